#include "../include/stream_protocol.hpp"

using json = nlohmann::json;

namespace {
// OpenAI-style chat chunks: {"finish_reason": "stop"}
bool has_finish_reason(const json& c) {
    auto it = c.find("finish_reason");
    return it != c.end() && !it->is_null();
}

// Ollama-style: {"done": true}
bool done_flag(const json& c) {
    auto it = c.find("done");
    return it != c.end() && it->is_boolean() && it->get<bool>();
}

// Typed event streams: {"type": "completion"} or {"type": "done"}
bool terminal_event_type(const json& c) {
    auto it = c.find("type");
    if (it == c.end() || !it->is_string()) return false;
    const auto& t = it->get_ref<const std::string&>();
    return t == "completion" || t == "done";
}

// Job-status envelopes: {"status": "completed"}
bool completed_status(const json& c) {
    auto it = c.find("status");
    return it != c.end() && it->is_string() && it->get_ref<const std::string&>() == "completed";
}

const std::string* string_field(const json& c, const char* key) {
    auto it = c.find(key);
    if (it == c.end() || !it->is_string()) return nullptr;
    return &it->get_ref<const std::string&>();
}
}

const std::vector<CompletionRule>& completion_rules() {
    static const std::vector<CompletionRule> rules = {
        {"finish_reason", &has_finish_reason},
        {"done", &done_flag},
        {"type", &terminal_event_type},
        {"status", &completed_status},
    };
    return rules;
}

const char* completion_marker(const json& chunk) {
    if (!chunk.is_object()) return nullptr;
    for (const auto& rule : completion_rules()) {
        if (rule.matches(chunk)) return rule.name;
    }
    return nullptr;
}

bool is_complete(const json& chunk) {
    return completion_marker(chunk) != nullptr;
}

std::string extract_content(const json& chunk) {
    if (!chunk.is_object()) return {};

    auto delta = chunk.find("delta");
    if (delta != chunk.end() && delta->is_object()) {
        if (const auto* s = string_field(*delta, "content")) return *s;
    }
    if (const auto* s = string_field(chunk, "text")) return *s;

    auto content = chunk.find("content");
    if (content != chunk.end() && content->is_array()) {
        std::string out;
        for (const auto& frag : *content) {
            if (!frag.is_object()) continue;
            if (const auto* s = string_field(frag, "text")) out += *s;
        }
        return out;
    }
    return {};
}
