#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// One end-of-stream convention used by an upstream agent CLI.
struct CompletionRule {
    const char* name;
    bool (*matches)(const nlohmann::json& chunk);
};

// Checked in order; the first match wins.
const std::vector<CompletionRule>& completion_rules();

// Name of the first matching rule, or nullptr when the chunk does not end the stream.
const char* completion_marker(const nlohmann::json& chunk);
bool is_complete(const nlohmann::json& chunk);

// delta.content, else text, else the joined text of content[] fragments, else "".
std::string extract_content(const nlohmann::json& chunk);
