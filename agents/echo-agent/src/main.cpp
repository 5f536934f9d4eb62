#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Stand-in agent CLI: reads one task per stdin line and answers with a
// stream of JSON chunks. The first word of a task selects a scripted behavior.

static void emit(const json& chunk) {
    std::cout << chunk.dump() << std::endl;
}

static void emit_raw(const std::string& line) {
    std::cout << line << std::endl;
}

static void respond(const std::string& task) {
    std::string verb = task.substr(0, task.find(' '));

    if (verb == "sleep") {
        emit({{"type", "partial"}, {"text", "working"}});
        std::this_thread::sleep_for(std::chrono::seconds(60));
        return;
    }
    if (verb == "crash") {
        emit({{"text", "partial"}});
        std::cerr << "agent crashed" << std::endl;
        std::exit(3);
    }
    if (verb == "exit0") {
        emit({{"text", "bye"}});
        std::exit(0);
    }
    if (verb == "garbage") {
        emit_raw("not json at all");
        emit_raw("[1, 2, 3]");
        emit({{"text", "after garbage"}});
        emit({{"done", true}});
        return;
    }
    if (verb == "finish") {
        emit({{"delta", {{"content", "hello"}}}});
        emit({{"finish_reason", "stop"}, {"delta", {{"content", "ignored"}}}});
        return;
    }
    if (verb == "status") {
        emit({{"text", "ok"}});
        emit({{"status", "completed"}});
        return;
    }
    if (verb == "completion") {
        emit({{"text", "ok"}});
        emit({{"type", "completion"}});
        return;
    }

    emit({{"delta", {{"content", "echo: "}}}});
    emit({{"text", task}});
    emit({{"content", json::array({{{"type", "text"}, {"text", "!"}}})}});
    emit({{"type", "done"}});
}

int main(int argc, char** argv) {
    bool linger = false;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--ignore-term") std::signal(SIGTERM, SIG_IGN);
        else if (a == "--linger") linger = true;
    }
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;
        respond(line);
    }
    // --linger: stay alive after stdin closes
    if (linger) std::this_thread::sleep_for(std::chrono::seconds(60));
    return 0;
}
