#pragma once
#include <string>

struct OrchestratorConfig {
    int port{7100};
    int max_concurrent{10};
    bool debug{false};
    std::string debug_log{"./logs/orchestrator-debug.log"};
    std::string qwen_command{"qwen -o stream-json --approval-mode yolo"};
    std::string claude_command{"claude --output-format stream-json --permission-mode acceptEdits"};
    std::string container_runtime{"docker"};
    std::string container_image{"python:3.13-slim"};
    std::string store_url; // HTTP result store; empty disables
    std::string store_db;  // SQLite result store; empty disables
    int stop_grace_ms{5000};
    std::string log_level{"info"};
};

// ORCH_* environment variables over the defaults above.
OrchestratorConfig load_config_from_env();

// Applies --port/--max-concurrent/--debug/... flags; throws std::invalid_argument on bad input.
void apply_command_line(OrchestratorConfig& config, int argc, char** argv);
