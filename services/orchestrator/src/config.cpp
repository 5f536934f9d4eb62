#include "../include/config.hpp"
#include "../include/util.hpp"
#include <stdexcept>

static bool truthy(const std::string& v) {
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

OrchestratorConfig load_config_from_env() {
    OrchestratorConfig c;
    c.port = getenv_int_or("ORCH_PORT", c.port);
    c.max_concurrent = getenv_int_or("ORCH_MAX_CONCURRENT", c.max_concurrent);
    c.debug = truthy(getenv_or("ORCH_DEBUG", "0"));
    c.debug_log = getenv_or("ORCH_DEBUG_LOG", c.debug_log);
    c.qwen_command = getenv_or("ORCH_QWEN_COMMAND", c.qwen_command);
    c.claude_command = getenv_or("ORCH_CLAUDE_COMMAND", c.claude_command);
    c.container_runtime = getenv_or("ORCH_CONTAINER_RUNTIME", c.container_runtime);
    c.container_image = getenv_or("ORCH_CONTAINER_IMAGE", c.container_image);
    c.store_url = getenv_or("ORCH_STORE_URL", c.store_url);
    c.store_db = getenv_or("ORCH_STORE_DB", c.store_db);
    c.stop_grace_ms = getenv_int_or("ORCH_STOP_GRACE_MS", c.stop_grace_ms);
    c.log_level = getenv_or("ORCH_LOG_LEVEL", c.log_level);
    return c;
}

void apply_command_line(OrchestratorConfig& config, int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument(arg + " needs a value");
            return argv[++i];
        };
        if (arg == "--port") config.port = std::stoi(value());
        else if (arg == "--max-concurrent") config.max_concurrent = std::stoi(value());
        else if (arg == "--debug") config.debug = true;
        else if (arg == "--debug-log") config.debug_log = value();
        else if (arg == "--runtime") config.container_runtime = value();
        else if (arg == "--image") config.container_image = value();
        else if (arg == "--store-url") config.store_url = value();
        else if (arg == "--store-db") config.store_db = value();
        else if (arg == "--log-level") config.log_level = value();
        else throw std::invalid_argument("unknown option " + arg);
    }
}
