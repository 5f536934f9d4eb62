#pragma once
#include <cstdint>

class WorkerManager;

// libmicrohttpd daemon serving handle_api_request, one thread per connection.
class ApiServer {
public:
    explicit ApiServer(WorkerManager& manager);
    ~ApiServer();

    ApiServer(const ApiServer&) = delete;
    ApiServer& operator=(const ApiServer&) = delete;

    // Port 0 binds an ephemeral port. Throws std::runtime_error if the daemon cannot start.
    void start(uint16_t port);
    void stop();
    uint16_t port() const { return port_; }

    WorkerManager& manager() { return manager_; }

private:
    WorkerManager& manager_;
    struct MHD_Daemon* daemon_{nullptr};
    uint16_t port_{0};
};
