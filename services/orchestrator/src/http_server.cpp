#include "../include/http_server.hpp"
#include "../include/http_api.hpp"
#include "../include/log.hpp"
#include <cstring>
#include <map>
#include <stdexcept>
#include <string>
#include <microhttpd.h>

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
};

static MhdResult send_response(struct MHD_Connection* conn, int status, const std::string& body) {
    struct MHD_Response* resp = MHD_create_response_from_buffer(body.size(), (void*)body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, "application/json");
    MhdResult ret = MHD_queue_response(conn, (unsigned int)status, resp);
    MHD_destroy_response(resp);
    return ret;
}

static MhdResult collect_query(void* cls, enum MHD_ValueKind, const char* key, const char* val) {
    auto* m = static_cast<std::map<std::string, std::string>*>(cls);
    (*m)[key ? key : ""] = val ? val : "";
    return MHD_YES;
}

static MhdResult handler(void* cls, struct MHD_Connection* connection, const char* url, const char* method,
                         const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    auto* server = static_cast<ApiServer*>(cls);
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}};
        *con_cls = ci;
        return MHD_YES;
    }

    if (*upload_data_size) {
        ci->body.append(upload_data, *upload_data_size);
        *upload_data_size = 0;
        return MHD_YES;
    }

    std::map<std::string, std::string> query;
    MHD_get_connection_values(connection, MHD_GET_ARGUMENT_KIND, &collect_query, &query);
    log_debug("api", ci->method + " " + ci->url);
    auto resp = handle_api_request(server->manager(), ci->method, ci->url, query, ci->body);
    return send_response(connection, resp.status, resp.body);
}

static void request_completed(void* /*cls*/, struct MHD_Connection* /*connection*/, void** con_cls,
                              enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

ApiServer::ApiServer(WorkerManager& manager) : manager_(manager) {}

ApiServer::~ApiServer() {
    stop();
}

void ApiServer::start(uint16_t port) {
    if (daemon_) return;
    daemon_ = MHD_start_daemon(MHD_USE_THREAD_PER_CONNECTION | MHD_USE_INTERNAL_POLLING_THREAD,
                               port, nullptr, nullptr, &handler, this,
                               MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                               MHD_OPTION_END);
    if (!daemon_) throw std::runtime_error("Failed to start HTTP server on port " + std::to_string(port));

    port_ = port;
    if (const union MHD_DaemonInfo* info = MHD_get_daemon_info(daemon_, MHD_DAEMON_INFO_BIND_PORT)) {
        port_ = info->port;
    }
    log_info("api", "listening on port " + std::to_string(port_));
}

void ApiServer::stop() {
    if (!daemon_) return;
    MHD_stop_daemon(daemon_);
    daemon_ = nullptr;
    log_info("api", "stopped");
}
