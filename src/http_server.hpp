// http_server.hpp
#pragma once

#include <atomic>
#include <string>
#include <thread>

#include "detection_record.hpp"
#include "engine.hpp"
#include "status_store.hpp"

namespace awss {

std::string escape_json(const std::string& s);
std::string record_to_json(const DetectionRecord& rec);
std::string status_to_json(const SystemStatus& st);

/**
 * Minimal HTTP/1.1 control surface, one request per connection:
 *   POST /api/start   POST /api/stop   POST /api/process
 *   GET  /api/status  GET  /latest-image   GET /
 */
class HttpControlServer {
public:
    HttpControlServer(SortingEngine& engine, int port);
    ~HttpControlServer();

    bool start();
    void stop();
    int port() const { return port_; }

    // Exposed for tests: full raw request in, full raw response out.
    std::string handleRequest(const std::string& request);

private:
    void serve();
    void handleClient(int client_socket);

    SortingEngine& engine_;
    int port_;
    int server_socket_{-1};
    std::atomic<bool> running_{false};
    std::thread thread_;
};

}  // namespace awss
