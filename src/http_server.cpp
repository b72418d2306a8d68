// http_server.cpp
#include "http_server.hpp"
#include "utils.hpp"
#include <cstdio>
#include <fstream>
#include <iterator>
#include <sstream>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace awss {

// ======= JSON =======

std::string escape_json(const std::string& s) {
    std::ostringstream o;
    for (char c : s) {
        switch (c) {
            case '\"': o << "\\\""; break;
            case '\\': o << "\\\\"; break;
            case '\n': o << "\\n"; break;
            case '\r': o << "\\r"; break;
            case '\t': o << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    o << buf;
                } else {
                    o << c;
                }
                break;
        }
    }
    return o.str();
}

namespace {

std::string json_string_or_null(const std::optional<std::string>& s) {
    return s ? "\"" + escape_json(*s) + "\"" : "null";
}

std::string http_response(int code, const std::string& content_type, const std::string& content) {
    const char* reason = "OK";
    switch (code) {
        case 404: reason = "Not Found"; break;
        case 500: reason = "Internal Server Error"; break;
        default: break;
    }
    return "HTTP/1.1 " + std::to_string(code) + " " + reason + "\r\n"
           "Content-Type: " + content_type + "\r\n"
           "Content-Length: " + std::to_string(content.length()) + "\r\n"
           "Cache-Control: no-store\r\n"
           "Connection: close\r\n"
           "\r\n" + content;
}

std::string ok_json(bool ok, const std::string& message) {
    return std::string("{\"ok\":") + (ok ? "true" : "false") +
           ",\"message\":\"" + escape_json(message) + "\"}";
}

const char* kHomePage = R"html(<!DOCTYPE html>
<html>
<head><title>AWSS</title></head>
<body>
    <h2>AWSS station is running.</h2>
    <p>POST /api/start, POST /api/stop, POST /api/process</p>
    <p>Status: <a href="/api/status">/api/status</a></p>
    <p>Last capture: <a href="/latest-image">/latest-image</a></p>
</body>
</html>
)html";

}  // namespace

std::string record_to_json(const DetectionRecord& rec) {
    std::ostringstream os;
    os << "{"
       << "\"timestamp\":\"" << iso_timestamp(rec.timestamp) << "\","
       << "\"category\":\"" << escape_json(rec.category) << "\","
       << "\"color\":\"" << escape_json(rec.color) << "\","
       << "\"confidence\":" << format_fixed(rec.confidence, 2) << ","
       << "\"reason\":\"" << escape_json(rec.reason) << "\",";
    if (rec.hsv) {
        const cv::Scalar& hsv = *rec.hsv;
        os << "\"hsv\":{\"h\":" << format_fixed(hsv[0], 2)
           << ",\"s\":" << format_fixed(hsv[1], 2)
           << ",\"v\":" << format_fixed(hsv[2], 2) << "},";
    } else {
        os << "\"hsv\":null,";
    }
    os << "\"color_matches\":{";
    for (size_t i = 0; i < rec.color_matches.size(); ++i) {
        if (i > 0) os << ",";
        os << "\"" << escape_json(rec.color_matches[i].first) << "\":"
           << format_fixed(rec.color_matches[i].second, 2);
    }
    os << "},"
       << "\"image_path\":" << json_string_or_null(rec.image_path) << ","
       << "\"image_filename\":" << json_string_or_null(rec.image_filename)
       << "}";
    return os.str();
}

std::string status_to_json(const SystemStatus& st) {
    std::ostringstream os;
    os << "{"
       << "\"running\":" << (st.running ? "true" : "false") << ","
       << "\"startedAt\":"
       << (st.started_at ? "\"" + iso_timestamp(*st.started_at) + "\"" : std::string("null")) << ","
       << "\"last\":" << (st.last ? record_to_json(*st.last) : std::string("null")) << ","
       << "\"history\":[";
    bool first = true;
    for (const auto& rec : st.history) {
        if (!first) os << ",";
        first = false;
        os << record_to_json(rec);
    }
    os << "],"
       << "\"lastError\":" << json_string_or_null(st.last_error) << ","
       << "\"lastImagePath\":" << json_string_or_null(st.last_image_path)
       << "}";
    return os.str();
}

// ======= Server =======

HttpControlServer::HttpControlServer(SortingEngine& engine, int port)
    : engine_(engine), port_(port) {}

HttpControlServer::~HttpControlServer() {
    stop();
}

bool HttpControlServer::start() {
    if (running_) return true;

    server_socket_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_socket_ == -1) {
        Logger::log(Logger::ERROR, "Failed to create HTTP server socket!");
        return false;
    }

    int opt = 1;
    setsockopt(server_socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in server_addr{};
    server_addr.sin_family = AF_INET;
    server_addr.sin_addr.s_addr = INADDR_ANY;
    server_addr.sin_port = htons(port_);

    if (bind(server_socket_, reinterpret_cast<sockaddr*>(&server_addr), sizeof(server_addr)) < 0) {
        Logger::log(Logger::ERROR, "HTTP server bind failed on port " + std::to_string(port_));
        close(server_socket_);
        server_socket_ = -1;
        return false;
    }

    if (listen(server_socket_, 5) < 0) {
        Logger::log(Logger::ERROR, "HTTP server listen failed!");
        close(server_socket_);
        server_socket_ = -1;
        return false;
    }

    running_ = true;
    thread_ = std::thread(&HttpControlServer::serve, this);
    Logger::log(Logger::INFO, "HTTP control interface on port " + std::to_string(port_));
    return true;
}

void HttpControlServer::stop() {
    if (!running_) return;
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    if (server_socket_ >= 0) {
        close(server_socket_);
        server_socket_ = -1;
    }
}

void HttpControlServer::serve() {
    while (running_) {
        pollfd pfd{};
        pfd.fd = server_socket_;
        pfd.events = POLLIN;
        // Wake up regularly so stop() is honoured
        int ready = poll(&pfd, 1, 250);
        if (ready <= 0) continue;

        sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);
        int client_socket = accept(server_socket_, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
        if (client_socket < 0) continue;

        handleClient(client_socket);
    }
}

void HttpControlServer::handleClient(int client_socket) {
    char buffer[8192] = {0};
    ssize_t n = recv(client_socket, buffer, sizeof(buffer) - 1, 0);
    if (n > 0) {
        std::string response = handleRequest(std::string(buffer, static_cast<size_t>(n)));
        size_t sent = 0;
        while (sent < response.size()) {
            ssize_t w = send(client_socket, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
            if (w <= 0) break;
            sent += static_cast<size_t>(w);
        }
    }
    close(client_socket);
}

std::string HttpControlServer::handleRequest(const std::string& request) {
    if (request.find("POST /api/start") == 0) {
        if (engine_.running()) {
            return http_response(200, "application/json", ok_json(true, "Already running"));
        }
        if (!engine_.start()) {
            auto st = engine_.status();
            return http_response(500, "application/json",
                                 ok_json(false, st.last_error.value_or("Start failed")));
        }
        return http_response(200, "application/json", ok_json(true, "Started"));
    }
    else if (request.find("POST /api/stop") == 0) {
        if (!engine_.running()) {
            return http_response(200, "application/json", ok_json(true, "Already stopped"));
        }
        engine_.stop();
        return http_response(200, "application/json", ok_json(true, "Stopped"));
    }
    else if (request.find("GET /api/status") == 0) {
        return http_response(200, "application/json", status_to_json(engine_.status()));
    }
    else if (request.find("POST /api/process") == 0) {
        return http_response(200, "application/json", record_to_json(engine_.processOnce()));
    }
    else if (request.find("GET /latest-image") == 0) {
        auto st = engine_.status();
        if (!st.last_image_path) {
            return http_response(404, "text/plain", "No image yet");
        }
        std::ifstream f(*st.last_image_path, std::ios::binary);
        if (!f) {
            return http_response(404, "text/plain", "Image not found");
        }
        std::string bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        return http_response(200, "image/jpeg", bytes);
    }
    else if (request.find("GET / ") == 0) {
        return http_response(200, "text/html", kHomePage);
    }
    return http_response(404, "text/html", "<h1>404 Not Found</h1>");
}

}  // namespace awss
