#pragma once

/**
 * @file server.hpp
 * @brief HTTP front end serving QueryEngine resources
 *
 * Routes /<resource> and /<resource>/<id> to the engine registered under
 * that name. Uses cpp-httplib. Enable with the OINO_WITH_SERVER CMake
 * option.
 */

#include "query_engine.hpp"
#include <memory>
#include <stdexcept>
#include <string>

#ifdef OINO_HAS_SERVER

#include <httplib.h>
#include <atomic>
#include <chrono>
#include <iostream>
#include <map>
#include <thread>

namespace oino::http {

// ============================================================================
// Server Configuration
// ============================================================================

struct server_config {
    int port = 8080;
    std::string bind_address = "127.0.0.1";
    std::string auth_token;

    // Severities copied into X-OINO-MESSAGE-n response headers
    bool header_errors = true;
    bool header_warnings = true;
    bool header_infos = false;
    bool header_debug = false;
};

// ============================================================================
// HTTP Server
// ============================================================================

class server {
public:
    explicit server(const server_config& config)
        : config_(config), running_(false) {}

    ~server() {
        stop();
    }

    /**
     * Serve an engine at /<name>. Register everything before run().
     */
    void add_resource(const std::string& name, std::shared_ptr<const QueryEngine> engine) {
        resources_[name] = std::move(engine);
    }

    /**
     * Start server (blocking).
     * Returns when server is stopped.
     */
    void run() {
        setup_routes();
        running_ = true;
        std::cout << "Listening on " << config_.bind_address << ":" << config_.port << "\n";
        svr_.listen(config_.bind_address.c_str(), config_.port);
        running_ = false;
    }

    /**
     * Start server in background thread.
     */
    void run_async() {
        server_thread_ = std::thread([this] { run(); });
        // Wait for server to start
        while (!running_ && !svr_.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    /**
     * Stop server gracefully.
     */
    void stop() {
        if (svr_.is_running()) {
            svr_.stop();
        }
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
        running_ = false;
    }

    bool is_running() const { return running_; }
    int port() const { return config_.port; }

private:
    server_config config_;
    httplib::Server svr_;
    std::thread server_thread_;
    std::atomic<bool> running_;
    std::map<std::string, std::shared_ptr<const QueryEngine>> resources_;

    void setup_routes() {
        const char* pattern = R"(/([^/?]+)(/[^/?]*)?)";
        auto handler = [this](const httplib::Request& req, httplib::Response& res) {
            handle_resource(req, res);
        };
        svr_.Get(pattern, handler);
        svr_.Post(pattern, handler);
        svr_.Put(pattern, handler);
        svr_.Delete(pattern, handler);

        // GET / - resource listing
        svr_.Get("/", [this](const httplib::Request& req, httplib::Response& res) {
            if (!authorize(req, res)) return;
            ordered_json list = ordered_json::array();
            for (const auto& kv : resources_) {
                list.push_back({{"name", kv.first},
                                {"table", kv.second->model().table_name()},
                                {"fields", kv.second->model().size()}});
            }
            res.set_content(list.dump(), "application/json");
        });
    }

    bool authorize(const httplib::Request& req, httplib::Response& res) const {
        if (config_.auth_token.empty()) return true;

        std::string token;
        if (req.has_header("X-OINO-Token")) {
            token = req.get_header_value("X-OINO-Token");
        } else if (req.has_header("Authorization")) {
            const std::string auth = req.get_header_value("Authorization");
            const std::string prefix = "Bearer ";
            if (auth.rfind(prefix, 0) == 0) {
                token = auth.substr(prefix.size());
            }
        }

        if (token == config_.auth_token) return true;

        res.status = 401;
        res.set_content("Unauthorized", "text/plain");
        return false;
    }

    void handle_resource(const httplib::Request& req, httplib::Response& res) {
        if (!authorize(req, res)) return;

        Request request;
        request.method = req.method;
        request.body = req.body;
        for (const auto& kv : req.headers) {
            request.headers.emplace(kv.first, kv.second);
        }

        std::string name;
        try {
            // The raw target keeps the id escaping that req.path has decoded
            name = parse_target(req.target.empty() ? req.path : req.target, request);
        } catch (const std::exception& e) {
            res.status = 400;
            res.set_content(std::string("Error: ") + e.what(), "text/plain");
            return;
        }

        auto it = resources_.find(name);
        if (it == resources_.end()) {
            res.status = 404;
            res.set_content("Unknown resource '" + name + "'", "text/plain");
            return;
        }

        ApiResult result = it->second->handle(request);
        res.status = result.status_code;
        for (const auto& header : result.message_headers(config_.header_errors, config_.header_warnings,
                                                         config_.header_infos, config_.header_debug)) {
            res.set_header(header.first, header.second);
        }
        if (!result.success) {
            res.set_content(result.to_json(), "application/json");
        } else {
            res.set_content(result.body, result.content_type);
        }
    }
};

}  // namespace oino::http

#else  // !OINO_HAS_SERVER

// Stub when the HTTP server is not enabled
namespace oino::http {

struct server_config {
    int port = 8080;
    std::string bind_address = "127.0.0.1";
    std::string auth_token;
    bool header_errors = true;
    bool header_warnings = true;
    bool header_infos = false;
    bool header_debug = false;
};

class server {
public:
    explicit server(const server_config&) {
        throw std::runtime_error("HTTP server not enabled. Build with OINO_WITH_SERVER=ON");
    }
    void add_resource(const std::string&, std::shared_ptr<const QueryEngine>) {}
    void run() {}
    void run_async() {}
    void stop() {}
    bool is_running() const { return false; }
    int port() const { return 0; }
};

}  // namespace oino::http

#endif  // OINO_HAS_SERVER
