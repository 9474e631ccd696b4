#pragma once

#include "edge_context.hpp"
#include "analyze_handler.hpp"
#include "sync_handler.hpp"
#include "push_handler.hpp"
#include "health.hpp"
#include <httplib.h>
#include <atomic>
#include <memory>
#include <thread>

class EdgeServer {
public:
    explicit EdgeServer(EdgeContext& ctx);

    void start();
    void stop();
    bool is_running() const { return running_; }

private:
    EdgeContext& ctx_;
    AnalyzeHandler analyze_;
    SyncHandler sync_;
    PushHandler push_;
    HealthCheck health_;

    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::thread server_thread_;

    using RouteFn = std::function<void(const httplib::Request&, httplib::Response&, const BodyFn&)>;

    void setup_routes();
    void route(const std::string& path, const RouteFn& fn);
    void handle_health(const httplib::Request& req, httplib::Response& res);
};
