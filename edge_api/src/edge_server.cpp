#include "edge_server.hpp"
#include "http_util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

EdgeServer::EdgeServer(EdgeContext& ctx)
    : ctx_(ctx)
    , analyze_(ctx)
    , sync_(ctx)
    , push_(ctx)
    , health_(ctx)
    , server_(std::make_unique<httplib::Server>())
{}

void EdgeServer::start() {
    if (running_) return;

    const int timeout_ms = socket_read_timeout_ms(ctx_.config.body_read_timeout_ms);
    server_->set_read_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
    server_->set_payload_max_length(
        std::max(ctx_.config.analyze_max_body_bytes, ctx_.config.sync_max_payload_bytes));

    server_->set_exception_handler(
        [](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            try {
                if (ep) std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                spdlog::error("Unhandled error on {} {}: {}", req.method, req.path, e.what());
            }
            send_json_error(res, 500, "Internal Server Error");
        });

    setup_routes();
    running_ = true;

    server_thread_ = std::thread([this]() {
        spdlog::info("Starting HTTP server on {}:{}",
                     ctx_.config.listen_addr, ctx_.config.listen_port);
        if (!server_->listen(ctx_.config.listen_addr.c_str(), ctx_.config.listen_port)) {
            spdlog::error("HTTP server failed to listen on {}:{}",
                          ctx_.config.listen_addr, ctx_.config.listen_port);
        }
        running_ = false;
    });

    spdlog::info("Edge server started");
}

void EdgeServer::stop() {
    server_->stop();

    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    running_ = false;

    spdlog::info("Edge server stopped");
}

void EdgeServer::route(const std::string& path, const RouteFn& fn) {
    auto no_body = [fn](const httplib::Request& req, httplib::Response& res) {
        fn(req, res, [](size_t) { return BodyReadResult{}; });
    };

    auto with_body = [this, fn](const httplib::Request& req, httplib::Response& res,
                                const httplib::ContentReader& content_reader) {
        bool consumed = false;
        BodyFn read_body = [&](size_t max_bytes) {
            consumed = true;
            return read_body_bounded(
                req,
                [&](const httplib::ContentReceiver& receiver) { return content_reader(receiver); },
                max_bytes, ctx_.config.body_read_timeout_ms);
        };

        fn(req, res, read_body);

        // An unread body would be parsed as the next request on this connection.
        if (!consumed) res.set_header("Connection", "close");
    };

    server_->Options(path, no_body);
    server_->Get(path, no_body);
    server_->Post(path, with_body);
    server_->Put(path, with_body);
    server_->Patch(path, with_body);
    server_->Delete(path, with_body);
}

void EdgeServer::setup_routes() {
    route("/api/analyze",
        [this](const httplib::Request& req, httplib::Response& res, const BodyFn& body) {
            analyze_.handle(req, res, body);
        });

    route("/api/sync",
        [this](const httplib::Request& req, httplib::Response& res, const BodyFn& body) {
            sync_.handle(req, res, body);
        });

    route("/api/subscribe",
        [this](const httplib::Request& req, httplib::Response& res, const BodyFn& body) {
            push_.handle_subscribe(req, res, body);
        });

    route("/api/unsubscribe",
        [this](const httplib::Request& req, httplib::Response& res, const BodyFn& body) {
            push_.handle_unsubscribe(req, res, body);
        });

    route("/api/schedules",
        [this](const httplib::Request& req, httplib::Response& res, const BodyFn& body) {
            push_.handle_schedules(req, res, body);
        });

    server_->Get("/health",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_health(req, res);
        });
}

void EdgeServer::handle_health(const httplib::Request&, httplib::Response& res) {
    nlohmann::json status = health_.get_status();
    send_json(res, status["ok"].get<bool>() ? 200 : 503, status);
}
