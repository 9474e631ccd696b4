#pragma once

#include "edge_context.hpp"
#include "body_reader.hpp"
#include <httplib.h>

class AnalyzeHandler {
public:
    explicit AnalyzeHandler(EdgeContext& ctx) : ctx_(ctx) {}

    void handle(const httplib::Request& req, httplib::Response& res, const BodyFn& read_body);

private:
    EdgeContext& ctx_;

    void call_provider(const std::string& request_id, const std::string& cache_key,
                       const LlmRequest& llm_request, httplib::Response& res);
};
