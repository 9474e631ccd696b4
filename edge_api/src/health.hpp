#pragma once

#include "edge_context.hpp"
#include <nlohmann/json.hpp>

class HealthCheck {
public:
    explicit HealthCheck(const EdgeContext& ctx) : ctx_(ctx) {}

    nlohmann::json get_status() const;
    bool is_healthy() const;

private:
    const EdgeContext& ctx_;
};
