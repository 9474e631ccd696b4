#pragma once

#include "../src/edge_context.hpp"
#include "../src/body_reader.hpp"
#include "../src/kv_store.hpp"
#include "../src/llm_client.hpp"
#include <httplib.h>
#include <algorithm>
#include <deque>
#include <memory>
#include <stdexcept>
#include <string>

// Manually advanced millisecond clock.
struct FakeClock {
    std::shared_ptr<int64_t> now = std::make_shared<int64_t>(1000000);

    util::ClockFn fn() const {
        auto t = now;
        return [t]() { return *t; };
    }
    void advance(int64_t ms) { *now += ms; }
};

// Provider double answering from a script; repeats the last result.
class ScriptedProvider : public LlmProvider {
public:
    std::deque<LlmResult> script;
    LlmResult last;
    int calls = 0;
    LlmRequest last_request;

    LlmResult generate(const LlmRequest& request) override {
        calls++;
        last_request = request;
        if (!script.empty()) {
            last = script.front();
            script.pop_front();
        }
        return last;
    }

    void push_ok(const std::string& text) {
        LlmResult r;
        r.ok = true;
        r.status = 200;
        r.text = text;
        script.push_back(r);
    }

    void push_error(int status, const std::string& error, bool timed_out = false) {
        LlmResult r;
        r.status = status;
        r.error = error;
        r.timed_out = timed_out;
        script.push_back(r);
    }
};

// Store double whose operations fail on demand.
class FailingKvStore : public MemoryKvStore {
public:
    bool fail = true;

    std::optional<std::string> get(const std::string& key) override {
        if (fail) throw std::runtime_error("connection refused");
        return MemoryKvStore::get(key);
    }
    void set(const std::string& key, const std::string& value) override {
        if (fail) throw std::runtime_error("connection refused");
        MemoryKvStore::set(key, value);
    }
    bool del(const std::string& key) override {
        if (fail) throw std::runtime_error("connection refused");
        return MemoryKvStore::del(key);
    }
    bool ping() override { return !fail; }
};

inline Config test_config() {
    Config config;
    config.api_key = "test-key";
    config.analyze_rate_max_requests = 1000;
    config.sync_rate_max_requests = 1000;
    return config;
}

inline httplib::Request make_request(const std::string& method, const std::string& path) {
    httplib::Request req;
    req.method = method;
    req.path = path;
    req.set_header("X-Real-IP", "198.51.100.7");
    return req;
}

// Serves body in fixed-size chunks through the bounded reader, the same
// way the server feeds a ContentReader.
inline BodyFn body_of(const httplib::Request& req, const std::string& body,
                      const util::ClockFn& clock = util::steady_now_ms) {
    return [&req, body, clock](size_t max_bytes) {
        BodySource source = [&body](const httplib::ContentReceiver& receiver) {
            const size_t chunk = 4096;
            for (size_t off = 0; off < body.size(); off += chunk) {
                size_t len = std::min(chunk, body.size() - off);
                if (!receiver(body.data() + off, len)) return false;
            }
            return true;
        };
        return read_body_bounded(req, source, max_bytes, 5000, clock);
    };
}

inline BodyFn no_body() {
    return [](size_t) { return BodyReadResult{}; };
}
