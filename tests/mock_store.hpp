#pragma once
#include "store/memory_store.hpp"
#include "errors.hpp"
#include <atomic>
#include <chrono>
#include <thread>

namespace callguard {

// MemoryStore that can be switched into a failing mode. Counts calls that
// reached the store so tests can tell short-circuited reads apart.
class MockStore : public CacheStore {
public:
    std::atomic<bool> fail{false};
    std::atomic<int> get_calls{0};
    std::atomic<int> set_calls{0};
    std::atomic<int> del_calls{0};
    std::atomic<int> get_delay_ms{0};   // applied after get reads the value
    bool shut_down = false;

    MockStore() : inner_(no_sweep()) {}

    std::string backend_name() const override { return "mock"; }

    std::optional<nlohmann::json> get(const std::string& key) override {
        get_calls++;
        check();
        auto value = inner_.get(key);
        if (int delay = get_delay_ms.load(); delay > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }
        return value;
    }
    bool set(const std::string& key, const nlohmann::json& value,
             std::optional<uint32_t> ttl_seconds = std::nullopt) override {
        set_calls++;
        check();
        return inner_.set(key, value, ttl_seconds);
    }
    bool del(const std::string& key) override {
        del_calls++;
        check();
        return inner_.del(key);
    }
    bool exists(const std::string& key) override { check(); return inner_.exists(key); }
    bool expire(const std::string& key, uint32_t ttl) override { check(); return inner_.expire(key, ttl); }
    std::vector<std::string> keys(const std::string& pattern) override {
        check();
        return inner_.keys(pattern);
    }
    int64_t ttl(const std::string& key) override { check(); return inner_.ttl(key); }
    int64_t incr(const std::string& key) override { check(); return inner_.incr(key); }
    int64_t decr(const std::string& key) override { check(); return inner_.decr(key); }
    void clear() override { check(); inner_.clear(); }
    StoreStats stats() const override { return inner_.stats(); }
    void shutdown() override { shut_down = true; }

private:
    static StoreConfig no_sweep() {
        StoreConfig cfg;
        cfg.sweep_interval = std::chrono::milliseconds(0);
        return cfg;
    }

    void check() const {
        if (fail.load()) throw StoreUnavailableError("mock store offline");
    }

    MemoryStore inner_;
};

} // namespace callguard
