#pragma once
#include "../store.hpp"

namespace callguard {

// Placeholder for an out-of-process backend. No wire protocol is implemented:
// every data operation throws StoreUnavailableError, which CacheLayer counts
// as a store failure.
class ExternalStore : public CacheStore {
public:
    explicit ExternalStore(const StoreConfig& config);

    std::string backend_name() const override { return "external"; }

    std::optional<nlohmann::json> get(const std::string& key) override;
    bool set(const std::string& key, const nlohmann::json& value,
             std::optional<uint32_t> ttl_seconds = std::nullopt) override;
    bool del(const std::string& key) override;
    bool exists(const std::string& key) override;
    bool expire(const std::string& key, uint32_t ttl_seconds) override;
    std::vector<std::string> keys(const std::string& pattern) override;
    int64_t ttl(const std::string& key) override;
    int64_t incr(const std::string& key) override;
    int64_t decr(const std::string& key) override;
    void clear() override;
    StoreStats stats() const override { return {}; }

private:
    [[noreturn]] static void unsupported(const char* operation);
};

} // namespace callguard
