#pragma once
#include "store.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace callguard {

using StoreFactory = std::function<std::unique_ptr<CacheStore>(const StoreConfig& config)>;

// Name -> factory map for cache backends. Backends self-register at file
// scope with StoreRegistrar. All methods are thread-safe.
class StoreRegistry {
public:
    static StoreRegistry& instance();

    void register_store(const std::string& name, StoreFactory factory);

    // Throws std::invalid_argument for an unknown name.
    std::unique_ptr<CacheStore> create_store(const std::string& name,
                                             const StoreConfig& config) const;

    std::vector<std::string> store_names() const;
    bool has_store(const std::string& name) const;

private:
    StoreRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, StoreFactory> stores_;
};

struct StoreRegistrar {
    StoreRegistrar(const std::string& name, StoreFactory factory) {
        StoreRegistry::instance().register_store(name, std::move(factory));
    }
};

} // namespace callguard
