#include "store_registry.hpp"
#include <stdexcept>
#include <algorithm>

namespace callguard {

StoreRegistry& StoreRegistry::instance() {
    static StoreRegistry registry;
    return registry;
}

void StoreRegistry::register_store(const std::string& name, StoreFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    stores_[name] = std::move(factory);
}

std::unique_ptr<CacheStore> StoreRegistry::create_store(const std::string& name,
                                                        const StoreConfig& config) const {
    StoreFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = stores_.find(name);
        if (it == stores_.end()) {
            throw std::invalid_argument("Unknown cache backend: " + name);
        }
        factory = it->second;
    }
    return factory(config);
}

std::vector<std::string> StoreRegistry::store_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(stores_.size());
    for (const auto& [name, factory] : stores_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool StoreRegistry::has_store(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stores_.count(name) > 0;
}

} // namespace callguard
