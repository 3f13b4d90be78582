#include "cache_layer.hpp"
#include "event_bus.hpp"
#include "store_registry.hpp"
#include <iostream>

namespace callguard {

void to_json(nlohmann::json& j, const CacheStats& s) {
    j = {
        {"hits", s.hits},
        {"misses", s.misses},
        {"errors", s.errors},
        {"operations", s.operations},
        {"hit_rate", s.hit_rate},
        {"circuit_breaker_open", s.circuit_breaker_open},
        {"pending_requests", s.pending_requests}
    };
}

static StoreConfig store_config_from(const CacheConfig& config) {
    StoreConfig sc;
    sc.default_ttl = config.default_ttl;
    sc.max_memory_bytes = static_cast<uint64_t>(config.max_memory_mb) * 1024 * 1024;
    sc.sweep_interval = std::chrono::seconds(config.sweep_interval);
    return sc;
}

static std::unique_ptr<CacheStore> create_backend(const CacheConfig& config) {
    auto& registry = StoreRegistry::instance();
    auto sc = store_config_from(config);
    try {
        return registry.create_store(config.backend, sc);
    } catch (const std::exception& e) {
        if (!config.fallback_to_memory || config.backend == "memory") throw;
        std::cerr << "[cache] Backend '" << config.backend << "' unavailable ("
                  << e.what() << "), falling back to memory\n";
    }
    return registry.create_store("memory", sc);
}

CacheLayer::CacheLayer(CacheConfig config, EventBus* events)
    : CacheLayer(config, create_backend(config), events) {}

CacheLayer::CacheLayer(CacheConfig config, std::unique_ptr<CacheStore> store,
                       EventBus* events)
    : config_(std::move(config)), store_(std::move(store)),
      breaker_(config_.breaker), events_(events) {
    if (!store_) {
        throw std::invalid_argument("CacheLayer requires a store");
    }
    wire_breaker_events();
}

CacheLayer::~CacheLayer() {
    shutdown();
}

void CacheLayer::wire_breaker_events() {
    breaker_.set_transition_callback([this](BreakerState from, BreakerState to) {
        if (to == BreakerState::Open) {
            std::cerr << "[cache] Circuit breaker opened after consecutive failures\n";
        } else if (to == BreakerState::Closed) {
            std::cerr << "[cache] Circuit breaker reset - cache is healthy\n";
        }
        BreakerStateChangedEvent ev;
        ev.from = from;
        ev.to = to;
        publish_to(events_, ev);
    });
}

std::optional<nlohmann::json> CacheLayer::get(const std::string& key) {
    if (!breaker_.allow_request()) {
        misses_++;
        CacheMissEvent ev;
        ev.key = key;
        ev.short_circuited = true;
        publish_to(events_, ev);
        return std::nullopt;
    }

    std::string fk = full_key(key);
    operations_++;
    std::optional<nlohmann::json> value;
    try {
        value = store_->get(fk);
    } catch (const std::exception& e) {
        record_store_failure("get", fk, e.what());
        return std::nullopt;
    }
    breaker_.record_success();

    if (value) {
        hits_++;
        CacheHitEvent ev;
        ev.key = key;
        publish_to(events_, ev);
    } else {
        misses_++;
        CacheMissEvent ev;
        ev.key = key;
        publish_to(events_, ev);
    }
    return value;
}

bool CacheLayer::set(const std::string& key, const nlohmann::json& value,
                     std::optional<uint32_t> ttl_seconds) {
    if (!breaker_.allow_request()) return false;

    std::string fk = full_key(key);
    operations_++;
    try {
        bool ok = store_->set(fk, value, ttl_seconds);
        if (ok) breaker_.record_success();
        return ok;
    } catch (const std::exception& e) {
        record_store_failure("set", fk, e.what());
        return false;
    }
}

nlohmann::json CacheLayer::get_or_set(const std::string& key, const FetchFn& fetch,
                                      std::optional<uint32_t> ttl_seconds) {
    if (auto hit = get(key)) {
        return *hit;
    }

    std::string pending_key = "pending:" + key;
    std::shared_future<nlohmann::json> in_flight;
    std::promise<nlohmann::json> promise;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(pending_key);
        if (it != pending_.end()) {
            in_flight = it->second.result;
        } else {
            pending_[pending_key] = PendingRequest{key, promise.get_future().share(), Clock::now()};
            owner = true;
        }
    }

    if (!owner) {
        return in_flight.get();
    }

    // The previous owner may have stored the value and released its pending
    // entry between our miss and taking ownership.
    if (auto stored = read_through(key)) {
        promise.set_value(*stored);
        finish_pending(pending_key);
        return *stored;
    }

    nlohmann::json result;
    try {
        result = fetch();
    } catch (const std::exception& e) {
        std::cerr << "[cache] Fetch function failed for key " << key << ": " << e.what() << "\n";
        promise.set_exception(std::current_exception());
        finish_pending(pending_key);
        throw;
    } catch (...) {
        std::cerr << "[cache] Fetch function failed for key " << key << "\n";
        promise.set_exception(std::current_exception());
        finish_pending(pending_key);
        throw;
    }

    // Store before releasing waiters so a late caller either joins the
    // pending entry or hits the cache.
    set(key, result, ttl_seconds);
    promise.set_value(result);
    finish_pending(pending_key);
    return result;
}

bool CacheLayer::del(const std::string& key) {
    std::string fk = full_key(key);
    operations_++;
    try {
        return store_->del(fk);
    } catch (const std::exception& e) {
        record_store_failure("del", fk, e.what());
        return false;
    }
}

size_t CacheLayer::invalidate_pattern(const std::string& pattern) {
    std::string full_pattern = full_key(pattern);
    operations_++;

    size_t deleted = 0;
    try {
        for (const auto& k : store_->keys(full_pattern)) {
            if (store_->del(k)) deleted++;
        }
    } catch (const std::exception& e) {
        record_store_failure("invalidate", full_pattern, e.what());
        return 0;
    }

    std::cerr << "[cache] Invalidated " << deleted << " keys matching pattern: " << pattern << "\n";
    CacheInvalidatedEvent ev;
    ev.pattern = pattern;
    ev.deleted = deleted;
    publish_to(events_, ev);
    return deleted;
}

void CacheLayer::clear() {
    try {
        store_->clear();
        std::cerr << "[cache] Cache cleared\n";
    } catch (const std::exception& e) {
        record_store_failure("clear", "*", e.what());
    }
}

CacheStats CacheLayer::stats() const {
    CacheStats s;
    s.hits = hits_.load();
    s.misses = misses_.load();
    s.errors = errors_.load();
    s.operations = operations_.load();
    s.hit_rate = s.operations > 0
        ? static_cast<double>(s.hits) / static_cast<double>(s.operations)
        : 0.0;
    s.circuit_breaker_open = breaker_.is_open();
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        s.pending_requests = pending_.size();
    }
    return s;
}

void CacheLayer::shutdown() {
    if (shut_down_.exchange(true)) return;
    store_->shutdown();
}

std::optional<nlohmann::json> CacheLayer::read_through(const std::string& key) {
    if (!breaker_.allow_request()) return std::nullopt;

    std::string fk = full_key(key);
    try {
        auto value = store_->get(fk);
        breaker_.record_success();
        return value;
    } catch (const std::exception& e) {
        record_store_failure("get", fk, e.what());
        return std::nullopt;
    }
}

void CacheLayer::record_store_failure(const char* operation, const std::string& key,
                                      const std::string& error) {
    errors_++;
    breaker_.record_failure();
    std::cerr << "[cache] " << operation << " operation failed for " << key
              << ": " << error << "\n";

    CacheErrorEvent ev;
    ev.operation = operation;
    ev.key = key;
    ev.error = error;
    publish_to(events_, ev);
}

void CacheLayer::finish_pending(const std::string& pending_key) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_.erase(pending_key);
}

} // namespace callguard
