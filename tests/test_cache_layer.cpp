#include <catch2/catch.hpp>
#include "mock_store.hpp"
#include "cache_layer.hpp"
#include "event_bus.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace callguard;

static CacheConfig test_config() {
    CacheConfig cfg;
    cfg.sweep_interval = 0;
    cfg.breaker.reset_timeout = std::chrono::milliseconds(50);
    return cfg;
}

// Owns a CacheLayer over a MockStore; `store` stays valid for the layer's lifetime.
struct LayerFixture {
    MockStore* store;
    EventBus bus;
    std::unique_ptr<CacheLayer> cache;

    explicit LayerFixture(CacheConfig cfg = test_config()) {
        auto owned = std::make_unique<MockStore>();
        store = owned.get();
        cache = std::make_unique<CacheLayer>(cfg, std::move(owned), &bus);
    }
};

// ── get / set ────────────────────────────────────────────────────

TEST_CASE("CacheLayer: miss then hit", "[cache_layer]") {
    LayerFixture f;
    REQUIRE_FALSE(f.cache->get("k").has_value());
    REQUIRE(f.cache->set("k", {{"v", 1}}));

    auto v = f.cache->get("k");
    REQUIRE(v.has_value());
    REQUIRE((*v)["v"] == 1);

    auto s = f.cache->stats();
    REQUIRE(s.hits == 1);
    REQUIRE(s.misses == 1);
    REQUIRE(s.operations == 3);
}

TEST_CASE("CacheLayer: keys are namespaced with the prefix", "[cache_layer]") {
    LayerFixture f;
    f.cache->set("user:1", "alice");

    REQUIRE(f.store->exists("analytical:user:1"));
    REQUIRE_FALSE(f.store->exists("user:1"));
    REQUIRE(f.cache->full_key("x") == "analytical:x");
}

TEST_CASE("CacheLayer: custom prefix", "[cache_layer]") {
    CacheConfig cfg = test_config();
    cfg.key_prefix = "test:";
    LayerFixture f(cfg);
    f.cache->set("k", 1);
    REQUIRE(f.store->exists("test:k"));
}

TEST_CASE("CacheLayer: set with ttl reaches the store", "[cache_layer]") {
    LayerFixture f;
    f.cache->set("k", 1, 30);
    auto remaining = f.store->ttl("analytical:k");
    REQUIRE(remaining > 0);
    REQUIRE(remaining <= 30);
}

TEST_CASE("CacheLayer: hit rate is hits over operations", "[cache_layer]") {
    LayerFixture f;
    REQUIRE(f.cache->stats().hit_rate == 0.0);

    f.cache->set("k", 1);
    f.cache->get("k");
    f.cache->get("k");
    f.cache->get("k");

    auto s = f.cache->stats();
    REQUIRE(s.operations == 4);
    REQUIRE(s.hit_rate == 0.75);
}

TEST_CASE("CacheLayer: hit and miss events", "[cache_layer]") {
    LayerFixture f;
    std::vector<std::string> hits;
    std::vector<std::string> misses;
    subscribe<CacheHitEvent>(f.bus, [&](const CacheHitEvent& ev) { hits.push_back(ev.key); });
    subscribe<CacheMissEvent>(f.bus, [&](const CacheMissEvent& ev) { misses.push_back(ev.key); });

    f.cache->get("a");
    f.cache->set("a", 1);
    f.cache->get("a");

    REQUIRE(misses == std::vector<std::string>{"a"});
    REQUIRE(hits == std::vector<std::string>{"a"});
}

// ── Store failures ───────────────────────────────────────────────

TEST_CASE("CacheLayer: store failure degrades to a miss", "[cache_layer]") {
    LayerFixture f;
    f.store->fail = true;

    REQUIRE_NOTHROW(f.cache->get("k"));
    REQUIRE_FALSE(f.cache->get("k").has_value());
    REQUIRE_FALSE(f.cache->set("k", 1));

    auto s = f.cache->stats();
    REQUIRE(s.errors == 3);
    REQUIRE(s.hits == 0);
}

TEST_CASE("CacheLayer: error event names the operation", "[cache_layer]") {
    LayerFixture f;
    std::string op;
    std::string key;
    subscribe<CacheErrorEvent>(f.bus, [&](const CacheErrorEvent& ev) {
        op = ev.operation;
        key = ev.key;
    });

    f.store->fail = true;
    f.cache->set("k", 1);
    REQUIRE(op == "set");
    REQUIRE(key == "analytical:k");
}

TEST_CASE("CacheLayer: five failures open the breaker", "[cache_layer]") {
    LayerFixture f;
    f.store->fail = true;
    for (int i = 0; i < 5; i++) f.cache->get("k");

    REQUIRE(f.cache->stats().circuit_breaker_open);
    REQUIRE(f.cache->breaker().state() == BreakerState::Open);
}

TEST_CASE("CacheLayer: open breaker short-circuits without touching the store", "[cache_layer]") {
    CacheConfig cfg = test_config();
    cfg.breaker.reset_timeout = std::chrono::milliseconds(60000);
    LayerFixture f(cfg);
    f.store->fail = true;
    for (int i = 0; i < 5; i++) f.cache->get("k");
    int calls_before = f.store->get_calls.load();

    bool short_circuited = false;
    subscribe<CacheMissEvent>(f.bus, [&](const CacheMissEvent& ev) {
        short_circuited = ev.short_circuited;
    });

    REQUIRE_FALSE(f.cache->get("k").has_value());
    REQUIRE_FALSE(f.cache->set("k", 1));
    REQUIRE(f.store->get_calls.load() == calls_before);
    REQUIRE(f.store->set_calls.load() == 0);
    REQUIRE(short_circuited);
}

TEST_CASE("CacheLayer: breaker recovers once the store is healthy", "[cache_layer]") {
    LayerFixture f;
    std::vector<BreakerState> transitions;
    subscribe<BreakerStateChangedEvent>(f.bus, [&](const BreakerStateChangedEvent& ev) {
        transitions.push_back(ev.to);
    });

    f.store->fail = true;
    for (int i = 0; i < 5; i++) f.cache->get("k");
    f.store->fail = false;

    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    for (int i = 0; i < 3; i++) f.cache->get("k");

    REQUIRE(f.cache->breaker().state() == BreakerState::Closed);
    REQUIRE(transitions.size() == 3);
    REQUIRE(transitions[0] == BreakerState::Open);
    REQUIRE(transitions[1] == BreakerState::HalfOpen);
    REQUIRE(transitions[2] == BreakerState::Closed);
}

// ── get_or_set ───────────────────────────────────────────────────

TEST_CASE("CacheLayer: get_or_set fetches once then serves from cache", "[cache_layer]") {
    LayerFixture f;
    int fetches = 0;
    auto fetch = [&]() {
        fetches++;
        return nlohmann::json{{"result", "fresh"}};
    };

    auto first = f.cache->get_or_set("q", fetch);
    auto second = f.cache->get_or_set("q", fetch);

    REQUIRE(fetches == 1);
    REQUIRE(first == second);
    REQUIRE(first["result"] == "fresh");
}

TEST_CASE("CacheLayer: concurrent get_or_set runs fetch once", "[cache_layer]") {
    LayerFixture f;
    std::atomic<int> fetches{0};
    std::atomic<int> pending_seen{0};

    auto fetch = [&]() {
        fetches++;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        return nlohmann::json("computed");
    };

    std::vector<std::thread> threads;
    std::vector<nlohmann::json> results(8);
    for (int i = 0; i < 8; i++) {
        threads.emplace_back([&, i]() {
            results[i] = f.cache->get_or_set("slow", fetch);
        });
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    pending_seen = static_cast<int>(f.cache->stats().pending_requests);
    for (auto& t : threads) t.join();

    REQUIRE(fetches == 1);
    REQUIRE(pending_seen == 1);
    for (const auto& r : results) REQUIRE(r == "computed");
    REQUIRE(f.cache->stats().pending_requests == 0);
}

TEST_CASE("CacheLayer: caller that missed before the value landed does not refetch", "[cache_layer]") {
    LayerFixture f;
    f.store->get_delay_ms = 100;
    std::atomic<int> fetches{0};

    auto fetch = [&]() {
        fetches++;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        return nlohmann::json("computed");
    };

    nlohmann::json first, second;
    std::thread a([&]() { first = f.cache->get_or_set("k", fetch); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    std::thread b([&]() { second = f.cache->get_or_set("k", fetch); });
    a.join();
    b.join();

    REQUIRE(fetches == 1);
    REQUIRE(first == "computed");
    REQUIRE(second == "computed");
    REQUIRE(f.cache->stats().pending_requests == 0);
}

TEST_CASE("CacheLayer: fetch failure reaches every waiter", "[cache_layer]") {
    LayerFixture f;
    std::atomic<int> fetches{0};
    std::atomic<int> failures{0};

    auto fetch = [&]() -> nlohmann::json {
        fetches++;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        throw std::runtime_error("upstream down");
    };

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; i++) {
        threads.emplace_back([&]() {
            try {
                f.cache->get_or_set("bad", fetch);
            } catch (const std::runtime_error& e) {
                if (std::string(e.what()) == "upstream down") failures++;
            }
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(fetches == 1);
    REQUIRE(failures == 4);
    REQUIRE(f.cache->stats().pending_requests == 0);
    REQUIRE_FALSE(f.cache->get("bad").has_value());
}

TEST_CASE("CacheLayer: failed fetch is retried on the next call", "[cache_layer]") {
    LayerFixture f;
    int calls = 0;
    auto flaky = [&]() -> nlohmann::json {
        if (++calls == 1) throw std::runtime_error("first call fails");
        return 42;
    };

    REQUIRE_THROWS_AS(f.cache->get_or_set("k", flaky), std::runtime_error);
    REQUIRE(f.cache->get_or_set("k", flaky) == 42);
    REQUIRE(calls == 2);
}

TEST_CASE("CacheLayer: get_or_set still fetches with the store down", "[cache_layer]") {
    LayerFixture f;
    f.store->fail = true;
    int fetches = 0;
    auto fetch = [&]() { fetches++; return nlohmann::json(7); };

    REQUIRE(f.cache->get_or_set("k", fetch) == 7);
    REQUIRE(f.cache->get_or_set("k", fetch) == 7);
    REQUIRE(fetches == 2);
}

// ── del / invalidate_pattern / clear ─────────────────────────────

TEST_CASE("CacheLayer: del removes the key", "[cache_layer]") {
    LayerFixture f;
    f.cache->set("k", 1);
    REQUIRE(f.cache->del("k"));
    REQUIRE_FALSE(f.cache->get("k").has_value());
    REQUIRE_FALSE(f.cache->del("k"));
}

TEST_CASE("CacheLayer: del failure returns false", "[cache_layer]") {
    LayerFixture f;
    f.cache->set("k", 1);
    f.store->fail = true;
    REQUIRE_FALSE(f.cache->del("k"));
    REQUIRE(f.cache->stats().errors == 1);
}

TEST_CASE("CacheLayer: invalidate_pattern deletes matching keys only", "[cache_layer]") {
    LayerFixture f;
    f.cache->set("user:1", 1);
    f.cache->set("user:2", 2);
    f.cache->set("session:1", 3);
    f.store->set("other:user:3", 4);  // outside the namespace

    size_t deleted_event = 0;
    subscribe<CacheInvalidatedEvent>(f.bus, [&](const CacheInvalidatedEvent& ev) {
        deleted_event = ev.deleted;
    });

    REQUIRE(f.cache->invalidate_pattern("user:*") == 2);
    REQUIRE(deleted_event == 2);
    REQUIRE_FALSE(f.cache->get("user:1").has_value());
    REQUIRE(f.cache->get("session:1").has_value());
    REQUIRE(f.store->exists("other:user:3"));
}

TEST_CASE("CacheLayer: invalidate_pattern with no matches", "[cache_layer]") {
    LayerFixture f;
    REQUIRE(f.cache->invalidate_pattern("none:*") == 0);
}

TEST_CASE("CacheLayer: invalidate_pattern failure returns zero", "[cache_layer]") {
    LayerFixture f;
    f.cache->set("user:1", 1);
    f.store->fail = true;
    REQUIRE(f.cache->invalidate_pattern("user:*") == 0);
}

TEST_CASE("CacheLayer: clear empties the store", "[cache_layer]") {
    LayerFixture f;
    f.cache->set("a", 1);
    f.cache->set("b", 2);
    f.cache->clear();
    REQUIRE(f.store->stats().entries == 0);
}

TEST_CASE("CacheLayer: clear failure is swallowed and counted", "[cache_layer]") {
    LayerFixture f;
    f.store->fail = true;
    REQUIRE_NOTHROW(f.cache->clear());
    REQUIRE(f.cache->stats().errors == 1);
}

// ── Backend selection and lifecycle ──────────────────────────────

TEST_CASE("CacheLayer: default backend is memory", "[cache_layer]") {
    CacheLayer cache(test_config());
    REQUIRE(cache.store().backend_name() == "memory");
    cache.set("k", 1);
    REQUIRE(cache.get("k").value() == 1);
}

TEST_CASE("CacheLayer: unknown backend falls back to memory", "[cache_layer]") {
    CacheConfig cfg = test_config();
    cfg.backend = "_no_such_backend";
    CacheLayer cache(cfg);
    REQUIRE(cache.store().backend_name() == "memory");
}

TEST_CASE("CacheLayer: unknown backend without fallback throws", "[cache_layer]") {
    CacheConfig cfg = test_config();
    cfg.backend = "_no_such_backend";
    cfg.fallback_to_memory = false;
    REQUIRE_THROWS_AS(CacheLayer(cfg), std::invalid_argument);
}

TEST_CASE("CacheLayer: external backend fails every operation", "[cache_layer]") {
    CacheConfig cfg = test_config();
    cfg.backend = "external";
    CacheLayer cache(cfg);

    REQUIRE(cache.store().backend_name() == "external");
    REQUIRE_FALSE(cache.set("k", 1));
    REQUIRE_FALSE(cache.get("k").has_value());
    REQUIRE(cache.stats().errors == 2);
}

TEST_CASE("CacheLayer: external backend trips the breaker", "[cache_layer]") {
    CacheConfig cfg = test_config();
    cfg.backend = "external";
    cfg.breaker.reset_timeout = std::chrono::milliseconds(60000);
    CacheLayer cache(cfg);

    for (int i = 0; i < 5; i++) cache.get("k");
    REQUIRE(cache.stats().circuit_breaker_open);

    cache.get("k");
    REQUIRE(cache.stats().errors == 5);
}

TEST_CASE("CacheLayer: null store is rejected", "[cache_layer]") {
    REQUIRE_THROWS_AS(CacheLayer(test_config(), std::unique_ptr<CacheStore>()),
                      std::invalid_argument);
}

TEST_CASE("CacheLayer: shutdown reaches the store", "[cache_layer]") {
    LayerFixture f;
    f.cache->shutdown();
    f.cache->shutdown();
    REQUIRE(f.store->shut_down);
}

TEST_CASE("CacheStats: serializes to JSON", "[cache_layer]") {
    LayerFixture f;
    f.cache->set("k", 1);
    f.cache->get("k");

    nlohmann::json j = f.cache->stats();
    REQUIRE(j["hits"] == 1);
    REQUIRE(j["operations"] == 2);
    REQUIRE(j["hit_rate"] == 0.5);
    REQUIRE(j["circuit_breaker_open"] == false);
    REQUIRE(j["pending_requests"] == 0);
}

// ── cached() wrapper ─────────────────────────────────────────────

TEST_CASE("cached: routes calls through get_or_set", "[cache_layer]") {
    LayerFixture f;
    int calls = 0;
    auto square = cached(*f.cache,
        [](int n) { return "square:" + std::to_string(n); },
        [&](int n) { calls++; return n * n; });

    REQUIRE(square(4) == 16);
    REQUIRE(square(4) == 16);
    REQUIRE(square(5) == 25);
    REQUIRE(calls == 2);
    REQUIRE(f.store->exists("analytical:square:4"));
}
