#include "config.hpp"
#include "cache_layer.hpp"
#include "rate_limiter.hpp"
#include "event_bus.hpp"
#include "event.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstring>
#include <iostream>
#include <string>
#include <unordered_map>

static void print_usage() {
    std::cout << "Usage: callguard [options]\n"
              << "\n"
              << "Runs a simulated search workload through the cache and rate limiter\n"
              << "and prints cache statistics and key usage as JSON.\n"
              << "\n"
              << "Options:\n"
              << "  --requests N         Number of lookups to run (default: 20)\n"
              << "  --keys N             Demo API keys to create when none are configured (default: 3)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  CALLGUARD_CACHE_BACKEND  Cache backend (memory, external)\n"
              << "  CALLGUARD_CACHE_TTL      Default TTL in seconds\n"
              << "  CALLGUARD_CACHE_MAX_MB   Memory ceiling for the in-memory store\n"
              << "  CALLGUARD_KEY_PREFIX     Namespace prepended to every cache key\n"
              << "  EXA_API_KEYS             Comma-separated API keys for provider \"exa\"\n";
}

static bool parse_count(const char* arg, uint32_t& out) {
    try {
        unsigned long v = std::stoul(arg);
        if (v == 0) return false;
        out = static_cast<uint32_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

int main(int argc, char* argv[]) try {
    uint32_t requests = 20;
    uint32_t demo_keys = 3;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--requests") == 0 && i + 1 < argc) {
            if (!parse_count(argv[++i], requests)) {
                std::cerr << "Invalid --requests value: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--keys") == 0 && i + 1 < argc) {
            if (!parse_count(argv[++i], demo_keys)) {
                std::cerr << "Invalid --keys value: " << argv[i] << "\n";
                return 1;
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    const std::string provider = "exa";
    const std::string endpoint = "exa/search";

    auto config = callguard::Config::load();
    if (config.api_keys_for(provider).empty()) {
        std::vector<std::string> keys;
        for (uint32_t i = 1; i <= demo_keys; i++) {
            keys.push_back("demo-key-" + std::to_string(i));
        }
        config.rate_limit.api_keys[provider] = keys;
    }

    callguard::EventBus bus;
    std::atomic<uint64_t> rate_limit_hits{0};
    callguard::subscribe<callguard::RateLimitHitEvent>(bus,
        [&](const callguard::RateLimitHitEvent&) { rate_limit_hits++; });

    callguard::CacheLayer cache(config.cache, &bus);
    callguard::RateLimitManager limiter(&bus);
    limiter.apply(config.rate_limit);

    // Every fourth call on a key is throttled by the simulated provider.
    std::unordered_map<std::string, uint32_t> calls_per_key;
    auto search = [&](const std::string& api_key, const std::string& query) {
        uint32_t n = ++calls_per_key[api_key];
        if (n % 4 == 0) {
            throw callguard::ApiError("Too many requests", 429, endpoint);
        }
        return nlohmann::json{{"query", query}, {"results", n}};
    };

    const char* queries[] = {"solar", "wind", "hydro", "geothermal", "tidal"};
    auto options = limiter.options_for(provider, endpoint);

    for (uint32_t i = 0; i < requests; i++) {
        std::string query = queries[i % 5];
        try {
            cache.get_or_set("search:" + query, [&] {
                return limiter.execute([&](const std::string& key) {
                    return search(key, query);
                }, options);
            });
        } catch (const callguard::ApiError& e) {
            std::cerr << "Request for '" << query << "' failed (" << e.status()
                      << "): " << e.what() << "\n";
        }
    }

    nlohmann::json report;
    report["cache"] = cache.stats();
    report["keys"] = limiter.key_usage(provider);
    report["rate_limit_hits"] = rate_limit_hits.load();
    std::cout << report.dump(2) << "\n";

    cache.shutdown();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
