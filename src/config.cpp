#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace callguard {

nlohmann::json Config::defaults_json() {
    return {
        {"cache", {
            {"backend", "memory"},
            {"default_ttl", 3600},
            {"max_memory_mb", 100},
            {"key_prefix", "analytical:"},
            {"sweep_interval", 60},
            {"fallback_to_memory", true}
        }},
        {"breaker", {
            {"failure_threshold", 5},
            {"reset_timeout", 60},
            {"success_threshold", 3}
        }},
        {"rate_limit", {
            {"providers", {
                {"exa", {{"api_keys", nlohmann::json::array()}}}
            }},
            {"endpoints", {
                {"exa/search", {{"requests_per_interval", 5}, {"interval_ms", 1000}}}
            }},
            {"max_retries", 5},
            {"initial_delay_ms", 1000},
            {"max_delay_ms", 60000},
            {"timeout_ms", 30000},
            {"use_jitter", true},
            {"rotate_keys_on_rate_limit", true},
            {"fail_fast", false}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

template<typename T>
static void read_unsigned(const nlohmann::json& obj, const char* field, T& out) {
    if (obj.contains(field) && obj[field].is_number_unsigned())
        out = obj[field].get<T>();
}

static void read_bool(const nlohmann::json& obj, const char* field, bool& out) {
    if (obj.contains(field) && obj[field].is_boolean())
        out = obj[field].get<bool>();
}

static void read_string(const nlohmann::json& obj, const char* field, std::string& out) {
    if (obj.contains(field) && obj[field].is_string())
        out = obj[field].get<std::string>();
}

static bool parse_env_uint(const char* name, uint32_t& out) {
    const char* v = std::getenv(name);
    if (!v) return false;
    try {
        unsigned long parsed = std::stoul(v);
        out = static_cast<uint32_t>(parsed);
        return true;
    } catch (const std::exception&) {
        std::cerr << "[config] Ignoring non-numeric " << name << "=" << v << "\n";
        return false;
    }
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("cache") && j["cache"].is_object()) {
        auto& c = j["cache"];
        read_string(c, "backend", cfg.cache.backend);
        read_unsigned(c, "default_ttl", cfg.cache.default_ttl);
        read_unsigned(c, "max_memory_mb", cfg.cache.max_memory_mb);
        read_string(c, "key_prefix", cfg.cache.key_prefix);
        read_unsigned(c, "sweep_interval", cfg.cache.sweep_interval);
        read_bool(c, "fallback_to_memory", cfg.cache.fallback_to_memory);
    }

    if (j.contains("breaker") && j["breaker"].is_object()) {
        auto& b = j["breaker"];
        read_unsigned(b, "failure_threshold", cfg.cache.breaker.failure_threshold);
        read_unsigned(b, "success_threshold", cfg.cache.breaker.success_threshold);
        if (b.contains("reset_timeout") && b["reset_timeout"].is_number_unsigned())
            cfg.cache.breaker.reset_timeout =
                std::chrono::seconds(b["reset_timeout"].get<uint64_t>());
    }

    if (j.contains("rate_limit") && j["rate_limit"].is_object()) {
        auto& r = j["rate_limit"];

        if (r.contains("providers") && r["providers"].is_object()) {
            for (auto& [name, obj] : r["providers"].items()) {
                if (!obj.is_object()) continue;
                std::vector<std::string> keys;
                if (obj.contains("api_keys") && obj["api_keys"].is_array()) {
                    for (const auto& k : obj["api_keys"]) {
                        if (k.is_string() && !k.get<std::string>().empty())
                            keys.push_back(k.get<std::string>());
                    }
                }
                cfg.rate_limit.api_keys[name] = std::move(keys);
            }
        }

        if (r.contains("endpoints") && r["endpoints"].is_object()) {
            for (auto& [name, obj] : r["endpoints"].items()) {
                if (!obj.is_object()) continue;
                EndpointLimit limit;
                read_unsigned(obj, "requests_per_interval", limit.requests_per_interval);
                read_unsigned(obj, "interval_ms", limit.interval_ms);
                if (limit.requests_per_interval == 0) {
                    std::cerr << "[config] Skipping endpoint " << name
                              << ": requests_per_interval must be positive\n";
                    continue;
                }
                cfg.rate_limit.endpoints[name] = limit;
            }
        }

        auto& retry = cfg.rate_limit.retry;
        read_unsigned(r, "max_retries", retry.max_retries);
        read_unsigned(r, "initial_delay_ms", retry.initial_delay_ms);
        read_unsigned(r, "max_delay_ms", retry.max_delay_ms);
        read_unsigned(r, "timeout_ms", retry.timeout_ms);
        read_bool(r, "use_jitter", retry.use_jitter);
        read_bool(r, "rotate_keys_on_rate_limit", retry.rotate_keys_on_rate_limit);
        read_bool(r, "fail_fast", retry.fail_fast);
    }

    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.callguard/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config, using defaults: " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        atomic_write_file(config_path, j.dump(4) + "\n");
        std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("CALLGUARD_CACHE_BACKEND"))
        cfg.cache.backend = v;
    parse_env_uint("CALLGUARD_CACHE_TTL", cfg.cache.default_ttl);
    parse_env_uint("CALLGUARD_CACHE_MAX_MB", cfg.cache.max_memory_mb);
    if (const char* v = std::getenv("CALLGUARD_KEY_PREFIX"))
        cfg.cache.key_prefix = v;

    for (auto& [provider, keys] : cfg.rate_limit.api_keys) {
        std::string var = to_upper(provider) + "_API_KEYS";
        if (const char* v = std::getenv(var.c_str())) {
            auto from_env = split(v, ',');
            if (!from_env.empty()) keys = std::move(from_env);
        }
    }

    return cfg;
}

std::vector<std::string> Config::api_keys_for(const std::string& provider) const {
    auto it = rate_limit.api_keys.find(provider);
    if (it != rate_limit.api_keys.end()) return it->second;
    return {};
}

} // namespace callguard
