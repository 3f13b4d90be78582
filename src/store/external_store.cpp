#include "external_store.hpp"
#include "../errors.hpp"
#include "../store_registry.hpp"
#include <iostream>

namespace callguard {

ExternalStore::ExternalStore(const StoreConfig& /*config*/) {
    std::cerr << "[cache] External cache backend is not supported yet; "
                 "all operations will fail\n";
}

void ExternalStore::unsupported(const char* operation) {
    throw StoreUnavailableError(std::string("external cache store not supported (") +
                                operation + ")");
}

std::optional<nlohmann::json> ExternalStore::get(const std::string&) { unsupported("get"); }

bool ExternalStore::set(const std::string&, const nlohmann::json&, std::optional<uint32_t>) {
    unsupported("set");
}

bool ExternalStore::del(const std::string&) { unsupported("del"); }
bool ExternalStore::exists(const std::string&) { unsupported("exists"); }
bool ExternalStore::expire(const std::string&, uint32_t) { unsupported("expire"); }
std::vector<std::string> ExternalStore::keys(const std::string&) { unsupported("keys"); }
int64_t ExternalStore::ttl(const std::string&) { unsupported("ttl"); }
int64_t ExternalStore::incr(const std::string&) { unsupported("incr"); }
int64_t ExternalStore::decr(const std::string&) { unsupported("decr"); }
void ExternalStore::clear() { unsupported("clear"); }

static StoreRegistrar reg_external("external", [](const StoreConfig& config) {
    return std::make_unique<ExternalStore>(config);
});

} // namespace callguard
