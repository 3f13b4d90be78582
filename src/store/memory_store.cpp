#include "memory_store.hpp"
#include "../store_registry.hpp"
#include <iostream>
#include <limits>
#include <stdexcept>

namespace callguard {

MemoryStore::MemoryStore(StoreConfig config)
    : config_(config) {
    if (config_.sweep_interval.count() > 0) {
        running_.store(true);
        sweeper_ = std::thread([this]() { sweep_loop(); });
    }
}

MemoryStore::~MemoryStore() {
    shutdown();
}

uint64_t MemoryStore::estimate_size(const nlohmann::json& value) {
    return static_cast<uint64_t>(value.dump().size()) + ENTRY_OVERHEAD;
}

TimePoint MemoryStore::deadline_for(std::optional<uint32_t> ttl_seconds) const {
    uint32_t ttl = (ttl_seconds && *ttl_seconds > 0) ? *ttl_seconds : config_.default_ttl;
    return Clock::now() + std::chrono::seconds(ttl);
}

std::optional<nlohmann::json> MemoryStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;

    if (Clock::now() >= it->second.expires_at) {
        erase_locked(it);
        expirations_++;
        return std::nullopt;
    }

    it->second.access_count++;
    return it->second.value;
}

bool MemoryStore::set(const std::string& key, const nlohmann::json& value,
                      std::optional<uint32_t> ttl_seconds) {
    auto expires_at = deadline_for(ttl_seconds);
    std::lock_guard<std::mutex> lock(mutex_);
    insert_locked(key, value, expires_at);
    return true;
}

bool MemoryStore::del(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return false;
    erase_locked(it);
    return true;
}

bool MemoryStore::exists(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    return it != entries_.end() && Clock::now() < it->second.expires_at;
}

bool MemoryStore::expire(const std::string& key, uint32_t ttl_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return false;
    it->second.expires_at = Clock::now() + std::chrono::seconds(ttl_seconds);
    return true;
}

std::vector<std::string> MemoryStore::keys(const std::string& pattern) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();

    std::vector<std::string> result;
    for (const auto& [key, entry] : entries_) {
        if (now >= entry.expires_at) continue;
        if (glob_match(pattern, key)) {
            result.push_back(key);
        }
    }
    return result;
}

int64_t MemoryStore::ttl(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return -2;

    auto now = Clock::now();
    if (now >= it->second.expires_at) return -1;
    return std::chrono::duration_cast<std::chrono::seconds>(it->second.expires_at - now).count();
}

int64_t MemoryStore::incr(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return add_locked(key, 1);
}

int64_t MemoryStore::decr(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return add_locked(key, -1);
}

void MemoryStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    by_age_.clear();
    memory_used_ = 0;
}

StoreStats MemoryStore::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    StoreStats s;
    s.entries = entries_.size();
    s.memory_bytes = memory_used_;
    s.evictions = evictions_;
    s.expirations = expirations_;
    return s;
}

uint64_t MemoryStore::access_count(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    return it == entries_.end() ? 0 : it->second.access_count;
}

size_t MemoryStore::sweep() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    size_t removed = 0;

    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if (now >= it->second.expires_at) {
            auto next = std::next(it);
            erase_locked(it);
            it = next;
            removed++;
        } else {
            ++it;
        }
    }
    expirations_ += removed;
    return removed;
}

void MemoryStore::shutdown() {
    {
        std::lock_guard<std::mutex> lock(sweep_mutex_);
        running_.store(false);
    }
    sweep_cv_.notify_all();
    if (sweeper_.joinable() && sweeper_.get_id() != std::this_thread::get_id()) {
        sweeper_.join();
    }
}

void MemoryStore::sweep_loop() {
    std::unique_lock<std::mutex> lock(sweep_mutex_);
    while (running_.load()) {
        sweep_cv_.wait_for(lock, config_.sweep_interval, [this]() { return !running_.load(); });
        if (!running_.load()) break;

        lock.unlock();
        sweep();
        lock.lock();
    }
}

// ── Internal helpers ─────────────────────────────────────────────

void MemoryStore::erase_locked(EntryMap::iterator it) {
    memory_used_ -= it->second.size_bytes;
    by_age_.erase(it->second.sequence);
    entries_.erase(it);
}

bool MemoryStore::evict_oldest_locked() {
    if (by_age_.empty()) return false;

    auto oldest = by_age_.begin();
    auto it = entries_.find(oldest->second);
    if (it == entries_.end()) {
        by_age_.erase(oldest);
        return false;
    }
    erase_locked(it);
    evictions_++;
    return true;
}

void MemoryStore::insert_locked(const std::string& key, nlohmann::json value,
                                TimePoint expires_at) {
    uint64_t size = estimate_size(value);

    auto existing = entries_.find(key);
    if (existing != entries_.end()) {
        erase_locked(existing);
    }

    while (!entries_.empty() && memory_used_ + size > config_.max_memory_bytes) {
        if (!evict_oldest_locked()) break;
    }
    if (memory_used_ + size > config_.max_memory_bytes) {
        std::cerr << "[cache] Entry " << key << " (" << size
                  << " bytes) exceeds the memory ceiling on its own\n";
    }

    Entry entry;
    entry.value = std::move(value);
    entry.expires_at = expires_at;
    entry.created_at = Clock::now();
    entry.size_bytes = size;
    entry.sequence = next_sequence_++;

    by_age_[entry.sequence] = key;
    memory_used_ += size;
    entries_[key] = std::move(entry);
}

int64_t MemoryStore::add_locked(const std::string& key, int64_t delta) {
    int64_t current = 0;
    TimePoint expires_at = deadline_for(std::nullopt);

    auto it = entries_.find(key);
    if (it != entries_.end()) {
        if (Clock::now() >= it->second.expires_at) {
            erase_locked(it);
            expirations_++;
        } else {
            if (!it->second.value.is_number_integer()) {
                throw std::invalid_argument("value at " + key + " is not an integer");
            }
            current = it->second.value.get<int64_t>();
            expires_at = it->second.expires_at;
        }
    }

    if ((delta > 0 && current > std::numeric_limits<int64_t>::max() - delta) ||
        (delta < 0 && current < std::numeric_limits<int64_t>::min() - delta)) {
        throw std::out_of_range("value at " + key + " would overflow");
    }
    int64_t updated = current + delta;
    insert_locked(key, updated, expires_at);
    return updated;
}

static StoreRegistrar reg_memory("memory", [](const StoreConfig& config) {
    return std::make_unique<MemoryStore>(config);
});

} // namespace callguard
