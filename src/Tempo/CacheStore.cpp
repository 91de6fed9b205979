// =================================================================
// src/Tempo/CacheStore.cpp
// =================================================================
// Implementation for the sharded generation-result cache.

#include "Tempo/CacheStore.hpp"
#include "Tempo/Errors.hpp"
#include "Tempo/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <zlib.h>

namespace Tempo {

void CacheConfig::validate() const {
    if (max_size == 0) {
        throw ConfigurationError("cache.max_size must be greater than zero");
    }
    if (base_ttl.count() <= 0) {
        throw ConfigurationError("cache.base_ttl must be positive");
    }
    if (max_ttl < base_ttl) {
        throw ConfigurationError("cache.max_ttl must not be shorter than cache.base_ttl");
    }
    if (shard_count == 0) {
        throw ConfigurationError("cache.shard_count must be greater than zero");
    }
    if (recency_weight < 0.0 || frequency_weight < 0.0 || quality_weight < 0.0) {
        throw ConfigurationError("cache eviction weights must not be negative");
    }
    if (history_weight < 0.0) {
        throw ConfigurationError("cache.history_weight must not be negative");
    }
    if (min_type_multiplier <= 0.0 || min_type_multiplier > 1.0 || max_type_multiplier < 1.0) {
        throw ConfigurationError("cache type multiplier bounds must satisfy 0 < min <= 1 <= max");
    }
    if (maintenance_interval.count() <= 0) {
        throw ConfigurationError("cache.maintenance_interval must be positive");
    }
}

CacheStore::CacheStore(const CacheConfig& config, const Clock& clock)
    : m_config(config), m_clock(clock) {
    m_config.validate();

    m_shards.reserve(m_config.shard_count);
    for (size_t i = 0; i < m_config.shard_count; i++) {
        m_shards.push_back(std::make_unique<Shard>());
    }

    std::ostringstream context;
    context << "Max size: " << m_config.max_size << ", ";
    context << "Shards: " << m_config.shard_count << ", ";
    context << "Base TTL: " << m_config.base_ttl.count() << "ms";
    Logger::getInstance().debug("CacheStore", "Cache initialized", context.str());
}

CacheStore::~CacheStore() {
    stopMaintenance();
}

std::string CacheStore::normalizeContent(const std::string& content) {
    size_t begin = 0;
    size_t end = content.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(content[begin]))) {
        begin++;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(content[end - 1]))) {
        end--;
    }

    std::string normalized = content.substr(begin, end - begin);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return normalized;
}

std::string CacheStore::fingerprint(const std::string& analysis_type, const std::string& content) {
    const uint64_t fnv_offset = 14695981039346656037ULL;
    const uint64_t fnv_prime = 1099511628211ULL;

    uint64_t hash = fnv_offset;
    auto mix = [&hash, fnv_prime](unsigned char byte) {
        hash ^= byte;
        hash *= fnv_prime;
    };

    for (unsigned char c : analysis_type) {
        mix(c);
    }
    mix(0x01); // separator so ("ab", "c") and ("a", "bc") differ
    for (unsigned char c : normalizeContent(content)) {
        mix(c);
    }

    std::ostringstream hex;
    hex << std::hex << std::setw(16) << std::setfill('0') << hash;
    return hex.str();
}

CacheStore::Shard& CacheStore::shardFor(const std::string& fingerprint) const {
    unsigned long prefix = std::stoul(fingerprint.substr(0, 8), nullptr, 16);
    return *m_shards[prefix % m_shards.size()];
}

std::optional<CacheEntry> CacheStore::lookup(const std::string& analysis_type, const std::string& content) {
    std::string fp = fingerprint(analysis_type, content);
    Shard& shard = shardFor(fp);
    TimePoint now = m_clock.now();

    std::optional<CacheEntry> found;
    bool expired = false;
    {
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.entries.find(fp);
        if (it != shard.entries.end()) {
            if (it->second.isExpired(now)) {
                shard.entries.erase(it);
                m_size--;
                expired = true;
            } else {
                it->second.access_count++;
                it->second.last_accessed = std::max(now, it->second.created_at);
                found = it->second;
            }
        }
    }

    if (expired) {
        m_expirations++;
        Logger::getInstance().debug("CacheStore", "Dropped expired entry on lookup", fp);
    }
    recordLookup(analysis_type, found.has_value());

    if (found && found->compressed) {
        found->content = decompressContent(*found);
    }
    return found;
}

void CacheStore::store(const std::string& analysis_type, const std::string& content,
                       const std::string& result, int tokens_used, double quality) {
    if (std::isnan(quality) || quality < 0.0 || quality > 1.0) {
        throw std::invalid_argument("cache quality must be within [0, 1]");
    }

    std::string fp = fingerprint(analysis_type, content);
    insertEntry(buildEntry(fp, analysis_type, result, tokens_used, quality), true);
}

CacheEntry CacheStore::buildEntry(const std::string& fingerprint, const std::string& analysis_type,
                                  const std::string& result, int tokens_used, double quality) const {
    CacheEntry entry;
    entry.fingerprint = fingerprint;
    entry.analysis_type = analysis_type;
    entry.original_size = result.size();
    entry.content = compressContent(result, entry.compressed);
    entry.tokens_used = tokens_used;
    entry.quality = quality;
    entry.created_at = m_clock.now();
    entry.last_accessed = entry.created_at;
    entry.access_count = 0;
    entry.ttl = computeTTL(analysis_type, quality);
    return entry;
}

bool CacheStore::insertEntry(CacheEntry entry, bool evict_when_full) {
    Shard& shard = shardFor(entry.fingerprint);

    {
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.entries.find(entry.fingerprint);
        if (it != shard.entries.end()) {
            it->second = std::move(entry);
            return true;
        }
    }

    if (!reserveSlot(evict_when_full)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.entries.find(entry.fingerprint);
    if (it != shard.entries.end()) {
        // A concurrent writer inserted the same fingerprint first
        it->second = std::move(entry);
        m_size--;
    } else {
        std::string key = entry.fingerprint;
        shard.entries.emplace(std::move(key), std::move(entry));
    }
    return true;
}

bool CacheStore::reserveSlot(bool evict_when_full) {
    while (true) {
        size_t current = m_size.load();
        if (current < m_config.max_size) {
            if (m_size.compare_exchange_weak(current, current + 1)) {
                return true;
            }
            continue;
        }
        if (!evict_when_full) {
            return false;
        }
        evictOne();
    }
}

void CacheStore::evictOne() {
    std::string victim_fingerprint;
    std::string victim_type;
    double victim_score = 0.0;
    bool evicted = false;

    {
        std::lock_guard<std::mutex> eviction_lock(m_eviction_mutex);
        if (m_size.load() < m_config.max_size) {
            return;
        }

        std::vector<std::unique_lock<std::mutex>> locks;
        locks.reserve(m_shards.size());
        for (auto& shard : m_shards) {
            locks.emplace_back(shard->mutex);
        }

        TimePoint now = m_clock.now();
        Shard* victim_shard = nullptr;
        const CacheEntry* victim = nullptr;

        for (auto& shard : m_shards) {
            for (const auto& [fp, entry] : shard->entries) {
                double score = evictionScore(entry, now);
                bool lower = false;
                if (!victim) {
                    lower = true;
                } else if (score < victim_score - 1e-12) {
                    lower = true;
                } else if (std::fabs(score - victim_score) <= 1e-12) {
                    lower = entry.created_at < victim->created_at ||
                            (entry.created_at == victim->created_at && fp < victim->fingerprint);
                }

                if (lower) {
                    victim = &entry;
                    victim_shard = shard.get();
                    victim_score = score;
                }
            }
        }

        if (victim) {
            victim_fingerprint = victim->fingerprint;
            victim_type = victim->analysis_type;
            victim_shard->entries.erase(victim_fingerprint);
            m_size--;
            m_evictions++;
            evicted = true;
        }
    }

    if (evicted) {
        Logger::getInstance().logCacheEviction(victim_fingerprint, victim_type, victim_score);
    } else {
        // Every slot is reserved by an insert still in progress
        std::this_thread::yield();
    }
}

void CacheStore::recordLookup(const std::string& analysis_type, bool hit) {
    if (hit) {
        m_hits++;
    } else {
        m_misses++;
    }

    std::lock_guard<std::mutex> lock(m_types_mutex);
    TypeStatistics& type_stats = m_type_stats[analysis_type];
    if (hit) {
        type_stats.hits++;
        type_stats.window_hits++;
    } else {
        type_stats.misses++;
        type_stats.window_misses++;
    }
}

Duration CacheStore::computeTTL(const std::string& analysis_type, double quality) const {
    double multiplier = 1.0;
    uint64_t type_hits = 0;
    {
        std::lock_guard<std::mutex> lock(m_types_mutex);
        auto it = m_type_stats.find(analysis_type);
        if (it != m_type_stats.end()) {
            multiplier = it->second.ttl_multiplier;
            type_hits = it->second.hits;
        }
    }

    double q = std::clamp(quality, 0.0, 1.0);
    double factor = multiplier * (0.5 + 0.5 * q) *
                    (1.0 + m_config.history_weight * std::log1p(static_cast<double>(type_hits)));

    using FloatMillis = std::chrono::duration<double, std::milli>;
    FloatMillis ttl = FloatMillis(m_config.base_ttl) * factor;
    FloatMillis ceiling = FloatMillis(m_config.max_ttl);
    return std::chrono::duration_cast<Duration>(std::min(ttl, ceiling));
}

double CacheStore::evictionScore(const CacheEntry& entry, TimePoint now) const {
    double age = std::max(0.0, toSeconds(now - entry.last_accessed));
    double base = toSeconds(m_config.base_ttl);

    return m_config.recency_weight * std::exp(-age / base) +
           m_config.frequency_weight * std::log1p(static_cast<double>(entry.access_count)) +
           m_config.quality_weight * entry.quality;
}

double CacheStore::typeMultiplier(const std::string& analysis_type) const {
    std::lock_guard<std::mutex> lock(m_types_mutex);
    auto it = m_type_stats.find(analysis_type);
    return it == m_type_stats.end() ? 1.0 : it->second.ttl_multiplier;
}

std::map<std::string, TypeStatistics> CacheStore::typeStatistics() const {
    std::lock_guard<std::mutex> lock(m_types_mutex);
    return m_type_stats;
}

void CacheStore::optimizeStrategy() {
    std::vector<std::pair<std::string, double>> changes;
    {
        std::lock_guard<std::mutex> lock(m_types_mutex);
        for (auto& [type, type_stats] : m_type_stats) {
            uint64_t samples = type_stats.window_hits + type_stats.window_misses;
            if (samples < m_config.min_samples_for_tuning) {
                continue;
            }

            double hit_rate = static_cast<double>(type_stats.window_hits) / samples;
            double previous = type_stats.ttl_multiplier;
            if (hit_rate > 0.8) {
                type_stats.ttl_multiplier *= 1.2;
            } else if (hit_rate < 0.3) {
                type_stats.ttl_multiplier *= 0.8;
            }
            type_stats.ttl_multiplier = std::clamp(type_stats.ttl_multiplier,
                                                   m_config.min_type_multiplier,
                                                   m_config.max_type_multiplier);
            type_stats.window_hits = 0;
            type_stats.window_misses = 0;

            if (type_stats.ttl_multiplier != previous) {
                changes.emplace_back(type, type_stats.ttl_multiplier);
            }
        }
    }

    for (const auto& [type, multiplier] : changes) {
        Logger::getInstance().info("CacheStore", "Adjusted TTL multiplier",
                                   type + " -> " + std::to_string(multiplier));
    }
}

size_t CacheStore::purgeExpired() {
    TimePoint now = m_clock.now();
    size_t removed = 0;

    for (auto& shard : m_shards) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        for (auto it = shard->entries.begin(); it != shard->entries.end();) {
            if (it->second.isExpired(now)) {
                it = shard->entries.erase(it);
                removed++;
            } else {
                ++it;
            }
        }
    }

    if (removed > 0) {
        m_size -= removed;
        m_expirations += removed;
        Logger::getInstance().debug("CacheStore", "Purged expired entries",
                                    "Removed: " + std::to_string(removed));
    }
    return removed;
}

size_t CacheStore::warm(const std::vector<CacheSeed>& seeds) {
    size_t inserted = 0;
    size_t skipped = 0;

    for (const auto& seed : seeds) {
        if (std::isnan(seed.quality) || seed.quality < 0.0 || seed.quality > 1.0) {
            Logger::getInstance().warning("CacheStore", "Skipping warm seed with invalid quality",
                                          seed.analysis_type);
            skipped++;
            continue;
        }
        if (contains(seed.analysis_type, seed.content)) {
            skipped++;
            continue;
        }

        std::string fp = fingerprint(seed.analysis_type, seed.content);
        if (!insertEntry(buildEntry(fp, seed.analysis_type, seed.result, seed.tokens_used, seed.quality), false)) {
            Logger::getInstance().info("CacheStore", "Cache full, stopping warm-up early");
            break;
        }
        inserted++;
    }

    std::ostringstream context;
    context << "Inserted: " << inserted << ", Skipped: " << skipped;
    Logger::getInstance().info("CacheStore", "Cache warm-up completed", context.str());
    return inserted;
}

bool CacheStore::contains(const std::string& analysis_type, const std::string& content) const {
    std::string fp = fingerprint(analysis_type, content);
    Shard& shard = shardFor(fp);
    TimePoint now = m_clock.now();

    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.entries.find(fp);
    return it != shard.entries.end() && !it->second.isExpired(now);
}

std::vector<CacheEntry> CacheStore::entries() const {
    std::vector<CacheEntry> result;
    for (const auto& shard : m_shards) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        for (const auto& [fp, entry] : shard->entries) {
            result.push_back(entry);
        }
    }
    return result;
}

CacheStatistics CacheStore::stats() const {
    CacheStatistics statistics;
    statistics.hits = m_hits.load();
    statistics.misses = m_misses.load();
    statistics.total_requests = statistics.hits + statistics.misses;
    statistics.hit_rate = statistics.total_requests > 0
        ? static_cast<double>(statistics.hits) / statistics.total_requests
        : 0.0;
    statistics.max_size = m_config.max_size;
    statistics.evictions = m_evictions.load();
    statistics.expirations = m_expirations.load();
    statistics.compression_enabled = m_config.compression_enabled;

    TimePoint now = m_clock.now();
    double total_age = 0.0;
    std::map<std::string, size_t> types;

    for (const auto& shard : m_shards) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        for (const auto& [fp, entry] : shard->entries) {
            statistics.size++;
            if (entry.isExpired(now)) {
                statistics.expired_entries++;
            } else {
                statistics.valid_entries++;
            }
            if (entry.compressed) {
                statistics.compressed_entries++;
            }
            total_age += std::max(0.0, toSeconds(now - entry.created_at));
            types[entry.analysis_type]++;
        }
    }

    statistics.analysis_types = types.size();
    if (statistics.size > 0) {
        statistics.average_age_seconds = total_age / statistics.size;
    }
    return statistics;
}

void CacheStore::clear() {
    std::lock_guard<std::mutex> eviction_lock(m_eviction_mutex);
    size_t removed = 0;
    for (auto& shard : m_shards) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        removed += shard->entries.size();
        shard->entries.clear();
    }
    m_size -= removed;
    Logger::getInstance().info("CacheStore", "Cache cleared", "Removed: " + std::to_string(removed));
}

void CacheStore::startMaintenance() {
    if (!m_maintenance) {
        m_maintenance = std::make_unique<PeriodicTask>("CacheStore", m_config.maintenance_interval, [this] {
            purgeExpired();
            optimizeStrategy();
        });
    }
    m_maintenance->start();
}

void CacheStore::stopMaintenance() {
    if (m_maintenance) {
        m_maintenance->stop();
    }
}

std::string CacheStore::compressContent(const std::string& content, bool& compressed) const {
    compressed = false;
    if (!m_config.compression_enabled || content.size() <= m_config.compression_threshold) {
        return content;
    }

    uLongf compressed_size = compressBound(static_cast<uLong>(content.size()));
    std::string buffer(compressed_size, '\0');
    int status = compress2(reinterpret_cast<Bytef*>(&buffer[0]), &compressed_size,
                           reinterpret_cast<const Bytef*>(content.data()),
                           static_cast<uLong>(content.size()), Z_DEFAULT_COMPRESSION);

    if (status != Z_OK || compressed_size >= content.size()) {
        return content;
    }

    buffer.resize(compressed_size);
    compressed = true;
    return buffer;
}

std::string CacheStore::decompressContent(const CacheEntry& entry) const {
    uLongf output_size = static_cast<uLongf>(entry.original_size);
    std::string output(entry.original_size, '\0');
    int status = uncompress(reinterpret_cast<Bytef*>(&output[0]), &output_size,
                            reinterpret_cast<const Bytef*>(entry.content.data()),
                            static_cast<uLong>(entry.content.size()));

    if (status != Z_OK || output_size != entry.original_size) {
        throw std::runtime_error("Failed to decompress cache entry " + entry.fingerprint +
                                 " (zlib status " + std::to_string(status) + ")");
    }
    return output;
}

} // namespace Tempo
