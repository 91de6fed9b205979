// =================================================================
// include/Tempo/CacheStore.hpp
// =================================================================
// Sharded, quality-weighted cache of generation results.

#pragma once

#include "Tempo/Clock.hpp"
#include "Tempo/PeriodicTask.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Tempo {

/**
 * @brief Cache configuration
 */
struct CacheConfig {
    size_t max_size = 1000;                                     ///< Maximum number of entries
    std::chrono::milliseconds base_ttl{std::chrono::minutes(30)}; ///< TTL before quality and history scaling
    std::chrono::milliseconds max_ttl{std::chrono::hours(2)};     ///< Upper bound for any computed TTL
    size_t compression_threshold = 1000;                        ///< Content bytes above which zlib is tried
    bool compression_enabled = true;                            ///< Enable zlib compression of large content
    size_t shard_count = 16;                                    ///< Number of independently locked shards

    // Eviction score weights
    double recency_weight = 1.0;                                ///< Weight of exp(-age / base_ttl)
    double frequency_weight = 0.5;                              ///< Weight of log(1 + access_count)
    double quality_weight = 1.0;                                ///< Weight of the quality score

    // TTL scaling
    double history_weight = 0.1;                                ///< TTL extension per log(1 + type hits)
    size_t min_samples_for_tuning = 10;                         ///< Lookups per type before multipliers move
    double min_type_multiplier = 0.25;                          ///< Lower clamp of a type multiplier
    double max_type_multiplier = 4.0;                           ///< Upper clamp of a type multiplier

    std::chrono::milliseconds maintenance_interval{std::chrono::minutes(1)}; ///< Purge and tuning period

    /**
     * @brief Reject inconsistent values
     * @throws ConfigurationError naming the first invalid field
     */
    void validate() const;
};

/**
 * @brief One cached generation result
 */
struct CacheEntry {
    std::string fingerprint;           ///< Digest of analysis type and normalized content
    std::string analysis_type;         ///< Analysis type the result was generated for
    std::string content;               ///< Generated text, deflated when `compressed`
    bool compressed = false;           ///< Whether `content` holds zlib data
    size_t original_size = 0;          ///< Uncompressed content size in bytes
    int tokens_used = 0;               ///< Tokens the backend spent on the result
    double quality = 0.0;              ///< Quality score in [0, 1]
    TimePoint created_at;              ///< Insertion time
    TimePoint last_accessed;           ///< Last hit, or insertion time
    uint64_t access_count = 0;         ///< Hits since insertion
    Duration ttl{};                    ///< Lifetime measured from `created_at`

    bool isExpired(TimePoint now) const { return now - created_at > ttl; }
};

/**
 * @brief Seed used to warm the cache at startup
 */
struct CacheSeed {
    std::string analysis_type;
    std::string content;
    std::string result;
    int tokens_used = 0;
    double quality = 0.5;
};

/**
 * @brief Point-in-time cache statistics
 */
struct CacheStatistics {
    uint64_t total_requests = 0;       ///< Lookups served
    uint64_t hits = 0;                 ///< Lookups that returned an entry
    uint64_t misses = 0;               ///< Lookups that returned nothing
    double hit_rate = 0.0;             ///< hits / (hits + misses), 0 without lookups
    size_t size = 0;                   ///< Entries currently stored
    size_t max_size = 0;               ///< Configured capacity
    size_t valid_entries = 0;          ///< Entries not yet expired
    size_t expired_entries = 0;        ///< Entries past their TTL awaiting purge
    double average_age_seconds = 0.0;  ///< Mean age of stored entries
    uint64_t evictions = 0;            ///< Capacity evictions
    uint64_t expirations = 0;          ///< Entries dropped for being expired
    size_t analysis_types = 0;         ///< Distinct analysis types stored
    size_t compressed_entries = 0;     ///< Entries stored compressed
    bool compression_enabled = false;  ///< Whether compression is configured
};

/**
 * @brief Per analysis type lookup history
 */
struct TypeStatistics {
    uint64_t hits = 0;                 ///< Lifetime hits, feeds TTL scaling
    uint64_t misses = 0;               ///< Lifetime misses
    uint64_t window_hits = 0;          ///< Hits since the last tuning pass
    uint64_t window_misses = 0;        ///< Misses since the last tuning pass
    double ttl_multiplier = 1.0;       ///< Self-tuned TTL factor
};

/**
 * @brief Fingerprinted cache of generation results
 *
 * The keyspace is split into shards chosen by the fingerprint, each with
 * its own mutex, so lookups and stores on different shards never
 * contend. A global atomic size counter enforces the capacity bound;
 * eviction takes every shard lock in index order to score a consistent
 * snapshot and removes exactly one entry.
 *
 * TTL = min(max_ttl, base_ttl * type_multiplier * (0.5 + 0.5 * quality)
 *           * (1 + history_weight * log(1 + type_hits)))
 *
 * Eviction score = recency_weight * exp(-age / base_ttl)
 *                + frequency_weight * log(1 + access_count)
 *                + quality_weight * quality
 * where age is measured from the last access. The lowest score is
 * evicted; ties go to the oldest created_at, then the smallest
 * fingerprint.
 */
class CacheStore {
public:
    /**
     * @brief Construct a cache
     * @param config Validated eagerly
     * @param clock Time source for TTLs and ages
     * @throws ConfigurationError on invalid configuration
     */
    CacheStore(const CacheConfig& config, const Clock& clock);
    virtual ~CacheStore();

    CacheStore(const CacheStore&) = delete;
    CacheStore& operator=(const CacheStore&) = delete;

    /**
     * @brief Find a live entry
     *
     * A hit increments the entry's access count and updates its last
     * access time. An expired entry is removed and reported as a miss.
     *
     * @param analysis_type Analysis type of the request
     * @param content Request content, normalized before hashing
     * @return Entry with decompressed content, or nullopt on miss
     */
    virtual std::optional<CacheEntry> lookup(const std::string& analysis_type, const std::string& content);

    /**
     * @brief Insert or replace the result for (analysis_type, content)
     *
     * Replacing an existing fingerprint never evicts. Inserting a new
     * fingerprint at capacity evicts one entry first.
     *
     * @param analysis_type Analysis type of the request
     * @param content Request content
     * @param result Generated text to cache
     * @param tokens_used Tokens spent producing the result
     * @param quality Quality score in [0, 1]
     * @throws std::invalid_argument when quality is NaN or out of range
     */
    virtual void store(const std::string& analysis_type, const std::string& content,
                       const std::string& result, int tokens_used, double quality);

    /**
     * @brief Retune per-type TTL multipliers from observed hit rates
     *
     * Types with at least min_samples_for_tuning lookups since the last
     * pass are scaled by 1.2 above an 0.8 hit rate and by 0.8 below 0.3.
     * Multipliers stay positive so the TTL function stays monotonic.
     */
    void optimizeStrategy();

    /**
     * @brief Remove every expired entry
     * @return Number of entries removed
     */
    size_t purgeExpired();

    /**
     * @brief Pre-populate from seeds without touching hit statistics
     *
     * Seeds whose fingerprint is already present are skipped, and
     * warming stops once the cache is full rather than evicting.
     *
     * @param seeds Results to insert
     * @return Number of entries inserted
     */
    size_t warm(const std::vector<CacheSeed>& seeds);

    CacheStatistics stats() const;

    size_t size() const { return m_size.load(); }

    /**
     * @brief Whether a live entry exists, without updating any statistics
     */
    bool contains(const std::string& analysis_type, const std::string& content) const;

    /**
     * @brief Copy of every stored entry, content left as stored
     */
    std::vector<CacheEntry> entries() const;

    /**
     * @brief Compute the TTL a new entry would receive
     * @param analysis_type Analysis type of the entry
     * @param quality Quality score in [0, 1]
     * @return TTL bounded by max_ttl
     */
    Duration computeTTL(const std::string& analysis_type, double quality) const;

    /**
     * @brief Retention score of an entry at a given time, lower is evicted first
     */
    double evictionScore(const CacheEntry& entry, TimePoint now) const;

    /**
     * @brief Current TTL multiplier for an analysis type, 1.0 if unseen
     */
    double typeMultiplier(const std::string& analysis_type) const;

    std::map<std::string, TypeStatistics> typeStatistics() const;

    void clear();

    /**
     * @brief Start periodic purge and strategy tuning
     */
    void startMaintenance();

    void stopMaintenance();

    const CacheConfig& config() const { return m_config; }

    /**
     * @brief Trim surrounding whitespace and lower-case
     */
    static std::string normalizeContent(const std::string& content);

    /**
     * @brief 64-bit FNV-1a digest of analysis type and normalized content
     * @return 16 lower-case hex digits
     */
    static std::string fingerprint(const std::string& analysis_type, const std::string& content);

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, CacheEntry> entries;
    };

    Shard& shardFor(const std::string& fingerprint) const;
    CacheEntry buildEntry(const std::string& fingerprint, const std::string& analysis_type,
                          const std::string& result, int tokens_used, double quality) const;
    bool insertEntry(CacheEntry entry, bool evict_when_full);
    bool reserveSlot(bool evict_when_full);
    void evictOne();
    void recordLookup(const std::string& analysis_type, bool hit);
    std::string compressContent(const std::string& content, bool& compressed) const;
    std::string decompressContent(const CacheEntry& entry) const;

    CacheConfig m_config;
    const Clock& m_clock;

    std::vector<std::unique_ptr<Shard>> m_shards;
    std::atomic<size_t> m_size{0};
    std::mutex m_eviction_mutex;

    mutable std::mutex m_types_mutex;
    std::map<std::string, TypeStatistics> m_type_stats;

    std::atomic<uint64_t> m_hits{0};
    std::atomic<uint64_t> m_misses{0};
    std::atomic<uint64_t> m_evictions{0};
    std::atomic<uint64_t> m_expirations{0};

    std::unique_ptr<PeriodicTask> m_maintenance;
};

} // namespace Tempo
