// =================================================================
// include/Tempo/SessionLoadBalancer.hpp
// =================================================================
// Bounded-capacity worker pool with sticky session assignment.

#pragma once

#include "Tempo/Cancellation.hpp"
#include "Tempo/Clock.hpp"
#include "Tempo/PeriodicTask.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Tempo {

/**
 * @brief Static description of one worker
 */
struct WorkerSpec {
    std::string id;                      ///< Unique worker identifier
    size_t capacity = 5;                 ///< Maximum concurrently bound sessions
    std::vector<std::string> tags;       ///< Specialization tags
};

/**
 * @brief Load balancer configuration
 */
struct LoadBalancerConfig {
    std::vector<WorkerSpec> workers;                                       ///< Worker pool
    std::chrono::milliseconds inactivity_threshold{std::chrono::minutes(30)}; ///< Idle time before a binding is reclaimed
    std::chrono::milliseconds cleanup_interval{std::chrono::minutes(5)};   ///< Sweep period
    size_t shard_count = 16;                                               ///< Session table shards
    bool remember_affinity = true;                                         ///< Prefer a session's previous worker

    /**
     * @brief Reject inconsistent values
     * @throws ConfigurationError naming the first invalid field
     */
    void validate() const;

    /**
     * @brief Pool of five general and specialist workers
     * @param capacity Capacity given to each worker
     */
    static std::vector<WorkerSpec> defaultWorkers(size_t capacity = 5);
};

enum class AssignmentStatus {
    ASSIGNED,   ///< Session is bound to `worker_id`
    REJECTED,   ///< No worker had spare capacity
    CANCELLED   ///< Caller cancelled while waiting
};

/**
 * @brief Outcome of an assignment attempt, rejection is not an error
 */
struct AssignmentResult {
    AssignmentStatus status = AssignmentStatus::REJECTED;
    std::string worker_id;               ///< Bound worker, empty unless assigned
    bool reused_binding = false;         ///< Session was already bound
    uint64_t binding_id = 0;             ///< Identifies the binding for a later release

    bool assigned() const { return status == AssignmentStatus::ASSIGNED; }
};

/**
 * @brief Binding of a session to the worker serving it
 */
struct SessionBinding {
    uint64_t binding_id = 0;             ///< Unique per binding, never reused
    std::string session_id;
    std::string worker_id;
    TimePoint assigned_at;
    TimePoint last_activity;
    size_t in_flight = 0;                ///< Requests currently riding this binding
};

/**
 * @brief Per-worker load in a metrics snapshot
 */
struct WorkerLoad {
    std::string worker_id;
    size_t current_load = 0;
    size_t capacity = 0;
    std::vector<std::string> tags;
    double seconds_since_heartbeat = 0.0;
};

/**
 * @brief Point-in-time load balancer metrics
 */
struct LoadBalancingMetrics {
    uint64_t total_sessions = 0;         ///< Assignment requests received
    size_t active_sessions = 0;          ///< Bindings currently held
    uint64_t balanced_sessions = 0;      ///< Bindings placed by least-loaded selection
    uint64_t sticky_sessions = 0;        ///< Bindings placed on the preferred worker
    uint64_t rejected_sessions = 0;      ///< Assignments rejected for capacity
    uint64_t reclaimed_sessions = 0;     ///< Bindings reclaimed by inactivity sweeps
    size_t total_workers = 0;
    size_t available_workers = 0;        ///< Workers with spare capacity
    size_t busy_workers = 0;             ///< Workers at capacity
    double average_load = 0.0;           ///< Mean of load / capacity over workers
    std::string strategy = "least_loaded_ratio";
    std::vector<WorkerLoad> workers;
};

/**
 * @brief Assigns sessions to workers without exceeding any capacity
 *
 * Sessions live in hashed shards, each with its own mutex, and every
 * worker slot has its own mutex. Locks are always taken as worker list,
 * then session shard, then worker slot. A session holds one unit of its
 * worker's load for as long as the binding exists; concurrent requests
 * on the same session share that unit.
 */
class SessionLoadBalancer {
public:
    /**
     * @brief Constructor
     * @param config Validated eagerly
     * @param clock Time source for activity and heartbeat timestamps
     * @throws ConfigurationError on invalid configuration
     */
    SessionLoadBalancer(const LoadBalancerConfig& config, const Clock& clock);
    virtual ~SessionLoadBalancer();

    SessionLoadBalancer(const SessionLoadBalancer&) = delete;
    SessionLoadBalancer& operator=(const SessionLoadBalancer&) = delete;

    /**
     * @brief Bind a session to a worker without blocking
     *
     * An existing binding is reused. Otherwise the preferred worker (or
     * the worker the session last used) wins when it has spare capacity;
     * failing that the worker with the lowest load/capacity ratio among
     * those carrying any of `required_tags` is chosen, ties going to the
     * oldest heartbeat and then the smallest id.
     *
     * @param session_id Session to bind
     * @param preferred_worker_id Optional sticky preference
     * @param required_tags Any-of tag filter, empty for all workers
     * @return Assigned worker or a rejection
     */
    virtual AssignmentResult assign(const std::string& session_id,
                                    const std::string& preferred_worker_id = "",
                                    const std::vector<std::string>& required_tags = {});

    /**
     * @brief Bind a session, waiting for capacity to free up
     *
     * Wakes on every release and cleanup. Never holds a slot when it
     * returns REJECTED or CANCELLED.
     *
     * @param deadline Give up with REJECTED once passed
     * @param token Give up with CANCELLED once cancelled
     */
    virtual AssignmentResult assignWaiting(const std::string& session_id,
                                           const std::string& preferred_worker_id,
                                           const std::vector<std::string>& required_tags,
                                           TimePoint deadline,
                                           const CancellationToken& token = CancellationToken());

    /**
     * @brief Drop one request from a session's binding
     *
     * The binding and its load unit are released once no request rides
     * it. Unknown sessions are ignored.
     *
     * @return True if the session was bound
     */
    virtual bool release(const std::string& session_id);

    /**
     * @brief Drop one request from a specific binding of a session
     *
     * A binding reclaimed by a sweep may be replaced by a new binding of
     * the same session. Releasing with the old `binding_id` is then a
     * no-op and leaves the new binding and its load unit alone.
     *
     * @param binding_id Id from the AssignmentResult that took the slot
     * @return True if that binding was still held
     */
    virtual bool release(const std::string& session_id, uint64_t binding_id);

    /**
     * @brief Force-release bindings idle for longer than a threshold
     * @param inactivity_threshold Bindings with now - last_activity above this are reclaimed
     * @return Number of bindings reclaimed
     */
    size_t cleanupExpired(std::chrono::milliseconds inactivity_threshold);

    /**
     * @brief Record that a worker is alive
     * @return False if the worker is unknown
     */
    bool heartbeat(const std::string& worker_id);

    /**
     * @brief Add a worker to the pool
     * @throws ConfigurationError on duplicate id or zero capacity
     */
    void addWorker(const WorkerSpec& spec);

    size_t activeSessionCount() const;

    std::optional<SessionBinding> binding(const std::string& session_id) const;

    LoadBalancingMetrics metrics() const;

    /**
     * @brief Start periodic inactivity sweeps with the configured interval
     */
    void startCleanup();

    void stopCleanup();

    const LoadBalancerConfig& config() const { return m_config; }

private:
    struct WorkerSlot {
        std::string worker_id;
        size_t capacity = 0;
        size_t current_load = 0;
        std::vector<std::string> tags;
        TimePoint last_heartbeat;
        mutable std::mutex mutex;
    };

    struct Affinity {
        std::string worker_id;
        TimePoint last_used;
    };

    struct SessionShard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, SessionBinding> bindings;
        std::unordered_map<std::string, Affinity> affinity;
    };

    // Shared with cancellation callbacks, which may outlive a wait
    struct Waker {
        std::mutex mutex;
        std::condition_variable cv;
        uint64_t generation = 0;
    };

    AssignmentResult assignInternal(const std::string& session_id,
                                    const std::string& preferred_worker_id,
                                    const std::vector<std::string>& required_tags);
    SessionShard& shardFor(const std::string& session_id) const;
    WorkerSlot* findWorker(const std::string& worker_id) const;
    WorkerSlot* reserveLeastLoaded(const std::vector<std::string>& required_tags);
    static bool tryReserve(WorkerSlot& slot);
    static void freeSlot(WorkerSlot& slot);
    static bool matchesTags(const WorkerSlot& slot, const std::vector<std::string>& required_tags);
    bool releaseBinding(const std::string& session_id, uint64_t binding_id);
    void notifyWaiters();

    LoadBalancerConfig m_config;
    const Clock& m_clock;

    mutable std::shared_mutex m_workers_mutex;
    std::vector<std::unique_ptr<WorkerSlot>> m_workers;
    std::unordered_map<std::string, size_t> m_worker_index;

    std::vector<std::unique_ptr<SessionShard>> m_shards;
    std::shared_ptr<Waker> m_waker;

    std::atomic<uint64_t> m_next_binding_id{1};
    std::atomic<uint64_t> m_total_requests{0};
    std::atomic<uint64_t> m_balanced{0};
    std::atomic<uint64_t> m_sticky{0};
    std::atomic<uint64_t> m_rejected{0};
    std::atomic<uint64_t> m_reclaimed{0};

    std::unique_ptr<PeriodicTask> m_cleanup_task;
};

} // namespace Tempo
