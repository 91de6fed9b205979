// =================================================================
// src/Tempo/SessionLoadBalancer.cpp
// =================================================================
// Implementation for session-to-worker load balancing.

#include "Tempo/SessionLoadBalancer.hpp"
#include "Tempo/Errors.hpp"
#include "Tempo/Logger.hpp"
#include <algorithm>
#include <functional>
#include <set>
#include <sstream>

namespace Tempo {

void LoadBalancerConfig::validate() const {
    std::set<std::string> ids;
    for (const auto& worker : workers) {
        if (worker.id.empty()) {
            throw ConfigurationError("load_balancer worker id must not be empty");
        }
        if (worker.capacity == 0) {
            throw ConfigurationError("load_balancer worker '" + worker.id + "' capacity must be greater than zero");
        }
        if (!ids.insert(worker.id).second) {
            throw ConfigurationError("load_balancer worker id '" + worker.id + "' is duplicated");
        }
    }
    if (inactivity_threshold.count() <= 0) {
        throw ConfigurationError("load_balancer.inactivity_threshold must be positive");
    }
    if (cleanup_interval.count() <= 0) {
        throw ConfigurationError("load_balancer.cleanup_interval must be positive");
    }
    if (shard_count == 0) {
        throw ConfigurationError("load_balancer.shard_count must be greater than zero");
    }
}

std::vector<WorkerSpec> LoadBalancerConfig::defaultWorkers(size_t capacity) {
    return {
        {"worker-1", capacity, {"aws", "architecture", "migration"}},
        {"worker-2", capacity, {"security", "compliance", "aws", "azure"}},
        {"worker-3", capacity, {"aws", "azure", "gcp", "architecture"}},
        {"worker-4", capacity, {"devops", "kubernetes", "ci/cd", "automation"}},
        {"worker-5", capacity, {"cost", "optimization", "finops", "aws"}},
    };
}

SessionLoadBalancer::SessionLoadBalancer(const LoadBalancerConfig& config, const Clock& clock)
    : m_config(config), m_clock(clock), m_waker(std::make_shared<Waker>()) {
    m_config.validate();

    if (m_config.workers.empty()) {
        m_config.workers = LoadBalancerConfig::defaultWorkers();
        Logger::getInstance().info("SessionLoadBalancer", "No workers configured, using default pool");
    }

    for (size_t i = 0; i < m_config.shard_count; i++) {
        m_shards.push_back(std::make_unique<SessionShard>());
    }

    TimePoint now = m_clock.now();
    for (const auto& spec : m_config.workers) {
        auto slot = std::make_unique<WorkerSlot>();
        slot->worker_id = spec.id;
        slot->capacity = spec.capacity;
        slot->tags = spec.tags;
        slot->last_heartbeat = now;
        m_worker_index[spec.id] = m_workers.size();
        m_workers.push_back(std::move(slot));
    }

    Logger::getInstance().info("SessionLoadBalancer", "Load balancer initialized",
                               "Workers: " + std::to_string(m_workers.size()));
}

SessionLoadBalancer::~SessionLoadBalancer() {
    stopCleanup();
}

SessionLoadBalancer::SessionShard& SessionLoadBalancer::shardFor(const std::string& session_id) const {
    return *m_shards[std::hash<std::string>{}(session_id) % m_shards.size()];
}

SessionLoadBalancer::WorkerSlot* SessionLoadBalancer::findWorker(const std::string& worker_id) const {
    auto it = m_worker_index.find(worker_id);
    return it == m_worker_index.end() ? nullptr : m_workers[it->second].get();
}

bool SessionLoadBalancer::tryReserve(WorkerSlot& slot) {
    std::lock_guard<std::mutex> lock(slot.mutex);
    if (slot.current_load >= slot.capacity) {
        return false;
    }
    slot.current_load++;
    return true;
}

void SessionLoadBalancer::freeSlot(WorkerSlot& slot) {
    std::lock_guard<std::mutex> lock(slot.mutex);
    if (slot.current_load > 0) {
        slot.current_load--;
    }
}

bool SessionLoadBalancer::matchesTags(const WorkerSlot& slot, const std::vector<std::string>& required_tags) {
    if (required_tags.empty()) {
        return true;
    }
    for (const auto& tag : required_tags) {
        if (std::find(slot.tags.begin(), slot.tags.end(), tag) != slot.tags.end()) {
            return true;
        }
    }
    return false;
}

SessionLoadBalancer::WorkerSlot* SessionLoadBalancer::reserveLeastLoaded(const std::vector<std::string>& required_tags) {
    struct Candidate {
        WorkerSlot* slot;
        size_t load;
        size_t capacity;
        TimePoint heartbeat;
    };

    std::vector<Candidate> candidates;
    for (const auto& worker : m_workers) {
        if (!matchesTags(*worker, required_tags)) {
            continue;
        }
        std::lock_guard<std::mutex> lock(worker->mutex);
        if (worker->current_load < worker->capacity) {
            candidates.push_back({worker.get(), worker->current_load, worker->capacity, worker->last_heartbeat});
        }
    }

    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        // Compare load/capacity ratios without floating point
        size_t lhs = a.load * b.capacity;
        size_t rhs = b.load * a.capacity;
        if (lhs != rhs) {
            return lhs < rhs;
        }
        if (a.heartbeat != b.heartbeat) {
            return a.heartbeat < b.heartbeat;
        }
        return a.slot->worker_id < b.slot->worker_id;
    });

    // Loads may have moved since the snapshot, so reservation can still fail
    for (const auto& candidate : candidates) {
        if (tryReserve(*candidate.slot)) {
            return candidate.slot;
        }
    }
    return nullptr;
}

AssignmentResult SessionLoadBalancer::assign(const std::string& session_id,
                                             const std::string& preferred_worker_id,
                                             const std::vector<std::string>& required_tags) {
    m_total_requests++;
    AssignmentResult result = assignInternal(session_id, preferred_worker_id, required_tags);
    if (!result.assigned()) {
        m_rejected++;
        Logger::getInstance().debug("SessionLoadBalancer", "Assignment rejected, no spare capacity", session_id);
    }
    return result;
}

AssignmentResult SessionLoadBalancer::assignInternal(const std::string& session_id,
                                                     const std::string& preferred_worker_id,
                                                     const std::vector<std::string>& required_tags) {
    AssignmentResult result;
    TimePoint now = m_clock.now();

    std::shared_lock<std::shared_mutex> workers_lock(m_workers_mutex);
    SessionShard& shard = shardFor(session_id);
    std::lock_guard<std::mutex> shard_lock(shard.mutex);

    auto existing = shard.bindings.find(session_id);
    if (existing != shard.bindings.end()) {
        existing->second.last_activity = now;
        existing->second.in_flight++;
        result.status = AssignmentStatus::ASSIGNED;
        result.worker_id = existing->second.worker_id;
        result.reused_binding = true;
        result.binding_id = existing->second.binding_id;
        return result;
    }

    WorkerSlot* chosen = nullptr;
    bool sticky = false;

    if (!preferred_worker_id.empty()) {
        WorkerSlot* preferred = findWorker(preferred_worker_id);
        if (preferred && tryReserve(*preferred)) {
            chosen = preferred;
            sticky = true;
        }
    } else if (m_config.remember_affinity) {
        auto previous = shard.affinity.find(session_id);
        if (previous != shard.affinity.end()) {
            WorkerSlot* preferred = findWorker(previous->second.worker_id);
            if (preferred && matchesTags(*preferred, required_tags) && tryReserve(*preferred)) {
                chosen = preferred;
                sticky = true;
            }
        }
    }

    if (!chosen) {
        chosen = reserveLeastLoaded(required_tags);
    }
    if (!chosen) {
        result.status = AssignmentStatus::REJECTED;
        return result;
    }

    SessionBinding binding;
    binding.binding_id = m_next_binding_id++;
    binding.session_id = session_id;
    binding.worker_id = chosen->worker_id;
    binding.assigned_at = now;
    binding.last_activity = now;
    binding.in_flight = 1;
    shard.bindings.emplace(session_id, binding);

    if (m_config.remember_affinity) {
        shard.affinity[session_id] = Affinity{chosen->worker_id, now};
    }

    if (sticky) {
        m_sticky++;
    } else {
        m_balanced++;
    }

    result.status = AssignmentStatus::ASSIGNED;
    result.worker_id = chosen->worker_id;
    result.binding_id = binding.binding_id;
    return result;
}

AssignmentResult SessionLoadBalancer::assignWaiting(const std::string& session_id,
                                                    const std::string& preferred_worker_id,
                                                    const std::vector<std::string>& required_tags,
                                                    TimePoint deadline,
                                                    const CancellationToken& token) {
    m_total_requests++;

    std::shared_ptr<Waker> waker = m_waker;
    CancellationRegistration registration = token.onCancel([waker] {
        {
            std::lock_guard<std::mutex> lock(waker->mutex);
            waker->generation++;
        }
        waker->cv.notify_all();
    });

    AssignmentResult result;
    while (true) {
        if (token.isCancelled()) {
            result.status = AssignmentStatus::CANCELLED;
            return result;
        }

        uint64_t observed;
        {
            std::lock_guard<std::mutex> lock(waker->mutex);
            observed = waker->generation;
        }

        result = assignInternal(session_id, preferred_worker_id, required_tags);
        if (result.assigned()) {
            return result;
        }

        std::unique_lock<std::mutex> lock(waker->mutex);
        bool woken = waker->cv.wait_until(lock, deadline, [&] {
            return waker->generation != observed || token.isCancelled();
        });
        if (!woken) {
            break;
        }
    }

    m_rejected++;
    Logger::getInstance().debug("SessionLoadBalancer", "Gave up waiting for a worker slot", session_id);
    result.status = AssignmentStatus::REJECTED;
    return result;
}

bool SessionLoadBalancer::release(const std::string& session_id) {
    return releaseBinding(session_id, 0);
}

bool SessionLoadBalancer::release(const std::string& session_id, uint64_t binding_id) {
    if (binding_id == 0) {
        return false;
    }
    return releaseBinding(session_id, binding_id);
}

// binding_id 0 matches whatever binding the session holds
bool SessionLoadBalancer::releaseBinding(const std::string& session_id, uint64_t binding_id) {
    bool freed = false;
    {
        std::shared_lock<std::shared_mutex> workers_lock(m_workers_mutex);
        SessionShard& shard = shardFor(session_id);
        std::lock_guard<std::mutex> shard_lock(shard.mutex);

        auto it = shard.bindings.find(session_id);
        if (it == shard.bindings.end()) {
            return false;
        }
        if (binding_id != 0 && it->second.binding_id != binding_id) {
            Logger::getInstance().debug("SessionLoadBalancer", "Ignored release of a reclaimed binding", session_id);
            return false;
        }

        SessionBinding& binding = it->second;
        binding.last_activity = std::max(binding.last_activity, m_clock.now());
        if (binding.in_flight > 1) {
            binding.in_flight--;
            return true;
        }

        WorkerSlot* slot = findWorker(binding.worker_id);
        if (slot) {
            freeSlot(*slot);
        }
        shard.bindings.erase(it);
        freed = true;
    }

    if (freed) {
        notifyWaiters();
    }
    return true;
}

size_t SessionLoadBalancer::cleanupExpired(std::chrono::milliseconds inactivity_threshold) {
    TimePoint now = m_clock.now();
    size_t reclaimed = 0;

    {
        std::shared_lock<std::shared_mutex> workers_lock(m_workers_mutex);
        for (auto& shard : m_shards) {
            std::lock_guard<std::mutex> shard_lock(shard->mutex);

            for (auto it = shard->bindings.begin(); it != shard->bindings.end();) {
                if (now - it->second.last_activity > inactivity_threshold) {
                    WorkerSlot* slot = findWorker(it->second.worker_id);
                    if (slot) {
                        freeSlot(*slot);
                    }
                    it = shard->bindings.erase(it);
                    reclaimed++;
                } else {
                    ++it;
                }
            }

            for (auto it = shard->affinity.begin(); it != shard->affinity.end();) {
                bool bound = shard->bindings.count(it->first) > 0;
                if (!bound && now - it->second.last_used > inactivity_threshold) {
                    it = shard->affinity.erase(it);
                } else {
                    ++it;
                }
            }
        }
    }

    if (reclaimed > 0) {
        m_reclaimed += reclaimed;
        notifyWaiters();
        Logger::getInstance().info("SessionLoadBalancer", "Reclaimed inactive sessions",
                                   "Count: " + std::to_string(reclaimed));
    }
    return reclaimed;
}

bool SessionLoadBalancer::heartbeat(const std::string& worker_id) {
    std::shared_lock<std::shared_mutex> workers_lock(m_workers_mutex);
    WorkerSlot* slot = findWorker(worker_id);
    if (!slot) {
        return false;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    slot->last_heartbeat = m_clock.now();
    return true;
}

void SessionLoadBalancer::addWorker(const WorkerSpec& spec) {
    if (spec.id.empty() || spec.capacity == 0) {
        throw ConfigurationError("worker requires an id and a positive capacity");
    }

    {
        std::unique_lock<std::shared_mutex> workers_lock(m_workers_mutex);
        if (m_worker_index.count(spec.id) > 0) {
            throw ConfigurationError("worker '" + spec.id + "' already exists");
        }

        auto slot = std::make_unique<WorkerSlot>();
        slot->worker_id = spec.id;
        slot->capacity = spec.capacity;
        slot->tags = spec.tags;
        slot->last_heartbeat = m_clock.now();
        m_worker_index[spec.id] = m_workers.size();
        m_workers.push_back(std::move(slot));
    }

    notifyWaiters();
    Logger::getInstance().info("SessionLoadBalancer", "Added worker",
                               spec.id + " (capacity " + std::to_string(spec.capacity) + ")");
}

size_t SessionLoadBalancer::activeSessionCount() const {
    size_t count = 0;
    for (const auto& shard : m_shards) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        count += shard->bindings.size();
    }
    return count;
}

std::optional<SessionBinding> SessionLoadBalancer::binding(const std::string& session_id) const {
    SessionShard& shard = shardFor(session_id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.bindings.find(session_id);
    if (it == shard.bindings.end()) {
        return std::nullopt;
    }
    return it->second;
}

LoadBalancingMetrics SessionLoadBalancer::metrics() const {
    LoadBalancingMetrics metrics;
    metrics.total_sessions = m_total_requests.load();
    metrics.balanced_sessions = m_balanced.load();
    metrics.sticky_sessions = m_sticky.load();
    metrics.rejected_sessions = m_rejected.load();
    metrics.reclaimed_sessions = m_reclaimed.load();
    metrics.active_sessions = activeSessionCount();

    TimePoint now = m_clock.now();
    double total_ratio = 0.0;

    std::shared_lock<std::shared_mutex> workers_lock(m_workers_mutex);
    for (const auto& worker : m_workers) {
        std::lock_guard<std::mutex> lock(worker->mutex);

        WorkerLoad load;
        load.worker_id = worker->worker_id;
        load.current_load = worker->current_load;
        load.capacity = worker->capacity;
        load.tags = worker->tags;
        load.seconds_since_heartbeat = std::max(0.0, toSeconds(now - worker->last_heartbeat));
        metrics.workers.push_back(load);

        if (worker->current_load < worker->capacity) {
            metrics.available_workers++;
        } else {
            metrics.busy_workers++;
        }
        total_ratio += static_cast<double>(worker->current_load) / worker->capacity;
    }

    metrics.total_workers = m_workers.size();
    if (metrics.total_workers > 0) {
        metrics.average_load = total_ratio / metrics.total_workers;
    }
    return metrics;
}

void SessionLoadBalancer::startCleanup() {
    if (!m_cleanup_task) {
        m_cleanup_task = std::make_unique<PeriodicTask>("SessionLoadBalancer", m_config.cleanup_interval, [this] {
            cleanupExpired(m_config.inactivity_threshold);
        });
    }
    m_cleanup_task->start();
}

void SessionLoadBalancer::stopCleanup() {
    if (m_cleanup_task) {
        m_cleanup_task->stop();
    }
}

void SessionLoadBalancer::notifyWaiters() {
    {
        std::lock_guard<std::mutex> lock(m_waker->mutex);
        m_waker->generation++;
    }
    m_waker->cv.notify_all();
}

} // namespace Tempo
