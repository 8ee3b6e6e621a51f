#pragma once
// Supervisor: one worker per agent
//
// Each agent owns a thread and a job queue. Polls, deliveries and health
// probes are posted as jobs and answered through futures, so a slow or
// stuck agent only ever blocks its own queue. Callers bound their waits,
// and a queue that reaches its bound refuses further jobs.

#include "agent.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <thread>

namespace sabha {

class AgentWorker {
public:
    AgentWorker(std::unique_ptr<Agent> agent, size_t max_backlog)
        : agent_(std::move(agent)), max_backlog_(std::max<size_t>(max_backlog, 1)) {}
    ~AgentWorker() { stop(); }

    AgentWorker(const AgentWorker&) = delete;
    AgentWorker& operator=(const AgentWorker&) = delete;

    void start() {
        std::lock_guard lock(mutex_);
        if (running_) return;
        running_ = true;
        thread_ = std::thread([this] { loop(); });
    }

    // Pending jobs are dropped; their futures report broken_promise
    void stop() {
        {
            std::lock_guard lock(mutex_);
            if (!running_) return;
            running_ = false;
        }
        cv_.notify_all();
        if (thread_.joinable()) thread_.join();
        std::lock_guard lock(mutex_);
        jobs_.clear();
    }

    // Run fn(agent) on the worker thread. Throws DegradedDependencyError
    // when the worker is stopped or max_backlog jobs are already queued.
    template<typename F>
    auto post(F&& fn) -> std::future<decltype(fn(std::declval<Agent&>()))> {
        using R = decltype(fn(std::declval<Agent&>()));
        auto task = std::make_shared<std::packaged_task<R()>>(
            [this, fn = std::forward<F>(fn)]() mutable { return fn(*agent_); });
        auto future = task->get_future();
        {
            std::lock_guard lock(mutex_);
            if (!running_) {
                throw DegradedDependencyError("worker for " + agent_->id() + " is not running");
            }
            if (jobs_.size() >= max_backlog_) {
                throw DegradedDependencyError("worker for " + agent_->id() + " has " +
                                              std::to_string(jobs_.size()) + " jobs queued");
            }
            jobs_.emplace_back([task] { (*task)(); });
        }
        cv_.notify_one();
        return future;
    }

    // No job queued or running
    bool idle() const {
        std::lock_guard lock(mutex_);
        return jobs_.empty() && !busy_;
    }

    size_t backlog() const {
        std::lock_guard lock(mutex_);
        return jobs_.size() + (busy_ ? 1 : 0);
    }

    size_t queued() const {
        std::lock_guard lock(mutex_);
        return jobs_.size();
    }

    const Agent& agent() const { return *agent_; }

private:
    void loop() {
        while (true) {
            std::function<void()> job;
            {
                std::unique_lock lock(mutex_);
                cv_.wait(lock, [this] { return !running_ || !jobs_.empty(); });
                if (!running_) return;
                job = std::move(jobs_.front());
                jobs_.pop_front();
                busy_ = true;
            }
            job();
            {
                std::lock_guard lock(mutex_);
                busy_ = false;
            }
        }
    }

    std::unique_ptr<Agent> agent_;
    size_t max_backlog_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> jobs_;
    std::thread thread_;
    bool running_ = false;
    bool busy_ = false;
};

// Where the output router sends fan-out and the coordinator its hand-offs
class EventDelivery {
public:
    virtual ~EventDelivery() = default;

    // Resolves true once the event was consumed, false if every attempt failed
    virtual std::future<bool> deliver(const std::string& agent_id, const Event& event) = 0;

    // Jobs waiting to start on this agent's worker
    virtual size_t queued(const std::string& agent_id) const = 0;
};

class AgentSupervisor : public EventDelivery {
public:
    explicit AgentSupervisor(size_t delivery_attempts = 2, size_t max_backlog = 64)
        : delivery_attempts_(std::max<size_t>(delivery_attempts, 1)), max_backlog_(max_backlog) {}

    ~AgentSupervisor() override { stop(); }

    void add(std::unique_ptr<Agent> agent) {
        std::string id = agent->id();
        if (workers_.count(id)) {
            throw ConfigurationError("duplicate agent id '" + id + "'");
        }
        order_.push_back(id);
        workers_.emplace(id, std::make_unique<AgentWorker>(std::move(agent), max_backlog_));
    }

    void start() {
        for (auto& [id, w] : workers_) w->start();
    }

    void stop() {
        for (auto& [id, w] : workers_) w->stop();
    }

    // Registration order
    const std::vector<std::string>& ids() const { return order_; }

    bool contains(const std::string& id) const { return workers_.count(id) > 0; }

    const AgentSpec& spec(const std::string& id) const { return worker(id).agent().spec(); }

    std::future<std::optional<Signal>> poll(const std::string& id, TickContext ctx) {
        return worker(id).post([ctx = std::move(ctx)](Agent& a) {
            return a.produce_signal(ctx);
        });
    }

    std::future<bool> probe(const std::string& id) {
        return worker(id).post([](Agent& a) { return a.healthy(); });
    }

    std::future<bool> deliver(const std::string& agent_id, const Event& event) override {
        size_t attempts = delivery_attempts_;
        return worker(agent_id).post([event, attempts](Agent& a) {
            for (size_t attempt = 1; attempt <= attempts; ++attempt) {
                try {
                    a.consume_event(event);
                    return true;
                } catch (const std::exception& e) {
                    log_warn("Supervisor", "delivery_failed", e.what(),
                             {{"agent", a.id()}, {"attempt", std::to_string(attempt)},
                              {"ref", event.ref_id}});
                }
            }
            return false;
        });
    }

    bool idle(const std::string& id) const { return worker(id).idle(); }
    size_t backlog(const std::string& id) const { return worker(id).backlog(); }
    size_t queued(const std::string& id) const override { return worker(id).queued(); }

private:
    AgentWorker& worker(const std::string& id) const {
        auto it = workers_.find(id);
        if (it == workers_.end()) throw ValidationError("unknown agent '" + id + "'");
        return *it->second;
    }

    size_t delivery_attempts_;
    size_t max_backlog_;
    std::vector<std::string> order_;
    std::map<std::string, std::unique_ptr<AgentWorker>> workers_;
};

} // namespace sabha
