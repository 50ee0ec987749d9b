#pragma once
// Scheduler: bounded-concurrency execution of unreliable units of work
//
// run(tasks):
//   1. A bench of min(max_concurrent, N) workers pulls tasks in order.
//      Each task holds its worker slot for its whole attempt sequence,
//      backoff sleeps included.
//   2. Each attempt is bounded by timeout_ms. The attempt runs on its own
//      thread; on expiry the scheduler stops waiting, not the work.
//   3. Failures are retried up to max_retries more times while the
//      RetryClassifier says so. Timeouts are always retryable.
//   4. After the batch, one extra wave runs HIGH+ handoffs addressed to
//      roles the batch already knows. The wave never drains handoffs itself.
//
// One task failing never stops its siblings.

#include "types.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "handoff_queue.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <cmath>
#include <functional>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <vector>

namespace hive {

using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// Units of work
// ═══════════════════════════════════════════════════════════════════════════

// Something the scheduler can run. execute() may throw, block or return
// anything; the scheduler never interprets the result.
class Executable {
public:
    virtual ~Executable() = default;

    virtual std::string role() const = 0;
    virtual std::string name() const { return role(); }
    virtual json execute(const json& context) = 0;
};

// Adapts a callable to Executable
class FunctionExecutable : public Executable {
public:
    using Fn = std::function<json(const json&)>;

    FunctionExecutable(std::string role, Fn fn, std::string name = "")
        : role_(std::move(role)), name_(std::move(name)), fn_(std::move(fn)) {}

    std::string role() const override { return role_; }
    std::string name() const override { return name_.empty() ? role_ : name_; }
    json execute(const json& context) override { return fn_(context); }

private:
    std::string role_;
    std::string name_;
    Fn fn_;
};

enum class TaskStatus : uint8_t {
    Pending = 0,
    Running = 1,
    Completed = 2,
    Failed = 3,
    Cancelled = 4,
};

inline std::string task_status_name(TaskStatus s) {
    switch (s) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::Running: return "running";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed: return "failed";
        case TaskStatus::Cancelled: return "cancelled";
    }
    return "pending";
}

struct Task {
    std::string id;
    std::shared_ptr<Executable> executable;
    json context = json::object();
    std::optional<HandoffContext> handoff;    // Set for handoff-wave tasks
    TaskStatus status = TaskStatus::Pending;
    uint32_t attempts = 0;
    json result;                              // Null until COMPLETED
    std::optional<std::string> error;
    Timestamp started_at = 0;
    Timestamp completed_at = 0;

    Task() = default;
    Task(std::shared_ptr<Executable> exe, json ctx = json::object(), std::string task_id = "")
        : id(task_id.empty() ? new_id() : std::move(task_id)),
          executable(std::move(exe)),
          context(std::move(ctx)) {}

    std::string role() const { return executable ? executable->role() : "unknown"; }

    // Forward-only status change; false when the transition is not allowed
    bool advance(TaskStatus next) {
        switch (status) {
            case TaskStatus::Pending:
                if (next != TaskStatus::Running && next != TaskStatus::Cancelled) return false;
                break;
            case TaskStatus::Running:
                if (next != TaskStatus::Running && next != TaskStatus::Completed &&
                    next != TaskStatus::Failed) return false;
                break;
            default:
                return false;
        }
        status = next;
        return true;
    }

    // Only tasks that have not started can be cancelled
    bool cancel() { return advance(TaskStatus::Cancelled); }
};

inline void to_json(json& j, const Task& t) {
    std::string summary;
    if (!t.result.is_null()) {
        summary = utf8_prefix(t.result.dump(), 200);
    }
    j = json{
        {"id", t.id},
        {"role", t.role()},
        {"context", t.context},
        {"handoff_context", t.handoff ? json(*t.handoff) : json()},
        {"status", task_status_name(t.status)},
        {"attempts", t.attempts},
        {"result", t.result.is_null() ? json() : json(summary)},
        {"error", t.error ? json(*t.error) : json()},
        {"started_at", t.started_at},
        {"completed_at", t.completed_at}
    };
}

struct SchedulerResult {
    size_t total = 0;
    size_t completed = 0;
    size_t failed = 0;
    size_t cancelled = 0;
    std::vector<Task> tasks;
    int64_t duration_ms = 0;
};

// One failed task, for reporting
struct TaskError {
    std::string task_id;
    std::string role;
    std::string error;
};

// Decides whether a failed attempt may be retried
using RetryClassifier = std::function<bool(const std::exception_ptr&)>;

namespace retry {

// Everything except cancellation
inline bool retry_all(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const CancelledError&) {
        return false;
    } catch (...) {
        return true;
    }
}

// Transient and foreign failures; never FatalFailure or cancellation
inline bool transient_only(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const CancelledError&) {
        return false;
    } catch (const FatalFailure&) {
        return false;
    } catch (...) {
        return true;
    }
}

} // namespace retry

// ═══════════════════════════════════════════════════════════════════════════
// Scheduler
// ═══════════════════════════════════════════════════════════════════════════

class Scheduler {
public:
    using StartCallback = std::function<void(const std::string& name)>;
    using CompleteCallback = std::function<void(const std::string& name, bool success)>;

    explicit Scheduler(SchedulerConfig config = {}, HandoffQueue* handoffs = nullptr)
        : config_(config), handoffs_(handoffs), classifier_(retry::retry_all) {
        if (config_.max_concurrent == 0) config_.max_concurrent = 1;
    }

    void on_task_start(StartCallback callback) { on_start_ = std::move(callback); }
    void on_task_complete(CompleteCallback callback) { on_complete_ = std::move(callback); }
    void set_retry_classifier(RetryClassifier classifier) { classifier_ = std::move(classifier); }

    const SchedulerConfig& config() const { return config_; }

    // Delay before retry number `retry` (1 for the first retry)
    int64_t backoff_ms(uint32_t retry) const {
        double delay = static_cast<double>(config_.backoff_base_ms) *
                       std::pow(config_.backoff_multiplier, static_cast<double>(retry));
        if (delay > static_cast<double>(config_.backoff_cap_ms)) {
            return config_.backoff_cap_ms;
        }
        return static_cast<int64_t>(delay);
    }

    SchedulerResult run(std::vector<Task> tasks) {
        auto t0 = std::chrono::steady_clock::now();

        run_bench(tasks);

        if (handoffs_ && config_.drain_handoffs) {
            auto wave = drain_handoffs(tasks);
            for (auto& t : wave) tasks.push_back(std::move(t));
        }

        SchedulerResult result;
        result.total = tasks.size();
        for (const auto& t : tasks) {
            switch (t.status) {
                case TaskStatus::Completed: result.completed++; break;
                case TaskStatus::Failed: result.failed++; break;
                case TaskStatus::Cancelled: result.cancelled++; break;
                default: break;
            }
        }
        result.tasks = std::move(tasks);
        result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0).count();
        return result;
    }

    // Completed results grouped by role
    static std::map<std::string, std::vector<json>> collect_results(const std::vector<Task>& tasks) {
        std::map<std::string, std::vector<json>> out;
        for (const auto& t : tasks) {
            if (t.status == TaskStatus::Completed && !t.result.is_null()) {
                out[t.role()].push_back(t.result);
            }
        }
        return out;
    }

    static std::vector<TaskError> errors(const std::vector<Task>& tasks) {
        std::vector<TaskError> out;
        for (const auto& t : tasks) {
            if (t.status == TaskStatus::Failed) {
                out.push_back({t.id, t.role(), t.error.value_or("")});
            }
        }
        return out;
    }

private:
    // Run every task on a fixed bench of workers
    void run_bench(std::vector<Task>& tasks) {
        if (tasks.empty()) return;

        size_t workers = std::min(config_.max_concurrent, tasks.size());
        std::atomic<size_t> next{0};

        auto worker = [this, &tasks, &next]() {
            while (true) {
                size_t i = next.fetch_add(1);
                if (i >= tasks.size()) return;
                try {
                    run_single(tasks[i]);
                } catch (...) {
                    abort_task(tasks[i], describe(std::current_exception()));
                }
            }
        };

        std::vector<std::thread> bench;
        bench.reserve(workers);
        for (size_t w = 0; w < workers; ++w) {
            try {
                bench.emplace_back(worker);
            } catch (const std::system_error& e) {
                std::cerr << "[Scheduler] Could not start worker " << w << ": " << e.what() << "\n";
                break;
            }
        }
        if (bench.empty()) worker();   // Degrade to the calling thread
        for (auto& th : bench) th.join();
    }

    // A task whose attempt sequence itself blew up
    static void abort_task(Task& task, const std::string& message) {
        std::cerr << "[Scheduler] Task " << task.id << " aborted: " << message << "\n";
        if (task.status == TaskStatus::Pending) task.advance(TaskStatus::Running);
        if (task.advance(TaskStatus::Failed)) {
            task.error = message;
            task.completed_at = now();
        }
    }

    // Attempt sequence for one task
    void run_single(Task& task) {
        if (task.status != TaskStatus::Pending) return;   // Cancelled before run

        if (!task.executable) {
            task.advance(TaskStatus::Running);
            task.error = "task has no executable";
            task.advance(TaskStatus::Failed);
            task.started_at = task.completed_at = now();
            return;
        }

        const std::string name = task.executable->name();
        uint32_t retry = 0;

        while (true) {
            task.advance(TaskStatus::Running);
            if (task.started_at == 0) task.started_at = now();
            task.attempts++;
            fire_start(name);

            if (retry > 0) {
                std::cerr << "[Scheduler] Task " << task.id << " (" << name << ") retry "
                          << retry << "/" << config_.max_retries << "\n";
            }

            json ctx = attempt_context(task);
            auto attempt_start = std::chrono::steady_clock::now();

            std::exception_ptr failure;
            json result;
            try {
                result = run_attempt(task.executable, std::move(ctx));
            } catch (...) {
                failure = std::current_exception();
            }

            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - attempt_start).count();

            if (!failure) {
                task.result = std::move(result);
                task.error.reset();
                task.advance(TaskStatus::Completed);
                task.completed_at = now();
                fire_complete(name, true);
                return;
            }

            std::string message = describe(failure);
            bool retryable = is_timeout(failure) || classifier_(failure);
            bool again = retryable && retry < config_.max_retries;

            std::cerr << "[Scheduler] Task " << task.id << " (" << name << ") failed after "
                      << elapsed << "ms: " << message
                      << (again ? ", retrying" : "") << "\n";

            if (again) {
                retry++;
                int64_t wait = backoff_ms(retry);
                if (wait > 0) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(wait));
                }
                continue;
            }

            task.error = message;
            task.advance(TaskStatus::Failed);
            task.completed_at = now();
            fire_complete(name, false);
            return;
        }
    }

    // One attempt, bounded by timeout_ms. The attempt thread owns copies of
    // everything it touches so an abandoned attempt can finish safely.
    json run_attempt(std::shared_ptr<Executable> exe, json ctx) {
        if (config_.timeout_ms <= 0) {
            return exe->execute(ctx);
        }

        auto promise = std::make_shared<std::promise<json>>();
        auto future = promise->get_future();

        std::thread([exe, ctx = std::move(ctx), promise]() {
            try {
                promise->set_value(exe->execute(ctx));
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        }).detach();

        if (future.wait_for(std::chrono::milliseconds(config_.timeout_ms)) ==
            std::future_status::timeout) {
            throw TimeoutFailure("attempt timed out after " +
                                 std::to_string(config_.timeout_ms) + "ms");
        }
        return future.get();
    }

    static bool is_timeout(const std::exception_ptr& error) {
        try {
            std::rethrow_exception(error);
        } catch (const TimeoutFailure&) {
            return true;
        } catch (...) {
            return false;
        }
    }

    static json attempt_context(const Task& task) {
        json ctx = task.context.is_object() ? task.context : json::object();
        ctx["_task_id"] = task.id;
        ctx["_attempt"] = task.attempts;
        if (task.handoff) ctx["_handoff"] = *task.handoff;
        return ctx;
    }

    // One wave of HIGH+ handoffs, matched to executables the batch knows
    std::vector<Task> drain_handoffs(const std::vector<Task>& batch) {
        std::unordered_map<std::string, std::shared_ptr<Executable>> by_role;
        for (const auto& t : batch) {
            if (t.executable) by_role.emplace(t.executable->role(), t.executable);
        }

        std::vector<Task> wave;
        std::vector<std::string> handoff_ids;
        for (const auto& h : handoffs_->list_pending(std::nullopt, HandoffPriority::High)) {
            if (!handoffs_->update_status(h.id, HandoffStatus::InProgress)) continue;

            auto it = by_role.find(h.to_role);
            if (it == by_role.end()) {
                std::cerr << "[Scheduler] Handoff " << h.id << " has no executable for role "
                          << h.to_role << "\n";
                handoffs_->update_status(h.id, HandoffStatus::Failed, std::nullopt,
                                         "no executable for role " + h.to_role);
                continue;
            }

            Task t(it->second, json::object(), "handoff-" + h.id);
            t.handoff = h.context;
            wave.push_back(std::move(t));
            handoff_ids.push_back(h.id);
        }

        if (wave.empty()) return wave;

        std::cerr << "[Scheduler] Running " << wave.size() << " handoff task(s)\n";
        run_bench(wave);

        for (size_t i = 0; i < wave.size(); ++i) {
            const auto& t = wave[i];
            if (t.status == TaskStatus::Completed) {
                handoffs_->update_status(handoff_ids[i], HandoffStatus::Completed, t.result.dump());
            } else {
                handoffs_->update_status(handoff_ids[i], HandoffStatus::Failed, std::nullopt,
                                         t.error.value_or("handoff task did not complete"));
            }
        }
        return wave;
    }

    void fire_start(const std::string& name) {
        if (!on_start_) return;
        std::lock_guard<std::mutex> lock(callback_mutex_);
        try {
            on_start_(name);
        } catch (const std::exception& e) {
            std::cerr << "[Scheduler] on_task_start callback failed: " << e.what() << "\n";
        } catch (...) {
            std::cerr << "[Scheduler] on_task_start callback failed: non-standard exception\n";
        }
    }

    void fire_complete(const std::string& name, bool success) {
        if (!on_complete_) return;
        std::lock_guard<std::mutex> lock(callback_mutex_);
        try {
            on_complete_(name, success);
        } catch (const std::exception& e) {
            std::cerr << "[Scheduler] on_task_complete callback failed: " << e.what() << "\n";
        } catch (...) {
            std::cerr << "[Scheduler] on_task_complete callback failed: non-standard exception\n";
        }
    }

    SchedulerConfig config_;
    HandoffQueue* handoffs_;
    RetryClassifier classifier_;
    StartCallback on_start_;
    CompleteCallback on_complete_;
    std::mutex callback_mutex_;
};

} // namespace hive
