// ============================================================================
// rivulet/io/thread_pool_executor.hpp - Multi-Threaded Executor
// ============================================================================
//
// ThreadPoolExecutor runs queued callbacks and coroutines on a fixed set of
// worker threads, with one extra thread that moves delayed work onto the
// queue when it becomes due.
//
// A stream running here really does hop threads: a generator's step may
// resolve on the timer thread and its next batch may run on a different
// worker. The acknowledgment protocol keeps each subscription sequential
// regardless, so subscribers need no locks of their own.
//
// USAGE:
// ------
//   ThreadPoolExecutor::Options opts;
//   opts.num_threads = 4;
//   opts.thread_name_prefix = "rivulet";
//   ThreadPoolExecutor executor(opts);
//
//   executor.Post([] { ... });
//   executor.Run();  // returns after Stop() or once all work is done
//
// ============================================================================

#pragma once

#include "rivulet/io/executor.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <coroutine>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace rivulet {

class ThreadPoolExecutor : public Executor {
   public:
    struct Options {
        // Worker count; 0 is treated as 1
        size_t num_threads = std::thread::hardware_concurrency();

        // Workers are named "<prefix>-<index>"; empty leaves names alone
        std::string thread_name_prefix = "rivulet-worker";

        Options() = default;
    };

    ThreadPoolExecutor();
    explicit ThreadPoolExecutor(size_t num_threads);
    explicit ThreadPoolExecutor(const Options& options);

    ~ThreadPoolExecutor() override;

    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;

    void Run() override;
    void RunOnce() override;
    void Stop() override;
    bool IsRunning() const override;

    void Schedule(std::coroutine_handle<> handle) override;
    void ScheduleAfter(std::chrono::milliseconds delay, std::coroutine_handle<> handle) override;
    void Post(std::function<void()> callback) override;
    void PostAfter(std::chrono::milliseconds delay, std::function<void()> callback) override;

    size_t NumThreads() const { return workers_.size(); }

    size_t PendingTasks() const;

   private:
    struct WorkItem {
        std::coroutine_handle<> handle{nullptr};
        std::function<void()> callback;

        WorkItem() = default;
        explicit WorkItem(std::coroutine_handle<> h) : handle(h) {}
        explicit WorkItem(std::function<void()> cb) : callback(std::move(cb)) {}

        void Execute() {
            if (handle) {
                handle.resume();
            } else if (callback) {
                callback();
            }
        }
    };

    struct DelayedWork {
        std::chrono::steady_clock::time_point when;
        uint64_t sequence;
        WorkItem item;

        // Earliest deadline first, FIFO among equal deadlines
        bool operator>(const DelayedWork& other) const {
            if (when != other.when) return when > other.when;
            return sequence > other.sequence;
        }
    };

    void InitWorkers();
    void WorkerLoop(size_t worker_index);
    void TimerLoop();
    void Enqueue(WorkItem item);
    void EnqueueDelayed(std::chrono::milliseconds delay, WorkItem item);
    void FinishTask();

    Options options_;

    std::vector<std::thread> workers_;
    std::thread timer_thread_;

    std::queue<WorkItem> work_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable work_available_;

    std::priority_queue<DelayedWork, std::vector<DelayedWork>, std::greater<DelayedWork>> delayed_queue_;
    std::mutex delayed_mutex_;
    std::condition_variable delayed_cv_;
    uint64_t next_sequence_ = 0;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<size_t> active_tasks_{0};
    std::atomic<size_t> delayed_tasks_{0};
};

}  // namespace rivulet
