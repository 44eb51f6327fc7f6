// ============================================================================
// rivulet/io/thread_pool_executor.cpp - Multi-Threaded Executor
// ============================================================================

#include "rivulet/io/thread_pool_executor.hpp"

#include <pthread.h>

namespace rivulet {

namespace {

void NameCurrentThread(const std::string& name) {
    // Linux limits thread names to 15 characters plus the terminator
    std::string truncated = name.substr(0, 15);
    pthread_setname_np(pthread_self(), truncated.c_str());
}

}  // namespace

// ============================================================================
// Construction / Destruction
// ============================================================================

ThreadPoolExecutor::ThreadPoolExecutor() : ThreadPoolExecutor(Options{}) {}

ThreadPoolExecutor::ThreadPoolExecutor(size_t num_threads) {
    options_.num_threads = num_threads;
    InitWorkers();
}

ThreadPoolExecutor::ThreadPoolExecutor(const Options& options) : options_(options) {
    InitWorkers();
}

void ThreadPoolExecutor::InitWorkers() {
    if (options_.num_threads == 0) {
        options_.num_threads = 1;
    }
    running_ = true;

    workers_.reserve(options_.num_threads);
    for (size_t i = 0; i < options_.num_threads; ++i) {
        workers_.emplace_back([this, i] { WorkerLoop(i); });
    }
    timer_thread_ = std::thread([this] { TimerLoop(); });
}

ThreadPoolExecutor::~ThreadPoolExecutor() {
    Stop();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }
}

// ============================================================================
// Executor Interface
// ============================================================================

void ThreadPoolExecutor::Run() {
    running_ = true;

    std::unique_lock<std::mutex> lock(queue_mutex_);
    work_available_.wait(lock, [this] {
        return stopping_ || (work_queue_.empty() && active_tasks_ == 0 && delayed_tasks_ == 0);
    });
}

void ThreadPoolExecutor::RunOnce() {
    WorkItem item;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (work_queue_.empty()) {
            return;
        }
        item = std::move(work_queue_.front());
        work_queue_.pop();
        active_tasks_++;
    }

    ExecutorGuard guard(this);
    item.Execute();
    FinishTask();
}

void ThreadPoolExecutor::Stop() {
    {
        // Flip the flag under both locks so no waiter misses the wakeup
        std::scoped_lock lock(queue_mutex_, delayed_mutex_);
        stopping_ = true;
        running_ = false;
    }
    work_available_.notify_all();
    delayed_cv_.notify_all();
}

bool ThreadPoolExecutor::IsRunning() const {
    return running_;
}

void ThreadPoolExecutor::Schedule(std::coroutine_handle<> handle) {
    if (!handle) return;
    Enqueue(WorkItem{handle});
}

void ThreadPoolExecutor::ScheduleAfter(std::chrono::milliseconds delay, std::coroutine_handle<> handle) {
    if (!handle) return;
    EnqueueDelayed(delay, WorkItem{handle});
}

void ThreadPoolExecutor::Post(std::function<void()> callback) {
    if (!callback) return;
    Enqueue(WorkItem{std::move(callback)});
}

void ThreadPoolExecutor::PostAfter(std::chrono::milliseconds delay, std::function<void()> callback) {
    if (!callback) return;
    EnqueueDelayed(delay, WorkItem{std::move(callback)});
}

size_t ThreadPoolExecutor::PendingTasks() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return work_queue_.size();
}

void ThreadPoolExecutor::Enqueue(WorkItem item) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        work_queue_.push(std::move(item));
    }
    work_available_.notify_one();
}

void ThreadPoolExecutor::EnqueueDelayed(std::chrono::milliseconds delay, WorkItem item) {
    auto when = std::chrono::steady_clock::now() + delay;
    {
        std::lock_guard<std::mutex> lock(delayed_mutex_);
        delayed_queue_.push(DelayedWork{when, next_sequence_++, std::move(item)});
        delayed_tasks_++;
    }
    delayed_cv_.notify_one();
}

// ============================================================================
// Worker Thread
// ============================================================================

void ThreadPoolExecutor::WorkerLoop(size_t worker_index) {
    ExecutorGuard guard(this);

    if (!options_.thread_name_prefix.empty()) {
        NameCurrentThread(options_.thread_name_prefix + "-" + std::to_string(worker_index));
    }

    while (true) {
        WorkItem item;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            work_available_.wait(lock, [this] { return stopping_ || !work_queue_.empty(); });

            if (stopping_) {
                break;
            }

            item = std::move(work_queue_.front());
            work_queue_.pop();
            // Counted under the lock so Run() never sees an empty queue with
            // the item in nobody's hands.
            active_tasks_++;
        }

        item.Execute();
        FinishTask();
    }
}

// Run() may be waiting for the pool to go idle. The decrement happens under
// the queue lock so that wakeup cannot slip in between its predicate check
// and its wait.
void ThreadPoolExecutor::FinishTask() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        active_tasks_--;
    }
    work_available_.notify_all();
}

// ============================================================================
// Timer Thread
// ============================================================================

void ThreadPoolExecutor::TimerLoop() {
    std::unique_lock<std::mutex> lock(delayed_mutex_);
    while (!stopping_) {
        if (delayed_queue_.empty()) {
            delayed_cv_.wait(lock, [this] { return stopping_ || !delayed_queue_.empty(); });
            continue;
        }

        auto when = delayed_queue_.top().when;
        if (std::chrono::steady_clock::now() < when) {
            // Woken early by new work or Stop(); re-evaluate the head
            delayed_cv_.wait_until(lock, when);
            continue;
        }

        WorkItem item = std::move(const_cast<DelayedWork&>(delayed_queue_.top()).item);
        delayed_queue_.pop();

        lock.unlock();
        {
            // Hand over under the queue lock so Run() never sees the item in
            // neither place.
            std::lock_guard<std::mutex> queue_lock(queue_mutex_);
            work_queue_.push(std::move(item));
            delayed_tasks_--;
        }
        work_available_.notify_all();
        lock.lock();
    }
}

}  // namespace rivulet
