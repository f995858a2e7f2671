#pragma once

#include <deque>
#include <functional>
#include <iterator>
#include <utility>

namespace routegraph {

/// Interface for follow-up task strategies
/// Lets the host decide when work queued by the controllers actually runs
class ITaskScheduler {
public:
    virtual ~ITaskScheduler() = default;

    /// Queue a task to run after the current work
    /// @param task The task to execute
    virtual void submit(std::function<void()> task) = 0;

    /// Drop queued tasks without running them
    virtual void shutdown() = 0;

    /// Check if the scheduler still accepts tasks
    virtual bool isRunning() const = 0;
};

/// Single-threaded queue drained explicitly by the host.
///
/// The rendering surface calls runPending() once it has committed the
/// positions of the latest snapshot, so queued tasks always observe them.
/// Tasks submitted while draining wait for the next runPending().
class DeferredTaskQueue : public ITaskScheduler {
public:
    DeferredTaskQueue() = default;
    ~DeferredTaskQueue() override = default;

    // Non-copyable
    DeferredTaskQueue(const DeferredTaskQueue&) = delete;
    DeferredTaskQueue& operator=(const DeferredTaskQueue&) = delete;

    void submit(std::function<void()> task) override {
        if (!running_ || !task) {
            return;
        }
        tasks_.push_back(std::move(task));
    }

    /// Run the tasks queued so far, oldest first
    /// If a task throws, the tasks after it stay queued ahead of any submitted
    /// meanwhile and the exception propagates.
    /// @return Number of tasks executed
    size_t runPending() {
        std::deque<std::function<void()>> batch;
        batch.swap(tasks_);

        size_t ran = 0;
        try {
            while (!batch.empty()) {
                std::function<void()> task = std::move(batch.front());
                batch.pop_front();
                ++ran;
                task();
            }
        } catch (...) {
            if (running_) {
                tasks_.insert(tasks_.begin(),
                              std::make_move_iterator(batch.begin()),
                              std::make_move_iterator(batch.end()));
            }
            throw;
        }
        return ran;
    }

    size_t pendingCount() const { return tasks_.size(); }

    void clear() { tasks_.clear(); }

    void shutdown() override {
        running_ = false;
        tasks_.clear();
    }

    bool isRunning() const override { return running_; }

private:
    std::deque<std::function<void()>> tasks_;
    bool running_ = true;
};

}  // namespace routegraph
