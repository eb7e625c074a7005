/**
 * @file thread_pool_adapter.cpp
 * @brief Implementation of thread_pool_adapter
 */

#include <docmig/integration/thread_pool_adapter.hpp>

#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/interfaces/thread_context.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace docmig::integration {

thread_pool_adapter::thread_pool_adapter(const thread_pool_config& config)
    : config_(config),
      outstanding_(std::make_shared<std::atomic<std::size_t>>(0)) {
    config_.min_threads = std::max<std::size_t>(config_.min_threads, 1);
    config_.max_threads = std::max(config_.max_threads, config_.min_threads);
}

thread_pool_adapter::~thread_pool_adapter() {
    shutdown(true);
}

// =============================================================================
// Lifecycle
// =============================================================================

auto thread_pool_adapter::start() -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return start_locked();
}

auto thread_pool_adapter::start_locked() -> bool {
    if (pool_ && pool_->is_running()) {
        return true;
    }

    kcenon::thread::thread_context context;
    pool_ = std::make_shared<kcenon::thread::thread_pool>(config_.pool_name, context);
    thread_count_ = 0;

    if (!add_workers_locked(config_.min_threads)) {
        pool_.reset();
        return false;
    }

    auto started = pool_->start();
    if (started.is_err()) {
        pool_.reset();
        thread_count_ = 0;
        return false;
    }
    return true;
}

auto thread_pool_adapter::add_workers_locked(std::size_t count) -> bool {
    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(count);

    kcenon::thread::thread_context context;
    for (std::size_t i = 0; i < count; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>(false, context));
    }

    auto enqueued = pool_->enqueue_batch(std::move(workers));
    if (enqueued.is_err()) {
        return false;
    }
    thread_count_ += count;
    return true;
}

auto thread_pool_adapter::is_running() const noexcept -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_ && pool_->is_running();
}

void thread_pool_adapter::shutdown(bool wait_for_completion) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pool_) {
        return;
    }

    // stop() takes "immediately", the inverse of waiting
    (void)pool_->stop(!wait_for_completion);
    pool_.reset();
    thread_count_ = 0;
}

// =============================================================================
// Task Submission
// =============================================================================

auto thread_pool_adapter::submit(std::function<void()> task) -> std::future<void> {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!start_locked()) {
        throw std::runtime_error("Failed to start thread pool " + config_.pool_name);
    }

    // Executor loops never hand their thread back, so a task submitted while
    // every thread is occupied needs a new one or it would never start
    if (outstanding_->load() >= thread_count_) {
        if (thread_count_ < config_.max_threads && !add_workers_locked(1)) {
            throw std::runtime_error("Failed to add a worker thread to " + config_.pool_name);
        }
    }

    outstanding_->fetch_add(1);
    auto outstanding = outstanding_;
    bool accepted = false;
    try {
        accepted = pool_->submit_task([task = std::move(task), promise, outstanding]() mutable {
            try {
                task();
                promise->set_value();
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
            outstanding->fetch_sub(1);
        });
    } catch (const std::exception& e) {
        outstanding_->fetch_sub(1);
        throw std::runtime_error("Failed to submit task to " + config_.pool_name + ": " +
                                 e.what());
    }
    if (!accepted) {
        outstanding_->fetch_sub(1);
        throw std::runtime_error("Task rejected by " + config_.pool_name);
    }

    return future;
}

// =============================================================================
// Statistics
// =============================================================================

auto thread_pool_adapter::get_thread_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_ ? thread_count_ : 0;
}

auto thread_pool_adapter::get_outstanding_task_count() const noexcept -> std::size_t {
    return outstanding_->load();
}

auto thread_pool_adapter::get_config() const noexcept -> const thread_pool_config& {
    return config_;
}

}  // namespace docmig::integration
