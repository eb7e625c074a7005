/**
 * @file thread_pool_adapter.hpp
 * @brief thread_pool_interface implemented on kcenon::thread::thread_pool
 */

#pragma once

#include <docmig/integration/thread_pool_interface.hpp>

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

namespace kcenon::thread {
class thread_pool;
}  // namespace kcenon::thread

namespace docmig::integration {

/**
 * @struct thread_pool_config
 * @brief Sizing of the executor thread pool
 */
struct thread_pool_config {
    /// Worker threads created on start()
    std::size_t min_threads = 2;

    /// The pool grows towards this while every thread is busy
    std::size_t max_threads = 16;

    /// Thread pool name for logging
    std::string pool_name = "docmig_thread_pool";
};

/**
 * @class thread_pool_adapter
 * @brief Runs migration executor loops on thread_system
 *
 * An executor loop holds its thread until the worker pool stops it. When a
 * task is submitted while every thread is occupied, one more thread_worker
 * is added, up to max_threads. Beyond that the task waits in the queue.
 *
 * Thread Safety: All public methods are thread-safe.
 *
 * @example
 * @code
 * thread_pool_config config;
 * config.min_threads = 4;
 * config.max_threads = 8;
 *
 * auto pool = std::make_shared<thread_pool_adapter>(config);
 * migration::worker_pool workers(pool_config, registry, pool);
 * @endcode
 */
class thread_pool_adapter final : public thread_pool_interface {
public:
    /**
     * @brief Construct adapter with configuration
     *
     * min_threads is raised to 1 and max_threads to min_threads. The pool
     * is not started until start() or the first submit().
     */
    explicit thread_pool_adapter(const thread_pool_config& config);

    /**
     * @brief Waits for outstanding tasks and stops the pool
     */
    ~thread_pool_adapter() override;

    thread_pool_adapter(const thread_pool_adapter&) = delete;
    thread_pool_adapter& operator=(const thread_pool_adapter&) = delete;
    thread_pool_adapter(thread_pool_adapter&&) = delete;
    thread_pool_adapter& operator=(thread_pool_adapter&&) = delete;

    [[nodiscard]] auto start() -> bool override;
    [[nodiscard]] auto is_running() const noexcept -> bool override;
    void shutdown(bool wait_for_completion = true) override;

    /**
     * @brief Queue a task, adding a thread first if all are occupied
     * @throws std::runtime_error if the pool cannot start or accept the task
     */
    [[nodiscard]] auto submit(std::function<void()> task)
        -> std::future<void> override;

    /// Threads currently attached to the pool (0 when stopped)
    [[nodiscard]] auto get_thread_count() const -> std::size_t override;
    [[nodiscard]] auto get_outstanding_task_count() const noexcept
        -> std::size_t override;

    [[nodiscard]] auto get_config() const noexcept -> const thread_pool_config&;

private:
    [[nodiscard]] auto start_locked() -> bool;
    [[nodiscard]] auto add_workers_locked(std::size_t count) -> bool;

    thread_pool_config config_;
    std::shared_ptr<kcenon::thread::thread_pool> pool_;
    mutable std::mutex mutex_;
    std::size_t thread_count_{0};  ///< Guarded by mutex_

    /// Shared with task wrappers so it outlives a reset pool
    std::shared_ptr<std::atomic<std::size_t>> outstanding_;
};

}  // namespace docmig::integration
