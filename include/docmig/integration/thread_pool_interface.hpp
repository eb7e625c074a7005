/**
 * @file thread_pool_interface.hpp
 * @brief Execution seam between the worker pool and a thread backend
 *
 * The worker pool runs its executor loops on whatever implementation of
 * this interface it is given: the thread_system backed adapter in
 * production, a mock in tests.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <future>

namespace docmig::integration {

/**
 * @brief Runs executor loops and short maintenance tasks
 *
 * An executor loop occupies its thread until the owning worker pool tells
 * it to stop, so implementations must be able to run at least as many tasks
 * concurrently as the pool has executors. All methods are thread-safe.
 *
 * @code
 * auto pool = std::make_shared<thread_pool_adapter>(config);
 * migration::worker_pool workers(pool_config, registry, pool);
 * @endcode
 */
class thread_pool_interface {
public:
    virtual ~thread_pool_interface() = default;

    /// @return true if started or already running
    [[nodiscard]] virtual auto start() -> bool = 0;

    [[nodiscard]] virtual auto is_running() const noexcept -> bool = 0;

    /**
     * @brief Stop the backend
     *
     * Executor loops are not interrupted; the caller signals them to exit
     * before shutting the backend down.
     */
    virtual void shutdown(bool wait_for_completion = true) = 0;

    /**
     * @brief Run a task, starting the backend if needed
     * @return Future carrying the task's completion or exception
     * @throws std::runtime_error if the task cannot be accepted
     */
    [[nodiscard]] virtual auto submit(std::function<void()> task)
        -> std::future<void> = 0;

    /// Threads currently serving tasks
    [[nodiscard]] virtual auto get_thread_count() const -> std::size_t = 0;

    /// Submitted tasks that have not finished yet
    [[nodiscard]] virtual auto get_outstanding_task_count() const noexcept
        -> std::size_t = 0;

protected:
    thread_pool_interface() = default;
    thread_pool_interface(const thread_pool_interface&) = delete;
    thread_pool_interface& operator=(const thread_pool_interface&) = delete;
};

}  // namespace docmig::integration
