/**
 * @file worker_pool.h
 * @brief Fixed-size job pool on top of thread_system
 */

#ifndef KCENON_RESILIENT_TRANSFER_CORE_WORKER_POOL_H
#define KCENON_RESILIENT_TRANSFER_CORE_WORKER_POOL_H

#include "types.h"

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

namespace kcenon::resilient_transfer {

/**
 * @brief Named kcenon::thread::thread_pool with a fixed number of workers
 *
 * Jobs run in submission order on whichever worker is free. Each submit()
 * returns a future that is satisfied when the job returns, or carries the
 * exception it threw.
 *
 * @code
 * worker_pool pool("part_workers", 4);
 * if (auto started = pool.start(); !started) { ... }
 * auto done = pool.submit([] { ... });
 * done.value().wait();
 * pool.stop();
 * @endcode
 */
class worker_pool {
public:
    /**
     * @param name pool name reported by thread_system
     * @param worker_count number of workers (at least 1)
     */
    worker_pool(std::string name, std::size_t worker_count);

    ~worker_pool();

    worker_pool(const worker_pool&) = delete;
    auto operator=(const worker_pool&) -> worker_pool& = delete;

    [[nodiscard]] auto start() -> result<void>;

    /**
     * @brief Queue @p task
     * @return shut_down once stopped, internal_error when the queue rejects the job
     */
    [[nodiscard]] auto submit(std::function<void()> task,
                              const std::string& job_name = "transfer_job")
        -> result<std::future<void>>;

    /**
     * @brief Drop queued jobs and join the workers; running jobs finish first
     */
    auto stop() -> void;

    [[nodiscard]] auto is_running() const -> bool;

    [[nodiscard]] auto worker_count() const noexcept -> std::size_t;

    [[nodiscard]] auto name() const -> const std::string&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::resilient_transfer

#endif  // KCENON_RESILIENT_TRANSFER_CORE_WORKER_POOL_H
