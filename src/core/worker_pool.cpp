/**
 * @file worker_pool.cpp
 * @brief worker_pool implementation using thread_system
 */

#include "kcenon/resilient_transfer/core/worker_pool.h"

#include <kcenon/common/patterns/result.h>
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>

namespace kcenon::resilient_transfer {

namespace {

/**
 * @brief Wraps a callable as a thread_system job
 */
class function_job : public kcenon::thread::job {
public:
    function_job(std::function<void()> func, const std::string& name)
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> kcenon::common::VoidResult override {
        if (func_) {
            func_();
        }
        return kcenon::common::ok();
    }

private:
    std::function<void()> func_;
};

}  // namespace

struct worker_pool::impl {
    std::string name;
    std::size_t worker_count;
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::mutex mutex;
    bool running = false;
    bool stopped = false;

    impl(std::string pool_name, std::size_t count)
        : name(std::move(pool_name)),
          worker_count(std::max<std::size_t>(1, count)),
          pool(std::make_shared<kcenon::thread::thread_pool>(name)) {}
};

worker_pool::worker_pool(std::string name, std::size_t worker_count)
    : impl_(std::make_unique<impl>(std::move(name), worker_count)) {}

worker_pool::~worker_pool() {
    stop();
}

auto worker_pool::start() -> result<void> {
    std::lock_guard lock(impl_->mutex);
    if (impl_->stopped) {
        return unexpected(error(error_code::shut_down, impl_->name + " is stopped"));
    }
    if (impl_->running) {
        return {};
    }

    for (std::size_t i = 0; i < impl_->worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(impl_->pool->get_job_queue());
        if (!impl_->pool->enqueue(std::move(worker)).is_ok()) {
            return unexpected(error(error_code::internal_error,
                                    "cannot add a worker to " + impl_->name));
        }
    }
    if (!impl_->pool->start().is_ok()) {
        return unexpected(error(error_code::internal_error, "cannot start " + impl_->name));
    }
    impl_->running = true;
    return {};
}

auto worker_pool::submit(std::function<void()> task, const std::string& job_name)
    -> result<std::future<void>> {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto wrapped = [task = std::move(task), promise]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    };

    std::lock_guard lock(impl_->mutex);
    if (!impl_->running) {
        return unexpected(error(error_code::shut_down, impl_->name + " is not running"));
    }
    auto job = std::make_unique<function_job>(std::move(wrapped), job_name);
    if (!impl_->pool->enqueue(std::move(job)).is_ok()) {
        return unexpected(error(error_code::internal_error,
                                "cannot queue " + job_name + " on " + impl_->name));
    }
    return future;
}

auto worker_pool::stop() -> void {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->stopped) {
            return;
        }
        impl_->stopped = true;
        if (!impl_->running) {
            return;
        }
        impl_->running = false;
        pool = impl_->pool;
    }

    // Queued jobs hold promises; dropping them breaks their futures.
    if (auto queue = pool->get_job_queue(); queue) {
        queue->stop();
        queue->clear();
    }
    pool->stop(true);
}

auto worker_pool::is_running() const -> bool {
    std::lock_guard lock(impl_->mutex);
    return impl_->running;
}

auto worker_pool::worker_count() const noexcept -> std::size_t {
    return impl_->worker_count;
}

auto worker_pool::name() const -> const std::string& {
    return impl_->name;
}

}  // namespace kcenon::resilient_transfer
