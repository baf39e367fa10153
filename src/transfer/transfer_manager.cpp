/**
 * @file transfer_manager.cpp
 * @brief Implementation of the transfer manager
 */

#include "kcenon/resilient_transfer/transfer/transfer_manager.h"
#include "kcenon/resilient_transfer/cloud/credential_manager.h"
#include "kcenon/resilient_transfer/core/logging.h"
#include "kcenon/resilient_transfer/core/rate_limiter.h"
#include "kcenon/resilient_transfer/core/resume_store.h"
#include "kcenon/resilient_transfer/core/worker_pool.h"
#include "kcenon/resilient_transfer/transfer/downloader.h"
#include "kcenon/resilient_transfer/transfer/engine_context.h"
#include "kcenon/resilient_transfer/transfer/uploader.h"

#include <algorithm>
#include <deque>
#include <mutex>
#include <unordered_map>

namespace kcenon::resilient_transfer {

namespace {

struct queued_job {
    std::shared_ptr<transfer_task> task;
    submit_options options;
};

auto make_event(event_type type, const transfer_task& task) -> transfer_event {
    const auto snapshot = task.snapshot();
    transfer_event event;
    event.type = type;
    event.id = snapshot.id;
    event.state = snapshot.state;
    event.bytes_transferred = snapshot.progress.bytes_transferred;
    event.total_bytes = snapshot.progress.total_bytes;
    event.fraction = snapshot.progress.fraction;
    event.bytes_per_second = snapshot.progress.bytes_per_second;
    if (snapshot.failure) {
        event.error = snapshot.failure->describe();
    }
    return event;
}

}  // namespace

struct transfer_manager::impl {
    transfer_manager_config config;
    std::shared_ptr<storage_backend> backend;

    rate_limiter_registry limits;
    std::unique_ptr<credential_manager> credentials;
    resource_allocator resources;
    resume_store resumes;
    event_bus events;

    std::unique_ptr<uploader> upload_engine;
    std::unique_ptr<downloader> download_engine;

    mutable std::mutex mutex;
    std::unordered_map<transfer_id, queued_job> jobs;
    std::deque<transfer_id> queue;
    worker_pool workers;
    bool running = true;
    uint32_t active_transfers = 0;
    uint64_t completed = 0;
    uint64_t failed = 0;
    uint64_t cancelled = 0;

    impl(transfer_manager_config cfg,
         std::shared_ptr<storage_backend> storage,
         std::shared_ptr<credential_source> source)
        : config(std::move(cfg)),
          backend(std::move(storage)),
          resources(config.resources),
          resumes(resume_store_config{config.engine.resume_max_age}),
          events(config.event_queue_capacity),
          workers("transfer_workers", config.max_concurrent_transfers) {
        credentials = std::make_unique<credential_manager>(
            std::move(source), config.credentials, &limits.get(rate_limit_scope::platform_api));

        engine_context context;
        context.config = config.engine;
        context.retry = config.retry;
        context.backend = backend;
        context.credentials = credentials.get();
        context.limits = &limits;
        context.resources = &resources;
        context.resumes = &resumes;
        upload_engine = std::make_unique<uploader>(context);
        download_engine = std::make_unique<downloader>(std::move(context));
    }

    auto configure_limits() -> result<void> {
        for (std::size_t i = 0; i < config.rate_profiles.size(); ++i) {
            if (auto r = limits.configure(static_cast<rate_limit_scope>(i), config.rate_profiles[i]);
                !r) {
                return r;
            }
        }
        return {};
    }

    auto start_workers() -> result<void> {
        return workers.start();
    }

    auto find_task(const transfer_id& id) const -> result<std::shared_ptr<transfer_task>> {
        std::lock_guard lock(mutex);
        auto it = jobs.find(id);
        if (it == jobs.end()) {
            return unexpected(error(error_code::transfer_not_found,
                                    "no transfer with id " + id.to_string()));
        }
        return it->second.task;
    }

    // Must be called with mutex held.
    auto stats_locked() const -> manager_stats {
        manager_stats stats;
        stats.total_slots = resources.total_threads();
        stats.active_slots = resources.stats().slots_in_use;
        stats.active_transfers = active_transfers;
        stats.queued_transfers = static_cast<uint32_t>(std::count_if(
            queue.begin(), queue.end(), [this](const transfer_id& id) {
                auto it = jobs.find(id);
                return it != jobs.end() && it->second.task->state() == task_state::queued;
            }));
        stats.completed = completed;
        stats.failed = failed;
        stats.cancelled = cancelled;
        stats.dropped_events = events.total_dropped();
        return stats;
    }

    auto stats_event(const manager_stats& stats) const -> transfer_event {
        transfer_event event;
        event.type = event_type::queue_stats_updated;
        event.stats = stats;
        return event;
    }

    auto publish_stats() -> void {
        manager_stats stats;
        {
            std::lock_guard lock(mutex);
            stats = stats_locked();
        }
        events.publish(stats_event(stats));
    }

    /**
     * @brief Pool job: start the oldest queued transfer
     *
     * One job is submitted per enqueue, so the pool's FIFO order and the
     * queue order agree.
     */
    auto run_next() -> void {
        queued_job job;
        {
            std::lock_guard lock(mutex);
            if (!running || queue.empty()) {
                return;
            }
            const auto id = queue.front();
            queue.pop_front();
            auto it = jobs.find(id);
            if (it == jobs.end()) {
                return;
            }
            // Cancelled while queued; already counted by cancel().
            if (!it->second.task->transition(task_state::initializing)) {
                return;
            }
            job = it->second;
            ++active_transfers;
        }

        events.publish(make_event(event_type::started, *job.task));
        publish_stats();
        run_job(job);
    }

    auto run_job(const queued_job& job) -> void {
        auto& task = *job.task;
        const auto& descriptor = task.descriptor();

        transfer_observer observer;
        observer.on_progress = [this](const transfer_task& t) {
            events.publish(make_event(event_type::progress, t));
        };

        uint32_t concurrent = 1;
        {
            std::lock_guard lock(mutex);
            concurrent = std::max(1U, active_transfers);
        }

        result<transfer_outcome> outcome;
        if (descriptor.direction == transfer_direction::upload) {
            upload_request request;
            request.local_path = descriptor.local_path;
            request.path_base = descriptor.remote_locator;
            request.storage = job.options.storage;
            request.priority = job.options.priority;
            request.concurrent_files = concurrent;
            outcome = upload_engine->run(task, request, observer);
        } else {
            download_request request;
            request.object_key = descriptor.remote_locator;
            request.local_path = descriptor.local_path;
            if (descriptor.declared_size > 0) {
                request.declared_size = descriptor.declared_size;
            }
            request.storage = job.options.storage;
            request.overwrite = job.options.overwrite;
            request.priority = job.options.priority;
            request.concurrent_files = concurrent;
            outcome = download_engine->run(task, request, observer);
        }

        finish_job(task, outcome);
    }

    auto finish_job(transfer_task& task, const result<transfer_outcome>& outcome) -> void {
        event_type type = event_type::completed;
        auto ctx = transfer_log_context{};
        ctx.transfer_id = task.id().to_string();
        ctx.object = task.descriptor().name();
        ctx.direction = to_string(task.descriptor().direction);

        if (outcome) {
            if (task.transition(task_state::completed)) {
                RT_LOG_INFO_CTX(log_category::manager,
                                outcome.value().already_complete
                                    ? "Transfer already complete"
                                    : "Transfer completed",
                                ctx);
            } else if (task.state() == task_state::cancelled) {
                // Cancel raced with the final step; the object is committed regardless.
                type = event_type::cancelled;
                RT_LOG_INFO_CTX(log_category::manager, "Transfer cancelled after commit", ctx);
            } else {
                transfer_failure failure(
                    task.descriptor().name(),
                    error(error_code::invalid_state_transition,
                          "finished in state " + std::string(to_string(task.state()))));
                ctx.error_message = failure.describe();
                RT_LOG_ERROR_CTX(log_category::manager, "Transfer left in a live state", ctx);
                type = task.fail(std::move(failure)) ? event_type::failed : event_type::cancelled;
            }
        } else if (outcome.error().code == error_code::cancelled || task.token().is_cancelled()) {
            if (!is_terminal(task.state())) {
                (void)task.cancel();
            }
            type = event_type::cancelled;
            RT_LOG_INFO_CTX(log_category::manager, "Transfer cancelled", ctx);
        } else {
            transfer_failure failure(task.descriptor().name(), outcome.error());
            ctx.error_message = failure.describe();
            RT_LOG_ERROR_CTX(log_category::manager, "Transfer failed", ctx);
            if (task.fail(std::move(failure))) {
                type = event_type::failed;
            } else {
                type = event_type::cancelled;
            }
        }

        {
            std::lock_guard lock(mutex);
            --active_transfers;
            switch (type) {
                case event_type::completed:
                    ++completed;
                    break;
                case event_type::failed:
                    ++failed;
                    break;
                default:
                    ++cancelled;
                    break;
            }
        }
        events.publish(make_event(type, task));
        publish_stats();
    }

    auto enqueue(std::shared_ptr<transfer_task> task, const submit_options& options)
        -> result<transfer_id> {
        const auto id = task->id();
        {
            std::lock_guard lock(mutex);
            if (!running) {
                return unexpected(error(error_code::shut_down, "transfer manager is shut down"));
            }
            jobs.emplace(id, queued_job{task, options});
            queue.push_back(id);
        }

        if (auto submitted = workers.submit([this] { run_next(); }, "transfer_job"); !submitted) {
            std::lock_guard lock(mutex);
            std::erase(queue, id);
            jobs.erase(id);
            return unexpected(submitted.error());
        }

        RT_LOG_DEBUG(log_category::manager,
                     "Queued " + std::string(to_string(task->descriptor().direction)) + " of " +
                         task->descriptor().name() + " as " + id.to_string());
        events.publish(make_event(event_type::queued, *task));
        publish_stats();
        return id;
    }

    /**
     * @return tasks cancelled before they ever started
     */
    auto cancel_locked(transfer_task& task) -> result<bool> {
        const bool was_queued = task.state() == task_state::queued;
        if (auto r = task.cancel(); !r) {
            return unexpected(r.error());
        }
        if (was_queued) {
            ++cancelled;
        }
        return was_queued;
    }

    auto shutdown() -> void {
        std::vector<std::shared_ptr<transfer_task>> never_started;
        {
            std::lock_guard lock(mutex);
            if (!running) {
                return;
            }
            running = false;
            for (auto& [id, job] : jobs) {
                if (is_terminal(job.task->state())) {
                    continue;
                }
                auto r = cancel_locked(*job.task);
                if (r && r.value()) {
                    never_started.push_back(job.task);
                }
            }
            queue.clear();
        }
        resources.slots().close();

        for (const auto& task : never_started) {
            events.publish(make_event(event_type::cancelled, *task));
        }
        workers.stop();

        resources.shutdown();
        credentials->stop_background_refresh();
        publish_stats();
        events.close();
        RT_LOG_INFO(log_category::manager, "Transfer manager shut down");
    }
};

// ============================================================================
// builder
// ============================================================================

transfer_manager::builder::builder() = default;

auto transfer_manager::builder::with_config(transfer_manager_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto transfer_manager::builder::with_engine_config(engine_config config) -> builder& {
    config_.engine = std::move(config);
    return *this;
}

auto transfer_manager::builder::with_master_secret(byte_buffer secret) -> builder& {
    config_.engine.master_secret = std::move(secret);
    return *this;
}

auto transfer_manager::builder::with_default_storage(storage_context storage) -> builder& {
    config_.engine.default_storage = std::move(storage);
    return *this;
}

auto transfer_manager::builder::with_backend(std::shared_ptr<storage_backend> backend)
    -> builder& {
    backend_ = std::move(backend);
    return *this;
}

auto transfer_manager::builder::with_credential_source(std::shared_ptr<credential_source> source)
    -> builder& {
    source_ = std::move(source);
    return *this;
}

auto transfer_manager::builder::with_retry_policy(retry_policy policy) -> builder& {
    config_.retry = policy;
    return *this;
}

auto transfer_manager::builder::with_rate_limit(rate_limit_scope scope, rate_limit_profile profile)
    -> builder& {
    config_.rate_profiles[static_cast<std::size_t>(scope)] = profile;
    return *this;
}

auto transfer_manager::builder::with_credential_config(credential_manager_config config)
    -> builder& {
    config_.credentials = config;
    return *this;
}

auto transfer_manager::builder::with_resources(resource_config config) -> builder& {
    config_.resources = config;
    return *this;
}

auto transfer_manager::builder::with_max_concurrent_transfers(uint32_t count) -> builder& {
    config_.max_concurrent_transfers = count;
    return *this;
}

auto transfer_manager::builder::with_event_queue_capacity(std::size_t capacity) -> builder& {
    config_.event_queue_capacity = capacity;
    return *this;
}

auto transfer_manager::builder::with_fast_mode(bool enable) -> builder& {
    config_.engine.fast_mode = enable;
    return *this;
}

auto transfer_manager::builder::with_background_credential_refresh(bool enable) -> builder& {
    config_.background_credential_refresh = enable;
    return *this;
}

auto transfer_manager::builder::build() -> result<transfer_manager> {
    if (!backend_) {
        return unexpected(error(error_code::invalid_configuration, "a storage backend is required"));
    }
    if (!source_) {
        return unexpected(error(error_code::invalid_configuration,
                                "a credential source is required"));
    }
    if (auto valid = config_.validate(); !valid) {
        return unexpected(valid.error());
    }

    transfer_manager manager(std::move(config_), std::move(backend_), std::move(source_));
    if (auto r = manager.impl_->configure_limits(); !r) {
        return unexpected(r.error());
    }
    if (manager.impl_->config.background_credential_refresh) {
        if (auto r = manager.impl_->credentials->start_background_refresh(); !r) {
            return unexpected(r.error());
        }
    }
    if (auto r = manager.impl_->start_workers(); !r) {
        return unexpected(r.error());
    }
    return std::move(manager);
}

// ============================================================================
// transfer_manager
// ============================================================================

transfer_manager::transfer_manager(transfer_manager_config config,
                                   std::shared_ptr<storage_backend> backend,
                                   std::shared_ptr<credential_source> source)
    : impl_(std::make_unique<impl>(std::move(config), std::move(backend), std::move(source))) {
    // Initialize logger (safe to call multiple times)
    get_logger().initialize();
    RT_LOG_INFO(log_category::manager,
                "Transfer manager started with " +
                    std::to_string(impl_->config.max_concurrent_transfers) + " workers and " +
                    std::to_string(impl_->resources.total_threads()) + " part slots");
}

transfer_manager::transfer_manager(transfer_manager&&) noexcept = default;
auto transfer_manager::operator=(transfer_manager&&) noexcept -> transfer_manager& = default;

transfer_manager::~transfer_manager() {
    if (impl_) {
        impl_->shutdown();
    }
}

auto transfer_manager::submit(transfer_direction direction,
                              const std::filesystem::path& local_path,
                              const std::string& remote_locator,
                              uint64_t size,
                              const std::string& origin,
                              const submit_options& options) -> result<transfer_id> {
    if (local_path.empty()) {
        return unexpected(error(error_code::invalid_argument, "local path is empty"));
    }
    if (direction == transfer_direction::download && remote_locator.empty()) {
        return unexpected(error(error_code::invalid_argument, "object key is empty"));
    }

    task_descriptor descriptor;
    descriptor.direction = direction;
    descriptor.local_path = local_path;
    descriptor.remote_locator = remote_locator;
    descriptor.declared_size = size;
    descriptor.origin = origin;
    descriptor.batch_id = options.batch_id;
    descriptor.batch_label = options.batch_label;

    auto task = std::make_shared<transfer_task>(transfer_id::generate(), std::move(descriptor));
    return impl_->enqueue(std::move(task), options);
}

auto transfer_manager::upload(const std::filesystem::path& local_path,
                              const std::string& path_base,
                              const submit_options& options) -> result<transfer_id> {
    std::error_code ec;
    const auto size = std::filesystem::file_size(local_path, ec);
    return submit(transfer_direction::upload, local_path, path_base, ec ? 0 : size, "api",
                  options);
}

auto transfer_manager::download(const std::string& object_key,
                                const std::filesystem::path& local_path,
                                const submit_options& options) -> result<transfer_id> {
    return submit(transfer_direction::download, local_path, object_key, 0, "api", options);
}

auto transfer_manager::cancel(const transfer_id& id) -> result<void> {
    std::shared_ptr<transfer_task> task;
    bool was_queued = false;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->jobs.find(id);
        if (it == impl_->jobs.end()) {
            return unexpected(error(error_code::transfer_not_found,
                                    "no transfer with id " + id.to_string()));
        }
        task = it->second.task;
        auto r = impl_->cancel_locked(*task);
        if (!r) {
            return unexpected(r.error());
        }
        was_queued = r.value();
    }

    RT_LOG_INFO(log_category::manager, "Cancel requested for " + id.to_string());
    if (was_queued) {
        impl_->events.publish(make_event(event_type::cancelled, *task));
        impl_->publish_stats();
    }
    return {};
}

auto transfer_manager::pause(const transfer_id& id) -> result<void> {
    auto task = impl_->find_task(id);
    if (!task) {
        return unexpected(task.error());
    }
    return task.value()->pause();
}

auto transfer_manager::resume(const transfer_id& id) -> result<void> {
    auto task = impl_->find_task(id);
    if (!task) {
        return unexpected(task.error());
    }
    return task.value()->resume();
}

auto transfer_manager::get_state(const transfer_id& id) const -> result<task_state> {
    auto task = impl_->find_task(id);
    if (!task) {
        return unexpected(task.error());
    }
    return task.value()->state();
}

auto transfer_manager::get_progress(const transfer_id& id) const -> result<progress_snapshot> {
    auto task = impl_->find_task(id);
    if (!task) {
        return unexpected(task.error());
    }
    return task.value()->progress();
}

auto transfer_manager::get_task(const transfer_id& id) const -> result<task_snapshot> {
    auto task = impl_->find_task(id);
    if (!task) {
        return unexpected(task.error());
    }
    return task.value()->snapshot();
}

auto transfer_manager::wait(const transfer_id& id, std::chrono::milliseconds timeout)
    -> result<task_snapshot> {
    auto task = impl_->find_task(id);
    if (!task) {
        return unexpected(task.error());
    }
    (void)task.value()->wait_terminal(timeout);
    return task.value()->snapshot();
}

auto transfer_manager::list_tasks() const -> std::vector<task_snapshot> {
    std::vector<std::shared_ptr<transfer_task>> tasks;
    {
        std::lock_guard lock(impl_->mutex);
        tasks.reserve(impl_->jobs.size());
        for (const auto& [id, job] : impl_->jobs) {
            tasks.push_back(job.task);
        }
    }

    std::vector<task_snapshot> snapshots;
    snapshots.reserve(tasks.size());
    for (const auto& task : tasks) {
        snapshots.push_back(task->snapshot());
    }
    std::sort(snapshots.begin(), snapshots.end(),
              [](const task_snapshot& a, const task_snapshot& b) {
                  return a.created_at < b.created_at;
              });
    return snapshots;
}

auto transfer_manager::purge_terminal() -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    return std::erase_if(impl_->jobs, [](const auto& entry) {
        return is_terminal(entry.second.task->state());
    });
}

auto transfer_manager::purge_stale_resume_states(const std::filesystem::path& directory)
    -> std::size_t {
    return impl_->resumes.purge_stale(directory);
}

auto transfer_manager::subscribe(event_type type) -> std::shared_ptr<event_subscription> {
    return impl_->events.subscribe(type);
}

auto transfer_manager::subscribe_all() -> std::shared_ptr<event_subscription> {
    return impl_->events.subscribe_all();
}

auto transfer_manager::allocate_transfer(uint64_t size, transfer_priority priority)
    -> result<std::shared_ptr<transfer_allocation>> {
    uint32_t concurrent = 1;
    {
        std::lock_guard lock(impl_->mutex);
        concurrent = std::max(1U, impl_->active_transfers);
    }
    return impl_->resources.allocate(size, priority, concurrent);
}

auto transfer_manager::complete(const std::shared_ptr<transfer_allocation>& allocation) -> void {
    if (allocation) {
        allocation->complete();
    }
}

auto transfer_manager::get_stats() const -> manager_stats {
    std::lock_guard lock(impl_->mutex);
    return impl_->stats_locked();
}

auto transfer_manager::resource_statistics() const -> resource_stats {
    return impl_->resources.stats();
}

auto transfer_manager::shutdown() -> void {
    impl_->shutdown();
}

auto transfer_manager::is_running() const -> bool {
    std::lock_guard lock(impl_->mutex);
    return impl_->running;
}

auto transfer_manager::config() const -> const transfer_manager_config& {
    return impl_->config;
}

}  // namespace kcenon::resilient_transfer
