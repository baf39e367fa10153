/**
 * @file credential_manager.cpp
 * @brief Credential cache implementation
 */

#include "kcenon/resilient_transfer/cloud/credential_manager.h"
#include "kcenon/resilient_transfer/core/logging.h"

#include <atomic>
#include <condition_variable>
#include <exception>
#include <future>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace kcenon::resilient_transfer {

class credential_manager::impl {
public:
    struct cache_entry {
        storage_context context;
        lease_ptr lease;
        std::shared_future<result<lease_ptr>> inflight;
        bool refreshing = false;
    };

    impl(std::shared_ptr<credential_source> source,
         credential_manager_config config,
         rate_limiter* limiter)
        : source_(std::move(source)), config_(config), limiter_(limiter) {}

    ~impl() { stop_background(); }

    auto needs_refresh(const lease_ptr& lease) const -> bool {
        if (!lease) {
            return true;
        }
        return lease->age() >= config_.refresh_interval ||
               lease->expires_within(config_.expiry_buffer);
    }

    auto get(const storage_context& context, bool force) -> result<lease_ptr> {
        const auto key = context.cache_key();

        if (!force) {
            std::shared_lock lock(mutex_);
            auto it = cache_.find(key);
            if (it != cache_.end() && !needs_refresh(it->second.lease)) {
                return it->second.lease;
            }
        }

        std::shared_future<result<lease_ptr>> waiter;
        std::promise<result<lease_ptr>> promise;
        lease_ptr previous;
        {
            std::unique_lock lock(mutex_);
            auto& entry = cache_[key];
            if (entry.refreshing) {
                waiter = entry.inflight;
            } else if (!force && !needs_refresh(entry.lease)) {
                return entry.lease;
            } else {
                entry.context = context;
                entry.refreshing = true;
                entry.inflight = promise.get_future().share();
                previous = entry.lease;
            }
        }

        if (waiter.valid()) {
            RT_LOG_TRACE(log_category::credentials, "Waiting for in-flight refresh of " + key);
            return waiter.get();
        }

        auto outcome = refresh(context, key, previous);
        promise.set_value(outcome);
        return outcome;
    }

    auto refresh(const storage_context& context, const std::string& key, const lease_ptr& previous)
        -> result<lease_ptr> {
        retry_executor executor(config_.refresh_retry);
        auto fetched = executor.execute("credential fetch for " + key, [&]() -> result<credential_lease> {
            if (limiter_ != nullptr) {
                if (auto permit = limiter_->acquire(); !permit) {
                    return unexpected(permit.error());
                }
            }
            fetch_count_.fetch_add(1, std::memory_order_relaxed);
            // A throwing source must still release the waiters on this refresh.
            try {
                return source_->fetch(context);
            } catch (const std::exception& e) {
                return unexpected(error(error_code::credentials_unavailable,
                                        std::string("credential source threw: ") + e.what()));
            } catch (...) {
                return unexpected(error(error_code::credentials_unavailable,
                                        "credential source threw an unknown exception"));
            }
        });

        result<lease_ptr> outcome;
        if (fetched) {
            auto lease = std::move(fetched.value());
            lease.context = context;
            if (lease.issued_at == std::chrono::system_clock::time_point{}) {
                lease.issued_at = std::chrono::system_clock::now();
            }
            auto shared = std::make_shared<const credential_lease>(std::move(lease));
            RT_LOG_DEBUG(log_category::credentials, "Refreshed " + shared->describe());
            outcome = lease_ptr(shared);
        } else if (previous && !previous->is_expired()) {
            RT_LOG_WARN(log_category::credentials,
                        "Credential refresh for " + key + " failed (" + fetched.error().message +
                            "); serving cached lease valid for " +
                            std::to_string(previous->time_until_expiration().count()) + "s");
            outcome = previous;
        } else if (previous) {
            RT_LOG_ERROR(log_category::credentials,
                         "Credential refresh for " + key + " failed and cached lease expired: " +
                             fetched.error().message);
            outcome = unexpected(error(error_code::auth_expired,
                                       "credentials for " + key + " expired and refresh failed: " +
                                           fetched.error().message));
        } else {
            RT_LOG_ERROR(log_category::credentials,
                         "Credential fetch for " + key + " failed: " + fetched.error().message);
            outcome = unexpected(fetched.error());
        }

        {
            std::unique_lock lock(mutex_);
            auto& entry = cache_[key];
            if (outcome) {
                entry.lease = outcome.value();
            }
            entry.refreshing = false;
            entry.inflight = {};
        }
        return outcome;
    }

    auto invalidate(const std::string& key) -> void {
        std::unique_lock lock(mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end() && !it->second.refreshing) {
            cache_.erase(it);
        } else if (it != cache_.end()) {
            it->second.lease.reset();
        }
    }

    auto clear() -> void {
        std::unique_lock lock(mutex_);
        for (auto it = cache_.begin(); it != cache_.end();) {
            if (it->second.refreshing) {
                it->second.lease.reset();
                ++it;
            } else {
                it = cache_.erase(it);
            }
        }
    }

    auto start_background() -> result<void> {
        std::lock_guard lock(worker_mutex_);
        if (worker_.joinable()) {
            return unexpected(error(error_code::invalid_argument,
                                    "background refresh already running"));
        }
        stop_requested_ = false;
        worker_ = std::thread([this] { background_loop(); });
        RT_LOG_INFO(log_category::credentials, "Background credential refresh started");
        return {};
    }

    auto stop_background() -> void {
        std::thread worker;
        {
            std::lock_guard lock(worker_mutex_);
            if (!worker_.joinable()) {
                return;
            }
            stop_requested_ = true;
            worker = std::move(worker_);
        }
        worker_cv_.notify_all();
        worker.join();
        RT_LOG_INFO(log_category::credentials, "Background credential refresh stopped");
    }

    auto background_loop() -> void {
        while (true) {
            {
                std::unique_lock lock(worker_mutex_);
                if (worker_cv_.wait_for(lock, config_.check_interval,
                                        [this] { return stop_requested_; })) {
                    return;
                }
            }

            std::vector<storage_context> stale;
            {
                std::shared_lock lock(mutex_);
                for (const auto& [key, entry] : cache_) {
                    if (entry.lease && !entry.refreshing && needs_refresh(entry.lease)) {
                        stale.push_back(entry.context);
                    }
                }
            }

            for (const auto& context : stale) {
                if (auto refreshed = get(context, false); !refreshed) {
                    RT_LOG_WARN(log_category::credentials,
                                "Background refresh failed for " + context.cache_key() + ": " +
                                    refreshed.error().message);
                }
            }
        }
    }

    std::shared_ptr<credential_source> source_;
    credential_manager_config config_;
    rate_limiter* limiter_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, cache_entry> cache_;
    std::atomic<uint64_t> fetch_count_{0};

    mutable std::mutex worker_mutex_;
    std::condition_variable worker_cv_;
    std::thread worker_;
    bool stop_requested_ = false;
};

credential_manager::credential_manager(std::shared_ptr<credential_source> source,
                                       credential_manager_config config,
                                       rate_limiter* limiter)
    : impl_(std::make_unique<impl>(std::move(source), config, limiter)) {}

credential_manager::~credential_manager() = default;

auto credential_manager::get_credentials(const storage_context& context) -> result<lease_ptr> {
    return impl_->get(context, false);
}

auto credential_manager::force_refresh(const storage_context& context) -> result<lease_ptr> {
    return impl_->get(context, true);
}

auto credential_manager::invalidate(const storage_context& context) -> void {
    impl_->invalidate(context.cache_key());
}

auto credential_manager::clear() -> void {
    impl_->clear();
}

auto credential_manager::start_background_refresh() -> result<void> {
    return impl_->start_background();
}

auto credential_manager::stop_background_refresh() -> void {
    impl_->stop_background();
}

auto credential_manager::is_background_refresh_running() const -> bool {
    std::lock_guard lock(impl_->worker_mutex_);
    return impl_->worker_.joinable();
}

auto credential_manager::cached_count() const -> std::size_t {
    std::shared_lock lock(impl_->mutex_);
    std::size_t count = 0;
    for (const auto& [key, entry] : impl_->cache_) {
        if (entry.lease) {
            ++count;
        }
    }
    return count;
}

auto credential_manager::fetch_count() const -> uint64_t {
    return impl_->fetch_count_.load(std::memory_order_relaxed);
}

auto credential_manager::config() const -> const credential_manager_config& {
    return impl_->config_;
}

}  // namespace kcenon::resilient_transfer
