/**
 * @file transfer_manager.h
 * @brief Queue, worker pool and control surface for transfers
 */

#ifndef KCENON_RESILIENT_TRANSFER_TRANSFER_TRANSFER_MANAGER_H
#define KCENON_RESILIENT_TRANSFER_TRANSFER_TRANSFER_MANAGER_H

#include "kcenon/resilient_transfer/cloud/credential_types.h"
#include "kcenon/resilient_transfer/config/engine_config.h"
#include "kcenon/resilient_transfer/core/transfer_id.h"
#include "kcenon/resilient_transfer/core/types.h"
#include "event_bus.h"
#include "resource_allocator.h"
#include "storage_backend.h"
#include "transfer_task.h"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::resilient_transfer {

/**
 * @brief Per-transfer options for submit()
 */
struct submit_options {
    /// Storage holding (download) or receiving (upload) the object
    std::optional<storage_context> storage;
    std::optional<std::string> batch_id;
    std::optional<std::string> batch_label;
    /// Replace an existing download destination that differs from the object
    bool overwrite = false;
    transfer_priority priority = transfer_priority::normal;
};

/**
 * @brief Runs uploads and downloads on a bounded worker pool
 *
 * Submitted transfers are queued and started in submission order by up to
 * max_concurrent_transfers workers. Each transfer reports its lifecycle on
 * the event bus; publishing never blocks the worker.
 *
 * @code
 * auto manager = transfer_manager::builder()
 *     .with_backend(backend)
 *     .with_credential_source(source)
 *     .with_master_secret(secret)
 *     .build();
 *
 * auto events = manager.value().subscribe(event_type::completed);
 * auto id = manager.value().submit(transfer_direction::upload,
 *                                  "/data/model.bin", "projects/42", 0, "cli");
 * auto done = manager.value().wait(id.value(), std::chrono::minutes(10));
 * @endcode
 */
class transfer_manager {
public:
    /**
     * @brief Builder for transfer_manager
     */
    class builder {
    public:
        builder();

        /**
         * @brief Replace the whole configuration
         */
        auto with_config(transfer_manager_config config) -> builder&;

        auto with_engine_config(engine_config config) -> builder&;

        /**
         * @brief Secret every per-file key is derived from (at least 32 bytes)
         */
        auto with_master_secret(byte_buffer secret) -> builder&;

        auto with_default_storage(storage_context storage) -> builder&;

        /**
         * @brief Remote object store (required)
         */
        auto with_backend(std::shared_ptr<storage_backend> backend) -> builder&;

        /**
         * @brief Issuer of storage credentials (required)
         */
        auto with_credential_source(std::shared_ptr<credential_source> source) -> builder&;

        auto with_retry_policy(retry_policy policy) -> builder&;

        auto with_rate_limit(rate_limit_scope scope, rate_limit_profile profile) -> builder&;

        auto with_credential_config(credential_manager_config config) -> builder&;

        auto with_resources(resource_config config) -> builder&;

        /**
         * @brief Transfers running at once (1-10, default 5)
         */
        auto with_max_concurrent_transfers(uint32_t count) -> builder&;

        auto with_event_queue_capacity(std::size_t capacity) -> builder&;

        /**
         * @brief Skip the duplicate-object listing before uploads (default off)
         */
        auto with_fast_mode(bool enable) -> builder&;

        auto with_background_credential_refresh(bool enable) -> builder&;

        [[nodiscard]] auto build() -> result<transfer_manager>;

    private:
        transfer_manager_config config_;
        std::shared_ptr<storage_backend> backend_;
        std::shared_ptr<credential_source> source_;
    };

    // Non-copyable, movable
    transfer_manager(const transfer_manager&) = delete;
    auto operator=(const transfer_manager&) -> transfer_manager& = delete;
    transfer_manager(transfer_manager&&) noexcept;
    auto operator=(transfer_manager&&) noexcept -> transfer_manager&;
    ~transfer_manager();

    /**
     * @brief Queue a transfer
     * @param direction upload or download
     * @param local_path source file (upload) or destination file (download)
     * @param remote_locator destination path base (upload) or object key (download)
     * @param size declared plaintext size; 0 when unknown
     * @param origin free-form label of the requester
     * @return id of the queued task
     */
    [[nodiscard]] auto submit(transfer_direction direction,
                              const std::filesystem::path& local_path,
                              const std::string& remote_locator,
                              uint64_t size,
                              const std::string& origin,
                              const submit_options& options = {}) -> result<transfer_id>;

    [[nodiscard]] auto upload(const std::filesystem::path& local_path,
                              const std::string& path_base,
                              const submit_options& options = {}) -> result<transfer_id>;

    [[nodiscard]] auto download(const std::string& object_key,
                                const std::filesystem::path& local_path,
                                const submit_options& options = {}) -> result<transfer_id>;

    /**
     * @brief Force CANCELLED and stop the task at its next part boundary
     */
    [[nodiscard]] auto cancel(const transfer_id& id) -> result<void>;

    [[nodiscard]] auto pause(const transfer_id& id) -> result<void>;

    [[nodiscard]] auto resume(const transfer_id& id) -> result<void>;

    [[nodiscard]] auto get_state(const transfer_id& id) const -> result<task_state>;

    [[nodiscard]] auto get_progress(const transfer_id& id) const -> result<progress_snapshot>;

    [[nodiscard]] auto get_task(const transfer_id& id) const -> result<task_snapshot>;

    /**
     * @brief Block until the task is terminal or @p timeout elapses
     * @return the latest snapshot; not terminal when the timeout elapsed
     */
    [[nodiscard]] auto wait(const transfer_id& id, std::chrono::milliseconds timeout)
        -> result<task_snapshot>;

    /**
     * @brief Snapshots of all known tasks, oldest first
     */
    [[nodiscard]] auto list_tasks() const -> std::vector<task_snapshot>;

    /**
     * @brief Forget terminal tasks
     * @return number of tasks removed
     */
    auto purge_terminal() -> std::size_t;

    /**
     * @brief Delete resume files older than the configured maximum age
     */
    auto purge_stale_resume_states(const std::filesystem::path& directory) -> std::size_t;

    [[nodiscard]] auto subscribe(event_type type) -> std::shared_ptr<event_subscription>;

    [[nodiscard]] auto subscribe_all() -> std::shared_ptr<event_subscription>;

    /**
     * @brief Reserve worker threads for a transfer of @p size bytes
     * @return shut_down after shutdown()
     */
    [[nodiscard]] auto allocate_transfer(uint64_t size,
                                         transfer_priority priority = transfer_priority::normal)
        -> result<std::shared_ptr<transfer_allocation>>;

    /**
     * @brief Release an allocation; repeated calls are no-ops
     */
    auto complete(const std::shared_ptr<transfer_allocation>& allocation) -> void;

    [[nodiscard]] auto get_stats() const -> manager_stats;

    [[nodiscard]] auto resource_statistics() const -> resource_stats;

    /**
     * @brief Cancel every unfinished task and stop the workers
     *
     * Later submits and allocations fail with shut_down.
     */
    auto shutdown() -> void;

    [[nodiscard]] auto is_running() const -> bool;

    [[nodiscard]] auto config() const -> const transfer_manager_config&;

private:
    transfer_manager(transfer_manager_config config,
                     std::shared_ptr<storage_backend> backend,
                     std::shared_ptr<credential_source> source);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::resilient_transfer

#endif  // KCENON_RESILIENT_TRANSFER_TRANSFER_TRANSFER_MANAGER_H
