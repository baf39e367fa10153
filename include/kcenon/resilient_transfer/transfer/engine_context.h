/**
 * @file engine_context.h
 * @brief Collaborators shared by the uploader and downloader
 */

#ifndef KCENON_RESILIENT_TRANSFER_TRANSFER_ENGINE_CONTEXT_H
#define KCENON_RESILIENT_TRANSFER_TRANSFER_ENGINE_CONTEXT_H

#include "kcenon/resilient_transfer/cloud/credential_manager.h"
#include "kcenon/resilient_transfer/config/engine_config.h"
#include "kcenon/resilient_transfer/core/cancellation.h"
#include "kcenon/resilient_transfer/core/rate_limiter.h"
#include "kcenon/resilient_transfer/core/resume_store.h"
#include "kcenon/resilient_transfer/core/retry_policy.h"
#include "resource_allocator.h"
#include "storage_backend.h"
#include "transfer_task.h"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>

namespace kcenon::resilient_transfer {

/**
 * @brief Non-owning references to the services an engine uses
 *
 * The transfer manager owns every referenced object and outlives the
 * engines it creates.
 */
struct engine_context {
    engine_config config;
    retry_policy retry;
    std::shared_ptr<storage_backend> backend;
    credential_manager* credentials = nullptr;
    rate_limiter_registry* limits = nullptr;
    resource_allocator* resources = nullptr;
    resume_store* resumes = nullptr;

    [[nodiscard]] auto validate() const -> result<void> {
        if (!backend || credentials == nullptr || limits == nullptr || resources == nullptr ||
            resumes == nullptr) {
            return unexpected(error(error_code::invalid_configuration,
                                    "engine context is missing a collaborator"));
        }
        if (auto r = retry.validate(); !r) {
            return r;
        }
        return config.validate();
    }
};

/**
 * @brief Progress notifications from an engine
 */
struct transfer_observer {
    std::function<void(const transfer_task&)> on_progress;
};

/**
 * @brief Outcome of a finished upload or download
 */
struct transfer_outcome {
    std::string object_key;
    uint64_t plain_size = 0;
    uint64_t remote_size = 0;
    std::string checksum;
    uint32_t part_count = 0;
    uint32_t parts_transferred = 0;  // parts moved by this run
    bool resumed = false;
    bool already_complete = false;   // nothing had to be moved
};

/**
 * @brief Wraps each remote call with a rate token, a fresh lease and retries
 *
 * Throttling drains the scope's bucket and sets a cooldown; an expired
 * lease forces one credential refresh before the call is repeated.
 */
class remote_caller {
public:
    remote_caller(const engine_context& context,
                  storage_context storage,
                  const cancellation_token* token);

    template <typename F>
    auto call(rate_limit_scope scope, std::string_view operation, F&& fn)
        -> std::invoke_result_t<F&, const credential_lease&> {
        using result_type = std::invoke_result_t<F&, const credential_lease&>;
        retry_executor executor(context_.retry, make_hooks(scope));
        return executor.execute(
            operation,
            [&]() -> result_type {
                auto token_ok = context_.limits->get(scope).acquire(token_);
                if (!token_ok) {
                    return unexpected(token_ok.error());
                }
                auto lease = context_.credentials->get_credentials(storage_);
                if (!lease) {
                    return unexpected(lease.error());
                }
                return fn(*lease.value());
            },
            token_);
    }

    [[nodiscard]] auto storage() const noexcept -> const storage_context& { return storage_; }

private:
    [[nodiscard]] auto make_hooks(rate_limit_scope scope) -> retry_hooks;

    const engine_context& context_;
    storage_context storage_;
    const cancellation_token* token_;
};

}  // namespace kcenon::resilient_transfer

#endif  // KCENON_RESILIENT_TRANSFER_TRANSFER_ENGINE_CONTEXT_H
