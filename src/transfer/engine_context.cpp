/**
 * @file engine_context.cpp
 * @brief Retry hooks binding the limiter and the credential cache
 */

#include "kcenon/resilient_transfer/transfer/engine_context.h"

namespace kcenon::resilient_transfer {

remote_caller::remote_caller(const engine_context& context,
                             storage_context storage,
                             const cancellation_token* token)
    : context_(context), storage_(std::move(storage)), token_(token) {}

auto remote_caller::make_hooks(rate_limit_scope scope) -> retry_hooks {
    retry_hooks hooks;
    hooks.on_throttled = [this, scope](std::chrono::milliseconds delay) {
        auto& limiter = context_.limits->get(scope);
        limiter.drain();
        limiter.set_cooldown(delay);
    };
    hooks.on_auth_expired = [this]() -> result<void> {
        auto lease = context_.credentials->force_refresh(storage_);
        if (!lease) {
            return unexpected(lease.error());
        }
        return {};
    };
    return hooks;
}

}  // namespace kcenon::resilient_transfer
