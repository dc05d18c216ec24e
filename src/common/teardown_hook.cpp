// =============================================================================
// FILE: src/common/teardown_hook.cpp
// =============================================================================
#include "common/teardown_hook.h"
#include "common/logger.h"
#include <exception>

namespace device_watch {

TeardownHook::Token TeardownHook::register_action(Action action) {
    if (!action) return kInvalidToken;
    std::lock_guard<std::mutex> lk(mu_);
    if (fired_.load(std::memory_order_acquire)) return kInvalidToken;
    Token token = next_token_++;
    actions_.emplace(token, std::move(action));
    return token;
}

void TeardownHook::unregister(Token token) {
    if (token == kInvalidToken) return;
    std::lock_guard<std::mutex> lk(mu_);
    actions_.erase(token);
}

size_t TeardownHook::fire() {
    if (fired_.exchange(true, std::memory_order_acq_rel)) {
        LOG_DEBUG("TeardownHook: already fired, ignoring");
        return 0;
    }

    size_t executed = 0;
    while (true) {
        Action action;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (actions_.empty()) break;
            auto it = actions_.begin();
            action = std::move(it->second);
            actions_.erase(it);
        }
        try {
            action();
        } catch (const std::exception& e) {
            LOG_ERROR("TeardownHook: action threw: %s", e.what());
        }
        ++executed;
    }

    LOG_INFO("TeardownHook: fired, %zu actions executed", executed);
    return executed;
}

size_t TeardownHook::pending_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return actions_.size();
}

} // namespace device_watch
