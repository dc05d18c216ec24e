// =============================================================================
// FILE: include/common/teardown_hook.h
// =============================================================================
#ifndef COMMON_TEARDOWN_HOOK_H
#define COMMON_TEARDOWN_HOOK_H

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <atomic>

namespace device_watch {

// Process-wide exit event. Components register cleanup actions; the owning
// context calls fire() once on shutdown. Actions run in registration order,
// outside the internal lock, so an action may unregister itself or others.
class TeardownHook {
public:
    using Action = std::function<void()>;
    using Token  = uint64_t;
    static constexpr Token kInvalidToken = 0;

    TeardownHook() = default;

    // Returns kInvalidToken once the hook has fired.
    Token register_action(Action action);

    // No-op for unknown or already-run tokens.
    void unregister(Token token);

    // Runs every registered action. Only the first call has any effect.
    // Returns the number of actions executed.
    size_t fire();

    bool fired() const { return fired_.load(std::memory_order_acquire); }
    size_t pending_count() const;

    TeardownHook(const TeardownHook&) = delete;
    TeardownHook& operator=(const TeardownHook&) = delete;

private:
    mutable std::mutex mu_;
    std::map<Token, Action> actions_;
    Token next_token_ = 1;
    std::atomic<bool> fired_{false};
};

} // namespace device_watch
#endif // COMMON_TEARDOWN_HOOK_H
