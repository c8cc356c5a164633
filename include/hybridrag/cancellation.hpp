#pragma once

#include <cstdint>
#include <functional>
#include <memory>

namespace hybridrag {

namespace detail {
class CancellationState;
}

class CancellationToken;

/**
 * RAII handle for a callback registered on a token. Destruction removes the
 * callback; if the callback is running on another thread at that moment the
 * destructor waits for it to return.
 */
class CallbackRegistration {
public:
    CallbackRegistration() = default;
    ~CallbackRegistration();

    CallbackRegistration(CallbackRegistration&& other) noexcept;
    CallbackRegistration& operator=(CallbackRegistration&& other) noexcept;
    CallbackRegistration(const CallbackRegistration&) = delete;
    CallbackRegistration& operator=(const CallbackRegistration&) = delete;

    void reset();

private:
    friend class CancellationToken;
    CallbackRegistration(std::shared_ptr<detail::CancellationState> state, std::uint64_t id)
        : state_(std::move(state)), id_(id) {}

    std::shared_ptr<detail::CancellationState> state_;
    std::uint64_t id_ = 0;
};

/**
 * Read side of a cancellation signal. A default-constructed token can never
 * be cancelled. Tokens are cheap to copy and safe to share across threads.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    bool is_cancelled() const;
    bool can_be_cancelled() const { return static_cast<bool>(state_); }

    // Throws CancelledError when cancelled.
    void throw_if_cancelled() const;

    // Runs immediately (on this thread) if already cancelled.
    [[nodiscard]] CallbackRegistration register_callback(std::function<void()> callback) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

/**
 * Write side. cancel() is idempotent; callbacks run once, on the cancelling
 * thread. A source linked to a parent token is cancelled when the parent is.
 */
class CancellationSource {
public:
    CancellationSource();
    explicit CancellationSource(const CancellationToken& parent);
    ~CancellationSource() = default;

    CancellationSource(CancellationSource&&) noexcept = default;
    CancellationSource& operator=(CancellationSource&&) noexcept = default;
    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;

    void cancel();
    bool is_cancelled() const;
    CancellationToken token() const;

private:
    std::shared_ptr<detail::CancellationState> state_;
    CallbackRegistration parent_link_;
};

} // namespace hybridrag
