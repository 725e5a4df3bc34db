#pragma once

#include <atomic>
#include <expected>
#include <memory>
#include <utility>

#include "RTB/Error.h"

namespace RTB {
namespace Render {

template<typename T> class HandoffSender;
template<typename T> class HandoffReceiver;

namespace detail {

// Control block shared by both ends. Allocated on the control thread.
template<typename T>
struct alignas(64) HandoffState {
    alignas(64) std::atomic<T*> slot{nullptr};
    alignas(64) std::atomic<bool> receiverAlive{true};
    // Set by the receiver once it has taken the value, before it can die.
    std::atomic<bool> delivered{false};

    ~HandoffState() { delete slot.load(std::memory_order_relaxed); }

    static_assert(std::atomic<T*>::is_always_lock_free);
};

} // namespace detail

template<typename T>
std::pair<HandoffSender<T>, HandoffReceiver<T>> makeHandoffChannel();

/**
 * @brief Sending end of a one-shot ownership channel. Control thread only.
 */
template<typename T>
class HandoffSender {
public:
    HandoffSender() = default;
    HandoffSender(HandoffSender&&) noexcept = default;
    HandoffSender& operator=(HandoffSender&&) noexcept = default;
    HandoffSender(const HandoffSender&) = delete;
    HandoffSender& operator=(const HandoffSender&) = delete;

    /**
     * @brief Move a value to the receiver without blocking.
     *
     * On failure the value is destroyed here, on the calling thread.
     * @return ReceiverGone if the receiving end no longer exists,
     *         AlreadySent if this channel has been used before
     */
    std::expected<void, HandoffError> send(std::unique_ptr<T> value) {
        if (!state_) {
            return std::unexpected(HandoffError::ReceiverGone);
        }
        if (sent_) {
            return std::unexpected(HandoffError::AlreadySent);
        }
        if (!state_->receiverAlive.load(std::memory_order_seq_cst)) {
            return std::unexpected(HandoffError::ReceiverGone);
        }

        sent_ = true;
        state_->slot.store(value.release(), std::memory_order_seq_cst);

        // The receiver may have been destroyed between the check and the store.
        // Whoever wins the exchange owns the pointer. An empty slot means the
        // receiver either took the value or freed it while tearing down.
        if (!state_->receiverAlive.load(std::memory_order_seq_cst)) {
            std::unique_ptr<T> reclaimed(state_->slot.exchange(nullptr, std::memory_order_acq_rel));
            if (reclaimed || !state_->delivered.load(std::memory_order_acquire)) {
                return std::unexpected(HandoffError::ReceiverGone);
            }
        }
        return {};
    }

    bool hasSent() const noexcept { return sent_; }

    bool isReceiverAlive() const noexcept {
        return state_ && state_->receiverAlive.load(std::memory_order_acquire);
    }

private:
    friend std::pair<HandoffSender<T>, HandoffReceiver<T>> makeHandoffChannel<T>();

    explicit HandoffSender(std::shared_ptr<detail::HandoffState<T>> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::HandoffState<T>> state_;
    bool sent_{false};
};

/**
 * @brief Receiving end of a one-shot ownership channel. Render thread only.
 *
 * tryReceive() is wait-free and never allocates. The receiver must be destroyed
 * outside the real-time callback.
 */
template<typename T>
class HandoffReceiver {
public:
    HandoffReceiver() = default;
    HandoffReceiver(HandoffReceiver&& other) noexcept = default;
    HandoffReceiver& operator=(HandoffReceiver&& other) noexcept {
        if (this != &other) {
            disconnect();
            state_ = std::move(other.state_);
        }
        return *this;
    }
    HandoffReceiver(const HandoffReceiver&) = delete;
    HandoffReceiver& operator=(const HandoffReceiver&) = delete;

    ~HandoffReceiver() { disconnect(); }

    /**
     * @brief Take the value if one has arrived.
     * @return The value on the single successful call, nullptr otherwise
     */
    std::unique_ptr<T> tryReceive() noexcept {
        if (!state_) {
            return nullptr;
        }
        // Cheap check first so the common empty case does not write the cache line.
        if (state_->slot.load(std::memory_order_acquire) == nullptr) {
            return nullptr;
        }
        std::unique_ptr<T> value(state_->slot.exchange(nullptr, std::memory_order_acq_rel));
        if (value) {
            state_->delivered.store(true, std::memory_order_release);
        }
        return value;
    }

    bool isConnected() const noexcept { return state_ != nullptr; }

private:
    friend std::pair<HandoffSender<T>, HandoffReceiver<T>> makeHandoffChannel<T>();

    explicit HandoffReceiver(std::shared_ptr<detail::HandoffState<T>> state)
        : state_(std::move(state)) {}

    void disconnect() noexcept {
        if (!state_) {
            return;
        }
        state_->receiverAlive.store(false, std::memory_order_seq_cst);
        std::unique_ptr<T> pending(state_->slot.exchange(nullptr, std::memory_order_seq_cst));
        state_.reset();
    }

    std::shared_ptr<detail::HandoffState<T>> state_;
};

/**
 * @brief Create a connected sender/receiver pair.
 */
template<typename T>
std::pair<HandoffSender<T>, HandoffReceiver<T>> makeHandoffChannel() {
    auto state = std::make_shared<detail::HandoffState<T>>();
    return {HandoffSender<T>(state), HandoffReceiver<T>(state)};
}

} // namespace Render
} // namespace RTB
