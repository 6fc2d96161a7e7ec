/*
 * Cancellation
 *
 * CancellationSource is held by whoever decides to stop (the signalfd
 * handler); CancellationToken copies are handed to loops that poll it.
 */

#ifndef CANCELLATION_H
#define CANCELLATION_H

#include <atomic>
#include <memory>

class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    bool is_cancellation_requested() const {
        return state_->requested.load(std::memory_order_acquire);
    }

private:
    friend class CancellationSource;

    struct State {
        std::atomic<bool> requested{false};
    };
    std::shared_ptr<State> state_;
};

class CancellationSource {
public:
    void cancel() { token_.state_->requested.store(true, std::memory_order_release); }

    bool is_cancellation_requested() const { return token_.is_cancellation_requested(); }

    CancellationToken token() const { return token_; }

private:
    CancellationToken token_;
};

#endif // CANCELLATION_H
