#ifndef EVENT_LOOP_H
#define EVENT_LOOP_H

#include <chrono>
#include <functional>
#include <memory>

// Single logical event loop every session callback is serialized on.
class EventLoop {
public:
    using TimerId = unsigned int;
    static constexpr TimerId kInvalidTimer = 0;

    virtual ~EventLoop() = default;

    // Run a task on the loop. Safe to call from any thread.
    virtual void post(std::function<void()> task) = 0;

    // Repeating timer; fires every interval until cancelled
    virtual TimerId scheduleRepeating(std::chrono::milliseconds interval,
                                      std::function<void()> task) = 0;

    // One-shot timer
    virtual TimerId scheduleOnce(std::chrono::milliseconds delay,
                                 std::function<void()> task) = 0;

    // Cancel a pending timer. Unknown or already-fired ids are ignored.
    virtual void cancel(TimerId id) = 0;
};

// Owns one timer registration and cancels it on reset or destruction
class ScopedTimer {
public:
    ScopedTimer() : loop_(nullptr), id_(EventLoop::kInvalidTimer) {}
    ScopedTimer(EventLoop* loop, EventLoop::TimerId id) : loop_(loop), id_(id) {}
    ~ScopedTimer() { reset(); }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    ScopedTimer(ScopedTimer&& other) noexcept : loop_(other.loop_), id_(other.id_) {
        other.loop_ = nullptr;
        other.id_ = EventLoop::kInvalidTimer;
    }

    ScopedTimer& operator=(ScopedTimer&& other) noexcept {
        if (this != &other) {
            reset();
            loop_ = other.loop_;
            id_ = other.id_;
            other.loop_ = nullptr;
            other.id_ = EventLoop::kInvalidTimer;
        }
        return *this;
    }

    void reset() {
        if (loop_ && id_ != EventLoop::kInvalidTimer) {
            loop_->cancel(id_);
        }
        loop_ = nullptr;
        id_ = EventLoop::kInvalidTimer;
    }

    // Forget the registration without cancelling (one-shot timer already fired)
    void release() {
        loop_ = nullptr;
        id_ = EventLoop::kInvalidTimer;
    }

    bool active() const { return id_ != EventLoop::kInvalidTimer; }

private:
    EventLoop* loop_;
    EventLoop::TimerId id_;
};

// Shared flag a superseding request flips to invalidate an in-flight one
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<bool>(false)) {}

    void cancel() { *state_ = true; }
    bool isCancelled() const { return *state_; }

private:
    std::shared_ptr<bool> state_;
};

#endif // EVENT_LOOP_H
