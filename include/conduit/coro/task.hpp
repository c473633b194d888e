#pragma once

#include <concepts>
#include <coroutine>
#include <exception>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace conduit {

template<typename T = void>
class Task;

namespace detail {

// ============================================================================
// Promise
// ============================================================================

// Empty until the coroutine finishes, then holds either its value or the
// exception that escaped it.
template<typename T>
using TaskOutcome = std::variant<std::monostate,
                                 std::conditional_t<std::is_void_v<T>, std::monostate, T>,
                                 std::exception_ptr>;

template<typename T>
struct PromiseCommon {
    std::coroutine_handle<> waiter = std::noop_coroutine();
    TaskOutcome<T> outcome;

    // Hands control back to whoever awaited the task
    struct ResumeWaiter {
        bool await_ready() const noexcept { return false; }

        template<typename P>
        std::coroutine_handle<> await_suspend(std::coroutine_handle<P> self) noexcept {
            return self.promise().waiter;
        }

        void await_resume() const noexcept {}
    };

    std::suspend_always initial_suspend() const noexcept { return {}; }
    ResumeWaiter final_suspend() const noexcept { return {}; }

    void unhandled_exception() noexcept {
        outcome.template emplace<2>(std::current_exception());
    }

    void rethrow_if_failed() const {
        if (outcome.index() == 2) {
            std::rethrow_exception(std::get<2>(outcome));
        }
    }
};

template<typename T>
struct Promise : PromiseCommon<T> {
    Task<T> get_return_object() noexcept;

    template<typename U>
        requires std::convertible_to<U, T>
    void return_value(U&& value) {
        this->outcome.template emplace<1>(std::forward<U>(value));
    }

    T take() {
        this->rethrow_if_failed();
        return std::move(std::get<1>(this->outcome));
    }
};

template<>
struct Promise<void> : PromiseCommon<void> {
    Task<void> get_return_object() noexcept;

    void return_void() noexcept { outcome.emplace<1>(); }

    void take() { rethrow_if_failed(); }
};

} // namespace detail

// ============================================================================
// Task<T>
// ============================================================================

/// Stages, actions and the endpoint all return Task. Nothing runs until the
/// task is awaited or driven with sync_wait(); awaiting transfers control
/// straight into the child, so a pipeline that never waits on I/O finishes
/// within one resume().
template<typename T>
class [[nodiscard]] Task {
public:
    using promise_type = detail::Promise<T>;

private:
    using Handle = std::coroutine_handle<promise_type>;

    Handle coro_;

    friend promise_type;
    explicit Task(Handle coro) noexcept : coro_(coro) {}

public:
    Task() noexcept = default;

    Task(Task&& other) noexcept : coro_(std::exchange(other.coro_, {})) {}

    Task& operator=(Task other) noexcept {
        std::swap(coro_, other.coro_);
        return *this;
    }

    ~Task() {
        if (coro_) coro_.destroy();
    }

    bool valid() const noexcept { return static_cast<bool>(coro_); }
    bool done() const noexcept { return coro_ && coro_.done(); }

    auto operator co_await() && noexcept {
        struct Awaiter {
            Handle coro;

            bool await_ready() const noexcept { return !coro || coro.done(); }

            std::coroutine_handle<> await_suspend(std::coroutine_handle<> waiter) noexcept {
                coro.promise().waiter = waiter;
                return coro;
            }

            T await_resume() { return coro.promise().take(); }
        };
        return Awaiter{coro_};
    }

    /// Drives the task on the calling thread. Throws std::logic_error if it
    /// is left waiting on something that only another thread could resume.
    T sync_wait() {
        if (!coro_) {
            throw std::logic_error("Task::sync_wait on an empty task");
        }
        if (!coro_.done()) {
            coro_.resume();
        }
        if (!coro_.done()) {
            throw std::logic_error("Task::sync_wait: task suspended on an external event");
        }
        return coro_.promise().take();
    }
};

namespace detail {

template<typename T>
Task<T> Promise<T>::get_return_object() noexcept {
    return Task<T>{std::coroutine_handle<Promise<T>>::from_promise(*this)};
}

inline Task<void> Promise<void>::get_return_object() noexcept {
    return Task<void>{std::coroutine_handle<Promise<void>>::from_promise(*this)};
}

} // namespace detail

} // namespace conduit
