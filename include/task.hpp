#pragma once

#include <concepts>
#include <coroutine>
#include <exception>
#include <memory>
#include <type_traits>
#include <utility>

namespace pasture
{

template <typename T>
struct task;

namespace detail
{

struct task_promise_base
{
    task_promise_base() noexcept = default;
    ~task_promise_base() noexcept = default;

    // resume the awaiting coroutine, if any, once the task finishes
    struct final_awaitable
    {
        bool await_ready() const noexcept { return false; }

        template <std::derived_from<task_promise_base> promise>
        std::coroutine_handle<> await_suspend(std::coroutine_handle<promise> coro) const noexcept {
            if (coro.promise().continue_ != nullptr)
                return coro.promise().continue_;
            return std::noop_coroutine();
        }

        void await_resume() const noexcept {}
    };

    std::suspend_always initial_suspend() noexcept { return {}; }
    final_awaitable final_suspend() noexcept { return {}; }
    void unhandled_exception() noexcept { exception_ = std::current_exception(); }
    void set_continue(std::coroutine_handle<> coro) noexcept { continue_ = coro; }

protected:
    std::coroutine_handle<> continue_{nullptr};
    std::exception_ptr exception_;
};


template <typename T>
struct task_promise final : public task_promise_base
{
    task<T> get_return_object() noexcept;

    template <typename U>
    void return_value(U&& value) { value_ = std::forward<U>(value); }

    T& result() {
        if (exception_) [[unlikely]]
            std::rethrow_exception(exception_);
        return value_;
    }

private:
    T value_{};
};

template <>
struct task_promise<void> : public task_promise_base
{
    task<void> get_return_object() noexcept;

    void return_void() noexcept {}

    void result() {
        if (exception_) [[unlikely]]
            std::rethrow_exception(exception_);
    }
};

} // namespace detail


/// Lazily started coroutine. A task does not run until it is awaited or
/// explicitly resumed; awaiting it resumes the awaiter when it finishes and
/// rethrows any exception it ended with.
template <typename T = void>
struct [[nodiscard]] task
{
    using promise_type = detail::task_promise<T>;
    using coroutine_handle = std::coroutine_handle<promise_type>;

    task() noexcept : coro_(nullptr) {}

    explicit task(coroutine_handle coro) noexcept
        : coro_(coro)
    {}

    task(task&& other) noexcept
        : coro_(std::exchange(other.coro_, nullptr))
    {}

    task& operator=(task&& other) noexcept {
        if (std::addressof(other) != this) {
            if (coro_) coro_.destroy();
            coro_ = std::exchange(other.coro_, nullptr);
        }
        return *this;
    }

    task(const task&) = delete;
    task& operator=(const task&) = delete;

    ~task() {
        if (coro_) coro_.destroy();
    }

    bool done() const noexcept { return !coro_ || coro_.done(); }

    /// Give up ownership of the coroutine frame, the caller must destroy it.
    coroutine_handle detach() noexcept { return std::exchange(coro_, nullptr); }

    auto operator co_await() noexcept {
        struct awaiter
        {
            coroutine_handle coro_;

            bool await_ready() const noexcept { return !coro_ || coro_.done(); }

            std::coroutine_handle<> await_suspend(std::coroutine_handle<> caller) noexcept {
                coro_.promise().set_continue(caller);
                return coro_;
            }

            auto await_resume() {
                if constexpr (std::is_void_v<T>) {
                    coro_.promise().result();
                    return;
                } else {
                    return std::move(coro_.promise().result());
                }
            }
        };

        return awaiter{coro_};
    }

    void resume() { coro_.resume(); }

private:
    coroutine_handle coro_;
};


namespace detail
{

template <typename T>
inline task<T> task_promise<T>::get_return_object() noexcept {
    return task<T>{std::coroutine_handle<task_promise<T>>::from_promise(*this)};
}

inline task<void> task_promise<void>::get_return_object() noexcept {
    return task<void>{std::coroutine_handle<task_promise<void>>::from_promise(*this)};
}

} // namespace detail

} // namespace pasture
