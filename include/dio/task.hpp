#pragma once

#include <coroutine>
#include <exception>
#include <optional>
#include <utility>

namespace dio
{
// -----------------------------------------------------------------------------
// Task<T> - lazily started coroutine; the completion token of the async façade
// -----------------------------------------------------------------------------

template <typename T>
class Task;

namespace detail
{
struct PromiseBase
{
    std::exception_ptr exception;
    std::coroutine_handle<> continuation;

    struct FinalAwaiter
    {
        bool await_ready() noexcept { return false; }

        template <typename Promise>
        std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> h) noexcept
        {
            if (auto cont = h.promise().continuation)
            {
                return cont;
            }
            return std::noop_coroutine();
        }

        void await_resume() noexcept {}
    };

    std::suspend_always initial_suspend() noexcept { return {}; }
    FinalAwaiter final_suspend() noexcept { return {}; }
    void unhandled_exception() { exception = std::current_exception(); }

    void RethrowIfFailed() const
    {
        if (exception)
        {
            std::rethrow_exception(exception);
        }
    }
};

template <typename T>
struct Promise : PromiseBase
{
    std::optional<T> value;

    Task<T> get_return_object();
    void return_value(T v) { value = std::move(v); }

    T Take()
    {
        RethrowIfFailed();
        return std::move(*value);
    }
};

template <>
struct Promise<void> : PromiseBase
{
    Task<void> get_return_object();
    void return_void() {}

    void Take() const { RethrowIfFailed(); }
};
}  // namespace detail

/**
 * Move-only owner of a coroutine frame. Nothing runs until the task is
 * co_awaited, resumed, or driven by IoContext::RunUntilDone. Destroying a
 * task whose coroutine is suspended on I/O terminates (see OperationState).
 */
template <typename T = void>
class [[nodiscard("You must co_await a Task or keep it alive")]] Task
{
public:
    using promise_type = detail::Promise<T>;
    using handle_type = std::coroutine_handle<promise_type>;

    explicit Task(handle_type h) : handle_(h) {}
    Task(Task&& other) noexcept : handle_(std::exchange(other.handle_, {})) {}
    Task& operator=(Task&& other) noexcept
    {
        if (this != &other)
        {
            Reset();
            handle_ = std::exchange(other.handle_, {});
        }
        return *this;
    }

    ~Task() { Reset(); }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    [[nodiscard]] bool Done() const { return handle_ && handle_.done(); }

    T Result() { return handle_.promise().Take(); }

    void resume()
    {
        if (handle_ && !handle_.done())
        {
            handle_.resume();
        }
    }

    // Awaitable interface: symmetric transfer into the child, which resumes
    // us from its final suspend point.
    bool await_ready() const noexcept { return false; }

    std::coroutine_handle<> await_suspend(std::coroutine_handle<> cont) noexcept
    {
        handle_.promise().continuation = cont;
        return handle_;
    }

    T await_resume() { return handle_.promise().Take(); }

private:
    void Reset() noexcept
    {
        if (handle_)
        {
            handle_.destroy();
            handle_ = {};
        }
    }

    handle_type handle_;
};

namespace detail
{
template <typename T>
Task<T> Promise<T>::get_return_object()
{
    return Task<T>{std::coroutine_handle<Promise<T>>::from_promise(*this)};
}

inline Task<void> Promise<void>::get_return_object()
{
    return Task<void>{std::coroutine_handle<Promise<void>>::from_promise(*this)};
}
}  // namespace detail
}  // namespace dio
