#pragma once

#include <coroutine>
#include <cstdint>
#include <cstdio>
#include <exception>

namespace dio
{
class IoContext;
class CancelToken;

// -----------------------------------------------------------------------------
// Operation State (intrusive tracking)
// -----------------------------------------------------------------------------

/**
 * Base state of one in-flight io_uring submission.
 *
 * Linked into the IoContext pending list on submission and unlinked when its
 * CQE is reaped. The state lives in the awaiting coroutine's frame, and so
 * does the iovec array the kernel is reading. Destroying the frame while the
 * state is still linked would let the kernel write into freed memory, so the
 * destructor terminates instead. This is detection, not prevention.
 *
 * Movable only while untracked (before await_suspend).
 */
struct OperationState
{
    IoContext* ctx = nullptr;
    CancelToken* token = nullptr;
    int32_t res = 0;
    std::coroutine_handle<> handle;

    OperationState* next = nullptr;
    OperationState* prev = nullptr;
    bool tracked = false;

    OperationState() = default;

    OperationState(OperationState&& other) noexcept
        : ctx(other.ctx), token(other.token), res(other.res), handle(other.handle)
    {
        if (other.tracked)
        {
            std::fputs("[dio] FATAL: moved an OperationState while its I/O is in flight\n", stderr);
            std::terminate();
        }
        other.ctx = nullptr;
        other.token = nullptr;
        other.handle = nullptr;
    }

    OperationState& operator=(OperationState&&) = delete;
    OperationState(const OperationState&) = delete;
    OperationState& operator=(const OperationState&) = delete;

    ~OperationState()
    {
        if (tracked)
        {
            std::fputs(
                "[dio] FATAL: OperationState destroyed while its I/O is in flight.\n"
                "[dio]        A Task was destroyed while suspended on a read or write; keep it alive until it "
                "completes.\n",
                stderr);
            std::terminate();
        }
    }
};
}  // namespace dio
