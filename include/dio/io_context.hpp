#pragma once

/**
 * io_context.hpp - single-threaded io_uring event loop for the suspending façade
 *
 * Design:
 * - One IoContext per thread; it is created, run and submitted to from that
 *   thread only (IORING_SETUP_SINGLE_ISSUER). Notify() is the one
 *   cross-thread entry point.
 * - The awaiting coroutine's handle is reached through the SQE user_data,
 *   which points at the OperationState embedded in the coroutine frame.
 * - Pending operations are tracked intrusively so the context can cancel and
 *   drain them on destruction.
 * - Callers own buffers and iovec storage; the context never allocates on
 *   the submission path.
 *
 * Requirements: Linux >= 6.1, liburing, C++23.
 */

#include <atomic>
#include <cerrno>
#include <coroutine>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <span>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <liburing.h>
#include <unistd.h>

#include <sys/eventfd.h>

#include "dio/logger.hpp"
#include "dio/operation_base.hpp"
#include "dio/result.hpp"
#include "dio/task.hpp"

namespace dio
{

namespace detail
{
/// Reserved user_data value for the internal eventfd wake read.
constexpr uint64_t kWakeTag = 1;
}  // namespace detail

// -----------------------------------------------------------------------------
// IoContext - the event loop
// -----------------------------------------------------------------------------

class IoContext
{
#ifndef NDEBUG
    std::thread::id owner_thread_ = std::this_thread::get_id();
#endif

    void AssertOwnerThread() const
    {
#ifndef NDEBUG
        if (std::this_thread::get_id() != owner_thread_)
        {
            std::fputs("[dio] FATAL: IoContext accessed from a thread other than its owner\n", stderr);
            std::terminate();
        }
#endif
    }

public:
    explicit IoContext(const unsigned entries = 256)
    {
        io_uring_params params{};
        params.flags |= IORING_SETUP_COOP_TASKRUN | IORING_SETUP_SINGLE_ISSUER | IORING_SETUP_DEFER_TASKRUN;

        int ret = io_uring_queue_init_params(entries, &ring_, &params);
        if (ret == -EINVAL)
        {
            // Older kernels reject the task-run flags; a plain ring still works.
            alog::info("io_uring task-run flags unsupported, falling back to a default ring");
            params = io_uring_params{};
            ret = io_uring_queue_init_params(entries, &ring_, &params);
        }
        if (ret < 0)
        {
            throw std::system_error(-ret, std::system_category(), "io_uring_queue_init_params");
        }

        ready_.reserve(entries);

        wake_fd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
        if (wake_fd_ < 0)
        {
            const int err = errno;
            io_uring_queue_exit(&ring_);
            throw std::system_error(err, std::system_category(), "eventfd");
        }

        SubmitWakeRead();
        io_uring_submit(&ring_);
    }

    ~IoContext() noexcept
    {
        CancelAllPending();
        if (wake_fd_ >= 0)
        {
            ::close(wake_fd_);
            wake_fd_ = -1;
        }
        io_uring_queue_exit(&ring_);
    }

    IoContext(const IoContext&) = delete;
    IoContext& operator=(const IoContext&) = delete;

    // -------------------------------------------------------------------------
    // Thread-safe signaling
    // -------------------------------------------------------------------------

    /// Wakes the loop from any thread. Returns false if the eventfd write failed.
    bool Notify() const noexcept
    {
        if (wake_fd_ == -1)
        {
            return false;
        }
        constexpr uint64_t val = 1;
        return ::write(wake_fd_, &val, sizeof(val)) == sizeof(val);
    }

    // -------------------------------------------------------------------------
    // Operation tracking
    // -------------------------------------------------------------------------

    void Track(OperationState* op)
    {
        AssertOwnerThread();

        op->tracked = true;
        op->next = pending_head_;
        op->prev = nullptr;
        if (pending_head_ != nullptr)
        {
            pending_head_->prev = op;
        }
        pending_head_ = op;
    }

    void Untrack(OperationState* op)
    {
        AssertOwnerThread();

        if (op->prev != nullptr)
        {
            op->prev->next = op->next;
        }
        else if (pending_head_ == op)
        {
            pending_head_ = op->next;
        }
        if (op->next != nullptr)
        {
            op->next->prev = op->prev;
        }
        op->next = nullptr;
        op->prev = nullptr;
        op->tracked = false;
    }

    [[nodiscard]] bool HasPending() const noexcept { return pending_head_ != nullptr; }

    /**
     * Queues an IORING_OP_ASYNC_CANCEL for one tracked operation. Best
     * effort: the target completes with -ECANCELED if the kernel had not
     * started it, or with its normal (possibly partial) result otherwise.
     * Goes out with the next submission.
     */
    void Cancel(const OperationState* op)
    {
        AssertOwnerThread();

        if (op == nullptr || !op->tracked)
        {
            return;
        }
        EnsureSqes(1);
        io_uring_sqe* sqe = io_uring_get_sqe(&ring_);
        io_uring_prep_cancel(sqe, const_cast<OperationState*>(op), 0);
        io_uring_sqe_set_data(sqe, nullptr);
    }

    /**
     * Cancels every pending operation and drains the completions.
     * Called on destruction. Coroutines are NOT resumed; their handles are dropped.
     */
    void CancelAllPending()
    {
        for (const auto* op = pending_head_; op != nullptr; op = op->next)
        {
            io_uring_sqe* sqe = io_uring_get_sqe(&ring_);
            if (sqe == nullptr)
            {
                io_uring_submit(&ring_);
                sqe = io_uring_get_sqe(&ring_);
                if (sqe == nullptr)
                {
                    break;
                }
            }
            io_uring_prep_cancel(sqe, const_cast<OperationState*>(op), 0);
            io_uring_sqe_set_data(sqe, nullptr);
        }
        io_uring_submit(&ring_);

        DrainWithoutResume();
    }

    // -------------------------------------------------------------------------
    // Event loop
    // -------------------------------------------------------------------------

    template <typename T>
    void RunUntilDone(Task<T>& t)
    {
        AssertOwnerThread();

        running_ = true;
        t.resume();
        while (running_ && !t.Done())
        {
            Step();
        }
    }

    template <typename Tick>
    void Run(Tick&& tick)
    {
        AssertOwnerThread();

        running_ = true;
        while (running_)
        {
            Step();
            tick();
        }
    }

    void Stop() { running_ = false; }

    // -------------------------------------------------------------------------
    // Low-level access
    // -------------------------------------------------------------------------

    io_uring* Ring() { return &ring_; }

    [[nodiscard]] int WakeFd() const { return wake_fd_; }

    void EnsureSqes(const unsigned n)
    {
        AssertOwnerThread();

        if (io_uring_sq_space_left(&ring_) < n)
        {
            io_uring_submit(&ring_);

            if (io_uring_sq_space_left(&ring_) < n)
            {
                throw std::runtime_error("SQ full after submit");
            }
        }
    }

    io_uring_sqe* GetSqe()
    {
        AssertOwnerThread();

        return io_uring_get_sqe(&ring_);
    }

private:
    void DrainWithoutResume()
    {
        while (pending_head_ != nullptr)
        {
            io_uring_cqe* cqe = nullptr;
            int ret = 0;
            do
            {
                ret = io_uring_wait_cqe(&ring_, &cqe);
            } while (ret == -EINTR);

            if (ret < 0)
            {
                break;
            }

            const auto ud = io_uring_cqe_get_data64(cqe);
            if (ud != 0 && ud != detail::kWakeTag)
            {
                auto* op = reinterpret_cast<OperationState*>(static_cast<uintptr_t>(ud));
                Untrack(op);
            }
            io_uring_cqe_seen(&ring_, cqe);
        }
    }

    void SubmitWakeRead()
    {
        auto* sqe = io_uring_get_sqe(&ring_);
        if (sqe == nullptr)
        {
            io_uring_submit(&ring_);
            sqe = io_uring_get_sqe(&ring_);
            if (sqe == nullptr)
            {
                alog::error("no SQE available to re-arm the wake read");
                return;
            }
        }

        io_uring_prep_read(sqe, wake_fd_, &wake_buffer_, sizeof(wake_buffer_), 0);
        io_uring_sqe_set_data64(sqe, detail::kWakeTag);
    }

    void Step()
    {
        int ret = 0;
        do
        {
            ret = io_uring_submit_and_wait(&ring_, 1);
        } while (ret == -EINTR);

        if (ret < 0)
        {
            alog::error("io_uring_submit_and_wait: {}", MakeErrorCode(ret).message());
            return;
        }

        ready_.clear();
        ProcessReadyCompletions();

        // Resume outside CQE iteration (flat, no stack growth)
        for (auto h : ready_)
        {
            if (h && !h.done())
            {
                h.resume();
            }
        }
    }

    unsigned ProcessReadyCompletions()
    {
        io_uring_cqe* cqe = nullptr;
        unsigned head = 0;
        unsigned count = 0;

        io_uring_for_each_cqe(&ring_, head, cqe)
        {
            count++;
            const auto user_data = io_uring_cqe_get_data64(cqe);

            if (user_data == 0)
            {
                continue;
            }

            if (user_data == detail::kWakeTag)
            {
                SubmitWakeRead();
                continue;
            }

            auto* op = reinterpret_cast<OperationState*>(static_cast<uintptr_t>(user_data));
            Untrack(op);
            op->res = cqe->res;
            ready_.push_back(op->handle);
        }

        io_uring_cq_advance(&ring_, count);
        return count;
    }

    io_uring ring_{};
    std::vector<std::coroutine_handle<>> ready_;
    OperationState* pending_head_ = nullptr;
    std::atomic<bool> running_ = false;

    int wake_fd_ = -1;
    uint64_t wake_buffer_ = 0;
};

// -----------------------------------------------------------------------------
// CancelToken - per-operation cancellation
// -----------------------------------------------------------------------------

/**
 * Cancels the async reads and writes it is passed to.
 *
 * Bound to one IoContext and used from its thread. Cancel() submits an
 * async-cancel for every operation currently registered; operations that
 * start after Cancel() complete immediately with ECANCELED and never reach
 * the kernel. The token must outlive the operations that reference it.
 *
 * @code
 *   CancelToken token(ctx);
 *   auto read = AsyncReadAt(ctx, fd, 0, views, 0, &token);
 *   ...
 *   token.Cancel();  // from another coroutine on the same context
 * @endcode
 */
class CancelToken
{
public:
    explicit CancelToken(IoContext& ctx) : ctx_(&ctx) {}

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void Cancel()
    {
        if (cancelled_)
        {
            return;
        }
        cancelled_ = true;
        for (const auto* op : ops_)
        {
            ctx_->Cancel(op);
        }
        if (!ops_.empty())
        {
            alog::debug("cancel requested for {} in-flight operation(s)", ops_.size());
        }
    }

    [[nodiscard]] bool Cancelled() const noexcept { return cancelled_; }

    [[nodiscard]] IoContext& Context() const noexcept { return *ctx_; }

    void Register(OperationState* op) { ops_.push_back(op); }

    void Unregister(const OperationState* op)
    {
        std::erase(ops_, op);
    }

private:
    IoContext* ctx_;
    bool cancelled_ = false;
    std::vector<const OperationState*> ops_;
};

// -----------------------------------------------------------------------------
// Base for operations (explicit object parameter)
// -----------------------------------------------------------------------------

struct UringOp : OperationState
{
protected:
    explicit UringOp(IoContext* c, CancelToken* t = nullptr)
    {
        ctx = c;
        token = t;
    }

    UringOp(UringOp&&) = default;

public:
    // A token cancelled before submission completes the op without
    // touching the ring.
    bool await_ready() noexcept
    {
        if (token != nullptr && token->Cancelled())
        {
            res = -ECANCELED;
            return true;
        }
        return false;
    }

    void await_suspend(this auto& self, std::coroutine_handle<> h)
    {
        self.handle = h;
        auto* op = static_cast<OperationState*>(&self);
        self.ctx->EnsureSqes(1);
        auto* sqe = self.ctx->GetSqe();
        self.PrepareSqe(sqe);
        io_uring_sqe_set_data(sqe, op);
        self.ctx->Track(op);
        if (self.token != nullptr)
        {
            self.token->Register(op);
        }
    }

    // Default: byte count for read/write style ops.
    Result<size_t> await_resume()
    {
        if (token != nullptr)
        {
            token->Unregister(this);
        }
        if (res < 0)
        {
            return std::unexpected(MakeErrorCode(res));
        }
        return static_cast<size_t>(res);
    }
};

}  // namespace dio
