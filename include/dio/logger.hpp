#pragma once
////////////////////////////////////////////////////////////////////////////////
// dio::alog - asynchronous, lock-free logger
//
// Producers format into a fixed-size record and push it onto a per-thread
// SPSC ring. A background thread, woken through an eventfd, drains every ring
// to the output fd. Producers never block; when a ring is full the record is
// dropped and counted. Slots are handed out per thread and never returned:
// once kMaxThreads threads have logged, records from any further thread are
// dropped and counted too.
//
//     dio::alog::start();                    // stderr by default
//     dio::alog::g_level = dio::alog::Level::Debug;
//     dio::alog::debug("short read at offset {}", off);
//     dio::alog::stop();                     // flushes
//
// Levels below DIO_LOG_BUILD_LEVEL are compiled out.
////////////////////////////////////////////////////////////////////////////////

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <format>
#include <source_location>
#include <system_error>
#include <thread>
#include <type_traits>

#include <fcntl.h>
#include <unistd.h>

#include <sys/eventfd.h>
#include <sys/syscall.h>

#ifndef DIO_LOG_BUILD_LEVEL
#define DIO_LOG_BUILD_LEVEL 0
#endif

namespace dio::alog
{

enum class Level : uint8_t
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Fatal = 4,
    Disabled = 5
};

inline std::atomic<Level> g_level{Level::Info};
inline std::atomic<bool> g_colors{true};

constexpr Level kBuildMinLevel = static_cast<Level>(DIO_LOG_BUILD_LEVEL);

constexpr size_t kMaxThreads = 64;   // max producer threads
constexpr size_t kQueueSize = 1024;  // records per thread (power of 2)
constexpr size_t kMsgMax = 512;      // bytes per record, '\n' included

namespace detail
{

struct LevelStyle
{
    const char* label;
    const char* color;
};

constexpr LevelStyle kStyles[] = {
    {"DBG", "\033[36m"},
    {"INF", "\033[32m"},
    {"WRN", "\033[33m"},
    {"ERR", "\033[31m"},
    {"FTL", "\033[35m"},
};
constexpr const char* kReset = "\033[0m";

inline const char* Basename(const char* path)
{
    const char* slash = std::strrchr(path, '/');
    return slash != nullptr ? slash + 1 : path;
}

inline uint32_t ThreadId()
{
    static thread_local const auto tid = static_cast<uint32_t>(::syscall(SYS_gettid));
    return tid;
}

struct Record
{
    uint16_t len;
    uint8_t level;
    uint8_t reserved;
    char msg[kMsgMax];
};

class RecordRing
{
    static constexpr size_t kMask = kQueueSize - 1;
    static_assert((kQueueSize & kMask) == 0, "kQueueSize must be a power of 2");

public:
    bool TryPush(const Record& r) noexcept
    {
        const uint32_t h = head_.load(std::memory_order_relaxed);
        const uint32_t t = tail_.load(std::memory_order_acquire);
        if (h - t == kQueueSize)
        {
            return false;
        }
        slots_[h & kMask] = r;
        head_.store(h + 1, std::memory_order_release);
        return true;
    }

    bool TryPop(Record& out) noexcept
    {
        const uint32_t t = tail_.load(std::memory_order_relaxed);
        const uint32_t h = head_.load(std::memory_order_acquire);
        if (t == h)
        {
            return false;
        }
        out = slots_[t & kMask];
        tail_.store(t + 1, std::memory_order_release);
        return true;
    }

private:
    std::atomic<uint32_t> head_{0};  // producer
    std::atomic<uint32_t> tail_{0};  // consumer
    Record slots_[kQueueSize];
};

struct ProducerSlot
{
    std::atomic<bool> active{false};
    RecordRing ring;
};

inline ProducerSlot g_slots[kMaxThreads];
inline std::atomic<uint32_t> g_next_slot{0};

// Created by the first start() and never closed: a producer may still hold
// the number after stop(), and it must not land on a reused descriptor.
inline std::atomic<int> g_wake_fd{-1};
inline std::atomic<bool> g_running{false};
inline std::jthread g_writer;
inline std::atomic<uint64_t> g_dropped{0};

constexpr uint32_t kNoSlot = UINT32_MAX;

inline uint32_t RegisterThread()
{
    static thread_local uint32_t slot = kNoSlot;
    if (slot != kNoSlot)
    {
        return slot;
    }

    const uint32_t i = g_next_slot.fetch_add(1, std::memory_order_relaxed);
    if (i >= kMaxThreads)
    {
        return kNoSlot;
    }
    g_slots[i].active.store(true, std::memory_order_release);
    slot = i;
    return slot;
}

inline void WakeWriter() noexcept
{
    const int fd = g_wake_fd.load(std::memory_order_acquire);
    if (fd < 0)
    {
        return;
    }
    constexpr uint64_t one = 1;
    // EAGAIN only means a wake is already pending.
    (void)::write(fd, &one, sizeof(one));
}

inline void DrainTo(const int out_fd)
{
    Record r{};
    for (auto& slot : g_slots)
    {
        if (!slot.active.load(std::memory_order_acquire))
        {
            continue;
        }
        while (slot.ring.TryPop(r))
        {
            (void)::write(out_fd, r.msg, r.len);
        }
    }
}

inline void WriterLoop(const int out_fd)
{
    const int wake_fd = g_wake_fd.load(std::memory_order_acquire);
    while (g_running.load(std::memory_order_acquire))
    {
        uint64_t n = 0;
        if (::read(wake_fd, &n, sizeof(n)) < 0 && errno == EINTR)
        {
            continue;
        }
        DrainTo(out_fd);
    }
    DrainTo(out_fd);
}

template <typename... Args>
void FormatRecord(Record& r, const Level lvl, const std::source_location loc, std::format_string<Args...> fmt,
                  Args&&... args) noexcept
{
    r.level = static_cast<uint8_t>(lvl);

    const bool colors = g_colors.load(std::memory_order_relaxed);
    const auto& style = kStyles[static_cast<int>(lvl)];
    const auto ms = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());

    char* p = r.msg;
    char* const end = r.msg + kMsgMax - 2;  // room for '\n'

    auto res = std::format_to_n(p, end - p, "{}[{}] [{:%T}] [{}] {}:{} | ", colors ? style.color : "", style.label, ms,
                                ThreadId(), Basename(loc.file_name()), loc.line());
    p = res.out;

    if (p < end)
    {
        res = std::format_to_n(p, end - p, fmt, std::forward<Args>(args)...);
        p = res.out;
    }

    if (colors && p < end)
    {
        res = std::format_to_n(p, end - p, "{}", kReset);
        p = res.out;
    }

    if (p > end)
    {
        p = end;
    }
    *p++ = '\n';
    r.len = static_cast<uint16_t>(p - r.msg);
}

}  // namespace detail

// ---- lifecycle ----

/// Starts the writer thread. Call once at process startup.
inline void start(const int out_fd = STDERR_FILENO)
{
    bool expected = false;
    if (!detail::g_running.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
    {
        return;
    }

    if (detail::g_wake_fd.load(std::memory_order_acquire) < 0)
    {
        // Blocking: the writer thread sleeps in read() until a producer wakes it.
        const int fd = ::eventfd(0, EFD_CLOEXEC);
        if (fd < 0)
        {
            detail::g_running.store(false, std::memory_order_release);
            throw std::system_error(errno, std::system_category(), "eventfd");
        }
        detail::g_wake_fd.store(fd, std::memory_order_release);
    }
    detail::g_writer = std::jthread([out_fd] { detail::WriterLoop(out_fd); });
}

/// Stops the writer thread after a final drain.
inline void stop()
{
    if (!detail::g_running.exchange(false, std::memory_order_acq_rel))
    {
        return;
    }
    detail::WakeWriter();
    if (detail::g_writer.joinable())
    {
        detail::g_writer.join();
    }
}

inline uint64_t dropped_count()
{
    return detail::g_dropped.load(std::memory_order_relaxed);
}

// ---- logging API ----

template <Level L, typename... Args>
void log(const std::source_location loc, std::format_string<Args...> fmt, Args&&... args)
{
    if constexpr (kBuildMinLevel <= L)
    {
        if (g_level.load(std::memory_order_relaxed) > L)
        {
            return;
        }

        const uint32_t slot = detail::RegisterThread();
        if (slot == detail::kNoSlot)
        {
            detail::g_dropped.fetch_add(1, std::memory_order_relaxed);
            return;
        }

        detail::Record r{};
        detail::FormatRecord(r, L, loc, fmt, std::forward<Args>(args)...);

        if (!detail::g_slots[slot].ring.TryPush(r))
        {
            detail::g_dropped.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        detail::WakeWriter();
    }
}

// The format string is wrapped so that std::source_location::current() can
// default-initialize at the call site despite the trailing parameter pack.
template <typename... Args>
struct FormatWithLocation
{
    std::format_string<Args...> fmt;
    std::source_location loc;

    template <typename S>
    consteval FormatWithLocation(const S& s, std::source_location l = std::source_location::current())
        : fmt(s), loc(l)
    {
    }
};

template <typename... Args>
void debug(FormatWithLocation<std::type_identity_t<Args>...> f, Args&&... a)
{
    log<Level::Debug>(f.loc, f.fmt, std::forward<Args>(a)...);
}
template <typename... Args>
void info(FormatWithLocation<std::type_identity_t<Args>...> f, Args&&... a)
{
    log<Level::Info>(f.loc, f.fmt, std::forward<Args>(a)...);
}
template <typename... Args>
void warn(FormatWithLocation<std::type_identity_t<Args>...> f, Args&&... a)
{
    log<Level::Warn>(f.loc, f.fmt, std::forward<Args>(a)...);
}
template <typename... Args>
void error(FormatWithLocation<std::type_identity_t<Args>...> f, Args&&... a)
{
    log<Level::Error>(f.loc, f.fmt, std::forward<Args>(a)...);
}
template <typename... Args>
void fatal(FormatWithLocation<std::type_identity_t<Args>...> f, Args&&... a)
{
    log<Level::Fatal>(f.loc, f.fmt, std::forward<Args>(a)...);
}

}  // namespace dio::alog
