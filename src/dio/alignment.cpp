#include "dio/alignment.hpp"

#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

#include <sys/stat.h>

#include "dio/logger.hpp"

namespace dio
{

size_t PageSize() noexcept
{
    static const size_t page = []
    {
        const long v = ::sysconf(_SC_PAGESIZE);
        return v > 0 ? static_cast<size_t>(v) : size_t{4096};
    }();
    return page;
}

Result<DirectIoAlignment> QueryDirectIoAlignment(const int fd)
{
    const DirectIoAlignment fallback{PageSize(), PageSize()};

#ifdef STATX_DIOALIGN
    struct statx stx{};
    if (::statx(fd, "", AT_EMPTY_PATH, STATX_DIOALIGN, &stx) < 0)
    {
        if (errno == ENOSYS)
        {
            return fallback;
        }
        return ErrorFromErrno(errno);
    }

    // Zero means the file does not support direct I/O or the filesystem does
    // not report it.
    if ((stx.stx_mask & STATX_DIOALIGN) == 0 || stx.stx_dio_mem_align == 0 || stx.stx_dio_offset_align == 0)
    {
        alog::debug("fd {}: no STATX_DIOALIGN info, using page size {}", fd, fallback.memory);
        return fallback;
    }

    return DirectIoAlignment{stx.stx_dio_mem_align, stx.stx_dio_offset_align};
#else
    struct stat st{};
    if (::fstat(fd, &st) < 0)
    {
        return ErrorFromErrno(errno);
    }
    return fallback;
#endif
}

}  // namespace dio
