#pragma once

/**
 * dio.hpp - Unbuffered (O_DIRECT) positional scatter/gather I/O
 *
 * Design:
 *   - Blocking façade over preadv/pwritev, suspending façade over io_uring
 *     READV/WRITEV; both share validation, batching and the loop state machine
 *   - Caller owns buffers; AlignedBuffer hands out direction-tagged views
 *   - A short transfer is a result, not an error: loops stop at the first one
 *   - Errors keep the native errno; compare against ErrorKind to classify
 *
 * Safety:
 *   Async operations live in coroutine frames and are tracked by the
 *   IoContext. Destroying a Task suspended on I/O terminates the process.
 *   Cancel through a CancelToken and let the Task finish instead.
 */

#include "dio/aligned_buffer.hpp"
#include "dio/alignment.hpp"
#include "dio/buffer_view.hpp"
#include "dio/completion_loop.hpp"
#include "dio/io_context.hpp"
#include "dio/logger.hpp"
#include "dio/positional_io.hpp"
#include "dio/result.hpp"
#include "dio/task.hpp"
#include "dio/transfer.hpp"
