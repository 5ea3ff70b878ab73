/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

// Every asynchronous operation in tether is written once and compiled two ways.
// With TETHER_BUILD_COROUTINE the operations are libcoro tasks awaited on an
// io_scheduler, otherwise they are plain blocking calls made from the caller's thread.

#ifdef TETHER_BUILD_COROUTINE
#include <coro/coro.hpp>

#define CORO_TASK(x) coro::task<x>
#define CO_RETURN co_return
#define CO_AWAIT co_await
#define SYNC_WAIT(x) coro::sync_wait(x)
#else
#define CORO_TASK(x) x
#define CO_RETURN return
#define CO_AWAIT
#define SYNC_WAIT(x) x
#endif
