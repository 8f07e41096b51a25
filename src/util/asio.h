#pragma once

// Copyright 2015 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

// ASIO does platform-support feature autoconfig and if it's building on
// libstdc++ this will only work if _some_ standard library component is
// included before its autoconfig machinery, so that <bits/c++config.h> gets
// pulled in and defines a bunch of _GLIBCXX_HAVE_FOO macros. We include
// system_error here as the most trivial such component
#include <system_error>

// We use the standalone (non-boost) asio in header-only mode; the UDP sockets
// of the QUIC transport, the gateway acceptor and the clock's event loop all
// live in the same io_context.
#ifndef ASIO_STANDALONE
#define ASIO_STANDALONE
#endif

#ifndef ASIO_NO_DEPRECATED
#define ASIO_NO_DEPRECATED
#endif

#include <asio.hpp>
