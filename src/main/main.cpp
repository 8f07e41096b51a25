// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/CryptoError.h"
#include "main/CommandLine.h"
#include "util/Logging.h"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <new>
#include <sodium/core.h>
#include <stdexcept>
#include <system_error>
#include <typeinfo>

namespace tpuproxy
{
// Reports the in-flight exception, if any, before the process dies.
static void
printCurrentException()
{
    auto eptr = std::current_exception();
    if (!eptr)
    {
        return;
    }
    try
    {
        std::rethrow_exception(eptr);
    }
    catch (CryptoError const& e)
    {
        fprintf(stderr, "current exception: CryptoError(\"%s\")\n", e.what());
    }
    catch (std::system_error const& e)
    {
        fprintf(stderr,
                "current exception: std::system_error(%d, \"%s\", \"%s\")\n",
                e.code().value(), e.code().message().c_str(), e.what());
    }
    catch (std::exception const& e)
    {
        fprintf(stderr, "current exception: %s(\"%s\")\n", typeid(e).name(),
                e.what());
    }
    catch (...)
    {
        fprintf(stderr, "current exception: unknown\n");
    }
    fflush(stderr);
}

static void
printExceptionAndAbort()
{
    printCurrentException();
    std::abort();
}

static void
outOfMemory()
{
    std::fprintf(stderr, "Unable to allocate memory\n");
    std::fflush(stderr);
    printExceptionAndAbort();
}
}

int
main(int argc, char* const* argv)
{
    using namespace tpuproxy;

    // Abort when out of memory
    std::set_new_handler(outOfMemory);
    // At least print the pending exception in any circumstance that would
    // call std::terminate
    std::set_terminate(printExceptionAndAbort);
    Logging::init();
    if (sodium_init() != 0)
    {
        CLOG_FATAL(Main, "Could not initialize crypto");
        return 1;
    }

    return handleCommandLine(argc, argv);
}
