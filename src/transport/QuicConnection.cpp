// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transport/QuicConnection.h"

namespace tpuproxy
{

char const*
toString(StreamResult r)
{
    switch (r)
    {
    case StreamResult::Success:
        return "success";
    case StreamResult::OpenRefused:
        return "open-refused";
    case StreamResult::WriteFailed:
        return "write-failed";
    case StreamResult::TimedOut:
        return "timed-out";
    case StreamResult::ConnectionClosed:
        return "connection-closed";
    }
    return "unknown";
}
}
