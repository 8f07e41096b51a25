// Copyright 2018 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/ApplicationUtils.h"
#include "util/Logging.h"
#include "util/Timer.h"
#include "util/asio.h"

namespace tpuproxy
{

int
runApp(Application::pointer app)
{
    try
    {
        app->start();
    }
    catch (std::exception const& e)
    {
        CLOG_FATAL(Main, "Got an exception: {}", e.what());
        return 1;
    }

    auto& io = app->getClock().getIOContext();
    auto mainWork = asio::make_work_guard(io);
    while (!io.stopped())
    {
        app->getClock().crank();
    }
    CLOG_INFO(Main, "Main loop exited");
    return 0;
}
}
