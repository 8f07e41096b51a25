#pragma once

// Copyright 2018 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/Application.h"

namespace tpuproxy
{

// Starts the application and cranks its clock until the main io_context is
// stopped (after a graceful stop triggered by SIGINT or SIGTERM).
int runApp(Application::pointer app);
}
