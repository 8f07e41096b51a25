// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/ProxyVersion.h"

#ifndef TPUPROXY_VERSION
#define TPUPROXY_VERSION "unknown"
#endif

namespace tpuproxy
{
const std::string TPU_FORWARD_PROXY_VERSION = TPUPROXY_VERSION;
}
