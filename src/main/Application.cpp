// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/Application.h"
#include "main/ApplicationImpl.h"
#include "transport/QuicConnector.h"

namespace tpuproxy
{

Application::pointer
Application::create(VirtualClock& clock, Config const& cfg,
                    std::unique_ptr<QuicConnector> connector)
{
    cfg.validate();
    auto ret =
        std::make_shared<ApplicationImpl>(clock, cfg, std::move(connector));
    ret->initialize();
    return ret;
}
}
