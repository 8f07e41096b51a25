#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "proxy/Destination.h"
#include "util/Timer.h"
#include "util/types.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace tpuproxy
{

// How a forwarding outcome is handled by the RetryCoordinator.
enum class Classification
{
    Success,
    TransientRetryable,
    TransientFatalToConnection,
    Permanent,
    CapacityExhausted
};

enum class DropReason
{
    PayloadTooLarge,
    UnknownDestination,
    RetriesExhausted,
    QueueOverflow,
    DestinationSaturated,
    ShuttingDown
};

// Synchronous answer of InboundGateway::submit.
enum class SubmitResult
{
    Accepted,
    RejectedPayloadTooLarge,
    RejectedEmptyPayload,
    RejectedUnknownDestination,
    RejectedShuttingDown
};

// Queued -> Admitted -> Forwarding -> {Succeeded | Retrying -> Admitted |
// Dropped}
enum class RequestState
{
    Queued,
    Admitted,
    Forwarding,
    Retrying,
    Succeeded,
    Dropped
};

// Result of one StreamForwarder::forward call.
enum class ForwardResult
{
    Sent,
    PayloadTooLarge,
    OpenRefused,
    TimedOut,
    WriteFailed,
    ConnectionClosed
};

char const* toString(Classification c);
char const* toString(DropReason r);
char const* toString(SubmitResult r);
char const* toString(RequestState s);
char const* toString(ForwardResult r);

Classification classify(ForwardResult r);
Classification classify(SubmitResult r);

bool isTerminal(RequestState s);

// The one notification a request produces: state is Succeeded or Dropped,
// and a Dropped outcome always carries a reason.
struct ForwardOutcome
{
    uint64_t mRequestID{0};
    DestinationIndex mDestination{0};
    RequestState mState{RequestState::Dropped};
    std::optional<DropReason> mReason;
    uint32_t mAttempts{0};
};

typedef std::function<void(ForwardOutcome const&)> OutcomeCallback;

struct ForwardRequest
{
    typedef std::shared_ptr<ForwardRequest> pointer;

    uint64_t const mID;
    Blob const mPayload;
    DestinationIndex const mDestination;
    VirtualClock::time_point mEnqueuedAt;
    uint32_t mAttempts{0};
    RequestState mState{RequestState::Queued};
    OutcomeCallback mOnOutcome;

    ForwardRequest(uint64_t id, Blob payload, DestinationIndex destination,
                   OutcomeCallback onOutcome);
};
}
