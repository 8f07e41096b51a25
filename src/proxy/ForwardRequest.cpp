// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "proxy/ForwardRequest.h"

namespace tpuproxy
{

ForwardRequest::ForwardRequest(uint64_t id, Blob payload,
                               DestinationIndex destination,
                               OutcomeCallback onOutcome)
    : mID(id)
    , mPayload(std::move(payload))
    , mDestination(destination)
    , mOnOutcome(std::move(onOutcome))
{
}

char const*
toString(Classification c)
{
    switch (c)
    {
    case Classification::Success:
        return "success";
    case Classification::TransientRetryable:
        return "transient-retryable";
    case Classification::TransientFatalToConnection:
        return "transient-fatal-to-connection";
    case Classification::Permanent:
        return "permanent";
    case Classification::CapacityExhausted:
        return "capacity-exhausted";
    }
    return "unknown-classification";
}

char const*
toString(DropReason r)
{
    switch (r)
    {
    case DropReason::PayloadTooLarge:
        return "payload-too-large";
    case DropReason::UnknownDestination:
        return "unknown-destination";
    case DropReason::RetriesExhausted:
        return "retries-exhausted";
    case DropReason::QueueOverflow:
        return "queue-overflow";
    case DropReason::DestinationSaturated:
        return "destination-saturated";
    case DropReason::ShuttingDown:
        return "shutting-down";
    }
    return "unknown-drop-reason";
}

char const*
toString(SubmitResult r)
{
    switch (r)
    {
    case SubmitResult::Accepted:
        return "accepted";
    case SubmitResult::RejectedPayloadTooLarge:
        return "rejected-payload-too-large";
    case SubmitResult::RejectedEmptyPayload:
        return "rejected-empty-payload";
    case SubmitResult::RejectedUnknownDestination:
        return "rejected-unknown-destination";
    case SubmitResult::RejectedShuttingDown:
        return "rejected-shutting-down";
    }
    return "unknown-submit-result";
}

char const*
toString(RequestState s)
{
    switch (s)
    {
    case RequestState::Queued:
        return "queued";
    case RequestState::Admitted:
        return "admitted";
    case RequestState::Forwarding:
        return "forwarding";
    case RequestState::Retrying:
        return "retrying";
    case RequestState::Succeeded:
        return "succeeded";
    case RequestState::Dropped:
        return "dropped";
    }
    return "unknown-state";
}

char const*
toString(ForwardResult r)
{
    switch (r)
    {
    case ForwardResult::Sent:
        return "sent";
    case ForwardResult::PayloadTooLarge:
        return "payload-too-large";
    case ForwardResult::OpenRefused:
        return "open-refused";
    case ForwardResult::TimedOut:
        return "timed-out";
    case ForwardResult::WriteFailed:
        return "write-failed";
    case ForwardResult::ConnectionClosed:
        return "connection-closed";
    }
    return "unknown-forward-result";
}

Classification
classify(ForwardResult r)
{
    switch (r)
    {
    case ForwardResult::Sent:
        return Classification::Success;
    case ForwardResult::OpenRefused:
    case ForwardResult::TimedOut:
        return Classification::TransientRetryable;
    case ForwardResult::WriteFailed:
    case ForwardResult::ConnectionClosed:
        return Classification::TransientFatalToConnection;
    case ForwardResult::PayloadTooLarge:
        return Classification::Permanent;
    }
    return Classification::Permanent;
}

Classification
classify(SubmitResult r)
{
    switch (r)
    {
    case SubmitResult::Accepted:
        return Classification::Success;
    case SubmitResult::RejectedShuttingDown:
        return Classification::CapacityExhausted;
    case SubmitResult::RejectedPayloadTooLarge:
    case SubmitResult::RejectedEmptyPayload:
    case SubmitResult::RejectedUnknownDestination:
        return Classification::Permanent;
    }
    return Classification::Permanent;
}

bool
isTerminal(RequestState s)
{
    return s == RequestState::Succeeded || s == RequestState::Dropped;
}
}
