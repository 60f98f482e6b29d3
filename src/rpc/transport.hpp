#pragma once

#include <string>
#include "core/context/call_context.hpp"
#include "core/errors/octavius_errors.hpp"

namespace octavius::rpc {

// Carries one request frame to the service and returns its response frame.
// A call either returns a frame or an error; transports never retry.
class Transport {
public:
    virtual ~Transport() = default;

    virtual core::errors::Result<std::string> round_trip(
        const core::context::CallContext& ctx, const std::string& request_frame) = 0;
};

}  // namespace octavius::rpc
