#include "rpc/loopback_transport.hpp"

#include <utility>

namespace octavius::rpc {

LoopbackTransport::LoopbackTransport(std::shared_ptr<const JobService> service)
    : service_(std::move(service)) {}

core::errors::Result<std::string> LoopbackTransport::round_trip(
    const core::context::CallContext& ctx, const std::string& request_frame) {
    const auto live = ctx.check("rpc round trip");
    if (core::errors::is_error(live)) {
        return core::errors::get_error(live);
    }
    return service_->handle(ctx, request_frame);
}

}  // namespace octavius::rpc
