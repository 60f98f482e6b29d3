#pragma once

#include <memory>
#include "rpc/job_service.hpp"
#include "rpc/transport.hpp"

namespace octavius::rpc {

// Delivers frames to a JobService hosted in the same process.
class LoopbackTransport : public Transport {
public:
    explicit LoopbackTransport(std::shared_ptr<const JobService> service);

    core::errors::Result<std::string> round_trip(
        const core::context::CallContext& ctx, const std::string& request_frame) override;

private:
    std::shared_ptr<const JobService> service_;
};

}  // namespace octavius::rpc
