#pragma once

#include <string>
#include "core/context/call_context.hpp"
#include "core/errors/octavius_errors.hpp"
#include "protocol/execution_contract.hpp"

namespace octavius::execution {

// Runs a job's image with its arguments and reports a terminal status.
// Implementations must honour the context's cancel token and deadline.
class Executor {
public:
    virtual ~Executor() = default;

    virtual core::errors::Result<std::string> run(
        const core::context::CallContext& ctx,
        const protocol::ExecutionOrder& order) = 0;
};

}  // namespace octavius::execution
