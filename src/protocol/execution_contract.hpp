#pragma once

#include <map>
#include <string>

namespace octavius::protocol {

using JobArguments = std::map<std::string, std::string>;

struct ExecutionRequest {
    std::string job_name;
    JobArguments arguments;
};

// What the coordinator hands to the executor for a single dispatch.
struct ExecutionOrder {
    std::string execution_id;
    std::string job_name;
    std::string image_name;
    JobArguments arguments;
};

struct ExecutionResponse {
    std::string status;  // Executor's terminal status, verbatim
};

}  // namespace octavius::protocol
