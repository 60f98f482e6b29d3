#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/octavius_errors.hpp"
#include "protocol/execution_contract.hpp"
#include "protocol/job_metadata.hpp"

namespace octavius::rpc {

// Method names on the wire.
inline constexpr const char* kSaveMetadata = "SaveMetadata";
inline constexpr const char* kGetMetadata = "GetMetadata";
inline constexpr const char* kGetAvailableJobs = "GetAvailableJobs";
inline constexpr const char* kExecuteJob = "ExecuteJob";

struct RpcRequest {
    std::string method;
    nlohmann::json payload = nlohmann::json::object();
};

// Request frame: {"method": ..., "payload": {...}}
std::string encode_request(const RpcRequest& request);
core::errors::Result<RpcRequest> decode_request(const std::string& frame);

// Response frame: {"code": "OK", "payload": {...}} on success, otherwise
// {"code": <status code>, "message": ..., "error_code": ..., "hint": ...}.
std::string encode_response(const core::errors::Result<nlohmann::json>& outcome);

// Maps the wire status code back to an error category.
core::errors::Result<nlohmann::json> decode_response(const std::string& frame);

nlohmann::json metadata_to_json(const protocol::Metadata& metadata);
core::errors::Result<protocol::Metadata> metadata_from_json(const nlohmann::json& payload);

nlohmann::json arguments_to_json(const protocol::JobArguments& arguments);
core::errors::Result<protocol::JobArguments> arguments_from_json(
    const nlohmann::json& payload);

}  // namespace octavius::rpc
