#pragma once

#include <string>
#include "core/errors/octavius_errors.hpp"
#include "protocol/job_metadata.hpp"

namespace octavius::registry {

// Deterministic JSON form of a Metadata record, as stored in the key-value store.
std::string encode_metadata(const protocol::Metadata& metadata);

// Fails with Internal/decode_failed on anything that is not a well-formed record.
core::errors::Result<protocol::Metadata> decode_metadata(const std::string& bytes);

}  // namespace octavius::registry
