#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/octavius_errors.hpp"
#include "protocol/execution_contract.hpp"
#include "protocol/job_metadata.hpp"

namespace octavius::app::cli {

    enum class CommandKind {
        Create,
        List,
        Describe,
        Execute
    };

    // Validated command line
    struct CliCommand {
        CommandKind kind = CommandKind::List;
        std::optional<std::filesystem::path> config_path;
        std::string job_name;                 // describe, execute
        protocol::JobArguments arguments;     // execute
        std::filesystem::path job_path;       // create
    };

    octavius::core::errors::Result<CliCommand> parse_and_validate(int argc, char* argv[]);

    // Splits each "key=value" token once on the first '='. Later duplicates win.
    octavius::core::errors::Result<protocol::JobArguments> parse_job_arguments(
        const std::vector<std::string>& tokens);

    // Reads the JSON job file given to `create --job-path`.
    octavius::core::errors::Result<protocol::Metadata> read_job_file(
        const std::filesystem::path& path);
}
