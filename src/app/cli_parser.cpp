#include "cli_parser.hpp"
#include <cstddef>
#include <fstream>
#include <sstream>
#include <system_error>
#include <nlohmann/json.hpp>
#include "policy/job_policy.hpp"
#include "rpc/rpc_codec.hpp"

namespace octavius::app::cli {

    using namespace octavius::core::errors;

    namespace {
        const char* kUsage =
            "Usage: octavius [--config <file>] <create --job-path <file> | list | "
            "describe <job-name> | execute <job-name> [key=value ...]>";
    }

    Result<protocol::JobArguments> parse_job_arguments(const std::vector<std::string>& tokens) {
        const policy::JobPolicy policy;
        protocol::JobArguments arguments;
        for (const auto& token : tokens) {
            const auto split = token.find('=');
            if (split == std::string::npos) {
                return OctaviusError{ErrorCategory::Input, "Malformed argument: " + token,
                                     "malformed_argument", "Arguments must look like key=value."};
            }
            std::string key = token.substr(0, split);
            const auto valid_key = policy.validate_argument_key(key);
            if (is_error(valid_key)) {
                return OctaviusError{ErrorCategory::Input, "Malformed argument: " + token,
                                     "malformed_argument", "Arguments must look like key=value."};
            }
            arguments[std::move(key)] = token.substr(split + 1);
        }
        return arguments;
    }

    Result<protocol::Metadata> read_job_file(const std::filesystem::path& path) {
        std::ifstream in(path);
        if (!in.is_open()) {
            return OctaviusError{ErrorCategory::Input, "Unable to open job file: " + path.string(),
                                 "invalid_path"};
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();

        const auto doc = nlohmann::json::parse(buffer.str(), nullptr, false);
        if (doc.is_discarded()) {
            return OctaviusError{ErrorCategory::Input, "Job file is not valid JSON: " + path.string(),
                                 "invalid_job_file"};
        }
        auto metadata = rpc::metadata_from_json(doc);
        if (is_error(metadata)) {
            return OctaviusError{ErrorCategory::Input,
                                 path.string() + ": " + get_error(metadata).message,
                                 "invalid_job_file"};
        }
        if (get_value(metadata).name.empty()) {
            return OctaviusError{ErrorCategory::Input, "Job file has no name: " + path.string(),
                                 "invalid_job_file", "Add a \"name\" field to the job file."};
        }
        return metadata;
    }

    Result<CliCommand> parse_and_validate(int argc, char* argv[]) {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) { // Skip program name
            args.push_back(argv[i]);
        }

        CliCommand cmd;

        // 1. Global options come before the command
        std::size_t pos = 0;
        while (pos < args.size() && args[pos].rfind("--", 0) == 0) {
            if (args[pos] == "--config") {
                if (pos + 1 >= args.size()) {
                    return OctaviusError{ErrorCategory::Input, "Missing value for --config", "missing_value"};
                }
                cmd.config_path = std::filesystem::path(args[pos + 1]);
                pos += 2;
            } else {
                return OctaviusError{ErrorCategory::Input, "Unknown argument: " + args[pos], "unknown_argument", kUsage};
            }
        }

        if (pos >= args.size()) {
            return OctaviusError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        const std::string command = args[pos++];
        std::vector<std::string> rest(args.begin() + static_cast<std::ptrdiff_t>(pos), args.end());

        // 2. Per-command validation
        const policy::JobPolicy policy;
        if (command == "execute" || command == "describe") {
            if (rest.empty()) {
                return OctaviusError{ErrorCategory::Input, "Missing job name for " + command,
                                     "missing_job_name", kUsage};
            }
            const auto valid_name = policy.validate_job_name(rest.front());
            if (is_error(valid_name)) {
                return get_error(valid_name);
            }
            cmd.job_name = rest.front();

            if (command == "describe") {
                if (rest.size() > 1) {
                    return OctaviusError{ErrorCategory::Input, "Unexpected argument: " + rest[1], "unknown_argument", kUsage};
                }
                cmd.kind = CommandKind::Describe;
                return cmd;
            }

            auto arguments = parse_job_arguments(std::vector<std::string>(rest.begin() + 1, rest.end()));
            if (is_error(arguments)) {
                return get_error(arguments);
            }
            cmd.kind = CommandKind::Execute;
            cmd.arguments = get_value(arguments);
            return cmd;
        }

        if (command == "list") {
            if (!rest.empty()) {
                return OctaviusError{ErrorCategory::Input, "Unexpected argument: " + rest.front(), "unknown_argument", kUsage};
            }
            cmd.kind = CommandKind::List;
            return cmd;
        }

        if (command == "create") {
            std::optional<std::string> job_path;
            for (std::size_t i = 0; i < rest.size(); ++i) {
                if (rest[i] == "--job-path") {
                    if (i + 1 < rest.size()) job_path = rest[++i];
                    else return OctaviusError{ErrorCategory::Input, "Missing value for --job-path", "missing_value"};
                } else {
                    return OctaviusError{ErrorCategory::Input, "Unknown argument: " + rest[i], "unknown_argument", kUsage};
                }
            }
            if (!job_path.has_value()) {
                return OctaviusError{ErrorCategory::Input, "Must provide --job-path", "missing_required_flag", kUsage};
            }
            cmd.kind = CommandKind::Create;
            cmd.job_path = std::filesystem::path(job_path.value());
            return cmd;
        }

        return OctaviusError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", kUsage};
    }

} // namespace octavius::app::cli
