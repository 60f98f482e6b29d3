#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include "app/cli_parser.hpp"
#include "core/config/id_generator.hpp"
#include "core/config/settings.hpp"
#include "core/context/call_context.hpp"
#include "core/errors/octavius_errors.hpp"
#include "core/logging/logger.hpp"
#include "execution/container_executor.hpp"
#include "execution/execution_coordinator.hpp"
#include "registry/job_registry.hpp"
#include "rpc/job_client.hpp"
#include "rpc/job_service.hpp"
#include "rpc/loopback_transport.hpp"
#include "rpc/rpc_codec.hpp"
#include "store/file_store.hpp"

namespace {

using octavius::core::errors::OctaviusError;

int report(const OctaviusError& err, const std::string& what) {
    LOG_ERROR(what + " [" + octavius::core::errors::to_string(err.category) + "/" +
              err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
    return err.category == octavius::core::errors::ErrorCategory::Input ? 2 : 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    namespace errors = octavius::core::errors;
    auto& logger = octavius::core::logging::Logger::get();

    // 1. Tag every log line of this invocation
    logger.set_context(octavius::core::config::generate_request_id());

    // 2. Parse CLI input and return normalized input errors
    auto parsed = octavius::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        return report(errors::get_error(parsed), "Input error");
    }
    const auto& cmd = errors::get_value(parsed);

    // 3. Load configuration and initialise logging once
    octavius::core::config::Settings settings;
    if (cmd.config_path.has_value()) {
        auto loaded = octavius::core::config::load_settings(cmd.config_path.value());
        if (errors::is_error(loaded)) {
            return report(errors::get_error(loaded), "Configuration error");
        }
        settings = errors::get_value(loaded);
    }
    logger.init(settings.log_level, std::clog);
    LOG_DEBUG("Store: " + settings.store_path.string() + ", registration mode: " +
              octavius::registry::to_string(settings.registration_mode));

    // 4. Wire the registry, coordinator and RPC surface
    auto store = std::make_shared<octavius::store::FileKeyValueStore>(settings.store_path);
    auto registry = std::make_shared<octavius::registry::JobRegistry>(
        store, settings.registration_mode, logger);

    octavius::execution::ContainerExecutorOptions executor_options;
    executor_options.runtime_binary = settings.container_runtime;
    executor_options.timeout_ms = settings.execution_timeout_ms;
    auto executor = std::make_shared<octavius::execution::ContainerExecutor>(
        executor_options, logger);
    auto coordinator = std::make_shared<octavius::execution::ExecutionCoordinator>(
        registry, executor, logger);

    auto service = std::make_shared<octavius::rpc::JobService>(registry, coordinator, logger);
    auto transport = std::make_shared<octavius::rpc::LoopbackTransport>(service);
    const octavius::rpc::JobClient client(transport);

    const auto ctx = settings.call_deadline_ms > 0
                         ? octavius::core::context::CallContext::with_timeout(
                               std::chrono::milliseconds(settings.call_deadline_ms))
                         : octavius::core::context::CallContext::background();

    // 5. Run the command; only success reaches stdout
    int exit_code = 0;
    switch (cmd.kind) {
        case octavius::app::cli::CommandKind::Create: {
            auto metadata = octavius::app::cli::read_job_file(cmd.job_path);
            if (errors::is_error(metadata)) {
                exit_code = report(errors::get_error(metadata), "Invalid job file");
                break;
            }
            const auto& record = errors::get_value(metadata);
            auto saved = client.save_metadata(ctx, record.name, record);
            if (errors::is_error(saved)) {
                exit_code = report(errors::get_error(saved), "Error in creating job");
                break;
            }
            std::cout << "Job " << errors::get_value(saved).name << " created" << std::endl;
            break;
        }
        case octavius::app::cli::CommandKind::List: {
            auto listed = client.get_available_jobs(ctx);
            if (errors::is_error(listed)) {
                exit_code = report(errors::get_error(listed), "Error in listing jobs");
                break;
            }
            for (const auto& job : errors::get_value(listed).jobs) {
                std::cout << job << std::endl;
            }
            break;
        }
        case octavius::app::cli::CommandKind::Describe: {
            auto fetched = client.get_metadata(ctx, cmd.job_name);
            if (errors::is_error(fetched)) {
                exit_code = report(errors::get_error(fetched), "Error in fetching metadata");
                break;
            }
            std::cout << octavius::rpc::metadata_to_json(errors::get_value(fetched)).dump(2)
                      << std::endl;
            break;
        }
        case octavius::app::cli::CommandKind::Execute: {
            auto executed = client.execute_job(ctx, cmd.job_name, cmd.arguments);
            if (errors::is_error(executed)) {
                exit_code = report(errors::get_error(executed), "Error in executing job");
                break;
            }
            std::cout << errors::get_value(executed).status << std::endl;
            break;
        }
    }

    logger.shutdown();
    return exit_code;
}
