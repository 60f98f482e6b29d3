#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "core/logging/logger.hpp"
#include "execution/executor.hpp"

namespace octavius::execution {

struct ContainerExecutorOptions {
    std::string runtime_binary = "docker";
    std::vector<std::string> runtime_args = {"run", "--rm"};
    std::uint32_t timeout_ms = 600000;  // 0 = bounded only by the call deadline
};

// Keeps the last `limit` bytes of a child's output stream.
class OutputTail {
public:
    explicit OutputTail(std::size_t limit = 512);

    void append(const char* data, std::size_t size);

    bool empty() const { return text_.empty(); }
    std::size_t size() const { return text_.size(); }

    // Prefixed with "..." once earlier bytes were dropped.
    std::string str() const;

private:
    std::size_t limit_;
    std::string text_;
    bool truncated_ = false;
};

// Runs `<runtime_binary> <runtime_args...> -e KEY=VALUE ... <image>` as a child
// process. Exit code 0 maps to status "succeeded", any other exit code to
// "failed (exit code N)". Timeouts and cancellation kill the child and fail.
class ContainerExecutor : public Executor {
public:
    explicit ContainerExecutor(ContainerExecutorOptions options = {},
                               core::logging::Logger& logger = core::logging::Logger::get());

    core::errors::Result<std::string> run(
        const core::context::CallContext& ctx,
        const protocol::ExecutionOrder& order) override;

    std::vector<std::string> build_command(const protocol::ExecutionOrder& order) const;

private:
    ContainerExecutorOptions options_;
    core::logging::Logger& logger_;
};

}  // namespace octavius::execution
