#pragma once
/**
 * @file command_runner.hpp
 * @brief Process execution seam used by ShellPrimitives.
 */

#include <string>
#include <vector>

#include "vpcctl/error.hpp"

namespace vpcctl::net {

/** @struct CommandResult
 *  @brief Exit status and captured output of a finished command.
 */
struct CommandResult {
    int         exit_code{0};
    std::string out; ///< Captured stdout
    std::string err; ///< Captured stderr
};

/** @class CommandRunner
 *  @brief Runs argv-style commands. A non-zero exit is NOT an error here;
 *         only failing to start or reap the process is.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual Result<CommandResult> run(const std::vector<std::string>& argv) = 0;
};

/** @class ProcessRunner
 *  @brief fork/execvp/waitpid runner; PATH lookup, stdout/stderr captured.
 */
class ProcessRunner final : public CommandRunner {
public:
    Result<CommandResult> run(const std::vector<std::string>& argv) override;
};

/// Render argv for logs ("ip link add br-a type bridge").
std::string join_argv(const std::vector<std::string>& argv);

} // namespace vpcctl::net
