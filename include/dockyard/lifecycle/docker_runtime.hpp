#pragma once
/**
 * @file docker_runtime.hpp
 * @brief Runtime + ArtifactBuilder backed by the docker command-line client.
 * @details Commands are executed with an argument vector (fork/execvp), never through
 *          a shell, so names and environment values are passed verbatim.
 */

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "dockyard/lifecycle/runtime.hpp"

namespace dockyard::lifecycle {

/// Captured result of one child process.
struct CommandResult final {
    int         exit_code{-1};   ///< 127 when the binary could not be executed
    std::string out;             ///< stdout
    std::string err;             ///< stderr
};

using CommandRunner = std::function<CommandResult(const std::vector<std::string>& argv)>;

/// Run @p argv[0] with arguments, capturing stdout/stderr. Blocks until exit.
CommandResult run_process(const std::vector<std::string>& argv);

/**
 * @class DockerRuntime
 * @brief Translates runtime calls into docker CLI invocations.
 */
class DockerRuntime final : public Runtime, public ArtifactBuilder {
public:
    explicit DockerRuntime(std::string binary = "docker", CommandRunner runner = run_process);

    RuntimeResult<Done> ping() override;

    RuntimeResult<Done> create(const CreateSpec& spec) override;
    RuntimeResult<Done> start(const std::string& name) override;
    RuntimeResult<Done> stop(const std::string& name) override;
    RuntimeResult<Done> remove(const std::string& name) override;
    RuntimeResult<InstanceInfo> inspect(const std::string& name) override;

    RuntimeResult<Done> create_network(const std::string& name) override;
    RuntimeResult<Done> remove_network(const std::string& name) override;
    RuntimeResult<NetworkInfo> inspect_network(const std::string& name) override;

    RuntimeResult<Done> build(const std::string& image, const std::string& context) override;

    /// Argument vector create() would execute (exposed for diagnostics and tests).
    [[nodiscard]] std::vector<std::string> create_args(const CreateSpec& spec) const;

private:
    RuntimeResult<Done> simple(std::vector<std::string> args);
    CommandResult exec(std::vector<std::string> args) const;

    /// Map a failed command onto a RuntimeError using its stderr.
    static RuntimeError classify(const CommandResult& r);

    std::string   binary_;
    CommandRunner runner_;
};

} // namespace dockyard::lifecycle
