/**
 * @file docker_runtime.cpp
 * @brief docker CLI adapter and the fork/exec process runner behind it.
 */
#include "dockyard/lifecycle/docker_runtime.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "dockyard/config/constants.hpp"

namespace dockyard::lifecycle {

namespace {

constexpr int EXIT_EXEC_FAILED = 127;

std::string trim(std::string s) {
    const auto not_space = [](unsigned char c) { return c != ' ' && c != '\n' && c != '\r' && c != '\t'; };
    std::size_t b = 0, e = s.size();
    while (b < e && !not_space(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && !not_space(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool contains(std::string_view haystack, std::string_view needle) noexcept {
    return haystack.find(needle) != std::string_view::npos;
}

std::string millis(std::chrono::milliseconds d) {
    return std::to_string(d.count()) + "ms";
}

} // namespace

CommandResult run_process(const std::vector<std::string>& argv) {
    CommandResult res;
    if (argv.empty()) { res.exit_code = EXIT_EXEC_FAILED; res.err = "empty command"; return res; }

    int out_pipe[2], err_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        res.exit_code = EXIT_EXEC_FAILED; res.err = std::strerror(errno); return res;
    }
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        res.exit_code = EXIT_EXEC_FAILED; res.err = std::strerror(errno);
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        return res;
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        res.exit_code = EXIT_EXEC_FAILED; res.err = std::strerror(errno);
        ::close(out_pipe[0]); ::close(out_pipe[1]); ::close(err_pipe[0]); ::close(err_pipe[1]);
        return res;
    }
    if (pid == 0) {
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(cargv[0], cargv.data());
        ::_exit(EXIT_EXEC_FAILED);
    }

    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    // Drain both pipes together so a chatty stderr cannot stall the child.
    pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
    std::string* sinks[2] = {&res.out, &res.err};
    int open_fds = 2;
    char buf[4096];
    while (open_fds > 0) {
        if (::poll(fds, 2, -1) < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
            const ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                ::close(fds[i].fd);
                fds[i].fd = -1;
                --open_fds;
            }
        }
    }
    for (auto& f : fds) if (f.fd >= 0) ::close(f.fd);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) { res.exit_code = EXIT_EXEC_FAILED; return res; }
    }
    res.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    return res;
}

DockerRuntime::DockerRuntime(std::string binary, CommandRunner runner)
    : binary_(std::move(binary)), runner_(std::move(runner)) {}

CommandResult DockerRuntime::exec(std::vector<std::string> args) const {
    args.insert(args.begin(), binary_);
    if (spdlog::should_log(spdlog::level::debug)) {
        std::string line;
        for (const auto& a : args) { if (!line.empty()) line += ' '; line += a; }
        spdlog::debug("exec: {}", line);
    }
    return runner_(args);
}

RuntimeError DockerRuntime::classify(const CommandResult& r) {
    const std::string msg = trim(r.err.empty() ? r.out : r.err);
    if (r.exit_code == EXIT_EXEC_FAILED && msg.empty()) {
        return RuntimeError{RuntimeErrc::Unreachable, "docker is not installed or not on PATH"};
    }
    if (contains(msg, "Cannot connect to the Docker daemon") || contains(msg, "Is the docker daemon running")) {
        return RuntimeError{RuntimeErrc::Unreachable, msg};
    }
    if (contains(msg, "No such") || contains(msg, "not found")) {
        return RuntimeError{RuntimeErrc::NotFound, msg};
    }
    if (contains(msg, "already in use") || contains(msg, "already exists") || contains(msg, "Conflict")) {
        return RuntimeError{RuntimeErrc::Conflict, msg};
    }
    return RuntimeError{RuntimeErrc::CommandFailed,
                        msg.empty() ? "exit code " + std::to_string(r.exit_code) : msg};
}

RuntimeResult<Done> DockerRuntime::simple(std::vector<std::string> args) {
    const auto r = exec(std::move(args));
    if (r.exit_code != 0) return dockyard_detail::unexpected<RuntimeError>(classify(r));
    return Done{};
}

RuntimeResult<Done> DockerRuntime::ping() {
    const auto r = exec({"info", "--format", "{{.ServerVersion}}"});
    if (r.exit_code == 0) return Done{};
    auto e = classify(r);
    // Any failure of `docker info` means the daemon cannot be used.
    e.code = RuntimeErrc::Unreachable;
    if (r.exit_code != EXIT_EXEC_FAILED) e.detail = "Docker daemon is not running: " + e.detail;
    return dockyard_detail::unexpected<RuntimeError>(std::move(e));
}

std::vector<std::string> DockerRuntime::create_args(const CreateSpec& spec) const {
    const Service& s = spec.service;
    std::vector<std::string> args{"create", "--name", s.name, "--network", s.network,
                                  "--label", std::string(config::constants::DEPLOYMENT_LABEL) + "=" + spec.deployment,
                                  "--label", std::string(config::constants::CONFIG_HASH_LABEL) + "=" + spec.config_hash};
    if (s.port.host != 0 && s.port.container != 0) {
        args.push_back("-p");
        args.push_back(std::to_string(s.port.host) + ":" + std::to_string(s.port.container));
    }
    for (const auto& [k, v] : s.env) {
        args.push_back("-e");
        args.push_back(k + "=" + v);
    }
    if (!s.health.command.empty()) {
        args.insert(args.end(), {"--health-cmd", s.health.command,
                                 "--health-interval", millis(s.health.interval),
                                 "--health-timeout", millis(s.health.timeout),
                                 "--health-retries", std::to_string(s.health.retries),
                                 "--health-start-period", millis(s.health.start_period)});
    }
    args.push_back(s.image);
    return args;
}

RuntimeResult<Done> DockerRuntime::create(const CreateSpec& spec) {
    return simple(create_args(spec));
}

RuntimeResult<Done> DockerRuntime::start(const std::string& name)  { return simple({"start", name}); }
RuntimeResult<Done> DockerRuntime::stop(const std::string& name)   { return simple({"stop", name}); }
RuntimeResult<Done> DockerRuntime::remove(const std::string& name) { return simple({"rm", name}); }

RuntimeResult<InstanceInfo> DockerRuntime::inspect(const std::string& name) {
    const std::string format = std::string("{{.State.Status}}|{{if .State.Health}}{{.State.Health.Status}}{{end}}|") +
                               "{{index .Config.Labels \"" + config::constants::CONFIG_HASH_LABEL + "\"}}";
    const auto r = exec({"inspect", "--type", "container", "--format", format, name});
    if (r.exit_code != 0) return dockyard_detail::unexpected<RuntimeError>(classify(r));

    const std::string line = trim(r.out);
    const auto p1 = line.find('|');
    const auto p2 = p1 == std::string::npos ? std::string::npos : line.find('|', p1 + 1);
    if (p2 == std::string::npos) {
        return dockyard_detail::unexpected<RuntimeError>(
            RuntimeError{RuntimeErrc::CommandFailed, "unexpected inspect output: " + line});
    }
    const std::string status = line.substr(0, p1);
    const std::string health = line.substr(p1 + 1, p2 - p1 - 1);

    InstanceInfo info;
    info.config_hash = line.substr(p2 + 1);
    if (info.config_hash == "<no value>") info.config_hash.clear();

    if (status == "running") {
        if (health == "unhealthy")      info.state = ServiceState::Unhealthy;
        else                            info.state = ServiceState::Running;
        info.health_pending = (health == "starting");
    } else if (status == "restarting") {
        info.state = ServiceState::Unhealthy;
    } else {
        // created, exited, paused, dead, removing
        info.state = ServiceState::Stopped;
    }
    return info;
}

RuntimeResult<Done> DockerRuntime::create_network(const std::string& name) {
    return simple({"network", "create", name});
}

RuntimeResult<Done> DockerRuntime::remove_network(const std::string& name) {
    return simple({"network", "rm", name});
}

RuntimeResult<NetworkInfo> DockerRuntime::inspect_network(const std::string& name) {
    const auto r = exec({"network", "inspect", "--format", "{{len .Containers}}", name});
    if (r.exit_code != 0) {
        auto e = classify(r);
        if (e.code == RuntimeErrc::NotFound) return NetworkInfo{};
        return dockyard_detail::unexpected<RuntimeError>(std::move(e));
    }
    NetworkInfo info;
    info.exists = true;
    const std::string n = trim(r.out);
    char* end = nullptr;
    const unsigned long attached = std::strtoul(n.c_str(), &end, 10);
    if (end == n.c_str()) {
        return dockyard_detail::unexpected<RuntimeError>(
            RuntimeError{RuntimeErrc::CommandFailed, "unexpected network inspect output: " + n});
    }
    info.attached = attached;
    return info;
}

RuntimeResult<Done> DockerRuntime::build(const std::string& image, const std::string& context) {
    return simple({"build", "-t", image, context});
}

} // namespace dockyard::lifecycle
