#include "oztransfer/process.hpp"

#include "oztransfer/at_scope_exit.hpp"
#include "oztransfer/error_codes.hpp"
#include "oztransfer/exception.hpp"
#include "oztransfer/logger.hpp"

#include <fmt/format.h>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <utility>

extern char** environ; // NOLINT(readability-redundant-declaration)

namespace
{
    using log_process = oztransfer::log::process;

    // Owns both ends of a pipe. The descriptors are close-on-exec, so the child
    // only sees the ends that are explicitly dup'ed onto its standard streams.
    class pipe_pair
    {
    public:
        pipe_pair()
        {
            if (pipe2(fds_.data(), O_CLOEXEC) < 0) {
                THROW(PROCESS_LAUNCH_FAILED, fmt::format("pipe2 failed: {}", std::strerror(errno)));
            }
        }

        pipe_pair(const pipe_pair&) = delete;
        auto operator=(const pipe_pair&) -> pipe_pair& = delete;

        ~pipe_pair()
        {
            close_read_end();
            close_write_end();
        }

        auto read_end() const noexcept -> int { return fds_[0]; }
        auto write_end() const noexcept -> int { return fds_[1]; }

        auto close_read_end() noexcept -> void { close_fd(fds_[0]); }
        auto close_write_end() noexcept -> void { close_fd(fds_[1]); }

    private:
        static auto close_fd(int& _fd) noexcept -> void
        {
            if (_fd >= 0) {
                close(_fd);
                _fd = -1;
            }
        }

        std::array<int, 2> fds_{-1, -1};
    }; // class pipe_pair

    // Drains the read ends of both pipes until the child closes them.
    auto read_until_closed(pipe_pair* _out, pipe_pair* _err, std::string& _out_buf, std::string& _err_buf) -> void
    {
        std::array<pollfd, 2> pfds{};
        std::array<std::string*, 2> bufs{&_out_buf, &_err_buf};
        std::array<pipe_pair*, 2> pipes{_out, _err};

        for (std::size_t i = 0; i < pipes.size(); ++i) {
            pfds[i].fd = pipes[i] ? pipes[i]->read_end() : -1;
            pfds[i].events = POLLIN;
        }

        std::array<char, 4096> chunk{};

        while (pfds[0].fd >= 0 || pfds[1].fd >= 0) {
            if (poll(pfds.data(), pfds.size(), -1) < 0) {
                if (EINTR == errno) {
                    continue;
                }

                THROW(PROCESS_OUTPUT_READ_FAILED, fmt::format("poll failed: {}", std::strerror(errno)));
            }

            for (std::size_t i = 0; i < pfds.size(); ++i) {
                if (pfds[i].fd < 0 || 0 == pfds[i].revents) {
                    continue;
                }

                const auto n = read(pfds[i].fd, chunk.data(), chunk.size());

                if (n > 0) {
                    bufs[i]->append(chunk.data(), static_cast<std::size_t>(n));
                }
                else if (0 == n || EINTR != errno) {
                    // A negative fd is ignored by poll().
                    pipes[i]->close_read_end();
                    pfds[i].fd = -1;
                }
            }
        }
    } // read_until_closed

    auto wait_for_exit(pid_t _pid, const std::string& _program) -> int
    {
        int status = 0;

        while (waitpid(_pid, &status, 0) < 0) {
            if (EINTR != errno) {
                THROW(PROCESS_WAIT_FAILED, fmt::format("waitpid failed for [{}]: {}", _program, std::strerror(errno)));
            }
        }

        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }

        if (WIFSIGNALED(status)) {
            log_process::warn("[{}] was terminated by signal {}.", _program, WTERMSIG(status));
            return 128 + WTERMSIG(status);
        }

        THROW(PROCESS_WAIT_FAILED, fmt::format("Unexpected wait status [{}] for [{}].", status, _program));
    } // wait_for_exit

    auto quote_if_needed(const std::string& _arg) -> std::string
    {
        if (!_arg.empty() && std::string::npos == _arg.find_first_of(" \t\"'\\$")) {
            return _arg;
        }

        std::string quoted = "'";

        for (const auto c : _arg) {
            if ('\'' == c) {
                quoted += R"('\'')";
            }
            else {
                quoted += c;
            }
        }

        quoted += '\'';

        return quoted;
    } // quote_if_needed
} // anonymous namespace

namespace oztransfer
{
    auto to_string(const command& _cmd) -> std::string
    {
        auto line = quote_if_needed(_cmd.program);

        for (const auto& arg : _cmd.arguments) {
            line += ' ';
            line += quote_if_needed(arg);
        }

        return line;
    } // to_string

    auto execution_environment::inherit() -> execution_environment
    {
        execution_environment env;

        for (char** entry = environ; entry && *entry; ++entry) {
            const std::string var = *entry;

            if (const auto pos = var.find('='); std::string::npos != pos && pos > 0) {
                env.vars_.insert_or_assign(var.substr(0, pos), var.substr(pos + 1));
            }
        }

        return env;
    } // execution_environment::inherit

    auto execution_environment::set(const std::string& _name, const std::string& _value) -> void
    {
        vars_.insert_or_assign(_name, _value);
    } // execution_environment::set

    auto execution_environment::get(const std::string& _name) const -> std::optional<std::string>
    {
        if (const auto iter = vars_.find(_name); iter != std::end(vars_)) {
            return iter->second;
        }

        return std::nullopt;
    } // execution_environment::get

    auto execution_environment::to_strings() const -> std::vector<std::string>
    {
        std::vector<std::string> strings;
        strings.reserve(vars_.size());

        for (const auto& [name, value] : vars_) {
            strings.push_back(name + '=' + value);
        }

        return strings;
    } // execution_environment::to_strings

    auto process_runner::run(const command& _cmd, const execution_environment& _env) -> command_result
    {
        log_process::debug("Running [{}].", to_string(_cmd));

        std::optional<pipe_pair> out_pipe;
        std::optional<pipe_pair> err_pipe;

        posix_spawn_file_actions_t actions;
        posix_spawn_file_actions_init(&actions);
        const auto destroy_actions = at_scope_exit{[&actions] { posix_spawn_file_actions_destroy(&actions); }};

        switch (_cmd.mode) {
            case output_mode::inherit:
                break;

            case output_mode::capture:
                out_pipe.emplace();
                err_pipe.emplace();
                posix_spawn_file_actions_adddup2(&actions, out_pipe->write_end(), STDOUT_FILENO);
                posix_spawn_file_actions_adddup2(&actions, err_pipe->write_end(), STDERR_FILENO);
                break;

            case output_mode::capture_merged:
                out_pipe.emplace();
                posix_spawn_file_actions_adddup2(&actions, out_pipe->write_end(), STDOUT_FILENO);
                posix_spawn_file_actions_adddup2(&actions, out_pipe->write_end(), STDERR_FILENO);
                break;

            case output_mode::discard:
                posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
                posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);
                break;
        }

        // Build the argument and environment vectors before spawning. The
        // strings must outlive the call to posix_spawnp().
        std::vector<std::string> arg_storage;
        arg_storage.reserve(_cmd.arguments.size() + 1);
        arg_storage.push_back(_cmd.program);
        arg_storage.insert(std::end(arg_storage), std::begin(_cmd.arguments), std::end(_cmd.arguments));

        std::vector<char*> argv;
        argv.reserve(arg_storage.size() + 1);
        for (auto& arg : arg_storage) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        auto env_storage = _env.to_strings();
        std::vector<char*> envp;
        envp.reserve(env_storage.size() + 1);
        for (auto& var : env_storage) {
            envp.push_back(var.data());
        }
        envp.push_back(nullptr);

        pid_t pid{};

        if (const auto ec = posix_spawnp(&pid, _cmd.program.c_str(), &actions, nullptr, argv.data(), envp.data()); ec != 0) {
            THROW(PROCESS_LAUNCH_FAILED, fmt::format("Could not launch [{}]: {}", _cmd.program, std::strerror(ec)));
        }

        log_process::trace("[{}] started with pid [{}].", _cmd.program, pid);

        // The parent must not hold the write ends, otherwise reads never see EOF.
        if (out_pipe) {
            out_pipe->close_write_end();
        }

        if (err_pipe) {
            err_pipe->close_write_end();
        }

        command_result result;

        if (out_pipe || err_pipe) {
            try {
                read_until_closed(out_pipe ? &*out_pipe : nullptr,
                                  err_pipe ? &*err_pipe : nullptr,
                                  result.standard_output,
                                  result.standard_error);
            }
            catch (const oztransfer::exception&) {
                // Reap the child before reporting so it does not linger as a zombie.
                out_pipe.reset();
                err_pipe.reset();
                wait_for_exit(pid, _cmd.program);
                throw;
            }
        }

        result.exit_code = wait_for_exit(pid, _cmd.program);

        log_process::debug("[{}] exited with status [{}].", _cmd.program, result.exit_code);

        return result;
    } // process_runner::run
} // namespace oztransfer
