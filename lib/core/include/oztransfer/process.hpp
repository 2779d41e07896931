#ifndef OZTRANSFER_PROCESS_HPP
#define OZTRANSFER_PROCESS_HPP

/// \file

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace oztransfer
{
    enum class output_mode
    {
        inherit,        ///< The child writes directly to the caller's stdout and stderr.
        capture,        ///< stdout and stderr are captured separately.
        capture_merged, ///< stderr is folded into the captured stdout.
        discard         ///< Both streams are redirected to /dev/null.
    }; // enum class output_mode

    struct command
    {
        std::string program;
        std::vector<std::string> arguments;
        output_mode mode = output_mode::inherit;
    }; // struct command

    /// Renders \p _cmd as a single line suitable for display.
    auto to_string(const command& _cmd) -> std::string;

    struct command_result
    {
        // Exit status of the child. A child terminated by signal N reports 128 + N.
        int exit_code = 0;
        std::string standard_output;
        std::string standard_error;

        auto ok() const noexcept -> bool { return 0 == exit_code; }
    }; // struct command_result

    /// The full set of environment variables handed to child processes.
    class execution_environment
    {
    public:
        execution_environment() = default;

        /// Captures the environment of the calling process.
        static auto inherit() -> execution_environment;

        auto set(const std::string& _name, const std::string& _value) -> void;

        auto get(const std::string& _name) const -> std::optional<std::string>;

        /// Returns the variables as NAME=VALUE strings, sorted by name.
        auto to_strings() const -> std::vector<std::string>;

    private:
        std::map<std::string, std::string> vars_;
    }; // class execution_environment

    /// Interface for running external commands.
    ///
    /// Every call blocks until the command exits. There is no timeout.
    class command_runner
    {
    public:
        virtual ~command_runner() = default;

        /// \throws oztransfer::exception PROCESS_LAUNCH_FAILED if the command cannot be
        ///         started, PROCESS_WAIT_FAILED if its exit status cannot be collected.
        virtual auto run(const command& _cmd, const execution_environment& _env) -> command_result = 0;
    }; // class command_runner

    /// Runs commands as child processes via posix_spawnp(). No shell is involved.
    class process_runner : public command_runner
    {
    public:
        auto run(const command& _cmd, const execution_environment& _env) -> command_result override;
    }; // class process_runner
} // namespace oztransfer

#endif // OZTRANSFER_PROCESS_HPP
