#include "oztransfer/connectivity_probe.hpp"

#include "oztransfer/error_codes.hpp"
#include "oztransfer/exception.hpp"
#include "oztransfer/logger.hpp"

#include <fmt/format.h>

namespace
{
    using log_xfer = oztransfer::log::transfer;
} // anonymous namespace

namespace oztransfer
{
    auto make_source_probe_command() -> command
    {
        return {"hdfs", {"dfs", "-ls", "/"}, output_mode::discard};
    } // make_source_probe_command

    auto make_destination_probe_command(const leader_info& _leader) -> command
    {
        return {"hadoop", {"fs", "-ls", fmt::format("ofs://{}/", _leader.address)}, output_mode::capture_merged};
    } // make_destination_probe_command

    auto probe_source(command_runner& _runner, const execution_environment& _env) -> void
    {
        const auto cmd = make_source_probe_command();
        log_xfer::debug("Running [{}].", to_string(cmd));

        if (const auto result = _runner.run(cmd, _env); !result.ok()) {
            THROW(SOURCE_UNREACHABLE,
                  fmt::format("Cannot access the source filesystem ([{}] exited with status [{}]).",
                              to_string(cmd),
                              result.exit_code));
        }

        fmt::print("✓ Source filesystem is reachable.\n");
    } // probe_source

    auto probe_destination(const leader_info& _leader, command_runner& _runner, const execution_environment& _env)
        -> void
    {
        const auto cmd = make_destination_probe_command(_leader);
        log_xfer::debug("Running [{}].", to_string(cmd));

        const auto result = _runner.run(cmd, _env);

        if (!result.ok()) {
            fmt::print("Output of [{}]:\n{}", to_string(cmd), result.standard_output);

            THROW(DESTINATION_UNREACHABLE,
                  fmt::format("Cannot access [ofs://{}/] ([{}] exited with status [{}]).",
                              _leader.address,
                              to_string(cmd),
                              result.exit_code));
        }

        fmt::print("✓ Remote service is reachable through [{}].\n", _leader.address);
    } // probe_destination
} // namespace oztransfer
