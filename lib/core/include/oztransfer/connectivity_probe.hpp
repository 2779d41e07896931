#ifndef OZTRANSFER_CONNECTIVITY_PROBE_HPP
#define OZTRANSFER_CONNECTIVITY_PROBE_HPP

/// \file

#include "oztransfer/leader_discovery.hpp"
#include "oztransfer/process.hpp"

namespace oztransfer
{
    auto make_source_probe_command() -> command;

    auto make_destination_probe_command(const leader_info& _leader) -> command;

    /// Lists the root of the source filesystem once.
    ///
    /// \throws oztransfer::exception SOURCE_UNREACHABLE
    auto probe_source(command_runner& _runner, const execution_environment& _env) -> void;

    /// Lists the root of the remote service through \p _leader once.
    ///
    /// On failure the probe's combined output is printed verbatim before throwing.
    ///
    /// \throws oztransfer::exception DESTINATION_UNREACHABLE
    auto probe_destination(const leader_info& _leader, command_runner& _runner, const execution_environment& _env)
        -> void;
} // namespace oztransfer

#endif // OZTRANSFER_CONNECTIVITY_PROBE_HPP
