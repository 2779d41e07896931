#ifndef OZTRANSFER_TRANSFER_EXECUTOR_HPP
#define OZTRANSFER_TRANSFER_EXECUTOR_HPP

/// \file

#include "oztransfer/leader_discovery.hpp"
#include "oztransfer/process.hpp"
#include "oztransfer/run_config.hpp"

#include <string>
#include <string_view>

namespace oztransfer
{
    /// A fully determined bulk copy.
    struct transfer_job
    {
        std::string manifest_path;
        std::string staged_manifest_path;
        std::string destination_path;
        std::string destination_uri;
        std::string log_path;
        transfer_tuning tuning;
    }; // struct transfer_job

    enum class transfer_outcome
    {
        success,
        failure
    }; // enum class transfer_outcome

    auto to_string(transfer_outcome _outcome) -> std::string_view;

    /// Returns "ofs://<leader address>/<destination path>".
    auto destination_uri(const leader_info& _leader, const std::string& _destination_path) -> std::string;

    auto make_transfer_job(const run_config& _config, const leader_info& _leader, const std::string& _destination_path)
        -> transfer_job;

    /// Copies the manifest into the staging directory of the source filesystem,
    /// replacing any earlier copy.
    ///
    /// \throws oztransfer::exception STAGING_FAILED
    auto stage_manifest(const run_config& _config,
                        const transfer_job& _job,
                        command_runner& _runner,
                        const execution_environment& _env) -> void;

    auto build_distcp_command(const run_config& _config, const transfer_job& _job, const leader_info& _leader)
        -> command;

    /// Runs the bulk copy and blocks until it exits.
    ///
    /// Prints verification hints on success and troubleshooting steps on
    /// failure. The engine's exit status is returned unchanged.
    auto run_transfer(const run_config& _config,
                      const transfer_job& _job,
                      const leader_info& _leader,
                      command_runner& _runner,
                      const execution_environment& _env) -> int;
} // namespace oztransfer

#endif // OZTRANSFER_TRANSFER_EXECUTOR_HPP
