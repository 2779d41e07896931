#ifndef OZTRANSFER_ORCHESTRATOR_HPP
#define OZTRANSFER_ORCHESTRATOR_HPP

/// \file

#include "oztransfer/leader_discovery.hpp"
#include "oztransfer/process.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace oztransfer
{
    namespace stage
    {
        // clang-format off
        inline constexpr const char* configuration   = "configuration";
        inline constexpr const char* environment     = "environment";
        inline constexpr const char* discovery       = "discovery";
        inline constexpr const char* path_derivation = "path_derivation";
        inline constexpr const char* authentication  = "authentication";
        inline constexpr const char* connectivity    = "connectivity";
        inline constexpr const char* staging         = "staging";
        inline constexpr const char* transfer        = "transfer";
        // clang-format on
    } // namespace stage

    /// What happened during a run. Filled in as stages complete.
    struct run_summary
    {
        std::string config_path;
        std::vector<std::string> stages_completed;
        std::optional<leader_info> leader;
        std::optional<std::string> destination_uri;
        std::optional<int> engine_exit_code;
        std::optional<int> error_code;
        std::string error_message;
        int exit_code = 0;
    }; // struct run_summary

    auto to_json(const run_summary& _summary) -> nlohmann::json;

    /// \throws oztransfer::exception SYS_INVALID_INPUT_PARAM if \p _path cannot be written.
    auto write_summary(const run_summary& _summary, const std::string& _path) -> void;

    /// Runs the transfer pipeline for the settings file at \p _config_path.
    ///
    /// Stages run strictly in order and the first failure ends the run:
    /// configuration, environment assembly, leader discovery, path derivation,
    /// ticket login, connectivity probes, staging and finally the bulk copy.
    ///
    /// External commands go through \p _runner with \p _base_env overlaid by
    /// the assembled client environment.
    ///
    /// Errors are reported and folded into the result. The returned exit code is
    /// the engine's own status once the copy has run, or the code of the failed
    /// pre-flight category.
    auto run_pipeline(const std::string& _config_path,
                      command_runner& _runner,
                      const execution_environment& _base_env,
                      run_summary& _summary) -> int;
} // namespace oztransfer

#endif // OZTRANSFER_ORCHESTRATOR_HPP
