#include "oztransfer/orchestrator.hpp"

#include "oztransfer/client_environment.hpp"
#include "oztransfer/connectivity_probe.hpp"
#include "oztransfer/error_codes.hpp"
#include "oztransfer/exception.hpp"
#include "oztransfer/kerberos.hpp"
#include "oztransfer/logger.hpp"
#include "oztransfer/path_deriver.hpp"
#include "oztransfer/run_config.hpp"
#include "oztransfer/transfer_executor.hpp"

#include <fmt/format.h>

#include <exception>
#include <fstream>
#include <memory>

namespace
{
    using log_orch = oztransfer::log::orchestrator;

    auto print_step(int _number, const std::string& _title) -> void
    {
        fmt::print("\nStep {}: {}\n", _number, _title);
    } // print_step

    auto warn_about_heterogeneous_entries(const oztransfer::run_config& _config, const std::string& _suffix) -> void
    {
        const auto mismatched =
            oztransfer::find_heterogeneous_entries(_config.manifest_path, _suffix, _config.source_root_prefix);

        if (mismatched.empty()) {
            return;
        }

        log_orch::warn("[{}] manifest entries do not share the destination [{}]. They are copied under it anyway.",
                       mismatched.size(),
                       _suffix);

        for (const auto& entry : mismatched) {
            log_orch::warn("  {}", entry);
        }
    } // warn_about_heterogeneous_entries

    auto execute(const std::string& _config_path,
                 oztransfer::command_runner& _runner,
                 const oztransfer::execution_environment& _base_env,
                 oztransfer::run_summary& _summary) -> int
    {
        namespace oz = oztransfer;

        print_step(1, fmt::format("Loading configuration from [{}]", _config_path));
        const auto config = oz::load_run_config(_config_path);
        fmt::print("✓ Service [{}] with peers [{}].\n", config.service_id, oz::joined_peer_ids(config));
        _summary.stages_completed.emplace_back(oz::stage::configuration);

        print_step(2, "Assembling client environment");
        const auto client = oz::assemble_environment(config, _base_env);
        fmt::print("✓ Site configuration written to [{}].\n", client.site_config_path.string());
        _summary.stages_completed.emplace_back(oz::stage::environment);

        const auto& env = client.child_environment;

        print_step(3, fmt::format("Discovering the leader of service [{}]", config.service_id));
        std::vector<std::unique_ptr<oz::discovery_strategy>> strategies;
        strategies.push_back(std::make_unique<oz::role_query_strategy>(_runner, env));
        strategies.push_back(std::make_unique<oz::site_config_strategy>(client.site_config_path));
        const auto leader = oz::discover_leader(config, strategies);
        fmt::print("✓ Leader [{}] ({}).\n", leader.address, oz::to_string(leader.state));
        _summary.leader = leader;
        _summary.stages_completed.emplace_back(oz::stage::discovery);

        print_step(4, fmt::format("Deriving destination path from [{}]", config.manifest_path));
        const auto destination = oz::derive_destination_from_manifest(config.manifest_path, config.source_root_prefix);
        warn_about_heterogeneous_entries(config, destination);
        const auto job = oz::make_transfer_job(config, leader, destination);
        fmt::print("✓ Destination [{}].\n", job.destination_uri);
        _summary.destination_uri = job.destination_uri;
        _summary.stages_completed.emplace_back(oz::stage::path_derivation);

        print_step(5, "Obtaining ticket");
        if (oz::kinit_login(config, _runner, env)) {
            _summary.stages_completed.emplace_back(oz::stage::authentication);
        }
        else {
            fmt::print("Ticket login disabled.\n");
        }

        print_step(6, "Checking connectivity");
        oz::probe_source(_runner, env);
        oz::probe_destination(leader, _runner, env);
        _summary.stages_completed.emplace_back(oz::stage::connectivity);

        print_step(7, "Staging manifest");
        oz::stage_manifest(config, job, _runner, env);
        _summary.stages_completed.emplace_back(oz::stage::staging);

        print_step(8, "Running DistCp");
        const auto ec = oz::run_transfer(config, job, leader, _runner, env);
        _summary.engine_exit_code = ec;

        if (0 == ec) {
            _summary.stages_completed.emplace_back(oz::stage::transfer);
        }

        return ec;
    } // execute
} // anonymous namespace

namespace oztransfer
{
    auto to_json(const run_summary& _summary) -> nlohmann::json
    {
        nlohmann::json json{
            {"config_file", _summary.config_path},
            {"stages_completed", _summary.stages_completed},
            {"exit_code", _summary.exit_code}
        };

        if (_summary.leader) {
            json["leader"] = {
                {"host", _summary.leader->host},
                {"address", _summary.leader->address},
                {"resolution", std::string{to_string(_summary.leader->state)}}
            };
        }

        if (_summary.destination_uri) {
            json["destination"] = *_summary.destination_uri;
        }

        if (_summary.engine_exit_code) {
            json["engine_exit_code"] = *_summary.engine_exit_code;
        }

        if (_summary.error_code) {
            json["error"] = {
                {"code", *_summary.error_code},
                {"name", std::string{error_name(*_summary.error_code)}},
                {"category", std::string{to_string(error_category_of(*_summary.error_code))}},
                {"message", _summary.error_message}
            };
        }

        return json;
    } // to_json

    auto write_summary(const run_summary& _summary, const std::string& _path) -> void
    {
        std::ofstream out{_path, std::ios::out | std::ios::trunc};

        if (!out) {
            THROW(SYS_INVALID_INPUT_PARAM, fmt::format("Cannot open summary file [{}].", _path));
        }

        out << to_json(_summary).dump(4) << '\n';
    } // write_summary

    auto run_pipeline(const std::string& _config_path,
                      command_runner& _runner,
                      const execution_environment& _base_env,
                      run_summary& _summary) -> int
    {
        _summary.config_path = _config_path;

        try {
            _summary.exit_code = execute(_config_path, _runner, _base_env, _summary);
        }
        catch (const oztransfer::exception& e) {
            log_orch::debug("{} raised: {}", to_string(error_category_of(e.code())), e.what());
            fmt::print(stderr, "ERROR: {}", e.client_display_what());

            _summary.error_code = e.code();
            _summary.error_message = e.client_display_what();
            _summary.exit_code = exit_code_for(e.code());
        }
        catch (const std::exception& e) {
            log_orch::debug("Unexpected exception: {}", e.what());
            fmt::print(stderr, "ERROR: {}: {}\n", error_name(SYS_INTERNAL_ERR), e.what());

            _summary.error_code = SYS_INTERNAL_ERR;
            _summary.error_message = e.what();
            _summary.exit_code = exit_code_for(SYS_INTERNAL_ERR);
        }

        return _summary.exit_code;
    } // run_pipeline
} // namespace oztransfer
