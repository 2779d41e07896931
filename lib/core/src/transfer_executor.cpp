#include "oztransfer/transfer_executor.hpp"

#include "oztransfer/error_codes.hpp"
#include "oztransfer/exception.hpp"
#include "oztransfer/logger.hpp"

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem/path.hpp>
#include <fmt/format.h>

#include <vector>

namespace fs = boost::filesystem;

namespace
{
    using log_xfer = oztransfer::log::transfer;

    constexpr const char* banner = "==========================================";

    // Share of the mapper container memory given to the JVM heap.
    constexpr int heap_percent = 80;

    auto run_staging_step(const oztransfer::command& _cmd,
                          oztransfer::command_runner& _runner,
                          const oztransfer::execution_environment& _env) -> void
    {
        log_xfer::debug("Running [{}].", oztransfer::to_string(_cmd));

        if (const auto result = _runner.run(_cmd, _env); !result.ok()) {
            THROW(STAGING_FAILED,
                  fmt::format("[{}] exited with status [{}]: {}",
                              oztransfer::to_string(_cmd),
                              result.exit_code,
                              boost::trim_copy(result.standard_output)));
        }
    } // run_staging_step

    auto print_success(const oztransfer::transfer_job& _job) -> void
    {
        fmt::print("  ✓ DISTCP COMPLETED SUCCESSFULLY!\n\n"
                   "  Verification:\n"
                   "    hadoop fs -ls {0}\n"
                   "    hadoop fs -count {0}\n\n",
                   _job.destination_uri);
    } // print_success

    auto print_failure(const oztransfer::run_config& _config, const oztransfer::transfer_job& _job, int _exit_code)
        -> void
    {
        std::vector<std::string> hosts;
        hosts.reserve(_config.peers.size());

        for (const auto& peer : _config.peers) {
            hosts.push_back(peer.host);
        }

        fmt::print("  ✗ DISTCP FAILED: EXIT CODE {}\n\n"
                   "  Troubleshooting steps:\n"
                   "    1. Check scheduler application logs:\n"
                   "       yarn application -list\n"
                   "       yarn logs -applicationId <app-id>\n\n"
                   "    2. Check DistCp logs:\n"
                   "       hdfs dfs -cat {}/_logs/*\n\n"
                   "    3. Check Ozone Manager logs on the remote peer nodes:\n"
                   "       {}\n\n"
                   "    4. Verify Ranger/ACL permissions for principal [{}] on path:\n"
                   "       {}\n\n",
                   _exit_code,
                   _job.log_path,
                   boost::join(hosts, ", "),
                   _config.principal,
                   _job.destination_uri);
    } // print_failure
} // anonymous namespace

namespace oztransfer
{
    auto to_string(transfer_outcome _outcome) -> std::string_view
    {
        return transfer_outcome::success == _outcome ? "success" : "failure";
    } // to_string

    auto destination_uri(const leader_info& _leader, const std::string& _destination_path) -> std::string
    {
        return fmt::format("ofs://{}/{}", _leader.address, _destination_path);
    } // destination_uri

    auto make_transfer_job(const run_config& _config, const leader_info& _leader, const std::string& _destination_path)
        -> transfer_job
    {
        const fs::path manifest{_config.manifest_path};

        auto staging = _config.staging_directory;
        while (staging.size() > 1 && '/' == staging.back()) {
            staging.pop_back();
        }

        return {
            _config.manifest_path,
            fmt::format("{}/{}", staging, manifest.filename().string()),
            _destination_path,
            destination_uri(_leader, _destination_path),
            _config.log_directory_prefix + manifest.filename().string(),
            _config.tuning
        };
    } // make_transfer_job

    auto stage_manifest(const run_config& _config,
                        const transfer_job& _job,
                        command_runner& _runner,
                        const execution_environment& _env) -> void
    {
        run_staging_step({"hdfs", {"dfs", "-mkdir", "-p", _config.staging_directory}, output_mode::capture_merged},
                         _runner,
                         _env);

        run_staging_step(
            {"hdfs", {"dfs", "-copyFromLocal", "-f", _job.manifest_path, _job.staged_manifest_path}, output_mode::capture_merged},
            _runner,
            _env);

        fmt::print("✓ Manifest staged to [{}].\n", _job.staged_manifest_path);
    } // stage_manifest

    auto build_distcp_command(const run_config& _config, const transfer_job& _job, const leader_info& _leader)
        -> command
    {
        const auto memory = _job.tuning.memory_mb_per_mapper;

        // clang-format off
        return {"hadoop", {
            "distcp",
            fmt::format("-Dmapreduce.job.queuename={}", _config.queue_name),
            fmt::format("-Dmapreduce.map.memory.mb={}", memory),
            fmt::format("-Dmapreduce.map.java.opts=-Xmx{}m", memory * heap_percent / 100),
            fmt::format("-Dmapreduce.job.hdfs-servers.token-renewal.exclude={}", _leader.host),
            fmt::format("-Dmapred.job.hdfs-servers.token-renewal.exclude={}", _leader.host),
            "-Dyarn.resourcemanager.delegation-token.renew-interval=-1",
            "-bandwidth", std::to_string(_job.tuning.bandwidth_mb_per_mapper),
            "-m", std::to_string(_job.tuning.mapper_count),
            "-skipcrccheck",
            "-log", _job.log_path,
            "-f", _job.staged_manifest_path,
            _job.destination_uri
        }, output_mode::inherit};
        // clang-format on
    } // build_distcp_command

    auto run_transfer(const run_config& _config,
                      const transfer_job& _job,
                      const leader_info& _leader,
                      command_runner& _runner,
                      const execution_environment& _env) -> int
    {
        fmt::print("{}\n"
                   "Source: {}\n"
                   "Target: {}\n"
                   "Bootstrap leader: {}\n"
                   "Bandwidth: {} MB/mapper\n"
                   "Mappers: {}\n"
                   "Memory per mapper: {} MB\n"
                   "{}\n\n",
                   banner,
                   _job.staged_manifest_path,
                   _job.destination_uri,
                   _leader.address,
                   _job.tuning.bandwidth_mb_per_mapper,
                   _job.tuning.mapper_count,
                   _job.tuning.memory_mb_per_mapper,
                   banner);

        const auto cmd = build_distcp_command(_config, _job, _leader);
        fmt::print("DistCp Command:\n{}\n\n", to_string(cmd));

        const auto result = _runner.run(cmd, _env);
        const auto outcome = result.ok() ? transfer_outcome::success : transfer_outcome::failure;

        fmt::print("\n{}\n", banner);

        if (transfer_outcome::success == outcome) {
            print_success(_job);
        }
        else {
            print_failure(_config, _job, result.exit_code);
            log_xfer::error("Bulk copy to [{}] failed with exit code [{}].", _job.destination_uri, result.exit_code);
        }

        fmt::print("{}\n", banner);

        return result.exit_code;
    } // run_transfer
} // namespace oztransfer
