#include "oztransfer/leader_discovery.hpp"

#include "oztransfer/error_codes.hpp"
#include "oztransfer/exception.hpp"
#include "oztransfer/logger.hpp"
#include "oztransfer/site_config.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <fmt/format.h>

#include <sstream>
#include <utility>

namespace
{
    using log_disc = oztransfer::log::discovery;
} // anonymous namespace

namespace oztransfer
{
    auto to_string(resolution _state) -> std::string_view
    {
        // clang-format off
        switch (_state) {
            case resolution::resolved:          return "resolved";
            case resolution::fallback_resolved: return "fallback_resolved";
        }
        // clang-format on

        return "unknown";
    } // to_string

    auto make_role_query_command(const std::string& _service_id) -> command
    {
        return {"ozone", {"admin", "om", "roles", "-id", _service_id}, output_mode::capture};
    } // make_role_query_command

    auto parse_leader_host(std::string_view _output) -> std::optional<std::string>
    {
        std::istringstream in{std::string{_output}};

        for (std::string line; std::getline(in, line);) {
            if (line.find(" LEADER ") == std::string::npos) {
                continue;
            }

            const auto open = line.find('(');
            if (open == std::string::npos) {
                return std::nullopt;
            }

            const auto close = line.find(')', open + 1);
            if (close == std::string::npos) {
                return std::nullopt;
            }

            auto host = boost::trim_copy(line.substr(open + 1, close - open - 1));
            if (host.empty()) {
                return std::nullopt;
            }

            return host;
        }

        return std::nullopt;
    } // parse_leader_host

    auto host_from_address(const std::string& _address) -> std::string
    {
        const auto pos = _address.rfind(':');
        return pos == std::string::npos ? _address : _address.substr(0, pos);
    } // host_from_address

    role_query_strategy::role_query_strategy(command_runner& _runner, const execution_environment& _env)
        : runner_{_runner}
        , env_{_env}
    {
    }

    auto role_query_strategy::name() const -> std::string_view
    {
        return "role query";
    }

    auto role_query_strategy::discover(const run_config& _config) -> std::optional<leader_info>
    {
        const auto cmd = make_role_query_command(_config.service_id);
        log_disc::debug("Running [{}].", to_string(cmd));

        command_result result;

        try {
            result = runner_.run(cmd, env_);
        }
        catch (const oztransfer::exception& e) {
            log_disc::warn("Role query could not be run: {}", e.client_display_what());
            return std::nullopt;
        }

        if (!result.ok()) {
            log_disc::warn("Role query exited with status [{}]: {}",
                           result.exit_code,
                           boost::trim_copy(result.standard_error));
            return std::nullopt;
        }

        auto host = parse_leader_host(result.standard_output);

        if (!host) {
            log_disc::warn("Role query output for service [{}] contains no leader.", _config.service_id);
            log_disc::debug("Role query output:\n{}", result.standard_output);
            return std::nullopt;
        }

        auto address = fmt::format("{}:{}", *host, _config.om_port);
        return leader_info{std::move(*host), std::move(address), resolution::resolved};
    } // role_query_strategy::discover

    site_config_strategy::site_config_strategy(boost::filesystem::path _site_config_path)
        : path_{std::move(_site_config_path)}
    {
    }

    auto site_config_strategy::name() const -> std::string_view
    {
        return "site configuration";
    }

    auto site_config_strategy::discover(const run_config& _config) -> std::optional<leader_info>
    {
        try {
            auto address = first_node_address(path_, _config.service_id);

            if (!address) {
                log_disc::warn("No node address for service [{}] in [{}].", _config.service_id, path_.string());
                return std::nullopt;
            }

            auto host = host_from_address(*address);
            return leader_info{std::move(host), std::move(*address), resolution::fallback_resolved};
        }
        catch (const oztransfer::exception& e) {
            log_disc::error("{}", e.client_display_what());
            return std::nullopt;
        }
    } // site_config_strategy::discover

    auto discover_leader(const run_config& _config, const std::vector<std::unique_ptr<discovery_strategy>>& _strategies)
        -> leader_info
    {
        for (const auto& strategy : _strategies) {
            log_disc::debug("Trying leader discovery via {}.", strategy->name());

            if (auto leader = strategy->discover(_config); leader) {
                log_disc::info("Leader for service [{}] is [{}] ({} via {}).",
                               _config.service_id,
                               leader->address,
                               to_string(leader->state),
                               strategy->name());
                return std::move(*leader);
            }
        }

        THROW(LEADER_UNRESOLVED, fmt::format("Could not determine the leader of service [{}].", _config.service_id));
    } // discover_leader
} // namespace oztransfer
