#ifndef OZTRANSFER_LEADER_DISCOVERY_HPP
#define OZTRANSFER_LEADER_DISCOVERY_HPP

/// \file

#include "oztransfer/process.hpp"
#include "oztransfer/run_config.hpp"

#include <boost/filesystem/path.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace oztransfer
{
    enum class resolution
    {
        resolved,         ///< Reported by the service itself.
        fallback_resolved ///< Taken from the site configuration.
    }; // enum class resolution

    auto to_string(resolution _state) -> std::string_view;

    struct leader_info
    {
        std::string host;
        std::string address; // host:port
        resolution state;
    }; // struct leader_info

    /// One way of finding the current leader.
    ///
    /// Implementations return std::nullopt when they cannot produce an answer.
    /// They only throw for failures that must abort the run.
    class discovery_strategy
    {
    public:
        virtual ~discovery_strategy() = default;

        virtual auto name() const -> std::string_view = 0;

        virtual auto discover(const run_config& _config) -> std::optional<leader_info> = 0;
    }; // class discovery_strategy

    /// Asks the service for its roles via "ozone admin om roles -id <service id>".
    class role_query_strategy : public discovery_strategy
    {
    public:
        role_query_strategy(command_runner& _runner, const execution_environment& _env);

        auto name() const -> std::string_view override;

        auto discover(const run_config& _config) -> std::optional<leader_info> override;

    private:
        command_runner& runner_;
        const execution_environment& env_;
    }; // class role_query_strategy

    /// Uses the first node address listed for the service in the written site configuration.
    class site_config_strategy : public discovery_strategy
    {
    public:
        explicit site_config_strategy(boost::filesystem::path _site_config_path);

        auto name() const -> std::string_view override;

        auto discover(const run_config& _config) -> std::optional<leader_info> override;

    private:
        boost::filesystem::path path_;
    }; // class site_config_strategy

    /// Builds the role query command for \p _service_id.
    auto make_role_query_command(const std::string& _service_id) -> command;

    /// Extracts the leader's host from role query output.
    ///
    /// The first line containing " LEADER " is used. The host is the trimmed
    /// text between its first '(' and the following ')'.
    auto parse_leader_host(std::string_view _output) -> std::optional<std::string>;

    /// Returns the text before the last ':' of \p _address, or \p _address if it has none.
    auto host_from_address(const std::string& _address) -> std::string;

    /// Tries each strategy in order and returns the first answer.
    ///
    /// \throws oztransfer::exception LEADER_UNRESOLVED if no strategy produces a leader.
    auto discover_leader(const run_config& _config, const std::vector<std::unique_ptr<discovery_strategy>>& _strategies)
        -> leader_info;
} // namespace oztransfer

#endif // OZTRANSFER_LEADER_DISCOVERY_HPP
