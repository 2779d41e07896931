#ifndef OZTRANSFER_SITE_CONFIG_HPP
#define OZTRANSFER_SITE_CONFIG_HPP

/// \file

#include "oztransfer/run_config.hpp"

#include <boost/filesystem/path.hpp>

#include <optional>
#include <string>
#include <vector>

namespace oztransfer
{
    inline constexpr const char* site_config_file_name = "ozone-site.xml";

    namespace site_keys
    {
        // clang-format off
        inline constexpr const char* service_id             = "ozone.service.id";
        inline constexpr const char* om_address_prefix      = "ozone.om.address.";
        inline constexpr const char* om_service_ids         = "ozone.om.service.ids";
        inline constexpr const char* om_nodes_prefix        = "ozone.om.nodes.";
        inline constexpr const char* ofs_impl               = "fs.ofs.impl";
        inline constexpr const char* ofs_abstract_impl      = "fs.AbstractFileSystem.ofs.impl";
        inline constexpr const char* security_enabled       = "ozone.security.enabled";
        inline constexpr const char* failover_max_attempts  = "ozone.client.failover.max.attempts";
        inline constexpr const char* connection_timeout     = "ozone.client.connection.timeout";
        // clang-format on
    } // namespace site_keys

    struct site_property
    {
        std::string name;
        std::string value;
    }; // struct site_property

    /// The client-side description of the remote service: its peers, security
    /// mode and failover tuning.
    struct site_config
    {
        std::string service_id;
        std::vector<site_property> properties;
    }; // struct site_config

    /// Returns "ozone.om.address.<service id>.<peer id>".
    auto node_address_key(const std::string& _service_id, const std::string& _peer_id) -> std::string;

    /// Builds the site configuration for \p _config.
    ///
    /// The result depends on nothing but \p _config. Peers appear in their
    /// configured order.
    auto build_site_config(const run_config& _config) -> site_config;

    /// Renders \p _site as a Hadoop-style configuration XML document.
    auto render_site_config(const site_config& _site) -> std::string;

    /// Creates \p _config.config_directory and copies the regular files of
    /// \p _config.base_config_directory into it.
    ///
    /// Copy failures are logged and otherwise ignored. A missing base directory
    /// is not an error.
    ///
    /// \throws oztransfer::exception SITE_CONFIG_WRITE_FAILED if the directory cannot be created.
    auto prepare_config_directory(const run_config& _config) -> boost::filesystem::path;

    /// Writes \p _site to "<_directory>/ozone-site.xml", replacing any existing file.
    ///
    /// \throws oztransfer::exception SITE_CONFIG_WRITE_FAILED
    auto write_site_config(const site_config& _site, const boost::filesystem::path& _directory) -> boost::filesystem::path;

    /// Returns the value of the first node-address property for \p _service_id
    /// in the site configuration file at \p _path.
    ///
    /// \throws oztransfer::exception SITE_CONFIG_READ_FAILED if the file cannot be parsed.
    auto first_node_address(const boost::filesystem::path& _path, const std::string& _service_id)
        -> std::optional<std::string>;
} // namespace oztransfer

#endif // OZTRANSFER_SITE_CONFIG_HPP
