#include "oztransfer/site_config.hpp"

#include "oztransfer/error_codes.hpp"
#include "oztransfer/exception.hpp"
#include "oztransfer/logger.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <fmt/format.h>

namespace fs = boost::filesystem;
namespace pt = boost::property_tree;

namespace
{
    using log_env = oztransfer::log::environment;

    auto escape_xml(const std::string& _text) -> std::string
    {
        std::string escaped;
        escaped.reserve(_text.size());

        for (const auto c : _text) {
            // clang-format off
            switch (c) {
                case '&':  escaped += "&amp;";  break;
                case '<':  escaped += "&lt;";   break;
                case '>':  escaped += "&gt;";   break;
                case '"':  escaped += "&quot;"; break;
                case '\'': escaped += "&apos;"; break;
                default:   escaped += c;        break;
            }
            // clang-format on
        }

        return escaped;
    } // escape_xml
} // anonymous namespace

namespace oztransfer
{
    auto node_address_key(const std::string& _service_id, const std::string& _peer_id) -> std::string
    {
        return fmt::format("{}{}.{}", site_keys::om_address_prefix, _service_id, _peer_id);
    } // node_address_key

    auto build_site_config(const run_config& _config) -> site_config
    {
        site_config site;
        site.service_id = _config.service_id;

        auto& props = site.properties;

        props.push_back({site_keys::service_id, _config.service_id});

        for (const auto& peer : _config.peers) {
            props.push_back({node_address_key(_config.service_id, peer.id), fmt::format("{}:{}", peer.host, _config.om_port)});
        }

        props.push_back({site_keys::om_service_ids, _config.service_id});
        props.push_back({site_keys::om_nodes_prefix + _config.service_id, joined_peer_ids(_config)});

        props.push_back({site_keys::ofs_impl, "org.apache.hadoop.fs.ozone.OzoneFileSystem"});
        props.push_back({site_keys::ofs_abstract_impl, "org.apache.hadoop.fs.ozone.OzFs"});

        props.push_back({site_keys::security_enabled, _config.security_enabled ? "true" : "false"});

        props.push_back({site_keys::failover_max_attempts, std::to_string(_config.failover_max_attempts)});
        props.push_back({site_keys::connection_timeout, std::to_string(_config.connection_timeout_ms)});

        return site;
    } // build_site_config

    auto render_site_config(const site_config& _site) -> std::string
    {
        std::string doc = "<?xml version=\"1.0\"?>\n<configuration>\n";

        doc += fmt::format("  <!-- Remote service [{}] -->\n", escape_xml(_site.service_id));

        for (const auto& prop : _site.properties) {
            doc += fmt::format("  <property>\n"
                               "    <name>{}</name>\n"
                               "    <value>{}</value>\n"
                               "  </property>\n",
                               escape_xml(prop.name),
                               escape_xml(prop.value));
        }

        doc += "</configuration>\n";

        return doc;
    } // render_site_config

    auto prepare_config_directory(const run_config& _config) -> fs::path
    {
        const fs::path dir{_config.config_directory};

        boost::system::error_code ec;
        fs::create_directories(dir, ec);

        if (ec) {
            THROW(SITE_CONFIG_WRITE_FAILED, fmt::format("Cannot create config directory [{}]: {}", dir.string(), ec.message()));
        }

        const fs::path base{_config.base_config_directory};

        if (!fs::is_directory(base, ec)) {
            log_env::info("Base client config directory [{}] does not exist. Nothing to copy.", base.string());
            return dir;
        }

        for (fs::directory_iterator iter{base, ec}, end; !ec && iter != end; iter.increment(ec)) {
            boost::system::error_code status_ec;

            if (!fs::is_regular_file(iter->status(status_ec))) {
                continue;
            }

            boost::system::error_code copy_ec;
            fs::copy_file(iter->path(), dir / iter->path().filename(), fs::copy_options::overwrite_existing, copy_ec);

            if (copy_ec) {
                log_env::warn("Could not copy [{}] into [{}]: {}", iter->path().string(), dir.string(), copy_ec.message());
            }
        }

        if (ec) {
            log_env::warn("Error while reading base config directory [{}]: {}", base.string(), ec.message());
        }

        return dir;
    } // prepare_config_directory

    auto write_site_config(const site_config& _site, const fs::path& _directory) -> fs::path
    {
        const auto path = _directory / site_config_file_name;

        fs::ofstream out{path, std::ios::out | std::ios::trunc};

        if (!out) {
            THROW(SITE_CONFIG_WRITE_FAILED, fmt::format("Cannot open [{}] for writing.", path.string()));
        }

        out << render_site_config(_site);
        out.close();

        if (!out) {
            THROW(SITE_CONFIG_WRITE_FAILED, fmt::format("Failed to write [{}].", path.string()));
        }

        log_env::debug("Wrote site configuration [{}].", path.string());

        return path;
    } // write_site_config

    auto first_node_address(const fs::path& _path, const std::string& _service_id) -> std::optional<std::string>
    {
        pt::ptree tree;

        try {
            pt::read_xml(_path.string(), tree, pt::xml_parser::trim_whitespace);
        }
        catch (const pt::xml_parser_error& e) {
            THROW(SITE_CONFIG_READ_FAILED, fmt::format("Cannot parse [{}]: {}", _path.string(), e.what()));
        }

        const auto prefix = fmt::format("{}{}.", site_keys::om_address_prefix, _service_id);
        const auto configuration = tree.get_child_optional("configuration");

        if (!configuration) {
            return std::nullopt;
        }

        for (const auto& [tag, node] : *configuration) {
            if ("property" != tag) {
                continue;
            }

            const auto name = node.get<std::string>("name", std::string{});

            if (!boost::starts_with(name, prefix)) {
                continue;
            }

            if (auto value = boost::trim_copy(node.get<std::string>("value", std::string{})); !value.empty()) {
                return value;
            }
        }

        return std::nullopt;
    } // first_node_address
} // namespace oztransfer
