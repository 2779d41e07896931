#include "oztransfer/run_config.hpp"

#include "oztransfer/error_codes.hpp"
#include "oztransfer/exception.hpp"
#include "oztransfer/logger.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <istream>
#include <optional>
#include <set>

namespace
{
    namespace keys = oztransfer::config_keys;
    namespace defaults = oztransfer::config_defaults;

    using log_config = oztransfer::log::config;

    auto lookup(const oztransfer::settings_map& _settings, const std::string& _key) -> std::optional<std::string>
    {
        if (const auto iter = _settings.find(_key); iter != std::end(_settings) && !iter->second.empty()) {
            return iter->second;
        }

        return std::nullopt;
    } // lookup

    auto value_or(const oztransfer::settings_map& _settings, const std::string& _key, const std::string& _default)
        -> std::string
    {
        return lookup(_settings, _key).value_or(_default);
    } // value_or

    // Strips matching quotes, or an inline comment from an unquoted value.
    auto unquote(const std::string& _value, bool& _ok) -> std::string
    {
        _ok = true;

        if (_value.empty()) {
            return _value;
        }

        if (const auto quote = _value.front(); quote == '"' || quote == '\'') {
            const auto closing = _value.find(quote, 1);

            if (std::string::npos == closing) {
                _ok = false;
                return {};
            }

            return _value.substr(1, closing - 1);
        }

        auto value = _value;

        for (std::string::size_type i = 1; i < value.size(); ++i) {
            if ('#' == value[i] && std::isspace(static_cast<unsigned char>(value[i - 1]))) {
                value.erase(i);
                break;
            }
        }

        boost::trim(value);

        return value;
    } // unquote

    auto parse_positive_int(const std::string& _value) -> std::optional<int>
    {
        try {
            if (const auto v = boost::lexical_cast<int>(_value); v > 0) {
                return v;
            }
        }
        catch (const boost::bad_lexical_cast&) {
            return std::nullopt;
        }

        return std::nullopt;
    } // parse_positive_int

    auto parse_bool(const std::string& _value) -> std::optional<bool>
    {
        if (boost::iequals(_value, "true")) {
            return true;
        }

        if (boost::iequals(_value, "false")) {
            return false;
        }

        return std::nullopt;
    } // parse_bool

    auto check_positive_int(const oztransfer::settings_map& _settings,
                            const std::string& _key,
                            oztransfer::validation_report& _report) -> void
    {
        if (const auto value = lookup(_settings, _key); value && !parse_positive_int(*value)) {
            _report.invalid_values.push_back(fmt::format("{} must be a positive integer [value={}]", _key, *value));
        }
    } // check_positive_int

    auto check_bool(const oztransfer::settings_map& _settings,
                    const std::string& _key,
                    oztransfer::validation_report& _report) -> void
    {
        if (const auto value = lookup(_settings, _key); value && !parse_bool(*value)) {
            _report.invalid_values.push_back(fmt::format("{} must be 'true' or 'false' [value={}]", _key, *value));
        }
    } // check_bool
} // anonymous namespace

namespace oztransfer
{
    auto parse_settings(std::istream& _in) -> settings_map
    {
        settings_map settings;
        std::string line;
        int line_number = 0;

        while (std::getline(_in, line)) {
            ++line_number;
            boost::trim(line);

            if (line.empty() || '#' == line.front()) {
                continue;
            }

            if (boost::starts_with(line, "export ")) {
                line.erase(0, 7);
                boost::trim_left(line);
            }

            const auto pos = line.find('=');

            if (std::string::npos == pos) {
                log_config::warn("Ignoring line {} with no assignment [{}].", line_number, line);
                continue;
            }

            auto key = boost::trim_copy(line.substr(0, pos));

            if (key.empty() || std::any_of(std::begin(key), std::end(key), [](unsigned char c) { return std::isspace(c); })) {
                log_config::warn("Ignoring line {} with invalid key [{}].", line_number, key);
                continue;
            }

            bool ok = true;
            auto value = unquote(boost::trim_copy(line.substr(pos + 1)), ok);

            if (!ok) {
                log_config::warn("Ignoring line {} with unterminated quote [{}].", line_number, line);
                continue;
            }

            log_config::trace("Read setting [{}] from line {}.", key, line_number);
            settings.insert_or_assign(std::move(key), std::move(value));
        }

        return settings;
    } // parse_settings

    auto parse_settings_file(const std::string& _path) -> settings_map
    {
        std::ifstream in{_path};

        if (!in) {
            THROW(CONFIG_FILE_NOT_FOUND, fmt::format("Config file not found: {}", _path));
        }

        return parse_settings(in);
    } // parse_settings_file

    auto peer_labels(const settings_map& _settings) -> std::vector<std::string>
    {
        const auto joined = value_or(_settings, keys::om_node_labels, defaults::om_node_labels);

        std::vector<std::string> labels;
        boost::split(labels, joined, boost::is_any_of(","));

        for (auto& label : labels) {
            boost::trim(label);
        }

        labels.erase(std::remove(std::begin(labels), std::end(labels), std::string{}), std::end(labels));

        return labels;
    } // peer_labels

    auto validate_settings(const settings_map& _settings) -> validation_report
    {
        validation_report report;

        const auto require = [&](const std::string& _key) {
            if (!lookup(_settings, _key)) {
                report.missing_keys.push_back(_key);
            }
        };

        const auto labels = peer_labels(_settings);

        require(keys::target_ozone_service);

        for (const auto& label : labels) {
            require(label + keys::peer_id_suffix);
        }

        for (const auto& label : labels) {
            require(label + keys::peer_host_suffix);
        }

        require(keys::om_port);
        require(keys::manifest_file);
        require(keys::library_directory);
        require(keys::config_directory);
        require(keys::keytab);
        require(keys::principal);
        require(keys::bandwidth_mb);
        require(keys::mapper_count);
        require(keys::memory_mb);

        if (labels.size() < minimum_peer_count) {
            report.invalid_values.push_back(fmt::format("{} must name at least {} peers [value={}]",
                                                        keys::om_node_labels,
                                                        minimum_peer_count,
                                                        fmt::join(labels, ",")));
        }

        std::set<std::string> seen_labels;
        std::set<std::string> seen_ids;

        for (const auto& label : labels) {
            if (!seen_labels.insert(label).second) {
                report.invalid_values.push_back(fmt::format("{} lists [{}] more than once", keys::om_node_labels, label));
                continue;
            }

            if (const auto id = lookup(_settings, label + keys::peer_id_suffix); id && !seen_ids.insert(*id).second) {
                report.invalid_values.push_back(
                    fmt::format("{}{} duplicates peer id [{}]", label, keys::peer_id_suffix, *id));
            }
        }

        if (const auto port = lookup(_settings, keys::om_port); port) {
            if (const auto v = parse_positive_int(*port); !v || *v > 65535) {
                report.invalid_values.push_back(fmt::format("{} must be in the range 1-65535 [value={}]", keys::om_port, *port));
            }
        }

        check_positive_int(_settings, keys::bandwidth_mb, report);
        check_positive_int(_settings, keys::mapper_count, report);
        check_positive_int(_settings, keys::memory_mb, report);
        check_positive_int(_settings, keys::failover_max_attempts, report);
        check_positive_int(_settings, keys::connection_timeout_ms, report);
        check_bool(_settings, keys::kerberos_enabled, report);
        check_bool(_settings, keys::security_enabled, report);

        return report;
    } // validate_settings

    auto make_run_config(const settings_map& _settings) -> run_config
    {
        const auto report = validate_settings(_settings);

        if (!report.ok()) {
            std::string msg;

            if (!report.missing_keys.empty()) {
                msg = fmt::format("Missing required parameters: {}", fmt::join(report.missing_keys, ", "));
            }

            for (const auto& problem : report.invalid_values) {
                if (!msg.empty()) {
                    msg += '\n';
                }

                msg += fmt::format("Invalid parameter: {}", problem);
            }

            THROW(report.missing_keys.empty() ? INVALID_PARAMETER : MISSING_PARAMETER, msg);
        }

        const auto get = [&_settings](const std::string& _key) { return *lookup(_settings, _key); };

        run_config config{};

        config.service_id = get(keys::target_ozone_service);

        for (const auto& label : peer_labels(_settings)) {
            config.peers.push_back({get(label + keys::peer_id_suffix), get(label + keys::peer_host_suffix)});
        }

        config.om_port = *parse_positive_int(get(keys::om_port));
        config.manifest_path = get(keys::manifest_file);
        config.library_directory = get(keys::library_directory);
        config.config_directory = get(keys::config_directory);
        config.base_config_directory = value_or(_settings, keys::base_config_directory, defaults::base_config_directory);

        config.kerberos_enabled = parse_bool(value_or(_settings, keys::kerberos_enabled, "false")).value_or(false);
        config.keytab = get(keys::keytab);
        config.principal = get(keys::principal);

        config.tuning.bandwidth_mb_per_mapper = *parse_positive_int(get(keys::bandwidth_mb));
        config.tuning.mapper_count = *parse_positive_int(get(keys::mapper_count));
        config.tuning.memory_mb_per_mapper = *parse_positive_int(get(keys::memory_mb));

        config.staging_directory = value_or(_settings, keys::staging_directory, defaults::staging_directory);
        config.source_root_prefix = value_or(_settings, keys::source_root_prefix, defaults::source_root_prefix);
        config.queue_name = value_or(_settings, keys::queue_name, defaults::queue_name);
        config.log_directory_prefix = value_or(_settings, keys::log_directory_prefix, defaults::log_directory_prefix);

        config.security_enabled = parse_bool(value_or(_settings, keys::security_enabled, "true")).value_or(true);
        config.failover_max_attempts = lookup(_settings, keys::failover_max_attempts)
                                           ? *parse_positive_int(get(keys::failover_max_attempts))
                                           : defaults::failover_max_attempts;
        config.connection_timeout_ms = lookup(_settings, keys::connection_timeout_ms)
                                           ? *parse_positive_int(get(keys::connection_timeout_ms))
                                           : defaults::connection_timeout_ms;

        return config;
    } // make_run_config

    auto load_run_config(const std::string& _path) -> run_config
    {
        log_config::debug("Loading settings from [{}].", _path);
        return make_run_config(parse_settings_file(_path));
    } // load_run_config

    auto joined_peer_ids(const run_config& _config) -> std::string
    {
        std::vector<std::string> ids;
        ids.reserve(_config.peers.size());

        for (const auto& peer : _config.peers) {
            ids.push_back(peer.id);
        }

        return boost::join(ids, ",");
    } // joined_peer_ids
} // namespace oztransfer
