#ifndef OZTRANSFER_RUN_CONFIG_HPP
#define OZTRANSFER_RUN_CONFIG_HPP

/// \file

#include <cstddef>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace oztransfer
{
    namespace config_keys
    {
        // clang-format off
        inline constexpr const char* target_ozone_service     = "TARGET_OZONE_SERVICE";
        inline constexpr const char* om_node_labels           = "OZONE_OM_NODE_LABELS";
        inline constexpr const char* om_port                  = "OZONE_OM_PORT";
        inline constexpr const char* manifest_file            = "SOURCE_DISTCP_FILE";
        inline constexpr const char* library_directory        = "OZONE_JARS_PATH";
        inline constexpr const char* config_directory         = "CUSTOM_CONF_DIR";
        inline constexpr const char* keytab                   = "KERBEROS_KEYTAB";
        inline constexpr const char* principal                = "KERBEROS_PRINCIPAL";
        inline constexpr const char* bandwidth_mb             = "DISTCP_BANDWIDTH_MB";
        inline constexpr const char* mapper_count             = "DISTCP_NUM_MAPS";
        inline constexpr const char* memory_mb                = "DISTCP_MEMORY_MB";

        inline constexpr const char* kerberos_enabled         = "KERBEROS_ENABLED";
        inline constexpr const char* staging_directory        = "HCFS_BASE_DIR";
        inline constexpr const char* base_config_directory    = "HADOOP_BASE_CONF_DIR";
        inline constexpr const char* source_root_prefix       = "SOURCE_ROOT_PREFIX";
        inline constexpr const char* queue_name               = "DISTCP_QUEUE";
        inline constexpr const char* log_directory_prefix     = "DISTCP_LOG_DIR_PREFIX";
        inline constexpr const char* security_enabled         = "OZONE_SECURITY_ENABLED";
        inline constexpr const char* failover_max_attempts    = "OZONE_CLIENT_FAILOVER_MAX_ATTEMPTS";
        inline constexpr const char* connection_timeout_ms    = "OZONE_CLIENT_CONNECTION_TIMEOUT_MS";

        // Suffixes appended to each peer label to form its keys (e.g. OM92_ID, OM92_HOST).
        inline constexpr const char* peer_id_suffix           = "_ID";
        inline constexpr const char* peer_host_suffix         = "_HOST";
        // clang-format on
    } // namespace config_keys

    namespace config_defaults
    {
        // clang-format off
        inline constexpr const char* om_node_labels           = "OM92,OM94,OM93";
        inline constexpr const char* staging_directory        = "/tmp/distcp";
        inline constexpr const char* base_config_directory    = "/etc/hadoop/conf";
        inline constexpr const char* source_root_prefix       = "data/";
        inline constexpr const char* queue_name               = "default";
        inline constexpr const char* log_directory_prefix     = "/tmp/distcp-logs-";
        inline constexpr int         failover_max_attempts    = 15;
        inline constexpr int         connection_timeout_ms    = 30000;
        // clang-format on
    } // namespace config_defaults

    // The minimum number of peers a quorum-replicated service can be configured with.
    inline constexpr std::size_t minimum_peer_count = 3;

    struct peer_node
    {
        std::string id;
        std::string host;
    }; // struct peer_node

    inline auto operator==(const peer_node& _lhs, const peer_node& _rhs) noexcept -> bool
    {
        return _lhs.id == _rhs.id && _lhs.host == _rhs.host;
    }

    struct transfer_tuning
    {
        int bandwidth_mb_per_mapper;
        int mapper_count;
        int memory_mb_per_mapper;
    }; // struct transfer_tuning

    /// The validated settings of a single run.
    ///
    /// Instances are only produced by make_run_config() and load_run_config(),
    /// which guarantee that every required field is non-empty. The object is
    /// passed by const reference to every stage of the pipeline.
    struct run_config
    {
        std::string service_id;
        std::vector<peer_node> peers;
        int om_port;

        std::string manifest_path;
        std::string library_directory;
        std::string config_directory;
        std::string base_config_directory;

        bool kerberos_enabled;
        std::string keytab;
        std::string principal;

        transfer_tuning tuning;

        std::string staging_directory;
        std::string source_root_prefix;
        std::string queue_name;
        std::string log_directory_prefix;

        bool security_enabled;
        int failover_max_attempts;
        int connection_timeout_ms;
    }; // struct run_config

    using settings_map = std::map<std::string, std::string>;

    struct validation_report
    {
        // Keys that are absent or empty, in the order they are checked.
        std::vector<std::string> missing_keys;

        // Human readable descriptions of values that are present but unusable.
        std::vector<std::string> invalid_values;

        auto ok() const noexcept -> bool { return missing_keys.empty() && invalid_values.empty(); }
    }; // struct validation_report

    /// Parses shell-style KEY=value assignments.
    ///
    /// Blank lines and comments are skipped, a leading "export " is accepted and
    /// matching surrounding quotes are removed. Lines without an '=' are skipped
    /// with a warning. Later assignments override earlier ones.
    auto parse_settings(std::istream& _in) -> settings_map;

    /// \throws oztransfer::exception CONFIG_FILE_NOT_FOUND if \p _path cannot be opened.
    auto parse_settings_file(const std::string& _path) -> settings_map;

    /// Returns the peer labels named by OZONE_OM_NODE_LABELS, or the default labels.
    auto peer_labels(const settings_map& _settings) -> std::vector<std::string>;

    /// Checks every required key and every numeric or boolean value.
    ///
    /// All problems are collected. Nothing stops at the first one.
    auto validate_settings(const settings_map& _settings) -> validation_report;

    /// \throws oztransfer::exception MISSING_PARAMETER when any required key is
    ///         absent, otherwise INVALID_PARAMETER when any value is unusable. The
    ///         message names every offending key.
    auto make_run_config(const settings_map& _settings) -> run_config;

    auto load_run_config(const std::string& _path) -> run_config;

    /// Comma separated peer ids in configured order (e.g. "om92,om94,om93").
    auto joined_peer_ids(const run_config& _config) -> std::string;
} // namespace oztransfer

#endif // OZTRANSFER_RUN_CONFIG_HPP
