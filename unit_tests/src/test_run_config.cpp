#include <catch2/catch.hpp>

#include "oztransfer_error_matcher.hpp"
#include "test_support.hpp"

#include "oztransfer/run_config.hpp"

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

namespace oz = oztransfer;

namespace
{
    auto complete_settings() -> oz::settings_map
    {
        return {
            {"TARGET_OZONE_SERVICE", "ozone1"},
            {"OM92_ID", "om92"},
            {"OM94_ID", "om94"},
            {"OM93_ID", "om93"},
            {"OM92_HOST", "om92.example.org"},
            {"OM94_HOST", "om94.example.org"},
            {"OM93_HOST", "om93.example.org"},
            {"OZONE_OM_PORT", "9862"},
            {"SOURCE_DISTCP_FILE", "/tmp/hdfs_db4_distcp_source.txt"},
            {"OZONE_JARS_PATH", "/opt/ozone/share/ozone/lib"},
            {"CUSTOM_CONF_DIR", "/tmp/ozone-conf"},
            {"KERBEROS_KEYTAB", "/etc/security/keytabs/hive.keytab"},
            {"KERBEROS_PRINCIPAL", "hive@EXAMPLE.ORG"},
            {"DISTCP_BANDWIDTH_MB", "50"},
            {"DISTCP_NUM_MAPS", "20"},
            {"DISTCP_MEMORY_MB", "4096"}
        };
    }

    const std::vector<std::string> required_keys{
        "TARGET_OZONE_SERVICE", "OM92_ID", "OM94_ID", "OM93_ID", "OM92_HOST", "OM94_HOST", "OM93_HOST",
        "OZONE_OM_PORT", "SOURCE_DISTCP_FILE", "OZONE_JARS_PATH", "CUSTOM_CONF_DIR", "KERBEROS_KEYTAB",
        "KERBEROS_PRINCIPAL", "DISTCP_BANDWIDTH_MB", "DISTCP_NUM_MAPS", "DISTCP_MEMORY_MB"
    };
} // anonymous namespace

TEST_CASE("parse_settings")
{
    SECTION("comments, exports, quotes and whitespace")
    {
        std::istringstream in{R"_(
# Remote cluster
export TARGET_OZONE_SERVICE="ozone1"
  OZONE_OM_PORT = 9862   # client RPC port
KERBEROS_PRINCIPAL='hive@EXAMPLE.ORG'
HCFS_BASE_DIR="/tmp/with # hash"
not an assignment
DISTCP_NUM_MAPS=10
DISTCP_NUM_MAPS=20
)_"};

        const auto settings = oz::parse_settings(in);

        CHECK(settings.at("TARGET_OZONE_SERVICE") == "ozone1");
        CHECK(settings.at("OZONE_OM_PORT") == "9862");
        CHECK(settings.at("KERBEROS_PRINCIPAL") == "hive@EXAMPLE.ORG");
        CHECK(settings.at("HCFS_BASE_DIR") == "/tmp/with # hash");
        CHECK(settings.at("DISTCP_NUM_MAPS") == "20");
        CHECK(settings.size() == 5);
    }

    SECTION("missing file")
    {
        REQUIRE_THROWS_MATCHES(oz::parse_settings_file("/nonexistent/oztransfer.conf"),
                               oz::exception,
                               has_error_code(CONFIG_FILE_NOT_FOUND));
    }
}

TEST_CASE("make_run_config builds a complete configuration")
{
    const auto config = oz::make_run_config(complete_settings());

    CHECK(config.service_id == "ozone1");
    REQUIRE(config.peers.size() == 3);
    CHECK(config.peers[0] == oz::peer_node{"om92", "om92.example.org"});
    CHECK(config.peers[1] == oz::peer_node{"om94", "om94.example.org"});
    CHECK(config.peers[2] == oz::peer_node{"om93", "om93.example.org"});
    CHECK(config.om_port == 9862);
    CHECK(config.tuning.bandwidth_mb_per_mapper == 50);
    CHECK(config.tuning.mapper_count == 20);
    CHECK(config.tuning.memory_mb_per_mapper == 4096);
    CHECK(oz::joined_peer_ids(config) == "om92,om94,om93");

    SECTION("optional keys take their defaults")
    {
        CHECK_FALSE(config.kerberos_enabled);
        CHECK(config.staging_directory == "/tmp/distcp");
        CHECK(config.base_config_directory == "/etc/hadoop/conf");
        CHECK(config.source_root_prefix == "data/");
        CHECK(config.queue_name == "default");
        CHECK(config.log_directory_prefix == "/tmp/distcp-logs-");
        CHECK(config.security_enabled);
        CHECK(config.failover_max_attempts == 15);
        CHECK(config.connection_timeout_ms == 30000);
    }

    SECTION("optional keys can be overridden")
    {
        auto settings = complete_settings();
        settings["KERBEROS_ENABLED"] = "TRUE";
        settings["HCFS_BASE_DIR"] = "/user/hive/distcp";
        settings["OZONE_CLIENT_FAILOVER_MAX_ATTEMPTS"] = "3";

        const auto overridden = oz::make_run_config(settings);

        CHECK(overridden.kerberos_enabled);
        CHECK(overridden.staging_directory == "/user/hive/distcp");
        CHECK(overridden.failover_max_attempts == 3);
    }
}

TEST_CASE("missing keys are reported exactly")
{
    SECTION("each required key on its own")
    {
        for (const auto& key : required_keys) {
            auto settings = complete_settings();
            settings.erase(key);

            const auto report = oz::validate_settings(settings);
            CHECK(report.missing_keys == std::vector<std::string>{key});
        }
    }

    SECTION("an empty value counts as missing")
    {
        auto settings = complete_settings();
        settings["KERBEROS_KEYTAB"] = "";

        CHECK(oz::validate_settings(settings).missing_keys == std::vector<std::string>{"KERBEROS_KEYTAB"});
    }

    SECTION("several missing keys")
    {
        auto settings = complete_settings();
        settings.erase("OM94_HOST");
        settings.erase("DISTCP_MEMORY_MB");
        settings.erase("TARGET_OZONE_SERVICE");

        const auto report = oz::validate_settings(settings);
        CHECK(report.missing_keys == std::vector<std::string>{"TARGET_OZONE_SERVICE", "OM94_HOST", "DISTCP_MEMORY_MB"});

        REQUIRE_THROWS_MATCHES(oz::make_run_config(settings), oz::exception, has_error_code(MISSING_PARAMETER));
        REQUIRE_THROWS_WITH(oz::make_run_config(settings),
                            Catch::Contains("TARGET_OZONE_SERVICE, OM94_HOST, DISTCP_MEMORY_MB"));
    }

    SECTION("nothing at all")
    {
        const auto report = oz::validate_settings({});
        CHECK(report.missing_keys == required_keys);
    }
}

TEST_CASE("invalid values")
{
    auto settings = complete_settings();

    SECTION("port out of range")
    {
        settings["OZONE_OM_PORT"] = "70000";
        REQUIRE_THROWS_MATCHES(oz::make_run_config(settings), oz::exception, has_error_code(INVALID_PARAMETER));
    }

    SECTION("non-numeric tuning")
    {
        settings["DISTCP_NUM_MAPS"] = "twenty";
        settings["DISTCP_MEMORY_MB"] = "-1";

        const auto report = oz::validate_settings(settings);
        CHECK(report.missing_keys.empty());
        CHECK(report.invalid_values.size() == 2);
    }

    SECTION("duplicate peer ids")
    {
        settings["OM93_ID"] = "om92";
        REQUIRE_THROWS_MATCHES(oz::make_run_config(settings), oz::exception, has_error_code(INVALID_PARAMETER));
    }

    SECTION("fewer than three peers")
    {
        settings["OZONE_OM_NODE_LABELS"] = "OM92,OM94";
        REQUIRE_THROWS_MATCHES(oz::make_run_config(settings), oz::exception, has_error_code(INVALID_PARAMETER));
    }

    SECTION("invalid boolean")
    {
        settings["KERBEROS_ENABLED"] = "maybe";
        REQUIRE_THROWS_MATCHES(oz::make_run_config(settings), oz::exception, has_error_code(INVALID_PARAMETER));
    }

    SECTION("missing keys take precedence over invalid values")
    {
        settings["OZONE_OM_PORT"] = "0";
        settings.erase("KERBEROS_PRINCIPAL");

        REQUIRE_THROWS_MATCHES(oz::make_run_config(settings), oz::exception, has_error_code(MISSING_PARAMETER));
        REQUIRE_THROWS_WITH(oz::make_run_config(settings), Catch::Contains("OZONE_OM_PORT"));
    }
}

TEST_CASE("custom peer labels")
{
    auto settings = complete_settings();
    settings["OZONE_OM_NODE_LABELS"] = "OM1, OM2, OM3, OM4";

    CHECK(oz::peer_labels(settings) == std::vector<std::string>{"OM1", "OM2", "OM3", "OM4"});

    const auto report = oz::validate_settings(settings);
    CHECK(std::count(std::begin(report.missing_keys), std::end(report.missing_keys), "OM4_HOST") == 1);
    CHECK(report.missing_keys.size() == 8);

    settings["OM1_ID"] = "a";
    settings["OM2_ID"] = "b";
    settings["OM3_ID"] = "c";
    settings["OM4_ID"] = "d";
    settings["OM1_HOST"] = "a.example.org";
    settings["OM2_HOST"] = "b.example.org";
    settings["OM3_HOST"] = "c.example.org";
    settings["OM4_HOST"] = "d.example.org";

    const auto config = oz::make_run_config(settings);
    CHECK(oz::joined_peer_ids(config) == "a,b,c,d");
}

TEST_CASE("load_run_config reads a settings file")
{
    test_support::temporary_directory dir;
    const auto path = dir / "transfer.conf";

    std::string contents;
    for (const auto& [key, value] : complete_settings()) {
        contents += key + "=\"" + value + "\"\n";
    }
    test_support::write_file(path, contents);

    const auto config = oz::load_run_config(path.string());
    CHECK(config.service_id == "ozone1");
    CHECK(config.peers.size() == 3);
}
