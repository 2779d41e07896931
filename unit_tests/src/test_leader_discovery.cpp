#include <catch2/catch.hpp>

#include "oztransfer_error_matcher.hpp"
#include "test_support.hpp"

#include "oztransfer/leader_discovery.hpp"
#include "oztransfer/site_config.hpp"

#include <memory>
#include <vector>

namespace oz = oztransfer;
namespace ts = test_support;

namespace
{
    const char* const roles_with_leader = R"_(om92 : FOLLOWER (om92.example.org)
om94 : LEADER (om94.example.org)
om93 : FOLLOWER (om93.example.org)
)_";

    auto make_config() -> oz::run_config
    {
        oz::run_config config{};
        config.service_id = "ozone1";
        config.peers = {{"om92", "om92.example.org"}, {"om94", "om94.example.org"}, {"om93", "om93.example.org"}};
        config.om_port = 9862;
        config.security_enabled = true;
        config.failover_max_attempts = 15;
        config.connection_timeout_ms = 30000;
        return config;
    }

    class static_strategy : public oz::discovery_strategy
    {
    public:
        explicit static_strategy(std::optional<oz::leader_info> _answer)
            : answer_{std::move(_answer)}
        {
        }

        auto name() const -> std::string_view override { return "static"; }

        auto discover(const oz::run_config&) -> std::optional<oz::leader_info> override
        {
            ++calls;
            return answer_;
        }

        int calls = 0;

    private:
        std::optional<oz::leader_info> answer_;
    };
} // anonymous namespace

TEST_CASE("parse_leader_host")
{
    CHECK(oz::parse_leader_host(roles_with_leader) == "om94.example.org");

    SECTION("surrounding whitespace in the parentheses is removed")
    {
        CHECK(oz::parse_leader_host("om93 : LEADER ( om93.example.org )\n") == "om93.example.org");
    }

    SECTION("the first leader line wins")
    {
        CHECK(oz::parse_leader_host("a : LEADER (first)\nb : LEADER (second)\n") == "first");
    }

    SECTION("no leader line")
    {
        CHECK_FALSE(oz::parse_leader_host("om92 : FOLLOWER (om92.example.org)\n"));
        CHECK_FALSE(oz::parse_leader_host(""));
    }

    SECTION("LEADER must be a separate word")
    {
        CHECK_FALSE(oz::parse_leader_host("om92 : NOT_LEADER (om92.example.org)\n"));
    }

    SECTION("leader line without a host")
    {
        CHECK_FALSE(oz::parse_leader_host("om94 : LEADER\n"));
        CHECK_FALSE(oz::parse_leader_host("om94 : LEADER ()\n"));
        CHECK_FALSE(oz::parse_leader_host("om94 : LEADER (om94.example.org\n"));
    }
}

TEST_CASE("host_from_address")
{
    CHECK(oz::host_from_address("om92.example.org:9862") == "om92.example.org");
    CHECK(oz::host_from_address("om92.example.org") == "om92.example.org");
}

TEST_CASE("role_query_strategy")
{
    const auto config = make_config();
    const oz::execution_environment env;
    ts::fake_command_runner runner;

    SECTION("leader found")
    {
        runner.on("ozone admin om roles -id ozone1", ts::success(roles_with_leader));

        oz::role_query_strategy strategy{runner, env};
        const auto leader = strategy.discover(config);

        REQUIRE(leader);
        CHECK(leader->host == "om94.example.org");
        CHECK(leader->address == "om94.example.org:9862");
        CHECK(leader->state == oz::resolution::resolved);

        REQUIRE(runner.commands().size() == 1);
        CHECK(runner.commands()[0].mode == oz::output_mode::capture);
    }

    SECTION("query fails")
    {
        runner.on("ozone admin om roles", ts::failure(255, roles_with_leader));

        oz::role_query_strategy strategy{runner, env};
        CHECK_FALSE(strategy.discover(config));
    }

    SECTION("query program cannot be started")
    {
        runner.fail_to_launch("ozone");

        oz::role_query_strategy strategy{runner, env};
        CHECK_FALSE(strategy.discover(config));
        CHECK(runner.count("ozone admin om roles") == 1);
    }

    SECTION("no leader in the output")
    {
        runner.on("ozone admin om roles", ts::success("om92 : FOLLOWER (om92.example.org)\n"));

        oz::role_query_strategy strategy{runner, env};
        CHECK_FALSE(strategy.discover(config));
    }
}

TEST_CASE("site_config_strategy")
{
    ts::temporary_directory dir;
    const auto config = make_config();

    SECTION("first node address")
    {
        const auto path = oz::write_site_config(oz::build_site_config(config), dir.path());

        oz::site_config_strategy strategy{path};
        const auto leader = strategy.discover(config);

        REQUIRE(leader);
        CHECK(leader->address == "om92.example.org:9862");
        CHECK(leader->host == "om92.example.org");
        CHECK(leader->state == oz::resolution::fallback_resolved);
    }

    SECTION("unreadable file")
    {
        oz::site_config_strategy strategy{dir / "missing.xml"};
        CHECK_FALSE(strategy.discover(config));
    }
}

TEST_CASE("discover_leader")
{
    const auto config = make_config();

    SECTION("strategies are tried in order")
    {
        auto first = std::make_unique<static_strategy>(std::nullopt);
        auto second = std::make_unique<static_strategy>(oz::leader_info{"b", "b:1", oz::resolution::fallback_resolved});
        auto third = std::make_unique<static_strategy>(oz::leader_info{"c", "c:1", oz::resolution::resolved});

        auto* first_ptr = first.get();
        auto* third_ptr = third.get();

        std::vector<std::unique_ptr<oz::discovery_strategy>> strategies;
        strategies.push_back(std::move(first));
        strategies.push_back(std::move(second));
        strategies.push_back(std::move(third));

        const auto leader = oz::discover_leader(config, strategies);

        CHECK(leader.host == "b");
        CHECK(first_ptr->calls == 1);
        CHECK(third_ptr->calls == 0);
    }

    SECTION("nothing resolves")
    {
        std::vector<std::unique_ptr<oz::discovery_strategy>> strategies;
        strategies.push_back(std::make_unique<static_strategy>(std::nullopt));

        REQUIRE_THROWS_MATCHES(oz::discover_leader(config, strategies),
                               oz::exception,
                               has_error_code(LEADER_UNRESOLVED));
    }

    SECTION("role query that cannot be started falls back to the first peer")
    {
        ts::temporary_directory dir;
        const auto path = oz::write_site_config(oz::build_site_config(config), dir.path());

        const oz::execution_environment env;
        ts::fake_command_runner runner;
        runner.fail_to_launch("ozone");

        std::vector<std::unique_ptr<oz::discovery_strategy>> strategies;
        strategies.push_back(std::make_unique<oz::role_query_strategy>(runner, env));
        strategies.push_back(std::make_unique<oz::site_config_strategy>(path));

        const auto leader = oz::discover_leader(config, strategies);

        CHECK(leader.address == "om92.example.org:9862");
        CHECK(leader.state == oz::resolution::fallback_resolved);
    }

    SECTION("role query without a leader falls back to the first peer")
    {
        ts::temporary_directory dir;
        const auto path = oz::write_site_config(oz::build_site_config(config), dir.path());

        const oz::execution_environment env;
        ts::fake_command_runner runner;
        runner.on("ozone admin om roles", ts::success("om92 : FOLLOWER (om92.example.org)\n"));

        std::vector<std::unique_ptr<oz::discovery_strategy>> strategies;
        strategies.push_back(std::make_unique<oz::role_query_strategy>(runner, env));
        strategies.push_back(std::make_unique<oz::site_config_strategy>(path));

        const auto leader = oz::discover_leader(config, strategies);

        CHECK(leader.address == "om92.example.org:9862");
        CHECK(leader.state == oz::resolution::fallback_resolved);
    }
}
