#include <catch2/catch.hpp>

#include "oztransfer/error_codes.hpp"
#include "oztransfer/exception.hpp"

namespace oz = oztransfer;

TEST_CASE("error names")
{
    CHECK(oz::error_name(SUCCESS_CODE) == "SUCCESS_CODE");
    CHECK(oz::error_name(MISSING_PARAMETER) == "MISSING_PARAMETER");
    CHECK(oz::error_name(LEADER_UNRESOLVED) == "LEADER_UNRESOLVED");
    CHECK(oz::error_name(DESTINATION_UNREACHABLE) == "DESTINATION_UNREACHABLE");
    CHECK(oz::error_name(-123456) == "UNKNOWN_ERROR");
}

TEST_CASE("each pre-flight category has its own exit code")
{
    // clang-format off
    CHECK(oz::exit_code_for(SUCCESS_CODE)              == 0);
    CHECK(oz::exit_code_for(CONFIG_FILE_NOT_FOUND)     == 2);
    CHECK(oz::exit_code_for(MISSING_PARAMETER)         == 2);
    CHECK(oz::exit_code_for(INVALID_PARAMETER)         == 2);
    CHECK(oz::exit_code_for(MISSING_LIBRARY)           == 3);
    CHECK(oz::exit_code_for(SITE_CONFIG_WRITE_FAILED)  == 3);
    CHECK(oz::exit_code_for(LEADER_UNRESOLVED)         == 4);
    CHECK(oz::exit_code_for(UNPARSEABLE_PATH)          == 5);
    CHECK(oz::exit_code_for(MANIFEST_EMPTY)            == 5);
    CHECK(oz::exit_code_for(KERBEROS_LOGIN_FAILED)     == 6);
    CHECK(oz::exit_code_for(SOURCE_UNREACHABLE)        == 7);
    CHECK(oz::exit_code_for(DESTINATION_UNREACHABLE)   == 7);
    CHECK(oz::exit_code_for(STAGING_FAILED)            == 8);
    CHECK(oz::exit_code_for(PROCESS_LAUNCH_FAILED)     == 9);
    CHECK(oz::exit_code_for(SYS_INTERNAL_ERR)          == 10);
    // clang-format on
}

TEST_CASE("error categories")
{
    CHECK(oz::error_category_of(INVALID_PARAMETER) == oz::error_category::configuration);
    CHECK(oz::error_category_of(MISSING_LIBRARY) == oz::error_category::environment);
    CHECK(oz::to_string(oz::error_category::configuration) == "ConfigurationError");
    CHECK(oz::to_string(oz::error_category::connectivity) == "ConnectivityError");
}

TEST_CASE("exception")
{
    try {
        THROW(UNPARSEABLE_PATH, "bad entry");
    }
    catch (const oz::exception& e) {
        CHECK(e.code() == UNPARSEABLE_PATH);
        CHECK(std::string{e.client_display_what()} == "UNPARSEABLE_PATH: bad entry\n");

        const std::string report = e.what();
        CHECK(report.find("bad entry") != std::string::npos);
        CHECK(report.find(std::to_string(UNPARSEABLE_PATH)) != std::string::npos);
        CHECK(report.find("test_error_codes.cpp") != std::string::npos);
    }

    SECTION("message stack")
    {
        oz::exception e{STAGING_FAILED, "first", __FILE__, __LINE__, __func__};
        e.add_message("second");

        REQUIRE(e.message_stack().size() == 2);
        CHECK(std::string{e.client_display_what()} == "STAGING_FAILED: first\nsecond\n");
    }
}
