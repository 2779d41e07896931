#include "oztransfer/kerberos.hpp"

#include "oztransfer/error_codes.hpp"
#include "oztransfer/exception.hpp"
#include "oztransfer/logger.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem/operations.hpp>
#include <fmt/format.h>

#include <sstream>

namespace
{
    using log_orch = oztransfer::log::orchestrator;

    auto first_lines(const std::string& _text, int _count) -> std::string
    {
        std::istringstream in{_text};
        std::string out;

        for (std::string line; _count > 0 && std::getline(in, line); --_count) {
            out += line;
            out += '\n';
        }

        return out;
    } // first_lines
} // anonymous namespace

namespace oztransfer
{
    auto make_kinit_command(const run_config& _config) -> command
    {
        return {"kinit", {"-kt", _config.keytab, _config.principal}, output_mode::capture_merged};
    } // make_kinit_command

    auto kinit_login(const run_config& _config, command_runner& _runner, const execution_environment& _env) -> bool
    {
        if (!_config.kerberos_enabled) {
            log_orch::debug("Ticket login disabled. Skipping.");
            return false;
        }

        boost::system::error_code ec;

        if (!boost::filesystem::is_regular_file(_config.keytab, ec)) {
            THROW(KEYTAB_NOT_FOUND, fmt::format("Keytab [{}] does not exist.", _config.keytab));
        }

        const auto login = _runner.run(make_kinit_command(_config), _env);

        if (!login.ok()) {
            THROW(KERBEROS_LOGIN_FAILED,
                  fmt::format("kinit for principal [{}] exited with status [{}]: {}",
                              _config.principal,
                              login.exit_code,
                              boost::trim_copy(login.standard_output)));
        }

        fmt::print("✓ Obtained ticket for [{}].\n", _config.principal);

        const auto tickets = _runner.run({"klist", {}, output_mode::capture}, _env);

        if (tickets.ok()) {
            fmt::print("{}", first_lines(tickets.standard_output, ticket_summary_line_count));
        }
        else {
            log_orch::warn("klist exited with status [{}].", tickets.exit_code);
        }

        return true;
    } // kinit_login
} // namespace oztransfer
