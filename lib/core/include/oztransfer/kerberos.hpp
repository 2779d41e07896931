#ifndef OZTRANSFER_KERBEROS_HPP
#define OZTRANSFER_KERBEROS_HPP

/// \file

#include "oztransfer/process.hpp"
#include "oztransfer/run_config.hpp"

namespace oztransfer
{
    // The number of ticket cache lines shown after a successful login.
    inline constexpr int ticket_summary_line_count = 5;

    auto make_kinit_command(const run_config& _config) -> command;

    /// Obtains a ticket for the configured principal from its keytab.
    ///
    /// Does nothing and returns false when ticket login is disabled.
    ///
    /// \throws oztransfer::exception KEYTAB_NOT_FOUND or KERBEROS_LOGIN_FAILED.
    auto kinit_login(const run_config& _config, command_runner& _runner, const execution_environment& _env) -> bool;
} // namespace oztransfer

#endif // OZTRANSFER_KERBEROS_HPP
