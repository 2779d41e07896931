#ifndef OZTRANSFER_CLIENT_ENVIRONMENT_HPP
#define OZTRANSFER_CLIENT_ENVIRONMENT_HPP

/// \file

#include "oztransfer/client_libraries.hpp"
#include "oztransfer/process.hpp"
#include "oztransfer/run_config.hpp"
#include "oztransfer/site_config.hpp"

#include <boost/filesystem/path.hpp>

#include <string>

namespace oztransfer
{
    namespace env_vars
    {
        // clang-format off
        inline constexpr const char* config_directory = "HADOOP_CONF_DIR";
        inline constexpr const char* classpath        = "HADOOP_CLASSPATH";
        inline constexpr const char* ticket_cache     = "KRB5CCNAME";
        // clang-format on
    } // namespace env_vars

    /// Everything later stages need to address the remote service.
    struct client_environment
    {
        library_set libraries;
        site_config site;
        boost::filesystem::path site_config_path;
        execution_environment child_environment;
    }; // struct client_environment

    /// Returns "FILE:/tmp/krb5cc_<uid>" for the calling user.
    auto default_ticket_cache() -> std::string;

    /// Locates the client libraries, writes the site configuration into the
    /// working directory and builds the environment for child processes.
    ///
    /// \p _base is overlaid, never modified. The calling process's own
    /// environment is left untouched.
    ///
    /// \throws oztransfer::exception LIBRARY_DIRECTORY_NOT_FOUND, MISSING_LIBRARY or
    ///         SITE_CONFIG_WRITE_FAILED.
    auto assemble_environment(const run_config& _config, const execution_environment& _base) -> client_environment;
} // namespace oztransfer

#endif // OZTRANSFER_CLIENT_ENVIRONMENT_HPP
