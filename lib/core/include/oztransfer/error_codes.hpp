#ifndef OZTRANSFER_ERROR_CODES_HPP
#define OZTRANSFER_ERROR_CODES_HPP

/// \file

#include <string_view>

// Error codes are negative and grouped by the pipeline stage that raises them.
// The thousands digit identifies the category, see error_category_of().

// clang-format off
enum OZTRANSFER_ERROR_ENUM : int
{
    SUCCESS_CODE                       = 0,

    // Configuration
    CONFIG_FILE_NOT_FOUND              = -1000,
    MISSING_PARAMETER                  = -1001,
    INVALID_PARAMETER                  = -1002,

    // Environment
    LIBRARY_DIRECTORY_NOT_FOUND        = -2000,
    MISSING_LIBRARY                    = -2001,
    SITE_CONFIG_WRITE_FAILED           = -2002,
    SITE_CONFIG_READ_FAILED            = -2003,

    // Discovery
    LEADER_UNRESOLVED                  = -3000,

    // Path derivation
    MANIFEST_NOT_FOUND                 = -4000,
    MANIFEST_EMPTY                     = -4001,
    UNPARSEABLE_PATH                   = -4002,

    // Authentication
    KEYTAB_NOT_FOUND                   = -5000,
    KERBEROS_LOGIN_FAILED              = -5001,

    // Connectivity
    SOURCE_UNREACHABLE                 = -6000,
    DESTINATION_UNREACHABLE            = -6001,

    // Staging
    STAGING_FAILED                     = -7000,

    // Process execution
    PROCESS_LAUNCH_FAILED              = -8000,
    PROCESS_WAIT_FAILED                = -8001,
    PROCESS_OUTPUT_READ_FAILED         = -8002,

    // Internal
    SYS_INVALID_INPUT_PARAM            = -9000,
    SYS_INTERNAL_ERR                   = -9001
};
// clang-format on

namespace oztransfer
{
    enum class error_category
    {
        none,
        configuration,
        environment,
        discovery,
        path_derivation,
        authentication,
        connectivity,
        staging,
        process,
        internal
    }; // enum class error_category

    /// Returns the symbolic name of \p _code (e.g. "MISSING_PARAMETER").
    ///
    /// Unknown codes yield "UNKNOWN_ERROR".
    auto error_name(int _code) noexcept -> std::string_view;

    auto error_category_of(int _code) noexcept -> error_category;

    auto to_string(error_category _category) noexcept -> std::string_view;

    /// Maps an error code to the exit code reported by the oztransfer program.
    ///
    /// Each pre-flight category has its own exit code so that callers can tell
    /// what went wrong without parsing the output. Zero maps to zero.
    auto exit_code_for(int _code) noexcept -> int;
} // namespace oztransfer

#endif // OZTRANSFER_ERROR_CODES_HPP
