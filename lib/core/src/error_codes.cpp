#include "oztransfer/error_codes.hpp"

#include <unordered_map>

namespace oztransfer
{
    auto error_name(int _code) noexcept -> std::string_view
    {
#define OZTRANSFER_ERROR_NAME_ENTRY(name) {name, #name}
        // clang-format off
        static const std::unordered_map<int, std::string_view> names{
            OZTRANSFER_ERROR_NAME_ENTRY(SUCCESS_CODE),
            OZTRANSFER_ERROR_NAME_ENTRY(CONFIG_FILE_NOT_FOUND),
            OZTRANSFER_ERROR_NAME_ENTRY(MISSING_PARAMETER),
            OZTRANSFER_ERROR_NAME_ENTRY(INVALID_PARAMETER),
            OZTRANSFER_ERROR_NAME_ENTRY(LIBRARY_DIRECTORY_NOT_FOUND),
            OZTRANSFER_ERROR_NAME_ENTRY(MISSING_LIBRARY),
            OZTRANSFER_ERROR_NAME_ENTRY(SITE_CONFIG_WRITE_FAILED),
            OZTRANSFER_ERROR_NAME_ENTRY(SITE_CONFIG_READ_FAILED),
            OZTRANSFER_ERROR_NAME_ENTRY(LEADER_UNRESOLVED),
            OZTRANSFER_ERROR_NAME_ENTRY(MANIFEST_NOT_FOUND),
            OZTRANSFER_ERROR_NAME_ENTRY(MANIFEST_EMPTY),
            OZTRANSFER_ERROR_NAME_ENTRY(UNPARSEABLE_PATH),
            OZTRANSFER_ERROR_NAME_ENTRY(KEYTAB_NOT_FOUND),
            OZTRANSFER_ERROR_NAME_ENTRY(KERBEROS_LOGIN_FAILED),
            OZTRANSFER_ERROR_NAME_ENTRY(SOURCE_UNREACHABLE),
            OZTRANSFER_ERROR_NAME_ENTRY(DESTINATION_UNREACHABLE),
            OZTRANSFER_ERROR_NAME_ENTRY(STAGING_FAILED),
            OZTRANSFER_ERROR_NAME_ENTRY(PROCESS_LAUNCH_FAILED),
            OZTRANSFER_ERROR_NAME_ENTRY(PROCESS_WAIT_FAILED),
            OZTRANSFER_ERROR_NAME_ENTRY(PROCESS_OUTPUT_READ_FAILED),
            OZTRANSFER_ERROR_NAME_ENTRY(SYS_INVALID_INPUT_PARAM),
            OZTRANSFER_ERROR_NAME_ENTRY(SYS_INTERNAL_ERR)
        };
        // clang-format on
#undef OZTRANSFER_ERROR_NAME_ENTRY

        if (const auto iter = names.find(_code); iter != std::end(names)) {
            return iter->second;
        }

        return "UNKNOWN_ERROR";
    } // error_name

    auto error_category_of(int _code) noexcept -> error_category
    {
        if (_code >= 0) {
            return error_category::none;
        }

        // clang-format off
        switch (-_code / 1000) {
            case 1:  return error_category::configuration;
            case 2:  return error_category::environment;
            case 3:  return error_category::discovery;
            case 4:  return error_category::path_derivation;
            case 5:  return error_category::authentication;
            case 6:  return error_category::connectivity;
            case 7:  return error_category::staging;
            case 8:  return error_category::process;
            default: return error_category::internal;
        }
        // clang-format on
    } // error_category_of

    auto to_string(error_category _category) noexcept -> std::string_view
    {
        switch (_category) {
            case error_category::none:            return "none";
            case error_category::configuration:   return "ConfigurationError";
            case error_category::environment:     return "EnvironmentError";
            case error_category::discovery:       return "DiscoveryError";
            case error_category::path_derivation: return "PathDerivationError";
            case error_category::authentication:  return "AuthenticationError";
            case error_category::connectivity:    return "ConnectivityError";
            case error_category::staging:         return "StagingError";
            case error_category::process:         return "ProcessError";
            case error_category::internal:        return "InternalError";
        }

        return "InternalError";
    } // to_string

    auto exit_code_for(int _code) noexcept -> int
    {
        // Exit code 1 is reserved for command line usage errors.
        // clang-format off
        switch (error_category_of(_code)) {
            case error_category::none:            return 0;
            case error_category::configuration:   return 2;
            case error_category::environment:     return 3;
            case error_category::discovery:       return 4;
            case error_category::path_derivation: return 5;
            case error_category::authentication:  return 6;
            case error_category::connectivity:    return 7;
            case error_category::staging:         return 8;
            case error_category::process:         return 9;
            case error_category::internal:        return 10;
        }
        // clang-format on

        return 10;
    } // exit_code_for
} // namespace oztransfer
