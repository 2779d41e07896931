#ifndef OZTRANSFER_CLIENT_LIBRARIES_HPP
#define OZTRANSFER_CLIENT_LIBRARIES_HPP

/// \file

#include <boost/filesystem/path.hpp>

#include <optional>
#include <string>
#include <vector>

namespace oztransfer
{
    /// Describes a library file as "<prefix>*<suffix>" (e.g. "ozone-client-*.jar").
    struct library_pattern
    {
        std::string prefix;
        std::string suffix;
        bool required;
    }; // struct library_pattern

    auto to_string(const library_pattern& _pattern) -> std::string;

    // clang-format off
    inline const library_pattern client_library_pattern{"ozone-client-", ".jar", true};
    inline const library_pattern common_library_pattern{"ozone-common-", ".jar", false};
    inline const library_pattern hdds_common_library_pattern{"hdds-common-", ".jar", false};
    inline const library_pattern hdds_dependency_library_pattern{"hdds-hadoop-dependency-client-", ".jar", false};
    // clang-format on

    struct library_set
    {
        boost::filesystem::path client;
        std::optional<boost::filesystem::path> common;
        std::optional<boost::filesystem::path> hdds_common;
        std::optional<boost::filesystem::path> hdds_dependency;

        /// The libraries that were found, primary client library first.
        auto paths() const -> std::vector<boost::filesystem::path>;
    }; // struct library_set

    /// Returns the match for \p _pattern in \p _directory with the highest version.
    ///
    /// Versions are the text between the prefix and the suffix. Runs of digits
    /// compare numerically, so "ozone-client-1.10.0.jar" wins over "ozone-client-1.9.0.jar".
    auto find_library(const boost::filesystem::path& _directory, const library_pattern& _pattern)
        -> std::optional<boost::filesystem::path>;

    /// Locates the client libraries in \p _directory.
    ///
    /// Only the primary client library is required. Each optional library that
    /// cannot be found is logged as a warning.
    ///
    /// \throws oztransfer::exception LIBRARY_DIRECTORY_NOT_FOUND or MISSING_LIBRARY.
    auto locate_client_libraries(const boost::filesystem::path& _directory) -> library_set;

    /// Joins the located libraries with ':' and appends \p _existing when it is non-empty.
    auto build_classpath(const library_set& _libraries, const std::optional<std::string>& _existing) -> std::string;
} // namespace oztransfer

#endif // OZTRANSFER_CLIENT_LIBRARIES_HPP
