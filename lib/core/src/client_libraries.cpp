#include "oztransfer/client_libraries.hpp"

#include "oztransfer/error_codes.hpp"
#include "oztransfer/exception.hpp"
#include "oztransfer/logger.hpp"

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem/operations.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <string_view>

namespace fs = boost::filesystem;

namespace
{
    using log_env = oztransfer::log::environment;

    auto is_digit(char _c) noexcept -> bool
    {
        return _c >= '0' && _c <= '9';
    } // is_digit

    // Orders version strings so that runs of digits compare by numeric value
    // ("1.9.0" < "1.10.0"). Everything else compares character by character.
    auto version_less(std::string_view _lhs, std::string_view _rhs) -> bool
    {
        std::size_t i = 0;
        std::size_t j = 0;

        while (i < _lhs.size() && j < _rhs.size()) {
            if (is_digit(_lhs[i]) && is_digit(_rhs[j])) {
                const auto lhs_start = i;
                const auto rhs_start = j;

                while (i < _lhs.size() && is_digit(_lhs[i])) { ++i; }
                while (j < _rhs.size() && is_digit(_rhs[j])) { ++j; }

                auto lhs_number = _lhs.substr(lhs_start, i - lhs_start);
                auto rhs_number = _rhs.substr(rhs_start, j - rhs_start);

                lhs_number.remove_prefix(std::min(lhs_number.find_first_not_of('0'), lhs_number.size()));
                rhs_number.remove_prefix(std::min(rhs_number.find_first_not_of('0'), rhs_number.size()));

                if (lhs_number.size() != rhs_number.size()) {
                    return lhs_number.size() < rhs_number.size();
                }

                if (lhs_number != rhs_number) {
                    return lhs_number < rhs_number;
                }

                continue;
            }

            if (_lhs[i] != _rhs[j]) {
                return _lhs[i] < _rhs[j];
            }

            ++i;
            ++j;
        }

        if (_lhs.size() - i != _rhs.size() - j) {
            return _lhs.size() - i < _rhs.size() - j;
        }

        return _lhs < _rhs;
    } // version_less

    // The part of a matching file name between the pattern's prefix and suffix.
    auto version_of(std::string_view _name, const oztransfer::library_pattern& _pattern) -> std::string_view
    {
        _name.remove_prefix(_pattern.prefix.size());
        _name.remove_suffix(_pattern.suffix.size());
        return _name;
    } // version_of
} // anonymous namespace

namespace oztransfer
{
    auto to_string(const library_pattern& _pattern) -> std::string
    {
        return fmt::format("{}*{}", _pattern.prefix, _pattern.suffix);
    } // to_string

    auto library_set::paths() const -> std::vector<fs::path>
    {
        std::vector<fs::path> found{client};

        for (const auto& lib : {common, hdds_common, hdds_dependency}) {
            if (lib) {
                found.push_back(*lib);
            }
        }

        return found;
    } // library_set::paths

    auto find_library(const fs::path& _directory, const library_pattern& _pattern) -> std::optional<fs::path>
    {
        std::optional<fs::path> match;

        boost::system::error_code ec;

        for (fs::directory_iterator iter{_directory, ec}, end; !ec && iter != end; iter.increment(ec)) {
            const auto name = iter->path().filename().string();

            if (name.size() <= _pattern.prefix.size() + _pattern.suffix.size() ||
                !boost::starts_with(name, _pattern.prefix) ||
                !boost::ends_with(name, _pattern.suffix))
            {
                continue;
            }

            if (!match) {
                match = iter->path();
                continue;
            }

            const auto current = match->filename().string();

            if (version_less(version_of(current, _pattern), version_of(name, _pattern))) {
                match = iter->path();
            }
        }

        if (ec) {
            log_env::warn("Error while scanning [{}] for [{}]: {}", _directory.string(), to_string(_pattern), ec.message());
        }

        return match;
    } // find_library

    auto locate_client_libraries(const fs::path& _directory) -> library_set
    {
        boost::system::error_code ec;

        if (!fs::is_directory(_directory, ec)) {
            THROW(LIBRARY_DIRECTORY_NOT_FOUND,
                  ec ? fmt::format("Cannot access client library directory [{}]: {}", _directory.string(), ec.message())
                     : fmt::format("Missing client library directory: {}", _directory.string()));
        }

        library_set libraries;

        if (auto client = find_library(_directory, client_library_pattern); client) {
            libraries.client = std::move(*client);
        }
        else {
            THROW(MISSING_LIBRARY, fmt::format("Missing required client library [{}] in [{}].",
                                               to_string(client_library_pattern),
                                               _directory.string()));
        }

        const auto locate_optional = [&_directory](const library_pattern& _pattern) {
            auto lib = find_library(_directory, _pattern);

            if (!lib) {
                log_env::warn("Optional client library [{}] not found in [{}]. Continuing without it.",
                              to_string(_pattern),
                              _directory.string());
            }

            return lib;
        };

        libraries.common = locate_optional(common_library_pattern);
        libraries.hdds_common = locate_optional(hdds_common_library_pattern);
        libraries.hdds_dependency = locate_optional(hdds_dependency_library_pattern);

        return libraries;
    } // locate_client_libraries

    auto build_classpath(const library_set& _libraries, const std::optional<std::string>& _existing) -> std::string
    {
        std::vector<std::string> entries;

        for (const auto& p : _libraries.paths()) {
            entries.push_back(p.string());
        }

        if (_existing && !_existing->empty()) {
            entries.push_back(*_existing);
        }

        return boost::join(entries, ":");
    } // build_classpath
} // namespace oztransfer
