#include "oztransfer/path_deriver.hpp"

#include "oztransfer/error_codes.hpp"
#include "oztransfer/exception.hpp"
#include "oztransfer/logger.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <fmt/format.h>

#include <fstream>
#include <utility>

namespace
{
    using log_xfer = oztransfer::log::transfer;

    auto normalize_line(std::string _line) -> std::string
    {
        boost::trim(_line);
        return _line;
    } // normalize_line

    // Returns _root with no leading '/' and exactly one trailing '/', so that it
    // only matches whole path segments. An empty root stays empty.
    auto normalize_root(const std::string& _root) -> std::string
    {
        auto root = boost::trim_copy_if(_root, boost::is_any_of("/"));

        if (!root.empty()) {
            root += '/';
        }

        return root;
    } // normalize_root
} // anonymous namespace

namespace oztransfer
{
    auto read_manifest_first_entry(const std::string& _manifest_path) -> std::string
    {
        std::ifstream in{_manifest_path};

        if (!in) {
            THROW(MANIFEST_NOT_FOUND, fmt::format("Cannot open manifest [{}].", _manifest_path));
        }

        std::string line;

        if (!std::getline(in, line)) {
            THROW(MANIFEST_EMPTY, fmt::format("Manifest [{}] is empty.", _manifest_path));
        }

        // boost::trim also removes the '\r' of CRLF files.
        auto entry = normalize_line(std::move(line));

        if (entry.empty()) {
            THROW(MANIFEST_EMPTY, fmt::format("First line of manifest [{}] is blank.", _manifest_path));
        }

        return entry;
    } // read_manifest_first_entry

    auto derive_destination_path(const std::string& _entry, const std::string& _root) -> std::string
    {
        const auto describe = [&_entry, &_root](const char* _reason) {
            return fmt::format("Cannot derive destination from [{}] with root [{}]: {}", _entry, _root, _reason);
        };

        const auto scheme_end = _entry.find("://");

        if (scheme_end == std::string::npos || 0 == scheme_end) {
            THROW(UNPARSEABLE_PATH, describe("missing scheme"));
        }

        const auto authority_begin = scheme_end + 3;
        const auto path_begin = _entry.find('/', authority_begin);

        if (path_begin == std::string::npos) {
            THROW(UNPARSEABLE_PATH, describe("missing path after authority"));
        }

        auto rest = _entry.substr(path_begin + 1);
        const auto root = normalize_root(_root);

        if (!boost::starts_with(rest, root)) {
            THROW(UNPARSEABLE_PATH, describe("root does not match"));
        }

        rest.erase(0, root.size());

        if (boost::starts_with(rest, "/")) {
            THROW(UNPARSEABLE_PATH, describe("empty path segment after root"));
        }

        while (!rest.empty() && '/' == rest.back()) {
            rest.pop_back();
        }

        const auto last_slash = rest.rfind('/');

        if (last_slash == std::string::npos) {
            THROW(UNPARSEABLE_PATH, describe("no directory above the final component"));
        }

        rest.erase(last_slash);

        if (rest.empty()) {
            THROW(UNPARSEABLE_PATH, describe("derived path is empty"));
        }

        return rest;
    } // derive_destination_path

    auto derive_destination_from_manifest(const std::string& _manifest_path, const std::string& _root) -> std::string
    {
        const auto entry = read_manifest_first_entry(_manifest_path);
        log_xfer::debug("First manifest entry: [{}]", entry);
        return derive_destination_path(entry, _root);
    } // derive_destination_from_manifest

    auto find_heterogeneous_entries(const std::string& _manifest_path,
                                    const std::string& _expected_suffix,
                                    const std::string& _root) -> std::vector<std::string>
    {
        std::vector<std::string> mismatched;

        std::ifstream in{_manifest_path};

        if (!in) {
            THROW(MANIFEST_NOT_FOUND, fmt::format("Cannot open manifest [{}].", _manifest_path));
        }

        for (std::string line; std::getline(in, line);) {
            const auto entry = normalize_line(line);

            if (entry.empty()) {
                continue;
            }

            try {
                if (derive_destination_path(entry, _root) != _expected_suffix) {
                    mismatched.push_back(entry);
                }
            }
            catch (const oztransfer::exception&) {
                mismatched.push_back(entry);
            }
        }

        return mismatched;
    } // find_heterogeneous_entries
} // namespace oztransfer
