#ifndef OZTRANSFER_PATH_DERIVER_HPP
#define OZTRANSFER_PATH_DERIVER_HPP

/// \file

#include <string>
#include <vector>

namespace oztransfer
{
    /// Returns the first line of the manifest at \p _manifest_path without
    /// surrounding whitespace or a trailing carriage return.
    ///
    /// \throws oztransfer::exception MANIFEST_NOT_FOUND or MANIFEST_EMPTY.
    auto read_manifest_first_entry(const std::string& _manifest_path) -> std::string;

    /// Computes the destination suffix of a source entry.
    ///
    /// The "<scheme>://<authority>/" prefix and \p _root are removed, then the
    /// final path component is dropped. For example,
    /// "hdfs://ns1/data/fid2/raw/hive/hdfs_db4/csvtable1" with root "data/"
    /// yields "fid2/raw/hive/hdfs_db4".
    ///
    /// \throws oztransfer::exception UNPARSEABLE_PATH if the prefix does not match
    ///         or the result would be empty.
    auto derive_destination_path(const std::string& _entry, const std::string& _root) -> std::string;

    /// Reads \p _manifest_path and derives the destination suffix from its first entry.
    auto derive_destination_from_manifest(const std::string& _manifest_path, const std::string& _root) -> std::string;

    /// Returns the non-blank manifest entries whose suffix differs from \p _expected_suffix.
    ///
    /// Entries that cannot be parsed at all are included.
    auto find_heterogeneous_entries(const std::string& _manifest_path,
                                    const std::string& _expected_suffix,
                                    const std::string& _root) -> std::vector<std::string>;
} // namespace oztransfer

#endif // OZTRANSFER_PATH_DERIVER_HPP
