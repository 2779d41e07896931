#include <catch2/catch.hpp>

#include "oztransfer_error_matcher.hpp"
#include "test_support.hpp"

#include "oztransfer/path_deriver.hpp"

#include <string>
#include <vector>

namespace oz = oztransfer;
namespace ts = test_support;

TEST_CASE("derive_destination_path")
{
    const std::string entry = "hdfs://ns1/data/fid2/raw/hive/hdfs_db4/csvtable1";

    CHECK(oz::derive_destination_path(entry, "data/") == "fid2/raw/hive/hdfs_db4");

    SECTION("deriving twice yields the same suffix")
    {
        CHECK(oz::derive_destination_path(entry, "data/") == oz::derive_destination_path(entry, "data/"));
    }

    SECTION("trailing slashes are ignored")
    {
        CHECK(oz::derive_destination_path(entry + "/", "data/") == "fid2/raw/hive/hdfs_db4");
    }

    SECTION("authority may contain a port")
    {
        CHECK(oz::derive_destination_path("hdfs://nn1.example.org:8020/data/a/b", "data/") == "a");
    }

    SECTION("other roots")
    {
        CHECK(oz::derive_destination_path("hdfs://ns1/warehouse/db/t1", "warehouse/") == "db");
    }

    SECTION("root matches whole path segments only")
    {
        for (const auto* root : {"data", "data/", "/data/", "data//"}) {
            INFO(root);
            CHECK(oz::derive_destination_path("hdfs://ns1/data/fid2/raw/t", root) == "fid2/raw");
            REQUIRE_THROWS_MATCHES(oz::derive_destination_path("hdfs://ns1/database/x/y/table", root),
                                   oz::exception,
                                   has_error_code(UNPARSEABLE_PATH));
        }
    }

    SECTION("nested root")
    {
        CHECK(oz::derive_destination_path("hdfs://ns1/data/landing/a/b/t", "data/landing") == "a/b");
    }

    SECTION("unparseable entries")
    {
        for (const auto* bad : {"/data/fid2/raw/csvtable1",
                                "://ns1/data/fid2/csvtable1",
                                "hdfs://ns1",
                                "hdfs://ns1/other/fid2/csvtable1",
                                "hdfs://ns1/data/csvtable1",
                                "hdfs://ns1/data//csvtable1"})
        {
            INFO(bad);
            REQUIRE_THROWS_MATCHES(oz::derive_destination_path(bad, "data/"),
                                   oz::exception,
                                   has_error_code(UNPARSEABLE_PATH));
        }
    }
}

TEST_CASE("manifest")
{
    ts::temporary_directory dir;
    const auto manifest = dir / "hdfs_db4_distcp_source.txt";

    SECTION("first entry")
    {
        ts::write_file(manifest,
                       "  hdfs://ns1/data/fid2/raw/hive/hdfs_db4/csvtable1\r\n"
                       "hdfs://ns1/data/fid2/raw/hive/hdfs_db4/csvtable2\r\n");

        CHECK(oz::read_manifest_first_entry(manifest.string()) == "hdfs://ns1/data/fid2/raw/hive/hdfs_db4/csvtable1");
        CHECK(oz::derive_destination_from_manifest(manifest.string(), "data/") == "fid2/raw/hive/hdfs_db4");
        CHECK(oz::find_heterogeneous_entries(manifest.string(), "fid2/raw/hive/hdfs_db4", "data/").empty());
    }

    SECTION("missing manifest")
    {
        REQUIRE_THROWS_MATCHES(oz::read_manifest_first_entry((dir / "nope.txt").string()),
                               oz::exception,
                               has_error_code(MANIFEST_NOT_FOUND));
    }

    SECTION("empty manifest")
    {
        ts::write_file(manifest, "");
        REQUIRE_THROWS_MATCHES(oz::read_manifest_first_entry(manifest.string()),
                               oz::exception,
                               has_error_code(MANIFEST_EMPTY));
    }

    SECTION("blank first line")
    {
        ts::write_file(manifest, "   \nhdfs://ns1/data/a/b/c\n");
        REQUIRE_THROWS_MATCHES(oz::read_manifest_first_entry(manifest.string()),
                               oz::exception,
                               has_error_code(MANIFEST_EMPTY));
    }

    SECTION("heterogeneous entries are reported")
    {
        ts::write_file(manifest,
                       "hdfs://ns1/data/fid2/raw/hive/hdfs_db4/csvtable1\n"
                       "\n"
                       "hdfs://ns1/data/fid2/raw/hive/hdfs_db5/csvtable2\n"
                       "not a path\n"
                       "hdfs://ns1/data/fid2/raw/hive/hdfs_db4/csvtable3\n");

        const auto mismatched = oz::find_heterogeneous_entries(manifest.string(), "fid2/raw/hive/hdfs_db4", "data/");

        CHECK(mismatched == std::vector<std::string>{"hdfs://ns1/data/fid2/raw/hive/hdfs_db5/csvtable2", "not a path"});
    }
}
