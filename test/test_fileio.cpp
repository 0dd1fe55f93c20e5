#include <doctest/doctest.h>

#include <podloader/fileio.hpp>

#include "helpers.hpp"

using namespace podloader;
using podloader::testing::TempDir;

TEST_SUITE("fileio")
{
    TEST_CASE("write_and_close")
    {
        TempDir dir;
        const auto path = dir.path() / "episode.tmp";

        std::error_code ec;
        FileIO f(path, FileIO::write_binary, ec);
        CHECK_FALSE(ec);
        CHECK(f.open());
        CHECK_EQ(f.write("audio", 1, 5), 5);
        CHECK_EQ(f.tell(), 5);
        f.sync(ec);
        CHECK_FALSE(ec);
        f.close(ec);
        CHECK_FALSE(ec);
        CHECK_FALSE(f.open());

        CHECK_EQ(testing::read_file(path), "audio");
    }

    TEST_CASE("append")
    {
        TempDir dir;
        const auto path = dir.path() / "log.txt";
        testing::write_file(path, "abc");

        std::error_code ec;
        {
            FileIO f(path, FileIO::append_binary, ec);
            CHECK_FALSE(ec);
            f.write("def", 1, 3);
        }
        CHECK_EQ(testing::read_file(path), "abcdef");
    }

    TEST_CASE("open_missing_directory")
    {
        TempDir dir;
        std::error_code ec;
        FileIO f(dir.path() / "missing" / "x.tmp", FileIO::write_binary, ec);
        CHECK(ec);
        CHECK_FALSE(f.open());

        // closing an unopened file is fine
        f.close(ec);
        CHECK_FALSE(ec);

        f.sync(ec);
        CHECK(ec);
    }

    TEST_CASE("sync_reports_flush_errors")
    {
        if (!fs::exists("/dev/full"))
            return;

        std::error_code ec;
        FileIO f("/dev/full", FileIO::write_binary, ec);
        REQUIRE_FALSE(ec);
        CHECK_EQ(f.write("audio", 1, 5), 5);
        f.sync(ec);
        CHECK_EQ(ec, std::errc::no_space_on_device);
    }

    TEST_CASE("sync_directory")
    {
        TempDir dir;
        std::error_code ec;
        sync_directory(dir.path(), ec);
        CHECK_FALSE(ec);

        sync_directory(dir.path() / "missing", ec);
        CHECK(ec);

        testing::write_file(dir.path() / "file.mp3", "x");
        sync_directory(dir.path() / "file.mp3", ec);
        CHECK(ec);
    }
}
