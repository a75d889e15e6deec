#include <doctest/doctest.h>

#include <parafetch/fileio.hpp>

#include "fakes.hpp"

using namespace parafetch;
using namespace parafetch::test;

TEST_SUITE("fileio")
{
    TEST_CASE("open")
    {
        TempDir dir;
        std::error_code ec;
        FileIO f(dir.path() / "test.txt", FileIO::write_update_binary, ec);

        CHECK_FALSE(ec);
        CHECK(f.open());
        CHECK_EQ(f.write("test", 1, 4), 4);
        f.close(ec);
        CHECK_FALSE(ec);
        CHECK_FALSE(f.open());
        CHECK_EQ(read_file(dir.path() / "test.txt"), "test");
    }

    TEST_CASE("open_missing")
    {
        TempDir dir;
        std::error_code ec;
        FileIO f(dir.path() / "missing.txt", FileIO::read_binary, ec);
        CHECK(ec);
        CHECK_FALSE(f.open());
    }

    TEST_CASE("exclusive_create")
    {
        TempDir dir;
        std::error_code ec;
        {
            FileIO f(dir.path() / "x.bin", FileIO::write_exclusive_binary, ec);
            CHECK_FALSE(ec);
        }
        FileIO again(dir.path() / "x.bin", FileIO::write_exclusive_binary, ec);
        CHECK(ec == std::errc::file_exists);
    }

    TEST_CASE("seek_and_truncate")
    {
        TempDir dir;
        std::error_code ec;
        FileIO f(dir.path() / "sparse.bin", FileIO::write_update_binary, ec);
        REQUIRE_FALSE(ec);

        f.truncate(100, ec);
        CHECK_FALSE(ec);
        CHECK_EQ(f.seek(90, SEEK_SET), 0);
        f.write("end", 1, 3);
        CHECK_EQ(f.tell(), 93);
        CHECK(f.flush());
        f.seek(0, SEEK_END);
        CHECK_EQ(f.tell(), 100);

        f.truncate(0, ec);
        CHECK_FALSE(ec);
        f.close(ec);
        CHECK_EQ(fs::file_size(dir.path() / "sparse.bin"), 0);
    }
}
