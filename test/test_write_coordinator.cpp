#include <thread>

#include <doctest/doctest.h>

#include <parafetch/range_planner.hpp>
#include <parafetch/write_coordinator.hpp>

#include "fakes.hpp"

using namespace parafetch;
using namespace parafetch::test;

namespace
{
    std::unique_ptr<FileIO> open_file(const fs::path& path)
    {
        std::error_code ec;
        auto file = std::make_unique<FileIO>(path, FileIO::write_update_binary, ec);
        REQUIRE_FALSE(ec);
        return file;
    }
}

TEST_SUITE("write_coordinator")
{
    TEST_CASE("rejects_closed_file")
    {
        CHECK_THROWS_AS(WriteCoordinator(std::make_unique<FileIO>()), std::invalid_argument);
        CHECK_THROWS_AS(WriteCoordinator(nullptr), std::invalid_argument);
    }

    TEST_CASE("positional_writes")
    {
        TempDir dir;
        auto path = dir.path() / "out.bin";
        {
            WriteCoordinator sink(open_file(path));
            REQUIRE(sink.resize(10));
            REQUIRE(sink.write_at(5, "world", 5));
            REQUIRE(sink.write_at(0, "hello", 5));
            CHECK_EQ(sink.bytes_written(), 10);
            CHECK_EQ(sink.path(), path);
            REQUIRE(sink.close());
            // closing twice is harmless
            CHECK(sink.close());
            CHECK_FALSE(sink.write_at(0, "x", 1));
        }
        CHECK_EQ(read_file(path), "helloworld");
    }

    TEST_CASE("concurrent_writers")
    {
        TempDir dir;
        auto path = dir.path() / "big.bin";
        const std::string payload = make_payload(1000003);
        auto plan = plan_ranges(payload.size(), 100000, 8, true);
        REQUIRE_EQ(plan.ranges.size(), 8);

        {
            WriteCoordinator sink(open_file(path));
            REQUIRE(sink.resize(payload.size()));

            std::vector<std::thread> threads;
            std::atomic<int> failures{ 0 };
            for (auto range : plan.ranges)
            {
                threads.emplace_back(
                    [&, range]()
                    {
                        // small pieces, so writers interleave
                        for (std::uint64_t pos = range.start; pos <= range.end; pos += 997)
                        {
                            std::size_t n = static_cast<std::size_t>(
                                std::min<std::uint64_t>(997, range.end - pos + 1));
                            if (!sink.write_at(pos, payload.data() + pos, n))
                            {
                                ++failures;
                            }
                        }
                    });
            }
            for (auto& t : threads)
            {
                t.join();
            }
            CHECK_EQ(failures, 0);
            CHECK_EQ(sink.bytes_written(), payload.size());
            REQUIRE(sink.close());
        }
        CHECK(read_file(path) == payload);
    }
}
