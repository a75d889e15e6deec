#include <thread>

#include <doctest/doctest.h>

#include <parafetch/cancellation.hpp>

using namespace parafetch;
using namespace std::chrono_literals;

TEST_SUITE("cancellation")
{
    TEST_CASE("first_trip_wins")
    {
        CancellationToken token;
        CHECK_FALSE(token.is_tripped());
        CHECK_FALSE(token.error());

        CHECK(token.trip(DownloaderError{ ErrorLevel::SERIOUS, ErrorCode::PF_TRANSPORT, "one" }));
        CHECK_FALSE(token.trip(DownloaderError{ ErrorLevel::SERIOUS, ErrorCode::PF_IO, "two" }));

        CHECK(token.is_tripped());
        CHECK(token.should_stop());
        REQUIRE(token.error());
        CHECK_EQ(token.error()->code, ErrorCode::PF_TRANSPORT);
        CHECK_EQ(token.error()->reason, "one");
    }

    TEST_CASE("concurrent_trips")
    {
        CancellationToken token;
        std::atomic<int> winners{ 0 };
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i)
        {
            threads.emplace_back(
                [&, i]()
                {
                    if (token.trip(DownloaderError{
                            ErrorLevel::SERIOUS, ErrorCode::PF_TRANSPORT, std::to_string(i) }))
                    {
                        ++winners;
                    }
                });
        }
        for (auto& t : threads)
        {
            t.join();
        }
        CHECK_EQ(winners, 1);
    }

    TEST_CASE("no_deadline")
    {
        CancellationToken token;
        CHECK_FALSE(token.has_deadline());
        CHECK_FALSE(token.expired());
        CHECK_FALSE(token.remaining());
        CHECK_FALSE(token.check_deadline());
        CHECK_FALSE(token.wait_for(1ms));
    }

    TEST_CASE("deadline_expires")
    {
        CancellationToken token(CancellationToken::clock::now() + 20ms);
        CHECK(token.has_deadline());
        CHECK_FALSE(token.expired());
        REQUIRE(token.remaining());
        CHECK(token.remaining().value() <= 20ms);

        // waiting past the deadline returns once it passed
        auto begin = CancellationToken::clock::now();
        CHECK(token.wait_for(5s));
        CHECK(CancellationToken::clock::now() - begin < 2s);

        CHECK(token.expired());
        CHECK_EQ(token.remaining().value(), 0ms);
        CHECK(token.check_deadline());
        REQUIRE(token.error());
        CHECK_EQ(token.error()->code, ErrorCode::PF_TIMEOUT);
    }

    TEST_CASE("trip_wakes_waiters")
    {
        CancellationToken token;
        std::thread waker(
            [&]()
            {
                std::this_thread::sleep_for(10ms);
                token.trip(DownloaderError{ ErrorLevel::INFO, ErrorCode::PF_CANCELLED, "stop" });
            });
        auto begin = CancellationToken::clock::now();
        CHECK(token.wait_for(10s));
        CHECK(CancellationToken::clock::now() - begin < 5s);
        waker.join();
    }
}
