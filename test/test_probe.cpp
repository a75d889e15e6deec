#include <doctest/doctest.h>

#include <parafetch/probe.hpp>

#include "fakes.hpp"

using namespace parafetch;
using namespace parafetch::test;

TEST_SUITE("probe")
{
    TEST_CASE("classify_status")
    {
        CHECK_FALSE(classify_status(200, "u"));
        CHECK_FALSE(classify_status(206, "u"));
        CHECK_EQ(classify_status(404, "u")->code, ErrorCode::PF_NOT_FOUND);
        CHECK_EQ(classify_status(401, "u")->code, ErrorCode::PF_UNAUTHORIZED);
        CHECK_EQ(classify_status(403, "u")->code, ErrorCode::PF_UNAUTHORIZED);
        CHECK_EQ(classify_status(500, "u")->code, ErrorCode::PF_TRANSPORT);
        CHECK_EQ(classify_status(301, "u")->code, ErrorCode::PF_TRANSPORT);
    }

    TEST_CASE("size_and_ranges")
    {
        FakeTransport transport(std::string(2000000, 'x'));
        URLHandler url("https://example.com/files/archive.tar.gz");

        auto res = probe_resource(transport, url, {});
        REQUIRE(res);
        CHECK_EQ(res->total_size, 2000000);
        CHECK(res->supports_range);
        CHECK_EQ(res->suggested_file_name, "archive.tar.gz");
        CHECK_EQ(res->http_status, 200);
        CHECK_EQ(transport.probe_calls, 1);
        CHECK_EQ(transport.fetch_calls, 0);
    }

    TEST_CASE("no_length_no_ranges")
    {
        FakeTransport transport("data");
        transport.announce_length = false;
        URLHandler url("https://example.com/a.bin");

        auto res = probe_resource(transport, url, {});
        REQUIRE(res);
        CHECK_EQ(res->total_size, 0);
        CHECK_FALSE(res->supports_range);
    }

    TEST_CASE("accept_ranges_none")
    {
        Response response;
        response.http_status = 200;
        response.headers["content-length"] = "42";
        response.headers["accept-ranges"] = "none";
        auto res = interpret_probe_response(response, URLHandler("http://h/x.txt"));
        CHECK_EQ(res.total_size, 42);
        CHECK_FALSE(res.supports_range);

        response.headers["accept-ranges"] = "Bytes";
        CHECK(interpret_probe_response(response, URLHandler("http://h/x.txt")).supports_range);

        response.headers["content-length"] = "-1";
        res = interpret_probe_response(response, URLHandler("http://h/x.txt"));
        CHECK_EQ(res.total_size, 0);
        CHECK_FALSE(res.supports_range);
    }

    TEST_CASE("content_disposition_wins")
    {
        Response response;
        response.http_status = 200;
        response.headers["content-disposition"] = "attachment; filename=\"report 2024.pdf\"";
        CHECK_EQ(file_name_from_response(response, URLHandler("https://h/download?id=4")),
                 "report 2024.pdf");

        response.headers["content-disposition"] = "attachment";
        CHECK_EQ(file_name_from_response(response, URLHandler("https://h/dl/file.zip")),
                 "file.zip");
    }

    TEST_CASE("status_errors")
    {
        FakeTransport transport("data");
        URLHandler url("https://example.com/missing.txt");

        transport.head_status = 404;
        auto res = probe_resource(transport, url, {});
        REQUIRE_FALSE(res);
        CHECK_EQ(res.error().code, ErrorCode::PF_NOT_FOUND);

        transport.head_status = 401;
        res = probe_resource(transport, url, {});
        REQUIRE_FALSE(res);
        CHECK_EQ(res.error().code, ErrorCode::PF_UNAUTHORIZED);

        transport.head_status = 200;
        transport.probe_error
            = DownloaderError{ ErrorLevel::SERIOUS, ErrorCode::PF_TRANSPORT, "refused" };
        res = probe_resource(transport, url, {});
        REQUIRE_FALSE(res);
        CHECK_EQ(res.error().code, ErrorCode::PF_TRANSPORT);
    }

    TEST_CASE("json")
    {
        ProbeResult result;
        result.total_size = 10;
        result.supports_range = true;
        result.suggested_file_name = "a.txt";
        result.http_status = 200;
        result.effective_url = "https://h/a.txt";

        auto j = to_json(result);
        CHECK_EQ(j["size"].get<std::uint64_t>(), 10);
        CHECK(j["supports_range"].get<bool>());
        CHECK_EQ(j["file_name"].get<std::string>(), "a.txt");
        CHECK_EQ(j["status"].get<long>(), 200);
    }
}
