#include "nexus/server/tus_routes.hpp"

#include "nexus/core/digest.hpp"
#include "upload_fixture.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace nexus;
using namespace nexus::network;
using nexus::testing::read_file;

namespace {

constexpr const char* kBase = "/api/upload/tus";

} // namespace

class TusRoutesTest : public nexus::testing::UploadFixture {
protected:
    void SetUp() override {
        UploadFixture::SetUp();
        make_service(1024);
        routes_ = std::make_unique<server::TusRoutes>(*service_, kBase);
        routes_->register_routes(router_);
    }

    void TearDown() override {
        routes_.reset();
        UploadFixture::TearDown();
    }

    static HttpRequest tus_request(HttpMethod method, const std::string& url) {
        HttpRequest request;
        request.method = method;
        request.url = url;
        request.headers["Tus-Resumable"] = "1.0.0";
        return request;
    }

    HttpRequest post(const std::string& filename, std::uint64_t length,
                     const std::string& credential = kCredential) {
        auto request = tus_request(HttpMethod::POST, kBase);
        request.headers["Upload-Length"] = std::to_string(length);
        request.headers["Upload-Metadata"] = "filename " + core::base64_encode(filename) +
                                             ",password " + core::base64_encode(credential);
        return request;
    }

    HttpRequest patch(const std::string& id, std::uint64_t offset, const std::string& bytes) {
        auto request = tus_request(HttpMethod::PATCH, std::string(kBase) + "/" + id);
        request.headers["Content-Type"] = "application/offset+octet-stream";
        request.headers["Upload-Offset"] = std::to_string(offset);
        request.body.assign(bytes.begin(), bytes.end());
        return request;
    }

    // Creates an upload and returns its id (last Location segment).
    std::string create(const std::string& filename, std::uint64_t length) {
        auto response = router_.handle_request(post(filename, length));
        EXPECT_EQ(response.status_code, 201);
        const auto location = response.get_header("Location");
        return location.substr(location.rfind('/') + 1);
    }

    HttpRouter router_;
    std::unique_ptr<server::TusRoutes> routes_;
};

TEST_F(TusRoutesTest, OptionsAdvertisesCapabilitiesWithoutVersionHeader) {
    HttpRequest request;
    request.method = HttpMethod::OPTIONS;
    request.url = kBase;

    auto response = router_.handle_request(request);
    EXPECT_EQ(response.status_code, 204);
    EXPECT_EQ(response.get_header("Tus-Resumable"), "1.0.0");
    EXPECT_EQ(response.get_header("Tus-Version"), "1.0.0");
    EXPECT_EQ(response.get_header("Tus-Extension"), "creation,termination,concatenation");
    EXPECT_EQ(response.get_header("Tus-Max-Size"), "1024");
}

TEST_F(TusRoutesTest, RejectsUnsupportedVersion) {
    auto request = post("a.txt", 4);
    request.headers["Tus-Resumable"] = "0.2.2";

    auto response = router_.handle_request(request);
    EXPECT_EQ(response.status_code, 412);
    EXPECT_EQ(response.get_header("Tus-Version"), "1.0.0");
    EXPECT_EQ(response.get_header("Tus-Resumable"), "1.0.0");

    request.headers.erase("Tus-Resumable");
    EXPECT_EQ(router_.handle_request(request).status_code, 412);
}

TEST_F(TusRoutesTest, CreateReturnsLocationAndResumes) {
    auto request = post("report.pdf", 10);
    request.headers["Host"] = "files.example.com";
    request.headers["X-Forwarded-Proto"] = "https";

    auto created = router_.handle_request(request);
    ASSERT_EQ(created.status_code, 201);
    EXPECT_EQ(created.get_header("Upload-Offset"), "0");
    const auto location = created.get_header("Location");
    EXPECT_EQ(location.rfind("https://files.example.com/api/upload/tus/", 0), 0u);

    auto resumed = router_.handle_request(request);
    EXPECT_EQ(resumed.status_code, 200);
    EXPECT_EQ(resumed.get_header("Location"), location);

    request.headers.erase("Host");
    auto relative = router_.handle_request(request);
    EXPECT_EQ(relative.get_header("Location").rfind("/api/upload/tus/", 0), 0u);
}

TEST_F(TusRoutesTest, CreateErrors) {
    EXPECT_EQ(router_.handle_request(post("a.txt", 4, "wrong")).status_code, 401);
    EXPECT_EQ(router_.handle_request(post("a.txt", 4096)).status_code, 413);

    auto deferred = post("a.txt", 4);
    deferred.headers.erase("Upload-Length");
    deferred.headers["Upload-Defer-Length"] = "1";
    EXPECT_EQ(router_.handle_request(deferred).status_code, 400);

    auto bad_length = post("a.txt", 4);
    bad_length.headers["Upload-Length"] = "-4";
    auto response = router_.handle_request(bad_length);
    EXPECT_EQ(response.status_code, 400);
    EXPECT_EQ(response.get_header("Tus-Resumable"), "1.0.0");
    auto body = nlohmann::json::parse(std::string(response.body.begin(), response.body.end()));
    EXPECT_EQ(body["error"], "validation_error");
}

TEST_F(TusRoutesTest, HeadReportsOffsetAndMetadata) {
    const auto id = create("notes.txt", 10);
    ASSERT_EQ(router_.handle_request(patch(id, 0, "0123")).status_code, 204);

    auto response = router_.handle_request(tus_request(HttpMethod::HEAD, std::string(kBase) + "/" + id));
    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(response.get_header("Upload-Offset"), "4");
    EXPECT_EQ(response.get_header("Upload-Length"), "10");
    EXPECT_EQ(response.get_header("Cache-Control"), "no-store");
    const auto metadata = response.get_header("Upload-Metadata");
    EXPECT_NE(metadata.find("filename " + core::base64_encode("notes.txt")), std::string::npos);
    EXPECT_EQ(metadata.find("password"), std::string::npos);

    auto missing = router_.handle_request(tus_request(HttpMethod::HEAD, std::string(kBase) + "/nope"));
    EXPECT_EQ(missing.status_code, 404);
    EXPECT_TRUE(missing.body.empty());
}

TEST_F(TusRoutesTest, PatchAppendsAndImports) {
    const auto id = create("data.bin", 10);

    auto first = router_.handle_request(patch(id, 0, "01234"));
    EXPECT_EQ(first.status_code, 204);
    EXPECT_EQ(first.get_header("Upload-Offset"), "5");
    EXPECT_EQ(first.get_header("Tus-Resumable"), "1.0.0");

    EXPECT_EQ(router_.handle_request(patch(id, 0, "01234")).status_code, 409);

    auto wrong_type = patch(id, 5, "56789");
    wrong_type.headers["Content-Type"] = "application/json";
    EXPECT_EQ(router_.handle_request(wrong_type).status_code, 415);

    auto no_offset = patch(id, 5, "56789");
    no_offset.headers.erase("Upload-Offset");
    EXPECT_EQ(router_.handle_request(no_offset).status_code, 400);

    auto last = router_.handle_request(patch(id, 5, "56789"));
    EXPECT_EQ(last.status_code, 204);
    EXPECT_EQ(last.get_header("Upload-Offset"), "10");
    EXPECT_EQ(read_file(owner_path("data.bin")), "0123456789");

    EXPECT_EQ(router_.handle_request(patch("unknown", 0, "x")).status_code, 404);
}

TEST_F(TusRoutesTest, DeleteTerminates) {
    const auto id = create("gone.bin", 10);
    const std::string url = std::string(kBase) + "/" + id;

    EXPECT_EQ(router_.handle_request(tus_request(HttpMethod::DELETE_METHOD, url)).status_code, 204);
    EXPECT_EQ(router_.handle_request(tus_request(HttpMethod::DELETE_METHOD, url)).status_code, 404);
    EXPECT_EQ(router_.handle_request(tus_request(HttpMethod::HEAD, url)).status_code, 404);
    EXPECT_EQ(router_.handle_request(patch(id, 0, "x")).status_code, 404);
}

TEST_F(TusRoutesTest, ConcatenationOverHttp) {
    auto part_request = [&](const std::string& bytes) {
        auto request = post("part", bytes.size());
        request.headers["Upload-Concat"] = "partial";
        auto response = router_.handle_request(request);
        EXPECT_EQ(response.status_code, 201);
        const auto location = response.get_header("Location");
        const auto id = location.substr(location.rfind('/') + 1);
        EXPECT_EQ(router_.handle_request(patch(id, 0, bytes)).status_code, 204);
        return id;
    };
    const auto a = part_request("hello ");
    const auto b = part_request("world");

    auto head = router_.handle_request(tus_request(HttpMethod::HEAD, std::string(kBase) + "/" + a));
    EXPECT_EQ(head.get_header("Upload-Concat"), "partial");

    auto final_request = post("greeting.txt", 0);
    final_request.headers.erase("Upload-Length");
    final_request.headers["Upload-Concat"] =
        std::string("final;") + kBase + "/" + a + " " + kBase + "/" + b;
    auto response = router_.handle_request(final_request);
    EXPECT_EQ(response.status_code, 201);
    EXPECT_EQ(read_file(owner_path("greeting.txt")), "hello world");
}

TEST(TusHelpersTest, ParseUint64) {
    EXPECT_EQ(server::parse_uint64("0"), std::optional<std::uint64_t>(0));
    EXPECT_EQ(server::parse_uint64("18446744073709551615"), std::optional<std::uint64_t>(UINT64_MAX));
    EXPECT_FALSE(server::parse_uint64(""));
    EXPECT_FALSE(server::parse_uint64("12a"));
    EXPECT_FALSE(server::parse_uint64("-1"));
    EXPECT_FALSE(server::parse_uint64("18446744073709551616"));
}

TEST(TusHelpersTest, StatusMapping) {
    EXPECT_EQ(server::status_for(ErrorCode::OffsetConflict), HttpStatus::CONFLICT);
    EXPECT_EQ(server::status_for(ErrorCode::UnsupportedMediaType), HttpStatus::UNSUPPORTED_MEDIA_TYPE);
    EXPECT_EQ(server::status_for(ErrorCode::StorageFailure), HttpStatus::INTERNAL_SERVER_ERROR);

    auto head = server::error_response(Error{ErrorCode::NotFound, "x"}, false);
    EXPECT_EQ(head.status_code, 404);
    EXPECT_TRUE(head.body.empty());
}
