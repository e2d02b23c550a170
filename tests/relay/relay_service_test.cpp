#include "mpu/events/components.hpp"
#include "mpu/events/event_bus.hpp"
#include "mpu/relay/relay_service.hpp"
#include "mpu/storage/memory_object_store.hpp"
#include "mpu/util/encoding.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

using mpu::ErrorCode;
using mpu::events::EventBus;
using mpu::events::MetricsComponent;
using mpu::events::UploadFailedEvent;
using mpu::network::HttpMethod;
using mpu::network::HttpRequest;
using mpu::network::HttpResponse;
using mpu::network::HttpRouter;
using mpu::relay::RelayOptions;
using mpu::relay::RelayService;
using mpu::storage::MemoryObjectStore;
using mpu::storage::StoreConfig;
using mpu::upload::CompletedPart;
using json = nlohmann::json;

namespace {

StoreConfig store_config() {
    StoreConfig config;
    config.min_part_size = 4;
    config.max_parts = 100;
    return config;
}

RelayOptions relay_options() {
    RelayOptions options;
    options.chunk_size = 4;
    options.public_url = "http://relay.test";
    options.limits.min_part_size = 4;
    options.limits.max_parts = 100;
    return options;
}

class RelayServiceTest : public ::testing::Test {
protected:
    RelayServiceTest()
        : store_(store_config()),
          metrics_(bus_),
          relay_(store_, bus_, relay_options()) {
        relay_.register_routes(router_);
    }

    HttpResponse call(HttpMethod method, const std::string& url, const std::string& body = "") {
        HttpRequest request;
        request.method = method;
        request.url = url;
        request.body.assign(body.begin(), body.end());
        if (!body.empty()) {
            request.headers["Content-Length"] = std::to_string(body.size());
        }
        HttpResponse response = router_.handle_request(request);
        if (response.is_streamed()) {
            mpu::stream::VectorSink sink(response.body);
            auto piped = mpu::stream::pipe(*response.body_stream, sink);
            EXPECT_TRUE(piped.is_ok());
            response.body_stream.reset();
        }
        return response;
    }

    static json body_json(const HttpResponse& response) {
        return json::parse(response.body_as_string(), nullptr, false);
    }

    /// Path and query of a URL the relay handed out
    static std::string target_of(const std::string& url) {
        const std::string base = "http://relay.test";
        EXPECT_EQ(url.compare(0, base.size(), base), 0) << url;
        return url.substr(base.size());
    }

    MemoryObjectStore store_;
    EventBus bus_;
    MetricsComponent metrics_;
    RelayService relay_;
    HttpRouter router_;
};

} // namespace

TEST_F(RelayServiceTest, InitiateSimpleUpload) {
    auto response = call(HttpMethod::POST, "/upload/initiate", R"({"filename":"a b.txt","fileSize":3})");

    ASSERT_EQ(response.status_code, 200);
    auto body = body_json(response);
    EXPECT_EQ(body["mode"], "simple");
    EXPECT_EQ(body["filename"], "a b.txt");
    EXPECT_EQ(body["uploadUrl"], "http://relay.test/upload/simple/a%20b.txt");
    EXPECT_FALSE(body.contains("uploadId"));
    EXPECT_EQ(relay_.active_uploads(), 0u);
}

TEST_F(RelayServiceTest, FullMultipartFlowOverHttp) {
    auto initiated = call(HttpMethod::POST, "/upload/initiate", R"({"filename":"dir/video.mp4","fileSize":10})");
    ASSERT_EQ(initiated.status_code, 200);
    auto plan = body_json(initiated);
    EXPECT_EQ(plan["mode"], "multipart");
    EXPECT_EQ(plan["chunkSize"], 4);
    ASSERT_EQ(plan["parts"].size(), 3u);
    const std::string upload_id = plan["uploadId"].get<std::string>();
    EXPECT_EQ(relay_.active_uploads(), 1u);

    const std::string chunks[] = {"0123", "4567", "89"};
    json parts = json::array();
    // Deliberately out of order
    for (int index : {2, 0, 1}) {
        const auto& part = plan["parts"][index];
        auto uploaded = call(HttpMethod::PUT, target_of(part["url"].get<std::string>()), chunks[index]);
        ASSERT_EQ(uploaded.status_code, 200) << uploaded.body_as_string();
        auto result = body_json(uploaded);
        EXPECT_EQ(result["success"], true);
        const std::string etag = result["etag"].get<std::string>();
        EXPECT_EQ(uploaded.get_header("ETag"), "\"" + etag + "\"");
        parts.push_back(json{{"partNumber", part["partNumber"]}, {"etag", etag}});
    }

    json request = {{"filename", "dir/video.mp4"}, {"uploadId", upload_id}, {"parts", parts}};
    auto completed = call(HttpMethod::POST, "/upload/complete", request.dump());
    ASSERT_EQ(completed.status_code, 200) << completed.body_as_string();
    auto done = body_json(completed);
    EXPECT_EQ(done["success"], true);
    EXPECT_EQ(done["size"], 10);
    EXPECT_EQ(relay_.active_uploads(), 0u);

    auto downloaded = call(HttpMethod::GET, "/objects/dir%2Fvideo.mp4");
    ASSERT_EQ(downloaded.status_code, 200);
    EXPECT_EQ(downloaded.body_as_string(), "0123456789");
    EXPECT_EQ(downloaded.get_header("Content-Length"), "10");
    EXPECT_EQ(downloaded.get_header("Content-Disposition"), "attachment; filename*=UTF-8''dir%2Fvideo.mp4");
    EXPECT_EQ(downloaded.get_header("ETag"), "\"" + done["etag"].get<std::string>() + "\"");

    const auto& stats = metrics_.get_stats();
    EXPECT_EQ(stats.multipart_initiated.load(), 1u);
    EXPECT_EQ(stats.parts_uploaded.load(), 3u);
    EXPECT_EQ(stats.uploads_completed.load(), 1u);
    EXPECT_EQ(stats.objects_downloaded.load(), 1u);
}

TEST_F(RelayServiceTest, SimpleUploadThenListAndHead) {
    auto stored = call(HttpMethod::PUT, "/upload/simple/notes.txt", "note");
    ASSERT_EQ(stored.status_code, 200);
    EXPECT_EQ(body_json(stored)["success"], true);

    auto listing = call(HttpMethod::GET, "/objects");
    ASSERT_EQ(listing.status_code, 200);
    auto items = body_json(listing);
    ASSERT_TRUE(items.is_array());
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0]["key"], "notes.txt");
    EXPECT_EQ(items[0]["size"], 4);
    EXPECT_TRUE(mpu::util::parse_timestamp(items[0]["uploadedAt"].get<std::string>()).has_value());

    auto head = call(HttpMethod::HEAD, "/objects/notes.txt");
    EXPECT_EQ(head.status_code, 200);
    EXPECT_EQ(head.get_header("Content-Length"), "4");
    EXPECT_TRUE(head.body.empty());
}

TEST_F(RelayServiceTest, EveryResponseCarriesCors) {
    auto ok = call(HttpMethod::GET, "/objects");
    auto missing = call(HttpMethod::GET, "/objects/nope");
    auto bad = call(HttpMethod::POST, "/upload/initiate", "not json");

    for (const auto* response : {&ok, &missing, &bad}) {
        EXPECT_EQ(response->get_header("Access-Control-Allow-Origin"), "*");
        EXPECT_EQ(response->get_header("Access-Control-Allow-Methods"), "GET,HEAD,POST,PUT,OPTIONS");
        EXPECT_EQ(response->get_header("Access-Control-Expose-Headers"),
                  "Content-Length, Content-Range, Content-Disposition");
    }
    EXPECT_EQ(missing.status_code, 404);
    EXPECT_EQ(body_json(missing)["error"], "File not found");
    EXPECT_EQ(bad.status_code, 400);
}

TEST_F(RelayServiceTest, PreflightIsNoContent) {
    auto response = call(HttpMethod::OPTIONS, "/upload/part/anything");

    EXPECT_EQ(response.status_code, 204);
    EXPECT_EQ(response.get_header("Access-Control-Allow-Headers"), "Content-Type, Range");
}

TEST_F(RelayServiceTest, InitiateValidatesInput) {
    EXPECT_EQ(call(HttpMethod::POST, "/upload/initiate", R"({"fileSize":3})").status_code, 400);
    EXPECT_EQ(call(HttpMethod::POST, "/upload/initiate", R"({"filename":"a","fileSize":-1})").status_code, 400);
    EXPECT_EQ(call(HttpMethod::POST, "/upload/initiate", R"({"filename":"","fileSize":3})").status_code, 400);
    EXPECT_EQ(call(HttpMethod::POST, "/upload/initiate", R"(["a"])").status_code, 400);
}

TEST_F(RelayServiceTest, OversizedPlanIsRejectedWithoutBackendSession) {
    int failures = 0;
    auto subscription = bus_.subscribe<UploadFailedEvent>([&failures](const UploadFailedEvent& e) {
        EXPECT_EQ(e.stage, "initiate");
        failures++;
    });

    auto response = call(HttpMethod::POST, "/upload/initiate", R"({"filename":"huge","fileSize":1000})");

    EXPECT_EQ(response.status_code, 400);
    EXPECT_EQ(body_json(response)["error"], "Upload rejected");
    EXPECT_EQ(store_.pending_upload_count(), 0u);
    EXPECT_EQ(failures, 1);
}

TEST_F(RelayServiceTest, PartRequestValidation) {
    auto plan = relay_.initiate("k", 10);
    ASSERT_TRUE(plan.is_ok());
    const std::string id = plan.value().upload_id;

    EXPECT_EQ(call(HttpMethod::PUT, "/upload/part/k?partNumber=1", "abcd").status_code, 400);
    EXPECT_EQ(call(HttpMethod::PUT, "/upload/part/k?uploadId=" + id + "&partNumber=0", "abcd").status_code, 400);
    EXPECT_EQ(call(HttpMethod::PUT, "/upload/part/k?uploadId=" + id + "&partNumber=x", "abcd").status_code, 400);
    EXPECT_EQ(call(HttpMethod::PUT, "/upload/part/k?uploadId=" + id + "&partNumber=4", "abcd").status_code, 400);
    EXPECT_EQ(call(HttpMethod::PUT, "/upload/part/other?uploadId=" + id + "&partNumber=1", "abcd").status_code, 400);
    EXPECT_EQ(store_.pending_part_count(id), 0u);
}

TEST_F(RelayServiceTest, CompleteRejectsDuplicatesAndMissingParts) {
    auto plan = relay_.initiate("k", 8);
    ASSERT_TRUE(plan.is_ok());
    const std::string id = plan.value().upload_id;
    auto etag1 = relay_.upload_part("k", id, 1, {'a', 'b', 'c', 'd'});
    ASSERT_TRUE(etag1.is_ok());

    auto duplicate = relay_.complete("k", id, {CompletedPart{1, etag1.value()}, CompletedPart{1, etag1.value()}});
    ASSERT_TRUE(duplicate.is_error());
    EXPECT_EQ(duplicate.error().code, ErrorCode::Validation);

    auto missing = relay_.complete("k", id, {CompletedPart{1, etag1.value()}});
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ErrorCode::Validation);
    EXPECT_EQ(relay_.active_uploads(), 1u);

    json request = {{"filename", "k"}, {"uploadId", id}, {"parts", json::array()}};
    auto response = call(HttpMethod::POST, "/upload/complete", request.dump());
    EXPECT_EQ(response.status_code, 400);
    EXPECT_EQ(body_json(response)["error"], "Failed to complete multipart upload");
}

TEST_F(RelayServiceTest, BackendRejectionIsServerError) {
    auto plan = relay_.initiate("k", 8);
    ASSERT_TRUE(plan.is_ok());
    const std::string id = plan.value().upload_id;
    ASSERT_TRUE(relay_.upload_part("k", id, 1, {'a', 'b', 'c', 'd'}).is_ok());
    ASSERT_TRUE(relay_.upload_part("k", id, 2, {'e', 'f', 'g', 'h'}).is_ok());

    json parts = json::array();
    parts.push_back(json{{"partNumber", 1}, {"etag", "wrong"}});
    parts.push_back(json{{"partNumber", 2}, {"etag", "wrong"}});
    json request = {{"filename", "k"}, {"uploadId", id}, {"parts", parts}};
    auto response = call(HttpMethod::POST, "/upload/complete", request.dump());

    EXPECT_EQ(response.status_code, 500);
    EXPECT_NE(body_json(response)["details"].get<std::string>().find("ETag mismatch"), std::string::npos);
    // Still tracked so the client can retry or abort
    EXPECT_EQ(relay_.active_uploads(), 1u);
}

TEST_F(RelayServiceTest, AbortReleasesTrackedUpload) {
    auto plan = relay_.initiate("k", 8);
    ASSERT_TRUE(plan.is_ok());
    const std::string id = plan.value().upload_id;
    ASSERT_TRUE(relay_.upload_part("k", id, 1, {'a', 'b', 'c', 'd'}).is_ok());

    json request = {{"filename", "k"}, {"uploadId", id}};
    auto response = call(HttpMethod::POST, "/upload/abort", request.dump());

    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(body_json(response)["success"], true);
    EXPECT_EQ(relay_.active_uploads(), 0u);
    EXPECT_EQ(store_.pending_upload_count(), 0u);
    EXPECT_EQ(metrics_.get_stats().uploads_aborted.load(), 1u);

    // Repeating the abort is harmless
    EXPECT_EQ(call(HttpMethod::POST, "/upload/abort", request.dump()).status_code, 200);
}

TEST_F(RelayServiceTest, UntrackedUploadIsResumed) {
    // Simulates a relay restart: the backend session exists, the registry does not
    auto created = store_.create_multipart("k", {});
    ASSERT_TRUE(created.is_ok());
    const std::string id = created.value();

    auto etag1 = relay_.upload_part("k", id, 1, {'a', 'b', 'c', 'd'});
    auto etag2 = relay_.upload_part("k", id, 2, {'e'});
    ASSERT_TRUE(etag1.is_ok());
    ASSERT_TRUE(etag2.is_ok());
    EXPECT_EQ(relay_.active_uploads(), 1u);

    auto info = relay_.complete("k", id, {CompletedPart{2, etag2.value()}, CompletedPart{1, etag1.value()}});
    ASSERT_TRUE(info.is_ok()) << info.error().message;
    EXPECT_EQ(info.value().size, 5u);
    EXPECT_EQ(relay_.active_uploads(), 0u);
}

TEST_F(RelayServiceTest, UnknownUploadSurfacesBackendError) {
    auto etag = relay_.upload_part("k", "no-such-upload", 1, {'a'});

    ASSERT_TRUE(etag.is_error());
    EXPECT_EQ(etag.error().code, ErrorCode::Backend);
    EXPECT_EQ(RelayService::status_for(etag.error().code), mpu::network::HttpStatus::INTERNAL_SERVER_ERROR);
    EXPECT_EQ(relay_.active_uploads(), 0u);
}

TEST_F(RelayServiceTest, UnknownUploadIdsAreNeverTracked) {
    for (int i = 0; i < 50; ++i) {
        const std::string suffix = std::to_string(i);
        EXPECT_TRUE(relay_.complete("k", "bogus-" + suffix, {}).is_error());
        EXPECT_TRUE(relay_.complete("k", "stale-" + suffix, {CompletedPart{1, "abc"}}).is_error());
        EXPECT_TRUE(relay_.upload_part("k", "other-" + suffix, 500, {'1', '2', '3', '4'}).is_error());
        EXPECT_TRUE(relay_.upload_part("k", "missing-" + suffix, 1, {'1', '2', '3', '4'}).is_error());
    }

    EXPECT_EQ(relay_.active_uploads(), 0u);
}

TEST_F(RelayServiceTest, FailedCompletionOfResumedUploadCanBeRetried) {
    auto created = store_.create_multipart("k", {});
    ASSERT_TRUE(created.is_ok());
    const std::string id = created.value();
    auto etag = store_.upload_part("k", id, 1, {'a', 'b'});
    ASSERT_TRUE(etag.is_ok());

    auto wrong = relay_.complete("k", id, {CompletedPart{1, "not-the-etag"}});
    ASSERT_TRUE(wrong.is_error());
    EXPECT_EQ(relay_.active_uploads(), 0u);
    EXPECT_EQ(store_.pending_upload_count(), 1u);

    auto info = relay_.complete("k", id, {CompletedPart{1, etag.value()}});
    ASSERT_TRUE(info.is_ok()) << info.error().message;
    EXPECT_EQ(info.value().size, 2u);
}

TEST_F(RelayServiceTest, IdleUploadsExpireOnNextInitiate) {
    RelayOptions options = relay_options();
    options.idle_timeout = std::chrono::seconds(0);
    RelayService relay(store_, bus_, options);

    auto first = relay.initiate("first", 8);
    ASSERT_TRUE(first.is_ok());
    ASSERT_EQ(relay.active_uploads(), 1u);

    auto second = relay.initiate("second", 8);
    ASSERT_TRUE(second.is_ok());

    EXPECT_EQ(relay.active_uploads(), 1u);
    EXPECT_EQ(store_.pending_upload_count(), 1u);
    EXPECT_EQ(metrics_.get_stats().uploads_aborted.load(), 1u);
    EXPECT_TRUE(relay.upload_part("first", first.value().upload_id, 1, {'a', 'b', 'c', 'd'}).is_error());
    EXPECT_EQ(relay.expire_idle_uploads(), 1u);
}

TEST_F(RelayServiceTest, ActiveUploadsAreNotExpired) {
    auto plan = relay_.initiate("k", 8);
    ASSERT_TRUE(plan.is_ok());

    EXPECT_EQ(relay_.expire_idle_uploads(), 0u);
    EXPECT_EQ(relay_.active_uploads(), 1u);
}

TEST_F(RelayServiceTest, SimplePutLargerThanChunkIsRejected) {
    auto stored = call(HttpMethod::PUT, "/upload/simple/big.txt", "hello");

    EXPECT_EQ(stored.status_code, 400);
    EXPECT_NE(body_json(stored)["details"].get<std::string>().find("multipart"), std::string::npos);
    EXPECT_EQ(store_.pending_upload_count(), 0u);
    EXPECT_EQ(call(HttpMethod::HEAD, "/objects/big.txt").status_code, 404);
}

TEST(RelayServiceStaticTest, ContentDispositionEncodesKey) {
    EXPECT_EQ(RelayService::content_disposition("résumé 1.pdf"),
              "attachment; filename*=UTF-8''r%C3%A9sum%C3%A9%201.pdf");
}

TEST(RelayServiceStaticTest, StatusMapping) {
    using mpu::network::HttpStatus;
    EXPECT_EQ(RelayService::status_for(ErrorCode::Config), HttpStatus::BAD_REQUEST);
    EXPECT_EQ(RelayService::status_for(ErrorCode::Validation), HttpStatus::BAD_REQUEST);
    EXPECT_EQ(RelayService::status_for(ErrorCode::NotFound), HttpStatus::NOT_FOUND);
    EXPECT_EQ(RelayService::status_for(ErrorCode::Backend), HttpStatus::INTERNAL_SERVER_ERROR);
}
