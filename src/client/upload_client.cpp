#include "mpu/client/upload_client.hpp"

#include "mpu/upload/part_planner.hpp"
#include "mpu/util/encoding.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>

namespace mpu::client {

using network::ClientRequest;
using network::HttpMethod;
using network::HttpResponse;
using json = nlohmann::json;

namespace {

bool is_success(const HttpResponse& response) {
    return response.status_code >= 200 && response.status_code < 300;
}

ErrorCode code_for_status(int status) {
    switch (status) {
        case 400: return ErrorCode::Validation;
        case 404: return ErrorCode::NotFound;
        default: return ErrorCode::Backend;
    }
}

/**
 * @brief Build an Error from a relay error response
 *
 * The relay answers plan rejections with {"error": "Upload rejected"}, which
 * is reported as ErrorCode::Config.
 */
Error error_from_response(const HttpResponse& response, const std::string& context) {
    std::string message = context + " (Status: " + std::to_string(response.status_code) + ")";
    ErrorCode code = code_for_status(response.status_code);

    auto body = json::parse(response.body_as_string(), nullptr, false);
    if (!body.is_discarded() && body.is_object()) {
        auto error = body.find("error");
        auto details = body.find("details");
        if (error != body.end() && error->is_string()) {
            message += ": " + error->get<std::string>();
            if (response.status_code == 400 && error->get<std::string>() == "Upload rejected") {
                code = ErrorCode::Config;
            }
        }
        if (details != body.end() && details->is_string() && !details->get<std::string>().empty()) {
            message += " - " + details->get<std::string>();
        }
    }
    return Error{code, message};
}

mpu::Result<json> parse_json_body(const HttpResponse& response, const std::string& context) {
    auto body = json::parse(response.body_as_string(), nullptr, false);
    if (body.is_discarded()) {
        return mpu::Err<json>(Error::backend(context + ": failed to parse server response"));
    }
    return mpu::Ok(std::move(body));
}

ClientRequest json_request(HttpMethod method, const std::string& target, const json& payload) {
    const std::string text = payload.dump();
    ClientRequest request;
    request.method = method;
    request.target = target;
    request.headers["Content-Type"] = "application/json";
    request.body = std::make_shared<stream::MemorySource>(std::vector<std::uint8_t>(text.begin(), text.end()));
    request.body_length = text.size();
    return request;
}

} // namespace

Error upload_failed(const Error& cause) {
    return Error{cause.code, "Upload failed: " + cause.message};
}

UploadClient::UploadClient(RelayTransport& transport, UploadOptions options)
    : transport_(transport),
      options_(std::move(options)) {}

void UploadClient::report_progress(std::uint64_t loaded, std::uint64_t total) {
    if (loaded < last_reported_) {
        return;
    }
    last_reported_ = loaded;
    if (options_.on_progress) {
        options_.on_progress(upload::make_progress(loaded, total));
    }
}

mpu::Result<UploadReport> UploadClient::upload(const std::filesystem::path& file, const std::string& key) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(file, ec);
    if (ec) {
        return mpu::Err<UploadReport>(upload_failed(Error::io("Cannot read " + file.string() + ": " + ec.message())));
    }

    last_reported_ = 0;
    spdlog::info("Initiating upload of {} ({} bytes) as {}", file.string(), size, key);

    auto plan = request_plan(key, size);
    if (plan.is_error()) {
        return mpu::Err<UploadReport>(upload_failed(plan.error()));
    }

    report_progress(0, size);

    if (plan.value().mode == upload::UploadMode::Simple) {
        return upload_simple(file, plan.value());
    }
    return upload_multipart(file, plan.value());
}

mpu::Result<upload::UploadPlan> UploadClient::request_plan(const std::string& key, std::uint64_t size) {
    // Once an upload id is known the backend session exists; every rejection
    // of the plan past that point must release it
    upload::UploadPlan opened;
    opened.key = key;

    auto rejected = [this, &opened](const Error& error) {
        if (!opened.upload_id.empty()) {
            abort_quietly(opened);
        }
        return mpu::Err<upload::UploadPlan>(error);
    };

    try {
        auto plan = request_plan_unchecked(key, size, opened);
        if (plan.is_error()) {
            return rejected(plan.error());
        }
        return plan;
    } catch (const json::exception& e) {
        return rejected(Error::backend(std::string("Initiate: malformed response: ") + e.what()));
    }
}

mpu::Result<upload::UploadPlan> UploadClient::request_plan_unchecked(const std::string& key,
                                                                     std::uint64_t size,
                                                                     upload::UploadPlan& opened) {
    auto sent = transport_.send(json_request(HttpMethod::POST, "/upload/initiate",
                                             json{{"filename", key}, {"fileSize", size}}));
    if (sent.is_error()) {
        return mpu::Err<upload::UploadPlan>(sent.error());
    }
    if (!is_success(sent.value())) {
        return mpu::Err<upload::UploadPlan>(error_from_response(sent.value(), "Server error"));
    }

    auto body = parse_json_body(sent.value(), "Initiate");
    if (body.is_error()) {
        return mpu::Err<upload::UploadPlan>(body.error());
    }
    const json& data = body.value();
    if (!data.is_object()) {
        return mpu::Err<upload::UploadPlan>(Error::backend("Initiate: unexpected response shape"));
    }

    upload::UploadPlan plan;
    plan.key = key;
    plan.total_size = size;

    auto mode = upload::parse_upload_mode(data.value("mode", std::string{}));
    if (!mode) {
        return mpu::Err<upload::UploadPlan>(Error::backend("Initiate: unknown upload mode"));
    }
    plan.mode = *mode;

    if (plan.mode == upload::UploadMode::Simple) {
        plan.upload_url = data.value("uploadUrl", std::string{});
        if (plan.upload_url.empty()) {
            return mpu::Err<upload::UploadPlan>(Error::backend("Initiate: missing uploadUrl"));
        }
        return mpu::Ok(std::move(plan));
    }

    plan.upload_id = data.value("uploadId", std::string{});
    opened.upload_id = plan.upload_id;
    plan.chunk_size = data.value("chunkSize", upload::kDefaultChunkSize);
    auto parts = data.find("parts");
    if (plan.upload_id.empty() || plan.chunk_size == 0 || parts == data.end() || !parts->is_array()) {
        return mpu::Err<upload::UploadPlan>(Error::backend("Initiate: incomplete multipart plan"));
    }

    for (const auto& entry : *parts) {
        upload::PartDescriptor part;
        part.part_number = entry.value("partNumber", 0u);
        part.url = entry.value("url", std::string{});
        if (part.part_number == 0 || part.url.empty()) {
            return mpu::Err<upload::UploadPlan>(Error::backend("Initiate: malformed part entry"));
        }
        part.start = (part.part_number - 1) * plan.chunk_size;
        part.end = std::min(part.start + plan.chunk_size, size);
        if (part.start >= size) {
            return mpu::Err<upload::UploadPlan>(Error::backend("Initiate: part " + std::to_string(part.part_number) +
                                                               " lies beyond the end of the file"));
        }
        plan.parts.push_back(std::move(part));
    }

    const auto expected = upload::PartPlanner::part_count_for(size, plan.chunk_size);
    if (plan.parts.size() != expected) {
        return mpu::Err<upload::UploadPlan>(Error::backend("Initiate: expected " + std::to_string(expected) +
                                                           " parts, relay planned " +
                                                           std::to_string(plan.parts.size())));
    }

    return mpu::Ok(std::move(plan));
}

mpu::Result<UploadReport> UploadClient::upload_simple(const std::filesystem::path& file,
                                                      const upload::UploadPlan& plan) {
    auto source = stream::FileRangeSource::open(file);
    if (source.is_error()) {
        return mpu::Err<UploadReport>(upload_failed(source.error()));
    }

    ClientRequest request;
    request.method = HttpMethod::PUT;
    request.target = transport_.target_for(plan.upload_url);
    request.headers["Content-Type"] = "application/octet-stream";
    request.body = std::shared_ptr<stream::ByteSource>(std::move(source.value()));
    request.body_length = plan.total_size;
    request.on_sent = [this, &plan](std::uint64_t sent) { report_progress(sent, plan.total_size); };

    auto sent = transport_.send(request);
    if (sent.is_error()) {
        return mpu::Err<UploadReport>(upload_failed(sent.error()));
    }
    if (!is_success(sent.value())) {
        return mpu::Err<UploadReport>(upload_failed(error_from_response(sent.value(), "Failed to upload file")));
    }

    auto body = parse_json_body(sent.value(), "Upload");
    if (body.is_error()) {
        return mpu::Err<UploadReport>(upload_failed(body.error()));
    }

    report_progress(plan.total_size, plan.total_size);

    UploadReport report;
    report.key = plan.key;
    report.mode = upload::UploadMode::Simple;
    report.bytes = plan.total_size;
    report.etag = body.value().is_object() ? body.value().value("etag", std::string{}) : std::string{};
    report.message = "Upload complete!";
    spdlog::info("{}: {} bytes stored as {}", report.message, report.bytes, report.key);
    return mpu::Ok(std::move(report));
}

mpu::Result<UploadReport> UploadClient::upload_multipart(const std::filesystem::path& file,
                                                         const upload::UploadPlan& plan) {
    std::vector<upload::CompletedPart> completed;
    completed.reserve(plan.parts.size());

    for (const auto& part : plan.parts) {
        auto etag = send_part(file, part, plan.total_size);
        if (etag.is_error()) {
            abort_quietly(plan);
            return mpu::Err<UploadReport>(upload_failed(etag.error()));
        }
        completed.push_back(upload::CompletedPart{part.part_number, etag.value()});
        report_progress(part.end, plan.total_size);
    }

    auto info = complete(plan, completed);
    if (info.is_error()) {
        abort_quietly(plan);
        return mpu::Err<UploadReport>(upload_failed(info.error()));
    }

    UploadReport report;
    report.key = plan.key;
    report.mode = upload::UploadMode::Multipart;
    report.upload_id = plan.upload_id;
    report.bytes = plan.total_size;
    report.part_count = plan.part_count();
    report.etag = info.value().etag;
    report.message = "Upload complete!";
    spdlog::info("{}: {} bytes in {} parts stored as {}", report.message, report.bytes, report.part_count, report.key);
    return mpu::Ok(std::move(report));
}

mpu::Result<std::string> UploadClient::send_part(const std::filesystem::path& file,
                                                 const upload::PartDescriptor& part,
                                                 std::uint64_t total_size) {
    const std::uint32_t attempts = options_.part_retries + 1;
    for (std::uint32_t attempt = 1;; ++attempt) {
        auto etag = send_part_once(file, part, total_size);
        if (etag.is_ok() || etag.error().code != ErrorCode::Network || attempt >= attempts) {
            return etag;
        }
        spdlog::warn("Part {} attempt {}/{} failed: {}", part.part_number, attempt, attempts, etag.error().message);
    }
}

mpu::Result<std::string> UploadClient::send_part_once(const std::filesystem::path& file,
                                                      const upload::PartDescriptor& part,
                                                      std::uint64_t total_size) {
    auto source = stream::FileRangeSource::open(file, part.start, part.end);
    if (source.is_error()) {
        return mpu::Err<std::string>(source.error());
    }

    ClientRequest request;
    request.method = HttpMethod::PUT;
    request.target = transport_.target_for(part.url);
    request.headers["Content-Type"] = "application/octet-stream";
    request.body = std::shared_ptr<stream::ByteSource>(std::move(source.value()));
    request.body_length = part.size();
    request.on_sent = [this, &part, total_size](std::uint64_t sent) {
        report_progress(part.start + sent, total_size);
    };

    const std::string context = "Failed to upload part " + std::to_string(part.part_number);

    auto sent = transport_.send(request);
    if (sent.is_error()) {
        return mpu::Err<std::string>(Error{sent.error().code, context + ": " + sent.error().message});
    }
    if (!is_success(sent.value())) {
        return mpu::Err<std::string>(error_from_response(sent.value(), context));
    }

    auto body = parse_json_body(sent.value(), context);
    if (body.is_error()) {
        return mpu::Err<std::string>(body.error());
    }
    std::string etag;
    if (body.value().is_object()) {
        auto field = body.value().find("etag");
        if (field != body.value().end() && field->is_string()) {
            etag = field->get<std::string>();
        }
    }
    if (etag.empty()) {
        return mpu::Err<std::string>(Error::backend("No ETag received for part " + std::to_string(part.part_number)));
    }

    spdlog::debug("Part {} stored, etag {}", part.part_number, etag);
    return mpu::Ok(std::move(etag));
}

mpu::Result<storage::ObjectInfo> UploadClient::complete(const upload::UploadPlan& plan,
                                                        const std::vector<upload::CompletedPart>& parts) {
    json listed = json::array();
    for (const auto& part : parts) {
        listed.push_back(json{{"partNumber", part.part_number}, {"etag", part.etag}});
    }

    auto sent = transport_.send(json_request(HttpMethod::POST, "/upload/complete",
        json{{"filename", plan.key}, {"uploadId", plan.upload_id}, {"parts", listed}}));
    if (sent.is_error()) {
        return mpu::Err<storage::ObjectInfo>(sent.error());
    }
    if (!is_success(sent.value())) {
        return mpu::Err<storage::ObjectInfo>(error_from_response(sent.value(), "Failed to complete multipart upload"));
    }

    auto body = parse_json_body(sent.value(), "Complete");
    if (body.is_error()) {
        return mpu::Err<storage::ObjectInfo>(body.error());
    }

    storage::ObjectInfo info;
    info.key = plan.key;
    info.size = plan.total_size;
    if (body.value().is_object()) {
        info.etag = body.value().value("etag", std::string{});
    }
    return mpu::Ok(std::move(info));
}

void UploadClient::abort_quietly(const upload::UploadPlan& plan) {
    auto sent = transport_.send(json_request(HttpMethod::POST, "/upload/abort",
        json{{"filename", plan.key}, {"uploadId", plan.upload_id}}));
    if (sent.is_error()) {
        spdlog::error("Failed to abort multipart upload {}: {}", plan.upload_id, sent.error().message);
        return;
    }
    if (!is_success(sent.value())) {
        spdlog::error("Failed to abort multipart upload {}: {}", plan.upload_id,
                      error_from_response(sent.value(), "Abort rejected").message);
        return;
    }
    spdlog::info("Aborted multipart upload {}", plan.upload_id);
}

mpu::Result<std::vector<storage::ObjectInfo>> UploadClient::list_objects() {
    try {
        return list_objects_unchecked();
    } catch (const json::exception& e) {
        return mpu::Err<std::vector<storage::ObjectInfo>>(Error::backend(std::string("List: malformed response: ") + e.what()));
    }
}

mpu::Result<std::vector<storage::ObjectInfo>> UploadClient::list_objects_unchecked() {
    ClientRequest request;
    request.method = HttpMethod::GET;
    request.target = "/objects";

    auto sent = transport_.send(request);
    if (sent.is_error()) {
        return mpu::Err<std::vector<storage::ObjectInfo>>(sent.error());
    }
    if (!is_success(sent.value())) {
        return mpu::Err<std::vector<storage::ObjectInfo>>(error_from_response(sent.value(), "Failed to list objects"));
    }

    auto body = parse_json_body(sent.value(), "List");
    if (body.is_error()) {
        return mpu::Err<std::vector<storage::ObjectInfo>>(body.error());
    }
    if (!body.value().is_array()) {
        return mpu::Err<std::vector<storage::ObjectInfo>>(Error::backend("List: expected an array"));
    }

    std::vector<storage::ObjectInfo> objects;
    for (const auto& entry : body.value()) {
        if (!entry.is_object()) {
            continue;
        }
        storage::ObjectInfo info;
        info.key = entry.value("key", std::string{});
        info.size = entry.value("size", std::uint64_t{0});
        info.etag = entry.value("etag", std::string{});
        if (auto uploaded = util::parse_timestamp(entry.value("uploadedAt", std::string{}))) {
            info.uploaded_at = *uploaded;
        }
        objects.push_back(std::move(info));
    }
    return mpu::Ok(std::move(objects));
}

mpu::Result<std::uint64_t> UploadClient::download(const std::string& key, stream::ByteSink& sink) {
    ClientRequest request;
    request.method = HttpMethod::GET;
    request.target = "/objects/" + util::percent_encode(key);

    auto sent = transport_.send(request, &sink);
    if (sent.is_error()) {
        return mpu::Err<std::uint64_t>(sent.error());
    }
    if (!is_success(sent.value())) {
        return mpu::Err<std::uint64_t>(error_from_response(sent.value(), "Failed to download " + key));
    }

    const std::string length = sent.value().get_header("Content-Length");
    std::uint64_t bytes = 0;
    auto [end, ec] = std::from_chars(length.data(), length.data() + length.size(), bytes);
    if (ec != std::errc() || end != length.data() + length.size()) {
        return mpu::Err<std::uint64_t>(Error::backend("Download of " + key + " returned no Content-Length"));
    }
    return mpu::Ok(bytes);
}

} // namespace mpu::client
