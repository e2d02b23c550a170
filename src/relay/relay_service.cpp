#include "mpu/relay/relay_service.hpp"

#include "mpu/events/events.hpp"
#include "mpu/util/encoding.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <charconv>
#include <optional>
#include <set>

namespace mpu::relay {

using network::HttpContext;
using network::HttpResponse;
using network::HttpStatus;
using json = nlohmann::json;

namespace {

HttpResponse make_json_response(HttpStatus status, const json& body) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json");
    response.set_body(body.dump());
    return response;
}

HttpResponse make_error(const Error& error, const std::string& summary) {
    return network::make_error_response(RelayService::status_for(error.code), summary, error.message);
}

HttpResponse bad_request(const std::string& details) {
    return network::make_error_response(HttpStatus::BAD_REQUEST, "Invalid request", details);
}

std::optional<std::uint32_t> parse_part_number(const std::string& text) {
    std::uint32_t value = 0;
    const char* first = text.data();
    const char* last = first + text.size();
    auto [end, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc() || end != last || value == 0) {
        return std::nullopt;
    }
    return value;
}

std::string string_field(const json& payload, const char* name) {
    auto it = payload.find(name);
    if (it == payload.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

json object_to_json(const storage::ObjectInfo& info) {
    json j;
    j["key"] = info.key;
    j["size"] = info.size;
    j["uploadedAt"] = util::format_timestamp(info.uploaded_at);
    j["etag"] = info.etag;
    return j;
}

json plan_to_json(const upload::UploadPlan& plan) {
    json j;
    j["mode"] = upload::to_string(plan.mode);
    j["filename"] = plan.key;
    j["chunkSize"] = plan.chunk_size;
    if (plan.mode == upload::UploadMode::Simple) {
        j["uploadUrl"] = plan.upload_url;
        return j;
    }
    j["uploadId"] = plan.upload_id;
    j["parts"] = json::array();
    for (const auto& part : plan.parts) {
        j["parts"].push_back(json{{"partNumber", part.part_number}, {"url", part.url}});
    }
    return j;
}

} // namespace

RelayService::RelayService(storage::ObjectStoreAdapter& store, events::EventBus& bus, RelayOptions options)
    : store_(store),
      event_bus_(bus),
      options_(std::move(options)),
      planner_(options_.limits) {}

void RelayService::apply_cors(HttpResponse& response) {
    response.set_header("Access-Control-Allow-Origin", "*");
    response.set_header("Access-Control-Allow-Methods", "GET,HEAD,POST,PUT,OPTIONS");
    response.set_header("Access-Control-Allow-Headers", "Content-Type, Range");
    response.set_header("Access-Control-Expose-Headers", "Content-Length, Content-Range, Content-Disposition");
}

std::string RelayService::content_disposition(const std::string& key) {
    return "attachment; filename*=UTF-8''" + util::percent_encode(key);
}

HttpStatus RelayService::status_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::Config:
        case ErrorCode::Validation:
            return HttpStatus::BAD_REQUEST;
        case ErrorCode::NotFound:
            return HttpStatus::NOT_FOUND;
        default:
            return HttpStatus::INTERNAL_SERVER_ERROR;
    }
}

upload::CoordinatorOptions RelayService::coordinator_options() const {
    upload::CoordinatorOptions options;
    options.chunk_size = options_.chunk_size;
    options.relay_base_url = options_.public_url;
    return options;
}

// ────────────────────────────────────────────────────────────
// Operations
// ────────────────────────────────────────────────────────────

mpu::Result<upload::UploadPlan> RelayService::initiate(const std::string& key, std::uint64_t size) {
    expire_idle_uploads();

    auto coordinator = std::make_shared<upload::UploadCoordinator>(store_, planner_, coordinator_options());

    auto planned = coordinator->initiate(key, size);
    if (planned.is_error()) {
        emit_failure(key, "", "initiate", planned.error());
        return planned;
    }

    const auto& plan = planned.value();
    if (plan.mode == upload::UploadMode::Multipart) {
        std::lock_guard lock(mutex_);
        ActiveUpload entry;
        entry.coordinator = coordinator;
        entry.total_bytes = size;
        uploads_[plan.upload_id] = std::move(entry);
    }

    events::UploadInitiatedEvent event;
    event.key = key;
    event.upload_id = plan.upload_id;
    event.mode = plan.mode;
    event.total_bytes = size;
    event.part_count = plan.part_count();
    event_bus_.emit(event);

    return planned;
}

mpu::Result<std::string> RelayService::upload_part(const std::string& key,
                                                   const std::string& upload_id,
                                                   std::uint32_t part_number,
                                                   const std::vector<std::uint8_t>& bytes) {
    auto found = find_or_resume(key, upload_id);
    if (found.is_error()) {
        return mpu::Err<std::string>(found.error());
    }
    auto coordinator = found.value().coordinator;

    if (auto checked = coordinator->check_part_number(part_number); checked.is_error()) {
        return mpu::Err<std::string>(checked.error());
    }

    auto etag = store_.upload_part(key, upload_id, part_number, bytes);
    if (etag.is_error()) {
        emit_failure(key, upload_id, "part", etag.error());
        return etag;
    }

    if (!found.value().tracked) {
        spdlog::info("Tracking resumed upload {} for {}", upload_id, key);
        coordinator = track(upload_id, std::move(coordinator));
    }

    if (auto recorded = coordinator->record_part(part_number, etag.value()); recorded.is_error()) {
        return mpu::Err<std::string>(recorded.error());
    }

    events::PartUploadedEvent event;
    event.key = key;
    event.upload_id = upload_id;
    event.part_number = part_number;
    event.bytes = bytes.size();
    event.etag = etag.value();
    event_bus_.emit(event);

    return etag;
}

mpu::Result<std::string> RelayService::upload_simple(const std::string& key, const std::vector<std::uint8_t>& bytes) {
    if (bytes.size() > options_.chunk_size) {
        return mpu::Err<std::string>(Error::validation(
            "Simple uploads are limited to " + std::to_string(options_.chunk_size) +
            " bytes; use a multipart upload for " + std::to_string(bytes.size()) + " bytes"));
    }

    const auto started = std::chrono::steady_clock::now();
    upload::UploadCoordinator coordinator(store_, planner_, coordinator_options());
    if (auto planned = coordinator.initiate(key, bytes.size()); planned.is_error()) {
        return mpu::Err<std::string>(planned.error());
    }

    auto etag = store_.put_object(key, bytes, storage::ObjectMetadata{});
    if (etag.is_error()) {
        emit_failure(key, "", "simple", etag.error());
        if (auto aborted = coordinator.abort(); aborted.is_error()) {
            spdlog::warn("Could not abort simple upload of {}: {}", key, aborted.error().message);
        }
        return etag;
    }
    if (auto done = coordinator.mark_simple_complete(); done.is_error()) {
        return mpu::Err<std::string>(done.error());
    }

    events::UploadCompletedEvent event;
    event.key = key;
    event.mode = upload::UploadMode::Simple;
    event.total_bytes = bytes.size();
    event.etag = etag.value();
    event.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    event_bus_.emit(event);

    return etag;
}

mpu::Result<storage::ObjectInfo> RelayService::complete(const std::string& key,
                                                        const std::string& upload_id,
                                                        const std::vector<upload::CompletedPart>& parts) {
    std::set<std::uint32_t> seen;
    for (const auto& part : parts) {
        if (!seen.insert(part.part_number).second) {
            return mpu::Err<storage::ObjectInfo>(
                Error::validation("Duplicate part number " + std::to_string(part.part_number)));
        }
    }

    auto found = find_or_resume(key, upload_id);
    if (found.is_error()) {
        return mpu::Err<storage::ObjectInfo>(found.error());
    }
    auto coordinator = found.value().coordinator;

    for (const auto& part : parts) {
        if (auto recorded = coordinator->record_part(part.part_number, part.etag); recorded.is_error()) {
            return mpu::Err<storage::ObjectInfo>(recorded.error());
        }
    }

    auto completed = coordinator->complete();
    if (completed.is_error()) {
        emit_failure(key, upload_id, "complete", completed.error());
        return completed;
    }

    std::chrono::steady_clock::time_point started_at = std::chrono::steady_clock::now();
    {
        std::lock_guard lock(mutex_);
        auto it = uploads_.find(upload_id);
        if (it != uploads_.end()) {
            started_at = it->second.started_at;
            uploads_.erase(it);
        }
    }

    const auto& info = completed.value();
    events::UploadCompletedEvent event;
    event.key = key;
    event.upload_id = upload_id;
    event.mode = upload::UploadMode::Multipart;
    event.total_bytes = info.size;
    event.part_count = static_cast<std::uint32_t>(parts.size());
    event.etag = info.etag;
    event.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at);
    event_bus_.emit(event);

    return completed;
}

mpu::Result<void> RelayService::abort(const std::string& key, const std::string& upload_id) {
    if (key.empty() || upload_id.empty()) {
        return mpu::Err<void>(Error::validation("filename and uploadId are required"));
    }

    std::shared_ptr<upload::UploadCoordinator> coordinator;
    {
        std::lock_guard lock(mutex_);
        auto it = uploads_.find(upload_id);
        if (it != uploads_.end()) {
            coordinator = it->second.coordinator;
        }
    }

    if (coordinator && coordinator->info().key != key) {
        return mpu::Err<void>(Error::validation("Upload " + upload_id + " does not belong to " + key));
    }
    if (!coordinator) {
        coordinator = upload::UploadCoordinator::resume(store_, planner_, coordinator_options(), key, upload_id);
    }

    auto released = coordinator->abort();
    forget(upload_id);

    events::UploadAbortedEvent event;
    event.key = key;
    event.upload_id = upload_id;
    if (released.is_error()) {
        event.backend_error = released.error().message;
    }
    event_bus_.emit(event);

    return released;
}

std::size_t RelayService::active_uploads() const {
    std::lock_guard lock(mutex_);
    return uploads_.size();
}

std::size_t RelayService::expire_idle_uploads() {
    const auto now = std::chrono::steady_clock::now();
    std::vector<std::pair<std::string, std::shared_ptr<upload::UploadCoordinator>>> expired;
    {
        std::lock_guard lock(mutex_);
        for (auto it = uploads_.begin(); it != uploads_.end();) {
            if (now - it->second.last_activity >= options_.idle_timeout) {
                expired.emplace_back(it->first, it->second.coordinator);
                it = uploads_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& [upload_id, coordinator] : expired) {
        const std::string key = coordinator->info().key;
        spdlog::warn("Expiring idle upload {} for {}", upload_id, key);

        events::UploadAbortedEvent event;
        event.key = key;
        event.upload_id = upload_id;
        if (auto released = coordinator->abort(); released.is_error()) {
            event.backend_error = released.error().message;
        }
        event_bus_.emit(event);
    }
    return expired.size();
}

mpu::Result<RelayService::Lookup> RelayService::find_or_resume(const std::string& key, const std::string& upload_id) {
    if (key.empty() || upload_id.empty()) {
        return mpu::Err<Lookup>(Error::validation("Object key and uploadId are required"));
    }

    Lookup lookup;
    {
        std::lock_guard lock(mutex_);
        auto it = uploads_.find(upload_id);
        if (it != uploads_.end()) {
            it->second.last_activity = std::chrono::steady_clock::now();
            lookup.coordinator = it->second.coordinator;
            lookup.tracked = true;
        }
    }

    if (!lookup.tracked) {
        lookup.coordinator = upload::UploadCoordinator::resume(store_, planner_, coordinator_options(), key, upload_id);
    } else if (lookup.coordinator->info().key != key) {
        return mpu::Err<Lookup>(Error::validation("Upload " + upload_id + " does not belong to " + key));
    }
    return mpu::Ok(std::move(lookup));
}

std::shared_ptr<upload::UploadCoordinator> RelayService::track(const std::string& upload_id,
                                                               std::shared_ptr<upload::UploadCoordinator> coordinator) {
    std::lock_guard lock(mutex_);
    ActiveUpload entry;
    entry.coordinator = std::move(coordinator);
    return uploads_.emplace(upload_id, std::move(entry)).first->second.coordinator;
}

void RelayService::forget(const std::string& upload_id) {
    std::lock_guard lock(mutex_);
    uploads_.erase(upload_id);
}

void RelayService::emit_failure(const std::string& key,
                                const std::string& upload_id,
                                const std::string& stage,
                                const Error& error) {
    events::UploadFailedEvent event;
    event.key = key;
    event.upload_id = upload_id;
    event.stage = stage;
    event.error_message = std::string(to_string(error.code)) + ": " + error.message;
    event_bus_.emit(event);
}

// ────────────────────────────────────────────────────────────
// HTTP surface
// ────────────────────────────────────────────────────────────

void RelayService::register_routes(network::HttpRouter& router) {
    router.use([](const HttpContext& ctx, HttpResponse&) {
        spdlog::info("{} {}", network::HttpMethodUtils::to_string(ctx.request.method), ctx.path);
        return true;
    });

    router.after([](const HttpContext&, HttpResponse& response) {
        apply_cors(response);
    });

    router.options("*", [](const HttpContext&) {
        return HttpResponse(HttpStatus::NO_CONTENT);
    });

    router.post("/upload/initiate", [this](const HttpContext& ctx) { return handle_initiate(ctx); });
    router.put("/upload/part/*key", [this](const HttpContext& ctx) { return handle_part(ctx); });
    router.put("/upload/simple/*key", [this](const HttpContext& ctx) { return handle_simple(ctx); });
    router.post("/upload/complete", [this](const HttpContext& ctx) { return handle_complete(ctx); });
    router.post("/upload/abort", [this](const HttpContext& ctx) { return handle_abort(ctx); });
    router.get("/objects", [this](const HttpContext& ctx) { return handle_list(ctx); });
    router.get("/objects/*key", [this](const HttpContext& ctx) { return handle_download(ctx); });
    router.head("/objects/*key", [this](const HttpContext& ctx) { return handle_download(ctx); });
}

HttpResponse RelayService::handle_initiate(const HttpContext& ctx) {
    auto payload = json::parse(ctx.request.body_as_string(), nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return bad_request("Could not parse request body");
    }

    auto filename = payload.find("filename");
    auto file_size = payload.find("fileSize");
    if (filename == payload.end() || !filename->is_string() || filename->get<std::string>().empty() ||
        file_size == payload.end() || !file_size->is_number_unsigned()) {
        return bad_request("filename and fileSize are required");
    }

    auto plan = initiate(filename->get<std::string>(), file_size->get<std::uint64_t>());
    if (plan.is_error()) {
        const char* summary = plan.error().code == ErrorCode::Config ? "Upload rejected" : "Failed to initiate upload";
        return make_error(plan.error(), summary);
    }
    return make_json_response(HttpStatus::OK, plan_to_json(plan.value()));
}

HttpResponse RelayService::handle_part(const HttpContext& ctx) {
    const std::string key = ctx.get_param("key");
    const std::string upload_id = ctx.get_query("uploadId");
    auto part_number = parse_part_number(ctx.get_query("partNumber"));
    if (upload_id.empty() || !part_number) {
        return bad_request("Missing uploadId or partNumber");
    }

    auto etag = upload_part(key, upload_id, *part_number, ctx.request.body);
    if (etag.is_error()) {
        return make_error(etag.error(), "Failed to upload part");
    }

    auto response = make_json_response(HttpStatus::OK, json{{"success", true}, {"etag", etag.value()}});
    response.set_header("ETag", "\"" + etag.value() + "\"");
    return response;
}

HttpResponse RelayService::handle_simple(const HttpContext& ctx) {
    auto etag = upload_simple(ctx.get_param("key"), ctx.request.body);
    if (etag.is_error()) {
        return make_error(etag.error(), "Failed to upload file");
    }

    auto response = make_json_response(HttpStatus::OK, json{{"success", true}, {"etag", etag.value()}});
    response.set_header("ETag", "\"" + etag.value() + "\"");
    return response;
}

HttpResponse RelayService::handle_complete(const HttpContext& ctx) {
    auto payload = json::parse(ctx.request.body_as_string(), nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return bad_request("Could not parse request body");
    }

    const std::string filename = string_field(payload, "filename");
    const std::string upload_id = string_field(payload, "uploadId");
    auto parts_field = payload.find("parts");
    if (filename.empty() || upload_id.empty() || parts_field == payload.end() || !parts_field->is_array()) {
        return bad_request("Missing required fields");
    }

    std::vector<upload::CompletedPart> parts;
    parts.reserve(parts_field->size());
    for (const auto& entry : *parts_field) {
        if (!entry.is_object()) {
            return bad_request("Each part must be an object");
        }
        auto number = entry.find("partNumber");
        auto etag = entry.find("etag");
        if (number == entry.end() || !number->is_number_unsigned() ||
            etag == entry.end() || !etag->is_string()) {
            return bad_request("Each part needs a partNumber and an etag");
        }
        const auto value = number->get<std::uint64_t>();
        if (value == 0 || value > upload::kMaxParts) {
            return bad_request("Part number " + std::to_string(value) + " is out of range");
        }
        parts.push_back(upload::CompletedPart{static_cast<std::uint32_t>(value), etag->get<std::string>()});
    }

    auto completed = complete(filename, upload_id, parts);
    if (completed.is_error()) {
        return make_error(completed.error(), "Failed to complete multipart upload");
    }

    const auto& info = completed.value();
    return make_json_response(HttpStatus::OK, json{{"success", true}, {"etag", info.etag}, {"size", info.size}});
}

HttpResponse RelayService::handle_abort(const HttpContext& ctx) {
    auto payload = json::parse(ctx.request.body_as_string(), nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return bad_request("Could not parse request body");
    }

    const std::string filename = string_field(payload, "filename");
    const std::string upload_id = string_field(payload, "uploadId");
    if (filename.empty() || upload_id.empty()) {
        return bad_request("Missing required fields");
    }

    auto released = abort(filename, upload_id);
    if (released.is_error()) {
        return make_error(released.error(), "Failed to abort multipart upload");
    }
    return make_json_response(HttpStatus::OK, json{{"success", true}});
}

HttpResponse RelayService::handle_list(const HttpContext&) {
    auto objects = store_.list_objects();
    if (objects.is_error()) {
        return make_error(objects.error(), "Failed to list objects");
    }

    json listing = json::array();
    for (const auto& info : objects.value()) {
        listing.push_back(object_to_json(info));
    }
    return make_json_response(HttpStatus::OK, listing);
}

HttpResponse RelayService::handle_download(const HttpContext& ctx) {
    const std::string key = ctx.get_param("key");

    if (ctx.request.method == network::HttpMethod::HEAD) {
        auto info = store_.head_object(key);
        if (info.is_error()) {
            return make_error(info.error(), "Failed to download file");
        }
        HttpResponse response(HttpStatus::OK);
        response.set_header("Content-Type", info.value().content_type);
        response.set_header("Content-Length", std::to_string(info.value().size));
        response.set_header("Content-Disposition", content_disposition(key));
        response.set_header("ETag", "\"" + info.value().etag + "\"");
        return response;
    }

    auto reader = store_.open_object(key);
    if (reader.is_error()) {
        const char* summary = reader.error().code == ErrorCode::NotFound ? "File not found" : "Failed to download file";
        return make_error(reader.error(), summary);
    }

    auto& object = reader.value();
    HttpResponse response(HttpStatus::OK);
    response.set_header("Content-Type", object.info.content_type);
    response.set_header("Content-Disposition", content_disposition(key));
    response.set_header("ETag", "\"" + object.info.etag + "\"");
    response.set_stream(std::shared_ptr<stream::ByteSource>(std::move(object.body)), object.info.size);

    events::ObjectDownloadedEvent event;
    event.key = key;
    event.total_bytes = object.info.size;
    event_bus_.emit(event);

    return response;
}

} // namespace mpu::relay
