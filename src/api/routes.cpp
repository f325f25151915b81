#include "chunkd/api/routes.hpp"

#include "chunkd/network/multipart.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <limits>
#include <memory>

namespace chunkd::api {

using json = nlohmann::json;
using network::HttpContext;
using network::HttpResponse;
using network::HttpStatus;

namespace {

Result<uint32_t, Error> parse_count(const std::optional<std::string>& text, const std::string& field) {
    if (!text || text->empty()) {
        return Fail<uint32_t>(ErrorKind::InvalidArgument, field + " is required");
    }

    uint64_t value = 0;
    for (char c : *text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return Fail<uint32_t>(ErrorKind::InvalidArgument, field + " must be a positive integer");
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
        if (value > std::numeric_limits<uint32_t>::max()) {
            return Fail<uint32_t>(ErrorKind::InvalidArgument, field + " is out of range");
        }
    }
    return Ok(static_cast<uint32_t>(value));
}

std::optional<std::string> query_value(const HttpContext& ctx, const std::string& name) {
    if (!ctx.has_query(name)) {
        return std::nullopt;
    }
    return ctx.get_query(name);
}

HttpResponse handle_upload_part(transfer::TransferService& service, const HttpContext& ctx) {
    auto part = part_from_request(ctx);
    if (part.is_error()) {
        return error_response(part.error());
    }

    auto receipt = service.upload_part(part.value());
    if (receipt.is_error()) {
        return error_response(receipt.error());
    }

    const auto& stored = receipt.value();
    return json_response(HttpStatus::OK, {
        {"message", stored.message},
        {"filename", stored.file_name},
        {"part_number", stored.part_number},
        {"total_parts", stored.total_parts},
        {"size", stored.stored_size},
        {"complete", stored.complete}
    });
}

HttpResponse handle_download(transfer::TransferService& service, const HttpContext& ctx) {
    auto opened = service.download_file(ctx.get_param("file_name"));
    if (opened.is_error()) {
        return error_response(opened.error());
    }

    auto stream = std::make_shared<transfer::ChunkStream>(std::move(opened.value()));

    HttpResponse response(HttpStatus::OK);
    response.set_header("Content-Type", "application/octet-stream");
    response.set_header("Content-Disposition", stream->disposition());
    response.set_stream(stream->size(), [stream](std::vector<uint8_t>& chunk) -> Result<bool> {
        auto next = stream->next();
        if (next.is_error()) {
            return Err<bool>(next.error().detail);
        }
        if (!next.value()) {
            return Ok(false);
        }
        chunk = std::move(*next.value());
        return Ok(true);
    });
    return response;
}

HttpResponse handle_resume(transfer::TransferService& service, const HttpContext& ctx) {
    const auto name = ctx.get_query("file_name");
    if (name.empty()) {
        return error_response(Error{ErrorKind::InvalidArgument, "File name parameter is required"});
    }

    auto point = service.resume_point(name);
    if (point.is_error()) {
        return error_response(point.error());
    }

    return json_response(HttpStatus::OK, {
        {"chunk_index", point.value().chunk_index},
        {"size", point.value().stored_size},
        {"message", point.value().message}
    });
}

HttpResponse handle_list(transfer::TransferService& service) {
    auto files = service.list_files();
    if (files.is_error()) {
        return error_response(files.error());
    }

    json body = {{"files", files.value()}};
    if (files.value().empty()) {
        body["message"] = "No files found.";
    }
    return json_response(HttpStatus::OK, body);
}

HttpResponse handle_search(transfer::TransferService& service, const HttpContext& ctx) {
    auto matches = service.search_files(ctx.get_query("file_name"));
    if (matches.is_error()) {
        return error_response(matches.error());
    }
    return json_response(HttpStatus::OK, {{"matching_files", matches.value()}});
}

const char* router_error_kind(HttpStatus status) {
    switch (status) {
        case HttpStatus::NOT_FOUND: return "not-found";
        case HttpStatus::METHOD_NOT_ALLOWED: return "method-not-allowed";
        default: return "internal-error";
    }
}

} // namespace

network::HttpStatus status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidArgument:
        case ErrorKind::MalformedPart:
        case ErrorKind::CountLimit:
            return HttpStatus::BAD_REQUEST;
        case ErrorKind::PartTooLarge:
        case ErrorKind::QuotaExceeded:
            return HttpStatus::PAYLOAD_TOO_LARGE;
        case ErrorKind::Conflict:
            return HttpStatus::CONFLICT;
        case ErrorKind::NotFound:
            return HttpStatus::NOT_FOUND;
        case ErrorKind::IoError:
            return HttpStatus::INTERNAL_SERVER_ERROR;
    }
    return HttpStatus::INTERNAL_SERVER_ERROR;
}

HttpResponse json_response(HttpStatus status, const json& body) {
    HttpResponse response(status);
    response.set_body(body.dump(-1, ' ', false, json::error_handler_t::replace));
    response.set_header("Content-Type", "application/json");
    return response;
}

HttpResponse error_response(const Error& error) {
    return json_response(status_for(error.kind), {
        {"error", to_string(error.kind)},
        {"detail", error.detail}
    });
}

Result<transfer::PartRequest, Error> part_from_request(const HttpContext& ctx) {
    const auto& request = ctx.request;
    const std::string content_type = request.get_header("Content-Type");

    transfer::PartRequest part;
    std::optional<std::string> part_number;
    std::optional<std::string> total_parts;

    if (network::is_multipart_form(content_type)) {
        auto form = network::MultipartForm::parse(content_type, request.body);
        if (form.is_error()) {
            return Fail<transfer::PartRequest>(ErrorKind::InvalidArgument, form.error());
        }

        const auto* file = form.value().find("file");
        if (file == nullptr || !file->filename) {
            return Fail<transfer::PartRequest>(ErrorKind::InvalidArgument, "Form field 'file' with a filename is required");
        }
        part.file_name = *file->filename;
        part.data = file->data;
        part_number = form.value().field("part_number");
        total_parts = form.value().field("total_parts");
    } else {
        part.file_name = ctx.get_query("file_name");
        if (part.file_name.empty()) {
            return Fail<transfer::PartRequest>(ErrorKind::InvalidArgument, "file_name is required");
        }
        part.data = request.body;
        part_number = query_value(ctx, "part_number");
        total_parts = query_value(ctx, "total_parts");
    }

    auto number = parse_count(part_number, "part_number");
    if (number.is_error()) {
        return Err<transfer::PartRequest>(number.error());
    }
    auto total = parse_count(total_parts, "total_parts");
    if (total.is_error()) {
        return Err<transfer::PartRequest>(total.error());
    }

    part.part_number = number.value();
    part.total_parts = total.value();
    return Ok(std::move(part));
}

void register_routes(network::HttpRouter& router, transfer::TransferService& service) {
    router.set_error_handler([](HttpStatus status, const std::string& message) {
        return json_response(status, {
            {"error", router_error_kind(status)},
            {"detail", message}
        });
    });

    router.post("/upload_part/", [&service](const HttpContext& ctx) {
        return handle_upload_part(service, ctx);
    });
    router.get("/download/:file_name", [&service](const HttpContext& ctx) {
        return handle_download(service, ctx);
    });
    router.get("/resume-upload", [&service](const HttpContext& ctx) {
        return handle_resume(service, ctx);
    });
    router.get("/files/", [&service](const HttpContext&) {
        return handle_list(service);
    });
    router.get("/search/", [&service](const HttpContext& ctx) {
        return handle_search(service, ctx);
    });

    spdlog::debug("Registered {} transfer routes", router.route_count());
}

} // namespace chunkd::api
