#pragma once

#include "chunkd/core/error.hpp"
#include "chunkd/network/http_router.hpp"
#include "chunkd/network/http_types.hpp"
#include "chunkd/transfer/service.hpp"
#include "chunkd/transfer/types.hpp"

#include <nlohmann/json.hpp>

namespace chunkd::api {

/**
 * Routes:
 *   POST /upload_part/              multipart form or raw body + query
 *   GET  /download/:file_name       streamed attachment
 *   GET  /resume-upload?file_name=  next chunk index
 *   GET  /files/                    stored names
 *   GET  /search/?file_name=        case-insensitive substring search
 *
 * Every failure is {"error": "<kind>", "detail": "<message>"}.
 */
void register_routes(network::HttpRouter& router, transfer::TransferService& service);

network::HttpStatus status_for(ErrorKind kind);

network::HttpResponse json_response(network::HttpStatus status, const nlohmann::json& body);

network::HttpResponse error_response(const Error& error);

/// Build a PartRequest from either a multipart form or a raw body with query parameters
Result<transfer::PartRequest, Error> part_from_request(const network::HttpContext& ctx);

} // namespace chunkd::api
