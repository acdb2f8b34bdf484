#pragma once

#include <string_view>

#include "layerserve/http-status-code.hpp"

namespace layerserve::http {

// NOTE ON CASE SENSITIVITY
// ------------------------
// HTTP header field names are case-insensitive per RFC 9110. The static file handler emits them in lowercase form,
// which is also what HTTP/2 requires on the wire. Lookups on requests and responses are case-insensitive.

// Header field names
inline constexpr std::string_view ContentType = "content-type";
inline constexpr std::string_view ContentLength = "content-length";
inline constexpr std::string_view ContentDisposition = "content-disposition";
inline constexpr std::string_view LastModified = "last-modified";
inline constexpr std::string_view CacheControl = "cache-control";
inline constexpr std::string_view ETag = "etag";
inline constexpr std::string_view Expires = "expires";
inline constexpr std::string_view IfNoneMatch = "if-none-match";
inline constexpr std::string_view IfModifiedSince = "if-modified-since";

// Prefix shared by all representation headers stripped from 304 responses
inline constexpr std::string_view ContentHeaderPrefix = "content";

// Cache-Control values
inline constexpr std::string_view CacheControlNoStore = "no-cache, no-store, must-revalidate";
inline constexpr std::string_view CacheControlPublicMaxAgePrefix = "public, max-age=";

// Reason Phrases (only those we currently emit explicitly)
inline constexpr std::string_view ReasonOK = "OK";                    // 200
inline constexpr std::string_view ReasonNotModified = "Not Modified";  // 304
inline constexpr std::string_view ReasonForbidden = "Forbidden";      // 403

// Content type
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeApplicationOctetStream = "application/octet-stream";

// Return the canonical reason phrase for a subset of status codes we care about.
constexpr std::string_view ReasonPhraseFor(http::StatusCode status) noexcept {
  switch (status) {
    case StatusCodeOK:
      return ReasonOK;
    case StatusCodeNotModified:
      return ReasonNotModified;
    case StatusCodeForbidden:
      return ReasonForbidden;
    default:
      return {};
  }
}

}  // namespace layerserve::http
