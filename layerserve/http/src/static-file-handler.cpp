#include "layerserve/static-file-handler.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "layerserve/file-stat.hpp"
#include "layerserve/file.hpp"
#include "layerserve/http-constants.hpp"
#include "layerserve/http-header.hpp"
#include "layerserve/http-method.hpp"
#include "layerserve/http-status-code.hpp"
#include "layerserve/log.hpp"
#include "layerserve/mime-mappings.hpp"
#include "layerserve/root-resolver.hpp"
#include "layerserve/string-equal-ignore-case.hpp"
#include "layerserve/timedef.hpp"
#include "layerserve/timestring.hpp"
#include "layerserve/url-decode.hpp"

namespace layerserve {
namespace {

void AppendInteger(std::string& out, std::integral auto value) {
  std::array<char, 24> buf;
  const auto result = std::to_chars(buf.data(), buf.data() + buf.size(), value);
  out.append(buf.data(), result.ptr);
}

[[nodiscard]] std::string FormatHttpDate(SysTimePoint tp) {
  std::string ret(kRFC7231DateStrLen, '\0');
  const char* end = TimeToStringRFC7231(tp, ret.data());
  ret.resize(static_cast<std::size_t>(end - ret.data()));
  return ret;
}

// A decoded path is rejected if any of its segments is '..', whatever the separator ('/' or '\').
// Embedded NUL characters are rejected as well as they would silently truncate the path at the system level.
[[nodiscard]] bool IsForbiddenPath(std::string_view decodedPath) {
  if (decodedPath.find('\0') != std::string_view::npos) {
    return true;
  }
  while (!decodedPath.empty()) {
    const auto sepPos = decodedPath.find_first_of("/\\");
    if (decodedPath.substr(0, sepPos) == "..") {
      return true;
    }
    if (sepPos == std::string_view::npos) {
      break;
    }
    decodedPath.remove_prefix(sepPos + 1);
  }
  return false;
}

void MakeForbidden(HttpResponse& response) {
  static constexpr std::string_view kBody = http::ReasonForbidden;

  std::string contentLength;
  AppendInteger(contentLength, kBody.size());

  response.status(http::StatusCodeForbidden)
      .headers({http::Header{std::string(http::ContentType), std::string(http::ContentTypeTextPlain)},
                http::Header{std::string(http::ContentLength), std::move(contentLength)}});
  response.body(std::string(kBody));
}

// Strong validator built from the on-disk size and the modification time in milliseconds: "<size>-<mtime>"
[[nodiscard]] std::string MakeEtag(std::uintmax_t fileSize, SysTimePoint lastModified) {
  std::string etag(1, '"');
  AppendInteger(etag, fileSize);
  etag.push_back('-');
  AppendInteger(etag, UnixMillis(lastModified));
  etag.push_back('"');
  return etag;
}

[[nodiscard]] std::string_view Trim(std::string_view value) {
  const auto first = value.find_first_not_of(" \t");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(" \t");
  return value.substr(first, last - first + 1);
}

// If-None-Match value may be '*' or a comma separated list of entity tags.
// Weak tags never match as our validators are strong.
[[nodiscard]] bool EtagListMatches(std::string_view headerValue, std::string_view etag) {
  headerValue = Trim(headerValue);
  if (headerValue == "*") {
    return true;
  }
  while (!headerValue.empty()) {
    const auto commaPos = headerValue.find(',');
    if (Trim(headerValue.substr(0, commaPos)) == etag) {
      return true;
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    headerValue.remove_prefix(commaPos + 1);
  }
  return false;
}

[[nodiscard]] bool IsNotModified(const HttpRequest& request, std::string_view etag, SysTimePoint lastModified) {
  if (auto ifNoneMatch = request.headerValue(http::IfNoneMatch); ifNoneMatch && EtagListMatches(*ifNoneMatch, etag)) {
    return true;
  }
  if (auto ifModifiedSince = request.headerValue(http::IfModifiedSince); ifModifiedSince) {
    const SysTimePoint since = TryParseTimeRFC7231(*ifModifiedSince);
    // Last-Modified is advertised with a one second precision, compare what the client has seen.
    return since != kInvalidTimePoint && TruncateToSeconds(lastModified) <= since;
  }
  return false;
}

[[nodiscard]] std::string_view ResolveContentType(std::string_view path, std::string_view body,
                                                  const MimeSniffer& sniffer) {
  const std::string_view fromExtension = DetermineMIMETypeStr(path);
  if (!fromExtension.empty() && fromExtension != http::ContentTypeApplicationOctetStream) {
    return fromExtension;
  }
  return sniffer.sniff(body).value_or(http::ContentTypeApplicationOctetStream);
}

[[nodiscard]] std::string_view Basename(std::string_view path) {
  const auto slashPos = path.rfind('/');
  return slashPos == std::string_view::npos ? path : path.substr(slashPos + 1);
}

// Control characters (CR and LF among them) cannot appear in a header value, they are percent-encoded.
[[nodiscard]] std::string MakeAttachmentDisposition(std::string_view filename) {
  static constexpr char kHexUpper[] = "0123456789ABCDEF";
  std::string value("attachment; filename=\"");
  for (char ch : filename) {
    const auto byte = static_cast<unsigned char>(ch);
    if (byte < 0x20U || byte == 0x7FU) {
      value.push_back('%');
      value.push_back(kHexUpper[byte >> 4U]);
      value.push_back(kHexUpper[byte & 0x0FU]);
      continue;
    }
    if (ch == '"' || ch == '\\') {
      value.push_back('\\');
    }
    value.push_back(ch);
  }
  value.push_back('"');
  return value;
}

}  // namespace

StaticFileHandler::StaticFileHandler(StaticFileConfig config, std::shared_ptr<ResponseCache> cache)
    : _config(std::move(config)), _cache(std::move(cache)) {
  _config.validate();
  _roots = _config.normalizedRoots();
  if (!_cache) {
    _cache = std::make_shared<ResponseCache>();
  }
  for (const std::string& root : _roots) {
    const StatResult statResult = StatPath(root);
    if (!statResult.found() || !statResult.stat.isDirectory) {
      log::warn("Static root '{}' is not an existing directory", root);
    }
  }
  log::debug("StaticFileHandler serving {} root(s), cache {}, max-age {} ms", _roots.size(),
             _config.cacheEnabled() ? "enabled" : "disabled", _config.maxAge().count());
}

bool StaticFileHandler::handle(const HttpRequest& request, HttpResponse& response,
                               const StaticFileOptions& options) const {
  const bool isHead = request.method() == http::Method::HEAD;
  if (!isHead && request.method() != http::Method::GET) {
    return false;
  }

  const std::string_view requestPath = request.path();
  const std::string decodedPath = url::DecodePath(requestPath);
  if (IsForbiddenPath(decodedPath)) {
    log::warn("Forbidden static file request path '{}'", requestPath);
    MakeForbidden(response);
    return true;
  }

  // A cached entry never answers a conditional request: freshness is evaluated against the live file.
  const bool isConditional =
      request.headerValue(http::IfNoneMatch).has_value() || request.headerValue(http::IfModifiedSince).has_value();
  const bool useCache = _config.cacheEnabled() && !options.nocache;

  std::string cacheKey;
  if (useCache) {
    cacheKey.reserve(options.cachePrefix.size() + requestPath.size());
    cacheKey.append(options.cachePrefix).append(requestPath);
    if (!isConditional) {
      if (const ResponseCache::EntryPtr entry = _cache->find(cacheKey)) {
        log::debug("Cache hit for '{}'", cacheKey);
        response.status(http::StatusCodeOK).headers(entry->headers);
        response.body(isHead ? std::string() : entry->body);
        return true;
      }
    }
  }

  RootResolution resolution = ResolveInRoots(_roots, decodedPath);
  switch (resolution.kind) {
    case RootResolution::Kind::NotFound:
      return false;
    case RootResolution::Kind::Error:
      log::error("Unable to stat '{}': {}", resolution.file.absolutePath, resolution.error.message());
      throw std::filesystem::filesystem_error("StaticFileHandler stat failed", resolution.file.absolutePath,
                                              resolution.error);
    case RootResolution::Kind::Found:
      break;
  }

  const ResolvedFile& resolved = resolution.file;
  if (!resolved.stat.isRegularFile) {
    // directory listing is not supported
    log::debug("'{}' is not a regular file, declining", resolved.absolutePath);
    return false;
  }

  std::string body;
  try {
    body = File(resolved.absolutePath).loadAllContent();
  } catch (const std::system_error& ex) {
    log::error("Unable to load '{}': {}", resolved.absolutePath, ex.what());
    throw;
  }
  if (options.transform) {
    body = options.transform(std::move(body));
  }

  const std::string etag = MakeEtag(resolved.stat.size, resolved.stat.lastModified);

  std::string contentLength;
  AppendInteger(contentLength, body.size());

  std::string cacheControl;
  if (options.nocache) {
    cacheControl.assign(http::CacheControlNoStore);
  } else {
    cacheControl.assign(http::CacheControlPublicMaxAgePrefix);
    AppendInteger(cacheControl, std::chrono::floor<std::chrono::seconds>(_config.maxAge()).count());
  }

  std::vector<http::Header> headers;
  headers.reserve(7U);
  const std::string_view contentType = ResolveContentType(resolved.absolutePath, body, _config.mimeSniffer());
  headers.push_back({std::string(http::ContentType), std::string(contentType)});
  headers.push_back({std::string(http::ContentLength), std::move(contentLength)});
  headers.push_back({std::string(http::LastModified), FormatHttpDate(resolved.stat.lastModified)});
  headers.push_back({std::string(http::CacheControl), std::move(cacheControl)});
  headers.push_back({std::string(http::ETag), etag});
  headers.push_back({std::string(http::Expires), FormatHttpDate(SysClock::now())});

  const std::string_view filename = Basename(resolved.absolutePath);
  if (EndsWithCaseInsensitive(filename, ".exe")) {
    // executables are downloaded, never rendered
    headers.push_back({std::string(http::ContentDisposition), MakeAttachmentDisposition(filename)});
  }

  if (IsNotModified(request, etag, resolved.stat.lastModified)) {
    std::erase_if(headers, [](const http::Header& header) {
      return StartsWithCaseInsensitive(header.name, http::ContentHeaderPrefix);
    });
    response.status(http::StatusCodeNotModified).headers(std::move(headers));
    response.body(std::string());
    return true;
  }

  if (useCache) {
    log::debug("Caching '{}' ({} bytes)", cacheKey, body.size());
    _cache->insert_or_assign(std::move(cacheKey), CacheEntry{headers, body});
  }

  response.status(http::StatusCodeOK).headers(std::move(headers));
  response.body(isHead ? std::string() : std::move(body));
  return true;
}

void StaticFileHandler::clearCache(std::string_view key, const StaticFileOptions& options) const {
  std::string cacheKey;
  cacheKey.reserve(options.cachePrefix.size() + key.size());
  cacheKey.append(options.cachePrefix).append(key);
  if (_cache->erase(cacheKey)) {
    log::debug("Invalidated cached response '{}'", cacheKey);
  }
}

void StaticFileHandler::clearCache() const {
  _cache->clear();
  log::debug("Cleared static file response cache");
}

}  // namespace layerserve
