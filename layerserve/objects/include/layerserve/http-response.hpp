#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "layerserve/http-constants.hpp"
#include "layerserve/http-header.hpp"
#include "layerserve/http-status-code.hpp"

namespace layerserve {

// Complete response descriptor: status, ordered headers and body.
// Serialization to the wire is the transport's job.
class HttpResponse {
 public:
  explicit HttpResponse(http::StatusCode code = http::StatusCodeOK) noexcept : _status(code) {}

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  [[nodiscard]] std::string_view reason() const noexcept { return http::ReasonPhraseFor(_status); }

  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view key) const noexcept {
    return http::FindHeaderValue(_headers, key);
  }

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view key) const noexcept {
    return headerValue(key).value_or(std::string_view{});
  }

  [[nodiscard]] std::span<const http::Header> headers() const noexcept { return _headers; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  HttpResponse& status(http::StatusCode statusCode) & noexcept {
    _status = statusCode;
    return *this;
  }

  // Append a header, without checking for an existing one with the same name.
  HttpResponse& addHeader(std::string_view key, std::string_view value) & {
    _headers.push_back(http::Header{std::string(key), std::string(value)});
    return *this;
  }

  // Replace all headers.
  HttpResponse& headers(std::vector<http::Header> headers) & {
    _headers = std::move(headers);
    return *this;
  }

  HttpResponse& body(std::string body) & {
    _body = std::move(body);
    return *this;
  }

 private:
  std::vector<http::Header> _headers;
  std::string _body;
  http::StatusCode _status;
};

}  // namespace layerserve
