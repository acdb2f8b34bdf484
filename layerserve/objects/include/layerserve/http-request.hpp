#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "layerserve/http-header.hpp"
#include "layerserve/http-method.hpp"

namespace layerserve {

// Already parsed HTTP request, as handed over by the transport layer.
class HttpRequest {
 public:
  HttpRequest() = default;

  // 'target' is the origin-form request target, possibly with a query string ("/a/b.txt?v=2").
  HttpRequest(http::Method method, std::string target) : _target(std::move(target)), _method(method) {}

  [[nodiscard]] http::Method method() const noexcept { return _method; }

  // Raw request target, as received.
  [[nodiscard]] std::string_view target() const noexcept { return _target; }

  // Path part of the target, without query string nor fragment. Not percent-decoded.
  [[nodiscard]] std::string_view path() const noexcept {
    const std::string_view target(_target);
    return target.substr(0, target.find_first_of("?#"));
  }

  // Returns the value of the first header named 'headerKey' (case-insensitive), if present.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view headerKey) const noexcept {
    return http::FindHeaderValue(_headers, headerKey);
  }

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view headerKey) const noexcept {
    return headerValue(headerKey).value_or(std::string_view{});
  }

  [[nodiscard]] std::span<const http::Header> headers() const noexcept { return _headers; }

  HttpRequest& method(http::Method method) & noexcept {
    _method = method;
    return *this;
  }

  HttpRequest& target(std::string target) & {
    _target = std::move(target);
    return *this;
  }

  HttpRequest& addHeader(std::string_view key, std::string_view value) & {
    _headers.push_back(http::Header{std::string(key), std::string(value)});
    return *this;
  }

 private:
  std::string _target{"/"};
  std::vector<http::Header> _headers;
  http::Method _method{http::Method::GET};
};

}  // namespace layerserve
