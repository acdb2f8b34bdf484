#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "layerserve/http-method.hpp"
#include "layerserve/http-request.hpp"
#include "layerserve/http-response.hpp"
#include "layerserve/log.hpp"
#include "layerserve/static-file-config.hpp"
#include "layerserve/static-file-handler.hpp"

// Runs a single request through a StaticFileHandler and prints the response head.
// Usage: static-file [-X METHOD] [-H 'Name: value']... <target> [root]...
int main(int argc, char** argv) {
  layerserve::http::Method method = layerserve::http::Method::GET;
  std::vector<std::pair<std::string, std::string>> headers;
  std::vector<std::string> positional;

  for (int argPos = 1; argPos < argc; ++argPos) {
    const std::string_view arg(argv[argPos]);
    if (arg == "-v") {
      layerserve::log::set_level(layerserve::log::level::debug);
    } else if (arg == "-X" && argPos + 1 < argc) {
      const auto parsed = layerserve::http::MethodFromStr(argv[++argPos]);
      if (!parsed) {
        std::cerr << "Unknown method " << argv[argPos] << '\n';
        return EXIT_FAILURE;
      }
      method = *parsed;
    } else if (arg == "-H" && argPos + 1 < argc) {
      const std::string_view header(argv[++argPos]);
      const auto colonPos = header.find(':');
      if (colonPos == std::string_view::npos) {
        std::cerr << "Invalid header " << header << '\n';
        return EXIT_FAILURE;
      }
      std::string_view value = header.substr(colonPos + 1);
      while (!value.empty() && value.front() == ' ') {
        value.remove_prefix(1);
      }
      headers.emplace_back(std::string(header.substr(0, colonPos)), std::string(value));
    } else {
      positional.emplace_back(arg);
    }
  }
  if (positional.empty()) {
    std::cerr << "Usage: " << argv[0] << " [-v] [-X METHOD] [-H 'Name: value']... <target> [root]...\n";
    return EXIT_FAILURE;
  }

  try {
    layerserve::StaticFileConfig cfg;
    cfg.withRoots(std::vector<std::string>(positional.begin() + 1, positional.end()));

    layerserve::StaticFileHandler handler(std::move(cfg));

    layerserve::HttpRequest request(method, positional.front());
    for (const auto& [name, value] : headers) {
      request.addHeader(name, value);
    }

    layerserve::HttpResponse response;
    if (!handler.handle(request, response)) {
      std::cout << "Not handled\n";
      return EXIT_FAILURE;
    }

    std::cout << response.status() << ' ' << response.reason() << '\n';
    for (const auto& header : response.headers()) {
      std::cout << header.name << ": " << header.value << '\n';
    }
    std::cout << "body: " << response.body().size() << " bytes\n";
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }

  return 0;
}
