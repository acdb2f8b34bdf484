// StaticFileHandler benchmarks:
//  - cache hit (no filesystem access)
//  - cold path (stat, read, header build) for several file sizes
//  - conditional request answered with 304
//  - forbidden path rejection

#include <benchmark/benchmark.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

#include "layerserve/http-method.hpp"
#include "layerserve/http-request.hpp"
#include "layerserve/http-response.hpp"
#include "layerserve/static-file-config.hpp"
#include "layerserve/static-file-handler.hpp"
#include "layerserve/temp-file.hpp"

namespace layerserve {

namespace {

StaticFileHandler MakeHandler(const test::ScopedTempDir& dir, bool cacheEnabled) {
  StaticFileConfig cfg(dir.dirPath().string());
  cfg.withCache(cacheEnabled);
  return StaticFileHandler(std::move(cfg));
}

}  // namespace

static void BM_StaticFile_CacheHit(benchmark::State& state) {
  test::ScopedTempDir dir("layerserve-bench-");
  dir.writeFile("file.js", std::string(static_cast<std::size_t>(state.range(0)), 'a'));
  const StaticFileHandler handler = MakeHandler(dir, true);
  const HttpRequest request(http::Method::GET, "/file.js");

  HttpResponse warmup;
  if (!handler.handle(request, warmup)) {
    state.SkipWithError("file not served");
    return;
  }

  for (auto _ : state) {
    HttpResponse response;
    bool handled = handler.handle(request, response);
    benchmark::DoNotOptimize(handled);
    benchmark::DoNotOptimize(response);
  }
  state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_StaticFile_CacheHit)->Arg(64)->Arg(4096)->Arg(256 << 10);

static void BM_StaticFile_Cold(benchmark::State& state) {
  test::ScopedTempDir dir("layerserve-bench-");
  dir.writeFile("file.js", std::string(static_cast<std::size_t>(state.range(0)), 'a'));
  const StaticFileHandler handler = MakeHandler(dir, false);
  const HttpRequest request(http::Method::GET, "/file.js");

  for (auto _ : state) {
    HttpResponse response;
    bool handled = handler.handle(request, response);
    benchmark::DoNotOptimize(handled);
    benchmark::DoNotOptimize(response);
  }
  state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_StaticFile_Cold)->Arg(64)->Arg(4096)->Arg(256 << 10);

static void BM_StaticFile_NotModified(benchmark::State& state) {
  test::ScopedTempDir dir("layerserve-bench-");
  dir.writeFile("file.js", std::string(4096, 'a'));
  const StaticFileHandler handler = MakeHandler(dir, true);

  HttpResponse first;
  if (!handler.handle(HttpRequest(http::Method::GET, "/file.js"), first)) {
    state.SkipWithError("file not served");
    return;
  }
  HttpRequest request(http::Method::GET, "/file.js");
  request.addHeader("if-none-match", first.headerValueOrEmpty("etag"));

  for (auto _ : state) {
    HttpResponse response;
    bool handled = handler.handle(request, response);
    benchmark::DoNotOptimize(handled);
  }
}
BENCHMARK(BM_StaticFile_NotModified);

static void BM_StaticFile_Forbidden(benchmark::State& state) {
  test::ScopedTempDir dir("layerserve-bench-");
  const StaticFileHandler handler = MakeHandler(dir, false);
  const HttpRequest request(http::Method::GET, "/assets/%2e%2e/%2e%2e/etc/passwd");

  for (auto _ : state) {
    HttpResponse response;
    bool handled = handler.handle(request, response);
    benchmark::DoNotOptimize(handled);
  }
}
BENCHMARK(BM_StaticFile_Forbidden);

}  // namespace layerserve

BENCHMARK_MAIN();
