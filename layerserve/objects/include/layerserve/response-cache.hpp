#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "layerserve/http-header.hpp"

namespace layerserve {

// Response as stored in the cache: headers exactly as sent, and the full body.
struct CacheEntry {
  std::vector<http::Header> headers;
  std::string body;
};

// Thread-safe store of cached static responses, shared by any number of StaticFileHandler instances.
// Entries never expire by themselves: they are only removed by erase() or clear().
// Entries are immutable once stored, and handed out as shared pointers so that a reader keeps a consistent
// entry alive even if it is replaced or invalidated concurrently.
class ResponseCache {
 public:
  using EntryPtr = std::shared_ptr<const CacheEntry>;

  struct Stats {
    uint64_t hits{0};
    uint64_t misses{0};
    uint64_t stores{0};
    uint64_t erasures{0};
    uint64_t clears{0};
    std::size_t nbEntries{0};
  };

  // Returns the entry stored under 'key', or nullptr.
  [[nodiscard]] EntryPtr find(std::string_view key) const;

  // Store 'entry' under 'key', replacing any previous entry.
  void insert_or_assign(std::string key, CacheEntry entry);

  // Remove the entry stored under 'key'. Returns true if there was one.
  bool erase(std::string_view key);

  // Remove all entries.
  void clear();

  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] Stats stats() const;

 private:
  struct TransparentHash {
    using is_transparent = void;

    std::size_t operator()(std::string_view key) const noexcept { return std::hash<std::string_view>{}(key); }
  };

  mutable std::mutex _mutex;
  std::unordered_map<std::string, EntryPtr, TransparentHash, std::equal_to<>> _entries;
  mutable Stats _stats;
};

}  // namespace layerserve
