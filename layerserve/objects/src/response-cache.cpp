#include "layerserve/response-cache.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace layerserve {

ResponseCache::EntryPtr ResponseCache::find(std::string_view key) const {
  std::scoped_lock lock(_mutex);
  const auto it = _entries.find(key);
  if (it == _entries.end()) {
    ++_stats.misses;
    return nullptr;
  }
  ++_stats.hits;
  return it->second;
}

void ResponseCache::insert_or_assign(std::string key, CacheEntry entry) {
  // allocate outside of the critical section
  auto newEntry = std::make_shared<const CacheEntry>(std::move(entry));

  std::scoped_lock lock(_mutex);
  _entries.insert_or_assign(std::move(key), std::move(newEntry));
  ++_stats.stores;
}

bool ResponseCache::erase(std::string_view key) {
  std::scoped_lock lock(_mutex);
  const auto it = _entries.find(key);
  if (it == _entries.end()) {
    return false;
  }
  _entries.erase(it);
  ++_stats.erasures;
  return true;
}

void ResponseCache::clear() {
  decltype(_entries) oldEntries;
  {
    std::scoped_lock lock(_mutex);
    oldEntries.swap(_entries);
    ++_stats.clears;
  }
  // bodies are released outside of the critical section
}

std::size_t ResponseCache::size() const {
  std::scoped_lock lock(_mutex);
  return _entries.size();
}

ResponseCache::Stats ResponseCache::stats() const {
  std::scoped_lock lock(_mutex);
  Stats ret = _stats;
  ret.nbEntries = _entries.size();
  return ret;
}

}  // namespace layerserve
