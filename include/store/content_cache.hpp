#ifndef SAFESTORE_STORE_CONTENT_CACHE_HPP
#define SAFESTORE_STORE_CONTENT_CACHE_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace safestore {
namespace store {

// Bounded cache of recently read text content.
// Entries expire ttl after insertion; at capacity the entry with the oldest
// last access is evicted. Not internally synchronized.
class ContentCache {
public:
  using Clock = std::chrono::steady_clock;
  using ClockFunction = std::function<Clock::time_point()>;

  static constexpr std::size_t DEFAULT_CAPACITY = 100;
  static constexpr std::chrono::seconds DEFAULT_TTL{300};

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ContentCache(std::size_t capacity = DEFAULT_CAPACITY,
                        std::chrono::seconds ttl = DEFAULT_TTL,
                        ClockFunction clock = &Clock::now);


  // ---- CACHE OPERATIONS ----
  // Content for key if present and younger than ttl; expired entries are dropped
  std::optional<std::string> get(const std::string& key);
  void put(const std::string& key, std::string content);
  void invalidate(const std::string& key);
  // Invalidates key and every key below it ("key/...")
  void invalidate_tree(const std::string& key);
  void clear();


  // ---- QUERY OPERATIONS ----
  // Presence check that neither refreshes nor evicts
  bool contains(const std::string& key) const;
  std::size_t size() const { return entries_.size(); }
  std::size_t capacity() const { return capacity_; }
  std::chrono::seconds ttl() const { return ttl_; }
  std::uint64_t hits() const { return hits_; }
  std::uint64_t misses() const { return misses_; }
  // hits / (hits + misses), 0 before any lookup
  double hit_rate() const;

private:
  struct Entry {
    std::string content;
    Clock::time_point inserted;
    Clock::time_point last_access;
  };

  // ---- PARAMETERS ----
  std::size_t capacity_;
  std::chrono::seconds ttl_;
  ClockFunction clock_;
  std::unordered_map<std::string, Entry> entries_;
  std::uint64_t hits_{0};
  std::uint64_t misses_{0};


  bool expired(const Entry& entry, Clock::time_point now) const;
  void evict_oldest();
};

} // namespace store
} // namespace safestore

#endif // SAFESTORE_STORE_CONTENT_CACHE_HPP
