#include "store/content_cache.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>

namespace safestore {
namespace store {

ContentCache::ContentCache(std::size_t capacity, std::chrono::seconds ttl, ClockFunction clock)
  : capacity_(std::max<std::size_t>(capacity, 1))
  , ttl_(ttl)
  , clock_(clock ? std::move(clock) : ClockFunction(&Clock::now)) {
}

std::optional<std::string> ContentCache::get(const std::string& key) {
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    ++misses_;
    return std::nullopt;
  }

  const auto now = clock_();
  if (expired(it->second, now)) {
    BOOST_LOG_TRIVIAL(debug) << "ContentCache: Entry expired for " << key;
    entries_.erase(it);
    ++misses_;
    return std::nullopt;
  }

  it->second.last_access = now;
  ++hits_;
  return it->second.content;
}

void ContentCache::put(const std::string& key, std::string content) {
  const auto now = clock_();

  auto it = entries_.find(key);
  if (it != entries_.end()) {
    it->second = Entry{std::move(content), now, now};
    return;
  }

  if (entries_.size() >= capacity_) {
    evict_oldest();
  }
  entries_.emplace(key, Entry{std::move(content), now, now});
}

void ContentCache::invalidate(const std::string& key) {
  entries_.erase(key);
}

void ContentCache::invalidate_tree(const std::string& key) {
  const std::string prefix = key + "/";
  entries_.erase(key);
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->first.compare(0, prefix.size(), prefix) == 0) {
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
}

void ContentCache::clear() {
  entries_.clear();
}

bool ContentCache::contains(const std::string& key) const {
  auto it = entries_.find(key);
  return it != entries_.end() && !expired(it->second, clock_());
}

double ContentCache::hit_rate() const {
  const auto lookups = hits_ + misses_;
  return lookups == 0 ? 0.0 : static_cast<double>(hits_) / static_cast<double>(lookups);
}

bool ContentCache::expired(const Entry& entry, Clock::time_point now) const {
  return now - entry.inserted >= ttl_;
}

void ContentCache::evict_oldest() {
  auto oldest = std::min_element(entries_.begin(), entries_.end(),
                                 [](const auto& a, const auto& b) {
                                   return a.second.last_access < b.second.last_access;
                                 });
  if (oldest != entries_.end()) {
    BOOST_LOG_TRIVIAL(debug) << "ContentCache: Evicting " << oldest->first;
    entries_.erase(oldest);
  }
}

} // namespace store
} // namespace safestore
