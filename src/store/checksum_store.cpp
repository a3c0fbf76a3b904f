#include "store/checksum_store.hpp"
#include "store/result.hpp"
#include <boost/log/trivial.hpp>
#include <openssl/evp.h>
#include <json/json.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace safestore {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ChecksumStore::ChecksumStore(const std::filesystem::path& metadata_file,
                             logging::SecurityLog& security_log,
                             std::size_t persist_interval)
  : metadata_file_(metadata_file)
  , security_log_(security_log)
  , persist_interval_(persist_interval == 0 ? 1 : persist_interval) {
}


//==============================================
// DIGESTS
//==============================================

std::string ChecksumStore::checksum(const std::string& content) {
  return digest_bytes(content.data(), content.size());
}

std::string ChecksumStore::checksum(const std::vector<std::uint8_t>& content) {
  return digest_bytes(content.data(), content.size());
}

std::string ChecksumStore::digest_bytes(const void* data, std::size_t length) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;

  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw StoreError("ChecksumStore: Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr)) {
    EVP_MD_CTX_free(ctx);
    throw StoreError("ChecksumStore: Failed to initialize hash context");
  }

  if (!EVP_DigestUpdate(ctx, data, length)) {
    EVP_MD_CTX_free(ctx);
    throw StoreError("ChecksumStore: Failed to update hash");
  }

  if (!EVP_DigestFinal_ex(ctx, hash, &hash_len)) {
    EVP_MD_CTX_free(ctx);
    throw StoreError("ChecksumStore: Failed to finalize hash");
  }

  EVP_MD_CTX_free(ctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(hash[i]);
  }
  return ss.str();
}


//==============================================
// TABLE OPERATIONS
//==============================================

bool ChecksumStore::verify(const std::string& path, const std::string& content) {
  auto it = checksums_.find(path);
  if (it == checksums_.end()) {
    return true;
  }

  std::string actual = checksum(content);
  if (actual == it->second) {
    return true;
  }

  security_log_.record("INTEGRITY_VIOLATION",
                       path + " expected " + it->second + " found " + actual);
  return false;
}

void ChecksumStore::update(const std::string& path, const std::string& digest) {
  checksums_[path] = digest;
  note_update();
}

void ChecksumStore::remove(const std::string& path) {
  if (checksums_.erase(path) > 0) {
    note_update();
  }
}

void ChecksumStore::remove_tree(const std::string& path) {
  const std::string prefix = path + "/";
  std::size_t removed = checksums_.erase(path);
  for (auto it = checksums_.begin(); it != checksums_.end();) {
    if (it->first.compare(0, prefix.size(), prefix) == 0) {
      it = checksums_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  if (removed > 0) {
    note_update();
  }
}

void ChecksumStore::rename(const std::string& from, const std::string& to) {
  const std::string prefix = from + "/";
  std::unordered_map<std::string, std::string> moved;

  for (auto it = checksums_.begin(); it != checksums_.end();) {
    if (it->first == from) {
      moved[to] = it->second;
      it = checksums_.erase(it);
    } else if (it->first.compare(0, prefix.size(), prefix) == 0) {
      moved[to + "/" + it->first.substr(prefix.size())] = it->second;
      it = checksums_.erase(it);
    } else {
      ++it;
    }
  }

  if (moved.empty()) {
    return;
  }
  for (auto& [key, digest] : moved) {
    checksums_[key] = std::move(digest);
  }
  note_update();
}

void ChecksumStore::copy(const std::string& from, const std::string& to) {
  auto it = checksums_.find(from);
  if (it != checksums_.end()) {
    update(to, it->second);
  }
}

std::optional<std::string> ChecksumStore::get(const std::string& path) const {
  auto it = checksums_.find(path);
  if (it == checksums_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool ChecksumStore::has(const std::string& path) const {
  return checksums_.count(path) > 0;
}

void ChecksumStore::note_update() {
  if (++updates_since_save_ >= persist_interval_) {
    save();
  }
}


//==============================================
// PERSISTENCE
//==============================================

void ChecksumStore::load() {
  checksums_.clear();
  updates_since_save_ = 0;

  std::ifstream in(metadata_file_, std::ios::binary);
  if (!in) {
    BOOST_LOG_TRIVIAL(info) << "ChecksumStore: No checksum metadata at " << metadata_file_.string()
                            << ", starting empty";
    return;
  }

  Json::CharReaderBuilder builder;
  Json::Value root;
  std::string errors;
  if (!Json::parseFromStream(builder, in, &root, &errors) || !root.isObject()) {
    BOOST_LOG_TRIVIAL(warning) << "ChecksumStore: Ignoring corrupt checksum metadata "
                               << metadata_file_.string() << ": " << errors;
    return;
  }

  for (const auto& key : root.getMemberNames()) {
    const Json::Value& digest = root[key];
    if (digest.isString()) {
      checksums_[key] = digest.asString();
    }
  }

  BOOST_LOG_TRIVIAL(info) << "ChecksumStore: Loaded " << checksums_.size() << " checksums";
}

bool ChecksumStore::save() {
  Json::Value root(Json::objectValue);
  for (const auto& [path, digest] : checksums_) {
    root[path] = digest;
  }

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";

  std::error_code ec;
  std::filesystem::create_directories(metadata_file_.parent_path(), ec);

  std::filesystem::path temp_file = metadata_file_;
  temp_file += ".tmp";
  {
    std::ofstream out(temp_file, std::ios::binary | std::ios::trunc);
    if (!out) {
      BOOST_LOG_TRIVIAL(error) << "ChecksumStore: Failed to open " << temp_file.string();
      return false;
    }
    out << Json::writeString(builder, root);
    if (!out.good()) {
      BOOST_LOG_TRIVIAL(error) << "ChecksumStore: Failed to write " << temp_file.string();
      std::filesystem::remove(temp_file, ec);
      return false;
    }
  }

  std::filesystem::rename(temp_file, metadata_file_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "ChecksumStore: Failed to persist checksums: " << ec.message();
    std::filesystem::remove(temp_file, ec);
    return false;
  }

  updates_since_save_ = 0;
  BOOST_LOG_TRIVIAL(debug) << "ChecksumStore: Persisted " << checksums_.size() << " checksums";
  return true;
}

} // namespace store
} // namespace safestore
