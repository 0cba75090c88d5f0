#include "key_store.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "internal/util/secure_bytes.hpp"

namespace vaultsync::crypto {

std::optional<vaultsync::core::v1::KeyMaterial> MemoryKeyStore::Load() {
  std::lock_guard<std::mutex> lock(mutex_);
  return material_;
}

void MemoryKeyStore::Save(const vaultsync::core::v1::KeyMaterial& material) {
  std::lock_guard<std::mutex> lock(mutex_);
  material_ = material;
}

FileKeyStore::FileKeyStore(std::string path) : path_(std::move(path)) {
  if (path_.empty()) {
    throw std::invalid_argument("key store path is empty");
  }
}

std::optional<vaultsync::core::v1::KeyMaterial> FileKeyStore::Load() {
  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }

  struct stat st {};
  if (::stat(path_.c_str(), &st) == 0 && (st.st_mode & 077) != 0) {
    throw std::runtime_error("key file is accessible by group or others: " + path_);
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  std::string bytes = buffer.str();

  vaultsync::core::v1::KeyMaterial material;
  const bool                       ok = material.ParseFromString(bytes);
  util::SecureWipe(bytes);
  if (!ok) {
    throw std::runtime_error("key file is corrupt: " + path_);
  }
  return material;
}

void FileKeyStore::Save(const vaultsync::core::v1::KeyMaterial& material) {
  std::string bytes;
  if (!material.SerializeToString(&bytes)) {
    throw std::runtime_error("failed to serialize key material");
  }

  const auto parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent);
  }

  const std::string tmp = path_ + ".tmp";
  const int         fd  = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
  if (fd < 0) {
    util::SecureWipe(bytes);
    throw std::runtime_error("failed to open key file: " + tmp + ": " + std::strerror(errno));
  }

  std::size_t written = 0;
  while (written < bytes.size()) {
    const auto n = ::write(fd, bytes.data() + written, bytes.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      const std::string err = std::strerror(errno);
      ::close(fd);
      util::SecureWipe(bytes);
      throw std::runtime_error("failed to write key file: " + err);
    }
    written += static_cast<std::size_t>(n);
  }
  util::SecureWipe(bytes);

  const bool synced = ::fsync(fd) == 0;
  if (::close(fd) != 0 || !synced) {
    throw std::runtime_error("failed to flush key file: " + tmp);
  }
  if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
    throw std::runtime_error("failed to replace key file: " + path_);
  }
}

} // namespace vaultsync::crypto
