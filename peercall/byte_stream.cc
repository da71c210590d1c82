/*
 *  (c) 2025, wilddolphin2022
 *  For WebRTCsays.ai project
 *  https://github.com/wilddolphin2022
 *
 *  Use of this source code is governed by a BSD-style license
 *  that can be found in the LICENSE file in the root of the source
 *  tree. An additional intellectual property rights grant can be found
 *  in the file PATENTS.  All contributing project authors may
 *  be found in the AUTHORS file in the root of the source tree.
 */

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <openssl/evp.h>

#include "rtc_base/logging.h"

#include "byte_stream.h"

namespace {

constexpr size_t kHashBufferSize = 64 * 1024;

std::string ToHex(const unsigned char* digest, unsigned int length) {
  static const char kHexDigits[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(length * 2);
  for (unsigned int i = 0; i < length; ++i) {
    hex.push_back(kHexDigits[digest[i] >> 4]);
    hex.push_back(kHexDigits[digest[i] & 0x0f]);
  }
  return hex;
}

bool FileExists(const std::string& path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0;
}

std::string JoinPath(const std::string& directory, const std::string& name) {
  if (directory.empty()) {
    return name;
  }
  if (directory.back() == '/') {
    return directory + name;
  }
  return directory + "/" + name;
}

// "name.ext" -> "name (1).ext" until the path is free.
std::string UniquePath(const std::string& directory, const std::string& name) {
  std::string candidate = JoinPath(directory, name);
  if (!FileExists(candidate)) {
    return candidate;
  }
  size_t dot = name.rfind('.');
  std::string stem = dot == std::string::npos || dot == 0 ? name : name.substr(0, dot);
  std::string ext = dot == std::string::npos || dot == 0 ? "" : name.substr(dot);
  for (int i = 1; i < 1000; ++i) {
    candidate = JoinPath(directory, stem + " (" + std::to_string(i) + ")" + ext);
    if (!FileExists(candidate)) {
      return candidate;
    }
  }
  return candidate;
}

}  // namespace

// ---------------------------------------------------------------------------
//  Hashing
// ---------------------------------------------------------------------------

Sha256Hasher::Sha256Hasher() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_ ||
      EVP_DigestInit_ex(static_cast<EVP_MD_CTX*>(ctx_), EVP_sha256(), nullptr) != 1) {
    RTC_LOG(LS_ERROR) << "Failed to initialize SHA-256 context";
    failed_ = true;
  }
}

Sha256Hasher::~Sha256Hasher() {
  if (ctx_) {
    EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
  }
}

bool Sha256Hasher::Update(const uint8_t* data, size_t size) {
  if (failed_) {
    return false;
  }
  if (size > 0 &&
      EVP_DigestUpdate(static_cast<EVP_MD_CTX*>(ctx_), data, size) != 1) {
    RTC_LOG(LS_ERROR) << "SHA-256 update failed";
    failed_ = true;
  }
  return !failed_;
}

std::string Sha256Hasher::FinalHex() {
  if (failed_) {
    return "";
  }
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if (EVP_DigestFinal_ex(static_cast<EVP_MD_CTX*>(ctx_), digest, &length) != 1) {
    RTC_LOG(LS_ERROR) << "SHA-256 finalize failed";
    failed_ = true;
    return "";
  }
  failed_ = true;  // spent
  return ToHex(digest, length);
}

std::string Sha256Hex(const uint8_t* data, size_t size) {
  Sha256Hasher hasher;
  hasher.Update(data, size);
  return hasher.FinalHex();
}

bool ComputeFileSha256(const std::string& path, uint64_t length, std::string* hex) {
  FILE* file = fopen(path.c_str(), "rb");
  if (!file) {
    RTC_LOG(LS_ERROR) << "Cannot open " << path << " for hashing";
    return false;
  }
  Sha256Hasher hasher;
  std::vector<uint8_t> buffer(kHashBufferSize);
  uint64_t remaining = length;
  bool ok = true;
  while (remaining > 0) {
    size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
    size_t got = fread(buffer.data(), 1, want, file);
    if (got == 0) {
      RTC_LOG(LS_ERROR) << "Short read while hashing " << path;
      ok = false;
      break;
    }
    if (!hasher.Update(buffer.data(), got)) {
      ok = false;
      break;
    }
    remaining -= got;
  }
  fclose(file);
  if (!ok) {
    return false;
  }
  *hex = hasher.FinalHex();
  return !hex->empty();
}

std::string SanitizeFileName(const std::string& name) {
  std::string base = name;
  size_t slash = base.find_last_of("/\\");
  if (slash != std::string::npos) {
    base = base.substr(slash + 1);
  }
  base.erase(std::remove_if(base.begin(), base.end(),
                            [](char c) { return c == '\0' || c == ':'; }),
             base.end());
  if (base.empty() || base == "." || base == "..") {
    return "download.bin";
  }
  return base;
}

// ---------------------------------------------------------------------------
//  Sources
// ---------------------------------------------------------------------------

std::unique_ptr<FileByteSource> FileByteSource::Open(const std::string& path) {
  FILE* file = fopen(path.c_str(), "rb");
  if (!file) {
    RTC_LOG(LS_ERROR) << "Could not open " << path << ": " << strerror(errno);
    return nullptr;
  }
  struct stat st;
  if (fstat(fileno(file), &st) != 0 || !S_ISREG(st.st_mode)) {
    RTC_LOG(LS_ERROR) << path << " is not a regular file";
    fclose(file);
    return nullptr;
  }
  return std::unique_ptr<FileByteSource>(
      new FileByteSource(path, file, static_cast<uint64_t>(st.st_size)));
}

FileByteSource::FileByteSource(std::string path, FILE* file, uint64_t size)
    : path_(std::move(path)), file_(file), size_(size) {}

FileByteSource::~FileByteSource() {
  if (file_) {
    fclose(file_);
  }
}

bool FileByteSource::Seek(uint64_t offset) {
  if (offset > size_) {
    return false;
  }
  if (fseeko(file_, static_cast<off_t>(offset), SEEK_SET) != 0) {
    RTC_LOG(LS_ERROR) << "Seek to " << offset << " failed in " << path_;
    return false;
  }
  return true;
}

size_t FileByteSource::Read(uint8_t* buffer, size_t length) {
  size_t got = fread(buffer, 1, length, file_);
  if (got == 0 && ferror(file_)) {
    RTC_LOG(LS_ERROR) << "Read error in " << path_;
    clearerr(file_);
  }
  return got;
}

bool FileByteSource::ComputeSha256(std::string* hex) {
  return ComputeFileSha256(path_, size_, hex);
}

bool MemoryByteSource::Seek(uint64_t offset) {
  if (offset > data_.size()) {
    return false;
  }
  cursor_ = static_cast<size_t>(offset);
  return true;
}

size_t MemoryByteSource::Read(uint8_t* buffer, size_t length) {
  size_t count = std::min(length, data_.size() - cursor_);
  if (count > 0) {
    memcpy(buffer, data_.data() + cursor_, count);
    cursor_ += count;
  }
  return count;
}

bool MemoryByteSource::ComputeSha256(std::string* hex) {
  *hex = Sha256Hex(data_.data(), data_.size());
  return !hex->empty();
}

// ---------------------------------------------------------------------------
//  Sinks
// ---------------------------------------------------------------------------

bool MemoryByteSink::Append(const uint8_t* data, size_t size) {
  data_.insert(data_.end(), data, data + size);
  return true;
}

bool MemoryByteSink::ComputeSha256(std::string* hex) {
  *hex = Sha256Hex(data_.data(), data_.size());
  return !hex->empty();
}

std::unique_ptr<DiskByteSink> DiskByteSink::Create(const std::string& directory,
                                                   const std::string& file_name,
                                                   const std::string& tag,
                                                   uint64_t resume_offset) {
  std::string name = SanitizeFileName(file_name);
  std::string final_path = JoinPath(directory, name);
  std::string part_path =
      tag.empty() ? final_path + ".part" : final_path + "." + SanitizeFileName(tag) + ".part";

  FILE* file = nullptr;
  if (resume_offset > 0) {
    file = fopen(part_path.c_str(), "r+b");
    if (!file) {
      RTC_LOG(LS_ERROR) << "Cannot reopen partial file " << part_path;
      return nullptr;
    }
    struct stat st;
    if (fstat(fileno(file), &st) != 0 ||
        static_cast<uint64_t>(st.st_size) < resume_offset) {
      RTC_LOG(LS_ERROR) << "Partial file " << part_path << " is shorter than "
                        << resume_offset << " bytes";
      fclose(file);
      return nullptr;
    }
    // Bytes past the checkpoint were never acknowledged.
    if (ftruncate(fileno(file), static_cast<off_t>(resume_offset)) != 0 ||
        fseeko(file, 0, SEEK_END) != 0) {
      RTC_LOG(LS_ERROR) << "Cannot truncate " << part_path << " to " << resume_offset;
      fclose(file);
      return nullptr;
    }
    RTC_LOG(LS_INFO) << "Resuming " << part_path << " at " << resume_offset;
  } else {
    file = fopen(part_path.c_str(), "wb");
    if (!file) {
      RTC_LOG(LS_ERROR) << "Cannot create " << part_path << ": " << strerror(errno);
      return nullptr;
    }
  }
  return std::unique_ptr<DiskByteSink>(
      new DiskByteSink(directory, part_path, final_path, file, resume_offset));
}

DiskByteSink::DiskByteSink(std::string directory, std::string part_path,
                           std::string final_path, FILE* file, uint64_t size)
    : directory_(std::move(directory)),
      part_path_(std::move(part_path)),
      final_path_(std::move(final_path)),
      file_(file),
      size_(size) {}

DiskByteSink::~DiskByteSink() {
  CloseFile();
}

void DiskByteSink::CloseFile() {
  if (file_) {
    fclose(file_);
    file_ = nullptr;
  }
}

bool DiskByteSink::Append(const uint8_t* data, size_t size) {
  if (!file_) {
    return false;
  }
  if (fwrite(data, 1, size, file_) != size) {
    RTC_LOG(LS_ERROR) << "Write failed on " << part_path_ << ": " << strerror(errno);
    return false;
  }
  size_ += size;
  return true;
}

bool DiskByteSink::Flush() {
  return file_ && fflush(file_) == 0;
}

bool DiskByteSink::ComputeSha256(std::string* hex) {
  if (file_ && fflush(file_) != 0) {
    return false;
  }
  return ComputeFileSha256(file_ ? part_path_ : final_path_, size_, hex);
}

bool DiskByteSink::Finalize() {
  if (!file_) {
    return FileExists(final_path_);
  }
  if (fflush(file_) != 0) {
    RTC_LOG(LS_ERROR) << "Flush failed on " << part_path_;
    return false;
  }
  CloseFile();

  size_t slash = final_path_.find_last_of('/');
  std::string name = slash == std::string::npos ? final_path_ : final_path_.substr(slash + 1);
  final_path_ = UniquePath(directory_, name);
  if (rename(part_path_.c_str(), final_path_.c_str()) != 0) {
    RTC_LOG(LS_ERROR) << "rename " << part_path_ << " -> " << final_path_
                      << " failed: " << strerror(errno);
    return false;
  }
  RTC_LOG(LS_INFO) << "Saved " << final_path_ << " (" << size_ << " bytes)";
  return true;
}

void DiskByteSink::Discard() {
  CloseFile();
  if (unlink(part_path_.c_str()) != 0 && errno != ENOENT) {
    RTC_LOG(LS_WARNING) << "Could not remove " << part_path_;
  }
  size_ = 0;
}
