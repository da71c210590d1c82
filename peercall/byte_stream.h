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

#ifndef PEERCALL_BYTE_STREAM_H_
#define PEERCALL_BYTE_STREAM_H_

#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// Incremental SHA-256 over OpenSSL EVP.
class Sha256Hasher {
 public:
  Sha256Hasher();
  ~Sha256Hasher();

  Sha256Hasher(const Sha256Hasher&) = delete;
  Sha256Hasher& operator=(const Sha256Hasher&) = delete;

  bool Update(const uint8_t* data, size_t size);
  // Lowercase hex digest, empty on failure. The hasher is spent afterwards.
  std::string FinalHex();

 private:
  void* ctx_;  // EVP_MD_CTX
  bool failed_ = false;
};

std::string Sha256Hex(const uint8_t* data, size_t size);
bool ComputeFileSha256(const std::string& path, uint64_t length, std::string* hex);

// Keeps only the last path component; never empty, never "." or "..".
std::string SanitizeFileName(const std::string& name);

// Read side of an outgoing transfer.
class ByteSource {
 public:
  virtual ~ByteSource() = default;

  virtual uint64_t size() const = 0;
  virtual bool Seek(uint64_t offset) = 0;
  // Returns the number of bytes read, 0 at end of data or on error.
  virtual size_t Read(uint8_t* buffer, size_t length) = 0;
  virtual bool ComputeSha256(std::string* hex) = 0;
  // Non-empty when the source can be reopened after a restart.
  virtual std::string path() const { return ""; }
};

class FileByteSource : public ByteSource {
 public:
  static std::unique_ptr<FileByteSource> Open(const std::string& path);
  ~FileByteSource() override;

  uint64_t size() const override { return size_; }
  bool Seek(uint64_t offset) override;
  size_t Read(uint8_t* buffer, size_t length) override;
  bool ComputeSha256(std::string* hex) override;
  std::string path() const override { return path_; }

 private:
  FileByteSource(std::string path, FILE* file, uint64_t size);

  const std::string path_;
  FILE* file_;
  const uint64_t size_;
};

class MemoryByteSource : public ByteSource {
 public:
  explicit MemoryByteSource(std::vector<uint8_t> data) : data_(std::move(data)) {}

  uint64_t size() const override { return data_.size(); }
  bool Seek(uint64_t offset) override;
  size_t Read(uint8_t* buffer, size_t length) override;
  bool ComputeSha256(std::string* hex) override;

 private:
  std::vector<uint8_t> data_;
  size_t cursor_ = 0;
};

// Write side of an incoming transfer. Bytes are committed in order.
class ByteSink {
 public:
  virtual ~ByteSink() = default;

  virtual bool Append(const uint8_t* data, size_t size) = 0;
  // Committed bytes.
  virtual uint64_t size() const = 0;
  virtual bool ComputeSha256(std::string* hex) = 0;
  // Makes the data available under its final name.
  virtual bool Finalize() = 0;
  // Drops partial data.
  virtual void Discard() = 0;
  // Directory holding the partial file, empty for memory sinks.
  virtual std::string directory() const { return ""; }
  virtual bool Flush() { return true; }
};

class MemoryByteSink : public ByteSink {
 public:
  bool Append(const uint8_t* data, size_t size) override;
  uint64_t size() const override { return data_.size(); }
  bool ComputeSha256(std::string* hex) override;
  bool Finalize() override { return true; }
  void Discard() override { data_.clear(); }

  const std::vector<uint8_t>& data() const { return data_; }

 private:
  std::vector<uint8_t> data_;
};

// Streams to "<dir>/<name>.<tag>.part", renamed to "<dir>/<name>" on
// Finalize. The tag keeps concurrent receives of one name apart.
class DiskByteSink : public ByteSink {
 public:
  // Reopens an existing partial file truncated to `resume_offset`, or starts
  // a fresh one when the offset is 0.
  static std::unique_ptr<DiskByteSink> Create(const std::string& directory,
                                              const std::string& file_name,
                                              const std::string& tag,
                                              uint64_t resume_offset);
  ~DiskByteSink() override;

  bool Append(const uint8_t* data, size_t size) override;
  uint64_t size() const override { return size_; }
  bool ComputeSha256(std::string* hex) override;
  bool Finalize() override;
  void Discard() override;
  std::string directory() const override { return directory_; }
  bool Flush() override;

  const std::string& part_path() const { return part_path_; }
  const std::string& final_path() const { return final_path_; }

 private:
  DiskByteSink(std::string directory, std::string part_path,
               std::string final_path, FILE* file, uint64_t size);
  void CloseFile();

  const std::string directory_;
  const std::string part_path_;
  std::string final_path_;
  FILE* file_;
  uint64_t size_;
};

#endif  // PEERCALL_BYTE_STREAM_H_
