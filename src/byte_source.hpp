#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

// Random-access view of a file's bytes. Implementations must tolerate
// concurrent read() calls from several chunk workers.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  virtual uint64_t size() const = 0;
  // Returns exactly `length` bytes starting at `offset`; throws std::runtime_error
  // on short reads or I/O failure.
  virtual std::vector<char> read(uint64_t offset, std::size_t length) const = 0;
};

class FileByteSource : public ByteSource {
public:
  explicit FileByteSource(std::filesystem::path path);

  uint64_t size() const override { return size_; }
  std::vector<char> read(uint64_t offset, std::size_t length) const override;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
  uint64_t size_ = 0;
};

class MemoryByteSource : public ByteSource {
public:
  explicit MemoryByteSource(std::vector<char> bytes);
  explicit MemoryByteSource(const std::string& bytes);

  uint64_t size() const override { return bytes_.size(); }
  std::vector<char> read(uint64_t offset, std::size_t length) const override;

private:
  std::vector<char> bytes_;
};
