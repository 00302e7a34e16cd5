#include "byte_source.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>

FileByteSource::FileByteSource(std::filesystem::path path)
  : path_(std::move(path)) {
  std::error_code ec;
  auto bytes = std::filesystem::file_size(path_, ec);
  if(ec) {
    throw std::runtime_error("Unable to stat " + path_.string() + ": " + ec.message());
  }
  size_ = static_cast<uint64_t>(bytes);
}

std::vector<char> FileByteSource::read(uint64_t offset, std::size_t length) const {
  if(offset + length > size_) {
    throw std::runtime_error("Read past end of " + path_.string());
  }
  std::vector<char> out(length);
  if(length == 0) return out;

  // One stream per call so chunk workers never share a file position.
  std::ifstream in(path_, std::ios::binary);
  if(!in) {
    throw std::runtime_error("Unable to open " + path_.string());
  }
  in.seekg(static_cast<std::streamoff>(offset));
  in.read(out.data(), static_cast<std::streamsize>(length));
  if(static_cast<std::size_t>(in.gcount()) != length) {
    throw std::runtime_error("Short read from " + path_.string());
  }
  return out;
}

MemoryByteSource::MemoryByteSource(std::vector<char> bytes)
  : bytes_(std::move(bytes)) {}

MemoryByteSource::MemoryByteSource(const std::string& bytes)
  : bytes_(bytes.begin(), bytes.end()) {}

std::vector<char> MemoryByteSource::read(uint64_t offset, std::size_t length) const {
  if(offset + length > bytes_.size()) {
    throw std::runtime_error("Read past end of memory buffer");
  }
  auto begin = bytes_.begin() + static_cast<std::ptrdiff_t>(offset);
  return std::vector<char>(begin, begin + static_cast<std::ptrdiff_t>(length));
}
