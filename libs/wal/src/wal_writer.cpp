#include "lendcore/wal/wal_writer.hpp"

#include <unistd.h>

#include <cerrno>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace lendcore {
namespace wal {

std::uint32_t checksum32(std::span<const std::byte> data) noexcept {
  // FNV-1a
  constexpr std::uint32_t kFnvPrime = 16777619u;
  std::uint32_t hash = 2166136261u;
  for (const auto& b : data) {
    hash ^= static_cast<std::uint8_t>(b);
    hash *= kFnvPrime;
  }
  return hash;
}

Writer::Writer(const std::filesystem::path& path, std::size_t flush_threshold_bytes)
    : path_(path), flush_threshold_(flush_threshold_bytes) {
  buffer_.reserve(flush_threshold_bytes);
  open();
}

Writer::~Writer() {
  try {
    flush();
  } catch (const std::exception& ex) {
    std::cerr << "wal: dropping buffered records for " << path_ << ": " << ex.what() << "\n";
  }
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

void Writer::open() {
  if (std::filesystem::exists(path_)) {
    // Continue numbering after the last intact record.
    Reader reader(path_);
    Record record;
    while (reader.next(record)) {
      next_sequence_ = record.header.sequence + 1;
    }
  }

  file_ = std::fopen(path_.c_str(), "ab");
  if (!file_) {
    throw std::runtime_error("failed to open WAL file: " + path_.string());
  }
}

std::uint64_t Writer::append(std::uint16_t type, std::span<const std::byte> payload) {
  if (!file_) {
    throw std::runtime_error("WAL writer not open");
  }

  RecordHeader header;
  header.type = type;
  header.sequence = next_sequence_++;
  header.payload_size = static_cast<std::uint32_t>(payload.size());
  header.checksum = checksum32(payload);

  const auto header_bytes = std::as_bytes(std::span(&header, 1));
  buffer_.insert(buffer_.end(), header_bytes.begin(), header_bytes.end());
  buffer_.insert(buffer_.end(), payload.begin(), payload.end());

  if (buffer_.size() >= flush_threshold_) {
    flush();
  }
  return header.sequence;
}

void Writer::flush() {
  if (!file_ || buffer_.empty()) {
    return;
  }

  const auto wrote = std::fwrite(buffer_.data(), 1, buffer_.size(), file_);
  if (wrote != buffer_.size()) {
    throw std::runtime_error("failed to write WAL buffer");
  }
  buffer_.clear();
  if (std::fflush(file_) != 0) {
    throw std::system_error(errno, std::system_category(), "fflush failed");
  }
}

void Writer::sync() {
  flush();
  if (!file_) {
    return;
  }
  if (::fsync(fileno(file_)) != 0) {
    throw std::system_error(errno, std::system_category(), "fsync failed");
  }
}

Reader::Reader(const std::filesystem::path& path) {
  file_ = std::fopen(path.c_str(), "rb");
  if (!file_) {
    throw std::runtime_error("failed to open WAL for read: " + path.string());
  }
}

Reader::~Reader() {
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

bool Reader::next(Record& out_record) {
  if (!file_) {
    return false;
  }

  RecordHeader header;
  const auto read_header = std::fread(&header, sizeof(RecordHeader), 1, file_);
  if (read_header != 1) {
    return false;
  }

  if (header.magic != kMagic) {
    throw std::runtime_error("invalid WAL magic");
  }
  if (header.version != kVersion) {
    throw std::runtime_error("unsupported WAL version " + std::to_string(header.version));
  }

  out_record.header = header;
  out_record.payload.resize(header.payload_size);
  if (header.payload_size > 0) {
    const auto read_payload = std::fread(out_record.payload.data(), 1, header.payload_size, file_);
    if (read_payload != header.payload_size) {
      throw std::runtime_error("truncated WAL record");
    }
  }

  if (header.checksum != checksum32(out_record.payload)) {
    throw std::runtime_error("WAL checksum mismatch");
  }

  return true;
}

}  // namespace wal
}  // namespace lendcore
