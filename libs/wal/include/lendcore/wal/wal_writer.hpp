#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <span>
#include <vector>

namespace lendcore {
namespace wal {

inline constexpr std::uint32_t kMagic = 0x4c43574c;  // 'LCWL'
inline constexpr std::uint16_t kVersion = 1;

struct RecordHeader {
  std::uint32_t magic{kMagic};
  std::uint16_t version{kVersion};
  std::uint16_t type{0};  // caller-defined record type
  std::uint64_t sequence{0};
  std::uint32_t payload_size{0};
  std::uint32_t checksum{0};
};

struct Record {
  RecordHeader header{};
  std::vector<std::byte> payload{};
};

// Append-only log. Records are buffered and written once the buffer reaches
// the flush threshold; sync() forces them to stable storage.
class Writer {
 public:
  explicit Writer(const std::filesystem::path& path,
                  std::size_t flush_threshold_bytes = 1 << 16);
  Writer(const Writer&) = delete;
  Writer& operator=(const Writer&) = delete;
  Writer(Writer&&) = delete;
  Writer& operator=(Writer&&) = delete;
  ~Writer();

  // Returns the sequence number assigned to the record.
  std::uint64_t append(std::uint16_t type, std::span<const std::byte> payload);
  void flush();
  void sync();
  [[nodiscard]] std::uint64_t next_sequence() const noexcept { return next_sequence_; }
  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

 private:
  std::filesystem::path path_;
  std::FILE* file_{nullptr};
  std::vector<std::byte> buffer_{};
  std::size_t flush_threshold_;
  std::uint64_t next_sequence_{1};

  void open();
};

class Reader {
 public:
  explicit Reader(const std::filesystem::path& path);
  Reader(const Reader&) = delete;
  Reader& operator=(const Reader&) = delete;
  Reader(Reader&&) = delete;
  Reader& operator=(Reader&&) = delete;
  ~Reader();

  // False at a clean end of file. Throws on corrupt or truncated records.
  bool next(Record& out_record);

 private:
  std::FILE* file_{nullptr};
};

[[nodiscard]] std::uint32_t checksum32(std::span<const std::byte> data) noexcept;

}  // namespace wal
}  // namespace lendcore
