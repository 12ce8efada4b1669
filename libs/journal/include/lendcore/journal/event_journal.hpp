#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

#include "lendcore/pool/events.hpp"
#include "lendcore/wal/wal_writer.hpp"

namespace lendcore {
namespace journal {

struct JournaledEvent {
  std::uint64_t sequence{0};
  pool::LendingEvent event{};
};

// Persists every published event as one WAL record whose type is the event
// kind.
class EventJournal : public pool::EventSink {
 public:
  explicit EventJournal(wal::Writer& writer) : writer_(writer) {}

  void publish(const pool::LendingEvent& event) override;

  [[nodiscard]] std::uint64_t published() const noexcept { return published_; }

 private:
  wal::Writer& writer_;
  std::uint64_t published_{0};
};

[[nodiscard]] std::vector<std::byte> encode_event(const pool::LendingEvent& event);
[[nodiscard]] pool::LendingEvent decode_event(const wal::Record& record);

// Reads every event of a journal file in order.
[[nodiscard]] std::vector<JournaledEvent> read_journal(const std::filesystem::path& path);

}  // namespace journal
}  // namespace lendcore
