#include "lendcore/journal/event_journal.hpp"

#include <cstring>
#include <span>
#include <stdexcept>
#include <string>

namespace lendcore {
namespace journal {

namespace {

struct EventPayload {
  std::uint64_t account{0};
  std::uint64_t counterparty{0};
  std::uint64_t amount{0};
  std::uint64_t secondary{0};
  std::uint64_t fee{0};
  std::int64_t timestamp{0};
};

static_assert(sizeof(EventPayload) == 48, "event payload layout changed");

}  // namespace

std::vector<std::byte> encode_event(const pool::LendingEvent& event) {
  const EventPayload payload{
      .account = event.account,
      .counterparty = event.counterparty,
      .amount = event.amount,
      .secondary = event.secondary,
      .fee = event.fee,
      .timestamp = event.timestamp,
  };
  const auto bytes = std::as_bytes(std::span(&payload, 1));
  return std::vector<std::byte>(bytes.begin(), bytes.end());
}

pool::LendingEvent decode_event(const wal::Record& record) {
  if (!pool::is_known(record.header.type)) {
    throw std::runtime_error("unknown event kind " + std::to_string(record.header.type));
  }
  if (record.payload.size() != sizeof(EventPayload)) {
    throw std::runtime_error("event payload has unexpected size " + std::to_string(record.payload.size()));
  }

  EventPayload payload;
  std::memcpy(&payload, record.payload.data(), sizeof(payload));

  return pool::LendingEvent{
      .kind = static_cast<pool::EventKind>(record.header.type),
      .account = payload.account,
      .counterparty = payload.counterparty,
      .amount = payload.amount,
      .secondary = payload.secondary,
      .fee = payload.fee,
      .timestamp = payload.timestamp,
  };
}

void EventJournal::publish(const pool::LendingEvent& event) {
  const auto payload = encode_event(event);
  writer_.append(static_cast<std::uint16_t>(event.kind), payload);
  ++published_;
}

std::vector<JournaledEvent> read_journal(const std::filesystem::path& path) {
  std::vector<JournaledEvent> events;
  if (!std::filesystem::exists(path)) {
    return events;
  }

  wal::Reader reader(path);
  wal::Record record;
  while (reader.next(record)) {
    events.push_back(JournaledEvent{.sequence = record.header.sequence, .event = decode_event(record)});
  }
  return events;
}

}  // namespace journal
}  // namespace lendcore
