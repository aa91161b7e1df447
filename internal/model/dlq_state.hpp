#pragma once

#include <cstdint>
#include <string_view>

namespace audit::model {

enum class DlqState : std::uint8_t {
  kPending      = 0,
  kInFlight     = 1,
  kSucceeded    = 2,
  kDeadLettered = 3,
};

constexpr bool IsTerminal(DlqState state) {
  return state == DlqState::kSucceeded || state == DlqState::kDeadLettered;
}

/*
  pending -> in_flight                 (lease)
  in_flight -> succeeded               (replay stored or duplicate)
  in_flight -> pending                 (replay failed, retry budget left,
                                        or lease expired)
  in_flight -> dead_lettered           (retry budget exhausted)
*/
constexpr bool CanTransition(DlqState from, DlqState to) {
  if (IsTerminal(from)) {
    return false;
  }

  switch (from) {
    case DlqState::kPending:
      return to == DlqState::kInFlight;
    case DlqState::kInFlight:
      return to == DlqState::kSucceeded || to == DlqState::kPending || to == DlqState::kDeadLettered;
    default:
      return false;
  }
}

constexpr std::string_view ToString(DlqState state) {
  switch (state) {
    case DlqState::kPending:
      return "pending";
    case DlqState::kInFlight:
      return "in_flight";
    case DlqState::kSucceeded:
      return "succeeded";
    case DlqState::kDeadLettered:
      return "dead_lettered";
  }
  return "unknown";
}

static_assert(CanTransition(DlqState::kPending, DlqState::kInFlight));
static_assert(!CanTransition(DlqState::kPending, DlqState::kSucceeded));
static_assert(!CanTransition(DlqState::kDeadLettered, DlqState::kPending));

} // namespace audit::model
