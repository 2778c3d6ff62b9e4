#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace curator::model {

/*
  Episode lifecycle status.

  Closed set: every switch over Status lists all enumerators and has no
  default label, so adding one is a compile-time diagnostic at each consumer.
*/
enum class Status : std::uint8_t {
  kNew         = 0,
  kChanged     = 1,
  kUnchanged   = 2,
  kMissingSide = 3,
  kDeleted     = 4,
  kOrphanVideo = 5,
  kPending     = 6,
  kError       = 7,
};

inline constexpr std::array<Status, 8> kAllStatuses = {
    Status::kNew,     Status::kChanged,     Status::kUnchanged, Status::kMissingSide,
    Status::kDeleted, Status::kOrphanVideo, Status::kPending,   Status::kError,
};

constexpr std::string_view ToString(Status status) {
  switch (status) {
    case Status::kNew:
      return "NEW";
    case Status::kChanged:
      return "CHANGED";
    case Status::kUnchanged:
      return "UNCHANGED";
    case Status::kMissingSide:
      return "MISSING_SIDE";
    case Status::kDeleted:
      return "DELETED";
    case Status::kOrphanVideo:
      return "ORPHAN_VIDEO";
    case Status::kPending:
      return "PENDING";
    case Status::kError:
      return "ERROR";
  }
  return "UNKNOWN";
}

constexpr std::optional<Status> StatusFromString(std::string_view text) {
  for (auto status : kAllStatuses) {
    if (ToString(status) == text) return status;
  }
  return std::nullopt;
}

// Anything other than UNCHANGED needs downstream (re)processing.
constexpr bool IsActionable(Status status) {
  switch (status) {
    case Status::kNew:
    case Status::kChanged:
    case Status::kMissingSide:
    case Status::kDeleted:
    case Status::kOrphanVideo:
    case Status::kPending:
    case Status::kError:
      return true;
    case Status::kUnchanged:
      return false;
  }
  return true;
}

// Row backed by a trajectory file in the run that wrote it.
constexpr bool IsTrajectoryBearing(Status status) {
  switch (status) {
    case Status::kNew:
    case Status::kChanged:
    case Status::kUnchanged:
    case Status::kMissingSide:
    case Status::kPending:
    case Status::kError:
      return true;
    case Status::kDeleted:
    case Status::kOrphanVideo:
      return false;
  }
  return false;
}

} // namespace curator::model
