#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace codereview::model {

// Closed set of pipeline stages; the enumerator value is the execution index.
enum class Stage : std::uint8_t {
  kArchitect = 0,
  kReviewer  = 1,
  kOptimizer = 2,
  kSave      = 3,
};

inline constexpr std::size_t kStageCount = 4;

inline constexpr std::array<Stage, kStageCount> kStageSequence = {
    Stage::kArchitect,
    Stage::kReviewer,
    Stage::kOptimizer,
    Stage::kSave,
};

constexpr std::size_t StageIndex(Stage stage) {
  return static_cast<std::size_t>(stage);
}

constexpr std::string_view StageName(Stage stage) {
  switch (stage) {
    case Stage::kArchitect:
      return "Architect";
    case Stage::kReviewer:
      return "Reviewer";
    case Stage::kOptimizer:
      return "Optimizer";
    case Stage::kSave:
      return "Save";
  }
  return "Unknown";
}

inline std::optional<Stage> ParseStage(std::string_view name) {
  for (const auto stage : kStageSequence) {
    if (StageName(stage) == name) {
      return stage;
    }
  }
  return std::nullopt;
}

enum class StageStatus : std::uint8_t {
  kIdle      = 0,
  kRunning   = 1,
  kCompleted = 2,
  kFailed    = 3,
};

constexpr std::string_view StageStatusName(StageStatus status) {
  switch (status) {
    case StageStatus::kIdle:
      return "idle";
    case StageStatus::kRunning:
      return "running";
    case StageStatus::kCompleted:
      return "completed";
    case StageStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

constexpr bool IsTerminal(StageStatus status) {
  return status == StageStatus::kCompleted || status == StageStatus::kFailed;
}

// Per-stage status only moves forward. Re-asserting a non-terminal status
// (running -> running with a new message) is allowed.
constexpr bool CanTransition(StageStatus from, StageStatus to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (from == to) {
    return true;
  }
  return static_cast<std::uint8_t>(to) > static_cast<std::uint8_t>(from);
}

enum class TaskStatus : std::uint8_t {
  kPending   = 0,
  kRunning   = 1,
  kCompleted = 2,
  kFailed    = 3,
};

constexpr std::string_view TaskStatusName(TaskStatus status) {
  switch (status) {
    case TaskStatus::kPending:
      return "pending";
    case TaskStatus::kRunning:
      return "running";
    case TaskStatus::kCompleted:
      return "completed";
    case TaskStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

constexpr bool IsTerminal(TaskStatus status) {
  return status == TaskStatus::kCompleted || status == TaskStatus::kFailed;
}

constexpr bool CanTransition(TaskStatus from, TaskStatus to) {
  if (IsTerminal(from)) {
    return false;
  }
  switch (to) {
    case TaskStatus::kPending:
      return false;
    case TaskStatus::kRunning:
      return from == TaskStatus::kPending;
    case TaskStatus::kCompleted:
      return from == TaskStatus::kRunning;
    case TaskStatus::kFailed:
      return true;
  }
  return false;
}

} // namespace codereview::model
