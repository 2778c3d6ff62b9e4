#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace curator::model {

enum class CameraView : std::uint8_t {
  kFront = 0,
  kWrist = 1,
};

inline constexpr std::array<CameraView, 2> kCameraViews = {CameraView::kFront, CameraView::kWrist};

constexpr std::string_view ToString(CameraView view) {
  switch (view) {
    case CameraView::kFront:
      return "front";
    case CameraView::kWrist:
      return "wrist";
  }
  return "unknown";
}

} // namespace curator::model
