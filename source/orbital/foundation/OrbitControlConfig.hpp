#pragma once

#include <optional>

#include "common.hpp"
#include "InputTypes.hpp"

namespace orbital::foundation {

  constexpr float32 kDefaultZoomSpeed = 0.2f;
  constexpr float32 kDefaultRotationSpeed = kPi;
  constexpr float32 kDefaultPanSpeed = 1.0f;
  constexpr float32 kDefaultRollSpeed = kPi;
  constexpr float32 kDefaultZoomSmoothness = 0.75f;

  /** Key pair for rolling; holding both cancels out. */
  struct RollKeys {
    KeyCode increase;
    KeyCode decrease;

    bool operator==(const RollKeys& other) const {
      return increase == other.increase && decrease == other.decrease;
    }
  };

  /**
   * Controls shared by all orbit cameras. An unset binding means the action is always active
   * (zoom is then driven by the scroll wheel alone); roll has no action without keys.
   */
  struct OrbitControlConfig {
    float32 zoom_speed = kDefaultZoomSpeed;
    float32 rotation_speed = kDefaultRotationSpeed;
    float32 pan_speed = kDefaultPanSpeed;
    float32 roll_speed = kDefaultRollSpeed;

    bool enable = true;
    bool enable_zoom = true;
    bool enable_rotation = true;
    bool enable_pan = true;
    bool enable_roll = true;

    float32 zoom_smoothness = kDefaultZoomSmoothness;

    std::optional<MouseButton> rotate_button = MouseButton::Left;
    std::optional<KeyCode> zoom_button = std::nullopt;
    std::optional<MouseButton> pan_button = MouseButton::Right;
    std::optional<RollKeys> roll_button = RollKeys{KeyCode::KeyQ, KeyCode::KeyE};
  };

}  // namespace orbital::foundation
