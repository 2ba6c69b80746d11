#pragma once

#include <glm/vec3.hpp>
#include <glm/gtc/quaternion.hpp>

#include "common.hpp"

namespace orbital::foundation {

  // pitch stays strictly inside (-pi/2, pi/2) so the world up axis never aligns with the view
  constexpr float32 kPitchLimit = kHalfPi - 0.01f;
  constexpr float32 kMinimumRadius = 0.01f;

  inline const glm::vec3 kWorldUp = glm::vec3(0.0f, 1.0f, 0.0f);

  struct OrbitAngles {
    float32 radius;
    float32 yaw;
    float32 pitch;
    float32 roll;
  };

  /** Wraps an angle into (-pi, pi]. Non-finite input yields 0. */
  [[nodiscard]] float32 wrap_angle(float32 angle);

  [[nodiscard]] float32 clamp_pitch(float32 pitch);

  /** Unit vector from the pivot toward the camera, Y up, right handed. */
  [[nodiscard]] glm::vec3 orbit_direction(float32 yaw, float32 pitch);

  /**
   * Rotation whose local -Z looks from the camera toward the pivot, with roll applied as a twist
   * about that forward axis.
   */
  [[nodiscard]] glm::quat orbit_orientation(float32 yaw, float32 pitch, float32 roll);

  /**
   * Inverse of the orbit parameterization: recovers radius and angles from a camera transform.
   * Pitch is clamped and roll wrapped the same way the forward mapping expects them.
   */
  [[nodiscard]] OrbitAngles decompose_orbit(const glm::vec3& pivot, const glm::vec3& position,
                                            const glm::quat& orientation);

}  // namespace orbital::foundation
