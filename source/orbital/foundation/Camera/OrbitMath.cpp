#include "Camera/OrbitMath.hpp"

#include <cmath>

#include <glm/common.hpp>
#include <glm/geometric.hpp>
#include <glm/trigonometric.hpp>

namespace orbital::foundation {

  float32 wrap_angle(const float32 angle) {
    if (!std::isfinite(angle)) {
      return 0.f;
    }
    if (angle > -kPi && angle <= kPi) {
      return angle;
    }
    // t lands in [0, 2pi), so pi - t lands in (-pi, pi]
    float32 t = std::fmod(kPi - angle, kTwoPi);
    if (t < 0.f) {
      t += kTwoPi;
    }
    if (t >= kTwoPi) {
      t = 0.f;
    }
    return kPi - t;
  }

  float32 clamp_pitch(const float32 pitch) {
    if (!std::isfinite(pitch)) {
      return 0.f;
    }
    return glm::clamp(pitch, -kPitchLimit, kPitchLimit);
  }

  glm::vec3 orbit_direction(const float32 yaw, const float32 pitch) {
    return glm::vec3(glm::cos(pitch) * glm::sin(yaw), glm::sin(pitch),
                     glm::cos(pitch) * glm::cos(yaw));
  }

  glm::quat orbit_orientation(const float32 yaw, const float32 pitch, const float32 roll) {
    const glm::quat yaw_rotation = glm::angleAxis(yaw, kWorldUp);
    const glm::quat pitch_rotation = glm::angleAxis(-pitch, glm::vec3(1.0f, 0.0f, 0.0f));
    const glm::quat roll_rotation = glm::angleAxis(roll, glm::vec3(0.0f, 0.0f, 1.0f));
    return glm::normalize(yaw_rotation * pitch_rotation * roll_rotation);
  }

  OrbitAngles decompose_orbit(const glm::vec3& pivot, const glm::vec3& position,
                              const glm::quat& orientation) {
    const glm::vec3 offset = position - pivot;
    const float32 radius = glm::length(offset);

    float32 yaw = 0.f;
    float32 pitch = 0.f;
    if (radius > 0.f) {
      pitch = std::asin(glm::clamp(offset.y / radius, -1.0f, 1.0f));
      yaw = std::atan2(offset.x, offset.z);
    } else {
      // camera sits on the pivot, fall back to the view direction
      const glm::vec3 back = orientation * glm::vec3(0.0f, 0.0f, 1.0f);
      pitch = std::asin(glm::clamp(back.y, -1.0f, 1.0f));
      yaw = std::atan2(back.x, back.z);
    }
    pitch = clamp_pitch(pitch);

    // express the camera's up axis in the unrolled frame: rotating (0,1,0) by roll about Z gives
    // (-sin roll, cos roll, 0)
    const glm::quat unrolled = orbit_orientation(yaw, pitch, 0.f);
    const glm::vec3 local_up
        = glm::inverse(unrolled) * (glm::normalize(orientation) * glm::vec3(0.0f, 1.0f, 0.0f));
    const float32 roll = wrap_angle(std::atan2(-local_up.x, local_up.y));

    return OrbitAngles{radius, wrap_angle(yaw), pitch, roll};
  }

}  // namespace orbital::foundation
