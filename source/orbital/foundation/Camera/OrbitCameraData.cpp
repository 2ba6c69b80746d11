#include "Camera/OrbitCameraData.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <glm/common.hpp>
#include <glm/ext/matrix_transform.hpp>

namespace orbital::foundation {

  namespace {
    glm::vec3 finite_or_zero(const glm::vec3& v) {
      return glm::vec3(std::isfinite(v.x) ? v.x : 0.f, std::isfinite(v.y) ? v.y : 0.f,
                       std::isfinite(v.z) ? v.z : 0.f);
    }

    float32 finite_or_zero(const float32 value) { return std::isfinite(value) ? value : 0.f; }
  }  // namespace

  OrbitCameraData::OrbitCameraData(const glm::vec3& pivot, const float32 radius,
                                   const float32 yaw, const float32 pitch, const float32 roll,
                                   const RadiusLimits& radius_limits)
      : pivot_(finite_or_zero(pivot)),
        radius_(kDefaultRadius),
        target_radius_(kDefaultRadius),
        yaw_(wrap_angle(yaw)),
        pitch_(clamp_pitch(pitch)),
        roll_(wrap_angle(roll)),
        radius_limits_(radius_limits) {
    radius_ = clamp_radius(radius);
    target_radius_ = radius_;
    update_transform();
  }

  OrbitCameraData OrbitCameraData::from_transform(const glm::vec3& pivot,
                                                  const TransformComponent& transform,
                                                  const RadiusLimits& radius_limits) {
    const OrbitAngles angles = decompose_orbit(pivot, transform.position(), transform.rotation());
    return OrbitCameraData(pivot, angles.radius, angles.yaw, angles.pitch, angles.roll,
                           radius_limits);
  }

  void OrbitCameraData::apply_delta(const float32 delta_yaw, const float32 delta_pitch,
                                    const float32 delta_roll, const float32 delta_target_radius,
                                    const glm::vec3& delta_pivot) {
    yaw_ = wrap_angle(yaw_ + finite_or_zero(delta_yaw));
    pitch_ = clamp_pitch(pitch_ + finite_or_zero(delta_pitch));
    roll_ = wrap_angle(roll_ + finite_or_zero(delta_roll));
    target_radius_ = clamp_radius(target_radius_ + finite_or_zero(delta_target_radius));
    pivot_ = finite_or_zero(pivot_ + finite_or_zero(delta_pivot));
    update_transform();
  }

  void OrbitCameraData::step_zoom(float32 smoothness, float32 delta_seconds) {
    smoothness = glm::clamp(finite_or_zero(smoothness), 0.f, kMaxZoomSmoothness);
    if (!(delta_seconds > 0.f) || !std::isfinite(delta_seconds)) {
      delta_seconds = 0.f;
    }

    if (smoothness <= 0.f) {
      radius_ = target_radius_;
    } else {
      const float32 keep = std::pow(smoothness, delta_seconds * kZoomReferenceRate);
      radius_ = target_radius_ + (radius_ - target_radius_) * keep;
    }
    radius_ = clamp_radius(radius_);
    update_transform();
  }

  TransformComponent OrbitCameraData::compute_transform() const {
    const glm::vec3 position = pivot_ + radius_ * orbit_direction(yaw_, pitch_);
    return TransformComponent(position, orbit_orientation(yaw_, pitch_, roll_));
  }

  glm::mat4 OrbitCameraData::view_matrix() const {
    const glm::mat4 r = glm::mat4_cast(glm::conjugate(transform_.rotation()));
    const glm::mat4 t = glm::translate(glm::mat4(1.0f), -transform_.position());
    return r * t;
  }

  void OrbitCameraData::set_pivot(const glm::vec3& pivot) {
    pivot_ = finite_or_zero(pivot);
    update_transform();
  }

  void OrbitCameraData::set_radius(const float32 radius) {
    radius_ = clamp_radius(radius);
    target_radius_ = radius_;
    update_transform();
  }

  void OrbitCameraData::set_target_radius(const float32 target_radius) {
    target_radius_ = clamp_radius(target_radius);
  }

  void OrbitCameraData::set_angles(const float32 yaw, const float32 pitch, const float32 roll) {
    yaw_ = wrap_angle(yaw);
    pitch_ = clamp_pitch(pitch);
    roll_ = wrap_angle(roll);
    update_transform();
  }

  void OrbitCameraData::reset_roll() {
    roll_ = 0.f;
    update_transform();
  }

  void OrbitCameraData::set_radius_limits(const RadiusLimits& radius_limits) {
    radius_limits_ = radius_limits;
    radius_ = clamp_radius(radius_);
    target_radius_ = clamp_radius(target_radius_);
    update_transform();
  }

  float32 OrbitCameraData::min_radius() const {
    if (radius_limits_.min.has_value() && std::isfinite(*radius_limits_.min)) {
      return std::max(kMinimumRadius, *radius_limits_.min);
    }
    return kMinimumRadius;
  }

  float32 OrbitCameraData::max_radius() const {
    const float32 lower = min_radius();
    if (radius_limits_.max.has_value() && std::isfinite(*radius_limits_.max)) {
      return std::max(lower, *radius_limits_.max);
    }
    return std::numeric_limits<float32>::max();
  }

  float32 OrbitCameraData::clamp_radius(const float32 radius) const {
    if (std::isnan(radius)) {
      return min_radius();
    }
    return glm::clamp(radius, min_radius(), max_radius());
  }

}  // namespace orbital::foundation
