#pragma once
#include <optional>

#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>
#include <glm/gtc/quaternion.hpp>

#include "common.hpp"
#include "Camera/OrbitMath.hpp"
#include "Components/TransformComponent.hpp"

namespace orbital::foundation {

  // smoothness is the fraction of the remaining zoom gap kept per 1/60 s
  constexpr float32 kZoomReferenceRate = 60.f;
  constexpr float32 kMaxZoomSmoothness = 0.999f;

  constexpr float32 kDefaultRadius = 1.f;

  /** Optional bounds on the orbit radius, applied on top of kMinimumRadius. */
  struct RadiusLimits {
    std::optional<float32> min;
    std::optional<float32> max;
  };

  /**
   * Orbit camera state: a pivot, a radius and yaw/pitch/roll angles. Every mutator keeps radius
   * positive, pitch inside (-pi/2, pi/2) and roll inside (-pi, pi], then refreshes the cached
   * transform so reads are never stale.
   */
  class OrbitCameraData {
  public:
    explicit OrbitCameraData(const glm::vec3& pivot = glm::vec3(0.0f),
                             float32 radius = kDefaultRadius, float32 yaw = 0.f,
                             float32 pitch = 0.f, float32 roll = 0.f,
                             const RadiusLimits& radius_limits = {});

    /** Adopts an existing camera transform as orbit state around the given pivot. */
    static OrbitCameraData from_transform(const glm::vec3& pivot,
                                          const TransformComponent& transform,
                                          const RadiusLimits& radius_limits = {});

    void apply_delta(float32 delta_yaw, float32 delta_pitch, float32 delta_roll,
                     float32 delta_target_radius, const glm::vec3& delta_pivot);

    /**
     * Moves the rendered radius toward the target radius with exponential smoothing. The step
     * is frame-rate independent: n steps of dt land where a single step of n * dt does.
     */
    void step_zoom(float32 smoothness, float32 delta_seconds);

    [[nodiscard]] TransformComponent compute_transform() const;
    void update_transform() { transform_ = compute_transform(); }

    [[nodiscard]] const TransformComponent& transform() const { return transform_; }
    [[nodiscard]] glm::vec3 position() const { return transform_.position(); }
    [[nodiscard]] glm::quat orientation() const { return transform_.rotation(); }
    [[nodiscard]] glm::mat4 view_matrix() const;

    [[nodiscard]] glm::vec3 pivot() const { return pivot_; }
    void set_pivot(const glm::vec3& pivot);

    [[nodiscard]] float32 radius() const { return radius_; }
    // snaps both the rendered and the target radius
    void set_radius(float32 radius);

    [[nodiscard]] float32 target_radius() const { return target_radius_; }
    void set_target_radius(float32 target_radius);

    [[nodiscard]] float32 yaw() const { return yaw_; }
    [[nodiscard]] float32 pitch() const { return pitch_; }
    [[nodiscard]] float32 roll() const { return roll_; }
    void set_angles(float32 yaw, float32 pitch, float32 roll);
    void reset_roll();

    [[nodiscard]] const RadiusLimits& radius_limits() const { return radius_limits_; }
    void set_radius_limits(const RadiusLimits& radius_limits);

    [[nodiscard]] float32 min_radius() const;
    [[nodiscard]] float32 max_radius() const;

  private:
    [[nodiscard]] float32 clamp_radius(float32 radius) const;

    glm::vec3 pivot_;
    float32 radius_;
    float32 target_radius_;
    float32 yaw_;
    float32 pitch_;
    float32 roll_;

    RadiusLimits radius_limits_;

    TransformComponent transform_;
  };

}  // namespace orbital::foundation
