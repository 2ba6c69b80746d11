#pragma once
#include "Components/Entity.hpp"
#include "OrbitControlConfig.hpp"
#include "glm/vec3.hpp"

namespace orbital::application {

  struct UpdateOrbitCameraEvent {
    UpdateOrbitCameraEvent(Entity entity, glm::vec3 pivot, float32 radius, float32 yaw,
                           float32 pitch, float32 roll)
        : entity_(entity), pivot_(pivot), radius_(radius), yaw_(yaw), pitch_(pitch), roll_(roll) {}

    [[nodiscard]] Entity entity() const { return entity_; }
    [[nodiscard]] glm::vec3 pivot() const { return pivot_; }
    [[nodiscard]] float32 radius() const { return radius_; }
    [[nodiscard]] float32 yaw() const { return yaw_; }
    [[nodiscard]] float32 pitch() const { return pitch_; }
    [[nodiscard]] float32 roll() const { return roll_; }

  private:
    Entity entity_;
    glm::vec3 pivot_;
    float32 radius_;
    float32 yaw_;
    float32 pitch_;
    float32 roll_;
  };

  struct UpdateOrbitControlsEvent {
    explicit UpdateOrbitControlsEvent(const OrbitControlConfig& config) : config_(config) {}

    [[nodiscard]] const OrbitControlConfig& config() const { return config_; }

  private:
    OrbitControlConfig config_;
  };

}  // namespace orbital::application
