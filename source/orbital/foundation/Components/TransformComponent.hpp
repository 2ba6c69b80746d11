#pragma once

#include <glm/vec3.hpp>
#include <glm/gtc/quaternion.hpp>

#include "common.hpp"

namespace orbital::foundation {

  /** Rigid transform handed to the host's scene: position plus rotation, no scale. */
  struct TransformComponent {
  private:
    glm::vec3 pos_;
    glm::quat rot_;

  public:
    TransformComponent() : pos_(0), rot_(1, 0, 0, 0) {}
    TransformComponent(const glm::vec3& position, const glm::quat& rotation)
        : pos_(position), rot_(rotation) {}

    glm::vec3 position() const { return pos_; }
    glm::quat rotation() const { return rot_; }

    glm::vec3 right() const { return rot_ * glm::vec3(1.0f, 0.0f, 0.0f); }
    glm::vec3 up() const { return rot_ * glm::vec3(0.0f, 1.0f, 0.0f); }
    glm::vec3 forward() const { return rot_ * glm::vec3(0.0f, 0.0f, -1.0f); }

    bool operator==(const TransformComponent& other) const {
      return pos_ == other.pos_ && rot_ == other.rot_;
    }
  };

}  // namespace orbital::foundation
