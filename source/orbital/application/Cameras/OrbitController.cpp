#include "Cameras/OrbitController.hpp"

#include <algorithm>

#include <glm/vec3.hpp>

#include "Camera/OrbitCameraData.hpp"
#include "InputTypes.hpp"
#include "OrbitControlConfig.hpp"

namespace orbital::application {

  namespace {
    bool is_active(const std::optional<MouseButton>& button, const UserInput& movement) {
      return !button.has_value() || movement.is_pressed(*button);
    }

    bool is_active(const std::optional<KeyCode>& key, const UserInput& movement) {
      return !key.has_value() || movement.is_pressed(*key);
    }
  }  // namespace

  void OrbitController::update(const OrbitControlConfig& config, const UserInput& movement,
                               const float32 delta_seconds, OrbitCameraData& data) {
    if (!config.enable) {
      return;
    }

    rotate(config, movement, delta_seconds, data);
    zoom(config, movement, delta_seconds, data);
    pan(config, movement, data);
    roll(config, movement, delta_seconds, data);

    data.update_transform();
  }

  void OrbitController::rotate(const OrbitControlConfig& config, const UserInput& movement,
                               const float32 delta_seconds, OrbitCameraData& data) {
    if (!config.enable_rotation || !is_active(config.rotate_button, movement)
        || !movement.has_viewport()) {
      return;
    }
    // measured against the shorter side so both axes turn at the same rate
    const auto extent
        = static_cast<float32>(std::min(movement.viewport_width, movement.viewport_height));

    // dragging right swings the camera left around the pivot, the world follows the pointer
    const float32 delta_yaw
        = -movement.mouse_position_x_rel / extent * config.rotation_speed * delta_seconds;
    const float32 delta_pitch
        = -movement.mouse_position_y_rel / extent * config.rotation_speed * delta_seconds;
    data.apply_delta(delta_yaw, delta_pitch, 0.f, 0.f, glm::vec3(0.0f));
  }

  void OrbitController::zoom(const OrbitControlConfig& config, const UserInput& movement,
                             const float32 delta_seconds, OrbitCameraData& data) {
    if (config.enable_zoom && is_active(config.zoom_button, movement)) {
      const float32 scroll = movement.scroll_lines();
      if (scroll != 0.f) {
        data.apply_delta(0.f, 0.f, 0.f, -scroll * config.zoom_speed, glm::vec3(0.0f));
      }
    }
    // keeps converging even when zoom was disabled mid-flight
    data.step_zoom(config.zoom_smoothness, delta_seconds);
  }

  void OrbitController::pan(const OrbitControlConfig& config, const UserInput& movement,
                            OrbitCameraData& data) {
    if (!config.enable_pan || !is_active(config.pan_button, movement)
        || !movement.has_viewport()) {
      return;
    }
    if (movement.mouse_position_x_rel == 0.f && movement.mouse_position_y_rel == 0.f) {
      return;
    }
    const TransformComponent& transform = data.transform();

    // a drag over the full viewport height moves the pivot by pan_speed * radius, both axes
    // share that scale so pixels stay square
    const float32 scale
        = config.pan_speed * data.radius() / static_cast<float32>(movement.viewport_height);
    const glm::vec3 delta_pivot = (-movement.mouse_position_x_rel * transform.right()
                                   + movement.mouse_position_y_rel * transform.up())
                                  * scale;
    data.apply_delta(0.f, 0.f, 0.f, 0.f, delta_pivot);
  }

  void OrbitController::roll(const OrbitControlConfig& config, const UserInput& movement,
                             const float32 delta_seconds, OrbitCameraData& data) {
    if (!config.enable_roll || !config.roll_button.has_value()) {
      return;
    }
    // both keys held cancel out
    float32 angle = 0.f;
    if (movement.is_pressed(config.roll_button->increase)) {
      angle += config.roll_speed * delta_seconds;
    }
    if (movement.is_pressed(config.roll_button->decrease)) {
      angle -= config.roll_speed * delta_seconds;
    }
    if (angle != 0.f) {
      data.apply_delta(0.f, 0.f, angle, 0.f, glm::vec3(0.0f));
    }
  }

}  // namespace orbital::application
