#include <fmt/core.h>
#include <tracy/Tracy.hpp>

#include "Camera/OrbitCameraData.hpp"
#include "ECS/CameraSystem.hpp"
#include "Events/EventBus.hpp"
#include "Events/Events.hpp"
#include "InputTypes.hpp"
#include "OrbitControlConfiguration.hpp"
#include "Repository.hpp"

using namespace orbital::foundation;
using orbital::application::CameraSystem;
using orbital::application::EventBus;
using orbital::application::UpdateOrbitControlsEvent;

namespace {

  constexpr float32 kFrameTime = 1.f / 60.f;
  constexpr uint32 kFramesPerPhase = 30;
  constexpr uint32 kViewportWidth = 1280;
  constexpr uint32 kViewportHeight = 720;

  struct ScriptPhase {
    const char* name;
    UserInput input;
  };

  UserInput drag(const MouseButton button, const float32 dx, const float32 dy) {
    UserInput input;
    input.set_pressed(button, true);
    input.mouse_position_x_rel = dx;
    input.mouse_position_y_rel = dy;
    return input;
  }

  UserInput scroll(const float32 lines) {
    UserInput input;
    input.scroll = lines;
    return input;
  }

  UserInput hold(const KeyCode key) {
    UserInput input;
    input.set_pressed(key, true);
    return input;
  }

  void print_camera(const Repository& repository, const Entity entity) {
    const auto orbit_camera = repository.orbit_camera_components.find(entity);
    const auto transform = repository.transform_components.find(entity);
    if (orbit_camera == nullptr || transform == nullptr) {
      return;
    }
    const glm::vec3 p = transform->position();
    const glm::quat q = transform->rotation();
    fmt::println(
        "  camera {}: radius {:.3f} (target {:.3f}) yaw {:.3f} pitch {:.3f} roll {:.3f}\n"
        "    position ({:.3f}, {:.3f}, {:.3f}) rotation ({:.3f}, {:.3f}, {:.3f}, {:.3f})",
        entity, orbit_camera->radius(), orbit_camera->target_radius(), orbit_camera->yaw(),
        orbit_camera->pitch(), orbit_camera->roll(), p.x, p.y, p.z, q.w, q.x, q.y, q.z);
    if (const auto projection = repository.orthographic_projection_components.find(entity);
        projection != nullptr) {
      fmt::println("    orthographic extent {:.3f} x {:.3f}", projection->right(),
                 projection->top());
    }
  }

}  // namespace

int main(int argc, char* argv[]) {
  auto& configuration = OrbitControlConfiguration::get_instance();
  if (argc > 1) {
    configuration.load_from_file(argv[1]);
  } else {
    configuration.load_from_file();
  }

  Repository repository;
  EventBus event_bus;
  CameraSystem camera_system(repository, event_bus, configuration.get_config());
  camera_system.set_aspect_ratio(static_cast<float32>(kViewportWidth)
                                 / static_cast<float32>(kViewportHeight));

  const Entity perspective_camera
      = camera_system.create_orbit_camera(OrbitCameraData(glm::vec3(0.0f), 6.f, 0.f, kPi / 8.f));
  const Entity orthographic_camera = camera_system.create_orthographic_orbit_camera(
      OrbitCameraData(glm::vec3(0.0f, 0.5f, 0.0f), 4.f, kPi / 4.f, kPi / 6.f,
                      0.f, RadiusLimits{1.f, 20.f}),
      0.1f, 100.f);

  const ScriptPhase script[] = {
      {"orbit", drag(MouseButton::Left, 240.f, -60.f)},
      {"zoom in", scroll(3.f)},
      {"settle", UserInput{}},
      {"pan", drag(MouseButton::Right, 12.f, 6.f)},
      {"roll", hold(KeyCode::KeyQ)},
      {"both roll keys", [] {
         UserInput input = hold(KeyCode::KeyQ);
         input.set_pressed(KeyCode::KeyE, true);
         return input;
       }()},
  };

  for (const auto& phase : script) {
    for (uint32 frame = 0; frame < kFramesPerPhase; ++frame) {
      event_bus.poll();
      // wheel notches arrive on the first frame of the phase only
      UserInput input = phase.input;
      input.set_viewport(kViewportWidth, kViewportHeight);
      if (frame > 0) {
        input.scroll = 0.f;
      }
      camera_system.update(kFrameTime, input);
      FrameMark;
    }
    fmt::println("after {}:", phase.name);
    print_camera(repository, perspective_camera);
    print_camera(repository, orthographic_camera);
  }

  // freeze the controls between frames, the next update must leave every camera untouched
  OrbitControlConfig frozen = configuration.get_config();
  frozen.enable = false;
  event_bus.emit(UpdateOrbitControlsEvent(frozen));
  event_bus.poll();
  UserInput ignored = drag(MouseButton::Left, 120.f, 120.f);
  ignored.set_viewport(kViewportWidth, kViewportHeight);
  camera_system.update(kFrameTime, ignored);
  fmt::println("after disabling controls:");
  print_camera(repository, perspective_camera);

  return 0;
}
