#include "ECS/CameraSystem.hpp"

#include <fmt/core.h>
#include <tracy/Tracy.hpp>

#include "Camera/OrbitMath.hpp"
#include "Cameras/OrbitController.hpp"
#include "Events/EventBus.hpp"
#include "Events/Events.hpp"
#include "InputTypes.hpp"
#include "OrbitControlConfig.hpp"
#include "Repository.hpp"

namespace orbital::application {

  CameraSystem::CameraSystem(Repository& repository, EventBus& event_bus,
                             OrbitControlConfig& config)
      : repository_(repository), event_bus_(event_bus), config_(config) {
    event_bus_.subscribe<UpdateOrbitCameraEvent>([this](const UpdateOrbitCameraEvent& event) {
      const auto orbit_camera = repository_.orbit_camera_components.find_mutable(event.entity());
      if (orbit_camera != nullptr) {
        orbit_camera->set_pivot(event.pivot());
        orbit_camera->set_radius(event.radius());
        orbit_camera->set_angles(event.yaw(), event.pitch(), event.roll());
        sync_components(event.entity(), *orbit_camera);
      }
    });

    event_bus_.subscribe<UpdateOrbitControlsEvent>(
        [this](const UpdateOrbitControlsEvent& event) { config_ = event.config(); });
  }

  Entity CameraSystem::create_orbit_camera(const OrbitCameraData& orbit_camera) {
    const Entity entity = repository_.create_entity();
    repository_.orbit_camera_components.upsert(entity, orbit_camera);
    repository_.transform_components.upsert(entity, orbit_camera.transform());
    fmt::println("created orbit camera {}", entity);
    return entity;
  }

  Entity CameraSystem::create_orthographic_orbit_camera(const OrbitCameraData& orbit_camera,
                                                        const float32 near, const float32 far) {
    const Entity entity = create_orbit_camera(orbit_camera);
    repository_.orthographic_projection_components.upsert(
        entity, OrthographicProjectionComponent(orbit_camera.radius(), near, far, aspect_ratio_));
    sync_components(entity, orbit_camera);
    return entity;
  }

  void CameraSystem::update(const float32 delta_time, const UserInput& movement) {
    ZoneScopedN("CameraSystem::update");

    for (const Entity entity : repository_.orbit_camera_components.entities()) {
      if (filter_ && !filter_(entity)) {
        continue;
      }
      const auto orbit_camera = repository_.orbit_camera_components.find_mutable(entity);
      if (orbit_camera == nullptr) {
        continue;
      }
      OrbitController::update(config_, movement, delta_time, *orbit_camera);
      sync_components(entity, *orbit_camera);
    }
  }

  void CameraSystem::sync_components(const Entity entity, const OrbitCameraData& orbit_camera) {
    const auto projection = repository_.orthographic_projection_components.find_mutable(entity);
    if (projection == nullptr) {
      repository_.transform_components.upsert(entity, orbit_camera.transform());
      return;
    }

    // orthographic views have no perspective to zoom with, the radius sets the visible extent
    projection->set_aspect_ratio(aspect_ratio_);
    projection->set_vertical_extent(orbit_camera.radius());

    // the camera stays midway between its clip planes so zooming never clips the pivot
    const float32 distance = (projection->near() + projection->far()) * .5f;
    const glm::vec3 direction = orbit_direction(orbit_camera.yaw(), orbit_camera.pitch());
    const glm::vec3 position = orbit_camera.pivot() + distance * direction;
    repository_.transform_components.upsert(
        entity, TransformComponent(position, orbit_camera.orientation()));
  }

}  // namespace orbital::application
