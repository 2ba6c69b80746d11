#pragma once
#include <functional>
#include <utility>

#include "Components/Entity.hpp"

namespace orbital::foundation {
  class Repository;
  class OrbitCameraData;
  struct OrbitControlConfig;
  struct UserInput;
}  // namespace orbital::foundation

namespace orbital::application {
  class EventBus;

  /**
   * Host-side driver for orbit cameras: runs the orbit controls once per frame for every camera
   * the filter accepts and publishes the result to the entity's transform and projection.
   * Orthographic cameras are published halfway between their clip planes instead of at the orbit
   * radius, which only sets their extent.
   */
  class CameraSystem final {
  public:
    using CameraFilter = std::function<bool(Entity)>;

  private:
    Repository& repository_;
    EventBus& event_bus_;
    OrbitControlConfig& config_;

    CameraFilter filter_;
    float32 aspect_ratio_{1.f};

    void sync_components(Entity entity, const OrbitCameraData& orbit_camera);

  public:
    CameraSystem(Repository& repository, EventBus& event_bus, OrbitControlConfig& config);
    ~CameraSystem() = default;

    CameraSystem(const CameraSystem&) = delete;
    CameraSystem& operator=(const CameraSystem&) = delete;

    CameraSystem(CameraSystem&&) = delete;
    CameraSystem& operator=(CameraSystem&&) = delete;

    Entity create_orbit_camera(const OrbitCameraData& orbit_camera);
    Entity create_orthographic_orbit_camera(const OrbitCameraData& orbit_camera, float32 near,
                                            float32 far);

    // an empty filter drives every orbit camera
    void set_filter(CameraFilter filter) { filter_ = std::move(filter); }

    void set_aspect_ratio(const float32 aspect) { aspect_ratio_ = aspect; }
    [[nodiscard]] float32 aspect_ratio() const { return aspect_ratio_; }

    void update(float32 delta_time, const UserInput& movement);
  };

}  // namespace orbital::application
