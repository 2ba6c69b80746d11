#pragma once

#include "common.hpp"

namespace orbital::foundation {
  class OrbitCameraData;
  struct OrbitControlConfig;
  struct UserInput;
};  // namespace orbital::foundation

namespace orbital::application {

  /**
   * Per-frame orbit controls: rotate, zoom, pan and roll, applied in that order. Stateless, all
   * state lives in the OrbitCameraData passed in.
   */
  class OrbitController final {
  public:
    static void update(const OrbitControlConfig& config, const UserInput& movement,
                       float32 delta_seconds, OrbitCameraData& data);

    static void rotate(const OrbitControlConfig& config, const UserInput& movement,
                       float32 delta_seconds, OrbitCameraData& data);
    static void zoom(const OrbitControlConfig& config, const UserInput& movement,
                     float32 delta_seconds, OrbitCameraData& data);
    static void pan(const OrbitControlConfig& config, const UserInput& movement,
                    OrbitCameraData& data);
    static void roll(const OrbitControlConfig& config, const UserInput& movement,
                     float32 delta_seconds, OrbitCameraData& data);
  };

}  // namespace orbital::application
