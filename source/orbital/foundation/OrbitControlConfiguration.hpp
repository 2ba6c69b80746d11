#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "common.hpp"
#include "OrbitControlConfig.hpp"

namespace orbital::foundation {

  constexpr std::string_view kDefaultConfigFile = "../orbit_controls.json";

  void to_json(nlohmann::json& j, const OrbitControlConfig& config);
  void from_json(const nlohmann::json& j, OrbitControlConfig& config);

  class OrbitControlConfiguration {
  public:
    static OrbitControlConfiguration& get_instance();

    /**
     * Loads the controls from a JSON file. A missing file is created with the current values;
     * unreadable or mistyped entries are reported and leave the current values in place.
     * Returns true when the file was read.
     */
    bool load_from_file(const std::string& filename = std::string(kDefaultConfigFile));

    bool save_to_file(const std::string& filename) const;

    OrbitControlConfig& get_config() { return config_; }

    void set_config(const OrbitControlConfig& new_config) { config_ = new_config; }

    OrbitControlConfiguration(const OrbitControlConfiguration&) = delete;
    OrbitControlConfiguration& operator=(const OrbitControlConfiguration&) = delete;

  private:
    OrbitControlConfig config_{};
    OrbitControlConfiguration() = default;
    ~OrbitControlConfiguration() = default;
  };

  inline OrbitControlConfig& getOrbitControls() {
    return OrbitControlConfiguration::get_instance().get_config();
  }

}  // namespace orbital::foundation
