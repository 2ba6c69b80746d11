#include "OrbitControlConfiguration.hpp"

#include <fstream>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace orbital::foundation {

  namespace {
    template <typename Binding>
    nlohmann::json binding_to_json(const std::optional<Binding>& binding) {
      if (!binding.has_value()) {
        return nullptr;
      }
      return std::string(to_string(*binding));
    }

    template <typename Binding, typename Parser>
    void binding_from_json(const nlohmann::json& j, const char* key,
                           std::optional<Binding>& binding, Parser parse) {
      const auto it = j.find(key);
      if (it == j.end()) {
        return;
      }
      if (it->is_null()) {
        binding = std::nullopt;
        return;
      }
      const auto name = it->get<std::string>();
      if (const auto parsed = parse(name); parsed.has_value()) {
        binding = parsed;
      } else {
        fmt::println("Unknown binding '{}' for {}, keeping {}", name, key,
                   binding.has_value() ? to_string(*binding) : "none");
      }
    }
  }  // namespace

  void to_json(nlohmann::json& j, const OrbitControlConfig& config) {
    j = nlohmann::json{{"zoomSpeed", config.zoom_speed},
                       {"rotationSpeed", config.rotation_speed},
                       {"panSpeed", config.pan_speed},
                       {"rollSpeed", config.roll_speed},
                       {"enable", config.enable},
                       {"enableZoom", config.enable_zoom},
                       {"enableRotation", config.enable_rotation},
                       {"enablePan", config.enable_pan},
                       {"enableRoll", config.enable_roll},
                       {"zoomSmoothness", config.zoom_smoothness},
                       {"rotateButton", binding_to_json(config.rotate_button)},
                       {"zoomButton", binding_to_json(config.zoom_button)},
                       {"panButton", binding_to_json(config.pan_button)}};

    if (config.roll_button.has_value()) {
      j["rollButton"] = {{"increase", std::string(to_string(config.roll_button->increase))},
                         {"decrease", std::string(to_string(config.roll_button->decrease))}};
    } else {
      j["rollButton"] = nullptr;
    }
  }

  void from_json(const nlohmann::json& j, OrbitControlConfig& config) {
    // parse into a copy so a type error part way through leaves config untouched
    OrbitControlConfig parsed = config;

    parsed.zoom_speed = j.value("zoomSpeed", parsed.zoom_speed);
    parsed.rotation_speed = j.value("rotationSpeed", parsed.rotation_speed);
    parsed.pan_speed = j.value("panSpeed", parsed.pan_speed);
    parsed.roll_speed = j.value("rollSpeed", parsed.roll_speed);

    parsed.enable = j.value("enable", parsed.enable);
    parsed.enable_zoom = j.value("enableZoom", parsed.enable_zoom);
    parsed.enable_rotation = j.value("enableRotation", parsed.enable_rotation);
    parsed.enable_pan = j.value("enablePan", parsed.enable_pan);
    parsed.enable_roll = j.value("enableRoll", parsed.enable_roll);

    parsed.zoom_smoothness = j.value("zoomSmoothness", parsed.zoom_smoothness);

    binding_from_json(j, "rotateButton", parsed.rotate_button, mouse_button_from_string);
    binding_from_json(j, "zoomButton", parsed.zoom_button, key_code_from_string);
    binding_from_json(j, "panButton", parsed.pan_button, mouse_button_from_string);

    if (const auto it = j.find("rollButton"); it != j.end()) {
      if (it->is_null()) {
        parsed.roll_button = std::nullopt;
      } else {
        const auto increase = key_code_from_string(it->at("increase").get<std::string>());
        const auto decrease = key_code_from_string(it->at("decrease").get<std::string>());
        if (increase.has_value() && decrease.has_value()) {
          parsed.roll_button = RollKeys{*increase, *decrease};
        } else {
          fmt::println("Unknown roll keys {}, keeping previous binding", it->dump());
        }
      }
    }

    config = parsed;
  }

  OrbitControlConfiguration& OrbitControlConfiguration::get_instance() {
    static OrbitControlConfiguration instance;
    return instance;
  }

  bool OrbitControlConfiguration::load_from_file(const std::string& filename) {
    std::ifstream config_file(filename);

    // If the file doesn't exist, create it with default values
    if (!config_file) {
      fmt::println("Configuration file not found, creating default configuration: {}", filename);
      if (save_to_file(filename)) {
        fmt::println("Default configuration saved to: {}", filename);
      }
      return false;
    }

    nlohmann::json config_json;
    try {
      config_file >> config_json;
    } catch (const nlohmann::json::parse_error& e) {
      fmt::println("JSON parse error in configuration file: {}", e.what());
      return false;
    }

    try {
      from_json(config_json, config_);
    } catch (const nlohmann::json::exception& e) {
      fmt::println("JSON type error in configuration file: {}", e.what());
      return false;
    }
    return true;
  }

  bool OrbitControlConfiguration::save_to_file(const std::string& filename) const {
    std::ofstream out_config_file(filename);
    if (!out_config_file) {
      fmt::println("Error: Could not create configuration file: {}", filename);
      return false;
    }
    const nlohmann::json config_json = config_;
    out_config_file << config_json.dump(4);  // Pretty print with 4-space indentation
    return true;
  }

}  // namespace orbital::foundation
