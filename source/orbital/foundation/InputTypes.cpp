#include "InputTypes.hpp"

#include <array>

namespace orbital::foundation {

  namespace {
    constexpr std::array<std::string_view, kMouseButtonCount> kMouseButtonNames
        = {"Left", "Right", "Middle", "Back", "Forward"};

    constexpr std::array<std::string_view, kKeyCodeCount> kKeyCodeNames = {
        "KeyA",        "KeyB",         "KeyC",      "KeyD",       "KeyE",      "KeyF",
        "KeyG",        "KeyH",         "KeyI",      "KeyJ",       "KeyK",      "KeyL",
        "KeyM",        "KeyN",         "KeyO",      "KeyP",       "KeyQ",      "KeyR",
        "KeyS",        "KeyT",         "KeyU",      "KeyV",       "KeyW",      "KeyX",
        "KeyY",        "KeyZ",         "Space",     "ShiftLeft",  "ShiftRight", "ControlLeft",
        "ControlRight", "AltLeft",     "AltRight",  "ArrowUp",    "ArrowDown", "ArrowLeft",
        "ArrowRight"};
  }  // namespace

  std::string_view to_string(const MouseButton button) {
    const auto index = static_cast<size_t>(button);
    return index < kMouseButtonNames.size() ? kMouseButtonNames[index] : "Unknown";
  }

  std::string_view to_string(const KeyCode key) {
    const auto index = static_cast<size_t>(key);
    return index < kKeyCodeNames.size() ? kKeyCodeNames[index] : "Unknown";
  }

  std::optional<MouseButton> mouse_button_from_string(const std::string_view name) {
    for (size_t i = 0; i < kMouseButtonNames.size(); ++i) {
      if (kMouseButtonNames[i] == name) return static_cast<MouseButton>(i);
    }
    return std::nullopt;
  }

  std::optional<KeyCode> key_code_from_string(const std::string_view name) {
    for (size_t i = 0; i < kKeyCodeNames.size(); ++i) {
      if (kKeyCodeNames[i] == name) return static_cast<KeyCode>(i);
    }
    return std::nullopt;
  }

}  // namespace orbital::foundation
