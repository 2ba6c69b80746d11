#pragma once

#include <bitset>
#include <optional>
#include <string_view>

#include "common.hpp"

namespace orbital::foundation {

  enum class MouseButton : uint8 { Left, Right, Middle, Back, Forward, Count };

  enum class KeyCode : uint8 {
    KeyA, KeyB, KeyC, KeyD, KeyE, KeyF, KeyG, KeyH, KeyI, KeyJ, KeyK, KeyL, KeyM,
    KeyN, KeyO, KeyP, KeyQ, KeyR, KeyS, KeyT, KeyU, KeyV, KeyW, KeyX, KeyY, KeyZ,
    Space,
    ShiftLeft, ShiftRight,
    ControlLeft, ControlRight,
    AltLeft, AltRight,
    ArrowUp, ArrowDown, ArrowLeft, ArrowRight,
    Count
  };

  // Line scrolling reports wheel notches, pixel scrolling reports touchpad distance.
  enum class ScrollUnit : uint8 { Line, Pixel };

  constexpr float32 kPixelScrollScale = 0.005f;

  constexpr size_t kMouseButtonCount = static_cast<size_t>(MouseButton::Count);
  constexpr size_t kKeyCodeCount = static_cast<size_t>(KeyCode::Count);

  /**
   * One frame of input as sampled by the host. Pointer deltas are relative motion in pixels since
   * the previous frame; button and key state is "held this frame". The viewport the pointer moved
   * in converts pixels to viewport units, without one pointer motion is ignored.
   */
  struct UserInput {
    float32 mouse_position_x_rel{0.f};
    float32 mouse_position_y_rel{0.f};
    float32 scroll{0.f};
    ScrollUnit scroll_unit{ScrollUnit::Line};
    uint32 viewport_width{0};
    uint32 viewport_height{0};

    [[nodiscard]] bool has_viewport() const { return viewport_width > 0 && viewport_height > 0; }

    void set_viewport(const uint32 width, const uint32 height) {
      viewport_width = width;
      viewport_height = height;
    }

    [[nodiscard]] bool is_pressed(MouseButton button) const {
      return button != MouseButton::Count && mouse_buttons_.test(static_cast<size_t>(button));
    }

    [[nodiscard]] bool is_pressed(KeyCode key) const {
      return key != KeyCode::Count && keys_.test(static_cast<size_t>(key));
    }

    void set_pressed(MouseButton button, const bool pressed) {
      if (button != MouseButton::Count) mouse_buttons_.set(static_cast<size_t>(button), pressed);
    }

    void set_pressed(KeyCode key, const bool pressed) {
      if (key != KeyCode::Count) keys_.set(static_cast<size_t>(key), pressed);
    }

    // scroll in zoom units, pixel scrolling is scaled down to line notches
    [[nodiscard]] float32 scroll_lines() const {
      return scroll_unit == ScrollUnit::Pixel ? scroll * kPixelScrollScale : scroll;
    }

  private:
    std::bitset<kMouseButtonCount> mouse_buttons_;
    std::bitset<kKeyCodeCount> keys_;
  };

  [[nodiscard]] std::string_view to_string(MouseButton button);
  [[nodiscard]] std::string_view to_string(KeyCode key);

  [[nodiscard]] std::optional<MouseButton> mouse_button_from_string(std::string_view name);
  [[nodiscard]] std::optional<KeyCode> key_code_from_string(std::string_view name);

}  // namespace orbital::foundation
