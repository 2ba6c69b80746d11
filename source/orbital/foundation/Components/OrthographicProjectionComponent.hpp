#pragma once

#include "common.hpp"
#include "glm/mat4x4.hpp"
#include "glm/ext/matrix_clip_space.hpp"

namespace orbital::foundation {

  /**
   * Symmetric orthographic volume. Orbit cameras have no perspective foreshortening to zoom with,
   * so the camera system drives the half extents from the orbit radius instead.
   */
  struct OrthographicProjectionComponent {
  private:
    float32 xmag_;
    float32 ymag_;
    float32 near_;
    float32 far_;
    float32 aspect_ratio_;

  public:
    OrthographicProjectionComponent(float32 ymag, float32 near, float32 far,
                                    float32 aspect_ratio = 1.f)
        : xmag_(ymag * aspect_ratio),
          ymag_(ymag),
          near_(near),
          far_(far),
          aspect_ratio_(aspect_ratio) {}

    float32 left() const { return -xmag_; }
    float32 right() const { return xmag_; }
    float32 bottom() const { return -ymag_; }
    float32 top() const { return ymag_; }

    float32 near() const { return near_; }
    float32 far() const { return far_; }

    float32 aspect_ratio() const { return aspect_ratio_; }
    void set_aspect_ratio(const float32 aspect_ratio) {
      aspect_ratio_ = aspect_ratio;
      xmag_ = ymag_ * aspect_ratio_;
    }

    void set_vertical_extent(const float32 ymag) {
      ymag_ = ymag;
      xmag_ = ymag_ * aspect_ratio_;
    }

    [[nodiscard]] glm::mat4 projection_matrix() const {
      return glm::orthoRH_ZO(left(), right(), bottom(), top(), near_, far_);
    }
  };

}  // namespace orbital::foundation
