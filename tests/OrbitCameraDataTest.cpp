#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <random>

#include <glm/geometric.hpp>
#include <glm/mat4x4.hpp>
#include <glm/vec4.hpp>

#include "Camera/OrbitCameraData.hpp"

using namespace orbital::foundation;

namespace {

  constexpr float32 kTolerance = 1e-4f;

}  // namespace

TEST(OrbitCameraData, ConstructorClampsInsteadOfRejecting) {
  const OrbitCameraData data(glm::vec3(0.0f), -5.f, 0.f, 3.f, 4.f * kPi + 0.5f);

  EXPECT_FLOAT_EQ(kMinimumRadius, data.radius());
  EXPECT_FLOAT_EQ(kMinimumRadius, data.target_radius());
  EXPECT_FLOAT_EQ(kPitchLimit, data.pitch());
  EXPECT_NEAR(0.5f, data.roll(), 1e-3f);
}

TEST(OrbitCameraData, ZeroDeltaKeepsRadiusAndDistance) {
  OrbitCameraData data(glm::vec3(0.0f), 6.f, 0.f, kPi / 8.f, 0.f);

  data.apply_delta(0.f, 0.f, 0.f, 0.f, glm::vec3(0.0f));

  EXPECT_FLOAT_EQ(6.f, data.radius());
  EXPECT_FLOAT_EQ(6.f, data.target_radius());
  EXPECT_NEAR(6.f, glm::length(data.position()), kTolerance);
}

TEST(OrbitCameraData, TransformIsFreshAfterEveryMutator) {
  OrbitCameraData data(glm::vec3(1.0f, 2.0f, 3.0f), 4.f, 0.3f, 0.2f, 0.1f);
  EXPECT_EQ(data.compute_transform(), data.transform());

  data.set_pivot(glm::vec3(-1.0f, 0.0f, 5.0f));
  EXPECT_EQ(data.compute_transform(), data.transform());
  EXPECT_NEAR(4.f, glm::length(data.position() - data.pivot()), kTolerance);

  data.set_angles(2.f, -0.5f, 1.f);
  EXPECT_EQ(data.compute_transform(), data.transform());

  data.set_radius(9.f);
  EXPECT_EQ(data.compute_transform(), data.transform());
  EXPECT_NEAR(9.f, glm::length(data.position() - data.pivot()), kTolerance);

  data.apply_delta(0.1f, 0.1f, 0.1f, 1.f, glm::vec3(0.5f));
  EXPECT_EQ(data.compute_transform(), data.transform());

  data.step_zoom(0.5f, 1.f / 60.f);
  EXPECT_EQ(data.compute_transform(), data.transform());
}

TEST(OrbitCameraData, ApplyDeltaMovesTargetNotRenderedRadius) {
  OrbitCameraData data(glm::vec3(0.0f), 5.f);

  data.apply_delta(0.f, 0.f, 0.f, 2.f, glm::vec3(0.0f));

  EXPECT_FLOAT_EQ(7.f, data.target_radius());
  EXPECT_FLOAT_EQ(5.f, data.radius());
}

TEST(OrbitCameraData, ApplyDeltaIgnoresNonFiniteValues) {
  OrbitCameraData data(glm::vec3(0.0f), 5.f, 0.2f, 0.3f, 0.4f);
  const float32 nan = std::numeric_limits<float32>::quiet_NaN();
  const float32 inf = std::numeric_limits<float32>::infinity();

  data.apply_delta(nan, inf, -inf, nan, glm::vec3(nan, inf, 1.0f));

  EXPECT_FLOAT_EQ(0.2f, data.yaw());
  EXPECT_FLOAT_EQ(0.3f, data.pitch());
  EXPECT_FLOAT_EQ(0.4f, data.roll());
  EXPECT_FLOAT_EQ(5.f, data.target_radius());
  EXPECT_EQ(glm::vec3(0.0f, 0.0f, 1.0f), data.pivot());
}

TEST(OrbitCameraData, RadiusNeverReachesZero) {
  OrbitCameraData data(glm::vec3(0.0f), 3.f);

  data.apply_delta(0.f, 0.f, 0.f, -1e9f, glm::vec3(0.0f));
  data.step_zoom(0.f, 1.f / 60.f);

  EXPECT_FLOAT_EQ(kMinimumRadius, data.target_radius());
  EXPECT_FLOAT_EQ(kMinimumRadius, data.radius());
  EXPECT_GT(glm::length(data.position() - data.pivot()), 0.f);
}

TEST(OrbitCameraData, RandomDeltasKeepRadiusAndPitchInRange) {
  OrbitCameraData data(glm::vec3(0.0f), 2.f);
  std::mt19937 rng(1234);
  std::uniform_real_distribution<float32> huge(-1e4f, 1e4f);
  std::uniform_real_distribution<float32> dt(0.f, 0.1f);

  for (int i = 0; i < 2000; ++i) {
    data.apply_delta(huge(rng), huge(rng), huge(rng), huge(rng), glm::vec3(0.0f));
    data.step_zoom(0.75f, dt(rng));

    ASSERT_GE(data.radius(), kMinimumRadius);
    ASSERT_GE(data.target_radius(), kMinimumRadius);
    ASSERT_LE(data.pitch(), kPitchLimit);
    ASSERT_GE(data.pitch(), -kPitchLimit);
    ASSERT_LE(data.roll(), kPi);
    ASSERT_GT(data.roll(), -kPi);
  }
}

TEST(OrbitCameraData, StepZoomWithoutSmoothnessSnapsForAnyDelta) {
  const float32 deltas[] = {0.f, 1e-6f, 1.f / 60.f, 10.f};
  for (const float32 dt : deltas) {
    OrbitCameraData data(glm::vec3(0.0f), 10.f);
    data.set_target_radius(2.f);

    data.step_zoom(0.f, dt);

    EXPECT_FLOAT_EQ(2.f, data.radius()) << "dt " << dt;
  }
}

TEST(OrbitCameraData, StepZoomFollowsReferenceRate) {
  OrbitCameraData data(glm::vec3(0.0f), 10.f);
  data.set_target_radius(2.f);

  data.step_zoom(0.5f, 1.f / kZoomReferenceRate);

  EXPECT_NEAR(6.f, data.radius(), kTolerance);
}

TEST(OrbitCameraData, StepZoomIsFrameRateIndependent) {
  OrbitCameraData one_step(glm::vec3(0.0f), 10.f);
  OrbitCameraData many_steps(glm::vec3(0.0f), 10.f);
  one_step.set_target_radius(2.f);
  many_steps.set_target_radius(2.f);

  one_step.step_zoom(0.75f, 0.05f);
  for (int i = 0; i < 10; ++i) {
    many_steps.step_zoom(0.75f, 0.005f);
  }

  EXPECT_NEAR(one_step.radius(), many_steps.radius(), 1e-3f);
  EXPECT_GT(one_step.radius(), 2.f);
  EXPECT_LT(one_step.radius(), 10.f);
}

TEST(OrbitCameraData, StepZoomWithoutElapsedTimeHolds) {
  OrbitCameraData data(glm::vec3(0.0f), 10.f);
  data.set_target_radius(2.f);

  data.step_zoom(0.5f, 0.f);
  data.step_zoom(0.5f, -1.f);

  EXPECT_FLOAT_EQ(10.f, data.radius());
}

TEST(OrbitCameraData, StepZoomClampsSmoothnessBelowOne) {
  OrbitCameraData data(glm::vec3(0.0f), 10.f);
  data.set_target_radius(2.f);

  data.step_zoom(1.f, 1.f);

  EXPECT_LT(data.radius(), 10.f);
  EXPECT_GT(data.radius(), 2.f);
}

TEST(OrbitCameraData, RadiusLimitsBoundBothRadii) {
  OrbitCameraData data(glm::vec3(0.0f), 10.f, 0.f, 0.f, 0.f, RadiusLimits{2.f, 5.f});
  EXPECT_FLOAT_EQ(5.f, data.radius());

  data.apply_delta(0.f, 0.f, 0.f, -100.f, glm::vec3(0.0f));
  EXPECT_FLOAT_EQ(2.f, data.target_radius());

  data.set_radius_limits(RadiusLimits{std::nullopt, 1.f});
  EXPECT_FLOAT_EQ(1.f, data.max_radius());
  EXPECT_FLOAT_EQ(1.f, data.radius());
  EXPECT_FLOAT_EQ(1.f, data.target_radius());
}

TEST(OrbitCameraData, InvertedRadiusLimitsFavourTheLowerBound) {
  const OrbitCameraData data(glm::vec3(0.0f), 3.f, 0.f, 0.f, 0.f, RadiusLimits{5.f, 2.f});
  EXPECT_FLOAT_EQ(5.f, data.min_radius());
  EXPECT_FLOAT_EQ(5.f, data.max_radius());
  EXPECT_FLOAT_EQ(5.f, data.radius());
}

TEST(OrbitCameraData, ViewMatrixPutsPivotStraightAhead) {
  const OrbitCameraData data(glm::vec3(2.0f, 1.0f, -3.0f), 7.f, 1.1f, -0.6f, 0.8f);

  const glm::vec4 pivot_in_view = data.view_matrix() * glm::vec4(data.pivot(), 1.0f);

  EXPECT_NEAR(0.f, pivot_in_view.x, 1e-3f);
  EXPECT_NEAR(0.f, pivot_in_view.y, 1e-3f);
  EXPECT_NEAR(-7.f, pivot_in_view.z, 1e-3f);
}

TEST(OrbitCameraData, FromTransformAdoptsExistingCamera) {
  const OrbitCameraData original(glm::vec3(0.5f, 0.0f, -1.0f), 3.f, -2.f, 0.7f, -0.4f);

  const OrbitCameraData adopted
      = OrbitCameraData::from_transform(original.pivot(), original.transform());

  EXPECT_NEAR(original.radius(), adopted.radius(), 1e-3f);
  EXPECT_NEAR(original.yaw(), adopted.yaw(), 1e-3f);
  EXPECT_NEAR(original.pitch(), adopted.pitch(), 1e-3f);
  EXPECT_NEAR(original.roll(), adopted.roll(), 1e-3f);
}

TEST(OrbitCameraData, ResetRollLevelsTheCamera) {
  OrbitCameraData data(glm::vec3(0.0f), 3.f, 0.f, 0.f, 1.f);

  data.reset_roll();

  EXPECT_EQ(0.f, data.roll());
  EXPECT_NEAR(1.f, data.transform().up().y, kTolerance);
}
