#include "rbg-gui/src/ViewProjection.hpp"

#include <cmath>
#include <numbers>

namespace rbg_gui
{

ViewProjection::ViewProjection(const rbg_sim::Camera& camera,
                               int width,
                               int height,
                               float fovDegrees,
                               float nearPlane,
                               float farPlane)
  : view_{Eigen::Matrix4f::Identity()},
    projection_{Eigen::Matrix4f::Zero()},
    width_{static_cast<float>(width)},
    height_{static_cast<float>(height)},
    focal_{1.0f /
           std::tan(fovDegrees * std::numbers::pi_v<float> / 180.0f / 2.0f)},
    nearPlane_{nearPlane}
{
  // View = inverse(T * R) = R^T * T^(-1)
  Eigen::Matrix3f const rotationTranspose =
    camera.orientation.toRotationMatrix().transpose().cast<float>();
  view_.block<3, 3>(0, 0) = rotationTranspose;
  view_.block<3, 1>(0, 3) = -rotationTranspose * camera.position.cast<float>();

  float const aspect = height_ > 0.0f ? width_ / height_ : 1.0f;
  float const rangeInv = 1.0f / (nearPlane - farPlane);

  projection_(0, 0) = focal_ / aspect;
  projection_(1, 1) = focal_;
  projection_(2, 2) = (farPlane + nearPlane) * rangeInv;
  projection_(2, 3) = 2.0f * farPlane * nearPlane * rangeInv;
  projection_(3, 2) = -1.0f;  // W = -Z
}

float ViewProjection::depthOf(const Eigen::Vector3d& world) const
{
  Eigen::Vector4f const eye = view_ * world.cast<float>().homogeneous();
  return -eye.z();
}

std::optional<Eigen::Vector2f> ViewProjection::toScreen(
  const Eigen::Vector3d& world) const
{
  Eigen::Vector4f const clip =
    projection_ * view_ * world.cast<float>().homogeneous();

  if (clip.w() < nearPlane_)
  {
    return std::nullopt;
  }

  float const ndcX = clip.x() / clip.w();
  float const ndcY = clip.y() / clip.w();

  return Eigen::Vector2f{(ndcX + 1.0f) * 0.5f * width_,
                         (1.0f - ndcY) * 0.5f * height_};
}

float ViewProjection::projectedRadius(double radius, float depth) const
{
  if (depth <= 0.0f)
  {
    return 0.0f;
  }
  return static_cast<float>(radius) * focal_ * 0.5f * height_ / depth;
}

}  // namespace rbg_gui
