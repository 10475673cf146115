#ifndef RBG_GUI_VIEW_PROJECTION_HPP
#define RBG_GUI_VIEW_PROJECTION_HPP

#include <optional>

#include <Eigen/Dense>

#include "rbg-sim/src/Camera/Camera.hpp"
#include "rbg-sim/src/DataTypes/Coordinate.hpp"

namespace rbg_gui
{

/**
 * @brief Perspective projection of a game camera onto the window
 *
 * Uses a right-handed coordinate system with:
 * - X: right
 * - Y: up
 * - Z: out of screen, opposite the viewing direction
 *
 * Screen coordinates have their origin at the top-left corner with +Y down.
 */
class ViewProjection
{
public:
  /**
   * @param camera Camera pose to view from
   * @param width Output width in pixels
   * @param height Output height in pixels
   * @param fovDegrees Vertical field of view in degrees (default: 60)
   * @param nearPlane Near clipping plane distance (default: 0.1)
   * @param farPlane Far clipping plane distance (default: 500.0)
   */
  ViewProjection(const rbg_sim::Camera& camera,
                 int width,
                 int height,
                 float fovDegrees = 60.0f,
                 float nearPlane = 0.1f,
                 float farPlane = 500.0f);

  /**
   * @brief Get the view matrix (transforms from world space to camera space)
   */
  [[nodiscard]] const Eigen::Matrix4f& getViewMatrix() const
  {
    return view_;
  }

  /**
   * @brief Get the perspective projection matrix
   */
  [[nodiscard]] const Eigen::Matrix4f& getProjectionMatrix() const
  {
    return projection_;
  }

  /**
   * @brief Depth of a world point along the viewing direction
   */
  [[nodiscard]] float depthOf(const Eigen::Vector3d& world) const;

  /**
   * @brief Project a world point to pixel coordinates
   * @return std::nullopt if the point is closer than the near plane or
   *         behind the camera
   */
  [[nodiscard]] std::optional<Eigen::Vector2f> toScreen(
    const Eigen::Vector3d& world) const;

  /**
   * @brief On-screen radius in pixels of a sphere at the given depth
   */
  [[nodiscard]] float projectedRadius(double radius, float depth) const;

private:
  Eigen::Matrix4f view_;
  Eigen::Matrix4f projection_;
  float width_;
  float height_;
  float focal_;  ///< 1 / tan(fov / 2)
  float nearPlane_;
};

}  // namespace rbg_gui

#endif  // RBG_GUI_VIEW_PROJECTION_HPP
