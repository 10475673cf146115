#ifndef RBG_SIM_SCENE_TRANSFORM_HPP
#define RBG_SIM_SCENE_TRANSFORM_HPP

#include <Eigen/Geometry>

#include "rbg-sim/src/DataTypes/Coordinate.hpp"

namespace rbg_sim
{

/**
 * @brief Translation / rotation / scale of a scene node relative to its parent
 *
 * Composition order is T * R * S, the same as glTF node transforms.
 */
struct Transform
{
  Coordinate translation;
  Eigen::Quaterniond rotation{Eigen::Quaterniond::Identity()};
  Eigen::Vector3d scale{1.0, 1.0, 1.0};

  static Transform fromTranslation(const Coordinate& t)
  {
    Transform result;
    result.translation = t;
    return result;
  }

  [[nodiscard]] Eigen::Affine3d toAffine() const
  {
    Eigen::Affine3d affine = Eigen::Affine3d::Identity();
    affine.translate(translation);
    affine.rotate(rotation);
    affine.scale(scale);
    return affine;
  }
};

}  // namespace rbg_sim

#endif  // RBG_SIM_SCENE_TRANSFORM_HPP
