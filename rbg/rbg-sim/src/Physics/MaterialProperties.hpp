#ifndef RBG_SIM_PHYSICS_MATERIAL_PROPERTIES_HPP
#define RBG_SIM_PHYSICS_MATERIAL_PROPERTIES_HPP

#include <stdexcept>
#include <string>

namespace rbg_sim
{

/**
 * @brief Surface material of a physics body
 *
 * Contact pairs combine their coefficients by averaging.
 */
struct MaterialProperties
{
  double coefficientOfRestitution{0.0};
  double frictionCoefficient{0.5};

  /**
   * @param e Coefficient of restitution [0, 1]
   * @throws std::invalid_argument if e not in [0, 1]
   */
  void setCoefficientOfRestitution(double e)
  {
    if (e < 0.0 || e > 1.0)
    {
      throw std::invalid_argument(
        "Coefficient of restitution must be in [0, 1], got: " +
        std::to_string(e));
    }
    coefficientOfRestitution = e;
  }

  /**
   * @param mu Friction coefficient [0, inf)
   * @throws std::invalid_argument if mu < 0
   */
  void setFrictionCoefficient(double mu)
  {
    if (mu < 0.0)
    {
      throw std::invalid_argument(
        "Friction coefficient must be non-negative, got: " +
        std::to_string(mu));
    }
    frictionCoefficient = mu;
  }

  static MaterialProperties create(double restitution, double friction)
  {
    MaterialProperties material;
    material.setCoefficientOfRestitution(restitution);
    material.setFrictionCoefficient(friction);
    return material;
  }
};

}  // namespace rbg_sim

#endif  // RBG_SIM_PHYSICS_MATERIAL_PROPERTIES_HPP
