#ifndef RBG_SIM_COORDINATE_HPP
#define RBG_SIM_COORDINATE_HPP

#include <format>
#include <string>

#include <Eigen/Dense>

namespace rbg_sim
{

/**
 * @brief World-space position, direction, velocity, force or torque [SI units]
 *
 * A thin Eigen::Vector3d wrapper that zero-initializes and converts from any
 * Eigen 3-vector expression. The game uses a Y-up, right-handed frame: -Z is
 * "forward" for an unrotated camera.
 */
struct Coordinate final : Eigen::Vector3d
{
  Coordinate() : Eigen::Vector3d{0.0, 0.0, 0.0}
  {
  }

  Coordinate(double x, double y, double z) : Eigen::Vector3d{x, y, z}
  {
  }

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Coordinate(const Eigen::MatrixBase<OtherDerived>& other)
    : Eigen::Vector3d{other}
  {
  }

  template <typename OtherDerived>
  Coordinate& operator=(const Eigen::MatrixBase<OtherDerived>& other)
  {
    this->Eigen::Vector3d::operator=(other);
    return *this;
  }
};

}  // namespace rbg_sim

// Formatter specialization for std::format support
template <>
struct std::formatter<rbg_sim::Coordinate>
{
  // Examples: "{}", "{:.2f}", "{:10.3f}"
  char presentation = 'f';
  int precision = 6;
  int width = 0;

  constexpr auto parse(std::format_parse_context& ctx)
  {
    auto it = ctx.begin();
    auto end = ctx.end();

    if (it == end || *it == '}')
    {
      return it;
    }

    // Format: [width][.precision][type]
    if (it != end && *it >= '0' && *it <= '9')
    {
      width = 0;
      while (it != end && *it >= '0' && *it <= '9')
      {
        width = width * 10 + (*it - '0');
        ++it;
      }
    }

    if (it != end && *it == '.')
    {
      ++it;
      precision = 0;
      while (it != end && *it >= '0' && *it <= '9')
      {
        precision = precision * 10 + (*it - '0');
        ++it;
      }
    }

    if (it != end && (*it == 'f' || *it == 'e' || *it == 'g'))
    {
      presentation = *it;
      ++it;
    }

    return it;
  }

  auto format(const rbg_sim::Coordinate& coord, std::format_context& ctx) const
  {
    std::string componentFmt = "{:";
    if (width > 0)
    {
      componentFmt += std::to_string(width);
    }
    componentFmt += '.';
    componentFmt += std::to_string(precision);
    componentFmt += presentation;
    componentFmt += '}';

    double const x = coord.x();
    double const y = coord.y();
    double const z = coord.z();

    return std::format_to(ctx.out(),
                          "({}, {}, {})",
                          std::vformat(componentFmt, std::make_format_args(x)),
                          std::vformat(componentFmt, std::make_format_args(y)),
                          std::vformat(componentFmt, std::make_format_args(z)));
  }
};

#endif  // RBG_SIM_COORDINATE_HPP
