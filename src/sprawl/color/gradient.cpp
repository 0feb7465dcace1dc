#include "sprawl/color/gradient.hpp"

#include <string>

#include "sprawl/color/color.hpp"
#include "sprawl/invalid_input.hpp"

namespace sprawl::color
{

  Gradient linear_gradient(const sf::Color &start, const sf::Color &target, std::size_t steps)
  {
    if (steps < 2)
      throw InvalidInput("Invalid step count " + std::to_string(steps) + ": need at least 2");

    Gradient out;
    out.reserve(steps);
    for (std::size_t i = 0; i < steps; ++i)
    {
      out.emplace_back(lerp_channel(start.r, target.r, i, steps),
                       lerp_channel(start.g, target.g, i, steps),
                       lerp_channel(start.b, target.b, i, steps));
    }
    return out;
  }

} // namespace sprawl::color
