#pragma once

#include <SFML/Graphics/Color.hpp>

#include <cstddef>
#include <vector>

namespace sprawl::color
{

  using Gradient = std::vector<sf::Color>;

  // `steps` colours from start to target (both included), evenly spaced per
  // channel in RGB and rounded to the nearest integer.
  // Throws InvalidInput if steps < 2.
  Gradient linear_gradient(const sf::Color &start, const sf::Color &target, std::size_t steps);

} // namespace sprawl::color
