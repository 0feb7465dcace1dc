#pragma once

#include <SFML/Graphics/Color.hpp>

#include <cstddef>
#include <string_view>

namespace sprawl::core
{
  // Map background #322F3D lightened by 2%. Font ramps fade up from here.
  inline const sf::Color FONT_RAMP_START{0x37, 0x33, 0x43};

  // Rows per font ramp on the map.
  inline constexpr std::size_t FONT_RAMP_STEPS = 10;

  // ------------------ Version ------------------
  inline constexpr std::string_view GRADIENT_VERSION{"sprawl_gradient 1.0v"};
}
