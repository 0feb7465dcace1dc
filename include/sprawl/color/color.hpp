#pragma once

#include <SFML/Graphics/Color.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace sprawl::color
{

  enum class HexCase
  {
    Lower,
    Upper
  };

  // Parses "rrggbb" or "#rrggbb" (either case). Throws InvalidInput otherwise.
  // Alpha of the result is always 255.
  sf::Color parse_hex(std::string_view text);

  // Six zero-padded hex digits, no prefix. Alpha is ignored.
  std::string to_hex(const sf::Color &c, HexCase hexCase = HexCase::Lower);

  // Sample `step` of `steps` evenly spaced values from a to b, rounded to nearest.
  // Throws InvalidInput unless steps >= 2 and step < steps.
  sf::Uint8 lerp_channel(sf::Uint8 a, sf::Uint8 b, std::size_t step, std::size_t steps);

} // namespace sprawl::color
