#pragma once

#include <iosfwd>
#include <string>

#include "color.hpp"
#include "gradient.hpp"

namespace sprawl::color
{

  // "[0x37, 0x33, 0x43]," ; the 0x prefix stays lower case.
  std::string format_array_literal(const sf::Color &c, HexCase hexCase = HexCase::Lower);

  // One row per colour, newline terminated. Throws std::runtime_error if the stream fails.
  void write_gradient(std::ostream &os, const Gradient &gradient, HexCase hexCase = HexCase::Lower);

} // namespace sprawl::color
