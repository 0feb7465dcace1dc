#pragma once
#include <SFML/Graphics/Color.hpp>

#include <cstddef>
#include <iosfwd>

#include "sprawl/color/color.hpp"
#include "sprawl/constants.hpp"

namespace sprawl::tools::gradient {

struct Options {
  sf::Color start = core::FONT_RAMP_START;
  sf::Color target;
  std::size_t steps = core::FONT_RAMP_STEPS;
  color::HexCase hexCase = color::HexCase::Lower;

  bool showHelp = false;
  bool showVersion = false;
};

void print_usage(std::ostream& os);

// Throws InvalidInput for unknown options, missing values, bad colours and
// non-numeric step counts. --help and --version short-circuit the colour checks.
// A step count below 2 is left for linear_gradient to refuse.
Options parse_args(int argc, char** argv);

}  // namespace sprawl::tools::gradient
