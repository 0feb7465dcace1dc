#include "sprawl/color/array_literal.hpp"

#include <ostream>
#include <stdexcept>

namespace sprawl::color
{

  std::string format_array_literal(const sf::Color &c, HexCase hexCase)
  {
    const std::string hex = to_hex(c, hexCase);
    std::string row;
    row.reserve(19);
    row += "[0x";
    row.append(hex, 0, 2);
    row += ", 0x";
    row.append(hex, 2, 2);
    row += ", 0x";
    row.append(hex, 4, 2);
    row += "],";
    return row;
  }

  void write_gradient(std::ostream &os, const Gradient &gradient, HexCase hexCase)
  {
    for (const auto &c : gradient)
      os << format_array_literal(c, hexCase) << '\n';
    os.flush();
    if (!os)
      throw std::runtime_error("Unable to write gradient to output stream");
  }

} // namespace sprawl::color
