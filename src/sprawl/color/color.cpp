#include "sprawl/color/color.hpp"

#include <cmath>
#include <cstdint>
#include <initializer_list>

#include "sprawl/invalid_input.hpp"

namespace sprawl::color
{

  namespace
  {
    int hex_digit(char c)
    {
      if (c >= '0' && c <= '9')
        return c - '0';
      if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
      if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
      return -1;
    }

    constexpr char LOWER_DIGITS[] = "0123456789abcdef";
    constexpr char UPPER_DIGITS[] = "0123456789ABCDEF";
  } // namespace

  sf::Color parse_hex(std::string_view text)
  {
    std::string_view digits = text;
    if (!digits.empty() && digits.front() == '#')
      digits.remove_prefix(1);

    if (digits.size() != 6)
      throw InvalidInput("Invalid color '" + std::string(text) +
                         "': expected 6 hex digits (e.g. ff00aa)");

    std::uint8_t channels[3]{};
    for (std::size_t i = 0; i < 3; ++i)
    {
      const int hi = hex_digit(digits[2 * i]);
      const int lo = hex_digit(digits[2 * i + 1]);
      if (hi < 0 || lo < 0)
        throw InvalidInput("Invalid color '" + std::string(text) + "': not a hex value");
      channels[i] = static_cast<std::uint8_t>(hi * 16 + lo);
    }
    return sf::Color(channels[0], channels[1], channels[2]);
  }

  std::string to_hex(const sf::Color &c, HexCase hexCase)
  {
    const char *table = hexCase == HexCase::Upper ? UPPER_DIGITS : LOWER_DIGITS;
    std::string out;
    out.reserve(6);
    for (sf::Uint8 v : {c.r, c.g, c.b})
    {
      out.push_back(table[v >> 4]);
      out.push_back(table[v & 0x0F]);
    }
    return out;
  }

  sf::Uint8 lerp_channel(sf::Uint8 a, sf::Uint8 b, std::size_t step, std::size_t steps)
  {
    if (steps < 2)
      throw InvalidInput("Invalid step count " + std::to_string(steps) + ": need at least 2");
    if (step >= steps)
      throw InvalidInput("Step " + std::to_string(step) + " out of range for " +
                         std::to_string(steps) + " steps");

    const double t = static_cast<double>(step) / static_cast<double>(steps - 1);
    const double v = static_cast<double>(a) + (static_cast<double>(b) - static_cast<double>(a)) * t;
    return static_cast<sf::Uint8>(std::lround(v));
  }

} // namespace sprawl::color
