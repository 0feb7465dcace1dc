#include "sprawl/tools/gradient/options.hpp"

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

#include "sprawl/invalid_input.hpp"

namespace sprawl::tools::gradient {

void print_usage(std::ostream& os) {
  os << "Usage: sprawl_gradient [options] <target>\n"
        "Prints a linear RGB gradient as [0xRR, 0xGG, 0xBB], rows.\n"
        "  <target>                  Target color, 6 hex digits (e.g. ff00aa or #ff00aa)\n"
        "Options:\n"
        "  --start <hex>             Start color (default "
     << color::to_hex(core::FONT_RAMP_START) << ")\n"
        "  --steps <N>               Number of colors, N >= 2 (default "
     << core::FONT_RAMP_STEPS << ")\n"
        "  --uppercase               Print hex digits in upper case\n"
        "  --version                 Print version and exit\n"
        "  -h, --help                Show this help\n";
}

static std::size_t parse_steps(const std::string& value) {
  // std::stoull would accept a leading '-' and wrap around.
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos)
    throw InvalidInput("Invalid value for --steps: '" + value + "'");
  try {
    return static_cast<std::size_t>(std::stoull(value));
  } catch (const std::out_of_range&) {
    throw InvalidInput("Value for --steps out of range: " + value);
  }
}

Options parse_args(int argc, char** argv) {
  Options o;
  std::optional<std::string> start;
  std::optional<std::string> target;

  auto require_value = [&](int& i, const char* name) -> std::string {
    if (i + 1 >= argc) throw InvalidInput(std::string("Missing value for ") + name);
    return argv[++i];
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--start") {
      start = require_value(i, "--start");
    } else if (arg == "--steps") {
      o.steps = parse_steps(require_value(i, "--steps"));
    } else if (arg == "--uppercase") {
      o.hexCase = color::HexCase::Upper;
    } else if (arg == "--version") {
      o.showVersion = true;
    } else if (arg == "--help" || arg == "-h") {
      o.showHelp = true;
    } else if (arg.size() > 1 && arg[0] == '-') {
      throw InvalidInput("Unknown option: " + arg);
    } else if (target) {
      throw InvalidInput("Unexpected argument: " + arg + " (only one target color is accepted)");
    } else {
      target = arg;
    }
  }

  if (o.showHelp || o.showVersion) return o;

  if (!target) throw InvalidInput("Missing target color");

  if (start) o.start = color::parse_hex(*start);
  o.target = color::parse_hex(*target);
  return o;
}

}  // namespace sprawl::tools::gradient
