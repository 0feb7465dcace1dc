#include "sprawl/tools/gradient/run.hpp"

#include <ostream>
#include <stdexcept>

#include "sprawl/color/array_literal.hpp"
#include "sprawl/color/gradient.hpp"
#include "sprawl/constants.hpp"
#include "sprawl/invalid_input.hpp"
#include "sprawl/tools/gradient/options.hpp"

namespace sprawl::tools::gradient {

int run(int argc, char** argv, std::ostream& out, std::ostream& err) {
  try {
    const Options opts = parse_args(argc, argv);

    if (opts.showHelp) {
      print_usage(out);
      return 0;
    }
    if (opts.showVersion) {
      out << core::GRADIENT_VERSION << "\n";
      return 0;
    }

    // Build everything first so a failure leaves `out` empty.
    const auto gradient = color::linear_gradient(opts.start, opts.target, opts.steps);
    color::write_gradient(out, gradient, opts.hexCase);
    return 0;
  } catch (const InvalidInput& ex) {
    err << "Error: " << ex.what() << "\n";
    print_usage(err);
    return 1;
  } catch (const std::exception& ex) {
    err << "Error: " << ex.what() << "\n";
    return 1;
  }
}

}  // namespace sprawl::tools::gradient
