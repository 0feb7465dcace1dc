#pragma once
#include <iosfwd>

namespace sprawl::tools::gradient {

// Whole tool: rows go to `out`, diagnostics to `err`. Returns the exit code
// (0 on success, 1 on any error). Nothing reaches `out` when it fails.
int run(int argc, char** argv, std::ostream& out, std::ostream& err);

}  // namespace sprawl::tools::gradient
