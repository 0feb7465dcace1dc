#pragma once

#include <stdexcept>
#include <string>

namespace sprawl
{

  // Raised for malformed colours, bad step counts and bad command lines.
  class InvalidInput : public std::invalid_argument
  {
  public:
    explicit InvalidInput(const std::string &what) : std::invalid_argument(what) {}
  };

} // namespace sprawl
