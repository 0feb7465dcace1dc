#include <iostream>

#include "sprawl/tools/gradient/run.hpp"

int main(int argc, char **argv)
{
  return sprawl::tools::gradient::run(argc, argv, std::cout, std::cerr);
}
