#include <cassert>
#include <sstream>
#include <string>
#include <vector>

#include "sprawl/constants.hpp"
#include "sprawl/invalid_input.hpp"
#include "sprawl/tools/gradient/options.hpp"
#include "sprawl/tools/gradient/run.hpp"

using namespace sprawl;
using sprawl::tools::gradient::Options;

// Keeps the strings alive for the char* view handed to parse_args.
struct Argv
{
  std::vector<std::string> storage;
  std::vector<char *> ptrs;

  Argv(const std::vector<const char *> &args)
  {
    storage.emplace_back("sprawl_gradient");
    for (const char *a : args)
      storage.emplace_back(a);
    for (auto &s : storage)
      ptrs.push_back(s.data());
    ptrs.push_back(nullptr);
  }

  int argc() const { return static_cast<int>(storage.size()); }
  char **argv() { return ptrs.data(); }
};

static Options parse(const std::vector<const char *> &args)
{
  Argv a(args);
  return tools::gradient::parse_args(a.argc(), a.argv());
}

static int run(const std::vector<const char *> &args, std::ostream &out, std::ostream &err)
{
  Argv a(args);
  return tools::gradient::run(a.argc(), a.argv(), out, err);
}

static bool rejects(const std::vector<const char *> &args)
{
  try
  {
    (void)parse(args);
  }
  catch (const InvalidInput &)
  {
    return true;
  }
  return false;
}

int main()
{
  // Defaults
  {
    Options o = parse({"ff00aa"});
    assert(o.start == core::FONT_RAMP_START);
    assert(o.target == sf::Color(0xff, 0x00, 0xaa));
    assert(o.steps == core::FONT_RAMP_STEPS);
    assert(o.steps == 10);
    assert(o.hexCase == color::HexCase::Lower);
    assert(!o.showHelp && !o.showVersion);
  }

  // Every option, in any order relative to the target
  {
    Options o = parse({"--steps", "4", "#309DFC", "--start", "322f3d", "--uppercase"});
    assert(o.start == sf::Color(0x32, 0x2f, 0x3d));
    assert(o.target == sf::Color(0x30, 0x9d, 0xfc));
    assert(o.steps == 4);
    assert(o.hexCase == color::HexCase::Upper);
  }

  // Help and version do not need a target
  {
    assert(parse({"--help"}).showHelp);
    assert(parse({"-h"}).showHelp);
    assert(parse({"--version"}).showVersion);
    assert(parse({"xyz123", "--help"}).showHelp);
    assert(parse({"--start", "zz", "--help"}).showHelp);
    assert(parse({"--start", "zz", "--version"}).showVersion);
  }

  // Step counts are only checked for being numbers; the gradient refuses small ones
  {
    assert(parse({"ff00aa", "--steps", "1"}).steps == 1);
    assert(parse({"ff00aa", "--steps", "0"}).steps == 0);
  }

  // Bad command lines
  {
    assert(rejects({}));
    assert(rejects({"xyz123"}));
    assert(rejects({"ff00aa", "00ff00"}));
    assert(rejects({"ff00aa", "--steps"}));
    assert(rejects({"ff00aa", "--steps", "-3"}));
    assert(rejects({"ff00aa", "--steps", "ten"}));
    assert(rejects({"ff00aa", "--steps", "5x"}));
    assert(rejects({"ff00aa", "--steps", "99999999999999999999999"}));
    assert(rejects({"ff00aa", "--start"}));
    assert(rejects({"ff00aa", "--start", "12345"}));
    assert(rejects({"ff00aa", "--lowercase"}));
    assert(rejects({"-x", "ff00aa"}));
  }

  // Failures exit with 1, print nothing on out and explain themselves on err
  {
    const std::vector<std::vector<const char *>> cases = {
        {"xyz123"},
        {"--steps", "1", "ffffff"},
        {"--steps", "0", "ffffff"},
        {"--start", "zz", "ffffff"},
        {"ffffff", "000000"},
        {},
    };
    for (const auto &args : cases)
    {
      std::ostringstream out, err;
      assert(run(args, out, err) == 1);
      assert(out.str().empty());
      assert(err.str().rfind("Error: ", 0) == 0);
      assert(err.str().find("Usage: sprawl_gradient") != std::string::npos);
    }
  }

  // Successful runs write rows only
  {
    std::ostringstream out, err;
    assert(run({"--steps", "2", "ffffff"}, out, err) == 0);
    assert(out.str() == "[0x37, 0x33, 0x43],\n[0xff, 0xff, 0xff],\n");
    assert(err.str().empty());
  }
  {
    std::ostringstream out, err;
    assert(run({"--uppercase", "--steps", "3", "--start", "000000", "ffffff"}, out, err) == 0);
    assert(out.str() == "[0x00, 0x00, 0x00],\n[0x80, 0x80, 0x80],\n[0xFF, 0xFF, 0xFF],\n");
  }
  {
    std::ostringstream out, err;
    assert(run({"373343"}, out, err) == 0);
    std::istringstream rows(out.str());
    std::string line;
    int count = 0;
    while (std::getline(rows, line))
    {
      assert(line == "[0x37, 0x33, 0x43],");
      ++count;
    }
    assert(count == 10);
  }

  // Help and version succeed
  {
    std::ostringstream out, err;
    assert(run({"--help"}, out, err) == 0);
    assert(out.str().find("Usage: sprawl_gradient") != std::string::npos);
    assert(err.str().empty());
  }
  {
    std::ostringstream out, err;
    assert(run({"--version"}, out, err) == 0);
    assert(out.str() == std::string(core::GRADIENT_VERSION) + "\n");
    assert(err.str().empty());
  }

  // Usage mentions the defaults
  {
    std::ostringstream os;
    tools::gradient::print_usage(os);
    const std::string text = os.str();
    assert(text.find("Usage: sprawl_gradient") != std::string::npos);
    assert(text.find("373343") != std::string::npos);
    assert(text.find("default 10") != std::string::npos);
  }

  return 0;
}
