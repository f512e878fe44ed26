#include <hsize/hsize.hpp>

#include <cmath>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>

#include "hsize/stringconv.hpp"
#include "hsize/vector.hpp"

using namespace hsize;

namespace {

void PrintUsage(std::string_view programName) {
  std::cerr << "Usage:\n"
            << "  " << programName << " [options] <bytes>       format a byte count\n"
            << "  " << programName << " [options] -b <size>     convert a size string to bytes\n"
            << "  " << programName << " -e                      print every size found in standard input\n"
            << "  " << programName << " compare <size> <size>   compare two sizes\n"
            << "Options:\n"
            << "  -s, --system si|iec|jedec|french  unit system (default iec)\n"
            << "  -d, --decimals N                  fraction digits (default 2)\n"
            << "      --bits                        bits instead of bytes\n";
}

double ToBytes(std::string_view arg, const ParseSpec &spec) { return Parse(arg, ParseSpec{spec}.withStrict()); }

int Compare(std::string_view lhs, std::string_view rhs, const ParseSpec &spec) {
  const double lhsBytes = ToBytes(lhs, spec);
  const double rhsBytes = ToBytes(rhs, spec);
  const char sign = lhsBytes < rhsBytes ? '<' : (rhsBytes < lhsBytes ? '>' : '=');
  std::cout << lhs << ' ' << sign << ' ' << rhs << '\n';
  return EXIT_SUCCESS;
}

int ExtractStdin() {
  const std::string text(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>{});
  for (const auto &match : Extract(text)) {
    std::cout << match.start << '-' << match.end << '\t' << match.input << '\t' << match.bytes << '\n';
  }
  return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char **argv) {
  const std::string_view programName = argc > 0 ? argv[0] : "hsize-cli";

  FormatSpec formatSpec;
  ParseSpec parseSpec;
  bool toBytes = false;
  bool extract = false;
  vector<std::string_view> positionals;

  try {
    for (int argPos = 1; argPos < argc; ++argPos) {
      const std::string_view arg(argv[argPos]);
      const auto nextArg = [&]() -> std::string_view {
        if (argPos + 1 >= argc) {
          throw invalid_argument("Missing value after option");
        }
        return argv[++argPos];
      };
      if (arg == "-h" || arg == "--help") {
        PrintUsage(programName);
        return EXIT_SUCCESS;
      }
      if (arg == "-b" || arg == "--to-bytes") {
        toBytes = true;
      } else if (arg == "-e" || arg == "--extract") {
        extract = true;
      } else if (arg == "--bits") {
        formatSpec.withBits();
      } else if (arg == "-s" || arg == "--system") {
        const std::string_view systemName = nextArg();
        const std::optional<UnitSystem> system = UnitSystemFromName(systemName);
        if (!system) {
          std::cerr << "Unknown unit system: " << systemName << '\n';
          return EXIT_FAILURE;
        }
        formatSpec.withSystem(*system);
        parseSpec.withIec(*system != UnitSystem::SI);
      } else if (arg == "-d" || arg == "--decimals") {
        formatSpec.withDecimals(StringToIntegral<int>(nextArg()));
      } else {
        positionals.push_back(arg);
      }
    }

    if (extract) {
      return ExtractStdin();
    }
    if (!positionals.empty() && positionals.front() == "compare") {
      if (positionals.size() != 3) {
        PrintUsage(programName);
        return EXIT_FAILURE;
      }
      return Compare(positionals[1], positionals[2], parseSpec);
    }
    if (positionals.size() != 1) {
      PrintUsage(programName);
      return EXIT_FAILURE;
    }
    if (toBytes) {
      std::cout << DoubleToString(ToBytes(positionals.front(), parseSpec)) << '\n';
    } else {
      // plain numbers and size strings are both accepted
      std::cout << Format(ToBytes(positionals.front(), parseSpec), formatSpec) << '\n';
    }
  } catch (const std::exception &ex) {
    std::cerr << ex.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
