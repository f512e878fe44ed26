#include <hsize/hsize.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>

using namespace hsize;

int main() {
  try {
    std::cout << Format(1536) << '\n';                                                // 1.5 KiB
    std::cout << Format(1000000000, FormatSpec{}.withSystem(UnitSystem::SI)) << '\n';  // 1 GB
    std::cout << Format(123456789, FormatSpec{}.withLongForm().withLocale("de-DE")) << '\n';

    std::cout << Parse("1 GB") << '\n';                               // 1073741824
    std::cout << Parse("1 GB", ParseSpec{}.withIec(false)) << '\n';  // 1e+09

    for (const auto &match : Extract("Downloaded 500 MB of 2 GB")) {
      std::cout << match.input << " at [" << match.start << ", " << match.end << ") = " << match.bytes << " bytes\n";
    }

    const ByteSize total = ByteSize("1 GiB").add(ByteSize("512 MiB")).multiply(2);
    std::cout << total.toString() << " / " << total.toSI() << '\n';  // 3 GiB / 3.22 GB
  } catch (const std::exception &ex) {
    std::cerr << "hsize error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
