// hsize Umbrella Header
//
// Include this single header to pull in the public API:
//   - Formatting (Format, FormatAs, Formatter, FormatSpec / FormatOptions)
//   - Parsing (Parse, ParseNumber, ParseBigInt, Parser, ParseSpec / ParseOptions)
//   - Extraction of sizes from free text (Extract) and the byte patterns
//   - ByteSize chainable value
//   - Exceptions thrown by the above
//
// Usage Example:
//    #include <hsize/hsize.hpp>
//    using namespace hsize;
//    int main() {
//      std::string str = Format(1536);                             // "1.5 KiB"
//      double bytes = Parse("1 GB", ParseSpec{}.withIec(false));  // 1e9
//      std::string total = ByteSize("1 GiB").add(ByteSize("512 MiB")).toString();
//    }

#pragma once

// Entry points
#include "hsize/byte-size.hpp"  // IWYU pragma: export
#include "hsize/extractor.hpp"  // IWYU pragma: export
#include "hsize/formatter.hpp"  // IWYU pragma: export
#include "hsize/parser.hpp"     // IWYU pragma: export

// Configuration
#include "hsize/custom-unit-table.hpp"    // IWYU pragma: export
#include "hsize/format-spec.hpp"          // IWYU pragma: export
#include "hsize/number-format-cache.hpp"  // IWYU pragma: export
#include "hsize/parse-spec.hpp"           // IWYU pragma: export
#include "hsize/rounding-method.hpp"      // IWYU pragma: export
#include "hsize/unit-system.hpp"          // IWYU pragma: export

// Results and input types
#include "hsize/bigint.hpp"         // IWYU pragma: export
#include "hsize/byte-pattern.hpp"   // IWYU pragma: export
#include "hsize/format-result.hpp"  // IWYU pragma: export

// Errors
#include "hsize/exception.hpp"                  // IWYU pragma: export
#include "hsize/invalid_argument_exception.hpp"  // IWYU pragma: export
#include "hsize/range_error_exception.hpp"       // IWYU pragma: export
