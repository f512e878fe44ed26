#include "hsize/extractor.hpp"

#include <cmath>
#include <cstddef>
#include <string>
#include <string_view>

#include "hsize/byte-pattern.hpp"
#include "hsize/locale-number-parse.hpp"
#include "hsize/log.hpp"
#include "hsize/parser.hpp"
#include "hsize/vector.hpp"

namespace hsize {

vector<ExtractedMatch> Extract(std::string_view text) {
  vector<ExtractedMatch> ret;

  // two spaces per no-break space keep offsets identical to 'text'
  const std::string haystack = ReplaceNoBreakSpaces(text, "  ");

  for (auto match = SearchByteString(haystack); match; match = SearchByteString(haystack, match->end)) {
    const std::size_t start = match->start;
    const std::string_view input = text.substr(start, match->end - start);

    const auto value = ParseNumberString(match->number);
    if (!value || !value->isFinite()) {
      log::debug("Skipping '{}' at offset {}", input, start);
      continue;
    }
    const double number = value->toDouble();
    const double bytes = Parse(input);
    if (!std::isfinite(number) || !std::isfinite(bytes)) {
      log::debug("Skipping '{}' at offset {}", input, start);
      continue;
    }
    ret.push_back(ExtractedMatch{number, std::string(match->unit), bytes, std::string(input), start, match->end});
  }
  return ret;
}

}  // namespace hsize
