#include "hsize/parse-spec.hpp"

namespace hsize {

ParseSpec ParseSpec::merged(const ParseOptions &overrides) const {
  ParseSpec ret = *this;
  if (overrides.iec) {
    ret.iec = *overrides.iec;
  }
  if (overrides.bits) {
    ret.bits = *overrides.bits;
  }
  if (overrides.strict) {
    ret.strict = *overrides.strict;
  }
  if (overrides.locale) {
    ret.locale = overrides.locale;
  }
  if (overrides.customUnits) {
    ret.customUnits = overrides.customUnits;
  }
  return ret;
}

}  // namespace hsize
