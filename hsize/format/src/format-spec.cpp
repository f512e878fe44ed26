#include "hsize/format-spec.hpp"

#include <optional>

#include "hsize/invalid_argument_exception.hpp"
#include "hsize/unit-system.hpp"

namespace hsize {

namespace {

// same limit as the usual toFixed implementations
constexpr int kMaxFractionDigits = 100;

template <class T>
void Override(T &field, const std::optional<T> &override) {
  if (override) {
    field = *override;
  }
}

template <class T>
void Override(std::optional<T> &field, const std::optional<T> &override) {
  if (override) {
    field = override;
  }
}

}  // namespace

void FormatSpec::validate() const {
  if (decimals < 0 || decimals > kMaxFractionDigits) {
    throw invalid_argument("decimals must be a non-negative finite number, got {}", decimals);
  }
  if (exponent && (*exponent < 0 || *exponent > kMaxExponent)) {
    throw invalid_argument("exponent must be an integer between 0 and {}, got {}", kMaxExponent, *exponent);
  }
  if (fixedWidth && *fixedWidth < 0) {
    throw invalid_argument("fixedWidth must be non-negative, got {}", *fixedWidth);
  }
  for (const auto &fractionDigits : {minimumFractionDigits, maximumFractionDigits}) {
    if (fractionDigits && (*fractionDigits < 0 || *fractionDigits > kMaxFractionDigits)) {
      throw invalid_argument("fraction digits must be between 0 and {}, got {}", kMaxFractionDigits, *fractionDigits);
    }
  }
}

FormatSpec FormatSpec::merged(const FormatOptions &overrides) const {
  FormatSpec ret = *this;
  Override(ret.system, overrides.system);
  Override(ret.bits, overrides.bits);
  Override(ret.decimals, overrides.decimals);
  Override(ret.roundingMethod, overrides.roundingMethod);
  Override(ret.output, overrides.output);
  Override(ret.longForm, overrides.longForm);
  Override(ret.longForms, overrides.longForms);
  Override(ret.space, overrides.space);
  Override(ret.nonBreakingSpace, overrides.nonBreakingSpace);
  Override(ret.spacer, overrides.spacer);
  Override(ret.pad, overrides.pad);
  Override(ret.showSign, overrides.showSign);
  Override(ret.unit, overrides.unit);
  Override(ret.exponent, overrides.exponent);
  Override(ret.locale, overrides.locale);
  Override(ret.minimumFractionDigits, overrides.minimumFractionDigits);
  Override(ret.maximumFractionDigits, overrides.maximumFractionDigits);
  Override(ret.thousandsSeparator, overrides.thousandsSeparator);
  Override(ret.outputTemplate, overrides.outputTemplate);
  Override(ret.fixedWidth, overrides.fixedWidth);
  Override(ret.customUnits, overrides.customUnits);
  return ret;
}

}  // namespace hsize
