#pragma once

#include <string>
#include <string_view>

#include "hsize/decimal.hpp"

namespace hsize {

/// Locale independent rendering of an already rounded value: '.' as decimal separator, 'maxFractionDigits' digits
/// with trailing zeros removed down to 'minFractionDigits' (all kept when 'pad' is set), integer part grouped by
/// three with 'thousandsSeparator' when not empty.
[[nodiscard]] std::string RenderPlainNumber(const Decimal &value, int minFractionDigits, int maxFractionDigits,
                                            bool pad, std::string_view thousandsSeparator = {});

/// Inserts 'separator' every three digits of the integer part of 'number' ("-1234567.5" -> "-1,234,567.5").
[[nodiscard]] std::string AddThousandsSeparator(std::string_view number, std::string_view separator);

}  // namespace hsize
