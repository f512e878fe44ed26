#pragma once

#include <string_view>

#include "hsize/bigint.hpp"
#include "hsize/number-format-cache.hpp"
#include "hsize/parse-spec.hpp"

namespace hsize {

/// Reads byte counts from size strings ("1.5 GB", "100 MiB", "12 kbits").
///
/// Invalid input follows the 'strict' policy of the merged spec: NaN is returned in non strict mode,
/// hsize::invalid_argument is thrown in strict mode. This applies to empty strings, strings that are not a size,
/// unknown custom units and results that do not fit in a double ("1e309").
/// Big integers beyond 2^53 - 1 are narrowed with a warning, or rejected with hsize::range_error in strict mode.
class Parser {
 public:
  Parser() noexcept = default;

  /// 'cache' is used for locale aware parsing, defaults to NumberFormatCache::Default(). It must outlive this object.
  explicit Parser(ParseSpec spec, NumberFormatCache *cache = nullptr);

  [[nodiscard]] const ParseSpec &spec() const noexcept { return _spec; }

  [[nodiscard]] double parse(std::string_view input, const ParseOptions &overrides = {}) const;

  /// Finite numbers are returned as is.
  [[nodiscard]] double parseNumber(double input, const ParseOptions &overrides = {}) const;

  [[nodiscard]] double parseBigInt(const BigInt &input, const ParseOptions &overrides = {}) const;

  /// Same Parser with 'overrides' merged into its default spec.
  [[nodiscard]] Parser with(const ParseOptions &overrides) const;

 private:
  [[nodiscard]] NumberFormatCache &cache() const;

  ParseSpec _spec;
  NumberFormatCache *_cache{nullptr};
};

[[nodiscard]] double Parse(std::string_view input, const ParseSpec &spec = {});

[[nodiscard]] double ParseNumber(double input, const ParseSpec &spec = {});

[[nodiscard]] double ParseBigInt(const BigInt &input, const ParseSpec &spec = {});

}  // namespace hsize
