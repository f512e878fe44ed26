#pragma once

#include <string>

#include "hsize/bigint.hpp"
#include "hsize/format-result.hpp"
#include "hsize/format-spec.hpp"
#include "hsize/number-format-cache.hpp"

namespace hsize {

/// Turns byte counts into human readable sizes.
/// A Formatter holds a validated default FormatSpec; per call FormatOptions are merged into it.
/// All operations throw invalid_argument for non finite input and invalid options.
class Formatter {
 public:
  Formatter() noexcept = default;

  /// 'cache' is used for locale rendering, defaults to NumberFormatCache::Default(). It must outlive this object.
  explicit Formatter(FormatSpec spec, NumberFormatCache *cache = nullptr);

  [[nodiscard]] const FormatSpec &spec() const noexcept { return _spec; }

  /// Result shaped by the 'output' field of the merged spec.
  [[nodiscard]] FormatResult format(double bytes, const FormatOptions &overrides = {}) const;
  [[nodiscard]] FormatResult format(const BigInt &bytes, const FormatOptions &overrides = {}) const;

  [[nodiscard]] std::string formatString(double bytes, const FormatOptions &overrides = {}) const;
  [[nodiscard]] std::string formatString(const BigInt &bytes, const FormatOptions &overrides = {}) const;

  [[nodiscard]] SizeParts formatParts(double bytes, const FormatOptions &overrides = {}) const;
  [[nodiscard]] SizeObject formatObject(double bytes, const FormatOptions &overrides = {}) const;
  [[nodiscard]] int formatExponent(double bytes, const FormatOptions &overrides = {}) const;

  /// Same Formatter with 'overrides' merged into its default spec.
  [[nodiscard]] Formatter with(const FormatOptions &overrides) const;

 private:
  [[nodiscard]] FormatSpec resolve(const FormatOptions &overrides) const;
  [[nodiscard]] NumberFormatCache &cache() const;

  FormatSpec _spec;
  NumberFormatCache *_cache{nullptr};
};

/// Free functions using a default Formatter.
[[nodiscard]] std::string Format(double bytes, const FormatSpec &spec = {});
[[nodiscard]] std::string Format(const BigInt &bytes, const FormatSpec &spec = {});

/// Result shaped by spec.output.
[[nodiscard]] FormatResult FormatAs(double bytes, const FormatSpec &spec);
[[nodiscard]] FormatResult FormatAs(const BigInt &bytes, const FormatSpec &spec);

[[nodiscard]] SizeParts FormatParts(double bytes, const FormatSpec &spec = {});
[[nodiscard]] SizeObject FormatObject(double bytes, const FormatSpec &spec = {});
[[nodiscard]] int FormatExponent(double bytes, const FormatSpec &spec = {});

}  // namespace hsize
