#pragma once

#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "hsize/locale-number-format.hpp"

namespace hsize {

/// Bounded least recently used cache of locale number formats, keyed by "locale|options".
/// Thread safe. Formats are immutable and shared, so entries can be evicted while still in use.
class NumberFormatCache {
 public:
  static constexpr std::size_t kDefaultCapacity = 100;

  explicit NumberFormatCache(std::size_t capacity = kDefaultCapacity);

  NumberFormatCache(const NumberFormatCache &) = delete;
  NumberFormatCache &operator=(const NumberFormatCache &) = delete;

  /// Returns the format for 'locale' (see FindLocale) and 'options', creating it if needed.
  /// Returns nullptr if the locale is unknown. Throws invalid_argument if options are invalid.
  std::shared_ptr<const LocaleNumberFormat> get(std::string_view locale, const NumberFormatOptions &options);

  void clear();

  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] std::size_t capacity() const noexcept { return _capacity; }

  /// Process wide instance, used by formatters and parsers that were not given one.
  static NumberFormatCache &Default();

 private:
  using Entry = std::pair<std::string, std::shared_ptr<const LocaleNumberFormat>>;
  using EntryList = std::list<Entry>;

  mutable std::mutex _mutex;
  EntryList _entries;  // most recently used first
  std::unordered_map<std::string_view, EntryList::iterator> _index;
  std::size_t _capacity;
};

}  // namespace hsize
