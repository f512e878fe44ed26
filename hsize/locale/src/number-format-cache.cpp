#include "hsize/number-format-cache.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include "hsize/invalid_argument_exception.hpp"
#include "hsize/locale-data.hpp"
#include "hsize/locale-number-format.hpp"
#include "hsize/log.hpp"

namespace hsize {

NumberFormatCache::NumberFormatCache(std::size_t capacity) : _capacity(capacity) {
  if (_capacity == 0) {
    throw invalid_argument("NumberFormatCache capacity must be positive");
  }
}

std::shared_ptr<const LocaleNumberFormat> NumberFormatCache::get(std::string_view locale,
                                                                 const NumberFormatOptions &options) {
  options.validate();

  std::string key(locale);
  key.push_back('|');
  key.append(options.key());

  {
    std::lock_guard<std::mutex> lock(_mutex);
    const auto it = _index.find(key);
    if (it != _index.end()) {
      _entries.splice(_entries.begin(), _entries, it->second);
      return it->second->second;
    }
  }

  const LocaleData *localeData = FindLocale(locale);
  if (localeData == nullptr) {
    log::debug("Unknown locale '{}'", locale);
    return nullptr;
  }

  // built outside of the lock, a concurrent miss on the same key builds an equivalent format
  auto format = std::make_shared<const LocaleNumberFormat>(*localeData, options);

  std::lock_guard<std::mutex> lock(_mutex);
  const auto it = _index.find(key);
  if (it != _index.end()) {
    _entries.splice(_entries.begin(), _entries, it->second);
    return it->second->second;
  }
  _entries.emplace_front(std::move(key), format);
  _index.emplace(_entries.front().first, _entries.begin());
  while (_entries.size() > _capacity) {
    log::trace("Evicting number format '{}'", _entries.back().first);
    _index.erase(_entries.back().first);
    _entries.pop_back();
  }
  return format;
}

void NumberFormatCache::clear() {
  std::lock_guard<std::mutex> lock(_mutex);
  _index.clear();
  _entries.clear();
}

std::size_t NumberFormatCache::size() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _entries.size();
}

NumberFormatCache &NumberFormatCache::Default() {
  static NumberFormatCache gCache;
  return gCache;
}

}  // namespace hsize
