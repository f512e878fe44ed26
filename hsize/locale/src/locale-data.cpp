#include "hsize/locale-data.hpp"

#include <cstddef>
#include <span>
#include <string_view>

#include "hsize/toupperlower.hpp"

namespace hsize {

namespace {

constexpr std::string_view kNoBreakSpace = "\xC2\xA0";
constexpr std::string_view kNarrowNoBreakSpace = "\xE2\x80\xAF";
constexpr std::string_view kRightSingleQuotationMark = "\xE2\x80\x99";

// Data from CLDR. The first locale of a language is its default.
constexpr LocaleData kLocales[] = {
    {"en-US", ".", ",", 3, 3, 1},
    {"en-GB", ".", ",", 3, 3, 1},
    {"en-IN", ".", ",", 3, 2, 1},
    {"de-DE", ",", ".", 3, 3, 1},
    {"de-CH", ".", kRightSingleQuotationMark, 3, 3, 1},
    {"fr-FR", ",", kNarrowNoBreakSpace, 3, 3, 1},
    {"es-ES", ",", ".", 3, 3, 2},
    {"it-IT", ",", ".", 3, 3, 1},
    {"pt-BR", ",", ".", 3, 3, 1},
    {"nl-NL", ",", ".", 3, 3, 1},
    {"ru-RU", ",", kNoBreakSpace, 3, 3, 1},
    {"pl-PL", ",", kNoBreakSpace, 3, 3, 2},
    {"sv-SE", ",", kNoBreakSpace, 3, 3, 1},
    {"ja-JP", ".", ",", 3, 3, 1},
    {"zh-CN", ".", ",", 3, 3, 1},
};

constexpr char NormalizeTagChar(char ch) { return ch == '_' ? '-' : tolower(ch); }

constexpr bool TagEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t pos = 0; pos < lhs.size(); ++pos) {
    if (NormalizeTagChar(lhs[pos]) != NormalizeTagChar(rhs[pos])) {
      return false;
    }
  }
  return true;
}

constexpr std::string_view LanguageOf(std::string_view tag) { return tag.substr(0, tag.find_first_of("-_")); }

}  // namespace

std::span<const LocaleData> BuiltinLocales() noexcept { return kLocales; }

const LocaleData *FindLocale(std::string_view tag) noexcept {
  for (const LocaleData &locale : kLocales) {
    if (TagEqual(locale.tag, tag)) {
      return &locale;
    }
  }
  const std::string_view language = LanguageOf(tag);
  if (language.empty()) {
    return nullptr;
  }
  for (const LocaleData &locale : kLocales) {
    if (TagEqual(LanguageOf(locale.tag), language)) {
      return &locale;
    }
  }
  return nullptr;
}

}  // namespace hsize
