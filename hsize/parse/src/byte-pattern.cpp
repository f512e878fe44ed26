#include "hsize/byte-pattern.hpp"

#include <cstddef>
#include <optional>
#include <regex>
#include <span>
#include <string>
#include <string_view>

#include "hsize/cctype.hpp"
#include "hsize/string-equal-ignore-case.hpp"
#include "hsize/string-trim.hpp"
#include "hsize/toupperlower.hpp"

namespace hsize {

namespace {

constexpr auto kNoMatch = std::string_view::npos;

std::regex Compile(std::string_view pattern) {
  return std::regex(pattern.begin(), pattern.end(), std::regex::ECMAScript | std::regex::icase);
}

constexpr bool IsSign(char ch) { return ch == '+' || ch == '-'; }

constexpr bool IsUnitPrefix(char ch) { return std::string_view("kmgtpezy").find(tolower(ch)) != kNoMatch; }

std::size_t SkipDigits(std::string_view str, std::size_t pos) {
  while (pos < str.size() && isdigit(str[pos])) {
    ++pos;
  }
  return pos;
}

std::size_t SkipSpaces(std::string_view str, std::size_t pos) {
  while (pos < str.size() && isspace(str[pos])) {
    ++pos;
  }
  return pos;
}

bool HasAt(std::string_view str, std::size_t pos, std::string_view word) {
  return str.size() - pos >= word.size() && CaseInsensitiveEqual(str.substr(pos, word.size()), word);
}

// End of [+-]?\d+(?:[.,]\d+)?(?:e[+-]?\d+)? starting at 'pos', or kNoMatch.
// Greedy without backtracking: a unit never starts with a digit, a separator or an exponent with digits.
std::size_t ScanNumber(std::string_view str, std::size_t pos) {
  if (pos < str.size() && IsSign(str[pos])) {
    ++pos;
  }
  const std::size_t integralEnd = SkipDigits(str, pos);
  if (integralEnd == pos) {
    return kNoMatch;
  }
  pos = integralEnd;
  if (pos < str.size() && (str[pos] == '.' || str[pos] == ',')) {
    const std::size_t fractionEnd = SkipDigits(str, pos + 1U);
    if (fractionEnd != pos + 1U) {
      pos = fractionEnd;
    }
  }
  if (pos < str.size() && tolower(str[pos]) == 'e') {
    std::size_t exponentStart = pos + 1U;
    if (exponentStart < str.size() && IsSign(str[exponentStart])) {
      ++exponentStart;
    }
    const std::size_t exponentEnd = SkipDigits(str, exponentStart);
    if (exponentEnd != exponentStart) {
      pos = exponentEnd;
    }
  }
  return pos;
}

// End of b(?:ytes?|its?)?|o(?:ctets?)? starting at 'pos', or kNoMatch.
std::size_t ScanBaseUnit(std::string_view str, std::size_t pos) {
  if (pos >= str.size()) {
    return kNoMatch;
  }
  static constexpr std::string_view kByteSuffixes[] = {"ytes", "yte", "its", "it"};
  static constexpr std::string_view kOctetSuffixes[] = {"ctets", "ctet"};

  std::span<const std::string_view> suffixes;
  switch (tolower(str[pos])) {
    case 'b':
      suffixes = kByteSuffixes;
      break;
    case 'o':
      suffixes = kOctetSuffixes;
      break;
    default:
      return kNoMatch;
  }
  ++pos;
  for (std::string_view suffix : suffixes) {
    if (HasAt(str, pos, suffix)) {
      return pos + suffix.size();
    }
  }
  return pos;
}

// End of (?:[kmgtpezy]i?)?<base unit> starting at 'pos', or kNoMatch.
std::size_t ScanUnit(std::string_view str, std::size_t pos) {
  if (pos < str.size() && IsUnitPrefix(str[pos])) {
    const std::size_t afterPrefix = pos + 1U;
    if (afterPrefix < str.size() && tolower(str[afterPrefix]) == 'i') {
      const std::size_t end = ScanBaseUnit(str, afterPrefix + 1U);
      if (end != kNoMatch) {
        return end;
      }
    }
    const std::size_t end = ScanBaseUnit(str, afterPrefix);
    if (end != kNoMatch) {
      return end;
    }
  }
  return ScanBaseUnit(str, pos);
}

// Number then spaces then a required unit, all starting at 'pos'.
std::optional<ByteMatch> MatchAt(std::string_view str, std::size_t pos) {
  const std::size_t numberEnd = ScanNumber(str, pos);
  if (numberEnd == kNoMatch) {
    return std::nullopt;
  }
  const std::size_t unitStart = SkipSpaces(str, numberEnd);
  const std::size_t unitEnd = ScanUnit(str, unitStart);
  if (unitEnd == kNoMatch) {
    return std::nullopt;
  }
  return ByteMatch{pos, unitEnd, str.substr(pos, numberEnd - pos), str.substr(unitStart, unitEnd - unitStart)};
}

}  // namespace

const std::regex &BytePattern() {
  static const std::regex kRegex = Compile(kBytePattern);
  return kRegex;
}

const std::regex &GlobalBytePattern() {
  static const std::regex kRegex = Compile(kGlobalBytePattern);
  return kRegex;
}

const std::regex &CustomBytePattern() {
  static const std::regex kRegex = Compile(kCustomBytePattern);
  return kRegex;
}

std::optional<ByteMatch> MatchByteString(std::string_view str) {
  const std::size_t numberEnd = ScanNumber(str, 0);
  if (numberEnd == kNoMatch) {
    return std::nullopt;
  }
  const std::size_t unitStart = SkipSpaces(str, numberEnd);
  ByteMatch ret{0, str.size(), str.substr(0, numberEnd), {}};
  if (unitStart == str.size()) {
    return ret;
  }
  if (ScanUnit(str, unitStart) != str.size()) {
    return std::nullopt;
  }
  ret.unit = str.substr(unitStart);
  return ret;
}

std::optional<ByteMatch> MatchCustomByteString(std::string_view str) {
  const std::size_t numberEnd = ScanNumber(str, 0);
  if (numberEnd == kNoMatch) {
    return std::nullopt;
  }
  const std::string_view unit = str.substr(SkipSpaces(str, numberEnd));
  // '.' does not match line terminators
  if (unit.find_first_of("\r\n") != kNoMatch) {
    return std::nullopt;
  }
  return ByteMatch{0, str.size(), str.substr(0, numberEnd), unit};
}

std::optional<ByteMatch> SearchByteString(std::string_view text, std::size_t from) {
  std::size_t pos = from;
  while (pos < text.size()) {
    const bool signedStart = IsSign(text[pos]) && pos + 1U < text.size() && isdigit(text[pos + 1U]);
    if (!signedStart && !isdigit(text[pos])) {
      ++pos;
      continue;
    }
    auto match = MatchAt(text, pos);
    if (match) {
      return match;
    }
    // every later start in this digit run reaches the same characters after the run, and fails the same way
    pos = SkipDigits(text, signedStart ? pos + 1U : pos);
  }
  return std::nullopt;
}

std::string ReplaceNoBreakSpaces(std::string_view str, std::string_view replacement) {
  std::string ret;
  ret.reserve(str.size());
  for (std::size_t pos = 0; pos < str.size();) {
    if (str.substr(pos).starts_with(kNbsp)) {
      ret.append(replacement);
      pos += kNbsp.size();
    } else {
      ret.push_back(str[pos]);
      ++pos;
    }
  }
  return ret;
}

}  // namespace hsize
