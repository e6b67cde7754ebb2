#include "paribind/Eligibility.h"

#include <utility>

namespace paribind {
namespace {

bool isAsciiAlpha(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool isAsciiDigit(char c) {
  return c >= '0' && c <= '9';
}

} // namespace

std::set<std::string> defaultDenyList() {
  return {
      "O",           // O(p^e) needs special parser support
      "alias",       // not needed and difficult to document
      "listcreate",  // redundant and obsolete
      "allocatemem", // handled by the hand-written Pari class
      "global",      // invalid in Python
      "inline",
      "uninline",
      "local",
      "my",
  };
}

bool isValidFunctionName(std::string_view name) {
  if (name.empty() || !isAsciiAlpha(name[0])) {
    return false;
  }
  for (char c : name.substr(1)) {
    if (!isAsciiAlpha(c) && !isAsciiDigit(c) && c != '_') {
      return false;
    }
  }
  return true;
}

EligibilityFilter::EligibilityFilter(EligibilityRules rules) : rules_(std::move(rules)) {}

bool EligibilityFilter::accepts(const std::string &name,
                                const std::string &classTag,
                                const std::string &sectionTag) const {
  if (rules_.denyList.count(name) > 0) {
    return false;
  }
  if (!isValidFunctionName(name)) {
    return false;
  }
  // Other classes are internal, gp-only or gp2c-only.
  if (classTag != rules_.basicClass) {
    return false;
  }
  // if, return, break, ...
  if (sectionTag == rules_.controlSection) {
    return false;
  }
  return true;
}

} // namespace paribind
