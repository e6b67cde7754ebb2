#include "paribind/Eligibility.h"

#include <doctest/doctest.h>

#include <string>

namespace {
paribind::EligibilityFilter defaultFilter() {
  paribind::EligibilityRules rules;
  rules.denyList = paribind::defaultDenyList();
  return paribind::EligibilityFilter(rules);
}
} // namespace

TEST_SUITE_BEGIN("paribind.eligibility");

TEST_CASE("accepts basic functions") {
  const auto filter = defaultFilter();
  CHECK(filter.accepts("bnfinit", "basic", "number_fields"));
  CHECK(filter.accepts("ellmodulareqn", "basic", "elliptic_curves"));
}

TEST_CASE("rejects non-basic classes") {
  const auto filter = defaultFilter();
  CHECK_FALSE(filter.accepts("bnfinit", "hard", "number_fields"));
  CHECK_FALSE(filter.accepts("bnfinit", "gp", "number_fields"));
  CHECK_FALSE(filter.accepts("bnfinit", "unknown", "unknown"));
}

TEST_CASE("rejects denied names") {
  const auto filter = defaultFilter();
  for (const char *name : {"O", "alias", "listcreate", "allocatemem", "global", "inline", "uninline", "local", "my"}) {
    CAPTURE(name);
    CHECK_FALSE(filter.accepts(name, "basic", "programming/specific"));
  }
}

TEST_CASE("rejects control flow section") {
  const auto filter = defaultFilter();
  CHECK_FALSE(filter.accepts("break", "basic", "programming/control"));
  CHECK(filter.accepts("break", "basic", "programming/other"));
}

TEST_CASE("rejects names that are not identifiers") {
  const auto filter = defaultFilter();
  CHECK_FALSE(filter.accepts("_bnfinit", "basic", "number_fields"));
  CHECK_FALSE(filter.accepts("", "basic", "number_fields"));
  CHECK_FALSE(filter.accepts("2x", "basic", "number_fields"));
  CHECK_FALSE(filter.accepts("_+_", "basic", "operators"));
  CHECK_FALSE(filter.accepts("a-b", "basic", "operators"));
  CHECK(filter.accepts("Str_1", "basic", "conversions"));
}

TEST_CASE("custom deny list replaces the default") {
  paribind::EligibilityRules rules;
  rules.denyList = {"bnfinit"};
  paribind::EligibilityFilter filter(rules);
  CHECK_FALSE(filter.accepts("bnfinit", "basic", "number_fields"));
  CHECK(filter.accepts("alias", "basic", "programming/specific"));
}

TEST_CASE("arbitrary input is handled without throwing") {
  const auto filter = defaultFilter();
  const std::string weird = std::string("a\0b", 3) + "\xff\n\t";
  CHECK_NOTHROW(filter.accepts(weird, weird, weird));
  CHECK_FALSE(filter.accepts(weird, "basic", "x"));
  CHECK_NOTHROW(filter.accepts("f", std::string(4096, 'x'), ""));
}

TEST_CASE("validates function names") {
  CHECK(paribind::isValidFunctionName("x"));
  CHECK(paribind::isValidFunctionName("bnfinit"));
  CHECK_FALSE(paribind::isValidFunctionName("_x"));
  CHECK_FALSE(paribind::isValidFunctionName("x y"));
}

TEST_SUITE_END();
