#pragma once

#include <set>
#include <string>
#include <string_view>

namespace paribind {

struct EligibilityRules {
  std::set<std::string> denyList;
  std::string basicClass = "basic";
  std::string controlSection = "programming/control";
};

std::set<std::string> defaultDenyList();
bool isValidFunctionName(std::string_view name);

class EligibilityFilter {
public:
  explicit EligibilityFilter(EligibilityRules rules);

  bool accepts(const std::string &name, const std::string &classTag, const std::string &sectionTag) const;

private:
  EligibilityRules rules_;
};

} // namespace paribind
