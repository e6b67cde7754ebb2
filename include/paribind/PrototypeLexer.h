#pragma once

#include <string>
#include <vector>

#include "paribind/PrototypeToken.h"

namespace paribind {

class PrototypeLexer {
public:
  explicit PrototypeLexer(const std::string &prototype);

  // The first token is always ReturnTypeCode and the last is always End.
  std::vector<PrototypeToken> tokenize();

private:
  bool isImplicitDefaultCode(char c) const;
  PrototypeToken readReturnCode();
  PrototypeToken readCode();
  bool readOptional(std::vector<PrototypeToken> &tokens);
  PrototypeToken unsupported(const std::string &text, size_t offset) const;

  const std::string &prototype_;
  size_t pos_ = 0;
};

} // namespace paribind
