#include "paribind/PrototypeLexer.h"

namespace paribind {

PrototypeLexer::PrototypeLexer(const std::string &prototype) : prototype_(prototype) {}

std::vector<PrototypeToken> PrototypeLexer::tokenize() {
  std::vector<PrototypeToken> tokens;
  pos_ = 0;
  tokens.push_back(readReturnCode());
  while (pos_ < prototype_.size()) {
    char c = prototype_[pos_];
    if (c == 'D') {
      if (!readOptional(tokens)) {
        break;
      }
      continue;
    }
    if (c == '*') {
      tokens.push_back({PrototypeTokenKind::VarargsMarker, prototype_.substr(pos_ + 1), pos_});
      pos_ = prototype_.size();
      break;
    }
    PrototypeToken token = readCode();
    bool stop = token.kind == PrototypeTokenKind::Unsupported;
    tokens.push_back(std::move(token));
    if (stop) {
      break;
    }
  }
  tokens.push_back({PrototypeTokenKind::End, "", prototype_.size()});
  return tokens;
}

bool PrototypeLexer::isImplicitDefaultCode(char c) const {
  switch (c) {
  case 'G':
  case 'W':
  case '&':
  case 'E':
  case 'I':
  case 'J':
  case 'V':
  case 'n':
  case 'r':
  case 's':
  case 'L':
  case 'U':
  case 'p':
  case 'b':
  case 'P':
    return true;
  default:
    return false;
  }
}

PrototypeToken PrototypeLexer::readReturnCode() {
  if (!prototype_.empty()) {
    char c = prototype_[0];
    if (c == 'i' || c == 'l' || c == 'u' || c == 'v' || c == 'm') {
      pos_ = 1;
      return {PrototypeTokenKind::ReturnTypeCode, std::string(1, c), 0};
    }
  }
  return {PrototypeTokenKind::ReturnTypeCode, "", 0};
}

PrototypeToken PrototypeLexer::readCode() {
  size_t start = pos_;
  char c = prototype_[pos_++];
  switch (c) {
  case 'G':
  case 'W':
    return {PrototypeTokenKind::NativeValue, std::string(1, c), start};
  case 'L':
    return {PrototypeTokenKind::NativeSmallInt, "L", start};
  case 'U':
    return {PrototypeTokenKind::NativeUnsignedInt, "U", start};
  case 's':
  case 'r':
    return {PrototypeTokenKind::NativeCharString, std::string(1, c), start};
  case 'n':
    return {PrototypeTokenKind::VariableReference, "n", start};
  case 'p':
  case 'b':
  case 'P':
    return {PrototypeTokenKind::PrecisionMarker, std::string(1, c), start};
  default:
    return unsupported(std::string(1, c), start);
  }
}

// Either "D<code>" (implicit default) or "D<expr>,<code>," where <expr> may
// contain commas nested in brackets, parentheses, braces or quotes.
bool PrototypeLexer::readOptional(std::vector<PrototypeToken> &tokens) {
  size_t start = pos_++;
  if (pos_ >= prototype_.size()) {
    tokens.push_back(unsupported("D", start));
    return false;
  }
  if (isImplicitDefaultCode(prototype_[pos_])) {
    tokens.push_back({PrototypeTokenKind::OptionalMarker, "", start});
    return true;
  }
  size_t exprStart = pos_;
  int depth = 0;
  char quote = 0;
  while (pos_ < prototype_.size()) {
    char c = prototype_[pos_];
    if (quote != 0) {
      if (c == '\\' && pos_ + 1 < prototype_.size()) {
        pos_ += 2;
        continue;
      }
      if (c == quote) {
        quote = 0;
      }
    } else if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == '(' || c == '[' || c == '{') {
      ++depth;
    } else if (c == ')' || c == ']' || c == '}') {
      --depth;
    } else if (c == ',' && depth == 0) {
      break;
    }
    ++pos_;
  }
  if (pos_ >= prototype_.size() || quote != 0 || depth != 0) {
    tokens.push_back(unsupported(prototype_.substr(start), start));
    return false;
  }
  tokens.push_back({PrototypeTokenKind::OptionalMarker, prototype_.substr(exprStart, pos_ - exprStart), start});
  ++pos_;
  if (pos_ >= prototype_.size()) {
    tokens.push_back(unsupported(prototype_.substr(start), start));
    return false;
  }
  PrototypeToken code = readCode();
  if (code.kind == PrototypeTokenKind::Unsupported) {
    tokens.push_back(std::move(code));
    return false;
  }
  tokens.push_back(std::move(code));
  if (pos_ >= prototype_.size() || prototype_[pos_] != ',') {
    tokens.push_back(unsupported(prototype_.substr(start, pos_ - start), start));
    return false;
  }
  ++pos_;
  return true;
}

PrototypeToken PrototypeLexer::unsupported(const std::string &text, size_t offset) const {
  return {PrototypeTokenKind::Unsupported, text, offset};
}

} // namespace paribind
