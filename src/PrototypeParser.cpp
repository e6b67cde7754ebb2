#include "paribind/PrototypeParser.h"

#include <array>
#include <cctype>
#include <string_view>
#include <utility>

#include "paribind/PrototypeLexer.h"

namespace paribind {
namespace {

constexpr std::array<std::string_view, 35> kHostKeywords = {
    "False",  "None",    "True",   "and",    "as",     "assert",   "async",
    "await",  "break",   "class",  "continue", "def",  "del",      "elif",
    "else",   "except",  "finally", "for",   "from",   "global",   "if",
    "import", "in",      "is",     "lambda", "nonlocal", "not",    "or",
    "pass",   "raise",   "return", "try",    "while",  "with",     "yield",
};

bool isHostKeyword(std::string_view name) {
  for (const auto &keyword : kHostKeywords) {
    if (keyword == name) {
      return true;
    }
  }
  return false;
}

bool isIdentifierStart(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool isIdentifierBody(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool isIntegerLiteral(const std::string &text) {
  size_t start = 0;
  if (!text.empty() && text[0] == '-') {
    start = 1;
  }
  if (start >= text.size()) {
    return false;
  }
  for (size_t i = start; i < text.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      return false;
    }
  }
  return true;
}

bool isQuotedLiteral(const std::string &text) {
  return text.size() >= 2 && text.front() == '"' && text.back() == '"';
}

// Splits on commas that are not nested in brackets, parentheses or braces.
std::vector<std::string> splitTopLevel(const std::string &text) {
  std::vector<std::string> parts;
  int depth = 0;
  size_t start = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '(' || c == '[' || c == '{') {
      ++depth;
    } else if (c == ')' || c == ']' || c == '}') {
      --depth;
    } else if (c == ',' && depth == 0) {
      parts.push_back(text.substr(start, i - start));
      start = i + 1;
    }
  }
  parts.push_back(text.substr(start));
  return parts;
}

std::string codeName(const PrototypeToken &token) {
  return "'" + token.text + "'";
}

} // namespace

std::vector<std::string> helpArgumentNames(const std::string &help) {
  std::vector<std::string> names;
  size_t pos = 0;
  while (pos < help.size() && std::isspace(static_cast<unsigned char>(help[pos]))) {
    ++pos;
  }
  if (pos >= help.size() || !isIdentifierStart(help[pos])) {
    return names;
  }
  while (pos < help.size() && isIdentifierBody(help[pos])) {
    ++pos;
  }
  if (pos >= help.size() || help[pos] != '(') {
    return names;
  }
  size_t open = pos;
  int depth = 0;
  size_t close = std::string::npos;
  for (size_t i = open; i < help.size(); ++i) {
    if (help[i] == '(') {
      ++depth;
    } else if (help[i] == ')') {
      --depth;
      if (depth == 0) {
        close = i;
        break;
      }
    }
  }
  if (close == std::string::npos) {
    return names;
  }
  const std::string params = help.substr(open + 1, close - open - 1);
  for (const auto &part : splitTopLevel(params)) {
    size_t i = 0;
    while (i < part.size() && (part[i] == ' ' || part[i] == '{')) {
      ++i;
    }
    if (i < part.size() && part[i] == '&') {
      ++i;
    }
    if (i >= part.size() || !isIdentifierStart(part[i])) {
      continue;
    }
    size_t start = i;
    while (i < part.size() && isIdentifierBody(part[i])) {
      ++i;
    }
    names.push_back(part.substr(start, i - start));
  }
  return names;
}

PrototypeParser::PrototypeParser(std::vector<PrototypeToken> tokens, std::vector<std::string> helpNames)
    : tokens_(std::move(tokens)), helpNames_(std::move(helpNames)) {}

bool PrototypeParser::parse(CallSignature &out, std::string &error, const std::vector<Argument> &leadingArgs) {
  error_ = &error;
  nextName_ = 0;
  pendingDefault_.reset();
  pendingOptional_ = false;

  CallSignature signature;
  signature.arguments = leadingArgs;
  const size_t leadingCount = leadingArgs.size();
  for (size_t i = 0; i < leadingCount; ++i) {
    signature.arguments[i].index = i;
  }
  if (tokens_.empty() || tokens_.front().kind != PrototypeTokenKind::ReturnTypeCode) {
    return fail("prototype has no return type code");
  }
  if (!parseReturn(tokens_.front(), signature.ret)) {
    return false;
  }
  usedNames_ = {"ret", "self"};
  if (signature.ret.kind == Return::Kind::String) {
    usedNames_.insert("str");
  }
  for (const auto &arg : leadingArgs) {
    usedNames_.insert(arg.name);
  }

  bool seenOptional = false;
  for (size_t i = 1; i < tokens_.size(); ++i) {
    const PrototypeToken &token = tokens_[i];
    if (token.kind == PrototypeTokenKind::End) {
      break;
    }
    if (token.kind == PrototypeTokenKind::Unsupported) {
      return fail("unsupported prototype code " + codeName(token));
    }
    if (token.kind == PrototypeTokenKind::ReturnTypeCode) {
      return fail("unexpected return type code " + codeName(token));
    }
    if (token.kind == PrototypeTokenKind::OptionalMarker) {
      if (pendingOptional_) {
        return fail("optional marker without a type code");
      }
      pendingOptional_ = true;
      pendingDefault_ = token.text;
      continue;
    }
    if (token.kind == PrototypeTokenKind::VarargsMarker) {
      if (pendingOptional_) {
        return fail("rest marker cannot follow an optional marker");
      }
      if (!markRest(signature.arguments, leadingCount)) {
        return false;
      }
      break;
    }

    Argument arg;
    if (!makeArgument(token, arg)) {
      return false;
    }
    arg.index = signature.arguments.size();
    arg.position = arg.index - leadingCount + 1;
    if (pendingOptional_ && !applyDefault(token, arg)) {
      return false;
    }
    pendingOptional_ = false;
    pendingDefault_.reset();
    if (arg.kind != Argument::Kind::Precision) {
      if (arg.isOptional()) {
        seenOptional = true;
      } else if (seenOptional) {
        return fail("mandatory argument after an optional one at offset " + std::to_string(token.offset));
      }
    }
    assignName(arg, arg.position == 1);
    signature.arguments.push_back(std::move(arg));
  }
  if (pendingOptional_) {
    return fail("optional marker at end of prototype");
  }
  out = std::move(signature);
  return true;
}

bool PrototypeParser::parseReturn(const PrototypeToken &token, Return &out) {
  if (token.text.empty()) {
    out.kind = Return::Kind::Handle;
  } else if (token.text == "m") {
    out.kind = Return::Kind::SharedHandle;
  } else if (token.text == "i") {
    out.kind = Return::Kind::Int;
  } else if (token.text == "l") {
    out.kind = Return::Kind::Long;
  } else if (token.text == "u") {
    out.kind = Return::Kind::ULong;
  } else if (token.text == "v") {
    out.kind = Return::Kind::Void;
  } else {
    return fail("unsupported return type code " + codeName(token));
  }
  return true;
}

bool PrototypeParser::makeArgument(const PrototypeToken &token, Argument &out) {
  out = Argument{};
  switch (token.kind) {
  case PrototypeTokenKind::NativeValue:
    out.kind = Argument::Kind::NativeValue;
    return true;
  case PrototypeTokenKind::NativeSmallInt:
    out.kind = Argument::Kind::SmallInt;
    return true;
  case PrototypeTokenKind::NativeUnsignedInt:
    out.kind = Argument::Kind::UnsignedInt;
    return true;
  case PrototypeTokenKind::NativeCharString:
    out.kind = Argument::Kind::String;
    return true;
  case PrototypeTokenKind::VariableReference:
    out.kind = Argument::Kind::Variable;
    return true;
  case PrototypeTokenKind::PrecisionMarker:
    out.kind = Argument::Kind::Precision;
    if (token.text == "p") {
      out.precisionUnit = Argument::PrecisionUnit::Words;
      out.defaultValue = "0";
    } else if (token.text == "b") {
      out.precisionUnit = Argument::PrecisionUnit::Bits;
      out.defaultValue = "0";
    } else {
      out.precisionUnit = Argument::PrecisionUnit::Series;
      out.defaultValue = "-1";
    }
    return true;
  case PrototypeTokenKind::ReturnTypeCode:
  case PrototypeTokenKind::OptionalMarker:
  case PrototypeTokenKind::VarargsMarker:
  case PrototypeTokenKind::Unsupported:
  case PrototypeTokenKind::End:
    break;
  }
  return fail("unsupported prototype code " + codeName(token));
}

bool PrototypeParser::applyDefault(const PrototypeToken &token, Argument &arg) {
  const std::string value = pendingDefault_.value_or("");
  switch (arg.kind) {
  case Argument::Kind::NativeValue:
    if (value.empty()) {
      arg.defaultValue = "NULL";
      return true;
    }
    if (value == "0") {
      arg.defaultValue = "0";
      return true;
    }
    break;
  case Argument::Kind::String:
    if (value.empty()) {
      arg.defaultValue = "NULL";
      return true;
    }
    if (isQuotedLiteral(value)) {
      arg.defaultValue = value;
      return true;
    }
    break;
  case Argument::Kind::Variable:
    if (value.empty()) {
      arg.defaultValue = "-1";
      return true;
    }
    break;
  case Argument::Kind::SmallInt:
  case Argument::Kind::UnsignedInt:
    if (value.empty()) {
      arg.defaultValue = "0";
      return true;
    }
    if (isIntegerLiteral(value) && (arg.kind == Argument::Kind::SmallInt || value[0] != '-')) {
      arg.defaultValue = value;
      return true;
    }
    break;
  case Argument::Kind::Precision:
    if (value.empty()) {
      return true;
    }
    break;
  case Argument::Kind::InstanceContext:
    break;
  }
  return fail("unsupported default '" + value + "' for code " + codeName(token));
}

bool PrototypeParser::markRest(std::vector<Argument> &args, size_t leadingCount) {
  if (args.size() <= leadingCount) {
    return fail("rest marker without a preceding argument");
  }
  Argument &last = args.back();
  if (last.kind != Argument::Kind::String || last.isOptional()) {
    return fail("rest marker is only supported after a mandatory string code");
  }
  last.isRest = true;
  return true;
}

void PrototypeParser::assignName(Argument &arg, bool firstUserArgument) {
  if (arg.kind == Argument::Kind::Precision) {
    arg.name = uniqueName(arg.precisionUnit == Argument::PrecisionUnit::Series ? "serprec" : "precision");
    return;
  }
  if (nextName_ < helpNames_.size()) {
    std::string name = helpNames_[nextName_++];
    if (isHostKeyword(name)) {
      name += "_";
    }
    arg.name = uniqueName(std::move(name));
    return;
  }
  arg.undocumented = true;
  if (firstUserArgument && arg.kind == Argument::Kind::NativeValue) {
    arg.name = uniqueName("x");
  } else {
    arg.name = uniqueName("arg" + std::to_string(arg.position));
  }
}

// Appends underscores until the name collides with no other parameter and no
// temporary of the method body ("_ret", "_str").
std::string PrototypeParser::uniqueName(std::string name) {
  while (usedNames_.count(name) > 0) {
    name += "_";
  }
  usedNames_.insert(name);
  return name;
}

bool PrototypeParser::fail(const std::string &message) {
  if (error_) {
    *error_ = message;
  }
  return false;
}

bool parsePrototype(const std::string &prototype,
                    const std::string &help,
                    CallSignature &out,
                    std::string &error,
                    const std::vector<Argument> &leadingArgs) {
  PrototypeLexer lexer(prototype);
  PrototypeParser parser(lexer.tokenize(), helpArgumentNames(help));
  return parser.parse(out, error, leadingArgs);
}

} // namespace paribind
