#pragma once

#include <optional>
#include <string>
#include <vector>

#include "paribind/Argument.h"

namespace paribind {

struct MethodRequest {
  std::string function;
  std::string cname;
  // Full parameter list, leading arguments included.
  const std::vector<Argument> *arguments = nullptr;
  // Arguments passed to the native call; a suffix of `arguments`.
  const std::vector<Argument> *callArguments = nullptr;
  const Return *ret = nullptr;
  std::string doc;
  std::optional<std::string> obsolete;
};

class MethodEmitter {
public:
  std::string emitDeclaration(const std::string &cname, const CallSignature &signature) const;
  std::string emitMethod(const MethodRequest &request) const;

  std::string genBanner(const std::string &sourceName) const;
  std::string instanceBanner(const std::string &sourceName) const;
  std::string declBanner(const std::string &sourceName) const;

private:
  std::string indentDoc(const std::string &doc) const;
};

} // namespace paribind
