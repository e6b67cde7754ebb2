#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "paribind/Argument.h"
#include "paribind/PrototypeToken.h"

namespace paribind {

class PrototypeParser {
public:
  PrototypeParser(std::vector<PrototypeToken> tokens, std::vector<std::string> helpNames);

  // Returns false when the prototype uses a code the argument model cannot translate.
  bool parse(CallSignature &out, std::string &error, const std::vector<Argument> &leadingArgs = {});

private:
  bool parseReturn(const PrototypeToken &token, Return &out);
  bool makeArgument(const PrototypeToken &token, Argument &out);
  bool applyDefault(const PrototypeToken &token, Argument &arg);
  bool markRest(std::vector<Argument> &args, size_t leadingCount);
  void assignName(Argument &arg, bool firstUserArgument);
  std::string uniqueName(std::string name);
  bool fail(const std::string &message);

  std::vector<PrototypeToken> tokens_;
  std::vector<std::string> helpNames_;
  size_t nextName_ = 0;
  // Parameter names taken so far, plus names the emitted method body reserves.
  std::set<std::string> usedNames_;
  std::optional<std::string> pendingDefault_;
  bool pendingOptional_ = false;
  std::string *error_ = nullptr;
};

// Parameter names declared by a help string such as "bnfinit(P,{flag=0},{tech=[]}): ...".
std::vector<std::string> helpArgumentNames(const std::string &help);

bool parsePrototype(const std::string &prototype,
                    const std::string &help,
                    CallSignature &out,
                    std::string &error,
                    const std::vector<Argument> &leadingArgs = {});

} // namespace paribind
