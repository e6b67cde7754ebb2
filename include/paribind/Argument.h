#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace paribind {

struct Argument {
  enum class Kind { NativeValue, SmallInt, UnsignedInt, String, Variable, InstanceContext, Precision };
  enum class PrecisionUnit { Words, Bits, Series };

  Kind kind = Kind::NativeValue;
  PrecisionUnit precisionUnit = PrecisionUnit::Words;
  std::string name;
  // Native-level default ("NULL", "0", "-1", an integer or string literal).
  std::optional<std::string> defaultValue;
  bool isRest = false;
  bool undocumented = false;
  // Index in the full signature, leading arguments included.
  size_t index = 0;
  // 1-based position among the arguments a caller actually passes.
  size_t position = 0;

  bool isOptional() const { return defaultValue.has_value(); }
  bool isHostObject() const;
  bool needsConversion() const;
  std::string tempName() const;

  std::string declaredType() const;
  std::string parameterFragment() const;
  std::string conversionStatements() const;
  std::string callFragment() const;
  std::string deprecationFragment(const std::string &functionName) const;
  std::string describe() const;
};

Argument makeInstanceArgument();

struct Return {
  enum class Kind { Handle, SharedHandle, Int, Long, ULong, Void, String };

  Kind kind = Kind::Handle;

  std::string declaredType() const;
  std::string assignFragment(const std::string &callExpr) const;
  std::string returnStatement() const;
};

struct CallSignature {
  std::vector<Argument> arguments;
  Return ret;
};

std::string describeSignature(const CallSignature &signature);

} // namespace paribind
