#pragma once

#include <cstddef>
#include <string>

namespace paribind {

enum class PrototypeTokenKind {
  ReturnTypeCode,
  NativeValue,
  NativeSmallInt,
  NativeUnsignedInt,
  NativeCharString,
  VariableReference,
  OptionalMarker,
  VarargsMarker,
  PrecisionMarker,
  Unsupported,
  End
};

struct PrototypeToken {
  PrototypeTokenKind kind = PrototypeTokenKind::End;
  // Type code for argument tokens, the default expression for OptionalMarker
  // (empty for an implicit default), the remaining text for VarargsMarker.
  std::string text;
  size_t offset = 0;
};

} // namespace paribind
