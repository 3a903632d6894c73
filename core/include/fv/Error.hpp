#pragma once
#include <string>

namespace fv {

// Error codes reported through Error::code.
inline constexpr const char* kErrShapeMismatch     = "SHAPE_MISMATCH";
inline constexpr const char* kErrIndexOutOfRange   = "INDEX_OUT_OF_RANGE";
inline constexpr const char* kErrContextInitFailed = "CONTEXT_INIT_FAILED";
inline constexpr const char* kErrRendererInit      = "RENDERER_INIT_FAILED";

struct Error {
  std::string code;     // one of the kErr* constants
  std::string message;  // human text
};

} // namespace fv
