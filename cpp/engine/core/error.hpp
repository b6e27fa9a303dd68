#pragma once

// Internal invariant checks for the flowsheet and evaluation engine.
//
// User-facing failures (bad settings, infeasible streams, non-convergence)
// use the taxonomy in errors.hpp. PROCSIM_ENSURE guards programming errors
// such as bad ids, mismatched vector shapes and element-kind mixups, and
// raises procsim::Error, which is still a ProcsimError so callers that
// catch the base see both.

#include "engine/core/errors.hpp"

#include <string>
#include <utility>

namespace procsim {

enum class ErrorCode : int {
  kInvalidArgument = 1,
  kOutOfRange      = 2,
  kInvariant       = 3,
  kTopology        = 4,  // wrong element kind or broken unit/stream wiring
  kInternal        = 5,
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::kInvalidArgument: return "invalid-argument";
    case ErrorCode::kOutOfRange:      return "out-of-range";
    case ErrorCode::kInvariant:       return "invariant";
    case ErrorCode::kTopology:        return "topology";
    case ErrorCode::kInternal:        return "internal";
  }
  return "unknown";
}

// Where a check fired.
struct SourceSite {
  const char* file = "";
  int line = 0;
  const char* function = "";
};

class Error final : public ProcsimError {
 public:
  Error(ErrorCode code, std::string message, SourceSite site)
      : ProcsimError(compose(code, message, site)),
        code_(code),
        message_(std::move(message)),
        site_(site) {}

  ErrorCode code() const noexcept { return code_; }
  const std::string& message() const noexcept { return message_; }
  const SourceSite& site() const noexcept { return site_; }

 private:
  // "procsim[out-of-range]: Flowsheet: unknown unit id (flowsheet.cpp:26 unit)"
  static std::string compose(ErrorCode code, const std::string& msg, const SourceSite& site) {
    std::string out = std::string("procsim[") + to_string(code) + "]: " + msg;
    if (site.file != nullptr && *site.file != '\0') {
      std::string file = site.file;
      const auto slash = file.find_last_of("/\\");
      if (slash != std::string::npos) file.erase(0, slash + 1);
      out += " (" + file + ":" + std::to_string(site.line);
      if (site.function != nullptr && *site.function != '\0') {
        out += std::string(" ") + site.function;
      }
      out += ")";
    }
    return out;
  }

  ErrorCode code_;
  std::string message_;
  SourceSite site_;
};

[[noreturn]] inline void throw_error(ErrorCode code, std::string message, SourceSite site) {
  throw Error(code, std::move(message), site);
}

}  // namespace procsim

#define PROCSIM_SOURCE_SITE ::procsim::SourceSite{__FILE__, __LINE__, __func__}

#define PROCSIM_THROW(CODE, MSG) ::procsim::throw_error((CODE), (MSG), PROCSIM_SOURCE_SITE)

// MSG is only evaluated when EXPR is false, so string concatenation in the
// message costs nothing on the hot path of a recycle loop.
#define PROCSIM_ENSURE(EXPR, CODE, MSG)                                  \
  do {                                                                   \
    if (!(EXPR)) ::procsim::throw_error((CODE), (MSG), PROCSIM_SOURCE_SITE); \
  } while (0)
