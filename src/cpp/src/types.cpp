#include "ips/types.h"

namespace ips {

const char* error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::Parsing:  return "ParsingError";
    case ErrorKind::Patching: return "PatchingError";
    }
    return "Error";
}

IpsError::IpsError(ErrorKind kind, std::string description)
    : std::runtime_error(std::string(error_kind_name(kind)) + ": " + description),
      kind_(kind),
      description_(std::move(description)) {}

} // namespace ips
