#include "util/result.hpp"

namespace updsrv {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:              return "none";
        case ErrorKind::NotFound:          return "not-found";
        case ErrorKind::InvalidInput:      return "invalid-input";
        case ErrorKind::CorruptAsset:      return "corrupt-asset";
        case ErrorKind::DependencyCycle:   return "dependency-cycle";
        case ErrorKind::SourceMissing:     return "source-missing";
        case ErrorKind::IntegrityMismatch: return "integrity-mismatch";
        case ErrorKind::PermissionDenied:  return "permission-denied";
        case ErrorKind::Io:                return "io";
        case ErrorKind::Cancelled:         return "cancelled";
    }
    return "unknown";
}

} // namespace updsrv
