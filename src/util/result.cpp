#include "bpm/util/result.hpp"

namespace bpm {

const char* ToString(Errc code) {
    switch (code) {
        case Errc::None:               return "None";
        case Errc::InvalidArgument:    return "InvalidArgument";
        case Errc::ConfigInvalid:      return "ConfigInvalid";
        case Errc::ManifestUnreadable: return "ManifestUnreadable";
        case Errc::ManifestMalformed:  return "ManifestMalformed";
        case Errc::PackageNotFound:    return "PackageNotFound";
        case Errc::VersionNotFound:    return "VersionNotFound";
        case Errc::CycleDetected:      return "CycleDetected";
        case Errc::StateCorrupt:       return "StateCorrupt";
        case Errc::StateWriteFailed:   return "StateWriteFailed";
        case Errc::LockFailed:         return "LockFailed";
        case Errc::BinaryCopyFailed:   return "BinaryCopyFailed";
        case Errc::BinaryDeleteFailed: return "BinaryDeleteFailed";
        case Errc::CatalogFailed:      return "CatalogFailed";
        case Errc::IoError:            return "IoError";
        case Errc::Cancelled:          return "Cancelled";
    }
    return "Unknown";
}

} // namespace bpm
