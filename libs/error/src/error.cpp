#include "modkeeper/error.h"

namespace modkeeper {

std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Catalog: return "catalog";
        case ErrorKind::Filesystem: return "filesystem";
        case ErrorKind::Config: return "config";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Conflict: return "conflict";
        case ErrorKind::OrphanedAsset: return "orphaned_asset";
        case ErrorKind::InvalidInput: return "invalid_input";
    }
    return "unknown";
}

} // namespace modkeeper
