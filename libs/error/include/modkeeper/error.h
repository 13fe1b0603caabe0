#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace modkeeper {

// ErrorKind classifies a failure at the library boundary.
enum class ErrorKind {
    Catalog,       // SQLite connection or query failure
    Filesystem,    // I/O, permission or missing path
    Config,        // required setting absent, malformed definitions
    NotFound,      // referenced id or slug absent
    Conflict,      // duplicate name or path, operation already running
    OrphanedAsset, // catalog row with no folder on disk in either state
    InvalidInput,  // empty or illegal names
};

// error_kind_name returns a stable lowercase name, e.g. "orphaned_asset".
std::string_view error_kind_name(ErrorKind kind);

// Error is thrown by every modkeeper library.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace modkeeper
