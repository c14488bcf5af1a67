#ifndef GCM_TUI_CORE_ERRORS_H
#define GCM_TUI_CORE_ERRORS_H

#include <stdexcept>
#include <string>

namespace gcm {

// I/O or parse failure in the record store
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Requested record does not exist
class NotFoundError : public StorageError {
public:
    NotFoundError(const std::string& kind, const std::string& id)
        : StorageError(kind + " not found: " + id), id_(id) {}

    const std::string& id() const { return id_; }

private:
    std::string id_;
};

class SettingsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class LaunchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ImportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace gcm

#endif  // GCM_TUI_CORE_ERRORS_H
