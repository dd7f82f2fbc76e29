#include "error_manager.hpp"
#include "logger.hpp"

#include <cerrno>
#include <cstring>

// ------------------------------------------------------------
// OikosError
// ------------------------------------------------------------
OikosError::OikosError(std::string code, const std::string& detail, int osError)
    : std::runtime_error(detail), code_(std::move(code)), osError_(osError) {}

void throwOsError(const std::string& code, const std::string& detail) {
    throwOsError(code, detail, errno);
}

void throwOsError(const std::string& code, const std::string& detail, int err) {
    throw OikosError(code, detail + ": " + std::strerror(err), err);
}

// ------------------------------------------------------------
// ErrorManager implementation
// ------------------------------------------------------------
nlohmann::json ErrorManager::errors;
nlohmann::json ErrorManager::root;

void ErrorManager::setCatalog(const nlohmann::json& catalog) {
    errors = catalog;
    if (errors.contains("errors") && errors["errors"].is_object()) {
        root = errors["errors"];
    } else {
        root = errors;
    }
}

std::string ErrorManager::getUserMessage(const std::string& code) {
    if (root.contains(code) && root[code].contains("user")) {
        return root[code]["user"].get<std::string>();
    }
    return "[Error] Unknown error code: " + code;
}

std::string ErrorManager::getDebugMessage(const std::string& code) {
    if (root.contains(code) && root[code].contains("debug")) {
        return root[code]["debug"].get<std::string>();
    }
    return "[Debug] No debug message for code: " + code;
}

std::string ErrorManager::report(const OikosError& error) {
    LOG_ERROR("ErrorManager", error.code() + " -> " + getDebugMessage(error.code()) +
                              ": " + error.what());
    return getUserMessage(error.code());
}
