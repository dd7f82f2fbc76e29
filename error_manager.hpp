#pragma once

#include <string>
#include <stdexcept>
#include <nlohmann/json.hpp>

// ------------------------------------------------------------
// OikosError: the one exception type thrown by the scheduler core
// ------------------------------------------------------------
// code()    -> stable catalog key (ERR_*), see bootstrap_config::defaultErrors()
// what()    -> detail naming the subsystem and device path / duration
// osError() -> errno captured at the failing call, 0 if none
class OikosError : public std::runtime_error {
public:
    OikosError(std::string code, const std::string& detail, int osError = 0);

    const std::string& code() const { return code_; }
    int osError() const { return osError_; }

private:
    std::string code_;
    int osError_;
};

// Throw OikosError for a failed syscall, appending strerror(errno).
[[noreturn]] void throwOsError(const std::string& code, const std::string& detail);
[[noreturn]] void throwOsError(const std::string& code, const std::string& detail, int err);

// ------------------------------------------------------------
// ErrorManager
// ------------------------------------------------------------
namespace ErrorManager {
    // Install the parsed errors.json catalog (bootstrap passes the patched file)
    void setCatalog(const nlohmann::json& catalog);

    // Get messages
    std::string getUserMessage(const std::string& code);
    std::string getDebugMessage(const std::string& code);

    // Log the error and return the user-facing message
    std::string report(const OikosError& error);

    // Internal storage
    extern nlohmann::json errors;
    extern nlohmann::json root;
}
