#pragma once

#include "scb/error.hpp"

#include <string>

namespace scb {

// ============================================================================
// Script Runner
// ============================================================================

class ScriptRunner {
public:
    virtual ~ScriptRunner() = default;

    virtual bool exists(const std::string& dir, const std::string& name) const = 0;

    /**
     * Run <dir>/<name> with target_dir as the working directory.
     *
     * A missing script is not an error. A non-zero exit is SCRIPT_FAILED.
     */
    virtual VoidResult run(const std::string& dir, const std::string& name,
                           const std::string& target_dir) = 0;
};

/**
 * @brief Runs template scripts with bash
 *
 * The script is copied into the target directory, made executable, run as
 * `bash <copy>` from there, and the copy is removed afterwards.
 */
class BashScriptRunner : public ScriptRunner {
public:
    bool exists(const std::string& dir, const std::string& name) const override;
    VoidResult run(const std::string& dir, const std::string& name,
                   const std::string& target_dir) override;
};

} // namespace scb
