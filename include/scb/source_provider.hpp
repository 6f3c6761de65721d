#pragma once

#include "scb/error.hpp"
#include "scb/template_registry.hpp"

#include <string>

namespace scb {

// ============================================================================
// Fetched Source
// ============================================================================

/**
 * @brief Local directory holding a fetched template tree
 *
 * Owned trees live in a scratch directory that is removed when the handle
 * is destroyed, on every exit path of the caller. A removal failure is
 * logged and otherwise ignored. Borrowed trees (a directory the user
 * pointed at) are never touched.
 */
class FetchedSource {
public:
    FetchedSource(std::string root, bool owned);
    ~FetchedSource();

    FetchedSource(FetchedSource&& other) noexcept;
    FetchedSource& operator=(FetchedSource&& other) noexcept;
    FetchedSource(const FetchedSource&) = delete;
    FetchedSource& operator=(const FetchedSource&) = delete;

    const std::string& root() const { return root_; }
    bool owned() const { return owned_; }

    // <root>/.strategic-claude-basic
    std::string framework_root() const;

    // Remove an owned scratch tree now. Safe to call more than once.
    void release();

private:
    std::string root_;
    bool owned_ = false;
};

// ============================================================================
// Source Providers
// ============================================================================

class SourceProvider {
public:
    virtual ~SourceProvider() = default;

    /**
     * Produce the template's content tree at its pinned revision.
     *
     * Errors: SOURCE_NOT_FOUND (tool or repository missing),
     * SOURCE_TRANSPORT (network or timeout, after retries),
     * REVISION_NOT_FOUND (branch or commit missing upstream).
     */
    virtual Result<FetchedSource> fetch(const Template& tmpl) = 0;
};

/**
 * @brief Clones the template repository with git
 *
 * `git clone -b <branch>` is retried with linear backoff on transport
 * failures, then `git checkout <commit>` pins the revision.
 */
class GitSourceProvider : public SourceProvider {
public:
    explicit GitSourceProvider(int timeout_seconds = 30, int max_attempts = 3);

    Result<FetchedSource> fetch(const Template& tmpl) override;

private:
    int timeout_seconds_;
    int max_attempts_;
};

// Uses an existing checkout as-is.
class LocalSourceProvider : public SourceProvider {
public:
    explicit LocalSourceProvider(std::string directory);

    Result<FetchedSource> fetch(const Template& tmpl) override;

private:
    std::string directory_;
};

} // namespace scb
