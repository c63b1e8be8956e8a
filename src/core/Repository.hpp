#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace oops {

class ObjectStore;

/**
 * @brief Repository layout, HEAD and branch references
 *
 * Repository layout:
 *   .oops/
 *     objects/<hash>     - Content-addressed objects
 *     refs/HEAD          - Current commit hash (absent before the first commit)
 *     refs/<branch>      - Commit hash a branch points to
 *     branch             - Name of the checked-out branch (display only)
 *     index              - Staging area
 *
 * HEAD always holds a commit hash. The branch file holds whatever name
 * was last checked out; when it names no ref, HEAD is detached.
 */
class Repository {
public:
    /// Get the global repository instance
    static Repository& instance();

    /**
     * @brief Initialize a new repository
     * @param path Directory to initialize (creates .oops subdirectory)
     * @return Success, or AlreadyInitialized / IoError
     *
     * Creates .oops/objects/, .oops/refs/ and .oops/branch -> "main".
     */
    Expected<void> init(const std::filesystem::path& path);

    /**
     * @brief Find repository root by searching upwards for .oops
     * @return Absolute path to the root, or NotARepository
     */
    Expected<std::filesystem::path> discoverRoot(const std::filesystem::path& start) const;

    /// .oops directory under a root
    static std::filesystem::path repoDir(const std::filesystem::path& root);

    /**
     * @brief Current commit hash
     * @return Hash, or empty string when nothing has been committed yet
     */
    static Expected<std::string> resolveHEAD(const std::filesystem::path& root);

    /// Point HEAD at a commit hash
    static Expected<void> updateHEAD(const std::filesystem::path& root, const std::string& commitHash);

    /// True if .oops/refs/<branchName> exists
    static Expected<bool> branchExists(const std::filesystem::path& root, const std::string& branchName);

    /// Branch names (every ref except HEAD), sorted
    static Expected<std::vector<std::string>> listBranches(const std::filesystem::path& root);

    /// Name stored in .oops/branch ("main" when the file is missing)
    static Expected<std::string> getCurrentBranch(const std::filesystem::path& root);

    static Expected<void> setCurrentBranch(const std::filesystem::path& root, const std::string& name);

    /// Write a ref file holding a commit hash
    static Expected<void> writeRef(const std::filesystem::path& root, const std::string& name, const std::string& commitHash);

    /**
     * @brief Create a branch at the current HEAD commit
     *
     * NoCommits before the first commit; InvalidArgs for names that are
     * empty, "HEAD", or contain '/' or whitespace.
     */
    static Expected<void> createBranch(const std::filesystem::path& root, const std::string& branchName);

    /**
     * @brief Commit hash stored in a branch ref
     * @return Hash, or empty string if the ref doesn't exist
     */
    static Expected<std::string> getBranchCommit(const std::filesystem::path& root, const std::string& branchName);

    /**
     * @brief Move HEAD to a branch or to a raw commit hash
     *
     * A name with a ref resolves to that ref's hash; any other name must
     * be the hash of a commit object. The branch pointer is set to name
     * either way.
     *
     * @return The commit hash HEAD now holds
     */
    static Expected<std::string> checkout(const std::filesystem::path& root, const ObjectStore& store, const std::string& name);

    /// True when HEAD holds a commit but the branch pointer names no existing ref
    static Expected<bool> isDetached(const std::filesystem::path& root);

    static bool isValidBranchName(const std::string& name);

    /**
     * @brief Rewrite a command-line path (relative to cwd) as a repo-relative path
     *
     * Arguments given from the repository root pass through unchanged, as
     * does anything that resolves outside the working tree.
     */
    static std::string toRepoRelative(const std::filesystem::path& root, const std::filesystem::path& cwd,
                                      const std::string& arg);

private:
    Repository() = default;
};

}
