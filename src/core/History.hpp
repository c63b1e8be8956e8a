#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/CommitObject.hpp"
#include "core/Index.hpp"
#include "util/Expected.hpp"

namespace oops {

class ObjectStore;

/// One page of `log` output
struct LogPage {
    std::vector<CommitObject> commits;  // Newest first
    size_t pageNumber{1};
    size_t pageCount{0};
    size_t totalCommits{0};
};

/**
 * @brief Commit creation, parsing and history traversal
 *
 * History is a singly linked chain: every commit names at most one
 * parent, and the root commit names "none".
 */
class History {
public:
    using Metadata = std::unordered_map<std::string, std::string>;

    /**
     * @brief Serialize a commit record
     *
     * The message is followed by one newline; parse() strips it again.
     */
    static std::string serialize(const std::string& parent, int64_t timestamp, const std::string& author,
                                 const std::string& snapshotHash, const Metadata& metadata,
                                 const std::string& message);

    /**
     * @brief Parse commit bytes
     *
     * Header lines run until the first blank line. parent, timestamp,
     * author and snapshot are recognized; any other "key: value" line is
     * metadata. A missing or unparsable timestamp, or a missing author,
     * is InvalidCommit.
     */
    static Expected<CommitObject> parse(const std::string& hash, const std::string& bytes);

    /// Read and parse a commit object
    static Expected<CommitObject> readCommit(const ObjectStore& store, const std::string& hash);

    /**
     * @brief Index entries recorded by a commit
     *
     * Empty for commits written without a snapshot.
     */
    static Expected<std::vector<IndexEntry>> readSnapshot(const ObjectStore& store, const CommitObject& commit);

    /**
     * @brief Record a commit of the current index and move HEAD to it
     *
     * The parent is the current HEAD (none for the first commit). The
     * index is written as a snapshot object. If the current branch
     * pointer names an existing ref (or this is the first commit) that
     * ref is advanced as well.
     *
     * @return New commit hash
     */
    static Expected<std::string> commit(const std::filesystem::path& root, ObjectStore& store,
                                        const std::vector<IndexEntry>& entries, const std::string& message,
                                        const Metadata& metadata, const std::string& author, int64_t timestamp);

    /// commit() with the current user and wall-clock time
    static Expected<std::string> commit(const std::filesystem::path& root, ObjectStore& store,
                                        const std::vector<IndexEntry>& entries, const std::string& message,
                                        const Metadata& metadata);

    /**
     * @brief Write a bookmark object for the current HEAD
     *
     * Requires a HEAD commit (NoCommits). Nothing is restored from it.
     * @return Stash object hash
     */
    static Expected<std::string> stash(const std::filesystem::path& root, ObjectStore& store, int64_t timestamp);

    /// Commits from start back to the root, newest first
    static Expected<std::vector<CommitObject>> walk(const ObjectStore& store, const std::string& start);

    /**
     * @brief History page starting at a branch (or HEAD when branch is empty)
     *
     * The slice is [pageSize*(page-1), min(start+pageSize, total)).
     * NoCommits when the start cannot be resolved; InvalidArgs for a
     * zero page size or page number.
     */
    static Expected<LogPage> log(const std::filesystem::path& root, const ObjectStore& store,
                                 const std::string& branch, size_t pageSize, size_t pageNumber);

    /**
     * @brief UTC "YYYY-MM-DD HH:MM:SS"
     * @throws std::logic_error for negative timestamps (corrupt repository data)
     */
    static std::string formatTimestamp(int64_t timestamp);

    /// Multi-line log rendering of one commit
    static std::string formatCommit(const CommitObject& commit);

    /// Author name from OOPS_AUTHOR, USER or USERNAME
    static std::string currentAuthor();

    /// Current wall-clock time in unix seconds
    static int64_t now();
};

}
