#include "core/History.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <ctime>
#include <sstream>
#include <stdexcept>

#include "core/Constants.hpp"
#include "core/ObjectStore.hpp"
#include "core/Repository.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace oops {

namespace {

constexpr const char* PARENT_KEY = "parent";
constexpr const char* TIMESTAMP_KEY = "timestamp";
constexpr const char* AUTHOR_KEY = "author";
constexpr const char* SNAPSHOT_KEY = "snapshot";

bool isReservedKey(const std::string& key) {
    return key == PARENT_KEY || key == TIMESTAMP_KEY || key == AUTHOR_KEY || key == SNAPSHOT_KEY;
}

Expected<void> validateMetadata(const History::Metadata& metadata) {
    for (const auto& kv : metadata) {
        const std::string& key = kv.first;
        if (key.empty() || key.find_first_of(":\n") != std::string::npos || isReservedKey(key)) {
            return Error{ErrorCode::InvalidArgs, "Invalid metadata key '" + key + "'"};
        }
        if (kv.second.find('\n') != std::string::npos) {
            return Error{ErrorCode::InvalidArgs, "Metadata value for '" + key + "' spans lines"};
        }
    }
    return {};
}

}

std::string History::serialize(const std::string& parent, int64_t timestamp, const std::string& author,
                               const std::string& snapshotHash, const Metadata& metadata,
                               const std::string& message) {
    std::ostringstream out;
    out << PARENT_KEY << ": " << (parent.empty() ? Constants::NO_PARENT : parent) << "\n";
    out << TIMESTAMP_KEY << ": " << timestamp << "\n";
    out << AUTHOR_KEY << ": " << author << "\n";
    if (!snapshotHash.empty()) {
        out << SNAPSHOT_KEY << ": " << snapshotHash << "\n";
    }
    for (const auto& kv : metadata) {
        out << kv.first << ": " << kv.second << "\n";
    }
    out << "\n" << message << "\n";
    return out.str();
}

Expected<CommitObject> History::parse(const std::string& hash, const std::string& bytes) {
    CommitObject c;
    c.hash = hash;
    bool haveTimestamp = false;
    bool haveAuthor = false;

    size_t pos = 0;
    bool headerClosed = false;
    while (pos < bytes.size()) {
        size_t eol = bytes.find('\n', pos);
        std::string line = bytes.substr(pos, eol == std::string::npos ? std::string::npos : eol - pos);
        pos = (eol == std::string::npos) ? bytes.size() : eol + 1;

        if (line.empty()) {
            headerClosed = true;
            break;
        }

        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            Logger::instance().debug("commit " + hash + ": skipping header line without ':'");
            continue;
        }
        std::string key = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        if (!value.empty() && value[0] == ' ') value.erase(0, 1);

        if (key == PARENT_KEY) {
            c.parent = (value == Constants::NO_PARENT) ? std::string() : value;
        } else if (key == TIMESTAMP_KEY) {
            try {
                size_t used = 0;
                c.timestamp = static_cast<int64_t>(std::stoll(value, &used, 10));
                if (used != value.size()) {
                    return Error{ErrorCode::InvalidCommit, "commit " + hash + ": malformed timestamp '" + value + "'"};
                }
            } catch (const std::exception&) {
                return Error{ErrorCode::InvalidCommit, "commit " + hash + ": malformed timestamp '" + value + "'"};
            }
            haveTimestamp = true;
        } else if (key == AUTHOR_KEY) {
            c.author = value;
            haveAuthor = true;
        } else if (key == SNAPSHOT_KEY) {
            c.snapshotHash = value;
        } else {
            c.metadata[key] = value;
        }
    }

    if (!haveTimestamp) {
        return Error{ErrorCode::InvalidCommit, "commit " + hash + ": missing timestamp"};
    }
    if (!haveAuthor) {
        return Error{ErrorCode::InvalidCommit, "commit " + hash + ": missing author"};
    }

    if (headerClosed) {
        c.message = bytes.substr(pos);
        // Drop the terminator serialize() appended
        if (!c.message.empty() && c.message.back() == '\n') {
            c.message.pop_back();
        }
    }
    return c;
}

Expected<CommitObject> History::readCommit(const ObjectStore& store, const std::string& hash) {
    auto bytes = store.read(hash);
    if (!bytes) return bytes.error();
    return parse(hash, bytes.value());
}

Expected<std::vector<IndexEntry>> History::readSnapshot(const ObjectStore& store, const CommitObject& commit) {
    if (commit.snapshotHash.empty()) {
        return std::vector<IndexEntry>();
    }
    auto bytes = store.read(commit.snapshotHash);
    if (!bytes) return bytes.error();
    auto entries = Index::parse(bytes.value());
    if (!entries) {
        return Error{ErrorCode::InvalidCommit, "commit " + commit.hash + ": bad snapshot: " + entries.error().message};
    }
    return entries;
}

Expected<std::string> History::commit(const fs::path& root, ObjectStore& store,
                                      const std::vector<IndexEntry>& entries, const std::string& message,
                                      const Metadata& metadata, const std::string& author, int64_t timestamp) {
    auto valid = validateMetadata(metadata);
    if (!valid) return valid.error();
    if (author.find('\n') != std::string::npos) {
        return Error{ErrorCode::InvalidArgs, "Author name spans lines"};
    }

    auto head = Repository::resolveHEAD(root);
    if (!head) return head.error();
    const std::string parent = head.value();

    auto snapshot = store.write(Index::serialize(entries));
    if (!snapshot) return snapshot.error();

    auto commitHash = store.write(serialize(parent, timestamp, author, snapshot.value(), metadata, message));
    if (!commitHash) return commitHash.error();

    auto updated = Repository::updateHEAD(root, commitHash.value());
    if (!updated) return updated.error();

    // Keep the checked-out branch pointing at its newest commit
    auto branch = Repository::getCurrentBranch(root);
    if (!branch) return branch.error();
    auto exists = Repository::branchExists(root, branch.value());
    if (!exists) return exists.error();
    if (exists.value() || (parent.empty() && Repository::isValidBranchName(branch.value()))) {
        auto moved = Repository::writeRef(root, branch.value(), commitHash.value());
        if (!moved) return moved.error();
    }

    Logger::instance().debug("Created commit " + commitHash.value() + " (parent " +
                             (parent.empty() ? std::string(Constants::NO_PARENT) : parent) + ")");
    return commitHash.value();
}

Expected<std::string> History::commit(const fs::path& root, ObjectStore& store,
                                      const std::vector<IndexEntry>& entries, const std::string& message,
                                      const Metadata& metadata) {
    return commit(root, store, entries, message, metadata, currentAuthor(), now());
}

Expected<std::string> History::stash(const fs::path& root, ObjectStore& store, int64_t timestamp) {
    auto head = Repository::resolveHEAD(root);
    if (!head) return head.error();
    if (head.value().empty()) {
        return Error{ErrorCode::NoCommits, "Cannot stash: no commits yet"};
    }
    std::string record = "stash: " + head.value() + "\ntimestamp: " + std::to_string(timestamp);
    return store.write(record);
}

Expected<std::vector<CommitObject>> History::walk(const ObjectStore& store, const std::string& start) {
    std::vector<CommitObject> commits;
    std::string current = start;
    while (!current.empty()) {
        auto c = readCommit(store, current);
        if (!c) return c.error();
        current = c.value().parent;
        commits.push_back(std::move(c.value()));
    }
    return commits;
}

Expected<LogPage> History::log(const fs::path& root, const ObjectStore& store,
                               const std::string& branch, size_t pageSize, size_t pageNumber) {
    if (pageSize == 0) {
        return Error{ErrorCode::InvalidArgs, "Page size must be positive"};
    }
    if (pageNumber == 0) {
        return Error{ErrorCode::InvalidArgs, "Page numbers start at 1"};
    }

    std::string start;
    if (!branch.empty()) {
        auto ref = Repository::getBranchCommit(root, branch);
        if (!ref) return ref.error();
        if (ref.value().empty()) {
            return Error{ErrorCode::NoCommits, "Branch '" + branch + "' does not exist"};
        }
        start = ref.value();
    } else {
        auto head = Repository::resolveHEAD(root);
        if (!head) return head.error();
        start = head.value();
    }
    if (start.empty()) {
        return Error{ErrorCode::NoCommits, "Your current branch does not have any commits yet"};
    }

    auto all = walk(store, start);
    if (!all) return all.error();

    LogPage page;
    page.pageNumber = pageNumber;
    page.totalCommits = all.value().size();
    page.pageCount = (page.totalCommits + pageSize - 1) / pageSize;

    size_t first = pageSize * (pageNumber - 1);
    if (first < page.totalCommits) {
        size_t last = std::min(first + pageSize, page.totalCommits);
        page.commits.assign(all.value().begin() + static_cast<std::ptrdiff_t>(first),
                            all.value().begin() + static_cast<std::ptrdiff_t>(last));
    }
    return page;
}

std::string History::formatTimestamp(int64_t timestamp) {
    if (timestamp < 0) {
        throw std::logic_error("Negative commit timestamp " + std::to_string(timestamp) + ": repository data is corrupt");
    }
    std::time_t t = static_cast<std::time_t>(timestamp);
    std::tm* utc = std::gmtime(&t);
    if (!utc) {
        throw std::logic_error("Commit timestamp out of range: " + std::to_string(timestamp));
    }
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", utc);
    return buffer;
}

std::string History::formatCommit(const CommitObject& commit) {
    std::ostringstream out;
    out << "Commit: " << commit.hash << "\n";
    out << "Author: " << commit.author << "\n";
    out << "Date: " << formatTimestamp(commit.timestamp) << "\n";
    out << "Message:\n" << commit.message;
    if (commit.message.empty() || commit.message.back() != '\n') out << "\n";
    for (const auto& kv : commit.metadata) {
        out << kv.first << ": " << kv.second << "\n";
    }
    return out.str();
}

std::string History::currentAuthor() {
    for (const char* var : {"OOPS_AUTHOR", "USER", "USERNAME"}) {
        const char* v = std::getenv(var);
        if (v && *v) return v;
    }
    return "unknown";
}

int64_t History::now() {
    return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

}
