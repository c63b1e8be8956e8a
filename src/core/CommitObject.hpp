#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace oops {

/**
 * @brief Parsed commit record
 *
 * Stored form:
 *   parent: <hash|none>
 *   timestamp: <unix seconds>
 *   author: <name>
 *   snapshot: <hash of the serialized index>
 *   <key>: <value>           (metadata, any order)
 *
 *   <message>
 */
struct CommitObject {
    std::string hash;              // Object hash of this commit
    std::string parent;            // Parent commit hash, empty for the root commit
    int64_t timestamp{0};          // Unix timestamp
    std::string author;
    std::string snapshotHash;      // Index snapshot object, empty for commits written without one
    std::unordered_map<std::string, std::string> metadata;
    std::string message;

    bool hasParent() const { return !parent.empty(); }

    /// First line of the message
    std::string shortMessage() const {
        size_t newlinePos = message.find('\n');
        if (newlinePos != std::string::npos) {
            return message.substr(0, newlinePos);
        }
        return message;
    }

    /// First 7 characters of the hash
    std::string shortHash() const {
        return hash.length() >= 7 ? hash.substr(0, 7) : hash;
    }
};

}
