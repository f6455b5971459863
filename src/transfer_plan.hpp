#pragma once

#include "job.hpp"
#include <string>

namespace motus {

enum class PathKind {
    Missing,
    File,
    Directory
};

/**
 * Answers "what is at this path" with one round trip per query.
 * Implemented by RcloneClient; tests supply a table.
 */
class PathInspector {
public:
    virtual ~PathInspector() = default;
    virtual PathKind inspect(const std::string& path) = 0;
};

struct TransferRequest {
    Operation operation = Operation::Copy;
    std::string source;          // literal, trailing slash significant
    std::string destination;     // literal, trailing slash significant
    bool follow_symlinks = false;
};

struct PathFacts {
    bool source_is_directory = false;
    bool destination_exists = false;    // only looked up without a trailing slash
    bool destination_is_file = false;
};

/**
 * Concrete rclone invocation for one job.
 */
struct TransferPlan {
    Operation operation = Operation::Copy;
    std::string subcommand;      // copy, copyto, move, moveto, sync, check
    std::string source;
    std::string destination;
    std::string mkdir_before;    // best-effort pre-creation, "" = none
    std::string cleanup_after;   // empty source dir removed after exit 0, "" = none
    bool follow_symlinks = false;
    bool source_is_directory = false;

    bool operator==(const TransferPlan& other) const;
    bool operator!=(const TransferPlan& other) const { return !(*this == other); }
};

bool has_trailing_slash(const std::string& path);

// Last path component of "dir/sub", "remote:sub" or "/a/b/"
std::string base_name(const std::string& path);

// Look up the source and, when it has no trailing slash, the destination
PathFacts gather_facts(const TransferRequest& request, PathInspector& inspector);

/**
 * Pure planning function, rsync trailing-slash conventions:
 *
 *   dst is an existing file (no slash)            -> copyto/moveto src dst
 *   dst is an existing dir, src dir without slash -> mkdir dst/name, copy src dst/name
 *   dst missing (no slash), src dir without slash -> mkdir dst, copy src/ dst/
 *   dst missing (no slash), src is a file         -> copyto/moveto src dst
 *   anything else                                 -> copy/move src dst as given
 *   sync                                          -> sync src dst as given
 *
 * A move of a directory without a trailing slash also schedules removal of
 * the emptied source directory. Throws MotusError(InvalidOperation) for zip.
 */
TransferPlan plan_transfer(const TransferRequest& request, const PathFacts& facts);

} // namespace motus
