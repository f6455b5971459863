#include "transfer_plan.hpp"
#include "errors.hpp"

namespace motus {

bool TransferPlan::operator==(const TransferPlan& other) const {
    return operation == other.operation &&
           subcommand == other.subcommand &&
           source == other.source &&
           destination == other.destination &&
           mkdir_before == other.mkdir_before &&
           cleanup_after == other.cleanup_after &&
           follow_symlinks == other.follow_symlinks &&
           source_is_directory == other.source_is_directory;
}

bool has_trailing_slash(const std::string& path) {
    return !path.empty() && path.back() == '/';
}

static std::string without_trailing_slash(const std::string& path) {
    std::string result = path;
    while (result.size() > 1 && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

static std::string join(const std::string& dir, const std::string& name) {
    if (has_trailing_slash(dir) || (!dir.empty() && dir.back() == ':')) {
        return dir + name;
    }
    return dir + "/" + name;
}

std::string base_name(const std::string& path) {
    std::string trimmed = without_trailing_slash(path);
    size_t pos = trimmed.find_last_of("/:");
    if (pos == std::string::npos) return trimmed;
    return trimmed.substr(pos + 1);
}

PathFacts gather_facts(const TransferRequest& request, PathInspector& inspector) {
    PathFacts facts;
    facts.source_is_directory =
        inspector.inspect(without_trailing_slash(request.source)) == PathKind::Directory;

    if (!has_trailing_slash(request.destination)) {
        PathKind kind = inspector.inspect(request.destination);
        facts.destination_exists = kind != PathKind::Missing;
        facts.destination_is_file = kind == PathKind::File;
    }
    return facts;
}

TransferPlan plan_transfer(const TransferRequest& request, const PathFacts& facts) {
    TransferPlan plan;
    plan.operation = request.operation;
    plan.source = request.source;
    plan.destination = request.destination;
    plan.follow_symlinks = request.follow_symlinks;
    plan.source_is_directory = facts.source_is_directory;

    switch (request.operation) {
    case Operation::Sync:
        plan.subcommand = "sync";
        return plan;
    case Operation::Check:
        plan.subcommand = "check";
        return plan;
    case Operation::Zip:
        throw MotusError(ErrorKind::InvalidOperation, "zip cannot be planned as a transfer");
    case Operation::Copy:
    case Operation::Move:
        break;
    }

    const bool is_move = request.operation == Operation::Move;
    const std::string recursive = is_move ? "move" : "copy";
    const std::string single = is_move ? "moveto" : "copyto";

    const bool src_slash = has_trailing_slash(request.source);
    const bool dst_slash = has_trailing_slash(request.destination);

    plan.subcommand = recursive;

    if (!dst_slash && facts.destination_is_file) {
        plan.subcommand = single;
        return plan;
    }

    if (facts.source_is_directory && !src_slash) {
        std::string name = base_name(request.source);
        if ((dst_slash || facts.destination_exists) && !name.empty()) {
            // By name: dst/<name> receives the tree
            plan.destination = join(request.destination, name);
            plan.mkdir_before = plan.destination;
        } else if (!dst_slash && !facts.destination_exists) {
            // Rename: dst becomes the directory itself
            plan.source = request.source + "/";
            plan.destination = request.destination + "/";
            plan.mkdir_before = request.destination;
        } else {
            return plan;
        }
        if (is_move) {
            plan.cleanup_after = request.source;
        }
        return plan;
    }

    if (!dst_slash && !facts.source_is_directory && !facts.destination_exists) {
        plan.subcommand = single;
    }
    return plan;
}

} // namespace motus
