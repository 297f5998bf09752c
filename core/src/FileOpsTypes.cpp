#include "fileops/FileOpsTypes.hpp"

namespace fileops {

const char* toWire(DecisionTag tag) {
    switch (tag) {
    case DecisionTag::Overwrite: return "overwrite";
    case DecisionTag::Skip:      return "skip";
    case DecisionTag::Update:    return "update";
    case DecisionTag::Reget:     return "reget";
    case DecisionTag::Abort:     return "abort";
    case DecisionTag::Delete:    return "delete";
    case DecisionTag::Keep:      return "keep";
    }
    return "";
}

const char* toWire(OperationKind op) {
    switch (op) {
    case OperationKind::Copy:   return "copy";
    case OperationKind::Move:   return "move";
    case OperationKind::Delete: return "delete";
    }
    return "";
}

const char* toWire(DecisionKind kind) {
    switch (kind) {
    case DecisionKind::Overwrite:           return "overwrite";
    case DecisionKind::IoError:             return "io_error";
    case DecisionKind::Partial:             return "partial";
    case DecisionKind::NonEmptyDirDeletion: return "non_empty_dir_deletion";
    }
    return "";
}

const char* toWire(SuspensionKind kind) {
    switch (kind) {
    case SuspensionKind::NeedOverwriteDecision:   return "need_overwrite_decision";
    case SuspensionKind::NeedIoErrorDecision:     return "need_io_error_decision";
    case SuspensionKind::NeedPartialDecision:     return "need_partial_decision";
    case SuspensionKind::NeedNonEmptyDirDecision: return "need_non_empty_dir_decision";
    case SuspensionKind::Progress:                return "progress";
    case SuspensionKind::Starting:                return "starting";
    case SuspensionKind::Terminated:              return "terminated";
    case SuspensionKind::Dead:                    return "dead";
    }
    return "";
}

const char* toWire(EntryKind kind) {
    switch (kind) {
    case EntryKind::File:        return "regular";
    case EntryKind::Directory:   return "directory";
    case EntryKind::Symlink:     return "link";
    case EntryKind::CharDevice:  return "character device";
    case EntryKind::BlockDevice: return "block device";
    case EntryKind::Fifo:        return "fifo";
    case EntryKind::Socket:      return "socket";
    case EntryKind::Unknown:     return "unknown";
    }
    return "";
}

std::optional<DecisionTag> decisionTagFromWire(const std::string& s) {
    static const DecisionTag all[] = {
        DecisionTag::Overwrite, DecisionTag::Skip,   DecisionTag::Update,
        DecisionTag::Reget,     DecisionTag::Abort,  DecisionTag::Delete,
        DecisionTag::Keep};
    for (DecisionTag t : all) {
        if (s == toWire(t))
            return t;
    }
    return std::nullopt;
}

std::optional<OperationKind> operationKindFromWire(const std::string& s) {
    if (s == "copy") return OperationKind::Copy;
    if (s == "move") return OperationKind::Move;
    if (s == "delete") return OperationKind::Delete;
    return std::nullopt;
}

bool isLegal(DecisionKind kind, DecisionTag tag) {
    switch (kind) {
    case DecisionKind::Overwrite:
        return tag == DecisionTag::Overwrite || tag == DecisionTag::Skip ||
               tag == DecisionTag::Update || tag == DecisionTag::Reget ||
               tag == DecisionTag::Abort;
    case DecisionKind::IoError:
        return tag == DecisionTag::Skip || tag == DecisionTag::Abort;
    case DecisionKind::Partial:
        return tag == DecisionTag::Delete || tag == DecisionTag::Keep;
    case DecisionKind::NonEmptyDirDeletion:
        return tag == DecisionTag::Delete || tag == DecisionTag::Skip ||
               tag == DecisionTag::Abort;
    }
    return false;
}

std::optional<DecisionKind> decisionKindFor(SuspensionKind kind) {
    switch (kind) {
    case SuspensionKind::NeedOverwriteDecision:   return DecisionKind::Overwrite;
    case SuspensionKind::NeedIoErrorDecision:     return DecisionKind::IoError;
    case SuspensionKind::NeedPartialDecision:     return DecisionKind::Partial;
    case SuspensionKind::NeedNonEmptyDirDecision: return DecisionKind::NonEmptyDirDeletion;
    default:
        return std::nullopt;
    }
}

double progressPercent(std::uint64_t part, std::uint64_t whole) {
    if (whole == 0)
        throw ContractError("progress reported with whole == 0");
    if (part >= whole)
        return 100.0;
    return 100.0 * static_cast<double>(part) / static_cast<double>(whole);
}

std::string describe(const Decision& d) {
    std::string out = toWire(d.tag);
    if (d.forAll)
        out += " (all)";
    return out;
}

} // namespace fileops
