// Basic types shared between the operation engine, the policies and the UI.
// Keep them plain values so they can cross the task/policy boundary by copy.
#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace fileops {

enum class OperationKind { Copy, Move, Delete };

enum class EntryKind {
    File,
    Directory,
    Symlink,
    CharDevice,
    BlockDevice,
    Fifo,
    Socket,
    Unknown
};

struct FileStat {
    EntryKind     kind  = EntryKind::Unknown;
    std::uint64_t size  = 0;  // bytes
    std::int64_t  mtime = 0;  // epoch (seconds)
    std::int64_t  atime = 0;
    std::uint32_t mode  = 0;  // permission bits
    std::uint32_t uid   = 0;
    std::uint32_t gid   = 0;
    std::uint64_t device = 0;
    std::uint64_t inode  = 0;
};

// Snapshot of one filesystem object as the task saw it. "name" is the full
// path; a destination that does not exist has exists == false.
struct Entry {
    std::string name;
    bool        exists = false;
    FileStat    stat;

    bool isDirectory() const { return exists && stat.kind == EntryKind::Directory; }
};

// Decision points a policy can be asked about.
enum class DecisionKind { Overwrite, IoError, Partial, NonEmptyDirDeletion };

// Literal answers. Their wire names are what batch scripts expect.
enum class DecisionTag { Overwrite, Skip, Update, Reget, Abort, Delete, Keep };

struct Decision {
    DecisionTag tag = DecisionTag::Abort;
    bool forAll = false; // apply to every later occurrence of the same kind

    Decision() = default;
    Decision(DecisionTag t, bool all = false) : tag(t), forAll(all) {}
};

inline bool operator==(const Decision& a, const Decision& b) {
    return a.tag == b.tag && a.forAll == b.forAll;
}
inline bool operator!=(const Decision& a, const Decision& b) { return !(a == b); }

// What the driver feeds into OperationTask::resume(). Empty means "go on".
using Command = std::optional<DecisionTag>;

enum class SuspensionKind {
    NeedOverwriteDecision,
    NeedIoErrorDecision,
    NeedPartialDecision,
    NeedNonEmptyDirDecision,
    Progress,
    Starting,
    Terminated,
    Dead
};

// Result of one resume() call: why the task stopped and the data the
// matching policy method needs.
struct Suspension {
    SuspensionKind kind = SuspensionKind::Dead;
    OperationKind  operation = OperationKind::Copy;
    Entry          src;
    std::optional<Entry> dst;
    std::string    message;   // I/O error text
    std::uint64_t  part  = 0; // progress counters
    std::uint64_t  whole = 0;

    bool isTerminal() const {
        return kind == SuspensionKind::Terminated || kind == SuspensionKind::Dead;
    }
};

enum class TaskState { Running, Suspended, Terminated, Dead };

// Options the policy hands to the engine when the task is created.
struct TaskOptions {
    bool deref = false;    // follow symlinks when statting sources
    bool preserve = true;  // copy mode/times/owner to targets
    std::size_t chunkSize = 1024 * 1024;
};

// A task or policy broke the resume/decision contract. Not recoverable by
// policy; it terminates the driver.
class ContractError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Raised out of a driver when resume() faulted; what() carries the step
// context and the original exception is nested.
class OperationFault : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

const char* toWire(DecisionTag tag);
const char* toWire(OperationKind op);
const char* toWire(DecisionKind kind);
const char* toWire(SuspensionKind kind);
const char* toWire(EntryKind kind);

std::optional<DecisionTag>   decisionTagFromWire(const std::string& s);
std::optional<OperationKind> operationKindFromWire(const std::string& s);

// Whether "tag" is an acceptable answer for "kind".
bool isLegal(DecisionKind kind, DecisionTag tag);

// Decision kind a suspension asks for, if it is a decision point.
std::optional<DecisionKind> decisionKindFor(SuspensionKind kind);

// 100 * part / whole. Requires whole > 0.
double progressPercent(std::uint64_t part, std::uint64_t whole);

// "overwrite", or "overwrite (all)" for blanket answers.
std::string describe(const Decision& d);

} // namespace fileops
