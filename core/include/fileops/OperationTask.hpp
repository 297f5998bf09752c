// Contract of a cooperatively suspendable file operation. The driver is the
// only caller of resume(); the task stops at every decision point and every
// progress checkpoint and waits for the next resume().
#pragma once
#include "FileOpsTypes.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fileops {

class FileSystem;

// One source/target pair. For delete the target is empty.
struct Transfer {
    std::string source;
    std::string target;
};

class OperationTask {
public:
    virtual ~OperationTask() = default;

    // Advances until the next suspension point or the end. The first call
    // takes an empty command; later calls take the answer to the previous
    // suspension (or abort). Throws ContractError on misuse.
    virtual Suspension resume(const Command& command) = 0;

    virtual TaskState state() const = 0;
    virtual OperationKind kind() const = 0;

    bool finished() const {
        const TaskState s = state();
        return s == TaskState::Terminated || s == TaskState::Dead;
    }
};

// Pairs sources with targets: one target for every source, or one target
// per source. Returns false and fills "err" on mismatched lists.
bool canonicalTransfers(const std::vector<std::string>& sources,
                        const std::vector<std::string>& targets,
                        std::vector<Transfer>& out,
                        std::string& err);

std::unique_ptr<OperationTask> createTask(FileSystem& fs,
                                          OperationKind kind,
                                          std::vector<Transfer> transfers,
                                          const TaskOptions& options);

// Convenience form: copy/move need a destination, delete must not get one.
// Returns nullptr and fills "err" on invalid arguments.
std::unique_ptr<OperationTask> createTask(FileSystem& fs,
                                          OperationKind kind,
                                          const std::vector<std::string>& sources,
                                          const std::optional<std::string>& destination,
                                          const TaskOptions& options,
                                          std::string& err);

} // namespace fileops
