// Copy/move/delete engine over a FileSystem, written as an explicit state
// machine: a stack of per-entry frames, each in one phase, advanced by
// resume() until a suspension is produced.
#pragma once
#include "FileSystem.hpp"
#include "OperationTask.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fileops {

class TreeWalkTask : public OperationTask {
public:
    TreeWalkTask(FileSystem& fs, OperationKind kind,
                 std::vector<Transfer> transfers, const TaskOptions& options);
    ~TreeWalkTask() override;

    Suspension resume(const Command& command) override;
    TaskState state() const override { return state_; }
    OperationKind kind() const override { return kind_; }

private:
    enum class Phase {
        Begin,
        Announce,
        CheckOverwrite,
        TryRename,
        Dispatch,
        OpenFile,
        CopyChunk,
        AskPartial,
        CloseFile,
        RemoveSource,
        MakeDir,
        ListDir,
        NextChild,
        FinishDir,
        CopyLink,
        DeleteFile,
        Fail
    };

    // What the last suspension is waiting for.
    enum class Await { None, Notification, Overwrite, IoError, Partial, NonEmptyDir };

    struct Frame {
        Phase phase = Phase::Begin;
        std::string srcPath;
        std::string dstPath;
        bool dstIsFinal = false;
        bool recursive = false; // delete: non-empty dirs need no confirmation
        Entry src;
        Entry dst;
        bool reget = false;
        std::unique_ptr<FileReader> reader;
        std::unique_ptr<FileWriter> writer;
        std::uint64_t copied = 0;  // target size so far
        std::uint64_t written = 0; // bytes written by this task
        std::vector<std::string> children;
        std::size_t next = 0;
        bool childrenOk = true;
        Phase afterIoSkip = Phase::Fail;
    };

    void step(Frame& f);
    void applyCommand(const Command& command);
    void applyOverwrite(Frame& f, DecisionTag tag);
    void applyPartial(Frame& f, DecisionTag tag);

    void buildEntries(Frame& f);
    void openFile(Frame& f);
    void copyChunk(Frame& f);
    void closeFile(Frame& f);
    void copyLink(Frame& f);
    void makeDir(Frame& f);
    void listDir(Frame& f);
    void nextChild(Frame& f);
    void finishDir(Frame& f);

    void suspend(SuspensionKind kind, Await await, const Frame* f);
    void ioError(Frame& f, const std::string& message, Phase afterSkip);
    void beginAbort();
    void skipCurrent();
    void finish(bool ok);

    FileSystem& fs_;
    const OperationKind kind_;
    const std::vector<Transfer> transfers_;
    const TaskOptions options_;

    std::vector<Frame> stack_;
    std::size_t nextTransfer_ = 0;
    TaskState state_ = TaskState::Suspended;
    bool started_ = false;
    bool terminating_ = false;
    Await awaiting_ = Await::None;
    std::optional<Suspension> out_;
};

} // namespace fileops
