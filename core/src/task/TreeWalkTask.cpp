// Tree walk for copy, move and delete. Every filesystem failure is routed
// through a need_io_error_decision suspension; nothing here throws for I/O.
#include "fileops/TreeWalkTask.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <utility>

namespace fileops {

namespace {

enum class IoStep {
    Open, Create, Read, Write, CloseTarget, Mkdir, Rmdir, Unlink,
    StatSource, ReadLink, Symlink, OpenDir
};

const char* failureTemplate(IoStep step) {
    switch (step) {
    case IoStep::Open:        return "Cannot open source file";
    case IoStep::Create:      return "Cannot create target file";
    case IoStep::Read:        return "Cannot read source file";
    case IoStep::Write:       return "Cannot write target file";
    case IoStep::CloseTarget: return "Cannot close target file";
    case IoStep::Mkdir:       return "Cannot create target directory";
    case IoStep::Rmdir:       return "Cannot remove directory";
    case IoStep::Unlink:      return "Cannot remove file";
    case IoStep::StatSource:  return "Cannot stat source file";
    case IoStep::ReadLink:    return "Cannot read source link";
    case IoStep::Symlink:     return "Cannot create target symlink";
    case IoStep::OpenDir:     return "Cannot read directory";
    }
    return "I/O error on";
}

std::string failure(IoStep step, const std::string& path, const std::string& reason) {
    return std::string(failureTemplate(step)) + " \"" + path + "\"\n" + reason;
}

} // namespace

TreeWalkTask::TreeWalkTask(FileSystem& fs, OperationKind kind,
                           std::vector<Transfer> transfers,
                           const TaskOptions& options)
    : fs_(fs), kind_(kind), transfers_(std::move(transfers)), options_(options) {}

TreeWalkTask::~TreeWalkTask() = default;

Suspension TreeWalkTask::resume(const Command& command) {
    if (state_ == TaskState::Terminated || state_ == TaskState::Dead)
        throw ContractError("resume() called on a finished task");
    out_.reset();
    if (!started_) {
        if (command)
            throw ContractError(std::string("first resume() must not carry a command, got '") +
                                toWire(*command) + "'");
        started_ = true;
    } else {
        // An abort answer suspends right here, with a partial question or
        // the terminal result.
        applyCommand(command);
    }
    state_ = TaskState::Running;

    while (!out_) {
        if (stack_.empty()) {
            if (nextTransfer_ < transfers_.size()) {
                const Transfer& t = transfers_[nextTransfer_++];
                Frame f;
                f.srcPath = t.source;
                f.dstPath = t.target;
                stack_.push_back(std::move(f));
                continue;
            }
            state_ = TaskState::Dead;
            Suspension s;
            s.kind = SuspensionKind::Dead;
            s.operation = kind_;
            return s;
        }
        step(stack_.back());
    }

    if (out_->kind == SuspensionKind::Terminated)
        state_ = TaskState::Terminated;
    else
        state_ = TaskState::Suspended;
    return *out_;
}

void TreeWalkTask::applyCommand(const Command& command) {
    const Await await = awaiting_;
    awaiting_ = Await::None;

    if (await == Await::Notification) {
        if (!command)
            return;
        if (*command == DecisionTag::Abort)
            beginAbort();
        else if (*command == DecisionTag::Skip)
            skipCurrent();
        else
            throw ContractError(std::string("'") + toWire(*command) +
                                "' is not a valid reply to a notification");
        return;
    }

    DecisionKind kind = DecisionKind::IoError;
    switch (await) {
    case Await::Overwrite:   kind = DecisionKind::Overwrite; break;
    case Await::IoError:     kind = DecisionKind::IoError; break;
    case Await::Partial:     kind = DecisionKind::Partial; break;
    case Await::NonEmptyDir: kind = DecisionKind::NonEmptyDirDeletion; break;
    default:
        throw ContractError("resume() called while no suspension is pending");
    }
    if (!command)
        throw ContractError(std::string("missing answer for ") + toWire(kind) + " decision");
    if (!isLegal(kind, *command))
        throw ContractError(std::string("'") + toWire(*command) +
                            "' is not a valid answer for " + toWire(kind) + " decision");

    Frame& f = stack_.back();
    const DecisionTag tag = *command;
    switch (await) {
    case Await::Overwrite:
        applyOverwrite(f, tag);
        break;
    case Await::IoError:
        if (tag == DecisionTag::Abort || terminating_)
            beginAbort();
        else
            f.phase = f.afterIoSkip;
        break;
    case Await::Partial:
        applyPartial(f, tag);
        break;
    case Await::NonEmptyDir:
        if (tag == DecisionTag::Abort) {
            beginAbort();
        } else if (tag == DecisionTag::Skip) {
            f.phase = Phase::Fail;
        } else {
            f.recursive = true;
            f.phase = Phase::NextChild;
        }
        break;
    default:
        break;
    }
}

void TreeWalkTask::applyOverwrite(Frame& f, DecisionTag tag) {
    const Phase proceed = kind_ == OperationKind::Move ? Phase::TryRename
                                                       : Phase::Dispatch;
    switch (tag) {
    case DecisionTag::Abort:
        beginAbort();
        return;
    case DecisionTag::Skip:
        f.phase = Phase::Fail;
        return;
    case DecisionTag::Update:
        // Target is up to date.
        if (f.src.stat.mtime <= f.dst.stat.mtime) {
            f.phase = Phase::Fail;
            return;
        }
        f.phase = proceed;
        return;
    case DecisionTag::Reget:
        f.reget = true;
        f.phase = proceed;
        return;
    default:
        f.phase = proceed;
        return;
    }
}

void TreeWalkTask::applyPartial(Frame& f, DecisionTag tag) {
    f.reader.reset();
    f.writer.reset();
    f.written = 0;
    if (tag == DecisionTag::Delete) {
        std::string err;
        if (!fs_.removeFile(f.dst.name, err)) {
            ioError(f, failure(IoStep::Unlink, f.dst.name, err), Phase::Fail);
            return;
        }
    }
    if (terminating_) {
        beginAbort();
        return;
    }
    f.phase = Phase::Fail;
}

void TreeWalkTask::suspend(SuspensionKind kind, Await await, const Frame* f) {
    Suspension s;
    s.kind = kind;
    s.operation = kind_;
    if (f) {
        s.src = f->src;
        if (kind_ != OperationKind::Delete)
            s.dst = f->dst;
    }
    out_ = std::move(s);
    awaiting_ = await;
}

void TreeWalkTask::ioError(Frame& f, const std::string& message, Phase afterSkip) {
    f.afterIoSkip = afterSkip;
    suspend(SuspensionKind::NeedIoErrorDecision, Await::IoError, &f);
    out_->message = message;
}

void TreeWalkTask::beginAbort() {
    terminating_ = true;
    if (!stack_.empty()) {
        Frame& f = stack_.back();
        if (f.writer && f.written > 0) {
            // Let the policy dispose of the half-written target first.
            f.reader.reset();
            f.writer.reset();
            suspend(SuspensionKind::NeedPartialDecision, Await::Partial, &f);
            return;
        }
    }
    stack_.clear();
    Suspension s;
    s.kind = SuspensionKind::Terminated;
    s.operation = kind_;
    out_ = std::move(s);
}

void TreeWalkTask::skipCurrent() {
    Frame& f = stack_.back();
    if (f.writer && f.written > 0)
        f.phase = Phase::AskPartial;
    else
        f.phase = Phase::Fail;
}

void TreeWalkTask::finish(bool ok) {
    stack_.pop_back();
    if (!stack_.empty() && !ok)
        stack_.back().childrenOk = false;
}

void TreeWalkTask::step(Frame& f) {
    switch (f.phase) {
    case Phase::Begin:
        buildEntries(f);
        return;
    case Phase::Announce:
        f.phase = kind_ == OperationKind::Delete
                      ? (f.src.isDirectory() ? Phase::ListDir : Phase::DeleteFile)
                      : Phase::CheckOverwrite;
        suspend(SuspensionKind::Starting, Await::Notification, &f);
        return;
    case Phase::CheckOverwrite:
        f.phase = kind_ == OperationKind::Move ? Phase::TryRename : Phase::Dispatch;
        if (f.dst.exists && f.dst.stat.kind != EntryKind::Directory)
            suspend(SuspensionKind::NeedOverwriteDecision, Await::Overwrite, &f);
        return;
    case Phase::TryRename: {
        std::string err;
        int errnum = 0;
        if (fs_.rename(f.src.name, f.dst.name, err, errnum)) {
            finish(true);
            return;
        }
        if (errnum == EINVAL) {
            ioError(f, "An attempt was made to make '" + f.src.name +
                           "' a subdirectory ('" + f.dst.name + "') of itself.",
                    Phase::Fail);
            return;
        }
        // Not on the same device (or a filesystem that reports something
        // else for it): fall back to copy + delete.
        f.phase = Phase::Dispatch;
        return;
    }
    case Phase::Dispatch:
        switch (f.src.stat.kind) {
        case EntryKind::File:
            f.phase = Phase::OpenFile;
            break;
        case EntryKind::Directory:
            f.phase = Phase::MakeDir;
            break;
        case EntryKind::Symlink:
            f.phase = Phase::CopyLink;
            break;
        default:
            ioError(f, std::string("I don't know how to copy files of type '") +
                           toWire(f.src.stat.kind) + "'",
                    Phase::Fail);
            break;
        }
        return;
    case Phase::OpenFile:
        openFile(f);
        return;
    case Phase::CopyChunk:
        copyChunk(f);
        return;
    case Phase::AskPartial:
        f.phase = Phase::Fail;
        suspend(SuspensionKind::NeedPartialDecision, Await::Partial, &f);
        return;
    case Phase::CloseFile:
        closeFile(f);
        return;
    case Phase::RemoveSource: {
        std::string err;
        if (!fs_.removeFile(f.src.name, err)) {
            ioError(f, failure(IoStep::Unlink, f.src.name, err), Phase::Fail);
            return;
        }
        finish(true);
        return;
    }
    case Phase::MakeDir:
        makeDir(f);
        return;
    case Phase::ListDir:
        listDir(f);
        return;
    case Phase::NextChild:
        nextChild(f);
        return;
    case Phase::FinishDir:
        finishDir(f);
        return;
    case Phase::CopyLink:
        copyLink(f);
        return;
    case Phase::DeleteFile: {
        std::string err;
        if (!fs_.removeFile(f.src.name, err)) {
            ioError(f, failure(IoStep::Unlink, f.src.name, err), Phase::Fail);
            return;
        }
        finish(true);
        return;
    }
    case Phase::Fail:
        finish(false);
        return;
    }
}

void TreeWalkTask::buildEntries(Frame& f) {
    std::string err;
    if (kind_ != OperationKind::Delete) {
        f.dst = Entry{};
        f.dst.name = f.dstPath;
        f.dst.exists = fs_.stat(f.dst.name, true, f.dst.stat, err);
        if (!f.dstIsFinal && f.dst.isDirectory()) {
            f.dst = Entry{};
            f.dst.name = joinPath(f.dstPath, baseName(f.srcPath));
            f.dst.exists = fs_.stat(f.dst.name, true, f.dst.stat, err);
        }
        // A target we cannot stat is treated as missing; creating it will
        // report the real problem.
        err.clear();
    }

    f.src = Entry{};
    f.src.name = f.srcPath;
    f.src.exists = fs_.stat(f.src.name, options_.deref, f.src.stat, err);
    if (!f.src.exists) {
        if (err.empty())
            err = std::strerror(ENOENT);
        ioError(f, failure(IoStep::StatSource, f.src.name, err), Phase::Fail);
        return;
    }
    f.phase = Phase::Announce;
}

void TreeWalkTask::openFile(Frame& f) {
    if (f.dst.exists && f.dst.stat.device == f.src.stat.device &&
        f.dst.stat.inode == f.src.stat.inode) {
        ioError(f, "\"" + f.src.name + "\"\nand\n\"" + f.dst.name +
                       "\"\nare the same file",
                Phase::Fail);
        return;
    }

    std::string err;
    f.reader = fs_.openRead(f.src.name, err);
    if (!f.reader) {
        ioError(f, failure(IoStep::Open, f.src.name, err), Phase::Fail);
        return;
    }

    f.copied = 0;
    bool append = false;
    if (f.reget && f.dst.exists) {
        std::string seekErr;
        if (f.reader->seek(f.dst.stat.size, seekErr)) {
            append = true;
            f.copied = f.dst.stat.size;
        } else {
            // Cannot seek: fall back to a full copy from a fresh handle.
            f.reader = fs_.openRead(f.src.name, err);
            if (!f.reader) {
                ioError(f, failure(IoStep::Open, f.src.name, err), Phase::Fail);
                return;
            }
        }
    }

    f.writer = fs_.openWrite(f.dst.name, append, err);
    if (!f.writer) {
        f.reader.reset();
        ioError(f, failure(IoStep::Create, f.dst.name, err), Phase::Fail);
        return;
    }
    f.written = 0;
    f.phase = Phase::CopyChunk;
}

void TreeWalkTask::copyChunk(Frame& f) {
    std::string buf;
    std::string err;
    if (!f.reader->read(buf, options_.chunkSize, err)) {
        ioError(f, failure(IoStep::Read, f.src.name, err), Phase::Fail);
        return;
    }
    if (buf.empty()) {
        f.phase = Phase::CloseFile;
        return;
    }
    if (!f.writer->write(buf, err)) {
        ioError(f, failure(IoStep::Write, f.dst.name, err), Phase::AskPartial);
        return;
    }
    f.copied += buf.size();
    f.written += buf.size();

    suspend(SuspensionKind::Progress, Await::Notification, &f);
    out_->part = f.copied;
    out_->whole = std::max<std::uint64_t>(f.src.stat.size, f.copied);
}

void TreeWalkTask::closeFile(Frame& f) {
    f.reader.reset();
    std::string err;
    const bool closed = f.writer->close(err);
    f.writer.reset();
    if (!closed) {
        ioError(f, failure(IoStep::CloseTarget, f.dst.name, err), Phase::Fail);
        return;
    }
    if (options_.preserve)
        fs_.copyAttributes(f.dst.name, f.src.stat);
    if (kind_ == OperationKind::Move) {
        f.phase = Phase::RemoveSource;
        return;
    }
    finish(true);
}

void TreeWalkTask::copyLink(Frame& f) {
    std::string target;
    std::string err;
    if (!fs_.readLink(f.src.name, target, err)) {
        ioError(f, failure(IoStep::ReadLink, f.src.name, err), Phase::Fail);
        return;
    }
    if (f.dst.exists && !fs_.removeFile(f.dst.name, err)) {
        ioError(f, failure(IoStep::Unlink, f.dst.name, err), Phase::Fail);
        return;
    }
    if (!fs_.symlink(target, f.dst.name, err)) {
        ioError(f, failure(IoStep::Symlink, f.dst.name, err), Phase::Fail);
        return;
    }
    if (kind_ == OperationKind::Move) {
        f.phase = Phase::RemoveSource;
        return;
    }
    finish(true);
}

void TreeWalkTask::makeDir(Frame& f) {
    if (!f.dst.exists) {
        std::string err;
        if (!fs_.mkdir(f.dst.name, err)) {
            ioError(f, failure(IoStep::Mkdir, f.dst.name, err), Phase::Fail);
            return;
        }
    } else if (!f.dst.isDirectory()) {
        ioError(f, "Destination \"" + f.dst.name + "\" must be a directory\n",
                Phase::Fail);
        return;
    }
    f.phase = Phase::ListDir;
}

void TreeWalkTask::listDir(Frame& f) {
    std::string err;
    if (!fs_.list(f.src.name, f.children, err)) {
        ioError(f, failure(IoStep::OpenDir, f.src.name, err), Phase::Fail);
        return;
    }
    f.next = 0;
    f.phase = Phase::NextChild;
    if (kind_ == OperationKind::Delete && !f.children.empty() && !f.recursive)
        suspend(SuspensionKind::NeedNonEmptyDirDecision, Await::NonEmptyDir, &f);
}

void TreeWalkTask::nextChild(Frame& f) {
    if (f.next >= f.children.size()) {
        f.phase = Phase::FinishDir;
        return;
    }
    const std::string& name = f.children[f.next++];
    Frame child;
    child.srcPath = joinPath(f.src.name, name);
    if (kind_ != OperationKind::Delete)
        child.dstPath = joinPath(f.dst.name, name);
    child.dstIsFinal = true;
    child.recursive = f.recursive;
    // "f" is invalidated by the push.
    stack_.push_back(std::move(child));
}

void TreeWalkTask::finishDir(Frame& f) {
    if (kind_ != OperationKind::Delete && options_.preserve) {
        // After the contents: the directory may lose its write permission.
        fs_.copyAttributes(f.dst.name, f.src.stat);
    }
    if (kind_ == OperationKind::Copy) {
        finish(true);
        return;
    }
    if (!f.childrenOk) {
        finish(false);
        return;
    }
    std::string err;
    if (!fs_.removeDir(f.src.name, err)) {
        ioError(f, failure(IoStep::Rmdir, f.src.name, err), Phase::Fail);
        return;
    }
    finish(true);
}

} // namespace fileops
