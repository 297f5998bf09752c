#include "fileops/Pump.hpp"
#include "fileops/OperationTask.hpp"
#include "fileops/Policy.hpp"

#include <exception>

namespace fileops {

static bool isNotification(SuspensionKind k) {
    return k == SuspensionKind::Starting || k == SuspensionKind::Progress;
}

Pump::Pump(OperationTask& task, Policy& policy) : task_(task), policy_(policy) {}

TaskState Pump::outcome() const {
    return task_.state();
}

void Pump::requestAbort() {
    abortRequested_ = true;
    skipRequested_ = false;
}

void Pump::requestSkip() {
    if (!abortRequested_)
        skipRequested_ = true;
}

Command Pump::nextCommand() {
    Command cmd = pending_;
    pending_.reset();
    if (!last_)
        return cmd; // first resume is always empty
    const SuspensionKind k = last_->kind;
    if (abortRequested_) {
        const auto dk = decisionKindFor(k);
        if (isNotification(k) || (dk && isLegal(*dk, DecisionTag::Abort))) {
            abortRequested_ = false;
            return DecisionTag::Abort;
        }
        return cmd; // partial answer goes first
    }
    if (skipRequested_) {
        skipRequested_ = false;
        if (isNotification(k))
            return DecisionTag::Skip;
    }
    return cmd;
}

std::string Pump::context() const {
    std::string ctx = "file operation step " + std::to_string(steps_);
    if (last_) {
        ctx += std::string(" after ") + toWire(last_->kind);
        if (!last_->src.name.empty())
            ctx += " \"" + last_->src.name + "\"";
        if (last_->dst)
            ctx += " -> \"" + last_->dst->name + "\"";
    }
    return ctx;
}

bool Pump::step() {
    if (finished_)
        throw ContractError("step() called after the task finished");

    ++steps_;
    try {
        const Command cmd = nextCommand();
        Suspension s = task_.resume(cmd);
        dispatch(s);
        last_ = std::move(s);
    } catch (const std::exception& e) {
        finished_ = true;
        std::throw_with_nested(OperationFault(context() + ": " + e.what()));
    }
    return !finished_;
}

void Pump::dispatch(const Suspension& s) {
    if (const auto kind = decisionKindFor(s.kind)) {
        Decision d;
        switch (*kind) {
        case DecisionKind::Overwrite:
            d = policy_.decideOnOverwrite(s.src, s.dst ? *s.dst : Entry{});
            break;
        case DecisionKind::IoError:
            d = policy_.decideOnIoError(s.message);
            break;
        case DecisionKind::Partial:
            d = policy_.decideOnPartial(s.src, s.dst ? *s.dst : Entry{});
            break;
        case DecisionKind::NonEmptyDirDeletion:
            d = policy_.decideOnNonEmptyDirDeletion(s.src);
            break;
        }
        if (!isLegal(*kind, d.tag))
            throw ContractError(std::string("policy answered '") + toWire(d.tag) +
                                "' to a " + toWire(*kind) + " decision");
        pending_ = d.tag;
        return;
    }

    switch (s.kind) {
    case SuspensionKind::Starting:
        policy_.notifyOnOperationStart(s.operation, s.src, s.dst ? &*s.dst : nullptr);
        break;
    case SuspensionKind::Progress:
        if (s.whole == 0)
            throw ContractError("progress reported with whole == 0");
        policy_.notifyOnProgress(s.part, s.whole);
        break;
    case SuspensionKind::Terminated:
    case SuspensionKind::Dead:
        finished_ = true;
        break;
    default:
        break;
    }
}

} // namespace fileops
