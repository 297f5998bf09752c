// Idle-tick pumping, close hook and fault capture for operation dialogs.
#include "DialogPump.hpp"
#include "OperationDialog.hpp"

#include "fileops/OperationTask.hpp"
#include "fileops/Policy.hpp"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(ocOps, "fileops.operation")

DialogPump::DialogPump(fileops::OperationTask& task, fileops::Policy& answerer,
                       OperationDialog& dialog, bool passive)
    : pump_(task, answerer), dialog_(dialog), passive_(passive) {
    connect(&dialog_, &OperationDialog::idle, this, &DialogPump::onIdle);
    connect(&dialog_, &OperationDialog::skipRequested, this, &DialogPump::onSkip);
    dialog_.setCloseGuard([this] { return onCloseRequested(); });
}

void DialogPump::run() {
    dialog_.setIdleEnabled(true);
    dialog_.exec();
    if (!tornDown_) {
        // exec() can only return early if the application is quitting.
        qCWarning(ocOps) << "Operation dialog closed before the task finished; aborting";
        pump_.requestAbort();
        while (!tornDown_)
            stepOnce();
    }
    if (fault_)
        std::rethrow_exception(fault_);
}

void DialogPump::onIdle() {
    if (inStep_ || tornDown_)
        return;
    stepOnce();
}

void DialogPump::onSkip() {
    if (tornDown_)
        return;
    pump_.requestSkip();
}

void DialogPump::stepOnce() {
    inStep_ = true;
    try {
        const bool more = pump_.step();
        inStep_ = false;
        if (!more)
            teardown();
    } catch (const std::exception& e) {
        inStep_ = false;
        qCWarning(ocOps) << "Operation fault:" << e.what();
        fault_ = std::current_exception();
        teardown();
    }
}

// Passive dialogs refuse to close while the task runs. Otherwise the close
// becomes an abort; the task may still ask about a partial file before it
// ends, and the dialog closes when it does.
bool DialogPump::onCloseRequested() {
    if (tornDown_)
        return true;
    if (passive_)
        return false;

    qCInfo(ocOps) << "Close requested; aborting operation";
    pump_.requestAbort();
    if (inStep_) {
        dialog_.setIdleEnabled(true);
        return false;
    }
    dialog_.setIdleEnabled(false);
    while (!tornDown_)
        stepOnce();
    return true;
}

void DialogPump::teardown() {
    if (tornDown_)
        return;
    tornDown_ = true;
    qCInfo(ocOps) << "Operation finished:"
                  << (pump_.outcome() == fileops::TaskState::Dead ? "completed" : "terminated")
                  << "after" << pump_.steps() << "steps";
    dialog_.finish();
}
