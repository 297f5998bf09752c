// Drives a task from the dialog's idle hook, one pump step per tick.
// Modal prompts inside a step run nested event loops; ticks arriving then
// are dropped. Faults close the dialog and are rethrown from run().
#pragma once
#include "fileops/Pump.hpp"

#include <QObject>
#include <exception>

class OperationDialog;

namespace fileops {
class OperationTask;
class Policy;
}

class DialogPump : public QObject {
    Q_OBJECT
public:
    DialogPump(fileops::OperationTask& task, fileops::Policy& answerer,
               OperationDialog& dialog, bool passive);

    // Shows the dialog modally until the task is terminal.
    void run();

    bool finished() const { return tornDown_; }
    const fileops::Pump& pump() const { return pump_; }

private slots:
    void onIdle();
    void onSkip();

private:
    bool onCloseRequested();
    void stepOnce();
    void teardown();

    fileops::Pump pump_;
    OperationDialog& dialog_;
    bool passive_;
    bool inStep_ = false;
    bool tornDown_ = false;
    std::exception_ptr fault_;
};
