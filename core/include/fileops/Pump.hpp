// One-step driver shared by every policy variant: resume the task once,
// route the suspension to exactly one policy call, keep the answer for the
// next step. Batch loops it; dialogs call it once per idle tick.
#pragma once
#include "FileOpsTypes.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace fileops {

class OperationTask;
class Policy;

class Pump {
public:
    Pump(OperationTask& task, Policy& policy);

    // Runs one resume step. Returns false once the task is terminal.
    // Faults from the task or an illegal policy answer are rethrown as
    // OperationFault with the step context, original exception nested.
    bool step();

    // Deliver abort at the first suspension that accepts it. A pending
    // partial-file answer is delivered first.
    void requestAbort();
    // Skip the current entry; honored only right after a notification.
    void requestSkip();

    bool finished() const { return finished_; }
    bool abortPending() const { return abortRequested_; }
    TaskState outcome() const;
    std::size_t steps() const { return steps_; }
    const std::optional<Suspension>& last() const { return last_; }

private:
    void dispatch(const Suspension& s);
    Command nextCommand();
    std::string context() const;

    OperationTask& task_;
    Policy& policy_;
    Command pending_;
    std::optional<Suspension> last_;
    std::size_t steps_ = 0;
    bool finished_ = false;
    bool abortRequested_ = false;
    bool skipRequested_ = false;
};

} // namespace fileops
