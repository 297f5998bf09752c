// Policy that asks the user. Undecided questions become modal prompts; the
// task is pumped from the progress dialog's idle hook.
#pragma once
#include "DecisionPrompter.hpp"
#include "OperationDialog.hpp"

#include "fileops/Policy.hpp"

#include <memory>

class QWidget;

class InteractivePolicy : public fileops::Policy {
public:
    explicit InteractivePolicy(QWidget* parent = nullptr);
    // prompter must not be null.
    InteractivePolicy(std::unique_ptr<DecisionPrompter> prompter, QWidget* parent = nullptr);
    ~InteractivePolicy() override;

    fileops::Decision decideOnOverwrite(const fileops::Entry& src,
                                        const fileops::Entry& dst) override;
    fileops::Decision decideOnIoError(const std::string& message) override;
    fileops::Decision decideOnPartial(const fileops::Entry& src,
                                      const fileops::Entry& dst) override;
    fileops::Decision decideOnNonEmptyDirDeletion(const fileops::Entry& src) override;

    void notifyOnOperationStart(fileops::OperationKind op, const fileops::Entry& src,
                                const fileops::Entry* dst) override;
    void notifyOnProgress(std::uint64_t part, std::uint64_t whole) override;

    void start(fileops::OperationTask& task) override;

    // Shows the progress dialog and pumps "task" on its idle ticks; decisions
    // and notifications go to "answerer". Returns once the task is terminal.
    void runDialog(fileops::OperationTask& task, fileops::Policy& answerer);

    fileops::PolicyState& state() override { return state_; }
    const fileops::PolicyState& state() const override { return state_; }

    // Live only while start() runs.
    OperationDialog* dialog() const { return dialog_.get(); }
    int consultations() const { return consultations_; }

private:
    fileops::Decision consult(const PromptRequest& req);
    QString dialogTitle() const;

    std::unique_ptr<DecisionPrompter> prompter_;
    QWidget* parent_;                          // not owned
    fileops::PolicyState state_;
    std::unique_ptr<OperationDialog> dialog_;
    fileops::OperationKind operation_ = fileops::OperationKind::Copy;
    int consultations_ = 0;
};
