// Unattended policy with a progress dialog: the batch answers, no buttons,
// and the dialog cannot be closed while the task runs.
#pragma once
#include "InteractivePolicy.hpp"

class PassivePolicy : public fileops::Policy {
public:
    explicit PassivePolicy(QWidget* parent = nullptr);
    // For tests: the inner policy never needs to prompt, so any prompter
    // being consulted is a defect the caller can observe.
    PassivePolicy(std::unique_ptr<DecisionPrompter> prompter, QWidget* parent = nullptr);

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

    fileops::PolicyState& state() override { return inner_.state(); }
    const fileops::PolicyState& state() const override { return inner_.state(); }

    OperationDialog* dialog() const { return inner_.dialog(); }

private:
    void seed();

    InteractivePolicy inner_;
};
