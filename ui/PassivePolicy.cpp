#include "PassivePolicy.hpp"

using fileops::Decision;
using fileops::DecisionKind;
using fileops::DecisionTag;

PassivePolicy::PassivePolicy(QWidget* parent) : inner_(parent) {
    seed();
}

PassivePolicy::PassivePolicy(std::unique_ptr<DecisionPrompter> prompter, QWidget* parent)
    : inner_(std::move(prompter), parent) {
    seed();
}

void PassivePolicy::seed() {
    fileops::PolicyState& st = inner_.state();
    st.forAll[DecisionKind::Overwrite] = Decision(DecisionTag::Overwrite, true);
    st.forAll[DecisionKind::IoError] = Decision(DecisionTag::Skip, true);
    st.forAll[DecisionKind::NonEmptyDirDeletion] = Decision(DecisionTag::Delete, true);
    st.passive = true;
}

Decision PassivePolicy::decideOnOverwrite(const fileops::Entry& src, const fileops::Entry& dst) {
    return inner_.decideOnOverwrite(src, dst);
}

Decision PassivePolicy::decideOnIoError(const std::string& message) {
    return inner_.decideOnIoError(message);
}

Decision PassivePolicy::decideOnPartial(const fileops::Entry&, const fileops::Entry&) {
    return Decision(DecisionTag::Delete);
}

Decision PassivePolicy::decideOnNonEmptyDirDeletion(const fileops::Entry& src) {
    return inner_.decideOnNonEmptyDirDeletion(src);
}

void PassivePolicy::notifyOnOperationStart(fileops::OperationKind op, const fileops::Entry& src,
                                           const fileops::Entry* dst) {
    inner_.notifyOnOperationStart(op, src, dst);
}

void PassivePolicy::notifyOnProgress(std::uint64_t part, std::uint64_t whole) {
    inner_.notifyOnProgress(part, whole);
}

void PassivePolicy::start(fileops::OperationTask& task) {
    inner_.runDialog(task, *this);
}
