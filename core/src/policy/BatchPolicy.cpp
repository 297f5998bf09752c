#include "fileops/BatchPolicy.hpp"
#include "fileops/Pump.hpp"

#include <iostream>

namespace fileops {

BatchPolicy::BatchPolicy(std::ostream& out) : out_(out) {}

BatchPolicy::BatchPolicy() : BatchPolicy(std::cout) {}

Decision BatchPolicy::decideOnOverwrite(const Entry&, const Entry&) {
    return Decision(DecisionTag::Overwrite);
}

Decision BatchPolicy::decideOnIoError(const std::string&) {
    return Decision(DecisionTag::Skip);
}

Decision BatchPolicy::decideOnPartial(const Entry&, const Entry&) {
    return Decision(DecisionTag::Delete);
}

Decision BatchPolicy::decideOnNonEmptyDirDeletion(const Entry&) {
    return Decision(DecisionTag::Delete);
}

void BatchPolicy::notifyOnOperationStart(OperationKind op, const Entry& src,
                                         const Entry* dst) {
    if (op == OperationKind::Delete || !dst)
        out_ << "rm " << src.name << "\n";
    else
        out_ << src.name << " -> " << dst->name << "\n";
}

void BatchPolicy::notifyOnProgress(std::uint64_t, std::uint64_t) {}

void BatchPolicy::start(OperationTask& task) {
    Pump pump(task, *this);
    while (pump.step()) {
    }
}

} // namespace fileops
