// Unattended policy: fixed answers, one line per started entry, tight pump
// loop. Behaves like the shell's cp/mv/rm.
#pragma once
#include "Policy.hpp"
#include <iosfwd>

namespace fileops {

class BatchPolicy : public Policy {
public:
    explicit BatchPolicy(std::ostream& out);
    BatchPolicy();

    Decision decideOnOverwrite(const Entry& src, const Entry& dst) override;
    Decision decideOnIoError(const std::string& message) override;
    Decision decideOnPartial(const Entry& src, const Entry& dst) override;
    Decision decideOnNonEmptyDirDeletion(const Entry& src) override;

    void notifyOnOperationStart(OperationKind op, const Entry& src,
                                const Entry* dst) override;
    void notifyOnProgress(std::uint64_t part, std::uint64_t whole) override;

    void start(OperationTask& task) override;

    PolicyState& state() override { return state_; }
    const PolicyState& state() const override { return state_; }

private:
    std::ostream& out_;
    PolicyState state_;
};

} // namespace fileops
