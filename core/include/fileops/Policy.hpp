// Pluggable decision maker consulted on the task's behalf. Variants (batch,
// interactive, passive) differ in how they answer and how they pump the task,
// never in the contract.
#pragma once
#include "FileOpsTypes.hpp"
#include <map>
#include <optional>
#include <string>

namespace fileops {

class OperationTask;

// Per-policy memory. Only the policy's own decision methods touch forAll.
struct PolicyState {
    bool deref = false;
    bool preserve = true;
    std::map<DecisionKind, Decision> forAll; // blanket answers
    bool passive = false;
    std::size_t chunkSize = 1024 * 1024;

    std::optional<Decision> recall(DecisionKind kind) const;
    // Stores "d" when it is a blanket answer; returns "d" unchanged.
    const Decision& remember(DecisionKind kind, const Decision& d);
};

class Policy {
public:
    virtual ~Policy() = default;

    virtual Decision decideOnOverwrite(const Entry& src, const Entry& dst) = 0;
    virtual Decision decideOnIoError(const std::string& message) = 0;
    virtual Decision decideOnPartial(const Entry& src, const Entry& dst) = 0;
    virtual Decision decideOnNonEmptyDirDeletion(const Entry& src) = 0;

    // dst is null for delete.
    virtual void notifyOnOperationStart(OperationKind op, const Entry& src,
                                        const Entry* dst) = 0;
    // whole > 0, part <= whole.
    virtual void notifyOnProgress(std::uint64_t part, std::uint64_t whole) = 0;

    // Drives "task" until it is terminal.
    virtual void start(OperationTask& task) = 0;

    virtual PolicyState& state() = 0;
    virtual const PolicyState& state() const = 0;

    // Engine options derived from the state, for createTask().
    TaskOptions taskOptions() const;
};

} // namespace fileops
