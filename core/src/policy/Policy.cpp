#include "fileops/Policy.hpp"

namespace fileops {

std::optional<Decision> PolicyState::recall(DecisionKind kind) const {
    auto it = forAll.find(kind);
    if (it == forAll.end())
        return std::nullopt;
    return it->second;
}

const Decision& PolicyState::remember(DecisionKind kind, const Decision& d) {
    if (d.forAll)
        forAll[kind] = d;
    return d;
}

TaskOptions Policy::taskOptions() const {
    const PolicyState& st = state();
    TaskOptions o;
    o.deref = st.deref;
    o.preserve = st.preserve;
    o.chunkSize = st.chunkSize;
    return o;
}

} // namespace fileops
