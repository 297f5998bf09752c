#include "fileops/OperationTask.hpp"
#include "fileops/TreeWalkTask.hpp"

namespace fileops {

bool canonicalTransfers(const std::vector<std::string>& sources,
                        const std::vector<std::string>& targets,
                        std::vector<Transfer>& out,
                        std::string& err) {
    out.clear();
    if (sources.empty()) {
        err = "Missing source argument";
        return false;
    }
    if (targets.empty()) {
        err = "Missing destination argument";
        return false;
    }
    if (targets.size() == 1) {
        for (const auto& s : sources)
            out.push_back({s, targets.front()});
        return true;
    }
    if (targets.size() != sources.size()) {
        err = "Illegal arguments: sources and destinations have different lengths";
        return false;
    }
    for (std::size_t i = 0; i < sources.size(); ++i)
        out.push_back({sources[i], targets[i]});
    return true;
}

std::unique_ptr<OperationTask> createTask(FileSystem& fs,
                                          OperationKind kind,
                                          std::vector<Transfer> transfers,
                                          const TaskOptions& options) {
    return std::make_unique<TreeWalkTask>(fs, kind, std::move(transfers), options);
}

std::unique_ptr<OperationTask> createTask(FileSystem& fs,
                                          OperationKind kind,
                                          const std::vector<std::string>& sources,
                                          const std::optional<std::string>& destination,
                                          const TaskOptions& options,
                                          std::string& err) {
    std::vector<Transfer> transfers;
    if (kind == OperationKind::Delete) {
        if (destination) {
            err = "delete takes no destination";
            return nullptr;
        }
        if (sources.empty()) {
            err = "Missing source argument";
            return nullptr;
        }
        for (const auto& s : sources)
            transfers.push_back({s, std::string()});
    } else {
        std::vector<std::string> targets;
        if (destination)
            targets.push_back(*destination);
        if (!canonicalTransfers(sources, targets, transfers, err))
            return nullptr;
    }
    return createTask(fs, kind, std::move(transfers), options);
}

} // namespace fileops
