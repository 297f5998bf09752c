#include "OperationSettings.hpp"

#include <QSettings>

#include <algorithm>

OperationSettings loadOperationSettings(const QSettings& s) {
    OperationSettings opts;
    opts.followSymlinks = s.value("Operations/followSymlinks", false).toBool();
    opts.preserveAttributes = s.value("Operations/preserveAttributes", true).toBool();
    opts.chunkSizeKiB = std::clamp(s.value("Operations/chunkSizeKiB", 1024).toInt(),
                                   kMinChunkSizeKiB, kMaxChunkSizeKiB);
    return opts;
}

OperationSettings loadOperationSettings() {
    QSettings s("FileOps", "FileOps");
    return loadOperationSettings(s);
}

void saveOperationSettings(QSettings& s, const OperationSettings& opts) {
    s.setValue("Operations/followSymlinks", opts.followSymlinks);
    s.setValue("Operations/preserveAttributes", opts.preserveAttributes);
    s.setValue("Operations/chunkSizeKiB",
               std::clamp(opts.chunkSizeKiB, kMinChunkSizeKiB, kMaxChunkSizeKiB));
}

void applyOperationSettings(const OperationSettings& opts, fileops::PolicyState& st) {
    st.deref = opts.followSymlinks;
    st.preserve = opts.preserveAttributes;
    st.chunkSize = static_cast<std::size_t>(
                       std::clamp(opts.chunkSizeKiB, kMinChunkSizeKiB, kMaxChunkSizeKiB)) *
                   1024;
}
