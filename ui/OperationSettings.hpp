// Persistent defaults for new operations (QSettings "Operations/*").
#pragma once
#include "fileops/Policy.hpp"

class QSettings;

struct OperationSettings {
    bool followSymlinks = false;
    bool preserveAttributes = true;
    int chunkSizeKiB = 1024;
};

static constexpr int kMinChunkSizeKiB = 4;
static constexpr int kMaxChunkSizeKiB = 64 * 1024;

OperationSettings loadOperationSettings(const QSettings& s);
// Reads QSettings("FileOps", "FileOps").
OperationSettings loadOperationSettings();
void saveOperationSettings(QSettings& s, const OperationSettings& opts);

void applyOperationSettings(const OperationSettings& opts, fileops::PolicyState& st);
