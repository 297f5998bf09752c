// fileops host: runs one copy/move/delete on the local filesystem with the
// chosen policy variant.
#include "PolicyFactory.hpp"
#include "UiAlerts.hpp"

#include "fileops/LocalFileSystem.hpp"
#include "fileops/OperationTask.hpp"
#include "fileops/RuntimeLogging.hpp"

#include <QApplication>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>

#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

Q_DECLARE_LOGGING_CATEGORY(ocOps)

// The application object must exist before the parser, and only the dialog
// variants need a GUI one.
static bool wantsGui(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        const char* value = nullptr;
        if (std::strcmp(a, "--mode") == 0 || std::strcmp(a, "-m") == 0)
            value = (i + 1 < argc) ? argv[i + 1] : nullptr;
        else if (std::strncmp(a, "--mode=", 7) == 0)
            value = a + 7;
        if (value) {
            const auto v = policyVariantFromName(QString::fromLocal8Bit(value));
            return v && *v != PolicyVariant::Batch;
        }
    }
    return false;
}

static void printNested(const std::exception& e, int depth = 0) {
    std::cerr << std::string(static_cast<std::size_t>(depth) * 2, ' ') << e.what() << "\n";
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& inner) {
        printNested(inner, depth + 1);
    }
}

int main(int argc, char* argv[]) {
    const bool gui = wantsGui(argc, argv);
    std::unique_ptr<QCoreApplication> app;
    if (gui)
        app = std::make_unique<QApplication>(argc, argv);
    else
        app = std::make_unique<QCoreApplication>(argc, argv);
    QCoreApplication::setOrganizationName("FileOps");
    QCoreApplication::setApplicationName("FileOps");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QCoreApplication::translate("main", "Copy, move or delete files and directory trees."));
    parser.addHelpOption();
    QCommandLineOption modeOpt(QStringList() << "m" << "mode",
                               QCoreApplication::translate("main", "Policy: batch, interactive or passive."),
                               "mode", "batch");
    QCommandLineOption derefOpt("deref",
                                QCoreApplication::translate("main", "Follow symbolic links in sources."));
    QCommandLineOption noPreserveOpt("no-preserve",
                                     QCoreApplication::translate("main", "Do not copy mode, times and owner."));
    parser.addOption(modeOpt);
    parser.addOption(derefOpt);
    parser.addOption(noPreserveOpt);
    parser.addPositionalArgument("operation", "copy, move or delete");
    parser.addPositionalArgument("paths", "SRC... [DST]", "<paths...>");
    parser.process(*app);

    const auto variant = policyVariantFromName(parser.value(modeOpt));
    if (!variant) {
        std::cerr << "fileops: unknown mode '" << parser.value(modeOpt).toStdString() << "'\n";
        return 2;
    }

    QStringList args = parser.positionalArguments();
    const auto kind = args.isEmpty() ? std::nullopt
                                     : fileops::operationKindFromWire(args.takeFirst().toStdString());
    if (!kind) {
        parser.showHelp(2);
    }

    std::vector<std::string> sources;
    for (const QString& a : args)
        sources.push_back(a.toStdString());
    std::optional<std::string> destination;
    if (*kind != fileops::OperationKind::Delete && !sources.empty()) {
        destination = sources.back();
        sources.pop_back();
    }
    if (sources.empty()) {
        std::cerr << "fileops: missing source path\n";
        return 2;
    }

    OperationSettings opts = loadOperationSettings();
    if (parser.isSet(derefOpt))
        opts.followSymlinks = true;
    if (parser.isSet(noPreserveOpt))
        opts.preserveAttributes = false;

    std::unique_ptr<fileops::Policy> policy = createPolicy(*variant, opts);

    fileops::LocalFileSystem fs;
    std::string err;
    std::unique_ptr<fileops::OperationTask> task =
        fileops::createTask(fs, *kind, sources, destination, policy->taskOptions(), err);
    if (!task) {
        std::cerr << "fileops: " << err << "\n";
        return 2;
    }

    qCInfo(ocOps) << "Running" << fileops::toWire(*kind) << "with" << policyVariantName(*variant)
                  << "policy on" << sources.size() << "source(s)";
    if (destination)
        qCInfo(ocOps) << "Destination:" << QString::fromStdString(fileops::loggablePath(*destination));

    try {
        policy->start(*task);
    } catch (const fileops::OperationFault& e) {
        qCWarning(ocOps) << "Operation failed:" << e.what();
        printNested(e);
        if (gui)
            UiAlerts::critical(nullptr, QCoreApplication::translate("main", "Error"),
                               QString::fromStdString(e.what()));
        return 3;
    }

    return task->state() == fileops::TaskState::Dead ? 0 : 1;
}
