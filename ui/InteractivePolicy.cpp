// Prompts and progress reporting for the interactive policy.
#include "InteractivePolicy.hpp"
#include "DialogPump.hpp"
#include "TimeUtils.hpp"

#include "fileops/OperationTask.hpp"
#include "fileops/RuntimeLogging.hpp"

#include <QCoreApplication>
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(ocOps)

using fileops::Decision;
using fileops::DecisionKind;
using fileops::DecisionTag;

static QString tr(const char* text) {
    return QCoreApplication::translate("InteractivePolicy", text);
}

static QString qPath(const std::string& path) {
    return QString::fromStdString(path);
}

InteractivePolicy::InteractivePolicy(QWidget* parent)
    : InteractivePolicy(std::make_unique<MessageBoxPrompter>(), parent) {}

InteractivePolicy::InteractivePolicy(std::unique_ptr<DecisionPrompter> prompter,
                                     QWidget* parent)
    : prompter_(std::move(prompter)), parent_(parent) {}

InteractivePolicy::~InteractivePolicy() = default;

QString InteractivePolicy::dialogTitle() const {
    switch (operation_) {
    case fileops::OperationKind::Copy:
        return tr("Copy");
    case fileops::OperationKind::Move:
        return tr("Move");
    case fileops::OperationKind::Delete:
        return tr("Delete");
    }
    return {};
}

Decision InteractivePolicy::consult(const PromptRequest& req) {
    ++consultations_;
    QWidget* parent = dialog_ ? static_cast<QWidget*>(dialog_.get()) : parent_;
    const Decision d = prompter_->ask(parent, req);
    if (d.tag == DecisionTag::Abort)
        qCInfo(ocOps) << "Abort chosen at" << fileops::toWire(req.kind) << "prompt";
    if (d.forAll) {
        qCInfo(ocOps) << "Remembering" << fileops::toWire(req.kind) << "answer:"
                      << QString::fromStdString(fileops::describe(d));
    }
    return d;
}

Decision InteractivePolicy::decideOnOverwrite(const fileops::Entry& src,
                                              const fileops::Entry& dst) {
    if (const auto d = state_.recall(DecisionKind::Overwrite))
        return *d;

    PromptRequest req;
    req.kind = DecisionKind::Overwrite;
    req.title = tr("File Exists");
    req.text = tr("Target file already exists!\n%1").arg(qPath(dst.name));
    req.details = tr("New     : %1, size %2\nExisting: %3, size %4\n\n"
                     "Overwrite this target, or all targets?")
                      .arg(fileopsui::localShortTime(src.stat.mtime))
                      .arg(fileopsui::groupedSize(src.stat.size))
                      .arg(fileopsui::localShortTime(dst.stat.mtime))
                      .arg(fileopsui::groupedSize(dst.stat.size));
    req.options.push_back({tr("&Yes"), Decision(DecisionTag::Overwrite)});
    req.options.push_back({tr("&No"), Decision(DecisionTag::Skip)});
    if (dst.stat.size != 0 && dst.stat.size < src.stat.size)
        req.options.push_back({tr("&Reget"), Decision(DecisionTag::Reget)});
    req.options.push_back({tr("A&ll"), Decision(DecisionTag::Overwrite, true)});
    req.options.push_back({tr("&Update"), Decision(DecisionTag::Update, true)});
    req.options.push_back({tr("Non&e"), Decision(DecisionTag::Skip, true)});
    req.options.push_back({tr("&Abort"), Decision(DecisionTag::Abort)});
    req.dismissed = Decision(DecisionTag::Abort);

    return state_.remember(DecisionKind::Overwrite, consult(req));
}

Decision InteractivePolicy::decideOnIoError(const std::string& message) {
    if (const auto d = state_.recall(DecisionKind::IoError))
        return *d;

    PromptRequest req;
    req.kind = DecisionKind::IoError;
    req.title = tr("Error");
    req.text = QString::fromStdString(message);
    req.options.push_back({tr("&Skip"), Decision(DecisionTag::Skip)});
    req.options.push_back({tr("Ski&p all"), Decision(DecisionTag::Skip, true)});
    req.options.push_back({tr("&Abort"), Decision(DecisionTag::Abort)});
    req.dismissed = Decision(DecisionTag::Abort);

    return state_.remember(DecisionKind::IoError, consult(req));
}

// Never remembered: each partial file is its own question.
Decision InteractivePolicy::decideOnPartial(const fileops::Entry&, const fileops::Entry&) {
    PromptRequest req;
    req.kind = DecisionKind::Partial;
    req.title = dialogTitle();
    req.text = tr("Incomplete file was retrieved. Keep it?");
    req.options.push_back({tr("&Delete"), Decision(DecisionTag::Delete)});
    req.options.push_back({tr("&Keep"), Decision(DecisionTag::Keep)});
    req.dismissed = Decision(DecisionTag::Keep);

    const Decision d = consult(req);
    return Decision(d.tag);
}

Decision InteractivePolicy::decideOnNonEmptyDirDeletion(const fileops::Entry& src) {
    if (const auto d = state_.recall(DecisionKind::NonEmptyDirDeletion))
        return *d;

    PromptRequest req;
    req.kind = DecisionKind::NonEmptyDirDeletion;
    req.title = dialogTitle();
    req.text = tr("Directory \"%1\" not empty.\nDelete it recursively?").arg(qPath(src.name));
    req.options.push_back({tr("&Yes"), Decision(DecisionTag::Delete)});
    req.options.push_back({tr("&No"), Decision(DecisionTag::Skip)});
    req.options.push_back({tr("A&ll"), Decision(DecisionTag::Delete, true)});
    req.options.push_back({tr("Non&e"), Decision(DecisionTag::Skip, true)});
    req.options.push_back({tr("&Abort"), Decision(DecisionTag::Abort)});
    req.dismissed = Decision(DecisionTag::Abort);

    return state_.remember(DecisionKind::NonEmptyDirDeletion, consult(req));
}

void InteractivePolicy::notifyOnOperationStart(fileops::OperationKind, const fileops::Entry& src,
                                               const fileops::Entry* dst) {
    qCDebug(ocOps) << "Entry:" << QString::fromStdString(fileops::loggablePath(src.name))
                   << "->"
                   << QString::fromStdString(dst ? fileops::loggablePath(dst->name) : "-");
    if (!dialog_)
        return;
    dialog_->showStart(qPath(src.name), dst ? qPath(dst->name) : QString());
}

void InteractivePolicy::notifyOnProgress(std::uint64_t part, std::uint64_t whole) {
    if (!dialog_)
        return;
    dialog_->setPercent(fileops::progressPercent(part, whole));
}

void InteractivePolicy::start(fileops::OperationTask& task) {
    runDialog(task, *this);
}

void InteractivePolicy::runDialog(fileops::OperationTask& task, fileops::Policy& answerer) {
    if (dialog_)
        throw fileops::ContractError("policy already runs an operation");

    operation_ = task.kind();
    dialog_ = std::make_unique<OperationDialog>(operation_, state_.passive, parent_);
    qCInfo(ocOps) << "Operation started:" << fileops::toWire(operation_)
                  << (state_.passive ? "(passive)" : "(interactive)");

    struct DialogReset {
        std::unique_ptr<OperationDialog>& d;
        ~DialogReset() { d.reset(); }
    } reset{dialog_};

    DialogPump pump(task, answerer, *dialog_, state_.passive);
    pump.run();
}
