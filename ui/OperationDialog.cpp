// Layout and close handling for the operation progress dialog.
#include "OperationDialog.hpp"

#include <QHBoxLayout>
#include <QLabel>
#include <QProgressBar>
#include <QPushButton>
#include <QTimer>
#include <QVBoxLayout>

#include <algorithm>
#include <cmath>

static QString titleFor(fileops::OperationKind op) {
    switch (op) {
    case fileops::OperationKind::Copy:
        return OperationDialog::tr("Copy");
    case fileops::OperationKind::Move:
        return OperationDialog::tr("Move");
    case fileops::OperationKind::Delete:
        return OperationDialog::tr("Delete");
    }
    return {};
}

OperationDialog::OperationDialog(fileops::OperationKind op, bool passive, QWidget* parent)
    : QDialog(parent), op_(op), passive_(passive) {
    setWindowTitle(titleFor(op));
    setModal(true);
    setMinimumWidth(480);

    auto* lay = new QVBoxLayout(this);
    if (op != fileops::OperationKind::Delete)
        lay->addWidget(new QLabel(tr("Source"), this));
    srcLabel_ = new QLabel(this);
    srcLabel_->setTextFormat(Qt::PlainText);
    srcLabel_->setWordWrap(true);
    lay->addWidget(srcLabel_);

    if (op != fileops::OperationKind::Delete) {
        lay->addWidget(new QLabel(tr("Target"), this));
        dstLabel_ = new QLabel(this);
        dstLabel_->setTextFormat(Qt::PlainText);
        dstLabel_->setWordWrap(true);
        lay->addWidget(dstLabel_);

        gauge_ = new QProgressBar(this);
        gauge_->setRange(0, 100);
        gauge_->setValue(0);
        lay->addWidget(gauge_);
    }

    if (!passive) {
        auto* row = new QHBoxLayout();
        row->addStretch();
        if (op != fileops::OperationKind::Delete) {
            skipBtn_ = new QPushButton(tr("&Skip"), this);
            suspendBtn_ = new QPushButton(tr("S&uspend"), this);
            row->addWidget(skipBtn_);
            row->addWidget(suspendBtn_);
            connect(skipBtn_, &QPushButton::clicked, this, [this] {
                setIdleEnabled(true);
                emit skipRequested();
            });
            connect(suspendBtn_, &QPushButton::clicked, this,
                    &OperationDialog::onSuspendToggled);
        }
        abortBtn_ = new QPushButton(tr("&Abort"), this);
        row->addWidget(abortBtn_);
        connect(abortBtn_, &QPushButton::clicked, this, &OperationDialog::reject);
        lay->addLayout(row);
    }

    idleTimer_ = new QTimer(this);
    idleTimer_->setInterval(0);
    connect(idleTimer_, &QTimer::timeout, this, &OperationDialog::idle);
}

void OperationDialog::showStart(const QString& src, const QString& dst) {
    if (op_ == fileops::OperationKind::Delete) {
        srcLabel_->setText(src);
        return;
    }
    srcLabel_->setText(src);
    dstLabel_->setText(dst);
    setPercent(0.0);
}

void OperationDialog::setPercent(double percent) {
    percent_ = std::clamp(percent, 0.0, 100.0);
    if (gauge_)
        gauge_->setValue(static_cast<int>(std::lround(percent_)));
}

int OperationDialog::gaugeValue() const {
    return gauge_ ? gauge_->value() : 0;
}

QString OperationDialog::sourceText() const {
    return srcLabel_->text();
}

QString OperationDialog::targetText() const {
    return dstLabel_ ? dstLabel_->text() : QString();
}

void OperationDialog::setIdleEnabled(bool on) {
    if (on && !finished_) {
        if (!idleTimer_->isActive())
            idleTimer_->start();
    } else {
        idleTimer_->stop();
    }
    if (suspendBtn_)
        suspendBtn_->setText(idleTimer_->isActive() ? tr("S&uspend") : tr("&Continue"));
}

bool OperationDialog::idleEnabled() const {
    return idleTimer_->isActive();
}

void OperationDialog::onSuspendToggled() {
    setIdleEnabled(!idleTimer_->isActive());
}

void OperationDialog::finish() {
    if (finished_)
        return;
    finished_ = true;
    setIdleEnabled(false);
    done(QDialog::Accepted);
}

// Every user close (window button, Escape, Abort) lands here. The guard may
// finish the dialog itself while it runs.
void OperationDialog::reject() {
    if (finished_)
        return;
    if (closeGuard_ && !closeGuard_())
        return;
    if (finished_)
        return;
    finished_ = true;
    setIdleEnabled(false);
    QDialog::reject();
}
