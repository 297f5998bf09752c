// Progress surface for one running operation: entry labels, a gauge for
// copy/move, control buttons and a zero-interval idle hook that drives the pump.
#pragma once
#include "fileops/FileOpsTypes.hpp"

#include <QDialog>
#include <functional>

class QLabel;
class QProgressBar;
class QPushButton;
class QTimer;

class OperationDialog : public QDialog {
    Q_OBJECT
public:
    OperationDialog(fileops::OperationKind op, bool passive, QWidget* parent = nullptr);

    // Shows the entry about to be processed; "dst" is ignored for delete.
    void showStart(const QString& src, const QString& dst);
    void setPercent(double percent);

    double percent() const { return percent_; }
    int gaugeValue() const;
    QString sourceText() const;
    QString targetText() const;
    fileops::OperationKind operation() const { return op_; }
    bool isPassive() const { return passive_; }

    void setIdleEnabled(bool on);
    bool idleEnabled() const;

    // Consulted before any user close. Returning false keeps the dialog open.
    void setCloseGuard(std::function<bool()> guard) { closeGuard_ = std::move(guard); }

    // Closes the dialog for good and stops the idle hook. Idempotent.
    void finish();
    bool isFinished() const { return finished_; }

signals:
    void idle();
    void skipRequested();

public slots:
    void reject() override;

private slots:
    void onSuspendToggled();

private:
    fileops::OperationKind op_;
    bool passive_;
    bool finished_ = false;
    double percent_ = 0.0;
    std::function<bool()> closeGuard_;

    QTimer* idleTimer_ = nullptr;
    QLabel* srcLabel_ = nullptr;
    QLabel* dstLabel_ = nullptr;       // copy/move only
    QProgressBar* gauge_ = nullptr;    // copy/move only
    QPushButton* skipBtn_ = nullptr;
    QPushButton* suspendBtn_ = nullptr;
    QPushButton* abortBtn_ = nullptr;
};
