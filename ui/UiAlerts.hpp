#pragma once

#include <QMessageBox>
#include <QStringList>

class QString;
class QWidget;

namespace UiAlerts {
void configure(QMessageBox &box,
               Qt::WindowModality modality = Qt::WindowModal);

QMessageBox::StandardButton
critical(QWidget *parent, const QString &title, const QString &text,
         QMessageBox::StandardButtons buttons = QMessageBox::Ok,
         QMessageBox::StandardButton defaultButton = QMessageBox::NoButton);

// Modal choice among custom buttons. Returns the index of the clicked label
// or -1 when the box was dismissed without a choice.
int choose(QWidget *parent, QMessageBox::Icon icon, const QString &title,
           const QString &text, const QString &informative,
           const QStringList &labels, int defaultIndex = 0);
} // namespace UiAlerts
