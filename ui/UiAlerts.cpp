#include "UiAlerts.hpp"

#include <QAbstractButton>
#include <QPushButton>
#include <QVector>

namespace UiAlerts {

void configure(QMessageBox &box, Qt::WindowModality modality) {
    box.setTextFormat(Qt::PlainText);
    box.setWindowModality(modality);
}

QMessageBox::StandardButton
critical(QWidget *parent, const QString &title, const QString &text,
         QMessageBox::StandardButtons buttons,
         QMessageBox::StandardButton defaultButton) {
    QMessageBox box(parent);
    configure(box, parent ? Qt::WindowModal : Qt::ApplicationModal);
    box.setIcon(QMessageBox::Critical);
    box.setWindowTitle(title);
    box.setText(text);
    box.setStandardButtons(buttons);
    if (defaultButton != QMessageBox::NoButton && buttons.testFlag(defaultButton))
        box.setDefaultButton(defaultButton);

    const int rc = box.exec();
    return static_cast<QMessageBox::StandardButton>(rc);
}

int choose(QWidget *parent, QMessageBox::Icon icon, const QString &title,
           const QString &text, const QString &informative,
           const QStringList &labels, int defaultIndex) {
    QMessageBox box(parent);
    configure(box, parent ? Qt::WindowModal : Qt::ApplicationModal);
    box.setIcon(icon);
    box.setWindowTitle(title);
    box.setText(text);
    if (!informative.isEmpty())
        box.setInformativeText(informative);

    QVector<QAbstractButton *> buttons;
    buttons.reserve(labels.size());
    for (const QString &label : labels)
        buttons.push_back(box.addButton(label, QMessageBox::ActionRole));
    if (defaultIndex >= 0 && defaultIndex < buttons.size())
        box.setDefaultButton(qobject_cast<QPushButton *>(buttons[defaultIndex]));

    box.exec();
    return static_cast<int>(buttons.indexOf(box.clickedButton()));
}
} // namespace UiAlerts
