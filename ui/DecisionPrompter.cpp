// Message box backed prompter.
#include "DecisionPrompter.hpp"
#include "UiAlerts.hpp"

#include <QStringList>

int PromptRequest::indexOf(const fileops::Decision& d) const {
    for (std::size_t i = 0; i < options.size(); ++i) {
        if (options[i].decision == d)
            return static_cast<int>(i);
    }
    return -1;
}

fileops::Decision MessageBoxPrompter::ask(QWidget* parent, const PromptRequest& req) {
    QStringList labels;
    for (const auto& opt : req.options)
        labels << opt.label;

    const QMessageBox::Icon icon = (req.kind == fileops::DecisionKind::IoError)
                                       ? QMessageBox::Critical
                                       : QMessageBox::Warning;
    const int idx = UiAlerts::choose(parent, icon, req.title, req.text, req.details,
                                     labels, req.defaultIndex);
    if (idx < 0 || idx >= static_cast<int>(req.options.size()))
        return req.dismissed;
    return req.options[static_cast<std::size_t>(idx)].decision;
}
