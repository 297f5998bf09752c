// Modal question shown when a running operation needs a decision.
// The message box implementation is the default; tests plug in scripted ones.
#pragma once
#include "fileops/FileOpsTypes.hpp"

#include <QString>
#include <vector>

class QWidget;

struct PromptOption {
    QString label;               // button text, may carry a '&' mnemonic
    fileops::Decision decision;  // answer when this button is chosen
};

struct PromptRequest {
    fileops::DecisionKind kind = fileops::DecisionKind::Overwrite;
    QString title;
    QString text;
    QString details;                 // secondary text (sizes, dates, reason)
    std::vector<PromptOption> options;
    int defaultIndex = 0;
    fileops::Decision dismissed;     // answer when closed without a choice

    // Index of the option carrying "d", or -1.
    int indexOf(const fileops::Decision& d) const;
};

class DecisionPrompter {
public:
    virtual ~DecisionPrompter() = default;
    // Blocks until the user picks an option or dismisses the prompt.
    virtual fileops::Decision ask(QWidget* parent, const PromptRequest& req) = 0;
};

class MessageBoxPrompter : public DecisionPrompter {
public:
    fileops::Decision ask(QWidget* parent, const PromptRequest& req) override;
};
