// Builds a policy by variant name and applies the operation settings to it.
#pragma once
#include "OperationSettings.hpp"

#include "fileops/Policy.hpp"

#include <QString>
#include <memory>
#include <optional>

class QWidget;

enum class PolicyVariant { Batch, Interactive, Passive };

// "batch", "interactive" or "passive" (case-insensitive).
std::optional<PolicyVariant> policyVariantFromName(const QString& name);
QString policyVariantName(PolicyVariant v);

std::unique_ptr<fileops::Policy> createPolicy(PolicyVariant v,
                                              const OperationSettings& opts,
                                              QWidget* parent = nullptr);
// Uses loadOperationSettings().
std::unique_ptr<fileops::Policy> createPolicy(PolicyVariant v);
