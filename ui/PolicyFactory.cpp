#include "PolicyFactory.hpp"
#include "InteractivePolicy.hpp"
#include "PassivePolicy.hpp"

#include "fileops/BatchPolicy.hpp"

std::optional<PolicyVariant> policyVariantFromName(const QString& name) {
    const QString n = name.trimmed().toLower();
    if (n == QLatin1String("batch"))
        return PolicyVariant::Batch;
    if (n == QLatin1String("interactive"))
        return PolicyVariant::Interactive;
    if (n == QLatin1String("passive"))
        return PolicyVariant::Passive;
    return std::nullopt;
}

QString policyVariantName(PolicyVariant v) {
    switch (v) {
    case PolicyVariant::Batch:
        return QStringLiteral("batch");
    case PolicyVariant::Interactive:
        return QStringLiteral("interactive");
    case PolicyVariant::Passive:
        return QStringLiteral("passive");
    }
    return {};
}

std::unique_ptr<fileops::Policy> createPolicy(PolicyVariant v,
                                              const OperationSettings& opts,
                                              QWidget* parent) {
    std::unique_ptr<fileops::Policy> policy;
    switch (v) {
    case PolicyVariant::Batch:
        policy = std::make_unique<fileops::BatchPolicy>();
        break;
    case PolicyVariant::Interactive:
        policy = std::make_unique<InteractivePolicy>(parent);
        break;
    case PolicyVariant::Passive:
        policy = std::make_unique<PassivePolicy>(parent);
        break;
    }
    applyOperationSettings(opts, policy->state());
    return policy;
}

std::unique_ptr<fileops::Policy> createPolicy(PolicyVariant v) {
    return createPolicy(v, loadOperationSettings());
}
