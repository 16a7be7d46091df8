#pragma once

#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

#include <optional>

#include "remediation.h"
#include "toolhub/backend/backend_definition.h"

namespace toolhub_server {

class ICommandRunner;

struct ValidationIssue {
    QString type;
    QString severity;   // error | warning
    QString description;
    QString field;

    QJsonObject toJson() const;
};

struct ValidationSuggestion {
    QString action;
    QString description;
    QString command;
    bool autoFix = false;
    std::optional<Remediation> remediation;

    QJsonObject toJson() const;
};

struct ValidationResult {
    QString serverId;
    QList<ValidationIssue> issues;
    QList<ValidationSuggestion> suggestions;

    /// No issue of severity error.
    bool isValid() const;
    bool hasAutoFix() const;
    QString summary() const;

    QJsonObject toJson() const;
};

/// Where the gateway registers itself with the downstream client.
struct ClientConfigTarget {
    QString path;
    QString entryName = "toolhub";
    QString selfPath;
    QStringList args{"--stdio"};
    QStringList candidates;

    /// selfPath first, then the usual install locations.
    QStringList pathCandidates() const;
};

/**
 * Checks that an installed backend can be launched, and repairs what it can
 */
class ConfigValidator {
public:
    ConfigValidator(ICommandRunner* runner, const ClientConfigTarget& target);

    ValidationResult validate(const toolhub::BackendDefinition& def,
                              const QString& installPath) const;

    /**
     * Run every auto-fixable suggestion's remediation in order
     * Stops at the first failure; nothing is rolled back.
     */
    bool autoFix(const ValidationResult& result, QString& error);

    bool apply(const Remediation& remediation, QString& error);

    /// validate(), then one autoFix() and a second validate() if needed.
    bool ensureValid(const toolhub::BackendDefinition& def,
                     const QString& installPath,
                     ValidationResult& result,
                     QString& error);

    const ClientConfigTarget& target() const { return m_target; }

private:
    void checkNodeLocal(const toolhub::BackendDefinition& def, const QString& installPath,
                        ValidationResult& result) const;
    void checkNodeNpx(const toolhub::BackendDefinition& def, ValidationResult& result) const;
    void checkPython(const QString& installPath, ValidationResult& result) const;
    void checkCommand(const toolhub::BackendDefinition& def, const QString& installPath,
                      ValidationResult& result) const;
    void checkRequiredEnv(const toolhub::BackendDefinition& def, const QString& installPath,
                          ValidationResult& result) const;
    void checkClientConfig(ValidationResult& result) const;

    ICommandRunner* m_runner = nullptr;
    ClientConfigTarget m_target;
};

} // namespace toolhub_server
