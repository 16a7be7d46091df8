#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include "toolhub/toolhub_export.h"

namespace toolhub {

enum class ErrorStage {
    GitClone,
    NpmInstall,
    NpmBuild,
    InterpreterEnv,
    DependencyInstall,
    EnvFile,
    Validation,
    Startup,
    ToolDiscovery,
    Generic
};

TOOLHUB_API QString errorStageName(ErrorStage stage);

/**
 * Typed failure record with remediation hints
 */
struct TOOLHUB_API EnhancedError {
    QString type;       // installation_error | startup_error | tool_discovery_error
    QString stage;
    QString message;
    QString details;
    QString context;
    QStringList suggestions;
    QDateTime timestamp;
    QString severity;   // error | warning | info

    QJsonObject toJson() const;
    static EnhancedError fromJson(const QJsonObject& obj);
};

/**
 * Heuristic suggestions for a failure text at a given stage.
 * Matching is a case-insensitive substring search; text that matches nothing
 * falls back to the stage defaults.
 */
TOOLHUB_API QStringList suggestionsFor(ErrorStage stage, const QString& failureText);

/**
 * Builds EnhancedError records for one backend
 */
class TOOLHUB_API ErrorReporter {
public:
    ErrorReporter(const QString& backendId, const QString& context);

    EnhancedError installationError(ErrorStage stage, const QString& failureText) const;
    EnhancedError startupError(const QString& failureText) const;
    EnhancedError toolDiscoveryError(const QString& failureText) const;

private:
    EnhancedError make(ErrorStage stage, const QString& type, const QString& message,
                       const QString& failureText, const QString& severity) const;

    QString m_backendId;
    QString m_context;
};

} // namespace toolhub
