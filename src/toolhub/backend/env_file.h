#pragma once

#include <QByteArray>
#include <QString>

#include "backend_definition.h"
#include "toolhub/toolhub_export.h"

namespace toolhub {

/**
 * Flat KEY=VALUE files, one entry per line, no quoting or escaping.
 * Blank lines and lines starting with '#' are skipped; the value is everything
 * after the first '='.
 */
class TOOLHUB_API EnvFile {
public:
    static EnvMap parse(const QByteArray& content);
    static QByteArray serialize(const EnvMap& env);

    static bool read(const QString& filePath, EnvMap& out, QString& error);
    static bool write(const QString& filePath, const EnvMap& env, QString& error);

    static QString pathFor(const QString& installPath) { return installPath + "/.env"; }

private:
    EnvFile() = delete;
};

} // namespace toolhub
