#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

namespace toolhub_server {

/**
 * The downstream client's config file
 *
 * Layout: {"mcpServers": {"<name>": {"command": "...", "args": [...]}}, ...}.
 * Top-level keys other than mcpServers are preserved on every write.
 */
class ClientConfig {
public:
    static bool load(const QString& path, QJsonObject& root, QString& error);
    static bool save(const QString& path, const QJsonObject& root, QString& error);

    /// Removes entries lacking a non-empty command or a non-empty args array.
    /// Returns the number of dropped entries.
    static int cleanup(QJsonObject& root);

    static bool isUsableEntry(const QJsonObject& entry);
    static bool findEntry(const QJsonObject& root, const QString& name, QJsonObject& entry);

    /// Create the file if missing, clean it up and set the entry.
    static bool upsertEntry(const QString& path,
                            const QString& name,
                            const QString& command,
                            const QStringList& args,
                            QString& error);

    /// Rewrite only the command of an existing entry.
    static bool patchCommand(const QString& path,
                             const QString& name,
                             const QString& command,
                             QString& error);

    static constexpr const char* kServersKey = "mcpServers";

private:
    ClientConfig() = delete;
};

} // namespace toolhub_server
