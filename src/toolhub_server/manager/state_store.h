#pragma once

#include <QJsonObject>
#include <QString>

namespace toolhub_server {

/**
 * <dataRoot>/server_state.json: {"<id>": snapshot, ...}
 */
class StateStore {
public:
    explicit StateStore(const QString& filePath);

    bool exists() const;
    bool load(QJsonObject& snapshot, QString& error) const;
    bool save(const QJsonObject& snapshot, QString& error) const;

    QString filePath() const { return m_filePath; }

    static constexpr const char* kFileName = "server_state.json";

private:
    QString m_filePath;
};

} // namespace toolhub_server
