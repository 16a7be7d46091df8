#include "env_file.h"

#include <QFile>
#include <QSaveFile>

namespace toolhub {

EnvMap EnvFile::parse(const QByteArray& content) {
    EnvMap env;
    const QList<QByteArray> lines = content.split('\n');
    for (const QByteArray& raw : lines) {
        const QString line = QString::fromUtf8(raw).trimmed();
        if (line.isEmpty() || line.startsWith('#')) {
            continue;
        }
        const int eq = line.indexOf('=');
        if (eq <= 0) {
            continue;
        }
        env.insert(line.left(eq).trimmed(), line.mid(eq + 1).trimmed());
    }
    return env;
}

QByteArray EnvFile::serialize(const EnvMap& env) {
    QByteArray out;
    for (auto it = env.constBegin(); it != env.constEnd(); ++it) {
        out.append(it.key().toUtf8());
        out.append('=');
        out.append(it.value().toUtf8());
        out.append('\n');
    }
    return out;
}

bool EnvFile::read(const QString& filePath, EnvMap& out, QString& error) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        error = "cannot open env file: " + filePath + ": " + file.errorString();
        return false;
    }
    out = parse(file.readAll());
    error.clear();
    return true;
}

bool EnvFile::write(const QString& filePath, const EnvMap& env, QString& error) {
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        error = "cannot write env file: " + filePath + ": " + file.errorString();
        return false;
    }
    const QByteArray data = serialize(env);
    if (file.write(data) != data.size()) {
        error = "cannot write env file: " + filePath + ": " + file.errorString();
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        error = "cannot commit env file: " + filePath + ": " + file.errorString();
        return false;
    }
    error.clear();
    return true;
}

} // namespace toolhub
