#pragma once

#include <QByteArray>
#include <QString>
#include <memory>
#include <spdlog/spdlog.h>

namespace toolhub_server {

/**
 * Line-buffered sink for one backend's stdout/stderr
 * Writes to <dataRoot>/logs/<id>.log through a rotating spdlog logger.
 */
class BackendLogWriter {
public:
    BackendLogWriter(const QString& logPath,
                     qint64 maxBytes = 10 * 1024 * 1024,
                     int maxFiles = 3);
    ~BackendLogWriter();

    void appendStdout(const QByteArray& data);
    void appendStderr(const QByteArray& data);
    QString logPath() const { return m_logPath; }

private:
    void processBuffer(QByteArray& buf, const char* prefix);
    void flushPartial(QByteArray& buf, const char* prefix);

    std::shared_ptr<spdlog::logger> m_logger;
    QByteArray m_stdoutBuf;
    QByteArray m_stderrBuf;
    QString m_logPath;

    static constexpr qint64 kMaxBufferBytes = 1 * 1024 * 1024;  // 1MB
};

} // namespace toolhub_server
