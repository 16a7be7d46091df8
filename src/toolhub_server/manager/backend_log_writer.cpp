#include "backend_log_writer.h"

#include <spdlog/sinks/rotating_file_sink.h>

namespace toolhub_server {

BackendLogWriter::BackendLogWriter(const QString& logPath, qint64 maxBytes, int maxFiles)
    : m_logPath(logPath)
{
    try {
        auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logPath.toStdString(),
            static_cast<size_t>(maxBytes),
            static_cast<size_t>(maxFiles));

        m_logger = std::make_shared<spdlog::logger>("backend_" + logPath.toStdString(), sink);
        m_logger->set_pattern("%Y-%m-%dT%H:%M:%S.%eZ | %v", spdlog::pattern_time_type::utc);
        m_logger->set_level(spdlog::level::trace);
        m_logger->flush_on(spdlog::level::trace);
    } catch (const spdlog::spdlog_ex& ex) {
        qWarning("BackendLogWriter: cannot open %s: %s", qUtf8Printable(logPath), ex.what());
    }
}

BackendLogWriter::~BackendLogWriter() {
    flushPartial(m_stdoutBuf, nullptr);
    flushPartial(m_stderrBuf, "[stderr]");
}

void BackendLogWriter::flushPartial(QByteArray& buf, const char* prefix) {
    if (m_logger && !buf.isEmpty()) {
        const std::string text = buf.toStdString();
        if (prefix) {
            m_logger->info("{} {}", prefix, text);
        } else {
            m_logger->info("{}", text);
        }
    }
    buf.clear();
}

void BackendLogWriter::processBuffer(QByteArray& buf, const char* prefix) {
    if (!m_logger) {
        buf.clear();
        return;
    }
    qsizetype nl = buf.indexOf('\n');
    while (nl >= 0) {
        QByteArray line = buf.left(nl);
        if (line.endsWith('\r')) {
            line.chop(1);
        }
        buf.remove(0, nl + 1);
        const std::string text = line.toStdString();
        if (prefix) {
            m_logger->info("{} {}", prefix, text);
        } else {
            m_logger->info("{}", text);
        }
        nl = buf.indexOf('\n');
    }
    if (buf.size() > kMaxBufferBytes) {
        flushPartial(buf, prefix);
    }
}

void BackendLogWriter::appendStdout(const QByteArray& data) {
    m_stdoutBuf.append(data);
    processBuffer(m_stdoutBuf, nullptr);
}

void BackendLogWriter::appendStderr(const QByteArray& data) {
    m_stderrBuf.append(data);
    processBuffer(m_stderrBuf, "[stderr]");
}

} // namespace toolhub_server
