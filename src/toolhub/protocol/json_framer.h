#pragma once

#include <QByteArray>

#include "toolhub/toolhub_export.h"

namespace toolhub {

/**
 * Brace-matching JSON object framer
 * Cuts complete top-level JSON objects out of a byte stream. An object may span
 * several lines. Text between objects (log noise) is discarded. An object is only
 * recognised when its opening brace is the first non-blank byte of a line.
 */
class TOOLHUB_API JsonFramer {
public:
    JsonFramer() = default;

    void append(const QByteArray& data);

    /**
     * Try to cut one complete object
     * @param outObject bytes from '{' to the matching '}'
     * @return true if an object was produced
     */
    bool tryReadObject(QByteArray& outObject);

    void clear();

    int bufferSize() const;

    static constexpr int kMaxFrameBytes = 8 * 1024 * 1024;

private:
    void resetScan();

    QByteArray m_buffer;
    int m_scanPos = 0;
    int m_start = -1;
    int m_depth = 0;
    bool m_inString = false;
    bool m_escape = false;
    bool m_atLineStart = true;
};

} // namespace toolhub
