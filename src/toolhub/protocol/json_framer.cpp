#include "json_framer.h"

namespace toolhub {

void JsonFramer::append(const QByteArray& data) {
    m_buffer.append(data);
}

bool JsonFramer::tryReadObject(QByteArray& outObject) {
    while (m_scanPos < m_buffer.size()) {
        const char c = m_buffer.at(m_scanPos);

        if (m_depth == 0) {
            if (c == '\n') {
                m_atLineStart = true;
            } else if (c == '{' && m_atLineStart) {
                m_start = m_scanPos;
                m_depth = 1;
                m_inString = false;
                m_escape = false;
            } else if (c != ' ' && c != '\t' && c != '\r') {
                m_atLineStart = false;
            }
            ++m_scanPos;
            continue;
        }

        if (m_inString) {
            if (m_escape) {
                m_escape = false;
            } else if (c == '\\') {
                m_escape = true;
            } else if (c == '"') {
                m_inString = false;
            }
        } else if (c == '"') {
            m_inString = true;
        } else if (c == '{' || c == '[') {
            ++m_depth;
        } else if (c == '}' || c == ']') {
            --m_depth;
            if (m_depth == 0) {
                outObject = m_buffer.mid(m_start, m_scanPos - m_start + 1);
                m_buffer.remove(0, m_scanPos + 1);
                resetScan();
                m_atLineStart = false;
                return true;
            }
        }
        ++m_scanPos;
    }

    if (m_depth == 0) {
        // nothing pending: drop consumed noise
        m_buffer.clear();
        m_scanPos = 0;
    } else if (m_scanPos - m_start > kMaxFrameBytes) {
        m_buffer.clear();
        resetScan();
        m_atLineStart = true;
    }
    return false;
}

void JsonFramer::clear() {
    m_buffer.clear();
    resetScan();
    m_atLineStart = true;
}

int JsonFramer::bufferSize() const {
    return m_buffer.size();
}

void JsonFramer::resetScan() {
    m_scanPos = 0;
    m_start = -1;
    m_depth = 0;
    m_inString = false;
    m_escape = false;
}

} // namespace toolhub
