#include "LogBuffer.h"

#include <algorithm>

LogBuffer::LogBuffer(int maxLines)
    : m_maxLines(std::max(1, maxLines))
    , m_lines({ QString() })
{
}

int LogBuffer::append(const QString& fragment)
{
    if (fragment.isEmpty()) return 0;

    const QStringList parts = fragment.split('\n');
    m_lines.last() += parts.first();
    for (int i = 1; i < parts.size(); ++i)
        m_lines.append(parts.at(i));

    // A trailing empty line is only the cursor after the last newline
    const int filled = m_lines.size() - (m_lines.last().isEmpty() ? 1 : 0);
    const int excess = filled - m_maxLines;
    if (excess <= 0) return 0;
    m_lines.erase(m_lines.begin(), m_lines.begin() + excess);
    return excess;
}

void LogBuffer::clear()
{
    m_lines = QStringList{ QString() };
}

QString LogBuffer::text() const
{
    return m_lines.join('\n');
}
