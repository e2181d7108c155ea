#ifndef LOGBUFFER_H
#define LOGBUFFER_H

#include <QStringList>

/**
 * @brief Text model behind the Output Log, capped at MaxLines lines.
 *
 * Appended text continues the last (possibly partial) line. When more than
 * MaxLines lines hold text the oldest are dropped; the empty line after a
 * final newline does not count, so lineCount() may be MaxLines + 1. An empty
 * buffer holds one empty line, like an empty text document holds one empty
 * block.
 */
class LogBuffer
{
public:
    static constexpr int MaxLines = 2000;

    explicit LogBuffer(int maxLines = MaxLines);

    /**
     * @brief Append a fragment.
     * @return number of lines evicted from the front to honour the cap
     */
    int append(const QString& fragment);

    void clear();

    QString text() const;
    int lineCount() const { return m_lines.size(); }
    int maxLines() const { return m_maxLines; }
    const QStringList& lines() const { return m_lines; }

private:
    int m_maxLines;
    QStringList m_lines;
};

#endif // LOGBUFFER_H
