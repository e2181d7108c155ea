#ifndef LOGPANEL_H
#define LOGPANEL_H

#include "process/LogBuffer.h"

#include <QWidget>
#include <memory>

class QPlainTextEdit;
class QTimer;
class LogSink;

// "Output Log" box at the bottom of the main window. Polls the sink every
// 100 ms and mirrors a LogBuffer into a read-only text view.
class LogPanel : public QWidget {
    Q_OBJECT
public:
    static constexpr int PollIntervalMs = 100;

    explicit LogPanel(std::shared_ptr<LogSink> sink, QWidget* parent = nullptr);

    // GUI thread only; other threads go through the sink
    void appendText(const QString& fragment);
    void clear();

    const LogBuffer& buffer() const { return m_buffer; }

public slots:
    void pollSink();

private:
    void setupUI();

    std::shared_ptr<LogSink> m_sink;
    LogBuffer m_buffer;
    QPlainTextEdit* m_view;
    QTimer* m_timer;
};

#endif // LOGPANEL_H
