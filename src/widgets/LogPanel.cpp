#include "LogPanel.h"
#include "process/LogSink.h"

#include <QFontDatabase>
#include <QHBoxLayout>
#include <QLabel>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QScrollBar>
#include <QTextBlock>
#include <QTextCursor>
#include <QTimer>
#include <QVBoxLayout>

LogPanel::LogPanel(std::shared_ptr<LogSink> sink, QWidget* parent)
    : QWidget(parent)
    , m_sink(std::move(sink))
{
    setupUI();

    m_timer = new QTimer(this);
    m_timer->setInterval(PollIntervalMs);
    connect(m_timer, &QTimer::timeout, this, &LogPanel::pollSink);
    m_timer->start();
}

void LogPanel::setupUI() {
    QVBoxLayout* layout = new QVBoxLayout(this);
    layout->setContentsMargins(8, 6, 8, 8);
    layout->setSpacing(4);

    QHBoxLayout* header = new QHBoxLayout();
    QLabel* title = new QLabel(tr("Output Log"), this);
    title->setStyleSheet("font-size: 13px; font-weight: bold;");
    QPushButton* clearBtn = new QPushButton(tr("Clear Log"), this);
    clearBtn->setFixedWidth(90);
    connect(clearBtn, &QPushButton::clicked, this, &LogPanel::clear);
    header->addWidget(title);
    header->addStretch();
    header->addWidget(clearBtn);
    layout->addLayout(header);

    m_view = new QPlainTextEdit(this);
    m_view->setReadOnly(true);
    m_view->setFont(QFontDatabase::systemFont(QFontDatabase::FixedFont));
    m_view->setLineWrapMode(QPlainTextEdit::WidgetWidth);
    m_view->setMinimumHeight(160);
    m_view->setStyleSheet("QPlainTextEdit { background-color: #1e1e1e; color: #dcdcdc; border: 1px solid #444; }");
    layout->addWidget(m_view);
}

void LogPanel::pollSink() {
    if (!m_sink) return;
    const QStringList fragments = m_sink->drain();
    for (const QString& f : fragments)
        appendText(f);
}

void LogPanel::appendText(const QString& fragment) {
    const int evicted = m_buffer.append(fragment);

    QTextCursor cursor(m_view->document());
    cursor.movePosition(QTextCursor::End);
    cursor.insertText(fragment);

    if (evicted > 0) {
        // The view holds the same lines as the buffer: one block per line
        QTextCursor head(m_view->document());
        head.movePosition(QTextCursor::Start);
        head.movePosition(QTextCursor::NextBlock, QTextCursor::KeepAnchor, evicted);
        head.removeSelectedText();
    }

    m_view->verticalScrollBar()->setValue(m_view->verticalScrollBar()->maximum());
}

void LogPanel::clear() {
    m_buffer.clear();
    m_view->clear();
}
