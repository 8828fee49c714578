// TermWidget.cpp
#include "TermWidget.h"

#include <QAction>
#include <QClipboard>
#include <QFont>
#include <QFontDatabase>
#include <QFontInfo>
#include <QGuiApplication>
#include <QKeySequence>
#include <QTimer>

TermWidget::TermWidget(int historyLines, QWidget *parent)
    : QTermWidget(0, parent) // 0: no local shell autostart
{
    setHistorySize(historyLines < 0 ? 0 : historyLines);
    setTerminalOpacity(1.0);
    setColorScheme(QStringLiteral("WhiteOnBlack"));

    QFont f = getTerminalFont();
    QFont prefer(QStringLiteral("DejaVu Sans Mono"));
    if (QFontInfo(prefer).exactMatch())
        f.setFamily(prefer.family());
    else
        f.setFamily(QFontDatabase::systemFont(QFontDatabase::FixedFont).family());

    f.setStyleHint(QFont::TypeWriter);
    f.setFixedPitch(true);
    f.setKerning(false);
    f.setBold(false);
    if (f.pointSize() <= 0 && f.pixelSize() <= 0)
        f.setPointSize(11);
    setTerminalFont(f);

    applyTerminalLook();
    // Children are created lazily by qtermwidget; re-apply once they exist.
    QTimer::singleShot(0, this, [this]() { applyTerminalLook(); });

    // ------------------------------------------------------------
    // Copy / Paste
    // ------------------------------------------------------------
    setContextMenuPolicy(Qt::ActionsContextMenu);

    auto *copyAct = new QAction(tr("Copy"), this);
    copyAct->setShortcut(QKeySequence(QStringLiteral("Ctrl+Shift+C")));
    addAction(copyAct);

    auto *pasteAct = new QAction(tr("Paste"), this);
    pasteAct->setShortcut(QKeySequence(QStringLiteral("Ctrl+Shift+V")));
    addAction(pasteAct);

    auto *pasteAct2 = new QAction(tr("Paste (Shift+Insert)"), this);
    pasteAct2->setShortcut(QKeySequence(QStringLiteral("Shift+Insert")));
    addAction(pasteAct2);

    connect(copyAct, &QAction::triggered, this, [this]() {
        const QString sel = selectedText();
        if (!sel.isEmpty())
            QGuiApplication::clipboard()->setText(sel);
    });

    auto doPaste = [this]() {
        const QString text = QGuiApplication::clipboard()->text();
        if (!text.isEmpty())
            sendText(text);
    };
    connect(pasteAct,  &QAction::triggered, this, doPaste);
    connect(pasteAct2, &QAction::triggered, this, doPaste);
}

void TermWidget::applyTerminalLook()
{
    setStyleSheet(QString());
    for (QWidget *w : findChildren<QWidget*>())
        w->setStyleSheet(QString());
}
