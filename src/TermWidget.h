#pragma once

#include <qtermwidget5/qtermwidget.h>

/*
    TermWidget
    ----------
    QTermWidget that never starts a local shell on its own. The caller sets
    the program (ssh ... <editor> <path>) and starts it explicitly.

    Adds Ctrl+Shift+C / Ctrl+Shift+V / Shift+Insert and keeps the
    application stylesheet out of the terminal.
*/
class TermWidget : public QTermWidget
{
    Q_OBJECT
public:
    explicit TermWidget(int historyLines = 2000, QWidget *parent = nullptr);

private:
    void applyTerminalLook();
};
