#pragma once

#include <QMainWindow>
#include <memory>

#include "SessionRecord.h"
#include "ShellCommand.h"

class QCloseEvent;
class QLabel;
class QListWidget;
class QPushButton;
class QTabWidget;

class SessionTab;
class Workbench;

class MainWindow : public QMainWindow
{
    Q_OBJECT
public:
    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow() override;

protected:
    void closeEvent(QCloseEvent* e) override;

private slots:
    void onOpenSession();
    void onNewSession();
    void onEditSession();
    void onDeleteSession();
    void onTabCloseRequested(int index);
    void onOpenLogFile();

private:
    void setupUi();
    void setupMenus();

    void loadSessions();
    void saveSessions();
    void rebuildSessionList();

    int currentSessionRow() const;
    SessionTab* tabForSession(const QString& name) const;
    void closeTabAt(int index);

    SessionList m_sessions;
    ShellLaunchOptions m_shellOptions;
    std::unique_ptr<Workbench> m_workbench;

    QListWidget *m_sessionList = nullptr;
    QPushButton *m_openBtn = nullptr;
    QPushButton *m_editBtn = nullptr;
    QPushButton *m_deleteBtn = nullptr;
    QTabWidget  *m_tabs = nullptr;
    QLabel      *m_statusLabel = nullptr;
};
