// MainWindow.cpp
//
// Session list on the left (persisted through SessionStore), one SessionTab
// per open session on the right. Connections are owned by the Workbench;
// closing a tab disconnects and destroys its Connection.

#include "MainWindow.h"
#include "AppSettings.h"
#include "AuditLogger.h"
#include "Connection.h"
#include "Logger.h"
#include "SessionDialog.h"
#include "SessionStore.h"
#include "SessionTab.h"
#include "SshChannels.h"
#include "Workbench.h"

#include <QAction>
#include <QCloseEvent>
#include <QDesktopServices>
#include <QFileInfo>
#include <QHBoxLayout>
#include <QLabel>
#include <QListWidget>
#include <QMenuBar>
#include <QMessageBox>
#include <QPushButton>
#include <QSplitter>
#include <QStatusBar>
#include <QTabWidget>
#include <QUrl>
#include <QVBoxLayout>
#include <QDebug>

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
{
    setWindowTitle(tr("MintTerm"));
    resize(1200, 800);

    m_shellOptions = AppSettings::shellLaunchOptions();
    m_workbench.reset(new Workbench(std::make_shared<SshChannelFactory>(AppSettings::connectTimeoutSec()),
                                    AppSettings::transferOptions()));

    setupUi();
    setupMenus();
    loadSessions();
}

MainWindow::~MainWindow()
{
    // Tabs reference Connections; drop them first.
    while (m_tabs && m_tabs->count() > 0)
        closeTabAt(0);
    m_workbench->disconnectAll();
}

// -----------------------------------------------------------------------------
// UI
// -----------------------------------------------------------------------------
void MainWindow::setupUi()
{
    auto *split = new QSplitter(Qt::Horizontal, this);
    split->setChildrenCollapsible(false);
    split->setHandleWidth(1);

    // Left: sessions
    auto *left = new QWidget(split);
    auto *leftL = new QVBoxLayout(left);
    leftL->setContentsMargins(6, 6, 0, 6);
    leftL->setSpacing(6);

    auto *title = new QLabel(tr("Sessions"), left);
    title->setStyleSheet("font-weight: bold;");

    m_sessionList = new QListWidget(left);
    m_sessionList->setSelectionMode(QAbstractItemView::SingleSelection);

    auto *btnRow = new QWidget(left);
    auto *btnL = new QHBoxLayout(btnRow);
    btnL->setContentsMargins(0, 0, 0, 0);
    btnL->setSpacing(6);

    m_openBtn   = new QPushButton(tr("Open"), btnRow);
    auto *newBtn = new QPushButton(tr("New"), btnRow);
    m_editBtn   = new QPushButton(tr("Edit"), btnRow);
    m_deleteBtn = new QPushButton(tr("Delete"), btnRow);

    btnL->addWidget(m_openBtn);
    btnL->addWidget(newBtn);
    btnL->addWidget(m_editBtn);
    btnL->addWidget(m_deleteBtn);

    leftL->addWidget(title);
    leftL->addWidget(m_sessionList, 1);
    leftL->addWidget(btnRow);

    // Right: tabs
    m_tabs = new QTabWidget(split);
    m_tabs->setTabsClosable(true);
    m_tabs->setDocumentMode(true);

    split->setStretchFactor(0, 0);
    split->setStretchFactor(1, 1);
    split->setSizes({ 240, 960 });
    setCentralWidget(split);

    m_statusLabel = new QLabel(this);
    statusBar()->addWidget(m_statusLabel, 1);

    connect(m_openBtn, &QPushButton::clicked, this, &MainWindow::onOpenSession);
    connect(newBtn, &QPushButton::clicked, this, &MainWindow::onNewSession);
    connect(m_editBtn, &QPushButton::clicked, this, &MainWindow::onEditSession);
    connect(m_deleteBtn, &QPushButton::clicked, this, &MainWindow::onDeleteSession);
    connect(m_sessionList, &QListWidget::itemDoubleClicked, this, [this]() { onOpenSession(); });
    connect(m_sessionList, &QListWidget::currentRowChanged, this, [this](int row) {
        const bool has = row >= 0;
        m_openBtn->setEnabled(has);
        m_editBtn->setEnabled(has);
        m_deleteBtn->setEnabled(has);
    });
    connect(m_tabs, &QTabWidget::tabCloseRequested, this, &MainWindow::onTabCloseRequested);
}

void MainWindow::setupMenus()
{
    auto *fileMenu = menuBar()->addMenu(tr("&File"));

    QAction *newAct = fileMenu->addAction(tr("New session…"));
    connect(newAct, &QAction::triggered, this, &MainWindow::onNewSession);

    QAction *logAct = fileMenu->addAction(tr("Open log file"));
    connect(logAct, &QAction::triggered, this, &MainWindow::onOpenLogFile);

    fileMenu->addSeparator();

    QAction *quitAct = fileMenu->addAction(tr("Quit"));
    quitAct->setShortcut(QKeySequence::Quit);
    connect(quitAct, &QAction::triggered, this, &QWidget::close);
}

// -----------------------------------------------------------------------------
// Session list persistence
// -----------------------------------------------------------------------------
void MainWindow::loadSessions()
{
    QString err;
    m_sessions = SessionStore::load(&err);
    if (!err.isEmpty()) {
        qWarning().noquote() << "[STORE] load failed:" << err;
        QMessageBox::warning(this, tr("Sessions"), err);
    }

    m_workbench->setSessions(m_sessions);
    rebuildSessionList();
    m_statusLabel->setText(tr("%1 session(s) loaded from %2")
                               .arg(m_sessions.size())
                               .arg(SessionStore::configPath()));
}

void MainWindow::saveSessions()
{
    QString err;
    if (!SessionStore::save(m_sessions, &err)) {
        QMessageBox::warning(this, tr("Sessions"), tr("Failed to save sessions:\n%1").arg(err));
        return;
    }
    m_workbench->setSessions(m_sessions);
}

void MainWindow::rebuildSessionList()
{
    const int keep = m_sessionList->currentRow();
    m_sessionList->clear();
    for (const SessionRecord& s : m_sessions) {
        auto *item = new QListWidgetItem(s.name, m_sessionList);
        item->setToolTip(QString("%1:%2").arg(s.target()).arg(s.effectivePort()));
    }
    if (m_sessions.isEmpty()) {
        m_openBtn->setEnabled(false);
        m_editBtn->setEnabled(false);
        m_deleteBtn->setEnabled(false);
        return;
    }
    m_sessionList->setCurrentRow(qBound(0, keep, int(m_sessions.size()) - 1));
}

int MainWindow::currentSessionRow() const
{
    const int row = m_sessionList->currentRow();
    return (row >= 0 && row < m_sessions.size()) ? row : -1;
}

// -----------------------------------------------------------------------------
// Session actions
// -----------------------------------------------------------------------------
SessionTab* MainWindow::tabForSession(const QString& name) const
{
    for (int i = 0; i < m_tabs->count(); ++i) {
        auto *tab = qobject_cast<SessionTab*>(m_tabs->widget(i));
        if (tab && tab->sessionName() == name)
            return tab;
    }
    return nullptr;
}

void MainWindow::onOpenSession()
{
    const int row = currentSessionRow();
    if (row < 0) return;
    const QString name = m_sessions[row].name;

    if (SessionTab *existing = tabForSession(name)) {
        m_tabs->setCurrentWidget(existing);
        return;
    }

    Connection *conn = m_workbench->connectionFor(name);
    if (!conn) return;

    auto *tab = new SessionTab(conn, m_shellOptions, m_tabs);
    const int idx = m_tabs->addTab(tab, name);
    m_tabs->setCurrentIndex(idx);

    // Shown first so the embed surface has a native window.
    tab->connectSession();
}

void MainWindow::onNewSession()
{
    QStringList names;
    for (const SessionRecord& s : m_sessions) names << s.name;

    SessionDialog dlg(SessionRecord(), names, this);
    if (dlg.exec() != QDialog::Accepted) return;

    m_sessions.push_back(dlg.record());
    saveSessions();
    rebuildSessionList();
    m_sessionList->setCurrentRow(m_sessions.size() - 1);
}

void MainWindow::onEditSession()
{
    const int row = currentSessionRow();
    if (row < 0) return;

    const SessionRecord old = m_sessions[row];
    if (Connection *c = m_workbench->existingConnection(old.name)) {
        if (c->state() != Connection::State::Idle) {
            QMessageBox::information(this, tr("Edit session"),
                                     tr("Disconnect '%1' before editing it.").arg(old.name));
            return;
        }
    }

    QStringList names;
    for (const SessionRecord& s : m_sessions) names << s.name;

    SessionDialog dlg(old, names, this);
    if (dlg.exec() != QDialog::Accepted) return;

    const SessionRecord updated = dlg.record();
    if (updated.name != old.name) {
        // Registry is keyed by name; an open tab would go stale.
        if (SessionTab *tab = tabForSession(old.name))
            closeTabAt(m_tabs->indexOf(tab));
    }

    m_sessions[row] = updated;
    saveSessions();
    rebuildSessionList();
}

void MainWindow::onDeleteSession()
{
    const int row = currentSessionRow();
    if (row < 0) return;

    const QString name = m_sessions[row].name;
    const auto answer = QMessageBox::question(this, tr("Delete session"),
                                              tr("Delete session '%1'?").arg(name));
    if (answer != QMessageBox::Yes) return;

    if (SessionTab *tab = tabForSession(name))
        closeTabAt(m_tabs->indexOf(tab));

    m_sessions.removeAt(row);
    saveSessions();
    rebuildSessionList();
}

void MainWindow::onTabCloseRequested(int index)
{
    closeTabAt(index);
}

void MainWindow::closeTabAt(int index)
{
    auto *tab = qobject_cast<SessionTab*>(m_tabs->widget(index));
    if (!tab) return;

    const QString name = tab->sessionName();
    m_tabs->removeTab(index);
    // Tab holds a raw Connection pointer: delete it before the Connection.
    delete tab;
    m_workbench->closeSession(name);
}

void MainWindow::onOpenLogFile()
{
    const QString path = Logger::logFilePath();
    if (path.isEmpty() || !QFileInfo::exists(path)) {
        QMessageBox::information(this, tr("Log file"), tr("No log file yet."));
        return;
    }
    if (!QDesktopServices::openUrl(QUrl::fromLocalFile(path)))
        QMessageBox::information(this, tr("Log file"), path);
}

void MainWindow::closeEvent(QCloseEvent* e)
{
    qInfo().noquote() << "[CONN] main window closing; disconnecting all sessions";
    m_workbench->disconnectAll();
    AuditLogger::writeEvent("app.exit");
    QMainWindow::closeEvent(e);
}
