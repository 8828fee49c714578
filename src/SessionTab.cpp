// SessionTab.cpp
#include "SessionTab.h"
#include "Connection.h"
#include "EmbedSurface.h"
#include "RemoteEditorWindow.h"
#include "ShellHost.h"
#include "TransferPipeline.h"

#include <QFileDialog>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QInputDialog>
#include <QLabel>
#include <QLineEdit>
#include <QMenu>
#include <QMessageBox>
#include <QPushButton>
#include <QSplitter>
#include <QStandardPaths>
#include <QStyle>
#include <QTableWidget>
#include <QVBoxLayout>
#include <QDir>
#include <QDebug>

SessionTab::SessionTab(Connection *connection,
                       const ShellLaunchOptions& shellOptions,
                       QWidget *parent)
    : QWidget(parent)
    , m_conn(connection)
    , m_shellOptions(shellOptions)
{
    buildUi();

    m_conn->shellHost()->setOptions(m_shellOptions);

    connect(m_conn, &Connection::listingChanged, this, &SessionTab::onListingChanged);
    connect(m_conn, &Connection::stateChanged, this, &SessionTab::onStateChanged);
    connect(m_conn, &Connection::currentPathChanged, m_pathEdit, &QLineEdit::setText);
    connect(m_conn, &Connection::statusChanged, m_statusLabel, &QLabel::setText);
    connect(m_conn, &Connection::errorReported, this, &SessionTab::onError);
    connect(m_conn, &Connection::editRequested, this, &SessionTab::onEditRequested);
    connect(m_conn, &Connection::entryInspected, this, &SessionTab::onEntryInspected);
    connect(m_conn, &Connection::infoReported, this, [this](const QString& msg) {
        m_statusLabel->setText(msg);
    });
    connect(m_conn, &Connection::shellWarning, this, [this](const QString& msg) {
        m_statusLabel->setText(msg);
    });

    m_pathEdit->setText(m_conn->currentPath());
    m_statusLabel->setText(m_conn->statusText());
    onStateChanged();
}

SessionTab::~SessionTab()
{
    // The shell may still be waiting on m_surface, which dies with this tab.
    m_conn->shellHost()->stop();
}

QString SessionTab::sessionName() const
{
    return m_conn->session().name;
}

// -----------------------------------------------------------------------------
// buildUi()
// -----------------------------------------------------------------------------
void SessionTab::buildUi()
{
    auto *outer = new QVBoxLayout(this);
    outer->setContentsMargins(0, 0, 0, 0);
    outer->setSpacing(6);

    // =========================
    // Top bar
    // =========================
    auto *top = new QWidget(this);
    auto *topL = new QHBoxLayout(top);
    topL->setContentsMargins(0, 0, 0, 0);
    topL->setSpacing(6);

    m_connectBtn    = new QPushButton(tr("Connect"), top);
    m_disconnectBtn = new QPushButton(tr("Disconnect"), top);
    m_syncBtn       = new QPushButton(tr("Sync"), top);
    m_refreshBtn    = new QPushButton(tr("Refresh"), top);
    m_upBtn         = new QPushButton(tr("Up"), top);
    m_pathEdit      = new QLineEdit(top);
    m_pathEdit->setPlaceholderText(tr("/remote/path"));

    m_syncBtn->setToolTip(tr("Jump to the shell's login directory (remote pwd)"));

    topL->addWidget(m_connectBtn);
    topL->addWidget(m_disconnectBtn);
    topL->addWidget(m_syncBtn);
    topL->addWidget(m_refreshBtn);
    topL->addWidget(m_upBtn);
    topL->addWidget(m_pathEdit, 1);

    // =========================
    // Listing / shell splitter
    // =========================
    auto *split = new QSplitter(Qt::Vertical, this);
    split->setChildrenCollapsible(false);

    m_table = new QTableWidget(split);
    m_table->setColumnCount(3);
    m_table->setHorizontalHeaderLabels(QStringList{ tr("Name"), tr("Size"), tr("Modified") });

    auto *hdr = m_table->horizontalHeader();
    hdr->setSectionResizeMode(QHeaderView::Interactive);
    hdr->setStretchLastSection(true);
    m_table->setColumnWidth(0, 260);
    m_table->setColumnWidth(1, 100);

    m_table->setSelectionBehavior(QAbstractItemView::SelectRows);
    m_table->setSelectionMode(QAbstractItemView::SingleSelection);
    m_table->setEditTriggers(QAbstractItemView::NoEditTriggers);
    m_table->setShowGrid(false);
    m_table->setAlternatingRowColors(true);
    m_table->verticalHeader()->setVisible(false);
    m_table->verticalHeader()->setDefaultSectionSize(22);
    // Order comes from the Connection (".." first, dirs, files)
    m_table->setSortingEnabled(false);

    m_table->setContextMenuPolicy(Qt::CustomContextMenu);
    connect(m_table, &QWidget::customContextMenuRequested,
            this, &SessionTab::showRemoteContextMenu);

    m_surface = new EmbedSurface(split);

    split->setStretchFactor(0, 1);
    split->setStretchFactor(1, 2);

    m_statusLabel = new QLabel(this);
    m_statusLabel->setStyleSheet("color:#888;");

    outer->addWidget(top);
    outer->addWidget(split, 1);
    outer->addWidget(m_statusLabel);

    // =========================
    // Wiring
    // =========================
    connect(m_connectBtn, &QPushButton::clicked, this, &SessionTab::connectSession);
    connect(m_disconnectBtn, &QPushButton::clicked, m_conn, &Connection::disconnectSession);
    connect(m_syncBtn, &QPushButton::clicked, this, [this]() { m_conn->sync(); });
    connect(m_refreshBtn, &QPushButton::clicked, this, [this]() { m_conn->refreshFiles(); });
    connect(m_upBtn, &QPushButton::clicked, this, [this]() { m_conn->goUp(); });
    connect(m_pathEdit, &QLineEdit::returnPressed, this, [this]() {
        if (!m_conn->openPath(m_pathEdit->text()))
            m_pathEdit->setText(m_conn->currentPath());
    });
    connect(m_table, &QTableWidget::cellDoubleClicked, this, [this](int row, int) {
        auto *it = m_table->item(row, 0);
        if (it) m_conn->activateEntry(it->text());
    });
}

void SessionTab::connectSession()
{
    m_conn->connectSession(m_surface);
}

// -----------------------------------------------------------------------------
// Rendering
// -----------------------------------------------------------------------------
void SessionTab::onListingChanged()
{
    const QIcon dirIcon  = style()->standardIcon(QStyle::SP_DirIcon);
    const QIcon fileIcon = style()->standardIcon(QStyle::SP_FileIcon);
    const QIcon upIcon   = style()->standardIcon(QStyle::SP_FileDialogToParent);

    const QVector<FileEntry>& entries = m_conn->entries();

    m_table->clearContents();
    m_table->setRowCount(entries.size());

    for (int row = 0; row < entries.size(); ++row) {
        const FileEntry& e = entries[row];

        auto *nameItem = new QTableWidgetItem(e.name);
        nameItem->setIcon(e.isParentLink ? upIcon : (e.isDirectory ? dirIcon : fileIcon));

        auto *sizeItem = new QTableWidgetItem(e.sizeText());
        sizeItem->setTextAlignment(Qt::AlignRight | Qt::AlignVCenter);

        m_table->setItem(row, 0, nameItem);
        m_table->setItem(row, 1, sizeItem);
        m_table->setItem(row, 2, new QTableWidgetItem(e.modifiedText()));
    }
}

void SessionTab::onStateChanged()
{
    const Connection::State s = m_conn->state();
    const bool connected = (s == Connection::State::Connected);

    m_connectBtn->setEnabled(s == Connection::State::Idle || connected);
    m_connectBtn->setText(connected ? tr("Reconnect") : tr("Connect"));
    m_disconnectBtn->setEnabled(s != Connection::State::Idle);
    m_syncBtn->setEnabled(connected);
    m_refreshBtn->setEnabled(connected);
    m_upBtn->setEnabled(connected);
    m_pathEdit->setEnabled(connected);
}

void SessionTab::onError(const RemoteError& error)
{
    // Busy is routine (double click while a task runs).
    if (error.kind == RemoteErrorKind::Busy) {
        m_statusLabel->setText(error.message);
        return;
    }

    QString title;
    switch (error.kind) {
        case RemoteErrorKind::AuthConfig:
        case RemoteErrorKind::Auth:            title = tr("Authentication"); break;
        case RemoteErrorKind::Connect:         title = tr("Connection"); break;
        case RemoteErrorKind::List:
        case RemoteErrorKind::Attribute:       title = tr("Files"); break;
        case RemoteErrorKind::SurfaceNotReady:
        case RemoteErrorKind::ShellLaunch:     title = tr("Shell"); break;
        default:                               title = tr("Transfer"); break;
    }
    QMessageBox::warning(this, title, error.message);
}

void SessionTab::onEditRequested(const QString& remotePath)
{
    auto *win = new RemoteEditorWindow(m_conn->session(), remotePath, m_shellOptions, window());
    connect(win, &RemoteEditorWindow::editorClosed, this, [this]() {
        m_conn->refreshFiles();
    });
    win->start();
}

// -----------------------------------------------------------------------------
// Context menu
// -----------------------------------------------------------------------------
QString SessionTab::selectedName() const
{
    const auto rows = m_table->selectionModel()
                        ? m_table->selectionModel()->selectedRows()
                        : QModelIndexList();
    if (rows.size() != 1) return QString();
    auto *it = m_table->item(rows.first().row(), 0);
    return it ? it->text() : QString();
}

void SessionTab::showRemoteContextMenu(const QPoint& pos)
{
    if (!m_conn->isConnected()) return;

    const QString name = selectedName();
    const bool entry = !name.isEmpty() && name != "..";

    QMenu menu(this);

    QAction* actOpen      = menu.addAction(tr("Open"));
    QAction* actDownload  = menu.addAction(tr("Download…"));
    menu.addSeparator();
    QAction* actUpload    = menu.addAction(tr("Upload file…"));
    QAction* actUploadDir = menu.addAction(tr("Upload folder…"));
    menu.addSeparator();
    QAction* actRename    = menu.addAction(tr("Rename…"));
    QAction* actTarGz     = menu.addAction(tr("Compress (tar.gz)"));
    QAction* actZip       = menu.addAction(tr("Compress (zip)"));
    QAction* actExtract   = menu.addAction(tr("Extract here"));
    menu.addSeparator();
    QAction* actDelete    = menu.addAction(tr("Delete"));

    actOpen->setEnabled(!name.isEmpty());
    actDownload->setEnabled(entry);
    actRename->setEnabled(entry);
    actTarGz->setEnabled(entry);
    actZip->setEnabled(entry);
    actExtract->setEnabled(entry && TransferPipeline::isSupportedArchive(name));
    actDelete->setEnabled(entry);

    const QAction* chosen = menu.exec(m_table->viewport()->mapToGlobal(pos));
    if (!chosen) return;

    if (chosen == actOpen)            m_conn->activateEntry(name);
    else if (chosen == actDownload)   downloadSelected();
    else if (chosen == actUpload)     uploadFileDialog();
    else if (chosen == actUploadDir)  uploadFolderDialog();
    else if (chosen == actRename)     renameSelected();
    else if (chosen == actTarGz)      m_conn->compressEntry(name, ArchiveFormat::TarGz);
    else if (chosen == actZip)        m_conn->compressEntry(name, ArchiveFormat::Zip);
    else if (chosen == actExtract)    m_conn->extractEntry(name);
    else if (chosen == actDelete)     deleteSelected();
}

// -----------------------------------------------------------------------------
// Actions
// -----------------------------------------------------------------------------
void SessionTab::downloadSelected()
{
    const QString name = selectedName();
    if (name.isEmpty() || name == "..") return;

    // The dialog waits for the server's answer; the listing may be stale.
    if (m_conn->inspectEntry(name))
        m_pendingDownload = name;
}

void SessionTab::onEntryInspected(const QString& name, bool isDir)
{
    if (name != m_pendingDownload) return;
    m_pendingDownload.clear();

    const QString home = QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
    QString target;
    if (isDir) {
        target = QFileDialog::getExistingDirectory(this, tr("Download folder into"), home);
    } else {
        target = QFileDialog::getSaveFileName(this, tr("Download file"), QDir(home).filePath(name));
    }
    if (target.isEmpty()) return;

    m_conn->downloadEntry(name, target);
}

void SessionTab::uploadFileDialog()
{
    const QString path = QFileDialog::getOpenFileName(this, tr("Upload file"), QDir::homePath());
    if (path.isEmpty()) return;
    m_conn->uploadFile(path);
}

void SessionTab::uploadFolderDialog()
{
    const QString dir = QFileDialog::getExistingDirectory(this, tr("Upload folder"), QDir::homePath());
    if (dir.isEmpty()) return;
    m_conn->uploadFolder(dir);
}

void SessionTab::renameSelected()
{
    const QString oldName = selectedName();
    if (oldName.isEmpty() || oldName == "..") return;

    bool ok = false;
    const QString newName = QInputDialog::getText(
        this, tr("Rename"), tr("New name:"), QLineEdit::Normal, oldName, &ok);
    if (!ok) return;

    m_conn->renameEntry(oldName, newName);
}

void SessionTab::deleteSelected()
{
    const QString name = selectedName();
    if (name.isEmpty() || name == "..") return;

    const auto answer = QMessageBox::question(
        this, tr("Delete"),
        tr("Delete '%1' on the server?\nFolders are removed recursively.").arg(name));
    if (answer != QMessageBox::Yes) return;

    m_conn->deleteEntry(name);
}
