#pragma once

#include <QWidget>
#include <QString>

#include "RemoteError.h"
#include "ShellCommand.h"

class QLabel;
class QLineEdit;
class QPushButton;
class QTableWidget;

class Connection;
class EmbedSurface;

/*
    SessionTab
    ----------
    One tab per open session: file listing on top, embedded shell below.
    All state lives in the Connection; the tab only renders it and turns
    user actions into Connection calls.
*/
class SessionTab : public QWidget
{
    Q_OBJECT
public:
    SessionTab(Connection *connection,
               const ShellLaunchOptions& shellOptions,
               QWidget *parent = nullptr);
    ~SessionTab() override;

    Connection* connection() const { return m_conn; }
    QString sessionName() const;

    void connectSession();

private slots:
    void onListingChanged();
    void onStateChanged();
    void onError(const RemoteError& error);
    void onEditRequested(const QString& remotePath);
    void onEntryInspected(const QString& name, bool isDirectory);
    void showRemoteContextMenu(const QPoint& pos);

private:
    void buildUi();
    QString selectedName() const;

    void downloadSelected();
    void uploadFileDialog();
    void uploadFolderDialog();
    void renameSelected();
    void deleteSelected();

    Connection *m_conn = nullptr;
    ShellLaunchOptions m_shellOptions;
    QString m_pendingDownload;   // entry whose download dialog waits on inspectEntry()

    QPushButton *m_connectBtn = nullptr;
    QPushButton *m_disconnectBtn = nullptr;
    QPushButton *m_syncBtn = nullptr;
    QPushButton *m_refreshBtn = nullptr;
    QPushButton *m_upBtn = nullptr;
    QLineEdit   *m_pathEdit = nullptr;
    QTableWidget *m_table = nullptr;
    EmbedSurface *m_surface = nullptr;
    QLabel      *m_statusLabel = nullptr;
};
