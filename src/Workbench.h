#pragma once

#include <QObject>
#include <QString>
#include <map>
#include <memory>

#include "RemoteChannels.h"
#include "SessionRecord.h"
#include "TransferPipeline.h"

class Connection;

/*
    Workbench
    ---------
    Registry of open sessions: the (read-only) session list plus one
    Connection per session name, created on first use and destroyed when
    its tab closes.
*/
class Workbench : public QObject
{
    Q_OBJECT
public:
    explicit Workbench(std::shared_ptr<ChannelFactory> factory,
                       const TransferOptions& transferOptions = TransferOptions(),
                       QObject *parent = nullptr);
    ~Workbench() override;

    void setSessions(const SessionList& sessions);
    const SessionList& sessions() const { return m_sessions; }

    // nullptr / false when no session has that name
    bool findSession(const QString& name, SessionRecord* out) const;

    // Lazily creates the Connection; nullptr for an unknown session.
    Connection* connectionFor(const QString& name);
    Connection* existingConnection(const QString& name) const;

    void closeSession(const QString& name);
    void disconnectAll();

    int openCount() const { return int(m_connections.size()); }

private:
    std::shared_ptr<ChannelFactory> m_factory;
    TransferOptions m_transferOptions;
    SessionList m_sessions;
    std::map<QString, std::unique_ptr<Connection>> m_connections;
};
