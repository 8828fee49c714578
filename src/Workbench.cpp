// Workbench.cpp
#include "Workbench.h"
#include "Connection.h"

#include <QDebug>

Workbench::Workbench(std::shared_ptr<ChannelFactory> factory,
                     const TransferOptions& transferOptions,
                     QObject *parent)
    : QObject(parent)
    , m_factory(std::move(factory))
    , m_transferOptions(transferOptions)
{
}

Workbench::~Workbench()
{
    disconnectAll();
    m_connections.clear();
}

void Workbench::setSessions(const SessionList& sessions)
{
    m_sessions = sessions;

    // Open connections pick up edited records; they apply on next connect.
    for (auto& kv : m_connections) {
        SessionRecord s;
        if (findSession(kv.first, &s))
            kv.second->setSession(s);
    }
}

bool Workbench::findSession(const QString& name, SessionRecord* out) const
{
    for (const SessionRecord& s : m_sessions) {
        if (s.name == name) {
            if (out) *out = s;
            return true;
        }
    }
    return false;
}

Connection* Workbench::connectionFor(const QString& name)
{
    auto it = m_connections.find(name);
    if (it != m_connections.end())
        return it->second.get();

    SessionRecord s;
    if (!findSession(name, &s)) {
        qWarning().noquote() << QString("[CONN] unknown session '%1'").arg(name);
        return nullptr;
    }

    qInfo().noquote() << QString("[CONN] open session '%1'").arg(name);
    std::unique_ptr<Connection> c(new Connection(s, m_factory, m_transferOptions));
    Connection* raw = c.get();
    m_connections.emplace(name, std::move(c));
    return raw;
}

Connection* Workbench::existingConnection(const QString& name) const
{
    auto it = m_connections.find(name);
    return it == m_connections.end() ? nullptr : it->second.get();
}

void Workbench::closeSession(const QString& name)
{
    auto it = m_connections.find(name);
    if (it == m_connections.end())
        return;

    qInfo().noquote() << QString("[CONN] close session '%1'").arg(name);
    it->second->disconnectSession();
    m_connections.erase(it);
}

void Workbench::disconnectAll()
{
    for (auto& kv : m_connections)
        kv.second->disconnectSession();
}
