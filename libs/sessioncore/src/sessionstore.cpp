#include "sessioncore/sessionstore.h"

SessionStore::SessionStore(QObject* parent)
    : QObject(parent)
{
    qRegisterMetaType<WorkSession>();
}

SessionStore::~SessionStore() = default;

QString SessionStore::lastError() const
{
    return m_lastError;
}

void SessionStore::setLastError(const QString& error)
{
    m_lastError = error;
}
