#include "sessioncore/launchhandshake.h"

#include <QByteArrayList>
#include <QHash>
#include <QList>
#include <QPair>

namespace {

QString decodeComponent(QString value)
{
    value.replace('+', ' ');
    return QUrl::fromPercentEncoding(value.toUtf8());
}

QString firstOf(const QHash<QString, QString>& params, const QStringList& keys)
{
    for (const QString& key : keys) {
        if (params.contains(key)) {
            return params.value(key);
        }
    }
    return QString();
}

} // namespace

bool LaunchHandshake::isValid() const
{
    switch (action) {
        case Action::CheckIn: return !credential.isEmpty() && !userId.isEmpty();
        case Action::Refresh: return !credential.isEmpty();
        case Action::Open:    return true;
        case Action::None:    return false;
    }
    return false;
}

QUrl LaunchHandshake::toUrl(const QString& scheme) const
{
    QList<QPair<QString, QString>> params;
    if (action == Action::CheckIn) {
        params = {{"token", credential}, {"uid", userId}, {"name", name},
                  {"email", email}, {"photo", photoUrl}};
    } else if (action == Action::Refresh) {
        params = {{"token", credential}};
    }

    QByteArray encoded = scheme.toUtf8() + "://" + actionName(action).toUtf8();
    QByteArrayList pairs;
    for (const auto& param : params) {
        pairs.append(param.first.toUtf8() + '=' + QUrl::toPercentEncoding(param.second));
    }
    if (!pairs.isEmpty()) {
        encoded += '?' + pairs.join('&');
    }
    return QUrl::fromEncoded(encoded, QUrl::StrictMode);
}

LaunchHandshake LaunchHandshake::checkIn(const QString& credential, const QString& userId, const QString& name,
                                         const QString& email, const QString& photoUrl)
{
    LaunchHandshake handshake;
    handshake.action = Action::CheckIn;
    handshake.credential = credential;
    handshake.userId = userId;
    handshake.name = name;
    handshake.email = email;
    handshake.photoUrl = photoUrl;
    return handshake;
}

LaunchHandshake LaunchHandshake::refresh(const QString& credential)
{
    LaunchHandshake handshake;
    handshake.action = Action::Refresh;
    handshake.credential = credential;
    return handshake;
}

bool LaunchHandshake::parse(const QString& raw, const QString& scheme, LaunchHandshake& handshake)
{
    handshake = LaunchHandshake();

    QString url = raw.trimmed();
    while (!url.isEmpty() && (url.startsWith('"') || url.startsWith('\''))) {
        url.remove(0, 1);
    }
    while (!url.isEmpty() && (url.endsWith('"') || url.endsWith('\''))) {
        url.chop(1);
    }
    while (url.endsWith('/')) {
        url.chop(1);
    }

    // Long credentials survive a manual split better than a full URL parse
    const QString prefix = scheme + "://";
    if (!url.startsWith(prefix, Qt::CaseInsensitive)) {
        return false;
    }
    url = url.mid(prefix.length());

    const int queryIndex = url.indexOf('?');
    QString actionPart = queryIndex >= 0 ? url.left(queryIndex) : url;
    const QString paramPart = queryIndex >= 0 ? url.mid(queryIndex + 1) : QString();
    while (actionPart.endsWith('/')) {
        actionPart.chop(1);
    }
    actionPart = actionPart.toLower();

    QHash<QString, QString> params;
    const QStringList pairs = paramPart.split('&', Qt::SkipEmptyParts);
    for (const QString& pair : pairs) {
        const int eq = pair.indexOf('=');
        if (eq < 0) {
            continue;
        }
        params.insert(decodeComponent(pair.left(eq)), decodeComponent(pair.mid(eq + 1)));
    }

    if (actionPart == "checkin") {
        handshake.action = Action::CheckIn;
    } else if (actionPart == "refresh") {
        handshake.action = Action::Refresh;
    } else if (actionPart == "open" || actionPart.isEmpty()) {
        handshake.action = Action::Open;
    } else {
        return false;
    }

    handshake.credential = firstOf(params, {"token", "credential"});
    handshake.userId = firstOf(params, {"uid", "userId"});
    handshake.name = firstOf(params, {"name"});
    handshake.email = firstOf(params, {"email"});
    handshake.photoUrl = firstOf(params, {"photo", "photoUrl"});

    return handshake.isValid();
}

bool LaunchHandshake::fromArguments(const QStringList& arguments, const QString& scheme, LaunchHandshake& handshake)
{
    for (const QString& argument : arguments) {
        if (argument.contains(scheme + "://", Qt::CaseInsensitive) && parse(argument, scheme, handshake)) {
            return true;
        }
    }
    return false;
}

QString LaunchHandshake::actionName(Action action)
{
    switch (action) {
        case Action::CheckIn: return "checkin";
        case Action::Refresh: return "refresh";
        case Action::Open:    return "open";
        case Action::None:    return QString();
    }
    return QString();
}
