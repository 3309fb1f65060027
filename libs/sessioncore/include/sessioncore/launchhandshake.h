#ifndef SESSIONCORE_LAUNCHHANDSHAKE_H
#define SESSIONCORE_LAUNCHHANDSHAKE_H

#include <QString>
#include <QStringList>
#include <QUrl>

/**
 * @brief Identity hand-off carried in a custom-scheme launch URL
 *
 * {scheme}://checkin?token=..&uid=..&name=..&email=..&photo=..
 * {scheme}://refresh?token=..
 *
 * Parsing also accepts the long keys credential/userId/photoUrl, and tolerates
 * the surrounding quotes and trailing slashes some launchers add.
 */
struct LaunchHandshake
{
    enum class Action {
        None,
        CheckIn,
        Refresh,
        Open
    };

    Action action = Action::None;
    QString credential;
    QString userId;
    QString name;
    QString email;
    QString photoUrl;

    bool isValid() const;

    QUrl toUrl(const QString& scheme) const;

    static LaunchHandshake checkIn(const QString& credential, const QString& userId, const QString& name,
                                   const QString& email = QString(), const QString& photoUrl = QString());
    static LaunchHandshake refresh(const QString& credential);

    static bool parse(const QString& raw, const QString& scheme, LaunchHandshake& handshake);

    // First argument that parses as a handshake for scheme
    static bool fromArguments(const QStringList& arguments, const QString& scheme, LaunchHandshake& handshake);

    static QString actionName(Action action);
};

#endif // SESSIONCORE_LAUNCHHANDSHAKE_H
