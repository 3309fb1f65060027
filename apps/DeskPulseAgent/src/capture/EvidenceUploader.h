#ifndef EVIDENCEUPLOADER_H
#define EVIDENCEUPLOADER_H

#include <QByteArray>
#include <QDateTime>
#include <QNetworkAccessManager>
#include <QObject>
#include <QString>

#include <functional>

#include "sessioncore/clock.h"

/**
 * @brief Uploads evidence JPEGs to the object storage bucket
 *
 * POST {storageUrl}/storage/v1/object/{bucket}/{name}; the public URL is
 * {storageUrl}/storage/v1/object/public/{bucket}/{name}.
 */
class EvidenceUploader : public QObject
{
    Q_OBJECT
public:
    using Callback = std::function<void(const QString& url)>;

    // Buffers smaller than this are treated as a failed capture
    static const int MinimumUploadBytes = 100;

    explicit EvidenceUploader(Clock* clock = nullptr, QObject* parent = nullptr);
    ~EvidenceUploader() override;

    bool initialize(const QString& storageUrl, const QString& bucket, const QString& apiKey);
    void setTimeout(int msecs);

    // Callback receives the public URL, or an empty string on failure
    void upload(const QByteArray& jpeg, const QString& prefix, const QString& userId, Callback callback);

    static QString objectName(const QString& prefix, const QString& userId, const QDateTime& at);
    QString publicUrl(const QString& objectName) const;

private:
    QNetworkAccessManager* m_networkManager;
    Clock* m_clock;
    QString m_storageUrl;
    QString m_bucket;
    QString m_apiKey;
    int m_timeoutMs;
    bool m_initialized;
};

#endif // EVIDENCEUPLOADER_H
