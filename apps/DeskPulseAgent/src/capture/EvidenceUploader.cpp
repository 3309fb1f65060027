#include "EvidenceUploader.h"
#include "logger/logger.h"

#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

EvidenceUploader::EvidenceUploader(Clock* clock, QObject* parent)
    : QObject(parent)
    , m_networkManager(new QNetworkAccessManager(this))
    , m_clock(clock ? clock : Clock::system())
    , m_bucket("tracker-evidence")
    , m_timeoutMs(30000)
    , m_initialized(false)
{
}

EvidenceUploader::~EvidenceUploader() = default;

bool EvidenceUploader::initialize(const QString& storageUrl, const QString& bucket, const QString& apiKey)
{
    if (storageUrl.isEmpty()) {
        LOG_WARNING("No storage URL configured; evidence uploads are disabled");
        return false;
    }

    m_storageUrl = storageUrl;
    while (m_storageUrl.endsWith('/')) {
        m_storageUrl.chop(1);
    }
    if (!bucket.isEmpty()) {
        m_bucket = bucket;
    }
    m_apiKey = apiKey;
    m_initialized = true;

    LOG_INFO(QString("Evidence uploads go to bucket %1").arg(m_bucket));
    return true;
}

void EvidenceUploader::setTimeout(int msecs)
{
    m_timeoutMs = msecs;
}

QString EvidenceUploader::objectName(const QString& prefix, const QString& userId, const QDateTime& at)
{
    return QString("%1_%2_%3.jpg").arg(prefix, userId).arg(at.toMSecsSinceEpoch());
}

QString EvidenceUploader::publicUrl(const QString& objectName) const
{
    return QString("%1/storage/v1/object/public/%2/%3").arg(m_storageUrl, m_bucket, objectName);
}

void EvidenceUploader::upload(const QByteArray& jpeg, const QString& prefix, const QString& userId, Callback callback)
{
    if (jpeg.size() < MinimumUploadBytes) {
        LOG_DEBUG(QString("Skipping %1 upload: %2 bytes").arg(prefix).arg(jpeg.size()));
        callback(QString());
        return;
    }
    if (!m_initialized) {
        LOG_WARNING("Evidence uploader not initialized");
        callback(QString());
        return;
    }

    const QString name = objectName(prefix, userId, m_clock->now());

    QNetworkRequest request(QUrl(QString("%1/storage/v1/object/%2/%3").arg(m_storageUrl, m_bucket, name)));
    request.setHeader(QNetworkRequest::ContentTypeHeader, "image/jpeg");
    if (!m_apiKey.isEmpty()) {
        request.setRawHeader("Authorization", QString("Bearer %1").arg(m_apiKey).toUtf8());
        request.setRawHeader("apikey", m_apiKey.toUtf8());
    }
    request.setTransferTimeout(m_timeoutMs);

    QNetworkReply* reply = m_networkManager->post(request, jpeg);
    connect(reply, &QNetworkReply::finished, this, [this, reply, name, callback]() {
        reply->deleteLater();
        if (reply->error() != QNetworkReply::NoError) {
            const int httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
            LOG_WARNING(QString("Upload of %1 failed (HTTP %2): %3").arg(name).arg(httpStatus).arg(reply->errorString()));
            callback(QString());
            return;
        }
        LOG_DEBUG(QString("Uploaded %1").arg(name));
        callback(publicUrl(name));
    });
}
