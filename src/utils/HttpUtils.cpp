#include "utils/HttpUtils.h"

#include <QEventLoop>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QTimer>

namespace Hawk {
namespace HttpUtils {

QString HttpResponse::failureMessage() const
{
    if (timedOut) {
        return QStringLiteral("Request timed out");
    }
    if (statusCode <= 0) {
        return errorString.isEmpty() ? QStringLiteral("Network request failed") : errorString;
    }
    return errorMessageFromBody(body, statusCode);
}

HttpResponse sendBlocking(const QNetworkRequest& request,
                          const QByteArray& verb,
                          const QByteArray& body,
                          int timeoutMs)
{
    QNetworkAccessManager manager;
    QNetworkReply* reply = manager.sendCustomRequest(request, verb, body);

    QEventLoop loop;
    QTimer timeoutTimer;
    timeoutTimer.setSingleShot(true);

    HttpResponse response;
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timeoutTimer, &QTimer::timeout, &loop, [&]() {
        response.timedOut = true;
        loop.quit();
    });

    timeoutTimer.start(timeoutMs);
    if (!reply->isFinished()) {
        loop.exec();
    }
    timeoutTimer.stop();

    if (response.timedOut) {
        reply->abort();
        reply->deleteLater();
        return response;
    }

    response.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    response.body = reply->readAll();
    if (reply->error() != QNetworkReply::NoError) {
        response.errorString = reply->errorString();
    }
    reply->deleteLater();
    return response;
}

QNetworkRequest jsonRequest(const QUrl& url, const QString& bearerToken)
{
    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    request.setRawHeader("Accept", "application/json");
    if (!bearerToken.isEmpty()) {
        request.setRawHeader("Authorization", "Bearer " + bearerToken.toUtf8());
    }
    return request;
}

QString errorMessageFromBody(const QByteArray& body, int statusCode)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error == QJsonParseError::NoError && doc.isObject()) {
        const QJsonObject obj = doc.object();
        const QJsonValue errorValue = obj.value("error");
        if (errorValue.isString() && !errorValue.toString().trimmed().isEmpty()) {
            return errorValue.toString().trimmed();
        }
        if (errorValue.isObject()) {
            const QString nested = errorValue.toObject().value("message").toString().trimmed();
            if (!nested.isEmpty()) {
                return nested;
            }
        }
        const QString message = obj.value("message").toString().trimmed();
        if (!message.isEmpty()) {
            return message;
        }
    }
    return QStringLiteral("Request failed with HTTP status %1").arg(statusCode);
}

} // namespace HttpUtils
} // namespace Hawk
