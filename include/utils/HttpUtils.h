#ifndef HTTPUTILS_H
#define HTTPUTILS_H

#include <QByteArray>
#include <QNetworkRequest>
#include <QString>

namespace Hawk {
namespace HttpUtils {

struct HttpResponse
{
    int statusCode = 0;
    QByteArray body;
    QString errorString;
    bool timedOut = false;

    bool isSuccess() const { return !timedOut && statusCode >= 200 && statusCode < 300; }

    // Best description of a failed response for logs and error out-params.
    QString failureMessage() const;
};

/**
 * @brief Send one request and wait for the reply in a local event loop.
 *
 * A QNetworkAccessManager is created for the call so the function can be
 * used from any thread. The request is aborted when timeoutMs elapses.
 */
HttpResponse sendBlocking(const QNetworkRequest& request,
                          const QByteArray& verb,
                          const QByteArray& body,
                          int timeoutMs);

QNetworkRequest jsonRequest(const QUrl& url, const QString& bearerToken = QString());

// Pulls "error" or "message" out of a JSON error body, else a generic
// message for the status code.
QString errorMessageFromBody(const QByteArray& body, int statusCode);

} // namespace HttpUtils
} // namespace Hawk

#endif // HTTPUTILS_H
