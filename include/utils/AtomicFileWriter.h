#ifndef ATOMICFILEWRITER_H
#define ATOMICFILEWRITER_H

#include <QByteArray>
#include <QImage>
#include <QString>

namespace Hawk {

class AtomicFileWriter
{
public:
    struct Error {
        QString message;
        QString stage; // mkdir / open / encode / write / commit
    };

    // Creates missing parent directories. The target only appears once the
    // whole payload is on disk.
    static bool writeBytes(const QByteArray& data,
                           const QString& filePath,
                           Error* error = nullptr);

    static bool writeImage(const QImage& image,
                           const QString& filePath,
                           const QByteArray& format = QByteArrayLiteral("png"),
                           Error* error = nullptr);

    // Returns path, or path with _1, _2, ... inserted before the suffix when
    // something already exists there.
    static QString uniquePath(const QString& path);

private:
    static bool ensureParentDirectory(const QString& filePath, Error* error);
    static void setError(Error* error, const QString& stage, const QString& message);
};

} // namespace Hawk

#endif // ATOMICFILEWRITER_H
