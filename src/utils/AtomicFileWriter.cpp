#include "utils/AtomicFileWriter.h"

#include <QDir>
#include <QFileInfo>
#include <QImageWriter>
#include <QSaveFile>

namespace Hawk {

bool AtomicFileWriter::writeBytes(const QByteArray& data,
                                  const QString& filePath,
                                  Error* error)
{
    if (!ensureParentDirectory(filePath, error)) {
        return false;
    }

    QSaveFile saveFile(filePath);
    if (!saveFile.open(QIODevice::WriteOnly)) {
        const QString saveError = saveFile.errorString().trimmed();
        setError(error, QStringLiteral("open"),
                 saveError.isEmpty() ? QStringLiteral("Failed to open output file")
                                     : saveError);
        return false;
    }

    if (saveFile.write(data) != data.size()) {
        const QString writeError = saveFile.errorString().trimmed();
        saveFile.cancelWriting();
        setError(error, QStringLiteral("write"),
                 writeError.isEmpty() ? QStringLiteral("Failed to write output file")
                                      : writeError);
        return false;
    }

    if (!saveFile.commit()) {
        const QString commitError = saveFile.errorString().trimmed();
        setError(error, QStringLiteral("commit"),
                 commitError.isEmpty() ? QStringLiteral("Failed to commit output file")
                                       : commitError);
        return false;
    }

    return true;
}

bool AtomicFileWriter::writeImage(const QImage& image,
                                  const QString& filePath,
                                  const QByteArray& format,
                                  Error* error)
{
    if (image.isNull()) {
        setError(error, QStringLiteral("encode"), QStringLiteral("Image is null"));
        return false;
    }
    if (!ensureParentDirectory(filePath, error)) {
        return false;
    }

    QSaveFile saveFile(filePath);
    if (!saveFile.open(QIODevice::WriteOnly)) {
        const QString saveError = saveFile.errorString().trimmed();
        setError(error, QStringLiteral("open"),
                 saveError.isEmpty() ? QStringLiteral("Failed to open output file")
                                     : saveError);
        return false;
    }

    QImageWriter writer(&saveFile, format);
    if (!writer.write(image)) {
        saveFile.cancelWriting();
        const QString writeError = writer.errorString().trimmed();
        setError(error, QStringLiteral("encode"),
                 writeError.isEmpty() ? QStringLiteral("Failed to encode image")
                                      : writeError);
        return false;
    }

    if (!saveFile.commit()) {
        const QString commitError = saveFile.errorString().trimmed();
        setError(error, QStringLiteral("commit"),
                 commitError.isEmpty() ? QStringLiteral("Failed to commit output file")
                                       : commitError);
        return false;
    }

    return true;
}

QString AtomicFileWriter::uniquePath(const QString& path)
{
    if (!QFileInfo::exists(path)) {
        return path;
    }

    const QFileInfo info(path);
    const QString base = info.path() + QLatin1Char('/') + info.completeBaseName();
    const QString suffix = info.suffix().isEmpty() ? QString()
                                                   : QLatin1Char('.') + info.suffix();
    for (int counter = 1;; ++counter) {
        const QString candidate = QStringLiteral("%1_%2%3").arg(base).arg(counter).arg(suffix);
        if (!QFileInfo::exists(candidate)) {
            return candidate;
        }
    }
}

bool AtomicFileWriter::ensureParentDirectory(const QString& filePath, Error* error)
{
    const QString directory = QFileInfo(filePath).absolutePath();
    if (QDir().mkpath(directory)) {
        return true;
    }
    setError(error, QStringLiteral("mkdir"),
             QStringLiteral("Failed to create directory %1").arg(directory));
    return false;
}

void AtomicFileWriter::setError(Error* error, const QString& stage, const QString& message)
{
    if (!error) {
        return;
    }
    error->stage = stage;
    error->message = message;
}

} // namespace Hawk
