#include "storage/folder_remote_store.hpp"

#include <QDebug>
#include <QDir>
#include <QMetaObject>
#include <QSaveFile>

namespace sheaf::storage {

namespace {

bool is_plain_segment(const QString& name) {
    return !name.isEmpty() && name != QStringLiteral(".") && name != QStringLiteral("..") &&
           !name.contains(QLatin1Char('/')) && !name.contains(QLatin1Char('\\'));
}

Error upload_error(const QString& message) {
    return Error{message.toStdString(), ErrorKind::TransientUpload};
}

} // namespace

FolderRemoteStore::FolderRemoteStore(QString root, QObject* parent)
    : QObject(parent)
    , root_(std::move(root))
{
}

Result<QString, Error> FolderRemoteStore::upload_now(const QString& folder_id,
                                                     const QString& filename,
                                                     const QByteArray& bytes) const {
    if (!is_plain_segment(folder_id) || !is_plain_segment(filename)) {
        return Result<QString, Error>::err(
            upload_error(QStringLiteral("invalid target %1/%2").arg(folder_id, filename)));
    }

    QDir dir(root_);
    if (!dir.mkpath(folder_id)) {
        return Result<QString, Error>::err(
            upload_error(QStringLiteral("cannot create folder %1").arg(dir.filePath(folder_id))));
    }

    const QString path = QDir(dir.filePath(folder_id)).filePath(filename);
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return Result<QString, Error>::err(
            upload_error(QStringLiteral("cannot open %1: %2").arg(path, file.errorString())));
    }
    if (file.write(bytes) != bytes.size()) {
        file.cancelWriting();
        return Result<QString, Error>::err(
            upload_error(QStringLiteral("short write to %1: %2").arg(path, file.errorString())));
    }
    if (!file.commit()) {
        return Result<QString, Error>::err(
            upload_error(QStringLiteral("cannot commit %1: %2").arg(path, file.errorString())));
    }

    qInfo() << "STORE: wrote" << path << bytes.size() << "bytes";
    return Result<QString, Error>::ok(folder_id + QLatin1Char('/') + filename);
}

void FolderRemoteStore::upload(const QString& folder_id,
                               const QString& filename,
                               const QByteArray& bytes,
                               UploadCallback done) {
    auto result = upload_now(folder_id, filename, bytes);
    QMetaObject::invokeMethod(this, [done = std::move(done), result = std::move(result)]() {
        done(result);
    }, Qt::QueuedConnection);
}

} // namespace sheaf::storage
