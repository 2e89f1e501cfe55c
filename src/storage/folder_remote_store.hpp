#pragma once

#include "storage/remote_store.hpp"
#include <QObject>
#include <QString>

namespace sheaf::storage {

/**
 * FolderRemoteStore - Remote store backed by a local directory.
 *
 * A remote folder id names a subdirectory of the root; uploads replace files
 * atomically. The object id is "<folder>/<filename>".
 */
class FolderRemoteStore : public QObject, public RemoteStore {
    Q_OBJECT

public:
    explicit FolderRemoteStore(QString root, QObject* parent = nullptr);

    void upload(const QString& folder_id,
                const QString& filename,
                const QByteArray& bytes,
                UploadCallback done) override;

    [[nodiscard]] Result<QString, Error> upload_now(const QString& folder_id,
                                                    const QString& filename,
                                                    const QByteArray& bytes) const;

    [[nodiscard]] const QString& root() const { return root_; }

private:
    QString root_;
};

} // namespace sheaf::storage
