#pragma once

#include "core/result.hpp"
#include <QByteArray>
#include <QString>
#include <functional>

namespace sheaf::storage {

/**
 * RemoteStore - Abstract interface to the durable target of uploaded bundles.
 *
 * Completion is asynchronous through the callback, on the engine's thread.
 * Failures are TransientUpload errors; the sync engine retries them.
 */
class RemoteStore {
public:
    using UploadCallback = std::function<void(Result<QString, Error>)>;

    virtual ~RemoteStore() = default;

    /**
     * Store `bytes` as `filename` inside `folder_id`, replacing an object of
     * the same name. Reports the remote object id.
     */
    virtual void upload(const QString& folder_id,
                        const QString& filename,
                        const QByteArray& bytes,
                        UploadCallback done) = 0;
};

} // namespace sheaf::storage
