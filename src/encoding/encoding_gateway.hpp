#pragma once

#include "core/result.hpp"
#include "encoding/representation.hpp"
#include <QByteArray>
#include <QString>
#include <functional>

namespace sheaf::encoding {

/**
 * EncodingGateway - Abstract interface to the bundle/item encoder.
 *
 * Every call completes asynchronously through its callback, on the thread that
 * owns the engine. Failures are reported as TransientEncoding errors; callers
 * retry on their next tick.
 *
 * Implementations may invoke the callback before returning (fakes do), so
 * callers must have recorded their in-flight state before calling.
 */
class EncodingGateway {
public:
    using BytesCallback = std::function<void(Result<QByteArray, Error>)>;
    using CompressCallback = std::function<void(Result<CompressedBytes, Error>)>;
    using PageCountCallback = std::function<void(Result<int, Error>)>;

    virtual ~EncodingGateway() = default;

    /**
     * Produce the exact bundle for `items` in order.
     */
    virtual void encode(const BundleItems& items,
                        const QString& title,
                        CompressionLevel level,
                        BytesCallback done) = 0;

    /**
     * Produce the compressed representation of a single item.
     */
    virtual void compress(const Item& item,
                          CompressionLevel level,
                          CompressCallback done) = 0;

    /**
     * Count the pages of a multi-page container.
     */
    virtual void page_count(const QByteArray& bytes, PageCountCallback done) = 0;
};

} // namespace sheaf::encoding
