#pragma once

#include "encoding/encoding_gateway.hpp"
#include <QObject>

namespace sheaf::encoding {

/**
 * CompressionProfile - How images are re-encoded at one compression level.
 */
struct CompressionProfile {
    int jpeg_quality;
    int max_width_px;
    qreal pdf_render_dpi;  // Rasterization of source PDF pages inside bundles
};

[[nodiscard]] CompressionProfile compression_profile(CompressionLevel level);

/**
 * QtEncodingGateway - Encoder built on QImage, QPdfWriter and Poppler.
 *
 * Images become JPEG, scaled down to the profile's maximum width. PDF and
 * document items keep their bytes. Bundles get one page per image and one
 * rasterized page per source PDF page; an item that cannot be read or decoded
 * gets a page saying so instead of failing the bundle.
 *
 * Work runs on the calling thread; results are delivered through the event
 * loop so callers always see an asynchronous completion.
 */
class QtEncodingGateway : public QObject, public EncodingGateway {
    Q_OBJECT

public:
    explicit QtEncodingGateway(QObject* parent = nullptr);
    ~QtEncodingGateway() override;

    void encode(const BundleItems& items,
                const QString& title,
                CompressionLevel level,
                BytesCallback done) override;

    void compress(const Item& item, CompressionLevel level, CompressCallback done) override;

    void page_count(const QByteArray& bytes, PageCountCallback done) override;

    // Synchronous forms, used by the asynchronous ones and by tests.
    [[nodiscard]] static Result<QByteArray, Error> encode_now(const BundleItems& items,
                                                             const QString& title,
                                                             CompressionLevel level);
    [[nodiscard]] static Result<CompressedBytes, Error> compress_now(const Item& item,
                                                                    CompressionLevel level);
    [[nodiscard]] static Result<int, Error> page_count_now(const QByteArray& bytes);
};

} // namespace sheaf::encoding
