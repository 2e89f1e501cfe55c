#include "encoding/qt_encoding_gateway.hpp"

#include <QBuffer>
#include <QDebug>
#include <QFile>
#include <QFont>
#include <QImage>
#include <QMarginsF>
#include <QMetaObject>
#include <QPageSize>
#include <QPainter>
#include <QPdfWriter>
#include <poppler/qt6/poppler-qt6.h>
#include <algorithm>
#include <memory>

namespace sheaf::encoding {

namespace {

bool encode_debug_enabled() {
    return qEnvironmentVariableIsSet("SHEAF_DEBUG_ENCODE");
}

// Bundle pages are A4 wide; height follows the content's aspect ratio.
constexpr qreal PAGE_WIDTH_PT = 595.0;
constexpr qreal A4_HEIGHT_PT = 842.0;

QString display_name(const Item& item) {
    return QString::fromStdString(item.name.empty() ? item.id : item.name);
}

Result<QByteArray, Error> read_source(const Item& item) {
    QFile file(QString::fromStdString(item.source_path));
    if (!file.open(QIODevice::ReadOnly)) {
        return Result<QByteArray, Error>::err(Error{
            "cannot read " + item.source_path + ": " + file.errorString().toStdString(),
            ErrorKind::TransientEncoding});
    }
    return Result<QByteArray, Error>::ok(file.readAll());
}

Result<QByteArray, Error> to_jpeg(const QImage& source, const CompressionProfile& profile) {
    QImage image = source;
    if (image.width() > profile.max_width_px) {
        image = image.scaledToWidth(profile.max_width_px, Qt::SmoothTransformation);
    }
    if (image.hasAlphaChannel()) {
        // JPEG has no alpha; flatten onto white instead of black.
        QImage flat(image.size(), QImage::Format_RGB32);
        flat.fill(Qt::white);
        QPainter painter(&flat);
        painter.drawImage(0, 0, image);
        painter.end();
        image = flat;
    }

    QByteArray out;
    QBuffer buffer(&out);
    buffer.open(QIODevice::WriteOnly);
    if (!image.save(&buffer, "JPEG", profile.jpeg_quality)) {
        return Result<QByteArray, Error>::err(Error{"JPEG encoder failed", ErrorKind::TransientEncoding});
    }
    return Result<QByteArray, Error>::ok(out);
}

std::unique_ptr<Poppler::Document> open_pdf(const QByteArray& bytes) {
    auto document = Poppler::Document::loadFromData(bytes);
    if (!document || document->isLocked()) {
        return nullptr;
    }
    document->setRenderHint(Poppler::Document::Antialiasing, true);
    document->setRenderHint(Poppler::Document::TextAntialiasing, true);
    return document;
}

/**
 * Appends pages to a QPdfWriter, sizing each page before it starts.
 */
class PageSink {
public:
    explicit PageSink(QPdfWriter& writer) : writer_(writer) {}

    // Returns the painter for a fresh page of the given size (in points).
    QPainter& begin_page(const QSizeF& size_pt) {
        writer_.setPageSize(QPageSize(size_pt, QPageSize::Point));
        if (!painter_) {
            painter_ = std::make_unique<QPainter>(&writer_);
            painter_->setRenderHint(QPainter::SmoothPixmapTransform);
        } else {
            writer_.newPage();
        }
        ++pages_;
        return *painter_;
    }

    void finish() {
        if (painter_) {
            painter_->end();
        }
    }

    [[nodiscard]] int pages() const { return pages_; }

private:
    QPdfWriter& writer_;
    std::unique_ptr<QPainter> painter_;
    int pages_ = 0;
};

void draw_full_page(PageSink& sink, const QImage& image) {
    const qreal height = PAGE_WIDTH_PT * static_cast<qreal>(image.height()) /
                         static_cast<qreal>(std::max(1, image.width()));
    QPainter& painter = sink.begin_page(QSizeF(PAGE_WIDTH_PT, height));
    painter.drawImage(QRectF(0, 0, PAGE_WIDTH_PT, height), image);
}

void draw_error_page(PageSink& sink, const Item& item, const QString& reason) {
    qWarning() << "ENCODE: error page for" << display_name(item) << ":" << reason;
    QPainter& painter = sink.begin_page(QSizeF(PAGE_WIDTH_PT, A4_HEIGHT_PT));
    painter.fillRect(QRectF(0, 0, PAGE_WIDTH_PT, A4_HEIGHT_PT), Qt::white);
    painter.setPen(Qt::darkRed);
    QFont font = painter.font();
    font.setPointSizeF(14);
    painter.setFont(font);
    painter.drawText(QRectF(48, 48, PAGE_WIDTH_PT - 96, A4_HEIGHT_PT - 96),
                     Qt::AlignHCenter | Qt::AlignVCenter | Qt::TextWordWrap,
                     QStringLiteral("Could not include %1\n\n%2").arg(display_name(item), reason));
}

QByteArray item_bytes(const BundleItem& entry, CompressionLevel level, QString* failure) {
    if (entry.cached && entry.cached->level == level) {
        return entry.cached->bytes;
    }
    auto compressed = QtEncodingGateway::compress_now(entry.item, level);
    if (compressed.is_err()) {
        *failure = QString::fromStdString(compressed.unwrap_err().message);
        return QByteArray{};
    }
    return compressed.unwrap().bytes;
}

void draw_item(PageSink& sink, const BundleItem& entry, CompressionLevel level) {
    QString failure;
    const QByteArray bytes = item_bytes(entry, level, &failure);
    if (!failure.isEmpty()) {
        draw_error_page(sink, entry.item, failure);
        return;
    }

    if (entry.item.kind == ItemKind::Image) {
        const QImage image = QImage::fromData(bytes);
        if (image.isNull()) {
            draw_error_page(sink, entry.item, QStringLiteral("the image could not be decoded"));
            return;
        }
        draw_full_page(sink, image);
        return;
    }

    auto document = open_pdf(bytes);
    if (!document || document->numPages() <= 0) {
        draw_error_page(sink, entry.item, QStringLiteral("the document could not be opened"));
        return;
    }
    const qreal dpi = compression_profile(level).pdf_render_dpi;
    for (int i = 0; i < document->numPages(); ++i) {
        auto page = document->page(i);
        if (!page) {
            draw_error_page(sink, entry.item, QStringLiteral("page %1 is missing").arg(i + 1));
            continue;
        }
        const QImage image = page->renderToImage(dpi, dpi);
        if (image.isNull()) {
            draw_error_page(sink, entry.item, QStringLiteral("page %1 could not be rendered").arg(i + 1));
            continue;
        }
        draw_full_page(sink, image);
    }
}

} // namespace

CompressionProfile compression_profile(CompressionLevel level) {
    switch (level) {
        case CompressionLevel::Low: return CompressionProfile{90, 2500, 150.0};
        case CompressionLevel::Medium: return CompressionProfile{70, 1600, 110.0};
        case CompressionLevel::High: return CompressionProfile{50, 1024, 80.0};
    }
    return CompressionProfile{90, 2500, 150.0};
}

QtEncodingGateway::QtEncodingGateway(QObject* parent)
    : QObject(parent)
{
}

QtEncodingGateway::~QtEncodingGateway() = default;

Result<CompressedBytes, Error> QtEncodingGateway::compress_now(const Item& item, CompressionLevel level) {
    auto source = read_source(item);
    if (source.is_err()) {
        return Result<CompressedBytes, Error>::err(source.unwrap_err());
    }
    QByteArray raw = std::move(source).unwrap();

    if (item.kind != ItemKind::Image) {
        const auto size = static_cast<int64_t>(raw.size());
        return Result<CompressedBytes, Error>::ok(CompressedBytes{std::move(raw), size});
    }

    const QImage image = QImage::fromData(raw);
    if (image.isNull()) {
        // Undecodable images keep their bytes; the bundle shows an error page.
        qWarning() << "ENCODE: cannot decode image" << display_name(item) << ", keeping original bytes";
        const auto size = static_cast<int64_t>(raw.size());
        return Result<CompressedBytes, Error>::ok(CompressedBytes{std::move(raw), size});
    }

    auto jpeg = to_jpeg(image, compression_profile(level));
    if (jpeg.is_err()) {
        return Result<CompressedBytes, Error>::err(jpeg.unwrap_err());
    }
    QByteArray bytes = std::move(jpeg).unwrap();
    if (encode_debug_enabled()) {
        qInfo() << "ENCODE: compressed" << display_name(item) << raw.size() << "->" << bytes.size();
    }
    const auto size = static_cast<int64_t>(bytes.size());
    return Result<CompressedBytes, Error>::ok(CompressedBytes{std::move(bytes), size});
}

Result<int, Error> QtEncodingGateway::page_count_now(const QByteArray& bytes) {
    auto document = open_pdf(bytes);
    if (!document) {
        return Result<int, Error>::err(Error{"not a readable PDF", ErrorKind::TransientEncoding});
    }
    return Result<int, Error>::ok(document->numPages());
}

Result<QByteArray, Error> QtEncodingGateway::encode_now(const BundleItems& items,
                                                       const QString& title,
                                                       CompressionLevel level) {
    QByteArray out;
    QBuffer buffer(&out);
    if (!buffer.open(QIODevice::WriteOnly)) {
        return Result<QByteArray, Error>::err(Error{"cannot open output buffer", ErrorKind::TransientEncoding});
    }

    {
        QPdfWriter writer(&buffer);
        writer.setResolution(72);
        writer.setPageMargins(QMarginsF(0, 0, 0, 0));
        writer.setTitle(title);
        writer.setCreator(QStringLiteral("sheaf"));

        PageSink sink(writer);
        for (const auto& entry : items) {
            draw_item(sink, entry, level);
        }
        if (sink.pages() == 0) {
            sink.begin_page(QSizeF(PAGE_WIDTH_PT, A4_HEIGHT_PT));
        }
        sink.finish();
    }
    buffer.close();

    if (out.isEmpty()) {
        return Result<QByteArray, Error>::err(Error{"PDF writer produced no output", ErrorKind::TransientEncoding});
    }
    if (encode_debug_enabled()) {
        qInfo() << "ENCODE: bundle" << title << "items=" << items.size() << "bytes=" << out.size();
    }
    return Result<QByteArray, Error>::ok(out);
}

void QtEncodingGateway::encode(const BundleItems& items,
                               const QString& title,
                               CompressionLevel level,
                               BytesCallback done) {
    auto result = encode_now(items, title, level);
    QMetaObject::invokeMethod(this, [done = std::move(done), result = std::move(result)]() {
        done(result);
    }, Qt::QueuedConnection);
}

void QtEncodingGateway::compress(const Item& item, CompressionLevel level, CompressCallback done) {
    auto result = compress_now(item, level);
    QMetaObject::invokeMethod(this, [done = std::move(done), result = std::move(result)]() {
        done(result);
    }, Qt::QueuedConnection);
}

void QtEncodingGateway::page_count(const QByteArray& bytes, PageCountCallback done) {
    auto result = page_count_now(bytes);
    QMetaObject::invokeMethod(this, [done = std::move(done), result = std::move(result)]() {
        done(result);
    }, Qt::QueuedConnection);
}

} // namespace sheaf::encoding
