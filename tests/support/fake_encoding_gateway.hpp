#pragma once

#include "core/settings.hpp"
#include "encoding/encoding_gateway.hpp"
#include <algorithm>
#include <deque>
#include <functional>
#include <set>

namespace sheaf::testing {

/**
 * FakeEncodingGateway - Deterministic size model of the encoder.
 *
 * compress() scales images by a per-level ratio and keeps other kinds as they
 * are. encode() sizes a bundle as the sum of its items' compressed sizes plus
 * BUNDLE_EXTRA per item, and returns that many bytes. With count_title_bytes
 * the title's UTF-8 length is added too, the way a PDF's info dictionary grows.
 *
 * Operations complete inside the call unless set_deferred(true), in which case
 * they queue until complete_next()/complete_all().
 */
class FakeEncodingGateway : public encoding::EncodingGateway {
public:
    static constexpr int64_t BUNDLE_EXTRA = MIB / 20;

    static int64_t compressed_size(const Item& item, CompressionLevel level) {
        if (item.kind != ItemKind::Image) {
            return item.raw_size;
        }
        switch (level) {
            case CompressionLevel::Low: return item.raw_size / 2;
            case CompressionLevel::Medium: return item.raw_size * 3 / 10;
            case CompressionLevel::High: return item.raw_size / 5;
        }
        return item.raw_size;
    }

    static int64_t bundle_size(const encoding::BundleItems& items, CompressionLevel level) {
        int64_t total = 0;
        for (const auto& entry : items) {
            const bool current = entry.cached && entry.cached->level == level;
            total += (current ? entry.cached->size : compressed_size(entry.item, level)) + BUNDLE_EXTRA;
        }
        return total;
    }

    void encode(const encoding::BundleItems& items,
                const QString& title,
                CompressionLevel level,
                BytesCallback done) override {
        ++encode_calls;
        encoded_titles.push_back(title);
        if (fail_encodes > 0) {
            --fail_encodes;
            run([done]() {
                done(Result<QByteArray, Error>::err(Error{"encoder unavailable", ErrorKind::TransientEncoding}));
            });
            return;
        }
        const auto size = bundle_size(items, level) +
                          (count_title_bytes ? static_cast<int64_t>(title.toUtf8().size()) : 0);
        run([done, size]() {
            done(Result<QByteArray, Error>::ok(QByteArray(static_cast<qsizetype>(size), 'x')));
        });
    }

    void compress(const Item& item, CompressionLevel level, CompressCallback done) override {
        ++compress_calls;
        compressed_ids.push_back(item.id);
        if (fail_compress_ids.count(item.id) > 0 || fail_compresses > 0) {
            if (fail_compresses > 0) --fail_compresses;
            run([done]() {
                done(Result<encoding::CompressedBytes, Error>::err(
                    Error{"compression failed", ErrorKind::TransientEncoding}));
            });
            return;
        }
        const auto size = compressed_size(item, level);
        run([done, size]() {
            done(Result<encoding::CompressedBytes, Error>::ok(encoding::CompressedBytes{QByteArray{}, size}));
        });
    }

    void page_count(const QByteArray&, PageCountCallback done) override {
        ++page_count_calls;
        const int pages = pages_per_document;
        run([done, pages]() { done(Result<int, Error>::ok(pages)); });
    }

    void set_deferred(bool deferred) { deferred_ = deferred; }
    [[nodiscard]] size_t pending() const { return queue_.size(); }

    void complete_next() {
        if (queue_.empty()) return;
        auto next = std::move(queue_.front());
        queue_.pop_front();
        next();
    }

    void complete_all() {
        while (!queue_.empty()) {
            complete_next();
        }
    }

    int encode_calls = 0;
    int compress_calls = 0;
    int page_count_calls = 0;
    int fail_encodes = 0;
    int fail_compresses = 0;
    int pages_per_document = 3;
    bool count_title_bytes = false;
    size_t max_pending = 0;
    std::set<ItemId> fail_compress_ids;
    std::vector<ItemId> compressed_ids;
    std::vector<QString> encoded_titles;

private:
    void run(std::function<void()> work) {
        if (!deferred_) {
            work();
            return;
        }
        queue_.push_back(std::move(work));
        max_pending = std::max(max_pending, queue_.size());
    }

    bool deferred_ = false;
    std::deque<std::function<void()>> queue_;
};

} // namespace sheaf::testing
