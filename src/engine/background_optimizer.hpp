#pragma once

#include "core/types.hpp"
#include "encoding/encoding_gateway.hpp"
#include "engine/book_state.hpp"
#include <QObject>
#include <QString>
#include <memory>
#include <optional>

class QTimer;

namespace sheaf::engine {

/**
 * BackgroundOptimizer - Keeps the item cache current, one item per tick.
 *
 * Each tick scans the book from the cursor and refreshes the first item whose
 * cache entry is missing or was produced under another compression level.
 * Item and settings changes reset the cursor to the start of the book. A
 * failed refresh moves the cursor past the item so later items are not starved;
 * the failed item is picked again once the scan wraps around.
 *
 * Exactly one refresh is in flight at a time. A completion is stored only if
 * the item and the compression level it was requested for are still current.
 */
class BackgroundOptimizer : public QObject {
    Q_OBJECT

public:
    BackgroundOptimizer(BookState& book, encoding::EncodingGateway& gateway, QObject* parent = nullptr);
    ~BackgroundOptimizer() override;

    void setTickInterval(int ms);

    void start();
    void stop();

    /**
     * Run one scheduling step. Called by the timer; public for tests.
     */
    void tick();

    [[nodiscard]] bool isRunning() const { return running_; }
    [[nodiscard]] bool isBusy() const { return in_flight_; }
    [[nodiscard]] bool isIdle() const;
    [[nodiscard]] QString statusText() const { return status_; }
    [[nodiscard]] double progress() const;
    [[nodiscard]] size_t cursor() const { return cursor_; }

signals:
    void statusChanged(const QString& status);
    void progressChanged(double progress);
    void itemRefreshed(const QString& item_id);
    void refreshFailed(const QString& item_id, const QString& message);
    void idle();

private:
    struct Refresh {
        Generation generation;
        Item item;
        CompressionLevel level;
        encoding::CompressedBytes compressed;
    };

    void resetCursor();
    void requestPageCount(Refresh refresh);
    void finish(const Refresh& refresh, std::optional<int> page_count);
    void fail(const Refresh& refresh, const Error& error);
    void setStatus(const QString& status);
    [[nodiscard]] std::optional<size_t> nextCandidate() const;

    BookState& book_;
    encoding::EncodingGateway& gateway_;
    std::unique_ptr<QTimer> timer_;

    size_t cursor_ = 0;
    Generation generation_;
    bool in_flight_ = false;
    bool running_ = false;
    bool reported_idle_ = false;
    QString status_;
};

} // namespace sheaf::engine
