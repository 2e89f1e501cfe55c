#include "engine/background_optimizer.hpp"

#include <QDebug>
#include <QPointer>
#include <QTimer>
#include <algorithm>

namespace sheaf::engine {

namespace {
bool optimizer_debug_enabled() {
    return qEnvironmentVariableIsSet("SHEAF_DEBUG_OPTIMIZER");
}

QString display_name(const Item& item) {
    return QString::fromStdString(item.name.empty() ? item.id : item.name);
}
} // namespace

BackgroundOptimizer::BackgroundOptimizer(BookState& book,
                                         encoding::EncodingGateway& gateway,
                                         QObject* parent)
    : QObject(parent)
    , book_(book)
    , gateway_(gateway)
    , timer_(std::make_unique<QTimer>(this))
{
    timer_->setInterval(EngineTimings{}.optimizer_tick_ms);
    connect(timer_.get(), &QTimer::timeout, this, &BackgroundOptimizer::tick);
    connect(&book_, &BookState::itemsChanged, this, &BackgroundOptimizer::resetCursor);
    connect(&book_, &BookState::settingsChanged, this, &BackgroundOptimizer::resetCursor);
}

BackgroundOptimizer::~BackgroundOptimizer() = default;

void BackgroundOptimizer::setTickInterval(int ms) {
    timer_->setInterval(ms);
}

void BackgroundOptimizer::start() {
    if (running_) {
        return;
    }
    running_ = true;
    reported_idle_ = false;
    timer_->start();
    if (optimizer_debug_enabled()) {
        qInfo() << "OPT: start interval_ms=" << timer_->interval();
    }
}

void BackgroundOptimizer::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    timer_->stop();
    // A refresh still in flight completes into a dead generation.
    generation_ = generation_.next();
    setStatus(QString{});
    if (optimizer_debug_enabled()) {
        qInfo() << "OPT: stop";
    }
}

bool BackgroundOptimizer::isIdle() const {
    return !in_flight_ && !nextCandidate().has_value();
}

double BackgroundOptimizer::progress() const {
    const auto& snapshot = book_.snapshot();
    return book_.cache().progress(snapshot.items, snapshot.settings);
}

void BackgroundOptimizer::resetCursor() {
    cursor_ = 0;
    reported_idle_ = false;
    generation_ = generation_.next();
    if (optimizer_debug_enabled()) {
        qInfo() << "OPT: cursor reset generation=" << generation_.value();
    }
    emit progressChanged(progress());
}

std::optional<size_t> BackgroundOptimizer::nextCandidate() const {
    const auto& snapshot = book_.snapshot();
    const auto& items = snapshot.items;
    const size_t start = std::min(cursor_, items.size());
    for (size_t i = start; i < items.size(); ++i) {
        if (book_.cache().needs_processing(items[i], snapshot.settings)) {
            return i;
        }
    }
    for (size_t i = 0; i < start; ++i) {
        if (book_.cache().needs_processing(items[i], snapshot.settings)) {
            return i;
        }
    }
    return std::nullopt;
}

void BackgroundOptimizer::tick() {
    if (in_flight_) {
        return;
    }

    const auto candidate = nextCandidate();
    if (!candidate) {
        setStatus(QString{});
        if (!reported_idle_) {
            reported_idle_ = true;
            if (optimizer_debug_enabled()) {
                qInfo() << "OPT: idle";
            }
            emit idle();
        }
        return;
    }

    reported_idle_ = false;
    cursor_ = *candidate;
    const auto& snapshot = book_.snapshot();
    Refresh refresh{
        .generation = generation_,
        .item = snapshot.items[*candidate],
        .level = snapshot.settings.compression_level,
        .compressed = {},
    };

    setStatus(QStringLiteral("Compressing %1...").arg(display_name(refresh.item)));
    if (optimizer_debug_enabled()) {
        qInfo() << "OPT: compress item=" << QString::fromStdString(refresh.item.id)
                << "index=" << *candidate
                << "level=" << QString::fromUtf8(to_string(refresh.level).data());
    }

    in_flight_ = true;
    QPointer<BackgroundOptimizer> self(this);
    const Item item = refresh.item;
    const CompressionLevel level = refresh.level;
    gateway_.compress(item, level,
                      [self, refresh = std::move(refresh)](Result<encoding::CompressedBytes, Error> result) mutable {
        if (!self) {
            return;
        }
        if (result.is_err()) {
            self->fail(refresh, result.unwrap_err());
            return;
        }
        refresh.compressed = std::move(result).unwrap();
        if (needs_page_count(refresh.item)) {
            self->requestPageCount(std::move(refresh));
            return;
        }
        const auto known = refresh.item.page_count;
        self->finish(refresh, known);
    });
}

void BackgroundOptimizer::requestPageCount(Refresh refresh) {
    QPointer<BackgroundOptimizer> self(this);
    const QByteArray bytes = refresh.compressed.bytes;
    gateway_.page_count(bytes, [self, refresh = std::move(refresh)](Result<int, Error> result) {
        if (!self) {
            return;
        }
        std::optional<int> pages;
        if (result.is_ok()) {
            pages = result.unwrap();
        } else {
            qWarning() << "OPT: page count failed item=" << QString::fromStdString(refresh.item.id)
                       << "error=" << QString::fromStdString(result.unwrap_err().message);
        }
        self->finish(refresh, pages);
    });
}

void BackgroundOptimizer::finish(const Refresh& refresh, std::optional<int> page_count) {
    in_flight_ = false;

    if (refresh.generation != generation_) {
        if (optimizer_debug_enabled()) {
            qInfo() << "OPT: discard stale item=" << QString::fromStdString(refresh.item.id);
        }
        return;
    }

    encoding::CompressedRepresentation representation{
        .bytes = refresh.compressed.bytes,
        .size = refresh.compressed.size,
        .level = refresh.level,
        .page_count = page_count,
    };
    if (!book_.storeRepresentation(refresh.item, refresh.level, std::move(representation))) {
        if (optimizer_debug_enabled()) {
            qInfo() << "OPT: discard superseded item=" << QString::fromStdString(refresh.item.id);
        }
        return;
    }

    if (optimizer_debug_enabled()) {
        qInfo() << "OPT: stored item=" << QString::fromStdString(refresh.item.id)
                << "size=" << refresh.compressed.size;
    }
    emit itemRefreshed(QString::fromStdString(refresh.item.id));
    emit progressChanged(progress());
}

void BackgroundOptimizer::fail(const Refresh& refresh, const Error& error) {
    in_flight_ = false;
    qWarning() << "OPT: compress failed item=" << QString::fromStdString(refresh.item.id)
               << "error=" << QString::fromStdString(error.message);

    if (refresh.generation == generation_) {
        cursor_ = cursor_ + 1;
    }
    emit refreshFailed(QString::fromStdString(refresh.item.id),
                       QString::fromStdString(error.message));
}

void BackgroundOptimizer::setStatus(const QString& status) {
    if (status == status_) {
        return;
    }
    status_ = status;
    emit statusChanged(status_);
}

} // namespace sheaf::engine
