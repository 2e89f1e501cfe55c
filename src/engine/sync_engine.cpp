#include "engine/sync_engine.hpp"
#include "engine/fingerprint.hpp"

#include <QDebug>
#include <QPointer>
#include <QTimer>

namespace sheaf::engine {

namespace {
bool sync_debug_enabled() {
    return qEnvironmentVariableIsSet("SHEAF_DEBUG_SYNC");
}
} // namespace

const char* to_string(SyncStatus status) noexcept {
    switch (status) {
        case SyncStatus::Waiting: return "waiting";
        case SyncStatus::Uploading: return "uploading";
        case SyncStatus::Synced: return "synced";
        case SyncStatus::Dirty: return "dirty";
    }
    return "unknown";
}

SyncRecords reconcile(SyncRecords records, const ChunkPlan& plan) {
    SyncRecords out;
    for (const auto& chunk : plan.chunks) {
        auto it = records.find(chunk.part_number);
        SyncRecord record;
        if (it != records.end()) {
            record = std::move(it->second);
        } else {
            record.part_number = chunk.part_number;
        }
        if (record.status == SyncStatus::Dirty) {
            record.status = SyncStatus::Waiting;
        } else if (record.status == SyncStatus::Synced &&
                   record.last_synced_fingerprint != chunk.content_fingerprint) {
            record.status = SyncStatus::Waiting;
        }
        out.emplace(chunk.part_number, std::move(record));
    }
    return out;
}

const Chunk* next_upload(const SyncRecords& records, const ChunkPlan& plan, bool wait_for_optimized) {
    for (const auto& chunk : plan.chunks) {
        if (wait_for_optimized && !chunk.fully_optimized) {
            continue;
        }
        auto it = records.find(chunk.part_number);
        if (it == records.end()) {
            return &chunk;
        }
        if (it->second.status == SyncStatus::Uploading) {
            continue;
        }
        if (it->second.last_synced_fingerprint != chunk.content_fingerprint) {
            return &chunk;
        }
    }
    return nullptr;
}

bool all_synced(const SyncRecords& records, const ChunkPlan& plan) {
    if (plan.empty()) {
        return false;
    }
    for (const auto& chunk : plan.chunks) {
        auto it = records.find(chunk.part_number);
        if (it == records.end() || it->second.status != SyncStatus::Synced ||
            it->second.last_synced_fingerprint != chunk.content_fingerprint) {
            return false;
        }
    }
    return true;
}

SyncEngine::SyncEngine(BookState& book,
                       encoding::EncodingGateway& gateway,
                       storage::RemoteStore& store,
                       QObject* parent)
    : QObject(parent)
    , book_(book)
    , gateway_(gateway)
    , store_(store)
    , timer_(std::make_unique<QTimer>(this))
{
    timer_->setInterval(options_.tick_ms);
    connect(timer_.get(), &QTimer::timeout, this, &SyncEngine::tick);
    connect(&book_, &BookState::remoteFolderChanged, this, &SyncEngine::onRemoteFolderChanged);
}

SyncEngine::~SyncEngine() = default;

void SyncEngine::setOptions(const SyncOptions& options) {
    options_ = options;
    timer_->setInterval(options_.tick_ms);
}

void SyncEngine::setPlan(const ChunkPlan& plan) {
    plan_ = plan;
    has_plan_ = true;
    setRecords(reconcile(records_, plan_));
    if (!allSynced()) {
        reported_synced_ = false;
    }
}

void SyncEngine::clearPlan() {
    plan_ = ChunkPlan{};
    has_plan_ = false;
    reported_synced_ = false;
    if (sync_debug_enabled()) {
        qInfo() << "SYNC: plan cleared, holding" << records_.size() << "record(s)";
    }
}

void SyncEngine::start() {
    if (running_) {
        return;
    }
    running_ = true;
    timer_->start();
    if (sync_debug_enabled()) {
        qInfo() << "SYNC: start interval_ms=" << timer_->interval();
    }
}

void SyncEngine::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    timer_->stop();
    generation_ = generation_.next();
    if (sync_debug_enabled()) {
        qInfo() << "SYNC: stop";
    }
}

std::optional<SyncRecord> SyncEngine::record(int part_number) const {
    auto it = records_.find(part_number);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void SyncEngine::onRemoteFolderChanged() {
    generation_ = generation_.next();
    reported_synced_ = false;
    // Nothing has been uploaded to the new folder yet.
    SyncRecords fresh;
    for (const auto& [part, record] : records_) {
        fresh.emplace(part, SyncRecord{.part_number = part});
    }
    setRecords(std::move(fresh));
    if (sync_debug_enabled()) {
        qInfo() << "SYNC: remote folder changed folder="
                << QString::fromStdString(book_.snapshot().remote_folder_id);
    }
}

std::optional<encoding::BundleItems> SyncEngine::bundleFor(const Chunk& chunk) const {
    const auto& snapshot = book_.snapshot();
    std::vector<Item> items;
    items.reserve(chunk.item_ids.size());
    for (const auto& id : chunk.item_ids) {
        const Item* item = find_item(snapshot, id);
        if (item == nullptr) {
            return std::nullopt;
        }
        items.push_back(*item);
    }
    return book_.cache().bundle_items(items);
}

void SyncEngine::tick() {
    if (!running_ || in_flight_) {
        return;
    }
    const auto& snapshot = book_.snapshot();
    if (snapshot.remote_folder_id.empty() || !has_plan_) {
        return;
    }

    setRecords(reconcile(records_, plan_));

    const Chunk* chunk = next_upload(records_, plan_, options_.wait_for_optimized);
    if (chunk == nullptr) {
        if (allSynced() && !reported_synced_) {
            reported_synced_ = true;
            qInfo() << "SYNC: all" << plan_.size() << "part(s) synced";
            emit allChunksSynced();
        }
        return;
    }

    auto bundle = bundleFor(*chunk);
    if (!bundle) {
        if (sync_debug_enabled()) {
            qInfo() << "SYNC: part" << chunk->part_number << "refers to removed items, waiting for a new plan";
        }
        return;
    }

    const Upload upload{
        .generation = generation_,
        .part_number = chunk->part_number,
        .fingerprint = chunk->content_fingerprint,
        .folder_id = QString::fromStdString(snapshot.remote_folder_id),
        .filename = upload_filename(chunk->title),
    };

    auto records = records_;
    auto& record = records[upload.part_number];
    record.part_number = upload.part_number;
    record.status = SyncStatus::Uploading;
    ++record.attempts;
    setRecords(std::move(records));

    in_flight_ = true;
    ++upload_count_;
    if (sync_debug_enabled()) {
        qInfo() << "SYNC: upload part" << upload.part_number << "file=" << upload.filename
                << "oversized=" << chunk->oversized;
    }
    emit uploadStarted(upload.part_number);

    QPointer<SyncEngine> self(this);
    gateway_.encode(*bundle, QString::fromStdString(chunk->title), snapshot.settings.compression_level,
                    [self, upload](Result<QByteArray, Error> result) {
        if (!self) {
            return;
        }
        if (result.is_err()) {
            self->fail(upload, result.unwrap_err());
            return;
        }
        self->sendBundle(upload, result.unwrap());
    });
}

void SyncEngine::sendBundle(const Upload& upload, const QByteArray& bytes) {
    if (upload.generation != generation_) {
        complete(upload, QString{});
        return;
    }
    QPointer<SyncEngine> self(this);
    store_.upload(upload.folder_id, upload.filename, bytes,
                  [self, upload](Result<QString, Error> result) {
        if (!self) {
            return;
        }
        if (result.is_err()) {
            self->fail(upload, result.unwrap_err());
            return;
        }
        self->complete(upload, result.unwrap());
    });
}

void SyncEngine::complete(const Upload& upload, const QString& remote_object_id) {
    in_flight_ = false;
    auto records = records_;
    auto it = records.find(upload.part_number);

    if (upload.generation != generation_) {
        if (sync_debug_enabled()) {
            qInfo() << "SYNC: discard stale upload part" << upload.part_number;
        }
        if (it != records.end() && it->second.status == SyncStatus::Uploading) {
            it->second.status = SyncStatus::Waiting;
            setRecords(std::move(records));
        }
        return;
    }
    if (it == records.end()) {
        if (sync_debug_enabled()) {
            qInfo() << "SYNC: part" << upload.part_number << "vanished during upload";
        }
        return;
    }

    it->second.last_synced_fingerprint = upload.fingerprint;
    it->second.status = SyncStatus::Synced;
    it->second.remote_object_id = remote_object_id;
    it->second.last_error.clear();
    it->second.last_synced_at = Timestamp::now();
    setRecords(has_plan_ ? reconcile(std::move(records), plan_) : std::move(records));

    qInfo() << "SYNC: part" << upload.part_number << "saved as" << remote_object_id;
    emit uploadFinished(upload.part_number, remote_object_id);

    if (allSynced() && !reported_synced_) {
        reported_synced_ = true;
        qInfo() << "SYNC: all" << plan_.size() << "part(s) synced";
        emit allChunksSynced();
    }
}

void SyncEngine::fail(const Upload& upload, const Error& error) {
    in_flight_ = false;
    auto records = records_;
    auto it = records.find(upload.part_number);

    if (upload.generation != generation_) {
        if (it != records.end() && it->second.status == SyncStatus::Uploading) {
            it->second.status = SyncStatus::Waiting;
            setRecords(std::move(records));
        }
        return;
    }

    qWarning() << "SYNC: part" << upload.part_number << "not saved:"
               << error_kind_name(error.kind) << QString::fromStdString(error.message);
    if (it != records.end()) {
        it->second.status = SyncStatus::Dirty;
        it->second.last_error = error.message;
        setRecords(std::move(records));
    }
    emit uploadFailed(upload.part_number, QString::fromStdString(error.message));
}

void SyncEngine::setRecords(SyncRecords records) {
    if (records == records_) {
        return;
    }
    records_ = std::move(records);
    emit recordsChanged();
}

} // namespace sheaf::engine
