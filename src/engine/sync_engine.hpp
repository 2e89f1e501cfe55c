#pragma once

#include "core/chunk.hpp"
#include "core/types.hpp"
#include "encoding/encoding_gateway.hpp"
#include "engine/book_state.hpp"
#include "storage/remote_store.hpp"
#include <QObject>
#include <QString>
#include <map>
#include <memory>
#include <optional>
#include <string>

class QTimer;

namespace sheaf::engine {

/**
 * SyncStatus - Upload state of one chunk slot.
 */
enum class SyncStatus {
    Waiting,
    Uploading,
    Synced,
    Dirty
};

[[nodiscard]] const char* to_string(SyncStatus status) noexcept;

/**
 * SyncRecord - What the engine knows about one part number on the remote side.
 *
 * Persists across planning passes so an unchanged chunk is not uploaded again.
 */
struct SyncRecord {
    int part_number = 0;
    std::string last_synced_fingerprint;
    SyncStatus status = SyncStatus::Waiting;
    QString remote_object_id;
    std::string last_error;
    int attempts = 0;
    Timestamp last_synced_at;

    bool operator==(const SyncRecord&) const = default;
};

using SyncRecords = std::map<int, SyncRecord>;

struct SyncOptions {
    // Only upload chunks whose items all had current representations.
    bool wait_for_optimized = true;
    int tick_ms = 1500;
};

// ============================================================================
// Pure transformation functions
// ============================================================================

/**
 * Align records with `plan`: drop records of vanished parts, add waiting
 * records for new ones, and send every dirty record back to waiting.
 */
[[nodiscard]] SyncRecords reconcile(SyncRecords records, const ChunkPlan& plan);

/**
 * First chunk in part-number order that needs uploading, or nullptr.
 */
[[nodiscard]] const Chunk* next_upload(const SyncRecords& records,
                                       const ChunkPlan& plan,
                                       bool wait_for_optimized);

/**
 * True when the plan is non-empty and every chunk's fingerprint is synced.
 */
[[nodiscard]] bool all_synced(const SyncRecords& records, const ChunkPlan& plan);

/**
 * SyncEngine - Mirrors planned chunks to the remote store.
 *
 * Every tick reconciles the records with the current plan and starts at most
 * one upload: the lowest part number whose fingerprint differs from what was
 * last synced. Encoding or upload failures mark the record dirty and the next
 * tick retries. The engine does nothing until a remote folder is configured.
 *
 * Changing the remote folder or stopping the engine starts a new sync
 * generation; a completion from an older generation is dropped.
 */
class SyncEngine : public QObject {
    Q_OBJECT

public:
    SyncEngine(BookState& book,
               encoding::EncodingGateway& gateway,
               storage::RemoteStore& store,
               QObject* parent = nullptr);
    ~SyncEngine() override;

    void setOptions(const SyncOptions& options);
    [[nodiscard]] const SyncOptions& options() const { return options_; }

    /**
     * Replace the plan being mirrored.
     */
    void setPlan(const ChunkPlan& plan);

    /**
     * Hold uploads until the next setPlan(). Records are kept as they are, so
     * parts that come back unchanged are not uploaded again.
     */
    void clearPlan();
    [[nodiscard]] bool hasPlan() const { return has_plan_; }

    void start();
    void stop();

    /**
     * Run one reconciliation step. Called by the timer; public for tests.
     */
    void tick();

    [[nodiscard]] const SyncRecords& records() const { return records_; }
    [[nodiscard]] std::optional<SyncRecord> record(int part_number) const;
    [[nodiscard]] bool isUploading() const { return in_flight_; }
    [[nodiscard]] bool isRunning() const { return running_; }
    [[nodiscard]] bool allSynced() const { return all_synced(records_, plan_); }
    [[nodiscard]] int uploadCount() const { return upload_count_; }

signals:
    void recordsChanged();
    void uploadStarted(int part_number);
    void uploadFinished(int part_number, const QString& remote_object_id);
    void uploadFailed(int part_number, const QString& message);
    void allChunksSynced();

private:
    struct Upload {
        Generation generation;
        int part_number = 0;
        std::string fingerprint;
        QString folder_id;
        QString filename;
    };

    void onRemoteFolderChanged();
    void sendBundle(const Upload& upload, const QByteArray& bytes);
    void complete(const Upload& upload, const QString& remote_object_id);
    void fail(const Upload& upload, const Error& error);
    void setRecords(SyncRecords records);
    [[nodiscard]] std::optional<encoding::BundleItems> bundleFor(const Chunk& chunk) const;

    BookState& book_;
    encoding::EncodingGateway& gateway_;
    storage::RemoteStore& store_;
    std::unique_ptr<QTimer> timer_;
    SyncOptions options_;

    ChunkPlan plan_;
    SyncRecords records_;
    Generation generation_;
    bool has_plan_ = false;
    bool in_flight_ = false;
    bool running_ = false;
    bool reported_synced_ = false;
    int upload_count_ = 0;
};

} // namespace sheaf::engine
