#pragma once

#include "core/book.hpp"
#include "core/chunk.hpp"
#include "core/settings.hpp"
#include "encoding/encoding_gateway.hpp"
#include "engine/background_optimizer.hpp"
#include "engine/book_state.hpp"
#include "engine/plan_controller.hpp"
#include "engine/sync_engine.hpp"
#include "storage/remote_store.hpp"
#include <QObject>
#include <QString>
#include <memory>
#include <vector>

namespace sheaf::engine {

/**
 * ExportSession - One book's export pipeline.
 *
 * Owns the book state and the three loops (optimizer, planner, sync) and wires
 * them together: every new plan goes to the sync engine, and status from the
 * optimizer and planner is merged into one line. Consumers connect to the
 * session's signals while it runs and disconnect by destroying it.
 */
class ExportSession : public QObject {
    Q_OBJECT

    Q_PROPERTY(double progress READ progress NOTIFY progressChanged)
    Q_PROPERTY(QString statusText READ statusText NOTIFY statusChanged)

public:
    ExportSession(std::unique_ptr<encoding::EncodingGateway> gateway,
                  std::unique_ptr<storage::RemoteStore> store,
                  QObject* parent = nullptr);
    ~ExportSession() override;

    void setItems(std::vector<Item> items);
    void setSettings(const Settings& settings);
    void setTitle(const QString& title);
    void setRemoteFolder(const QString& folder_id);
    void setTimings(const EngineTimings& timings);
    void setSyncOptions(const SyncOptions& options);

    /**
     * Load title, items, settings and folder from a snapshot in one go.
     */
    void load(const BookSnapshot& book);

    Q_INVOKABLE void start();
    Q_INVOKABLE void stop();

    [[nodiscard]] const BookSnapshot& book() const { return book_.snapshot(); }
    [[nodiscard]] const ItemCache& cache() const { return book_.cache(); }
    [[nodiscard]] const ChunkPlan& plan() const { return planner_->plan(); }
    [[nodiscard]] bool hasPlan() const { return planner_->hasPlan(); }
    [[nodiscard]] const SyncRecords& syncRecords() const { return sync_->records(); }
    [[nodiscard]] std::vector<OversizedItemError> violations() const { return planner_->plan().violations(); }
    [[nodiscard]] double progress() const { return optimizer_->progress(); }
    [[nodiscard]] QString statusText() const;
    [[nodiscard]] bool isRunning() const { return running_; }
    [[nodiscard]] bool isAllSynced() const { return sync_->allSynced(); }

    [[nodiscard]] BackgroundOptimizer& optimizer() { return *optimizer_; }
    [[nodiscard]] PlanController& planner() { return *planner_; }
    [[nodiscard]] SyncEngine& sync() { return *sync_; }

signals:
    void planChanged();
    void syncRecordsChanged();
    void progressChanged(double progress);
    void statusChanged(const QString& status);
    void oversizedItems(const std::vector<sheaf::OversizedItemError>& violations);
    void allSynced();

private:
    void onPlanChanged();

    std::unique_ptr<encoding::EncodingGateway> gateway_;
    std::unique_ptr<storage::RemoteStore> store_;
    BookState book_;
    std::unique_ptr<BackgroundOptimizer> optimizer_;
    std::unique_ptr<PlanController> planner_;
    std::unique_ptr<SyncEngine> sync_;
    QString planner_status_;
    bool running_ = false;
};

} // namespace sheaf::engine
