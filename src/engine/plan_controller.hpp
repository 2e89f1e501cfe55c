#pragma once

#include "core/chunk_planner.hpp"
#include "core/types.hpp"
#include "encoding/encoding_gateway.hpp"
#include "engine/book_state.hpp"
#include <QObject>
#include <memory>
#include <optional>
#include <vector>

class QTimer;

namespace sheaf::engine {

/**
 * PlanController - Runs planning passes against the real encoder.
 *
 * Book and cache changes schedule a pass after a short debounce. A pass walks
 * a PlanningPass, sending each verification request to the encoding gateway;
 * passes run one at a time. Item, order, settings and title changes make the
 * running pass stale: its completions are dropped and a fresh pass is
 * scheduled. Cache changes let the running pass finish and schedule another.
 *
 * A settings change clears the plan immediately. No new pass starts until at
 * least one item has a representation produced under the new compression
 * level, or no item needs processing.
 *
 * A verification error aborts the pass; the plan stays as it was and the pass
 * is retried after the retry interval.
 */
class PlanController : public QObject {
    Q_OBJECT

public:
    PlanController(BookState& book, encoding::EncodingGateway& gateway, QObject* parent = nullptr);
    ~PlanController() override;

    void setDebounceInterval(int ms);
    void setRetryInterval(int ms);

    void start();
    void stop();

    /**
     * Start a pass now if one is due. Called by the debounce timer; public for
     * tests.
     */
    void runPass();

    [[nodiscard]] const ChunkPlan& plan() const { return plan_; }
    [[nodiscard]] bool hasPlan() const { return planned_; }
    [[nodiscard]] bool isPlanning() const { return pass_ != nullptr; }
    [[nodiscard]] bool isGated() const { return gated_; }
    [[nodiscard]] bool isRunning() const { return running_; }
    [[nodiscard]] int passCount() const { return pass_count_; }

signals:
    void planChanged();
    void oversizedItems(const std::vector<sheaf::OversizedItemError>& violations);
    void planningFailed(const QString& message);
    void statusChanged(const QString& status);

private:
    struct ActivePass {
        Generation generation;
        std::unique_ptr<PlanningPass> pass;
        encoding::BundleItems bundle;  // Items and cache entries the pass started from
        std::vector<PlannerItem> inputs;
        QString title;
        CompressionLevel level;
    };

    void onContentChanged();
    void onSettingsChanged();
    void onCacheChanged();
    void schedule(int delay_ms);
    void verifyNext();
    void completePass();
    void abortPass(const Error& error);
    [[nodiscard]] bool gateOpen() const;

    BookState& book_;
    encoding::EncodingGateway& gateway_;
    std::unique_ptr<QTimer> timer_;
    int debounce_ms_;
    int retry_ms_;

    ChunkPlan plan_;
    bool planned_ = false;
    std::vector<PlannerItem> planned_inputs_;
    std::string planned_title_;

    Generation generation_;
    std::unique_ptr<ActivePass> pass_;
    bool rerun_ = false;
    bool gated_ = false;
    bool running_ = false;
    int pass_count_ = 0;
};

} // namespace sheaf::engine
