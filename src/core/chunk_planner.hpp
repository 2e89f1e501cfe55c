#pragma once

#include "core/chunk.hpp"
#include "core/result.hpp"
#include "core/settings.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace sheaf {

// Container metadata every bundle pays once, and per included item.
constexpr int64_t BUNDLE_OVERHEAD_BYTES = 15000;
constexpr int64_t ITEM_OVERHEAD_BYTES = 4000;

// Fraction of the effective limit at which estimates stop being trusted and
// the batch is measured with the real encoder.
constexpr double VERIFICATION_THRESHOLD = 0.85;

/**
 * PlannerItem - What the planner knows about one item.
 */
struct PlannerItem {
    ItemId id;
    int64_t estimated_bytes = 0;  // Cached size, or raw size when not current
    bool optimized = false;       // estimated_bytes comes from a current cache entry

    bool operator==(const PlannerItem&) const = default;
};

/**
 * VerificationRequest - Half-open slice [begin, end) of the item sequence whose
 * exact encoded size the pass needs before it can continue. The batch must be
 * measured as part `part_number`, under the title that part will carry.
 */
struct VerificationRequest {
    size_t begin = 0;
    size_t end = 0;
    int part_number = 1;

    [[nodiscard]] size_t size() const noexcept { return end - begin; }
    bool operator==(const VerificationRequest&) const = default;
};

/**
 * PlanningPass - Greedy bin packing with verified backtrack, as a resumable
 * state machine.
 *
 * Items are appended while the running estimate stays under the verification
 * threshold. Once it crosses (or the sequence ends) the pass stops and asks for
 * the exact size of the current batch through pending(). The caller measures
 * the batch however it likes and answers with supply(). A batch that verifies
 * at or above the effective limit gives back its last item (and more, if the
 * shorter batch still does not fit); a single item that does not fit becomes an
 * oversized chunk.
 *
 * The pass never measures anything itself, so the same code drives the
 * synchronous plan_chunks() below and the asynchronous PlanController.
 */
class PlanningPass {
public:
    PlanningPass(std::vector<PlannerItem> items, const Settings& settings, std::string book_title);

    [[nodiscard]] bool finished() const noexcept { return phase_ == Phase::Done; }

    /**
     * The batch waiting for a verified size, or nullopt once finished.
     */
    [[nodiscard]] std::optional<VerificationRequest> pending() const;

    /**
     * Answer the pending request with the exact encoded size of that batch.
     */
    void supply(int64_t verified_bytes);

    [[nodiscard]] const std::vector<PlannerItem>& items() const noexcept { return items_; }
    [[nodiscard]] int verification_count() const noexcept { return verification_count_; }

    /**
     * The finished plan. Empty until finished().
     */
    [[nodiscard]] const ChunkPlan& plan() const noexcept { return plan_; }

private:
    enum class Phase {
        Filling,
        AwaitGrow,    // Batch grew past the threshold or reached the end
        AwaitShrink,  // Batch lost items after failing and has no known-good size
        Done
    };

    void fill();
    void give_back_last_item();
    void finalize(int64_t verified_bytes, bool oversized);
    [[nodiscard]] int64_t estimate(size_t begin, size_t end) const;
    [[nodiscard]] size_t batch_size() const noexcept { return batch_end_ - batch_begin_; }

    std::vector<PlannerItem> items_;
    std::string book_title_;
    int64_t limit_;
    double threshold_;

    Phase phase_ = Phase::Filling;
    size_t batch_begin_ = 0;
    size_t batch_end_ = 0;
    int64_t accumulator_ = BUNDLE_OVERHEAD_BYTES;

    // Largest prefix of the current batch that verified under the limit.
    std::optional<size_t> good_end_;
    int64_t good_size_ = 0;

    int verification_count_ = 0;
    ChunkPlan plan_;
};

/**
 * Title of one exported part.
 */
[[nodiscard]] std::string part_title(const std::string& book_title, int part_number);

using VerifyBatchFn = std::function<Result<int64_t, Error>(std::span<const PlannerItem> batch,
                                                           const std::string& title)>;

/**
 * Run a whole pass synchronously, measuring every requested batch with
 * `verify`, which receives the batch and its part title. The first
 * verification error aborts the pass and is returned.
 */
[[nodiscard]] Result<ChunkPlan, Error> plan_chunks(std::vector<PlannerItem> items,
                                                   const Settings& settings,
                                                   const std::string& book_title,
                                                   const VerifyBatchFn& verify);

} // namespace sheaf
