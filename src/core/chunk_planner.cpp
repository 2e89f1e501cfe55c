#include "core/chunk_planner.hpp"

namespace sheaf {

PlanningPass::PlanningPass(std::vector<PlannerItem> items,
                           const Settings& settings,
                           std::string book_title)
    : items_(std::move(items))
    , book_title_(std::move(book_title))
    , limit_(settings.effective_limit())
    , threshold_(static_cast<double>(settings.effective_limit()) * VERIFICATION_THRESHOLD)
{
    plan_.effective_limit = limit_;
    fill();
}

std::optional<VerificationRequest> PlanningPass::pending() const {
    if (phase_ == Phase::AwaitGrow || phase_ == Phase::AwaitShrink) {
        return VerificationRequest{batch_begin_, batch_end_, static_cast<int>(plan_.chunks.size()) + 1};
    }
    return std::nullopt;
}

void PlanningPass::supply(int64_t verified_bytes) {
    if (phase_ != Phase::AwaitGrow && phase_ != Phase::AwaitShrink) {
        return;
    }
    ++verification_count_;

    if (verified_bytes < limit_) {
        // A batch that already lost items is final: the next item was shown not to fit.
        if (phase_ == Phase::AwaitShrink || batch_end_ == items_.size()) {
            finalize(verified_bytes, false);
            fill();
            return;
        }
        good_end_ = batch_end_;
        good_size_ = verified_bytes;
        accumulator_ = verified_bytes;
        fill();
        return;
    }

    if (batch_size() == 1) {
        finalize(verified_bytes, true);
        fill();
        return;
    }
    give_back_last_item();
}

void PlanningPass::fill() {
    phase_ = Phase::Filling;
    while (batch_end_ < items_.size()) {
        accumulator_ += items_[batch_end_].estimated_bytes + ITEM_OVERHEAD_BYTES;
        ++batch_end_;
        if (static_cast<double>(accumulator_) >= threshold_ || batch_end_ == items_.size()) {
            phase_ = Phase::AwaitGrow;
            return;
        }
    }
    phase_ = batch_size() > 0 ? Phase::AwaitGrow : Phase::Done;
}

void PlanningPass::give_back_last_item() {
    --batch_end_;
    if (good_end_ && *good_end_ == batch_end_) {
        finalize(good_size_, false);
        fill();
        return;
    }
    phase_ = Phase::AwaitShrink;
}

void PlanningPass::finalize(int64_t verified_bytes, bool oversized) {
    Chunk chunk;
    chunk.part_number = static_cast<int>(plan_.chunks.size()) + 1;
    chunk.title = part_title(book_title_, chunk.part_number);
    chunk.estimated_size_bytes = estimate(batch_begin_, batch_end_);
    chunk.verified_size_bytes = verified_bytes;
    chunk.oversized = oversized;
    chunk.fully_optimized = true;
    chunk.item_ids.reserve(batch_size());
    chunk.item_sizes.reserve(batch_size());
    for (size_t i = batch_begin_; i < batch_end_; ++i) {
        chunk.item_ids.push_back(items_[i].id);
        chunk.item_sizes.push_back(items_[i].estimated_bytes);
        chunk.fully_optimized = chunk.fully_optimized && items_[i].optimized;
    }
    plan_.chunks.push_back(std::move(chunk));

    batch_begin_ = batch_end_;
    accumulator_ = BUNDLE_OVERHEAD_BYTES;
    good_end_.reset();
    good_size_ = 0;
}

int64_t PlanningPass::estimate(size_t begin, size_t end) const {
    int64_t total = BUNDLE_OVERHEAD_BYTES;
    for (size_t i = begin; i < end; ++i) {
        total += items_[i].estimated_bytes + ITEM_OVERHEAD_BYTES;
    }
    return total;
}

std::string part_title(const std::string& book_title, int part_number) {
    const std::string base = book_title.empty() ? std::string("Untitled") : book_title;
    return base + " (Part " + std::to_string(part_number) + ")";
}

Result<ChunkPlan, Error> plan_chunks(std::vector<PlannerItem> items,
                                     const Settings& settings,
                                     const std::string& book_title,
                                     const VerifyBatchFn& verify) {
    PlanningPass pass(std::move(items), settings, book_title);
    while (const auto request = pass.pending()) {
        const auto batch = std::span<const PlannerItem>(pass.items())
                               .subspan(request->begin, request->size());
        auto measured = verify(batch, part_title(book_title, request->part_number));
        if (measured.is_err()) {
            return Result<ChunkPlan, Error>::err(measured.unwrap_err());
        }
        pass.supply(measured.unwrap());
    }
    return Result<ChunkPlan, Error>::ok(pass.plan());
}

} // namespace sheaf
