#include <catch2/catch_test_macros.hpp>
#include "core/chunk_planner.hpp"

using namespace sheaf;

namespace {

Settings limit_mib(int64_t mib, double margin = 0.0) {
    return Settings{.max_chunk_size_bytes = mib * MIB,
                    .compression_level = CompressionLevel::Low,
                    .safety_margin_percent = margin};
}

std::vector<PlannerItem> items_of(std::initializer_list<int64_t> sizes, bool optimized = true) {
    std::vector<PlannerItem> out;
    int n = 1;
    for (auto size : sizes) {
        out.push_back(PlannerItem{.id = "item-" + std::to_string(n++), .estimated_bytes = size,
                                  .optimized = optimized});
    }
    return out;
}

// Encoded size of a batch: its items plus `per_item` container bytes each, times `factor`.
struct CountingVerifier {
    int64_t per_item = 0;
    int64_t factor = 1;
    int calls = 0;
    std::vector<std::string> titles;

    VerifyBatchFn fn() {
        return [this](std::span<const PlannerItem> batch, const std::string& title) {
            ++calls;
            titles.push_back(title);
            int64_t total = 0;
            for (const auto& item : batch) {
                total += item.estimated_bytes + per_item;
            }
            return Result<int64_t, Error>::ok(total * factor);
        };
    }
};

constexpr int64_t kPerItem = MIB / 20;

} // namespace

TEST_CASE("ChunkPlanner: empty book plans no chunks", "[chunk_planner]") {
    CountingVerifier verifier;
    const auto plan = plan_chunks({}, limit_mib(15), "Book", verifier.fn()).unwrap();

    REQUIRE(plan.empty());
    REQUIRE(plan.effective_limit == 15 * MIB);
    REQUIRE(verifier.calls == 0);
}

TEST_CASE("ChunkPlanner: overflowing batch gives back its last item", "[chunk_planner]") {
    CountingVerifier verifier{.per_item = kPerItem};
    const auto plan = plan_chunks(items_of({6 * MIB, 6 * MIB, 6 * MIB}), limit_mib(15), "Atlas",
                                  verifier.fn()).unwrap();

    REQUIRE(plan.size() == 2);
    REQUIRE(plan.chunks[0].item_ids == std::vector<ItemId>{"item-1", "item-2"});
    REQUIRE(plan.chunks[0].verified_size_bytes == 2 * (6 * MIB + kPerItem));
    REQUIRE_FALSE(plan.chunks[0].oversized);
    REQUIRE(plan.chunks[1].item_ids == std::vector<ItemId>{"item-3"});
    REQUIRE(plan.chunks[1].verified_size_bytes == 6 * MIB + kPerItem);
    REQUIRE_FALSE(plan.chunks[1].oversized);
    REQUIRE(plan.violations().empty());

    // {1,2,3} rejected, {1,2} accepted, {3} accepted.
    REQUIRE(verifier.calls == 3);
    REQUIRE(verifier.titles == std::vector<std::string>{"Atlas (Part 1)", "Atlas (Part 1)", "Atlas (Part 2)"});
}

TEST_CASE("ChunkPlanner: single item above the limit becomes an oversized chunk", "[chunk_planner]") {
    CountingVerifier verifier;
    const auto plan = plan_chunks(items_of({20 * MIB}), limit_mib(15), "Atlas", verifier.fn()).unwrap();

    REQUIRE(plan.size() == 1);
    REQUIRE(plan.chunks[0].oversized);
    REQUIRE(plan.chunks[0].verified_size_bytes == 20 * MIB);

    const auto violations = plan.violations();
    REQUIRE(violations.size() == 1);
    REQUIRE(violations[0] == OversizedItemError{.part_number = 1, .item_id = "item-1",
                                                .verified_size_bytes = 20 * MIB,
                                                .effective_limit = 15 * MIB});

    const auto check = plan.check_constraints();
    REQUIRE(check.is_err());
    REQUIRE(check.unwrap_err().kind == ErrorKind::OversizedItem);
}

TEST_CASE("ChunkPlanner: oversized item does not swallow its neighbours", "[chunk_planner]") {
    CountingVerifier verifier;
    const auto plan = plan_chunks(items_of({2 * MIB, 20 * MIB, 2 * MIB}), limit_mib(15), "",
                                  verifier.fn()).unwrap();

    REQUIRE(plan.size() == 3);
    REQUIRE(plan.chunks[0].item_ids == std::vector<ItemId>{"item-1"});
    REQUIRE_FALSE(plan.chunks[0].oversized);
    REQUIRE(plan.chunks[1].item_ids == std::vector<ItemId>{"item-2"});
    REQUIRE(plan.chunks[1].oversized);
    REQUIRE(plan.chunks[2].item_ids == std::vector<ItemId>{"item-3"});
    REQUIRE_FALSE(plan.chunks[2].oversized);
}

TEST_CASE("ChunkPlanner: verified prefix is kept when the next item does not fit", "[chunk_planner]") {
    // 6.5 + 6.5 crosses the threshold and verifies; adding each 1 MiB item is
    // measured again until the batch lands exactly on the limit.
    CountingVerifier verifier;
    const int64_t half = MIB / 2;
    const auto plan = plan_chunks(items_of({6 * MIB + half, 6 * MIB + half, MIB, MIB}), limit_mib(15),
                                  "Atlas", verifier.fn()).unwrap();

    REQUIRE(plan.size() == 2);
    REQUIRE(plan.chunks[0].item_ids == std::vector<ItemId>{"item-1", "item-2", "item-3"});
    REQUIRE(plan.chunks[0].verified_size_bytes == 14 * MIB);
    REQUIRE(plan.chunks[1].item_ids == std::vector<ItemId>{"item-4"});
    REQUIRE(plan.chunks[1].verified_size_bytes == MIB);

    // {1,2}, {1,2,3}, {1,2,3,4} at exactly the limit, then {4}.
    REQUIRE(verifier.calls == 4);
}

TEST_CASE("ChunkPlanner: shrinks repeatedly when estimates are far too low", "[chunk_planner]") {
    CountingVerifier verifier{.per_item = 0, .factor = 2};
    const auto plan = plan_chunks(items_of({4 * MIB, 4 * MIB, 4 * MIB}), limit_mib(15), "Atlas",
                                  verifier.fn()).unwrap();

    REQUIRE(plan.size() == 3);
    for (const auto& chunk : plan.chunks) {
        REQUIRE(chunk.item_ids.size() == 1);
        REQUIRE(chunk.verified_size_bytes == 8 * MIB);
        REQUIRE_FALSE(chunk.oversized);
    }
    REQUIRE(verifier.calls == 6);
}

TEST_CASE("ChunkPlanner: safety margin lowers the limit", "[chunk_planner]") {
    CountingVerifier verifier;
    const auto settings = limit_mib(10, 20.0);
    REQUIRE(settings.effective_limit() == 8 * MIB);

    const auto plan = plan_chunks(items_of({5 * MIB, 5 * MIB}), settings, "Atlas", verifier.fn()).unwrap();

    REQUIRE(plan.effective_limit == 8 * MIB);
    REQUIRE(plan.size() == 2);
}

TEST_CASE("ChunkPlanner: chunk metadata", "[chunk_planner]") {
    CountingVerifier verifier;
    auto items = items_of({7 * MIB, 7 * MIB, 7 * MIB});
    items[2].optimized = false;

    SECTION("titles carry the part number") {
        const auto plan = plan_chunks(items, limit_mib(15), "Field Notes", verifier.fn()).unwrap();
        REQUIRE(plan.size() == 2);
        REQUIRE(plan.chunks[0].part_number == 1);
        REQUIRE(plan.chunks[0].title == "Field Notes (Part 1)");
        REQUIRE(plan.chunks[1].part_number == 2);
        REQUIRE(plan.chunks[1].title == "Field Notes (Part 2)");
    }

    SECTION("untitled books get a placeholder title") {
        REQUIRE(part_title("", 3) == "Untitled (Part 3)");
    }

    SECTION("optimization and sizes are recorded per chunk") {
        const auto plan = plan_chunks(items, limit_mib(15), "Field Notes", verifier.fn()).unwrap();
        REQUIRE(plan.chunks[0].fully_optimized);
        REQUIRE_FALSE(plan.chunks[1].fully_optimized);
        REQUIRE(plan.chunks[0].item_sizes == std::vector<int64_t>{7 * MIB, 7 * MIB});
        REQUIRE(plan.chunks[0].estimated_size_bytes ==
                BUNDLE_OVERHEAD_BYTES + 2 * (7 * MIB + ITEM_OVERHEAD_BYTES));
    }
}

TEST_CASE("ChunkPlanner: chunks cover every item in order", "[chunk_planner]") {
    CountingVerifier verifier{.per_item = kPerItem};
    const auto items = items_of({3 * MIB, 9 * MIB, 1 * MIB, 4 * MIB, 12 * MIB, 2 * MIB, 2 * MIB});
    const auto plan = plan_chunks(items, limit_mib(15), "Atlas", verifier.fn()).unwrap();

    std::vector<ItemId> expected;
    for (const auto& item : items) {
        expected.push_back(item.id);
    }
    REQUIRE(plan.concatenated_item_ids() == expected);
    REQUIRE(plan.check_constraints().is_ok());
}

TEST_CASE("ChunkPlanner: verification error aborts the pass", "[chunk_planner]") {
    int calls = 0;
    const VerifyBatchFn failing = [&calls](std::span<const PlannerItem>, const std::string&) {
        ++calls;
        return Result<int64_t, Error>::err(Error{"encoder crashed", ErrorKind::TransientEncoding});
    };

    const auto result = plan_chunks(items_of({MIB, MIB}), limit_mib(15), "Atlas", failing);

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::TransientEncoding);
    REQUIRE(calls == 1);
}

TEST_CASE("PlanningPass: stepwise driving", "[chunk_planner]") {
    PlanningPass pass(items_of({6 * MIB, 6 * MIB, 6 * MIB}), limit_mib(15), "Atlas");

    REQUIRE_FALSE(pass.finished());
    REQUIRE(pass.pending() == VerificationRequest{0, 3, 1});

    pass.supply(18 * MIB);
    REQUIRE(pass.pending() == VerificationRequest{0, 2, 1});

    pass.supply(12 * MIB);
    REQUIRE(pass.pending() == VerificationRequest{2, 3, 2});
    REQUIRE(pass.plan().size() == 1);

    pass.supply(6 * MIB);
    REQUIRE(pass.finished());
    REQUIRE_FALSE(pass.pending().has_value());
    REQUIRE(pass.verification_count() == 3);

    SECTION("answers after the pass finished are ignored") {
        const auto before = pass.plan();
        pass.supply(1);
        REQUIRE(pass.plan() == before);
        REQUIRE(pass.verification_count() == 3);
    }
}
