#include <catch2/catch_test_macros.hpp>
#include "engine/export_session.hpp"
#include "support/fake_encoding_gateway.hpp"
#include "support/fake_remote_store.hpp"
#include "support/items.hpp"
#include "support/spin.hpp"

#include <QSignalSpy>
#include <algorithm>

using namespace sheaf;
using namespace sheaf::engine;
using sheaf::testing::FakeEncodingGateway;
using sheaf::testing::FakeRemoteStore;
using sheaf::testing::image_item;
using sheaf::testing::limit_settings;
using sheaf::testing::spinUntil;

namespace {

constexpr int kTimeoutMs = 5000;

struct SessionFixture {
    FakeEncodingGateway* gateway = nullptr;
    FakeRemoteStore* store = nullptr;
    std::unique_ptr<ExportSession> session;

    SessionFixture() {
        auto g = std::make_unique<FakeEncodingGateway>();
        auto s = std::make_unique<FakeRemoteStore>();
        gateway = g.get();
        store = s.get();
        session = std::make_unique<ExportSession>(std::move(g), std::move(s));
        session->setTimings(EngineTimings{.optimizer_tick_ms = 1, .plan_debounce_ms = 1, .sync_retry_ms = 5});
    }

    BookSnapshot book(std::vector<Item> items, Settings settings = limit_settings(5)) const {
        BookSnapshot snapshot;
        snapshot.title = "Field Notes";
        snapshot.items = std::move(items);
        snapshot.settings = settings;
        snapshot.remote_folder_id = "archive";
        return snapshot;
    }
};

} // namespace

TEST_CASE("ExportSession: optimizes, plans and syncs a book", "[export_session]") {
    SessionFixture f;
    f.session->load(f.book({image_item("a", 4 * MIB), image_item("b", 4 * MIB),
                            image_item("c", 4 * MIB), image_item("d", 4 * MIB)}));
    QSignalSpy synced(f.session.get(), &ExportSession::allSynced);

    f.session->start();
    REQUIRE(spinUntil([&]() { return synced.count() > 0; }, kTimeoutMs));

    REQUIRE(f.session->progress() == 1.0);
    REQUIRE(f.session->isAllSynced());

    const auto& plan = f.session->plan();
    REQUIRE(plan.size() == 2);
    REQUIRE(plan.chunks[0].item_ids == std::vector<ItemId>{"a", "b"});
    REQUIRE(plan.chunks[1].item_ids == std::vector<ItemId>{"c", "d"});
    for (const auto& chunk : plan.chunks) {
        REQUIRE(chunk.fully_optimized);
        REQUIRE(chunk.verified_size_bytes < 5 * MIB);
    }

    const auto& records = f.session->syncRecords();
    REQUIRE(records.size() == 2);
    REQUIRE(records.at(1).remote_object_id == QStringLiteral("archive/Field Notes (Part 1).pdf"));
    REQUIRE(records.at(2).remote_object_id == QStringLiteral("archive/Field Notes (Part 2).pdf"));
    REQUIRE(records.at(2).last_synced_fingerprint == plan.chunks[1].content_fingerprint);

    f.session->stop();
    REQUIRE_FALSE(f.session->isRunning());
}

TEST_CASE("ExportSession: oversized items are reported and still uploaded", "[export_session]") {
    SessionFixture f;
    f.session->load(f.book({image_item("poster", 30 * MIB)}));
    std::vector<OversizedItemError> reported;
    QObject::connect(f.session.get(), &ExportSession::oversizedItems,
                     [&reported](const std::vector<OversizedItemError>& violations) { reported = violations; });
    QSignalSpy synced(f.session.get(), &ExportSession::allSynced);

    f.session->start();
    REQUIRE(spinUntil([&]() { return synced.count() > 0; }, kTimeoutMs));

    REQUIRE_FALSE(reported.empty());
    REQUIRE(reported.back().item_id == "poster");
    REQUIRE(f.session->violations().size() == 1);
    REQUIRE(f.store->uploads.back().filename == QStringLiteral("Field Notes (Part 1).pdf"));
}

TEST_CASE("ExportSession: higher compression replans and resyncs", "[export_session]") {
    SessionFixture f;
    f.session->load(f.book({image_item("a", 6 * MIB), image_item("b", 6 * MIB), image_item("c", 6 * MIB)}));
    QSignalSpy synced(f.session.get(), &ExportSession::allSynced);

    f.session->start();
    REQUIRE(spinUntil([&]() { return synced.count() == 1; }, kTimeoutMs));
    const auto prior = f.session->plan().size();
    REQUIRE(prior == 3);

    f.session->setSettings(limit_settings(5, CompressionLevel::High));
    REQUIRE_FALSE(f.session->hasPlan());

    REQUIRE(spinUntil([&]() { return synced.count() == 2; }, kTimeoutMs));
    REQUIRE(f.session->plan().size() == 1);
    REQUIRE(f.session->plan().size() <= prior);
    REQUIRE(f.session->syncRecords().size() == 1);
}

TEST_CASE("ExportSession: settings are clamped", "[export_session]") {
    SessionFixture f;
    Settings wild;
    wild.max_chunk_size_bytes = 500 * MIB;
    wild.safety_margin_percent = -4.0;

    f.session->setSettings(wild);

    REQUIRE(f.session->book().settings.max_chunk_size_bytes == MAX_CHUNK_SIZE_BYTES);
    REQUIRE(f.session->book().settings.safety_margin_percent == 0.0);
}

TEST_CASE("ExportSession: status reports optimizer work first", "[export_session]") {
    SessionFixture f;
    f.gateway->set_deferred(true);
    f.session->load(f.book({image_item("a", MIB)}));
    QStringList statuses;
    QObject::connect(f.session.get(), &ExportSession::statusChanged,
                     [&statuses](const QString& status) { statuses.append(status); });

    f.session->start();
    REQUIRE(spinUntil([&]() { return f.gateway->compress_calls == 1; }, kTimeoutMs));

    REQUIRE(f.session->statusText() == QStringLiteral("Compressing a.jpg..."));
    REQUIRE(statuses.contains(QStringLiteral("Compressing a.jpg...")));

    f.session->stop();
    f.gateway->complete_all();
}

TEST_CASE("ExportSession: a margin change that keeps the chunks uploads nothing", "[export_session]") {
    SessionFixture f;
    f.session->load(f.book({image_item("a", 4 * MIB), image_item("b", 4 * MIB),
                            image_item("c", 4 * MIB), image_item("d", 4 * MIB)}));
    QSignalSpy synced(f.session.get(), &ExportSession::allSynced);

    f.session->start();
    REQUIRE(spinUntil([&]() { return synced.count() == 1; }, kTimeoutMs));
    const auto uploads = f.store->calls;
    REQUIRE(uploads == 2);
    const auto fingerprint = f.session->plan().chunks[1].content_fingerprint;

    auto settings = limit_settings(5);
    settings.safety_margin_percent = 2.0;
    f.session->setSettings(settings);
    REQUIRE_FALSE(f.session->hasPlan());
    REQUIRE(f.session->syncRecords().size() == 2);

    REQUIRE(spinUntil([&]() { return synced.count() == 2; }, kTimeoutMs));
    REQUIRE(f.session->plan().size() == 2);
    REQUIRE(f.session->plan().chunks[1].content_fingerprint == fingerprint);
    REQUIRE(f.store->calls == uploads);
}

TEST_CASE("ExportSession: verified sizes match the uploaded bundles", "[export_session]") {
    SessionFixture f;
    f.gateway->count_title_bytes = true;
    f.session->load(f.book({image_item("a", 4 * MIB), image_item("b", 4 * MIB), image_item("c", 4 * MIB)}));
    QSignalSpy synced(f.session.get(), &ExportSession::allSynced);

    f.session->start();
    REQUIRE(spinUntil([&]() { return synced.count() > 0; }, kTimeoutMs));

    const auto& plan = f.session->plan();
    REQUIRE(plan.size() == 2);
    REQUIRE(f.store->uploads.size() == 2);
    for (const auto& upload : f.store->uploads) {
        const auto chunk = std::find_if(plan.chunks.begin(), plan.chunks.end(), [&](const Chunk& c) {
            return upload.filename == QString::fromStdString(c.title) + QStringLiteral(".pdf");
        });
        REQUIRE(chunk != plan.chunks.end());
        REQUIRE(upload.size == chunk->verified_size_bytes);
    }
}
