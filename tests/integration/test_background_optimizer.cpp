#include <catch2/catch_test_macros.hpp>
#include "engine/background_optimizer.hpp"
#include "support/fake_encoding_gateway.hpp"
#include "support/items.hpp"
#include "support/spin.hpp"

#include <QSignalSpy>

using namespace sheaf;
using namespace sheaf::engine;
using sheaf::testing::FakeEncodingGateway;
using sheaf::testing::image_item;
using sheaf::testing::document_item;

TEST_CASE("BackgroundOptimizer: refreshes one item per tick", "[optimizer]") {
    BookState book;
    FakeEncodingGateway gateway;
    book.setItems({image_item("a", 6 * MIB), image_item("b", 6 * MIB), image_item("c", 6 * MIB)});
    BackgroundOptimizer optimizer(book, gateway);
    QSignalSpy refreshed(&optimizer, &BackgroundOptimizer::itemRefreshed);
    QSignalSpy idle(&optimizer, &BackgroundOptimizer::idle);

    optimizer.tick();
    REQUIRE(gateway.compress_calls == 1);
    REQUIRE(book.cache().size() == 1);
    REQUIRE(book.cache().entry("a")->size == 3 * MIB);
    REQUIRE(refreshed.count() == 1);
    REQUIRE(refreshed.at(0).at(0).toString() == QStringLiteral("a"));

    optimizer.tick();
    optimizer.tick();
    REQUIRE(gateway.compressed_ids == std::vector<ItemId>{"a", "b", "c"});
    REQUIRE(optimizer.progress() == 1.0);
    REQUIRE(idle.count() == 0);

    optimizer.tick();
    optimizer.tick();
    REQUIRE(idle.count() == 1);
    REQUIRE(gateway.compress_calls == 3);
    REQUIRE(optimizer.isIdle());
}

TEST_CASE("BackgroundOptimizer: page counts for multi-page items", "[optimizer]") {
    BookState book;
    FakeEncodingGateway gateway;
    gateway.pages_per_document = 7;
    book.setItems({document_item("scan", MIB), document_item("known", MIB, 4)});
    BackgroundOptimizer optimizer(book, gateway);

    optimizer.tick();
    optimizer.tick();

    REQUIRE(gateway.page_count_calls == 1);
    REQUIRE(book.cache().entry("scan")->page_count == 7);
    REQUIRE(book.cache().entry("known")->page_count == 4);
    REQUIRE(book.cache().entry("scan")->size == MIB);
}

TEST_CASE("BackgroundOptimizer: compression change reprocesses from the start", "[optimizer]") {
    BookState book;
    FakeEncodingGateway gateway;
    book.setItems({image_item("a", 10 * MIB), image_item("b", 10 * MIB)});
    BackgroundOptimizer optimizer(book, gateway);
    optimizer.tick();
    optimizer.tick();
    REQUIRE(optimizer.progress() == 1.0);

    book.setSettings(sheaf::testing::limit_settings(15, CompressionLevel::High));

    REQUIRE(optimizer.cursor() == 0);
    REQUIRE(optimizer.progress() == 0.0);
    REQUIRE(book.cache().needs_processing(book.snapshot().items[0], book.snapshot().settings));

    optimizer.tick();
    REQUIRE(gateway.compressed_ids.back() == "a");
    REQUIRE(book.cache().entry("a")->level == CompressionLevel::High);
    REQUIRE(book.cache().entry("a")->size == 2 * MIB);
    REQUIRE(optimizer.progress() == 0.5);
}

TEST_CASE("BackgroundOptimizer: one refresh in flight", "[optimizer]") {
    BookState book;
    FakeEncodingGateway gateway;
    gateway.set_deferred(true);
    book.setItems({image_item("a", MIB), image_item("b", MIB)});
    BackgroundOptimizer optimizer(book, gateway);

    optimizer.tick();
    optimizer.tick();
    optimizer.tick();

    REQUIRE(gateway.compress_calls == 1);
    REQUIRE(gateway.max_pending == 1);
    REQUIRE(optimizer.isBusy());
    REQUIRE(optimizer.statusText() == QStringLiteral("Compressing a.jpg..."));

    gateway.complete_next();
    REQUIRE_FALSE(optimizer.isBusy());
    REQUIRE(book.cache().entry("a") != nullptr);

    optimizer.tick();
    REQUIRE(gateway.compressed_ids == std::vector<ItemId>{"a", "b"});
}

TEST_CASE("BackgroundOptimizer: stale completions are dropped", "[optimizer]") {
    BookState book;
    FakeEncodingGateway gateway;
    gateway.set_deferred(true);
    book.setItems({image_item("a", 4 * MIB), image_item("b", 4 * MIB)});
    BackgroundOptimizer optimizer(book, gateway);
    QSignalSpy refreshed(&optimizer, &BackgroundOptimizer::itemRefreshed);

    SECTION("item edited while compressing") {
        optimizer.tick();
        book.setItems({image_item("a", 5 * MIB), image_item("b", 4 * MIB)});
        gateway.complete_next();

        REQUIRE(book.cache().entry("a") == nullptr);
        REQUIRE(refreshed.count() == 0);
        REQUIRE_FALSE(optimizer.isBusy());
    }

    SECTION("item removed while compressing") {
        optimizer.tick();
        book.setItems({image_item("b", 4 * MIB)});
        gateway.complete_next();

        REQUIRE(book.cache().empty());
        REQUIRE(refreshed.count() == 0);
    }

    SECTION("compression level changed while compressing") {
        optimizer.tick();
        book.setSettings(sheaf::testing::limit_settings(15, CompressionLevel::Medium));
        gateway.complete_next();

        REQUIRE(book.cache().empty());
    }

    SECTION("optimizer stopped while compressing") {
        optimizer.start();
        optimizer.tick();
        optimizer.stop();
        gateway.complete_next();

        REQUIRE(book.cache().empty());
        REQUIRE(optimizer.statusText().isEmpty());
    }
}

TEST_CASE("BackgroundOptimizer: a failing item does not starve the rest", "[optimizer]") {
    BookState book;
    FakeEncodingGateway gateway;
    gateway.fail_compress_ids = {"a"};
    book.setItems({image_item("a", MIB), image_item("b", MIB), image_item("c", MIB)});
    BackgroundOptimizer optimizer(book, gateway);
    QSignalSpy failed(&optimizer, &BackgroundOptimizer::refreshFailed);

    optimizer.tick();
    REQUIRE(failed.count() == 1);
    REQUIRE(failed.at(0).at(0).toString() == QStringLiteral("a"));
    REQUIRE(optimizer.cursor() == 1);

    optimizer.tick();
    optimizer.tick();
    REQUIRE(book.cache().entry("b") != nullptr);
    REQUIRE(book.cache().entry("c") != nullptr);

    // The scan wraps around and retries the failed item.
    optimizer.tick();
    REQUIRE(gateway.compressed_ids == std::vector<ItemId>{"a", "b", "c", "a"});
    REQUIRE(failed.count() == 2);

    gateway.fail_compress_ids.clear();
    optimizer.tick();
    REQUIRE(optimizer.progress() == 1.0);
}

TEST_CASE("BackgroundOptimizer: timer drives the cache to completion", "[optimizer]") {
    BookState book;
    FakeEncodingGateway gateway;
    book.setItems({image_item("a", MIB), document_item("b", MIB), image_item("c", MIB)});
    BackgroundOptimizer optimizer(book, gateway);
    optimizer.setTickInterval(1);
    QSignalSpy idle(&optimizer, &BackgroundOptimizer::idle);

    optimizer.start();
    REQUIRE(sheaf::testing::spinUntil([&]() { return idle.count() > 0; }, 2000));
    optimizer.stop();

    REQUIRE(optimizer.progress() == 1.0);
    REQUIRE(book.cache().size() == 3);
    REQUIRE_FALSE(optimizer.isRunning());
}
