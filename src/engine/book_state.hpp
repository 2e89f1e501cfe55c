#pragma once

#include "core/book.hpp"
#include "core/types.hpp"
#include "engine/item_cache.hpp"
#include <QObject>
#include <QString>

namespace sheaf::engine {

/**
 * BookState - The current book snapshot and item cache, shared by the engine
 * loops.
 *
 * Every setter replaces the snapshot as a whole and bumps generation() when
 * the content that plans are derived from changed (items, order, settings or
 * title). Storing a cache entry does not bump the generation; it is reported
 * through cacheChanged() instead.
 */
class BookState : public QObject {
    Q_OBJECT

public:
    explicit BookState(QObject* parent = nullptr);

    [[nodiscard]] const BookSnapshot& snapshot() const { return snapshot_; }
    [[nodiscard]] const ItemCache& cache() const { return cache_; }
    [[nodiscard]] Generation generation() const { return generation_; }

    void setItems(std::vector<Item> items);
    void setSettings(const Settings& settings);
    void setTitle(std::string title);
    void setRemoteFolder(std::string folder_id);

    /**
     * Store a representation for `item` produced under `level`.
     *
     * Accepted only if the item is still in the book unchanged and the
     * current compression level is still `level`. Returns whether it was
     * stored.
     */
    bool storeRepresentation(const Item& item,
                             CompressionLevel level,
                             encoding::CompressedRepresentation representation);

signals:
    void itemsChanged();
    void settingsChanged();
    void titleChanged();
    void remoteFolderChanged();
    void cacheChanged(const QString& item_id);

private:
    BookSnapshot snapshot_;
    ItemCache cache_;
    Generation generation_;
};

} // namespace sheaf::engine
