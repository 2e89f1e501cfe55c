#include "engine/book_state.hpp"

namespace sheaf::engine {

BookState::BookState(QObject* parent)
    : QObject(parent)
{
}

void BookState::setItems(std::vector<Item> items) {
    if (items == snapshot_.items) {
        return;
    }
    snapshot_ = with_items(std::move(snapshot_), std::move(items));
    cache_.prune(snapshot_.items);
    generation_ = generation_.next();
    emit itemsChanged();
}

void BookState::setSettings(const Settings& settings) {
    if (settings == snapshot_.settings) {
        return;
    }
    snapshot_ = with_settings(std::move(snapshot_), settings);
    generation_ = generation_.next();
    emit settingsChanged();
}

void BookState::setTitle(std::string title) {
    if (title == snapshot_.title) {
        return;
    }
    snapshot_ = with_title(std::move(snapshot_), std::move(title));
    generation_ = generation_.next();
    emit titleChanged();
}

void BookState::setRemoteFolder(std::string folder_id) {
    if (folder_id == snapshot_.remote_folder_id) {
        return;
    }
    snapshot_ = with_remote_folder(std::move(snapshot_), std::move(folder_id));
    emit remoteFolderChanged();
}

bool BookState::storeRepresentation(const Item& item,
                                    CompressionLevel level,
                                    encoding::CompressedRepresentation representation) {
    const Item* current = find_item(snapshot_, item.id);
    if (current == nullptr || *current != item) {
        return false;
    }
    if (snapshot_.settings.compression_level != level || representation.level != level) {
        return false;
    }
    cache_.store(item.id, std::move(representation));
    emit cacheChanged(QString::fromStdString(item.id));
    return true;
}

} // namespace sheaf::engine
