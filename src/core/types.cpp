#include "core/types.hpp"

#include <type_traits>

namespace sheaf {

static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");
static_assert(std::is_trivially_copyable_v<Generation>, "Generation should be trivially copyable");

std::string_view to_string(ItemKind kind) noexcept {
    switch (kind) {
        case ItemKind::Image: return "image";
        case ItemKind::Pdf: return "pdf";
        case ItemKind::Document: return "document";
    }
    return "image";
}

std::string_view to_string(CompressionLevel level) noexcept {
    switch (level) {
        case CompressionLevel::Low: return "low";
        case CompressionLevel::Medium: return "medium";
        case CompressionLevel::High: return "high";
    }
    return "low";
}

std::optional<ItemKind> parse_item_kind(std::string_view text) {
    if (text == "image") return ItemKind::Image;
    if (text == "pdf") return ItemKind::Pdf;
    if (text == "document") return ItemKind::Document;
    return std::nullopt;
}

std::optional<CompressionLevel> parse_compression_level(std::string_view text) {
    if (text == "low") return CompressionLevel::Low;
    if (text == "medium") return CompressionLevel::Medium;
    if (text == "high") return CompressionLevel::High;
    return std::nullopt;
}

} // namespace sheaf
