#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <cstdint>
#include <compare>
#include <optional>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace sheaf {

/**
 * ItemId - Stable identity of a book item (the remote file id in practice).
 */
using ItemId = std::string;

/**
 * ItemKind - What an item's source bytes are.
 *
 * Pdf and Document items are multi-page containers whose page count is only
 * known after inspecting their bytes.
 */
enum class ItemKind {
    Image,
    Pdf,
    Document
};

/**
 * CompressionLevel - Per-item re-encoding aggressiveness.
 */
enum class CompressionLevel {
    Low,
    Medium,
    High
};

[[nodiscard]] constexpr bool is_multi_page(ItemKind kind) noexcept {
    return kind != ItemKind::Image;
}

[[nodiscard]] std::string_view to_string(ItemKind kind) noexcept;
[[nodiscard]] std::string_view to_string(CompressionLevel level) noexcept;

// Parsers accept the lowercase names produced by to_string().
[[nodiscard]] std::optional<ItemKind> parse_item_kind(std::string_view text);
[[nodiscard]] std::optional<CompressionLevel> parse_compression_level(std::string_view text);

/**
 * Timestamp - Milliseconds since the Unix epoch.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;

    constexpr Timestamp() noexcept : millis_(0) {}
    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    [[nodiscard]] static Timestamp now() {
        const auto since_epoch = Clock::now().time_since_epoch();
        return Timestamp(std::chrono::duration_cast<Duration>(since_epoch).count());
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept { return millis_; }
    [[nodiscard]] constexpr bool is_epoch() const noexcept { return millis_ == 0; }

    /**
     * Format as ISO 8601 (UTC, millisecond precision).
     */
    [[nodiscard]] std::string to_iso_string() const {
        const std::time_t seconds = static_cast<std::time_t>(millis_ / 1000);
        std::tm utc{};
        gmtime_r(&seconds, &utc);
        std::ostringstream oss;
        oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << (millis_ % 1000) << 'Z';
        return oss.str();
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Duration operator-(const Timestamp& other) const {
        return Duration(millis_ - other.millis_);
    }

private:
    int64_t millis_;
};

/**
 * Generation - Marker for the inputs an asynchronous operation started from.
 *
 * Owners bump their generation whenever the inputs change; a completion that
 * carries an older generation is discarded instead of merged.
 */
class Generation {
public:
    constexpr Generation() noexcept = default;
    explicit constexpr Generation(uint64_t value) noexcept : value_(value) {}

    [[nodiscard]] constexpr Generation next() const noexcept { return Generation(value_ + 1); }
    [[nodiscard]] constexpr uint64_t value() const noexcept { return value_; }

    auto operator<=>(const Generation&) const = default;
    bool operator==(const Generation&) const = default;

private:
    uint64_t value_ = 0;
};

} // namespace sheaf
