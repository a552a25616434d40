#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace vieweval::core {

/// Memory: Frame owns one contiguous, tightly packed buffer (std::vector<std::byte>).
/// Distinct Frame instances are independent; a Frame is read-only for every
/// evaluation stage, so one screenshot may be shared by concurrent comparisons.

/// Interleaved 8-bit pixel layouts a screenshot can arrive in.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  RGB8,
  BGR8,
  RGBA8,
  BGRA8,
};

/// Number of interleaved channels; 0 for Unknown.
[[nodiscard]] std::uint32_t channel_count(PixelFormat format) noexcept;

/// Raster image (captured screenshot or ground-truth screenshot).
class Frame {
 public:
  Frame() = default;

  Frame(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> buffer)
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }
  [[nodiscard]] std::uint32_t channels() const noexcept { return channel_count(format_); }

  /// Bytes per row; rows are tightly packed.
  [[nodiscard]] std::size_t stride() const noexcept {
    return static_cast<std::size_t>(width_) * channels();
  }

  /// Same dimensions (the formats may differ).
  [[nodiscard]] bool same_size(const Frame& other) const noexcept {
    return width_ == other.width_ && height_ == other.height_;
  }

  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// True when the buffer holds at least width * height * channels bytes of a known format.
  [[nodiscard]] bool valid() const noexcept;

  /// Minimum bytes required for given dimensions and format (for validation).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format);

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
};

}  // namespace vieweval::core
