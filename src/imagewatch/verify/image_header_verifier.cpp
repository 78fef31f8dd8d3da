#include "imagewatch/core/constants.hpp"
#include "imagewatch/util/log.hpp"
#include "imagewatch/verify/file_verifier.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <string_view>
#include <system_error>

namespace imagewatch {

namespace {

using Header = std::span<const std::byte>;

auto starts_with(Header h, std::size_t offset, std::string_view magic) -> bool {
  if (h.size() < offset + magic.size())
    return false;
  return std::ranges::equal(
      h.subspan(offset, magic.size()), magic,
      [](std::byte b, char c) { return b == static_cast<std::byte>(c); });
}

auto u8(Header h, std::size_t i) -> std::uint32_t {
  return std::to_integer<std::uint32_t>(h[i]);
}

auto be32(Header h, std::size_t i) -> std::uint32_t {
  return (u8(h, i) << 24) | (u8(h, i + 1) << 16) | (u8(h, i + 2) << 8) |
         u8(h, i + 3);
}

auto le16(Header h, std::size_t i) -> std::uint32_t {
  return u8(h, i) | (u8(h, i + 1) << 8);
}

auto le32(Header h, std::size_t i) -> std::uint32_t {
  return le16(h, i) | (le16(h, i + 2) << 16);
}

// SOI followed by the first marker's 0xFF prefix.
auto is_jpeg(Header h) -> bool {
  return h.size() >= 3 && u8(h, 0) == 0xFF && u8(h, 1) == 0xD8 &&
         u8(h, 2) == 0xFF;
}

auto is_png(Header h) -> bool {
  static constexpr std::string_view kSignature{"\x89PNG\r\n\x1a\n", 8};
  if (!starts_with(h, 0, kSignature) || h.size() < 24)
    return false;
  // First chunk must be a 13-byte IHDR with non-zero dimensions.
  return be32(h, 8) == 13 && starts_with(h, 12, "IHDR") && be32(h, 16) != 0 &&
         be32(h, 20) != 0;
}

auto is_gif(Header h) -> bool {
  if (!starts_with(h, 0, "GIF87a") && !starts_with(h, 0, "GIF89a"))
    return false;
  return h.size() >= 10 && le16(h, 6) != 0 && le16(h, 8) != 0;
}

auto is_bmp(Header h) -> bool {
  if (!starts_with(h, 0, "BM") || h.size() < 22)
    return false;
  constexpr std::array<std::uint32_t, 7> kDibSizes{12, 40, 52, 56, 64, 108, 124};
  auto dib_size = le32(h, 14);
  if (std::ranges::find(kDibSizes, dib_size) == kDibSizes.end())
    return false;
  if (dib_size == 12)
    return le16(h, 18) != 0;
  return h.size() >= 26 && le32(h, 18) != 0;
}

auto is_webp(Header h) -> bool {
  if (!starts_with(h, 0, "RIFF") || !starts_with(h, 8, "WEBP") || h.size() < 16)
    return false;
  if (le32(h, 4) < 4)
    return false;
  return starts_with(h, 12, "VP8 ") || starts_with(h, 12, "VP8L") ||
         starts_with(h, 12, "VP8X");
}

}  // namespace

auto ImageHeaderVerifier::detect(std::span<const std::byte> header)
    -> Result<ImageFormat> {
  if (is_jpeg(header))
    return ImageFormat::Jpeg;
  if (is_png(header))
    return ImageFormat::Png;
  if (is_gif(header))
    return ImageFormat::Gif;
  if (is_bmp(header))
    return ImageFormat::Bmp;
  if (is_webp(header))
    return ImageFormat::WebP;
  return fail(Error::InvalidImage);
}

auto ImageHeaderVerifier::verify(const std::filesystem::path& path) const
    -> Result<void> {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return fail(Error::FileVanished);
  }
  if (!std::filesystem::is_regular_file(path, ec)) {
    return fail(Error::InvalidImage);
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return fail(Error::FileOpenFailed);
  }

  std::array<std::byte, io::kHeaderProbeSize> buffer{};
  file.read(reinterpret_cast<char*>(buffer.data()),
            static_cast<std::streamsize>(buffer.size()));
  auto got = static_cast<std::size_t>(file.gcount());

  auto format = detect(std::span(buffer).first(got));
  if (!format) {
    return std::unexpected(format.error());
  }
  log::trace("{} looks like image format {}", path.string(),
             static_cast<int>(*format));
  return ok();
}

auto create_image_verifier() -> std::shared_ptr<const IFileVerifier> {
  return std::make_shared<ImageHeaderVerifier>();
}

}  // namespace imagewatch
