#pragma once

#include "imagewatch/core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>

namespace imagewatch {

// Boolean structural check on a settled file. Called from worker threads;
// implementations must be safe to call concurrently.
class IFileVerifier {
public:
  virtual ~IFileVerifier() = default;
  [[nodiscard]] virtual auto verify(const std::filesystem::path& path) const
      -> Result<void> = 0;
};

enum class ImageFormat : std::uint8_t { Jpeg, Png, Gif, Bmp, WebP };

// Reads only the leading bytes of a file and checks that they form a
// plausible JPEG, PNG, GIF, BMP or WebP header. Pixel data is never decoded.
class ImageHeaderVerifier final : public IFileVerifier {
public:
  [[nodiscard]] auto verify(const std::filesystem::path& path) const
      -> Result<void> override;

  // Exposed for tests; `header` is whatever prefix of the file was read.
  [[nodiscard]] static auto detect(std::span<const std::byte> header)
      -> Result<ImageFormat>;
};

[[nodiscard]] auto create_image_verifier() -> std::shared_ptr<const IFileVerifier>;

}  // namespace imagewatch
