#pragma once

#include "imagewatch/config/system_config.hpp"
#include "imagewatch/core/error.hpp"

#include <string>
#include <string_view>

namespace imagewatch {

// Parsing only checks shapes and types; call validate() once command-line
// overrides have been applied.
class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<AppConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<AppConfig>;
};

[[nodiscard]] auto validate(const AppConfig& config) -> Result<void>;

// ".JPG" and "jpg" both become ".jpg".
[[nodiscard]] auto normalize_extension(std::string_view ext) -> std::string;

}  // namespace imagewatch
