#pragma once

#include "bpm/pkg/manifest.hpp"

#include <expected>
#include <string>

namespace bpm {

class ManifestParser {
  public:
    std::expected<Manifest, std::string> Parse(const std::string& json_input) const;
};

} // namespace bpm
