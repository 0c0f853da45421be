#pragma once

#include "bpm/util/result.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace bpm {

class ICatalogSink {
  public:
    virtual ~ICatalogSink() = default;
    virtual Result Record(const std::string& catalog_path,
                          const std::string& name,
                          std::span<const std::uint8_t> bytes) = 0;
};

struct CatalogEntry {
    std::string name;
    std::uint64_t size = 0;
    std::string sha256;
};

// Catalog kept as a pax tar archive. Each Record rewrites the archive with
// the named entry replaced (or appended) and renames it into place while
// holding "<catalog>.lock".
class TarCatalog final : public ICatalogSink {
  public:
    Result Record(const std::string& catalog_path,
                  const std::string& name,
                  std::span<const std::uint8_t> bytes) override;

    // Missing catalog lists as empty.
    static Result List(const std::string& catalog_path, std::vector<CatalogEntry>& out);
    static Result Read(const std::string& catalog_path,
                       const std::string& name,
                       std::vector<std::uint8_t>& out);
};

} // namespace bpm
