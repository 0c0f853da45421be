#pragma once
#include <cstdint>
#include <string_view>

namespace bpm {

// Observational only; sinks never influence control flow.
class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void Begin(std::uint64_t total, std::string_view label) = 0;
    virtual void Advance(std::uint64_t n) = 0;
    virtual void Finish(std::string_view label) = 0;
};

} // namespace bpm
