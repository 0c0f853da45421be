#pragma once

#include "bpm/pkg/progress.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace bpm {

class FileProgressSink final : public IProgress {
public:
    explicit FileProgressSink(std::string path);

    void Begin(std::uint64_t total, std::string_view label) override;
    void Advance(std::uint64_t n) override;
    void Finish(std::string_view label) override;

private:
    void Write(bool finished) const;

    std::string path_;
    std::string label_;
    std::uint64_t done_ = 0;
    std::uint64_t total_ = 0;
};

class ConsoleProgressSink final : public IProgress {
public:
    ConsoleProgressSink() = default;

    void Begin(std::uint64_t total, std::string_view label) override;
    void Advance(std::uint64_t n) override;
    void Finish(std::string_view label) override;

private:
    void Draw() const;

    std::string label_;
    std::uint64_t done_ = 0;
    std::uint64_t total_ = 0;
};

// Forwards every event to each non-null sink.
class TeeProgressSink final : public IProgress {
public:
    explicit TeeProgressSink(std::vector<IProgress*> sinks);

    void Begin(std::uint64_t total, std::string_view label) override;
    void Advance(std::uint64_t n) override;
    void Finish(std::string_view label) override;

private:
    std::vector<IProgress*> sinks_;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace bpm
