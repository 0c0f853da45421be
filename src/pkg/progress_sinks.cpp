#include "bpm/pkg/progress_sinks.hpp"

#include "bpm/io/file_writer.hpp"

#include <cstdio>
#include <nlohmann/json.hpp>
#include <string>

namespace bpm {

namespace {
bool g_progress_line_active = false;

int Percent(std::uint64_t done, std::uint64_t total) {
    if (total == 0)
        return 100;
    int pct = static_cast<int>((done * 100ULL) / total);
    if (pct > 100)
        pct = 100;
    return pct;
}
} // namespace

FileProgressSink::FileProgressSink(std::string path) : path_(std::move(path)) {}

void FileProgressSink::Begin(std::uint64_t total, std::string_view label) {
    label_ = std::string(label);
    done_ = 0;
    total_ = total;
    Write(false);
}

void FileProgressSink::Advance(std::uint64_t n) {
    done_ += n;
    Write(false);
}

void FileProgressSink::Finish(std::string_view label) {
    label_ = std::string(label);
    done_ = total_;
    Write(true);
}

void FileProgressSink::Write(bool finished) const {
    nlohmann::json j = {
        {"label", label_},
        {"done", done_},
        {"total", total_},
        {"percent", Percent(done_, total_)},
        {"finished", finished},
    };
    // Best effort: a progress file that cannot be written is not an error.
    (void)WriteFileAtomic(path_, j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

void ConsoleProgressSink::Begin(std::uint64_t total, std::string_view label) {
    ClearProgressLine();
    label_ = std::string(label);
    done_ = 0;
    total_ = total;
    Draw();
}

void ConsoleProgressSink::Advance(std::uint64_t n) {
    done_ += n;
    Draw();
}

void ConsoleProgressSink::Finish(std::string_view label) {
    done_ = total_;
    std::fprintf(stderr,
                 "\r[%-30.*s] %3d%% %llu/%llu %.*s\n",
                 (int)label_.size(),
                 label_.data(),
                 100,
                 (unsigned long long)done_,
                 (unsigned long long)total_,
                 (int)label.size(),
                 label.data());
    std::fflush(stderr);
    g_progress_line_active = false;
}

void ConsoleProgressSink::Draw() const {
    std::fprintf(stderr,
                 "\r[%-30.*s] %3d%% %llu/%llu",
                 (int)label_.size(),
                 label_.data(),
                 Percent(done_, total_),
                 (unsigned long long)done_,
                 (unsigned long long)total_);
    std::fflush(stderr);
    g_progress_line_active = true;
}

TeeProgressSink::TeeProgressSink(std::vector<IProgress*> sinks) : sinks_(std::move(sinks)) {}

void TeeProgressSink::Begin(std::uint64_t total, std::string_view label) {
    for (auto* s : sinks_)
        if (s) s->Begin(total, label);
}

void TeeProgressSink::Advance(std::uint64_t n) {
    for (auto* s : sinks_)
        if (s) s->Advance(n);
}

void TeeProgressSink::Finish(std::string_view label) {
    for (auto* s : sinks_)
        if (s) s->Finish(label);
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
}

} // namespace bpm
