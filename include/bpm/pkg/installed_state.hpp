#pragma once

#include "bpm/util/result.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bpm {

struct InstalledRecord {
    std::string repo;
    std::string version;
    std::vector<std::string> binaries;  // absolute destination paths

    bool operator==(const InstalledRecord&) const = default;
};

class InstalledState {
public:
    using Map = std::map<std::string, InstalledRecord>;

    bool Contains(const std::string& name) const;
    std::optional<InstalledRecord> Get(const std::string& name) const;
    void Insert(const std::string& name, InstalledRecord record);
    std::optional<InstalledRecord> Remove(const std::string& name);

    bool Empty() const { return records_.empty(); }
    std::size_t Size() const { return records_.size(); }
    const Map& Records() const { return records_; }

    static std::expected<InstalledState, std::string> FromJson(const std::string& json_input);
    // Fails when a name or path is not valid UTF-8.
    std::expected<std::string, std::string> ToJson() const;

    bool operator==(const InstalledState&) const = default;

private:
    Map records_;
};

// Owns <store_root>/installed.json. Every call reads or writes the document
// afresh; nothing is cached between calls.
class InstalledStateStore {
public:
    // Return true from the mutator to persist the modified state.
    using Mutator = std::function<bool(InstalledState&)>;

    explicit InstalledStateStore(std::filesystem::path store_root);

    // Empty state when the document does not exist, StateCorrupt when it
    // exists but cannot be parsed.
    Result Load(InstalledState& out) const;

    // Replaces the document wholesale (temp file + rename).
    Result Save(const InstalledState& state) const;

    // Load, mutate and save under one exclusive lock.
    Result Modify(const Mutator& mutate) const;

    std::string DocumentPath() const;

private:
    Result LoadUnlocked(InstalledState& out) const;
    Result SaveUnlocked(const InstalledState& state) const;
    Result EnsureRoot() const;

    std::filesystem::path store_root_;
};

} // namespace bpm
