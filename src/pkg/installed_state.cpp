#include "bpm/pkg/installed_state.hpp"

#include "bpm/io/file_lock.hpp"
#include "bpm/io/file_reader.hpp"
#include "bpm/io/file_writer.hpp"
#include "bpm/pkg/store_paths.hpp"
#include "bpm/util/logger.hpp"

#include <cerrno>
#include <nlohmann/json.hpp>
#include <system_error>

namespace bpm {

using json = nlohmann::json;

namespace fs = std::filesystem;

namespace {

bool GetString(const json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_string())
        return false;
    out = it->get<std::string>();
    return true;
}

} // namespace

bool InstalledState::Contains(const std::string& name) const {
    return records_.find(name) != records_.end();
}

std::optional<InstalledRecord> InstalledState::Get(const std::string& name) const {
    auto it = records_.find(name);
    if (it == records_.end())
        return std::nullopt;
    return it->second;
}

void InstalledState::Insert(const std::string& name, InstalledRecord record) {
    records_.insert_or_assign(name, std::move(record));
}

std::optional<InstalledRecord> InstalledState::Remove(const std::string& name) {
    auto node = records_.extract(name);
    if (node.empty())
        return std::nullopt;
    return std::move(node.mapped());
}

std::expected<InstalledState, std::string> InstalledState::FromJson(const std::string& json_input) {
    try {
        auto j = json::parse(json_input);
        if (!j.is_object()) {
            return std::unexpected("JSON root must be an object");
        }

        InstalledState state;
        for (const auto& [name, item] : j.items()) {
            if (!item.is_object()) {
                return std::unexpected("record '" + name + "' must be an object");
            }
            InstalledRecord rec;
            if (!GetString(item, "repo", rec.repo)) {
                return std::unexpected("record '" + name + "' missing string 'repo'");
            }
            if (!GetString(item, "version", rec.version)) {
                return std::unexpected("record '" + name + "' missing string 'version'");
            }
            auto bins = item.find("binaries");
            if (bins == item.end() || !bins->is_array()) {
                return std::unexpected("record '" + name + "' missing array 'binaries'");
            }
            for (const auto& b : *bins) {
                if (!b.is_string()) {
                    return std::unexpected("record '" + name + "' has a non-string binary");
                }
                rec.binaries.push_back(b.get<std::string>());
            }
            state.records_.emplace(name, std::move(rec));
        }
        return state;
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Internal Error: ") + e.what());
    }
}

std::expected<std::string, std::string> InstalledState::ToJson() const {
    try {
        json j = json::object();
        for (const auto& [name, rec] : records_) {
            j[name] = {
                {"repo", rec.repo},
                {"version", rec.version},
                {"binaries", rec.binaries},
            };
        }
        return j.dump(2);
    } catch (const json::exception& e) {
        return std::unexpected(std::string("Encode Error: ") + e.what());
    }
}

InstalledStateStore::InstalledStateStore(fs::path store_root) : store_root_(std::move(store_root)) {}

std::string InstalledStateStore::DocumentPath() const {
    return InstalledDbPath(store_root_).string();
}

Result InstalledStateStore::EnsureRoot() const {
    std::error_code ec;
    fs::create_directories(store_root_, ec);
    if (ec) {
        return Result::Fail(Errc::StateWriteFailed,
                            "cannot create store root " + store_root_.string() + ": " + ec.message(),
                            ec.value());
    }
    return Result::Ok();
}

Result InstalledStateStore::Load(InstalledState& out) const {
    std::error_code ec;
    if (!fs::exists(store_root_, ec)) {
        out = InstalledState{};
        return Result::Ok();
    }

    FileLock lock;
    auto lock_result = FileLock::Acquire(LockPathFor(DocumentPath()).string(),
                                         FileLock::Mode::Shared, lock);
    if (!lock_result.is_ok()) {
        if (!IsReadOnlyLockFailure(lock_result))
            return lock_result;
        LogDebug("Reading %s without a lock: %s", DocumentPath().c_str(), lock_result.msg.c_str());
    }

    return LoadUnlocked(out);
}

Result InstalledStateStore::Save(const InstalledState& state) const {
    auto root_result = EnsureRoot();
    if (!root_result.is_ok())
        return root_result;

    FileLock lock;
    auto lock_result = FileLock::Acquire(LockPathFor(DocumentPath()).string(),
                                         FileLock::Mode::Exclusive, lock);
    if (!lock_result.is_ok())
        return lock_result;

    return SaveUnlocked(state);
}

Result InstalledStateStore::Modify(const Mutator& mutate) const {
    auto root_result = EnsureRoot();
    if (!root_result.is_ok())
        return root_result;

    FileLock lock;
    auto lock_result = FileLock::Acquire(LockPathFor(DocumentPath()).string(),
                                         FileLock::Mode::Exclusive, lock);
    if (!lock_result.is_ok())
        return lock_result;

    InstalledState state;
    auto load_result = LoadUnlocked(state);
    if (!load_result.is_ok())
        return load_result;

    if (!mutate(state))
        return Result::Ok();

    return SaveUnlocked(state);
}

Result InstalledStateStore::LoadUnlocked(InstalledState& out) const {
    const std::string path = DocumentPath();
    std::string content;
    auto read_result = ReadFileToString(path, content);
    if (!read_result.is_ok()) {
        if (read_result.err == ENOENT) {
            out = InstalledState{};
            return Result::Ok();
        }
        return Result::Fail(Errc::StateCorrupt, "cannot read " + path + ": " + read_result.msg,
                            read_result.err);
    }

    auto parsed = InstalledState::FromJson(content);
    if (!parsed) {
        LogError("Installed-state document %s is corrupt: %s", path.c_str(), parsed.error().c_str());
        return Result::Fail(Errc::StateCorrupt, "corrupt installed state " + path + ": " + parsed.error());
    }

    out = std::move(*parsed);
    return Result::Ok();
}

Result InstalledStateStore::SaveUnlocked(const InstalledState& state) const {
    const std::string path = DocumentPath();
    auto doc = state.ToJson();
    if (!doc) {
        LogError("Cannot encode installed state for %s: %s", path.c_str(), doc.error().c_str());
        return Result::Fail(Errc::StateWriteFailed, "cannot encode installed state: " + doc.error());
    }
    auto write_result = WriteFileAtomic(path, *doc);
    if (!write_result.is_ok()) {
        return Result::Fail(Errc::StateWriteFailed,
                            "cannot save installed state: " + write_result.msg, write_result.err);
    }
    LogDebug("Saved %s (%zu records)", path.c_str(), state.Size());
    return Result::Ok();
}

} // namespace bpm
