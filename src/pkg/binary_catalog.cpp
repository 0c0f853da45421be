#include "bpm/pkg/binary_catalog.hpp"

#include "bpm/crypto/sha256.hpp"
#include "bpm/io/file_lock.hpp"
#include "bpm/pkg/store_paths.hpp"
#include "bpm/util/logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

namespace bpm {

namespace {

constexpr size_t kBlockSize = 10240;

std::string ArchiveError(archive* a) {
    const char* em = a ? archive_error_string(a) : nullptr;
    return em ? std::string(em) : std::string("unknown");
}

class ArchiveReader final {
public:
    ArchiveReader() : ar_(archive_read_new()) {
        if (ar_) archive_read_support_format_tar(ar_);
    }
    ArchiveReader(const ArchiveReader&) = delete;
    ArchiveReader& operator=(const ArchiveReader&) = delete;
    ~ArchiveReader() {
        if (ar_) archive_read_free(ar_);
    }

    archive* get() const { return ar_; }

    Result Open(const std::string& path) {
        if (!ar_) return Result::Fail(Errc::CatalogFailed, "archive_read_new failed");
        if (archive_read_open_filename(ar_, path.c_str(), kBlockSize) != ARCHIVE_OK) {
            return Result::Fail(Errc::CatalogFailed, "cannot open catalog " + path + ": " + ArchiveError(ar_));
        }
        return Result::Ok();
    }

private:
    archive* ar_ = nullptr;
};

class ArchiveWriter final {
public:
    ArchiveWriter() : aw_(archive_write_new()) {}
    ArchiveWriter(const ArchiveWriter&) = delete;
    ArchiveWriter& operator=(const ArchiveWriter&) = delete;
    ~ArchiveWriter() {
        if (aw_) archive_write_free(aw_);
    }

    archive* get() const { return aw_; }

    Result Open(const std::string& path) {
        if (!aw_) return Result::Fail(Errc::CatalogFailed, "archive_write_new failed");
        if (archive_write_set_format_pax_restricted(aw_) != ARCHIVE_OK) {
            return Result::Fail(Errc::CatalogFailed, "archive_write_set_format_pax_restricted: " + ArchiveError(aw_));
        }
        if (archive_write_open_filename(aw_, path.c_str()) != ARCHIVE_OK) {
            return Result::Fail(Errc::CatalogFailed, "cannot create " + path + ": " + ArchiveError(aw_));
        }
        return Result::Ok();
    }

    Result Close() {
        if (archive_write_close(aw_) != ARCHIVE_OK) {
            return Result::Fail(Errc::CatalogFailed, "archive_write_close: " + ArchiveError(aw_));
        }
        return Result::Ok();
    }

private:
    archive* aw_ = nullptr;
};

class EntryGuard final {
public:
    EntryGuard() : entry_(archive_entry_new()) {}
    EntryGuard(const EntryGuard&) = delete;
    EntryGuard& operator=(const EntryGuard&) = delete;
    ~EntryGuard() {
        if (entry_) archive_entry_free(entry_);
    }

    archive_entry* get() const { return entry_; }

private:
    archive_entry* entry_ = nullptr;
};

// Streams the data of the current entry of `in`; `sink` gets each block.
template <typename Sink>
Result ForEachBlock(archive* in, Sink&& sink) {
    std::array<std::uint8_t, 64 * 1024> buf{};
    while (true) {
        const la_ssize_t n = archive_read_data(in, buf.data(), buf.size());
        if (n == 0) break;
        if (n < 0) {
            return Result::Fail(Errc::CatalogFailed, "archive_read_data: " + ArchiveError(in));
        }
        auto r = sink(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
        if (!r.is_ok()) return r;
    }
    return Result::Ok();
}

Result CopyEntries(archive* in, archive* out, const std::string& skip_name) {
    archive_entry* entry = nullptr;
    while (true) {
        const int r = archive_read_next_header(in, &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK) {
            return Result::Fail(Errc::CatalogFailed, "archive_read_next_header: " + ArchiveError(in));
        }

        const char* name = archive_entry_pathname(entry);
        if (archive_entry_filetype(entry) != AE_IFREG || (name && skip_name == name)) {
            archive_read_data_skip(in);
            continue;
        }

        if (archive_write_header(out, entry) != ARCHIVE_OK) {
            return Result::Fail(Errc::CatalogFailed, "archive_write_header: " + ArchiveError(out));
        }
        auto copy_res = ForEachBlock(in, [out](std::span<const std::uint8_t> block) {
            if (archive_write_data(out, block.data(), block.size()) < 0) {
                return Result::Fail(Errc::CatalogFailed, "archive_write_data: " + ArchiveError(out));
            }
            return Result::Ok();
        });
        if (!copy_res.is_ok()) return copy_res;
    }
    return Result::Ok();
}

Result AppendEntry(archive* out, const std::string& name, std::span<const std::uint8_t> bytes) {
    EntryGuard hdr;
    if (!hdr.get()) return Result::Fail(Errc::CatalogFailed, "archive_entry_new failed");

    archive_entry_set_pathname(hdr.get(), name.c_str());
    archive_entry_set_filetype(hdr.get(), AE_IFREG);
    archive_entry_set_perm(hdr.get(), 0755);
    archive_entry_set_size(hdr.get(), static_cast<la_int64_t>(bytes.size()));
    archive_entry_set_mtime(hdr.get(), std::time(nullptr), 0);

    if (archive_write_header(out, hdr.get()) != ARCHIVE_OK) {
        return Result::Fail(Errc::CatalogFailed, "archive_write_header: " + ArchiveError(out));
    }
    if (!bytes.empty() && archive_write_data(out, bytes.data(), bytes.size()) < 0) {
        return Result::Fail(Errc::CatalogFailed, "archive_write_data: " + ArchiveError(out));
    }
    return Result::Ok();
}

} // namespace

Result TarCatalog::Record(const std::string& catalog_path,
                          const std::string& name,
                          std::span<const std::uint8_t> bytes) {
    if (name.empty()) return Result::Fail(Errc::InvalidArgument, "catalog entry name is empty");

    FileLock lock;
    auto lock_res = FileLock::Acquire(LockPathFor(catalog_path).string(), FileLock::Mode::Exclusive, lock);
    if (!lock_res.is_ok()) return lock_res;

    const std::string tmp_path = catalog_path + ".tmp";
    {
        ArchiveWriter writer;
        auto open_res = writer.Open(tmp_path);
        if (!open_res.is_ok()) {
            ::unlink(tmp_path.c_str());
            return open_res;
        }

        std::error_code ec;
        if (fs::exists(catalog_path, ec)) {
            ArchiveReader reader;
            auto r = reader.Open(catalog_path);
            if (r.is_ok()) r = CopyEntries(reader.get(), writer.get(), name);
            if (!r.is_ok()) {
                ::unlink(tmp_path.c_str());
                return r;
            }
        }

        auto r = AppendEntry(writer.get(), name, bytes);
        if (r.is_ok()) r = writer.Close();
        if (!r.is_ok()) {
            ::unlink(tmp_path.c_str());
            return r;
        }
    }

    if (::rename(tmp_path.c_str(), catalog_path.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp_path.c_str());
        return Result::Fail(Errc::CatalogFailed, "Atomic rename failed: " + std::string(std::strerror(err)), err);
    }

    LogDebug("Catalog %s: recorded %s (%zu bytes)", catalog_path.c_str(), name.c_str(), bytes.size());
    return Result::Ok();
}

Result TarCatalog::List(const std::string& catalog_path, std::vector<CatalogEntry>& out) {
    out.clear();

    std::error_code ec;
    if (!fs::exists(catalog_path, ec)) return Result::Ok();

    FileLock lock;
    auto lock_res = FileLock::Acquire(LockPathFor(catalog_path).string(), FileLock::Mode::Shared, lock);
    if (!lock_res.is_ok() && !IsReadOnlyLockFailure(lock_res)) return lock_res;

    ArchiveReader reader;
    auto open_res = reader.Open(catalog_path);
    if (!open_res.is_ok()) return open_res;

    archive_entry* entry = nullptr;
    while (true) {
        const int r = archive_read_next_header(reader.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK) {
            return Result::Fail(Errc::CatalogFailed, "archive_read_next_header: " + ArchiveError(reader.get()));
        }
        if (archive_entry_filetype(entry) != AE_IFREG) {
            archive_read_data_skip(reader.get());
            continue;
        }

        CatalogEntry ce;
        const char* name = archive_entry_pathname(entry);
        ce.name = name ? std::string(name) : std::string();

        Sha256Hasher hasher;
        auto hash_res = ForEachBlock(reader.get(), [&](std::span<const std::uint8_t> block) {
            hasher.Update(block);
            ce.size += block.size();
            return Result::Ok();
        });
        if (!hash_res.is_ok()) return hash_res;
        ce.sha256 = hasher.FinalHex();
        out.push_back(std::move(ce));
    }
    return Result::Ok();
}

Result TarCatalog::Read(const std::string& catalog_path,
                        const std::string& name,
                        std::vector<std::uint8_t>& out) {
    out.clear();

    FileLock lock;
    auto lock_res = FileLock::Acquire(LockPathFor(catalog_path).string(), FileLock::Mode::Shared, lock);
    if (!lock_res.is_ok() && !IsReadOnlyLockFailure(lock_res)) return lock_res;

    ArchiveReader reader;
    auto open_res = reader.Open(catalog_path);
    if (!open_res.is_ok()) return open_res;

    archive_entry* entry = nullptr;
    while (true) {
        const int r = archive_read_next_header(reader.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK) {
            return Result::Fail(Errc::CatalogFailed, "archive_read_next_header: " + ArchiveError(reader.get()));
        }
        const char* entry_name = archive_entry_pathname(entry);
        if (archive_entry_filetype(entry) != AE_IFREG || !entry_name || name != entry_name) {
            archive_read_data_skip(reader.get());
            continue;
        }
        return ForEachBlock(reader.get(), [&out](std::span<const std::uint8_t> block) {
            out.insert(out.end(), block.begin(), block.end());
            return Result::Ok();
        });
    }
    return Result::Fail(Errc::CatalogFailed, "no catalog entry named '" + name + "'");
}

} // namespace bpm
