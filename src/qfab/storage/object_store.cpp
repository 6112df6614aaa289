#include "qfab/storage/object_store.h"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include <arrow/io/file.h>

#include "qfab/common/logger.h"
#include "qfab/storage/file_data_cache.h"
#include "qfab/storage/file_list.h"
#include "qfab/storage/tmpfs.h"

namespace fs = std::filesystem;

namespace qfab {
namespace storage {

using BufferResult = core::Result<std::shared_ptr<arrow::Buffer>>;
using ListResult = core::Result<std::vector<ObjectMeta>>;

namespace {

core::Result<void> ReadOnlyError(const char* store, const std::string& path) {
    return core::Result<void>::error(std::string(store) + " store is read-only, rejected write to " + path,
                                     core::Error::Code::INVALID_ARGUMENT);
}

// Objects staged under a "{session}/schema={key}/" prefix, in staging order.
// Returns an empty list when the prefix is not a staged key or nothing is
// staged under it.
std::vector<ObjectMeta> ListStaged(const std::string& prefix) {
    std::vector<ObjectMeta> out;
    auto parsed = ParseStagedPath(prefix);
    if (!parsed) {
        return out;
    }
    auto files = FileListRegistry::Instance().Get(parsed->session_id, parsed->schema_key);
    if (!files) {
        return out;
    }
    std::string base = FileListRegistry::MakeKey(parsed->session_id, parsed->schema_key);
    for (const auto& file : *files) {
        if (file.key.compare(0, parsed->file_key.size(), parsed->file_key) != 0) continue;
        out.push_back(ObjectMeta{base + file.key, file.meta.compressed_size});
    }
    return out;
}

BufferResult InvalidRange(const std::string& path, int64_t offset, int64_t length) {
    return BufferResult::error("Invalid range [" + std::to_string(offset) + ", +" + std::to_string(length) +
                                   ") of " + path,
                               core::Error::Code::INVALID_ARGUMENT);
}

// A zero-copy view of the range within an in-memory object
BufferResult SliceRange(const std::shared_ptr<arrow::Buffer>& data, const std::string& path, int64_t offset,
                        int64_t length) {
    if (offset < 0 || length < 0 || offset > data->size()) {
        return InvalidRange(path, offset, length);
    }
    return BufferResult(arrow::SliceBuffer(data, offset, std::min(length, data->size() - offset)));
}

std::optional<int64_t> StagedSize(const StagedPath& path) {
    auto files = FileListRegistry::Instance().Get(path.session_id, path.schema_key);
    if (!files) return std::nullopt;
    for (const auto& file : *files) {
        if (file.key == path.file_key) return file.meta.compressed_size;
    }
    return std::nullopt;
}

} // namespace

std::optional<StagedPath> ParseStagedPath(const std::string& raw) {
    std::string path = raw;
    while (!path.empty() && path.front() == '/') path.erase(0, 1);
    static const std::string kMarker = "/schema=";
    auto marker = path.find(kMarker);
    if (marker == std::string::npos || marker == 0) {
        return std::nullopt;
    }
    StagedPath out;
    out.session_id = path.substr(0, marker);
    auto key_begin = marker + kMarker.size();
    auto key_end = path.find('/', key_begin);
    if (key_end == std::string::npos) {
        out.schema_key = path.substr(key_begin);
    } else {
        out.schema_key = path.substr(key_begin, key_end - key_begin);
        out.file_key = path.substr(key_end + 1);
    }
    if (out.schema_key.empty()) {
        return std::nullopt;
    }
    return out;
}

// ---------------------------------------------------------------------------
// LocalObjectStore
// ---------------------------------------------------------------------------

LocalObjectStore::LocalObjectStore(std::string root) : root_(std::move(root)) {
    if (root_.empty()) root_ = ".";
}

std::string LocalObjectStore::FullPath(const std::string& path) const {
    std::string rel = path;
    while (!rel.empty() && rel.front() == '/') rel.erase(0, 1);
    return (fs::path(root_) / rel).string();
}

BufferResult LocalObjectStore::Get(const std::string& path) const {
    std::string full = FullPath(path);
    std::error_code ec;
    if (!fs::is_regular_file(full, ec)) {
        return BufferResult::error("Object not found: " + full, core::Error::Code::NOT_FOUND);
    }
    auto file = arrow::io::ReadableFile::Open(full);
    if (!file.ok()) {
        return BufferResult::error("Failed to open " + full + ": " + file.status().ToString(),
                                   core::Error::Code::INTERNAL);
    }
    auto infile = *file;
    auto size = infile->GetSize();
    if (!size.ok()) {
        return BufferResult::error("Failed to size " + full + ": " + size.status().ToString(),
                                   core::Error::Code::INTERNAL);
    }
    auto data = infile->Read(*size);
    auto close_status = infile->Close();
    if (!data.ok()) {
        return BufferResult::error("Failed to read " + full + ": " + data.status().ToString(),
                                   core::Error::Code::INTERNAL);
    }
    if (!close_status.ok()) {
        QFAB_WARN("[object_store] Failed to close {}: {}", full, close_status.ToString());
    }
    return BufferResult(*data);
}

BufferResult LocalObjectStore::GetRange(const std::string& path, int64_t offset, int64_t length) const {
    if (offset < 0 || length < 0) {
        return InvalidRange(path, offset, length);
    }
    std::string full = FullPath(path);
    std::error_code ec;
    if (!fs::is_regular_file(full, ec)) {
        return BufferResult::error("Object not found: " + full, core::Error::Code::NOT_FOUND);
    }
    auto file = arrow::io::ReadableFile::Open(full);
    if (!file.ok()) {
        return BufferResult::error("Failed to open " + full + ": " + file.status().ToString(),
                                   core::Error::Code::INTERNAL);
    }
    auto infile = *file;
    auto size = infile->GetSize();
    if (!size.ok()) {
        return BufferResult::error("Failed to size " + full + ": " + size.status().ToString(),
                                   core::Error::Code::INTERNAL);
    }
    if (offset > *size) {
        return InvalidRange(path, offset, length);
    }
    auto data = infile->ReadAt(offset, std::min(length, *size - offset));
    auto close_status = infile->Close();
    if (!data.ok()) {
        return BufferResult::error("Failed to read " + full + ": " + data.status().ToString(),
                                   core::Error::Code::INTERNAL);
    }
    if (!close_status.ok()) {
        QFAB_WARN("[object_store] Failed to close {}: {}", full, close_status.ToString());
    }
    return BufferResult(*data);
}

core::Result<ObjectMeta> LocalObjectStore::Head(const std::string& path) const {
    std::string full = FullPath(path);
    std::error_code ec;
    auto size = fs::file_size(full, ec);
    if (ec) {
        return core::Result<ObjectMeta>::error("Object not found: " + full, core::Error::Code::NOT_FOUND);
    }
    return core::Result<ObjectMeta>(ObjectMeta{path, static_cast<int64_t>(size)});
}

ListResult LocalObjectStore::List(const std::string& prefix) const {
    std::vector<ObjectMeta> out;
    std::string rel_prefix = prefix;
    while (!rel_prefix.empty() && rel_prefix.front() == '/') rel_prefix.erase(0, 1);

    // Walk the deepest directory the prefix names, then filter by prefix
    std::string dir_part = rel_prefix.substr(0, rel_prefix.rfind('/') == std::string::npos
                                                    ? 0 : rel_prefix.rfind('/') + 1);
    fs::path start = fs::path(root_) / dir_part;
    std::error_code ec;
    if (!fs::is_directory(start, ec)) {
        return ListResult(std::move(out));
    }
    fs::path root_path(root_);
    for (fs::recursive_directory_iterator it(start, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        std::string rel = fs::relative(it->path(), root_path, ec).generic_string();
        if (ec) break;
        if (rel.compare(0, rel_prefix.size(), rel_prefix) != 0) continue;
        out.push_back(ObjectMeta{rel, static_cast<int64_t>(it->file_size(ec))});
    }
    if (ec) {
        return ListResult::error("Failed to list " + start.string() + ": " + ec.message(),
                                 core::Error::Code::INTERNAL);
    }
    std::sort(out.begin(), out.end(),
              [](const ObjectMeta& a, const ObjectMeta& b) { return a.location < b.location; });
    return ListResult(std::move(out));
}

core::Result<void> LocalObjectStore::Put(const std::string& path, const std::shared_ptr<arrow::Buffer>& data) {
    std::string full = FullPath(path);
    std::error_code ec;
    fs::create_directories(fs::path(full).parent_path(), ec);
    if (ec) {
        return core::Result<void>::error("Failed to create directory for " + full + ": " + ec.message(),
                                         core::Error::Code::INTERNAL);
    }
    auto out = arrow::io::FileOutputStream::Open(full);
    if (!out.ok()) {
        return core::Result<void>::error("Failed to open " + full + ": " + out.status().ToString(),
                                         core::Error::Code::INTERNAL);
    }
    auto status = (*out)->Write(data);
    if (status.ok()) status = (*out)->Close();
    if (!status.ok()) {
        return core::Result<void>::error("Failed to write " + full + ": " + status.ToString(),
                                         core::Error::Code::INTERNAL);
    }
    return core::Result<void>();
}

core::Result<void> LocalObjectStore::Delete(const std::string& path) {
    std::string full = FullPath(path);
    std::error_code ec;
    if (!fs::remove(full, ec)) {
        if (ec) {
            return core::Result<void>::error("Failed to delete " + full + ": " + ec.message(),
                                             core::Error::Code::INTERNAL);
        }
        return core::Result<void>::error("Object not found: " + full, core::Error::Code::NOT_FOUND);
    }
    return core::Result<void>();
}

// ---------------------------------------------------------------------------
// MemoryStore
// ---------------------------------------------------------------------------

MemoryStore::MemoryStore(std::shared_ptr<LocalObjectStore> durable) : durable_(std::move(durable)) {}

BufferResult MemoryStore::Get(const std::string& path) const {
    auto parsed = ParseStagedPath(path);
    if (!parsed || parsed->file_key.empty()) {
        return BufferResult::error("Not a staged memory path: " + path, core::Error::Code::NOT_FOUND);
    }
    auto& cache = FileDataCache::Instance();
    if (auto cached = cache.Get(parsed->file_key)) {
        return BufferResult(std::move(cached));
    }
    if (!durable_) {
        return BufferResult::error("Object not cached and no durable store: " + parsed->file_key,
                                   core::Error::Code::NOT_FOUND);
    }
    auto fetched = durable_->Get(parsed->file_key);
    if (!fetched.ok()) {
        return fetched;
    }
    cache.Put(parsed->file_key, fetched.value());
    return fetched;
}

BufferResult MemoryStore::GetRange(const std::string& path, int64_t offset, int64_t length) const {
    auto parsed = ParseStagedPath(path);
    if (!parsed || parsed->file_key.empty()) {
        return BufferResult::error("Not a staged memory path: " + path, core::Error::Code::NOT_FOUND);
    }
    if (auto cached = FileDataCache::Instance().Get(parsed->file_key)) {
        return SliceRange(cached, path, offset, length);
    }
    if (!durable_) {
        return BufferResult::error("Object not cached and no durable store: " + parsed->file_key,
                                   core::Error::Code::NOT_FOUND);
    }
    return durable_->GetRange(parsed->file_key, offset, length);
}

core::Result<ObjectMeta> MemoryStore::Head(const std::string& path) const {
    auto parsed = ParseStagedPath(path);
    if (!parsed || parsed->file_key.empty()) {
        return core::Result<ObjectMeta>::error("Not a staged memory path: " + path, core::Error::Code::NOT_FOUND);
    }
    if (auto size = StagedSize(*parsed)) {
        return core::Result<ObjectMeta>(ObjectMeta{path, *size});
    }
    auto data = Get(path);
    if (!data.ok()) {
        return core::Result<ObjectMeta>::error(data);
    }
    return core::Result<ObjectMeta>(ObjectMeta{path, data.value()->size()});
}

ListResult MemoryStore::List(const std::string& prefix) const {
    return ListResult(ListStaged(prefix));
}

core::Result<void> MemoryStore::Put(const std::string& path, const std::shared_ptr<arrow::Buffer>&) {
    return ReadOnlyError(name(), path);
}

core::Result<void> MemoryStore::Delete(const std::string& path) {
    return ReadOnlyError(name(), path);
}

// ---------------------------------------------------------------------------
// WalStore
// ---------------------------------------------------------------------------

WalStore::WalStore(std::string wal_dir) : disk_(std::move(wal_dir)) {}

BufferResult WalStore::Get(const std::string& path) const {
    auto parsed = ParseStagedPath(path);
    if (!parsed || parsed->file_key.empty()) {
        return BufferResult::error("Not a staged wal path: " + path, core::Error::Code::NOT_FOUND);
    }
    return disk_.Get(parsed->file_key);
}

BufferResult WalStore::GetRange(const std::string& path, int64_t offset, int64_t length) const {
    auto parsed = ParseStagedPath(path);
    if (!parsed || parsed->file_key.empty()) {
        return BufferResult::error("Not a staged wal path: " + path, core::Error::Code::NOT_FOUND);
    }
    return disk_.GetRange(parsed->file_key, offset, length);
}

core::Result<ObjectMeta> WalStore::Head(const std::string& path) const {
    auto parsed = ParseStagedPath(path);
    if (!parsed || parsed->file_key.empty()) {
        return core::Result<ObjectMeta>::error("Not a staged wal path: " + path, core::Error::Code::NOT_FOUND);
    }
    if (auto size = StagedSize(*parsed)) {
        return core::Result<ObjectMeta>(ObjectMeta{path, *size});
    }
    auto meta = disk_.Head(parsed->file_key);
    if (!meta.ok()) {
        return meta;
    }
    return core::Result<ObjectMeta>(ObjectMeta{path, meta.value().size});
}

ListResult WalStore::List(const std::string& prefix) const {
    return ListResult(ListStaged(prefix));
}

core::Result<void> WalStore::Put(const std::string& path, const std::shared_ptr<arrow::Buffer>&) {
    return ReadOnlyError(name(), path);
}

core::Result<void> WalStore::Delete(const std::string& path) {
    return ReadOnlyError(name(), path);
}

// ---------------------------------------------------------------------------
// TmpfsStore
// ---------------------------------------------------------------------------

namespace {
std::string StripLeadingSlash(const std::string& path) {
    size_t i = 0;
    while (i < path.size() && path[i] == '/') i++;
    return path.substr(i);
}
} // namespace

BufferResult TmpfsStore::Get(const std::string& path) const {
    auto data = Tmpfs::Instance().Get(StripLeadingSlash(path));
    if (!data) {
        return BufferResult::error("Object not found in tmpfs: " + path, core::Error::Code::NOT_FOUND);
    }
    return BufferResult(std::move(data));
}

BufferResult TmpfsStore::GetRange(const std::string& path, int64_t offset, int64_t length) const {
    auto data = Tmpfs::Instance().Get(StripLeadingSlash(path));
    if (!data) {
        return BufferResult::error("Object not found in tmpfs: " + path, core::Error::Code::NOT_FOUND);
    }
    return SliceRange(data, path, offset, length);
}

core::Result<ObjectMeta> TmpfsStore::Head(const std::string& path) const {
    auto data = Tmpfs::Instance().Get(StripLeadingSlash(path));
    if (!data) {
        return core::Result<ObjectMeta>::error("Object not found in tmpfs: " + path, core::Error::Code::NOT_FOUND);
    }
    return core::Result<ObjectMeta>(ObjectMeta{StripLeadingSlash(path), data->size()});
}

ListResult TmpfsStore::List(const std::string& prefix) const {
    std::vector<ObjectMeta> out;
    for (auto& [location, size] : Tmpfs::Instance().List(StripLeadingSlash(prefix))) {
        out.push_back(ObjectMeta{location, size});
    }
    return ListResult(std::move(out));
}

core::Result<void> TmpfsStore::Put(const std::string& path, const std::shared_ptr<arrow::Buffer>& data) {
    Tmpfs::Instance().Put(StripLeadingSlash(path), data);
    return core::Result<void>();
}

core::Result<void> TmpfsStore::Delete(const std::string& path) {
    if (!Tmpfs::Instance().Delete(StripLeadingSlash(path))) {
        return core::Result<void>::error("Object not found in tmpfs: " + path, core::Error::Code::NOT_FOUND);
    }
    return core::Result<void>();
}

} // namespace storage
} // namespace qfab
