#include <sweep/storage/metadata_store.hpp>
#include <sweep/util/crc32.hpp>

#include <algorithm>
#include <cstring>
#include <iterator>
#include <mutex>

namespace sweep {

namespace {

constexpr size_t HEADER_SIZE = 8;         // magic + version
constexpr size_t RECORD_PREFIX_SIZE = 8;  // len + crc32

void append_u32(std::string& out, uint32_t v) {
    char buf[4];
    std::memcpy(buf, &v, 4);
    out.append(buf, 4);
}

void append_u64(std::string& out, uint64_t v) {
    char buf[8];
    std::memcpy(buf, &v, 8);
    out.append(buf, 8);
}

// Bounds-checked cursor over a decoded buffer
class Reader {
public:
    Reader(const char* data, size_t len) : data_(data), len_(len) {}

    bool read_u32(uint32_t& v) { return read_raw(&v, 4); }
    bool read_u64(uint64_t& v) { return read_raw(&v, 8); }

    bool read_string(std::string& s) {
        uint32_t n = 0;
        if (!read_u32(n)) return false;
        if (n > len_ - offset_) return false;
        s.assign(data_ + offset_, n);
        offset_ += n;
        return true;
    }

    bool at_end() const { return offset_ == len_; }

private:
    bool read_raw(void* out, size_t n) {
        if (n > len_ - offset_) return false;
        std::memcpy(out, data_ + offset_, n);
        offset_ += n;
        return true;
    }

    const char* data_;
    size_t len_;
    size_t offset_ = 0;
};

std::string journal_header() {
    std::string header;
    append_u32(header, MetadataStore::JOURNAL_MAGIC);
    append_u32(header, MetadataStore::JOURNAL_VERSION);
    return header;
}

}  // namespace

MetadataStore::MetadataStore(fs::path journal_path, std::shared_ptr<Logger> logger)
    : journal_path_(std::move(journal_path))
    , logger_(logger_or_null(std::move(logger))) {}

MetadataStore::~MetadataStore() {
    close();
}

Result<std::unique_ptr<MetadataStore>> MetadataStore::open(const fs::path& journal_path,
                                                           std::shared_ptr<Logger> logger) {
    if (journal_path.empty()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Journal path is empty");
    }

    std::unique_ptr<MetadataStore> store(new MetadataStore(journal_path, std::move(logger)));
    store->persistent_ = true;

    std::error_code ec;
    if (journal_path.has_parent_path()) {
        fs::create_directories(journal_path.parent_path(), ec);
        if (ec) {
            return error_from_code(ec, "create " + journal_path.parent_path().string());
        }
    }

    auto replayed = store->replay();
    if (!replayed.ok()) {
        return replayed.error();
    }

    store->is_open_ = true;
    store->logger_->debug("Metadata journal opened at " + journal_path.string() +
                          " (" + std::to_string(store->rows_.size()) + " entries)");
    return store;
}

std::unique_ptr<MetadataStore> MetadataStore::open_in_memory() {
    std::unique_ptr<MetadataStore> store(new MetadataStore(fs::path(), nullptr));
    store->is_open_ = true;
    return store;
}

void MetadataStore::close() {
    std::unique_lock lock(mutex_);
    if (!is_open_) return;

    if (journal_.is_open()) {
        journal_.flush();
        journal_.close();
    }
    is_open_ = false;
}

// =============================================================================
// Encoding
// =============================================================================

std::string MetadataStore::encode_put(const CacheEntry& entry) {
    std::string payload;
    payload.reserve(4 + entry.path.size() + 24);
    append_u32(payload, static_cast<uint32_t>(entry.path.size()));
    payload.append(entry.path);
    append_u64(payload, entry.size);
    append_u64(payload, static_cast<uint64_t>(entry.mtime_ns));
    append_u64(payload, static_cast<uint64_t>(entry.last_checked_ns));
    return payload;
}

std::string MetadataStore::encode_erase(const std::string& path) {
    std::string payload;
    append_u32(payload, static_cast<uint32_t>(path.size()));
    payload.append(path);
    return payload;
}

// =============================================================================
// Journal I/O
// =============================================================================

Result<void> MetadataStore::open_for_append() {
    journal_.open(journal_path_, std::ios::out | std::ios::binary | std::ios::app);
    if (!journal_.is_open()) {
        return Error(ErrorCode::IO_ERROR, "Failed to open journal " + journal_path_.string());
    }
    return Ok();
}

Result<void> MetadataStore::replay() {
    std::string data;
    {
        std::ifstream in(journal_path_, std::ios::binary);
        if (in.is_open()) {
            data.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        }
    }

    if (data.empty()) {
        // New journal
        std::ofstream out(journal_path_, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return Error(ErrorCode::IO_ERROR, "Failed to create journal " + journal_path_.string());
        }
        const std::string header = journal_header();
        out.write(header.data(), static_cast<std::streamsize>(header.size()));
        if (!out.good()) {
            return Error(ErrorCode::IO_ERROR, "Failed to write journal " + journal_path_.string());
        }
        out.close();
        return open_for_append();
    }

    bool corrupt = false;
    size_t total_records = 0;

    Reader header(data.data(), std::min(data.size(), HEADER_SIZE));
    uint32_t magic = 0;
    uint32_t version = 0;
    if (!header.read_u32(magic) || !header.read_u32(version) ||
        magic != JOURNAL_MAGIC || version != JOURNAL_VERSION) {
        logger_->warning("Metadata journal " + journal_path_.string() +
                         " has an invalid header, starting empty");
        corrupt = true;
    }

    size_t offset = HEADER_SIZE;
    while (!corrupt && offset < data.size()) {
        if (data.size() - offset < RECORD_PREFIX_SIZE) {
            corrupt = true;
            break;
        }

        uint32_t len = 0;
        uint32_t crc = 0;
        std::memcpy(&len, data.data() + offset, 4);
        std::memcpy(&crc, data.data() + offset + 4, 4);
        const size_t body_offset = offset + RECORD_PREFIX_SIZE;

        if (len == 0 || len > data.size() - body_offset) {
            corrupt = true;
            break;
        }
        if (Crc32::of(data.data() + body_offset, len) != crc) {
            corrupt = true;
            break;
        }

        const auto type = static_cast<JournalRecordType>(data[body_offset]);
        Reader payload(data.data() + body_offset + 1, len - 1);

        if (type == JournalRecordType::PUT) {
            CacheEntry entry;
            uint64_t mtime = 0;
            uint64_t checked = 0;
            if (!payload.read_string(entry.path) || !payload.read_u64(entry.size) ||
                !payload.read_u64(mtime) || !payload.read_u64(checked) || !payload.at_end()) {
                corrupt = true;
                break;
            }
            entry.mtime_ns = static_cast<int64_t>(mtime);
            entry.last_checked_ns = static_cast<int64_t>(checked);
            rows_[entry.path] = entry;
        } else if (type == JournalRecordType::ERASE) {
            std::string path;
            if (!payload.read_string(path) || !payload.at_end()) {
                corrupt = true;
                break;
            }
            rows_.erase(path);
        } else {
            corrupt = true;
            break;
        }

        ++total_records;
        offset = body_offset + len;
    }

    dead_records_ = total_records > rows_.size() ? total_records - rows_.size() : 0;

    if (corrupt) {
        recovered_ = true;
        logger_->warning("Metadata journal " + journal_path_.string() +
                         " is damaged at offset " + std::to_string(offset) +
                         ", keeping " + std::to_string(rows_.size()) + " entries");
        return compact_locked();
    }

    auto opened = open_for_append();
    if (!opened.ok()) {
        return opened;
    }

    maybe_compact_locked();
    return Ok();
}

Result<void> MetadataStore::append_record(JournalRecordType type, const std::string& payload) {
    if (!persistent_) return Ok();

    std::string body;
    body.reserve(1 + payload.size());
    body.push_back(static_cast<char>(type));
    body.append(payload);

    std::string record;
    record.reserve(RECORD_PREFIX_SIZE + body.size());
    append_u32(record, static_cast<uint32_t>(body.size()));
    append_u32(record, Crc32::of(body));
    record.append(body);

    journal_.write(record.data(), static_cast<std::streamsize>(record.size()));
    if (!journal_.good()) {
        journal_.clear();
        return Error(ErrorCode::IO_ERROR, "Failed to append to journal " + journal_path_.string());
    }
    return Ok();
}

Result<void> MetadataStore::compact_locked() {
    if (!persistent_) {
        dead_records_ = 0;
        return Ok();
    }

    if (journal_.is_open()) {
        journal_.close();
    }

    fs::path tmp_path = journal_path_;
    tmp_path += ".compact";

    {
        std::ofstream out(tmp_path, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return Error(ErrorCode::IO_ERROR, "Failed to create " + tmp_path.string());
        }

        const std::string header = journal_header();
        out.write(header.data(), static_cast<std::streamsize>(header.size()));

        for (const auto& [key, entry] : rows_) {
            std::string body;
            body.push_back(static_cast<char>(JournalRecordType::PUT));
            body.append(encode_put(entry));

            std::string record;
            append_u32(record, static_cast<uint32_t>(body.size()));
            append_u32(record, Crc32::of(body));
            record.append(body);
            out.write(record.data(), static_cast<std::streamsize>(record.size()));
        }

        out.flush();
        if (!out.good()) {
            return Error(ErrorCode::IO_ERROR, "Failed to write " + tmp_path.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, journal_path_, ec);
    if (ec) {
        fs::remove(tmp_path, ec);
        return error_from_code(ec, "rename " + tmp_path.string());
    }

    dead_records_ = 0;
    return open_for_append();
}

void MetadataStore::maybe_compact_locked() {
    if (dead_records_ < COMPACTION_MIN_DEAD || dead_records_ <= rows_.size()) {
        return;
    }
    auto result = compact_locked();
    if (!result.ok()) {
        logger_->warning("Metadata journal compaction failed: " + result.error().to_string());
    }
}

// =============================================================================
// Table operations
// =============================================================================

std::optional<CacheEntry> MetadataStore::get(const std::string& path) const {
    std::shared_lock lock(mutex_);
    auto it = rows_.find(path);
    if (it == rows_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<void> MetadataStore::put(const CacheEntry& entry) {
    std::unique_lock lock(mutex_);
    if (!is_open_) {
        return Error(ErrorCode::STORE_NOT_OPEN, "Store is not open");
    }

    auto appended = append_record(JournalRecordType::PUT, encode_put(entry));
    if (!appended.ok()) {
        return appended;
    }

    if (!rows_.insert_or_assign(entry.path, entry).second) {
        ++dead_records_;
    }
    maybe_compact_locked();
    return Ok();
}

Result<bool> MetadataStore::erase(const std::string& path) {
    std::unique_lock lock(mutex_);
    if (!is_open_) {
        return Error(ErrorCode::STORE_NOT_OPEN, "Store is not open");
    }

    auto it = rows_.find(path);
    if (it == rows_.end()) {
        return false;
    }

    auto appended = append_record(JournalRecordType::ERASE, encode_erase(path));
    if (!appended.ok()) {
        return appended.error();
    }

    rows_.erase(it);
    // The PUT and the ERASE record are both dead now
    dead_records_ += 2;
    maybe_compact_locked();
    return true;
}

Result<void> MetadataStore::clear() {
    std::unique_lock lock(mutex_);
    if (!is_open_) {
        return Error(ErrorCode::STORE_NOT_OPEN, "Store is not open");
    }
    rows_.clear();
    return compact_locked();
}

std::vector<std::string> MetadataStore::keys() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> result;
    result.reserve(rows_.size());
    for (const auto& [key, entry] : rows_) {
        result.push_back(key);
    }
    return result;
}

std::vector<CacheEntry> MetadataStore::entries() const {
    std::shared_lock lock(mutex_);
    std::vector<CacheEntry> result;
    result.reserve(rows_.size());
    for (const auto& [key, entry] : rows_) {
        result.push_back(entry);
    }
    return result;
}

bool MetadataStore::is_open() const {
    std::shared_lock lock(mutex_);
    return is_open_;
}

size_t MetadataStore::size() const {
    std::shared_lock lock(mutex_);
    return rows_.size();
}

size_t MetadataStore::dead_record_count() const {
    std::shared_lock lock(mutex_);
    return dead_records_;
}

Result<void> MetadataStore::flush() {
    std::unique_lock lock(mutex_);
    if (!is_open_) {
        return Error(ErrorCode::STORE_NOT_OPEN, "Store is not open");
    }
    if (!persistent_) return Ok();

    journal_.flush();
    if (!journal_.good()) {
        journal_.clear();
        return Error(ErrorCode::IO_ERROR, "Failed to flush journal " + journal_path_.string());
    }
    return Ok();
}

Result<void> MetadataStore::compact() {
    std::unique_lock lock(mutex_);
    if (!is_open_) {
        return Error(ErrorCode::STORE_NOT_OPEN, "Store is not open");
    }
    return compact_locked();
}

}  // namespace sweep
