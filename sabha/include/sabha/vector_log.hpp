#pragma once
// Vector Log: the durable half of the vector index
//
// Design:
// - Append-only: one checksummed entry per record (id + float vector)
// - Exclusive flock for the lifetime of the writer
// - Crash recovery: replay valid entries, truncate a torn tail
// - Rollback: truncate back to the offset an append started at
// - Compaction: write live entries to a locked temp file, rename over
//
// The HNSW graph is rebuilt from this log at open.

#include "types.hpp"
#include <cerrno>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <sys/file.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace sabha {

constexpr uint32_t VECTOR_LOG_MAGIC = 0x5342564C;    // "SBVL"
constexpr uint32_t VECTOR_LOG_VERSION = 1;
constexpr uint32_t VECTOR_ENTRY_MAGIC = 0x56454354;  // "VECT"

struct VectorLogHeader {
    uint32_t magic;
    uint32_t version;
    uint32_t dimension;
    uint32_t reserved;
};
static_assert(sizeof(VectorLogHeader) == 16, "VectorLogHeader must be 16 bytes");

struct VectorEntryHeader {
    uint32_t magic;       // VECTOR_ENTRY_MAGIC
    uint32_t length;      // Payload bytes (dimension * sizeof(float))
    uint64_t sequence;    // Monotonic sequence number
    uint64_t id_high;
    uint64_t id_low;
    uint32_t checksum;    // CRC32 of id + payload
    uint8_t reserved[4];
};
static_assert(sizeof(VectorEntryHeader) == 40, "VectorEntryHeader must be 40 bytes");

struct VectorEntry {
    RecordId id;
    std::vector<float> vector;
};

struct ReplayResult {
    std::vector<VectorEntry> entries;
    size_t torn_bytes = 0;   // Bytes dropped from an incomplete tail
};

// RAII file lock
class ScopedFileLock {
public:
    ScopedFileLock() = default;
    ~ScopedFileLock() { release(); }

    ScopedFileLock(const ScopedFileLock&) = delete;
    ScopedFileLock& operator=(const ScopedFileLock&) = delete;

    bool acquire(int fd) {
        release();
        if (fd < 0) return false;
        if (flock(fd, LOCK_EX | LOCK_NB) != 0) return false;
        fd_ = fd;
        return true;
    }

    void release() {
        if (fd_ >= 0) {
            flock(fd_, LOCK_UN);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

inline uint32_t entry_checksum(const RecordId& id, const float* data, size_t n) {
    uint32_t crc = crc32(reinterpret_cast<const uint8_t*>(&id.high), sizeof(id.high));
    crc = crc32(reinterpret_cast<const uint8_t*>(&id.low), sizeof(id.low), crc);
    return crc32(reinterpret_cast<const uint8_t*>(data), n * sizeof(float), crc);
}

class VectorLog {
public:
    VectorLog() = default;
    ~VectorLog() { close(); }

    VectorLog(const VectorLog&) = delete;
    VectorLog& operator=(const VectorLog&) = delete;

    // Open or create. On failure returns false and fills error.
    bool open(const std::string& path, size_t dimension, std::string& error) {
        close();
        path_ = path;
        dimension_ = dimension;

        struct stat st;
        if (::stat(path.c_str(), &st) != 0) {
            if (!write_header_file(path, dimension)) {
                error = "cannot create vector log " + path + ": " + std::strerror(errno);
                return false;
            }
        }

        fd_ = ::open(path.c_str(), O_RDWR);
        if (fd_ < 0) {
            error = "cannot open vector log " + path + ": " + std::strerror(errno);
            return false;
        }
        if (!lock_.acquire(fd_)) {
            error = "vector log " + path + " is locked by another writer";
            close();
            return false;
        }

        VectorLogHeader header{};
        if (::pread(fd_, &header, sizeof(header), 0) != static_cast<ssize_t>(sizeof(header))) {
            error = "vector log " + path + " has a truncated header";
            close();
            return false;
        }
        if (header.magic != VECTOR_LOG_MAGIC || header.version != VECTOR_LOG_VERSION) {
            error = "vector log " + path + " has an unknown format";
            close();
            return false;
        }
        if (header.dimension != dimension) {
            error = "vector log " + path + " holds dimension " +
                    std::to_string(header.dimension) + ", configured " +
                    std::to_string(dimension);
            close();
            return false;
        }
        return true;
    }

    void close() {
        lock_.release();
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    bool is_open() const { return fd_ >= 0; }
    const std::string& path() const { return path_; }

    // Read every valid entry. A torn or corrupt tail is truncated away.
    ReplayResult replay() {
        ReplayResult result;
        if (fd_ < 0) return result;

        off_t end = ::lseek(fd_, 0, SEEK_END);
        off_t pos = sizeof(VectorLogHeader);
        const size_t expected = dimension_ * sizeof(float);

        while (pos + static_cast<off_t>(sizeof(VectorEntryHeader)) <= end) {
            VectorEntryHeader h{};
            if (::pread(fd_, &h, sizeof(h), pos) != static_cast<ssize_t>(sizeof(h))) break;
            if (h.magic != VECTOR_ENTRY_MAGIC || h.length != expected) break;
            if (pos + static_cast<off_t>(sizeof(h) + h.length) > end) break;

            VectorEntry entry;
            entry.id = RecordId{h.id_high, h.id_low};
            entry.vector.resize(dimension_);
            if (::pread(fd_, entry.vector.data(), h.length, pos + sizeof(h)) !=
                static_cast<ssize_t>(h.length)) break;
            if (entry_checksum(entry.id, entry.vector.data(), dimension_) != h.checksum) break;

            sequence_ = std::max(sequence_, h.sequence);
            result.entries.push_back(std::move(entry));
            pos += sizeof(h) + h.length;
        }

        if (pos < end) {
            result.torn_bytes = static_cast<size_t>(end - pos);
            if (::ftruncate(fd_, pos) != 0) {
                std::cerr << "[VectorLog] Failed to truncate torn tail of " << path_ << "\n";
            }
        }
        return result;
    }

    // Append and fsync. Returns the offset the entry starts at, for rollback.
    std::optional<uint64_t> append(const RecordId& id, const std::vector<float>& vector) {
        if (fd_ < 0 || vector.size() != dimension_) return std::nullopt;

        off_t start = ::lseek(fd_, 0, SEEK_END);
        if (start < 0) return std::nullopt;

        VectorEntryHeader h{};
        h.magic = VECTOR_ENTRY_MAGIC;
        h.length = static_cast<uint32_t>(vector.size() * sizeof(float));
        h.sequence = ++sequence_;
        h.id_high = id.high;
        h.id_low = id.low;
        h.checksum = entry_checksum(id, vector.data(), vector.size());

        std::vector<uint8_t> buf(sizeof(h) + h.length);
        std::memcpy(buf.data(), &h, sizeof(h));
        std::memcpy(buf.data() + sizeof(h), vector.data(), h.length);

        if (!write_all(fd_, buf.data(), buf.size(), start) || ::fsync(fd_) != 0) {
            truncate_to(static_cast<uint64_t>(start));
            return std::nullopt;
        }
        return static_cast<uint64_t>(start);
    }

    // Undo appends past offset
    bool truncate_to(uint64_t offset) {
        if (fd_ < 0) return false;
        if (::ftruncate(fd_, static_cast<off_t>(offset)) != 0) return false;
        return ::fsync(fd_) == 0;
    }

    // Replace the log with exactly these entries. The replacement is locked
    // before it is renamed over the path, so the path is never unlocked.
    // On failure the current log stays open and unchanged.
    bool rewrite(const std::vector<VectorEntry>& entries) {
        if (fd_ < 0) return false;
        const size_t dim = dimension_;
        const std::string tmp = path_ + ".tmp." + std::to_string(::getpid());

        int next = ::open(tmp.c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
        if (next < 0) return false;
        auto discard = [&](const char* what) {
            std::cerr << "[VectorLog] Compaction " << what << " failed: " << std::strerror(errno) << "\n";
            ::close(next);
            ::remove(tmp.c_str());
            return false;
        };
        if (flock(next, LOCK_EX | LOCK_NB) != 0) return discard("lock");

        VectorLogHeader header{VECTOR_LOG_MAGIC, VECTOR_LOG_VERSION, static_cast<uint32_t>(dim), 0};
        off_t offset = 0;
        if (!write_all(next, reinterpret_cast<const uint8_t*>(&header), sizeof(header), offset)) {
            return discard("write");
        }
        offset += sizeof(header);

        uint64_t seq = 0;
        std::vector<uint8_t> buf(sizeof(VectorEntryHeader) + dim * sizeof(float));
        for (const auto& e : entries) {
            if (e.vector.size() != dim) return discard("dimension check");
            VectorEntryHeader h{};
            h.magic = VECTOR_ENTRY_MAGIC;
            h.length = static_cast<uint32_t>(dim * sizeof(float));
            h.sequence = ++seq;
            h.id_high = e.id.high;
            h.id_low = e.id.low;
            h.checksum = entry_checksum(e.id, e.vector.data(), dim);
            std::memcpy(buf.data(), &h, sizeof(h));
            std::memcpy(buf.data() + sizeof(h), e.vector.data(), h.length);
            if (!write_all(next, buf.data(), buf.size(), offset)) return discard("write");
            offset += static_cast<off_t>(buf.size());
        }
        if (::fsync(next) != 0) return discard("fsync");
        if (::rename(tmp.c_str(), path_.c_str()) != 0) return discard("rename");
        fsync_dir(path_);

        // Closing the old descriptor drops the old inode's lock only
        lock_.release();
        ::close(fd_);
        fd_ = next;
        if (!lock_.acquire(fd_)) {
            std::cerr << "[VectorLog] Lock handover after compaction failed\n";
            close();
            return false;
        }
        sequence_ = seq;
        return true;
    }

    size_t dimension() const { return dimension_; }

private:
    static bool write_header_file(const std::string& path, size_t dimension) {
        return safe_save(path, [dimension](FILE* f) {
            VectorLogHeader header{VECTOR_LOG_MAGIC, VECTOR_LOG_VERSION,
                                   static_cast<uint32_t>(dimension), 0};
            return fwrite(&header, sizeof(header), 1, f) == 1;
        });
    }

    static bool write_all(int fd, const uint8_t* data, size_t size, off_t offset) {
        size_t written = 0;
        while (written < size) {
            ssize_t n = ::pwrite(fd, data + written, size - written, offset + written);
            if (n < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            written += static_cast<size_t>(n);
        }
        return true;
    }

    std::string path_;
    size_t dimension_ = 0;
    int fd_ = -1;
    ScopedFileLock lock_;
    uint64_t sequence_ = 0;
};

} // namespace sabha
