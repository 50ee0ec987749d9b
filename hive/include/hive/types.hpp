#pragma once
// Core types: ids, clocks, scores, durable files
//
// Everything written to the hive gets an id and a timestamp.
// Scores are probabilities. Files are replaced atomically or not at all.

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <optional>
#include <random>
#include <sstream>
#include <string>

// POSIX headers for atomic file persistence (must be outside namespace)
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

namespace hive {

// Timestamp as Unix millis
using Timestamp = int64_t;

constexpr Timestamp MS_PER_SECOND = 1000;
constexpr Timestamp MS_PER_HOUR = 3600 * MS_PER_SECOND;

// Current time as Timestamp
inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// Probability-like fields live in [0,1]; out-of-range input is clamped
inline float clamp01(float v) {
    if (!(v == v)) return 0.0f;  // NaN
    return std::clamp(v, 0.0f, 1.0f);
}

// 128-bit random identifier, rendered as a UUID string
struct Uuid {
    uint64_t high = 0;
    uint64_t low = 0;

    static Uuid generate() {
        // One engine per thread: producers add records concurrently
        thread_local std::mt19937_64 gen(std::random_device{}() ^
            static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()));
        std::uniform_int_distribution<uint64_t> dis;
        return {dis(gen), dis(gen)};
    }

    std::string to_string() const {
        char buf[37];
        snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                 (uint32_t)(high >> 32),
                 (uint16_t)(high >> 16),
                 (uint16_t)high,
                 (uint16_t)(low >> 48),
                 (unsigned long long)(low & 0xFFFFFFFFFFFFULL));
        return buf;
    }
};

inline std::string new_id() {
    return Uuid::generate().to_string();
}

// Local calendar date (YYYY-MM-DD) of a timestamp
inline std::string local_date(Timestamp ts) {
    std::time_t secs = static_cast<std::time_t>(ts / MS_PER_SECOND);
    std::tm tm{};
    localtime_r(&secs, &tm);
    char buf[11];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

// ISO-8601 local time with millis, for human-facing snapshot fields
inline std::string iso_time(Timestamp ts) {
    std::time_t secs = static_cast<std::time_t>(ts / MS_PER_SECOND);
    std::tm tm{};
    localtime_r(&secs, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[40];
    snprintf(out, sizeof(out), "%s.%03d", buf, static_cast<int>(ts % MS_PER_SECOND));
    return out;
}

// FNV-1a 64-bit, stable across runs and platforms
inline uint64_t fnv1a64(const std::string& data) {
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

// At most max_bytes of s, cut back to a UTF-8 character boundary
inline std::string utf8_prefix(const std::string& s, size_t max_bytes) {
    if (s.size() <= max_bytes) return s;
    size_t n = max_bytes;
    while (n > 0 && (static_cast<unsigned char>(s[n]) & 0xC0) == 0x80) --n;
    return s.substr(0, n);
}

inline std::string to_hex(uint64_t v) {
    char buf[17];
    snprintf(buf, sizeof(buf), "%016llx", (unsigned long long)v);
    return buf;
}

// ═══════════════════════════════════════════════════════════════════════════
// Atomic file persistence: write temp → fsync → rename → fsync dir
// ═══════════════════════════════════════════════════════════════════════════

// Fsync parent directory for durability
inline bool fsync_dir(const std::string& path) {
    auto slash = path.find_last_of('/');
    std::string dir = (slash == std::string::npos) ? "." : path.substr(0, slash);
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dfd < 0) return false;
    int rc = ::fsync(dfd);
    ::close(dfd);
    return rc == 0;
}

// Atomic save: write to temp file, fsync, rename to final path
// Writer function takes FILE* and returns true on success
template <typename Writer>
bool safe_save(const std::string& path, Writer&& write_fn) {
    static std::atomic<uint64_t> seq{0};
    std::string tmp = path + ".tmp." + std::to_string(::getpid()) + "." +
                      std::to_string(seq.fetch_add(1));
    FILE* f = ::fopen(tmp.c_str(), "wb");
    if (!f) return false;

    bool ok = write_fn(f);
    if (ok && ::fflush(f) == 0 && ::fsync(::fileno(f)) == 0) {
        ok = true;
    } else {
        ok = false;
    }

    ::fclose(f);
    if (!ok) { ::remove(tmp.c_str()); return false; }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        ::remove(tmp.c_str());
        return false;
    }

    fsync_dir(path);
    return true;
}

// Save a whole text document atomically
inline bool safe_save_text(const std::string& path, const std::string& text) {
    return safe_save(path, [&text](FILE* f) {
        return ::fwrite(text.data(), 1, text.size(), f) == text.size();
    });
}

// Read a whole file; nullopt when missing or unreadable
inline std::optional<std::string> read_text(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) return std::nullopt;
    return ss.str();
}

// Create the parent directories of a file path (best effort)
inline void ensure_parent_dir(const std::string& path) {
    auto slash = path.find_last_of('/');
    if (slash == std::string::npos || slash == 0) return;
    std::string dir = path.substr(0, slash);
    for (size_t pos = dir.find('/', 1); ; pos = dir.find('/', pos + 1)) {
        ::mkdir(dir.substr(0, pos).c_str(), 0755);
        if (pos == std::string::npos) break;
    }
}

} // namespace hive
