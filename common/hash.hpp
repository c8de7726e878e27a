#pragma once

// ============================================================
// hash.hpp -- xxHash3 wrappers and GUID generation
// ============================================================

#include "platform.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>

// We include it here with XXH_STATIC_LINKING_ONLY for the XXH3 streaming API
#define XXH_STATIC_LINKING_ONLY
#include <xxhash.h>

namespace hash {

// 16-byte (128-bit) hash result
using Hash128 = std::array<u8, 16>;

inline Hash128 from_xxh128(XXH128_hash_t h) {
    Hash128 result;
    // Store as big-endian for determinism
    for (int i = 0; i < 8; ++i) {
        result[i]     = (u8)(h.high64 >> (56 - 8 * i));
        result[8 + i] = (u8)(h.low64  >> (56 - 8 * i));
    }
    return result;
}

// Streaming hasher for xxh3_128
class StreamHasher128 {
public:
    StreamHasher128() {
        state_ = XXH3_createState();
        if (!state_) throw std::runtime_error("XXH3_createState failed");
        reset();
    }

    ~StreamHasher128() {
        if (state_) XXH3_freeState(state_);
    }

    StreamHasher128(const StreamHasher128&) = delete;
    StreamHasher128& operator=(const StreamHasher128&) = delete;

    void reset() {
        XXH3_128bits_reset(state_);
    }

    void update(const void* data, size_t len) {
        XXH3_128bits_update(state_, data, len);
    }

    template<typename T>
    void update_value(const T& v) {
        update(&v, sizeof(v));
    }

    Hash128 digest() const {
        return from_xxh128(XXH3_128bits_digest(state_));
    }

private:
    XXH3_state_t* state_;
};

inline bool is_zero(const Hash128& h) {
    for (u8 b : h) if (b != 0) return false;
    return true;
}

// Lowercase hex, 32 characters
inline std::string to_hex(const Hash128& h) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(h.size() * 2);
    for (u8 b : h) {
        out += digits[b >> 4];
        out += digits[b & 0x0F];
    }
    return out;
}

// Fresh 32-hex-char global identifier. Mixes OS entropy, the clock, a
// process-wide counter, the calling thread and an optional salt (the
// asset path) through XXH3-128. Never returns the all-zero id.
inline std::string generate_guid(const std::string& salt = "") {
    static std::atomic<u64> counter{0};

    std::random_device rd;
    StreamHasher128 hasher;
    for (int i = 0; i < 4; ++i) hasher.update_value((u32)rd());
    hasher.update_value((u64)std::chrono::high_resolution_clock::now()
                            .time_since_epoch().count());
    hasher.update_value(counter.fetch_add(1));
    hasher.update_value(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    if (!salt.empty()) hasher.update(salt.data(), salt.size());

    Hash128 h = hasher.digest();
    if (is_zero(h)) h[15] = 1;
    return to_hex(h);
}

} // namespace hash
