#include "capsync/store/hashing.hpp"

#include <cerrno>
#include <cstddef>
#include <fcntl.h>
#include <memory>
#include <unistd.h>

#include <blake3.h>

namespace capsync::store {
    using capsync::core::Hash256;
    using capsync::core::Status;
    using capsync::core::StatusCode;
    using capsync::core::StatusDomain;
    using capsync::core::make_status;
    using capsync::core::ok_status;

    Status hash_compute(BufferView data, Hash256* out) noexcept {
        if (out == nullptr){
            return make_status(StatusDomain::Store, StatusCode::Invalid);
        }
        if (data.len > 0 && data.data == nullptr){
            return make_status(StatusDomain::Store, StatusCode::Invalid);
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        if (data.len > 0){
            blake3_hasher_update(&hasher, data.data, static_cast<size_t>(data.len));
        }

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return ok_status();
    }

    struct HashStream::State {
        blake3_hasher hasher;
    };

    HashStream::HashStream() : state_(std::make_unique<State>()) {
        blake3_hasher_init(&state_->hasher);
    }

    HashStream::~HashStream() = default;
    HashStream::HashStream(HashStream&&) noexcept = default;
    HashStream& HashStream::operator=(HashStream&&) noexcept = default;

    void HashStream::update(const void* data, size_t len) noexcept {
        if (len == 0 || state_ == nullptr) {
            return;
        }
        blake3_hasher_update(&state_->hasher, data, len);
    }

    void HashStream::finalize(Hash256* out) const noexcept {
        if (state_ == nullptr) {
            out->b.fill(0);
            return;
        }
        // blake3 finalize does not consume the hasher state
        blake3_hasher_finalize(&state_->hasher, out->b.data(), out->b.size());
    }

    Status hash_file(const char* path, Hash256* out, capsync::core::u64* size_out) noexcept {
        if (path == nullptr || out == nullptr) {
            return make_status(StatusDomain::Store, StatusCode::Invalid);
        }

        int fd = open(path, O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            if (errno == ENOENT) {
                return make_status(StatusDomain::Store, StatusCode::NotFound);
            }
            return make_status(StatusDomain::Store, StatusCode::Io, errno);
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        capsync::core::u64 total = 0;
        u8 buf[64 * 1024];
        for (;;) {
            ssize_t n = read(fd, buf, sizeof(buf));
            if (n < 0) {
                if (errno == EINTR) continue;
                const int err = errno;
                close(fd);
                return make_status(StatusDomain::Store, StatusCode::Io, err);
            }
            if (n == 0) break;  // EOF
            blake3_hasher_update(&hasher, buf, static_cast<size_t>(n));
            total += static_cast<capsync::core::u64>(n);
        }
        close(fd);

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        if (size_out != nullptr) {
            *size_out = total;
        }
        return ok_status();
    }

    void hash_to_hex(const Hash256& hash, char* out, size_t out_size) noexcept {
        static const char hex[] = "0123456789abcdef";
        if (out == nullptr || out_size == 0) {
            return;
        }
        size_t pos = 0;
        for (size_t i = 0; i < hash.b.size() && pos + 2 < out_size; ++i) {
            out[pos++] = hex[(hash.b[i] >> 4) & 0xF];
            out[pos++] = hex[hash.b[i] & 0xF];
        }
        out[pos] = '\0';
    }

    std::string hash_hex(const Hash256& hash) {
        char buf[65];
        hash_to_hex(hash, buf, sizeof(buf));
        return std::string(buf);
    }

    namespace {
        int hex_value(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }
    } // namespace

    bool hash_from_hex(std::string_view hex, Hash256* out) noexcept {
        if (out == nullptr || hex.size() != 64) {
            return false;
        }
        Hash256 h{};
        for (size_t i = 0; i < 32; ++i) {
            const int hi = hex_value(hex[i * 2]);
            const int lo = hex_value(hex[i * 2 + 1]);
            if (hi < 0 || lo < 0) {
                return false;
            }
            h.b[i] = static_cast<u8>((hi << 4) | lo);
        }
        *out = h;
        return true;
    }
} // namespace capsync::store
