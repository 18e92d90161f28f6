#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include "capsync/core/errors.hpp"
#include "capsync/core/types.hpp"
#include "capsync/store/buffer.hpp"

namespace capsync::store {
    [[nodiscard]] constexpr bool hash_is_zero(const capsync::core::Hash256& h) noexcept {
        for (u8 b : h.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    capsync::core::Status hash_compute(BufferView data, capsync::core::Hash256* out) noexcept;

    // Incremental BLAKE3 for data that does not fit in one buffer.
    class HashStream {
    public:
        HashStream();
        ~HashStream();

        HashStream(const HashStream&) = delete;
        HashStream& operator=(const HashStream&) = delete;
        HashStream(HashStream&&) noexcept;
        HashStream& operator=(HashStream&&) noexcept;

        void update(const void* data, size_t len) noexcept;
        void finalize(capsync::core::Hash256* out) const noexcept;

    private:
        struct State;  // wraps blake3_hasher
        std::unique_ptr<State> state_;
    };

    // Streams the file through BLAKE3 in 64 KiB blocks.
    // NotFound if the file is missing, Io (aux=errno) on read failure.
    capsync::core::Status hash_file(const char* path, capsync::core::Hash256* out, capsync::core::u64* size_out) noexcept;

    // out must hold 65 bytes.
    void hash_to_hex(const capsync::core::Hash256& hash, char* out, size_t out_size) noexcept;
    std::string hash_hex(const capsync::core::Hash256& hash);
    [[nodiscard]] bool hash_from_hex(std::string_view hex, capsync::core::Hash256* out) noexcept;

} // namespace capsync::store
