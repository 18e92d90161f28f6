#pragma once

#include <type_traits>

#include "capsync/core/types.hpp"

namespace capsync::store {
    using u8 = capsync::core::u8;
    using u32 = capsync::core::u32;

    struct BufferView {
        const u8* data{nullptr};
        u32 len{0};
    };

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
} // namespace capsync::store
