#pragma once

#include <cstdint>
#include <filesystem>

namespace rsim {

namespace fs = std::filesystem;

using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;
using f32 = float;
using f64 = double;

/// Entity IDs are handed out by the EntityRegistry starting at 1.
using EntityId = u32;
constexpr EntityId NO_ENTITY = 0;

} // namespace rsim
