#pragma once

/**
@file
@brief Fixed-width numeric type aliases used throughout Vitrine.
*/

#include <cstddef>
#include <cstdint>

using uint8 = std::uint8_t;   ///< Unsigned 8-bit integer
using uint16 = std::uint16_t; ///< Unsigned 16-bit integer
using uint32 = std::uint32_t; ///< Unsigned 32-bit integer
using uint64 = std::uint64_t; ///< Unsigned 64-bit integer

using sint8 = std::int8_t;   ///< Signed 8-bit integer
using sint16 = std::int16_t; ///< Signed 16-bit integer
using sint32 = std::int32_t; ///< Signed 32-bit integer
using sint64 = std::int64_t; ///< Signed 64-bit integer

using usize = std::size_t; ///< Unsigned size/index type

using float32 = float;  ///< 32-bit floating point
using float64 = double; ///< 64-bit floating point
