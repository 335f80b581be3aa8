#pragma once

#include <cstdint>

namespace colonia {

using Id = std::uint64_t;

constexpr Id kInvalidId = 0;

} // namespace colonia
