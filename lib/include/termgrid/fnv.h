#pragma once

#include "di/types/integers.h"

/// @brief 64 bit FNV-1a hashing, used for render cache keys
namespace termgrid::fnv {
constexpr auto offset_basis = 14695981039346656037_u64;
constexpr auto prime = 1099511628211_u64;

constexpr auto mix(u64 hash, u64 value) -> u64 {
    return (hash ^ value) * prime;
}
}
