#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mc {

// Filesystem
namespace fs = std::filesystem;
using Path = fs::path;

// Integer types
using i32 = std::int32_t;
using i64 = std::int64_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

// Floating point
using f32 = float;
using f64 = double;

// Size type
using usize = std::size_t;

// Common result type
template <typename T>
using Result = std::optional<T>;

}  // namespace mc
