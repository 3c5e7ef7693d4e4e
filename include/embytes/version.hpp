#pragma once

namespace embytes {

// Semantic versioning for the public API
inline constexpr int version_major = 1;
inline constexpr int version_minor = 0;
inline constexpr int version_patch = 0;

// Convenience
inline constexpr bool is_v1 = (version_major == 1);

} // namespace embytes
