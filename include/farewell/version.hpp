#ifndef FAREWELL_VERSION_HPP
#define FAREWELL_VERSION_HPP

// ============================================================================
// Farewell - Version Header
// ============================================================================

namespace farewell {

inline constexpr int VERSION_MAJOR = 0;
inline constexpr int VERSION_MINOR = 3;
inline constexpr int VERSION_PATCH = 0;

inline constexpr const char* VERSION_STRING = "0.3.0";

/// Written into the metadata of every delivery proof
inline constexpr const char* GENERATOR_NAME = "farewell-claimer";

} // namespace farewell

#endif // FAREWELL_VERSION_HPP
