#pragma once

#include "wheelsmith/project.hpp"

#include <string>

namespace wheelsmith {

// ============================================================================
// Core Metadata 2.1
// ============================================================================

inline constexpr const char* METADATA_VERSION = "2.1";

// Render the METADATA file (RFC 822 style headers, readme as the body).
// A readme that cannot be read is left out.
std::string render_metadata(const ProjectConfig& project);

} // namespace wheelsmith
