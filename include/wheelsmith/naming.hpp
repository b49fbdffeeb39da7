#pragma once

#include <string>

namespace wheelsmith {

// ============================================================================
// Distribution Naming
// ============================================================================

// Collapse each run of characters outside [A-Za-z0-9] into one '_'.
// "My.Cool Package" -> "My_Cool_Package"
std::string escape_name(const std::string& name);

// Collapse each run of characters outside [A-Za-z0-9.] into one '_'.
// "1.0-beta" -> "1.0_beta"
std::string escape_version(const std::string& version);

// "<escaped-name>-<escaped-version>.dist-info"
std::string dist_info_name(const std::string& name, const std::string& version);

// "<escaped-name>-<escaped-version>-<tag>.whl"
std::string wheel_filename(const std::string& name, const std::string& version,
                           const std::string& tag);

// Importable module name guessed from a distribution name:
// lowercased, runs of '-', '.' and ' ' collapsed to '_'
std::string module_name(const std::string& name);

} // namespace wheelsmith
