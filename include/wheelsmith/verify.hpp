#pragma once

#include <string>
#include <vector>

namespace wheelsmith {

// ============================================================================
// Wheel Verification
// ============================================================================

struct VerifyResult {
    bool ok = false;                    // archive readable and no issues found
    std::string error;                  // set when the archive could not be read
    std::vector<std::string> issues;
    std::string record_path;
    size_t entry_count = 0;
};

// Check that RECORD is the last entry, that every other entry has exactly
// one row whose hash and size match, and that RECORD's own row is empty
VerifyResult verify_wheel(const std::string& wheel_path);

} // namespace wheelsmith
