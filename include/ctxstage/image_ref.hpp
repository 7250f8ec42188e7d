#pragma once

#include <string>

namespace ctxstage {

// ============================================================================
// Image References
// ============================================================================
//
// Format: [HOST[:PORT]/]PATH[:TAG]
//   HOST  lower-case letters, digits, dots and dashes
//   PATH  one or more '/'-separated components; a component is [a-z0-9]+
//         joined by a single dot, one or two underscores, or a run of dashes
//   TAG   [a-zA-Z0-9_.-]+

bool is_valid_image_reference(const std::string& reference);

// Replace ':' and '/' with '_' so the reference can be part of a file name
std::string sanitize_image_reference(const std::string& reference);

} // namespace ctxstage
