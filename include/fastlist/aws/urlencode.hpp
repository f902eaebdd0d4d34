#pragma once

#include <string>
#include <string_view>

namespace fastlist::aws {

// Percent-encodes everything except the SigV4 unreserved set (A-Z a-z 0-9 - . _ ~).
// Suitable for query parameter names and values.
[[nodiscard]] std::string urlencode(std::string_view input);

// Like urlencode, but keeps '/' so object paths stay readable.
[[nodiscard]] std::string urlencode_path(std::string_view input);
[[nodiscard]] bool urlencode_path_required(std::string_view input);

} // namespace fastlist::aws
