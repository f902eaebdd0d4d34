#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace fastlist::aws {

struct Credentials {
    std::string access_key;
    std::string secret_access_key;
    // set for temporary credentials, sent as x-amz-security-token
    std::optional<std::string> session_token;
};

// AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY and optionally AWS_SESSION_TOKEN.
// Returns nullopt unless both keys are set and non-empty.
[[nodiscard]] std::optional<Credentials> credentials_from_environment();

// Reads one key per file, surrounding whitespace is trimmed.
// Throws std::runtime_error if a file cannot be read or is empty.
[[nodiscard]] Credentials credentials_from_files(const std::filesystem::path &access_key_file,
                                                 const std::filesystem::path &secret_access_key_file);

} // namespace fastlist::aws
