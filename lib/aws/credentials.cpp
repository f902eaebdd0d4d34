#include "fastlist/aws/credentials.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace fastlist::aws {

namespace {

[[nodiscard]] std::optional<std::string> getenv_nonempty(const char *name) {
    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    const char *value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string{value};
}

[[nodiscard]] std::string read_key_file(const std::filesystem::path &path) {
    const std::ifstream stream{path};
    if (!stream) {
        throw std::runtime_error{std::format("unable to read key file {}", path.string())};
    }
    std::stringstream buffer;
    buffer << stream.rdbuf();
    std::string key = buffer.str();
    boost::algorithm::trim(key);
    if (key.empty()) {
        throw std::runtime_error{std::format("key file {} is empty", path.string())};
    }
    return key;
}

} // namespace

std::optional<Credentials> credentials_from_environment() {
    auto access_key = getenv_nonempty("AWS_ACCESS_KEY_ID");
    auto secret_access_key = getenv_nonempty("AWS_SECRET_ACCESS_KEY");
    if (!access_key.has_value() || !secret_access_key.has_value()) {
        return std::nullopt;
    }
    return Credentials{.access_key = std::move(*access_key),
                       .secret_access_key = std::move(*secret_access_key),
                       .session_token = getenv_nonempty("AWS_SESSION_TOKEN")};
}

Credentials credentials_from_files(const std::filesystem::path &access_key_file,
                                   const std::filesystem::path &secret_access_key_file) {
    return Credentials{.access_key = read_key_file(access_key_file),
                       .secret_access_key = read_key_file(secret_access_key_file),
                       .session_token = std::nullopt};
}

} // namespace fastlist::aws
