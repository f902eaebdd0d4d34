#include "fastlist/aws/s3/types.hpp"

#include <array>
#include <boost/asio/error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core/error.hpp>
#include <charconv>
#include <expected>
#include <format>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <optional>
#include <pugixml.hpp>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace fastlist::aws::s3 {

namespace {

constexpr std::array transient_error_codes = {
    std::string_view{"SlowDown"},          std::string_view{"InternalError"},
    std::string_view{"RequestTimeout"},    std::string_view{"ServiceUnavailable"},
    std::string_view{"Throttling"},        std::string_view{"ThrottlingException"},
    std::string_view{"RequestLimitExceeded"},
};

[[nodiscard]] std::optional<std::string> optional_child(const pugi::xml_node &node, const char *name) {
    const pugi::xml_node child = node.child(name);
    if (child == nullptr) {
        return std::nullopt;
    }
    return std::string{child.child_value()};
}

[[nodiscard]] std::optional<std::string> nonempty_child(const pugi::xml_node &node, const char *name) {
    auto value = optional_child(node, name);
    if (value.has_value() && value->empty()) {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] bool is_transient_network_error(const boost::beast::error_code &error) {
    if (error == boost::asio::error::host_not_found || error == boost::asio::error::service_not_found) {
        return false;
    }
    if (error.category() == boost::asio::error::get_ssl_category()) {
        // a certificate that fails verification will fail again
        return ERR_GET_REASON(static_cast<unsigned long>(error.value())) != SSL_R_CERTIFICATE_VERIFY_FAILED;
    }
    return true;
}

[[nodiscard]] bool is_transient_http_error(const HttpError &error) {
    if (error.status >= 500 || error.status == 408 || error.status == 429) {
        return true;
    }
    for (const auto code : transient_error_codes) {
        if (error.code == code) {
            return true;
        }
    }
    return false;
}

} // namespace

Object::Object(const pugi::xml_node &xml) {
    ETag = optional_child(xml, "ETag");
    Key = optional_child(xml, "Key");
    LastModified = nonempty_child(xml, "LastModified");
    StorageClass = nonempty_child(xml, "StorageClass");

    if (const auto size_str = optional_child(xml, "Size"); size_str.has_value()) {
        std::size_t parsed_size{};
        const auto res = std::from_chars(size_str->data(), size_str->data() + size_str->size(), parsed_size);
        if (res.ec != std::errc{} || res.ptr != size_str->data() + size_str->size()) {
            throw std::runtime_error{std::format("failed to parse object size '{}'", *size_str)};
        }
        Size = parsed_size;
    }
}

bool is_transient(const Error &error) {
    struct Visitor {
        static bool operator()(const boost::beast::error_code &err) { return is_transient_network_error(err); }
        static bool operator()(const HttpError &err) { return is_transient_http_error(err); }
        // a truncated or garbled body is worth another try
        static bool operator()(const pugi::xml_parse_status & /*err*/) { return true; }
    };
    return std::visit(Visitor{}, error);
}

std::string to_string(const Error &error) {
    struct Visitor {
        static std::string operator()(const boost::beast::error_code &err) { return err.message(); }
        static std::string operator()(const HttpError &err) {
            if (err.code.empty()) {
                return std::format("HTTP {}", err.status);
            }
            return std::format("HTTP {} {}: {} (request id {})", err.status, err.code, err.message,
                               err.request_id.empty() ? "<none>" : err.request_id);
        }
        static std::string operator()(const pugi::xml_parse_status &err) {
            return std::format("pugixml error {}", std::to_underlying(err));
        }
    };
    return std::visit(Visitor{}, error);
}

std::expected<ListObjectsV2Result, pugi::xml_parse_status> parse_list_objects_v2(std::string body) {
    ListObjectsV2Result ret;
    pugi::xml_document document;
    if (const pugi::xml_parse_status status =
            document.load_buffer_inplace(body.data(), body.size(), pugi::parse_default, pugi::encoding_utf8)
                .status;
        status != pugi::xml_parse_status::status_ok) {
        return std::unexpected{status};
    }
    const pugi::xml_node node = document.child("ListBucketResult");
    if (node == nullptr) {
        return std::unexpected{pugi::xml_parse_status::status_no_document_element};
    }

    if (node.child("CommonPrefixes") != nullptr) {
        ret.CommonPrefixes = std::vector<CommonPrefix>{};
        for (const auto &child : node.children("CommonPrefixes")) {
            ret.CommonPrefixes->emplace_back(optional_child(child, "Prefix"));
        }
    }

    if (node.child("Contents") != nullptr) {
        ret.Contents = std::vector<Object>{};
        for (const auto &child : node.children("Contents")) {
            ret.Contents->emplace_back(child);
        }
    }

    ret.ContinuationToken = nonempty_child(node, "ContinuationToken");
    ret.Delimiter = nonempty_child(node, "Delimiter");
    ret.StartAfter = nonempty_child(node, "StartAfter");
    ret.KeyCount = node.child("KeyCount").text().as_ullong();
    ret.MaxKeys = node.child("MaxKeys").text().as_ullong();
    ret.Name = node.child_value("Name");
    ret.Prefix = node.child_value("Prefix");

    if (const std::string_view is_truncated = node.child_value("IsTruncated"); is_truncated == "true") {
        ret.IsTruncated = true;
        ret.NextContinuationToken = nonempty_child(node, "NextContinuationToken");
        if (!ret.NextContinuationToken.has_value()) {
            throw std::runtime_error{"truncated result without NextContinuationToken"};
        }
    } else if (is_truncated == "false") {
        ret.IsTruncated = false;
    } else {
        throw std::runtime_error{std::format("unknown IsTruncated value '{}'", is_truncated)};
    }

    return ret;
}

HttpError parse_http_error(unsigned status, std::string_view body) {
    HttpError ret{.status = status};
    pugi::xml_document document;
    if (document.load_buffer(body.data(), body.size(), pugi::parse_default, pugi::encoding_utf8).status !=
        pugi::xml_parse_status::status_ok) {
        return ret;
    }
    const pugi::xml_node node = document.child("Error");
    if (node == nullptr) {
        return ret;
    }
    ret.code = node.child_value("Code");
    ret.message = node.child_value("Message");
    ret.request_id = node.child_value("RequestId");
    return ret;
}

} // namespace fastlist::aws::s3
