#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

#include <boost/beast/http.hpp>

namespace chremote::http {

namespace beast_http = boost::beast::http;

inline constexpr std::string_view kContentTypeJson = "application/json";
inline constexpr std::string_view kContentTypeText = "text/plain";

struct Request {
    beast_http::request<beast_http::string_body> raw;
    std::string path; // target without query
    std::unordered_map<std::string, std::string> query;
    std::string remote_address; // peer IP, empty if unknown

    std::string_view Query(std::string_view key) const;
};

struct Response {
    unsigned status = 200;
    std::string body;
    std::string content_type = "text/plain; charset=utf-8";
    std::unordered_map<std::string, std::string> headers;

    void SetJson(std::string json, unsigned status_code = 200);
    void SetText(unsigned status_code, std::string text);
};

} // namespace chremote::http
