#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

struct Url {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;
    std::string path;     // always starts with '/'

    static Url parse(const std::string& url);
};

struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers;   // lower-cased names
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

// Splits a raw HTTP/1.x response and undoes chunked transfer encoding.
HttpResponse parse_http_response(const std::string& raw);
std::string decode_chunked(const std::string& body);

// One request per connection over OpenSSL (or plain TCP for http://).
// Throws std::runtime_error on connection or TLS failures; HTTP error
// statuses are returned, not thrown.
class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse post(const std::string& url, const HttpHeaders& headers, const std::string& body);

private:
    struct Impl;
    Impl* impl_;
};
