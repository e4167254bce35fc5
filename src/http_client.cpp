#include "http_client.hpp"

#include "logging.hpp"
#include "utils.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <cstdlib>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace {

std::string openssl_error(const std::string& context) {
    unsigned long code = ERR_get_error();
    if (code == 0) return context;
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return context + ": " + buffer;
}

struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free_all(bio); }
};
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

} // namespace

Url Url::parse(const std::string& url) {
    Url out;
    std::size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) throw std::runtime_error("Invalid URL: " + url);
    out.scheme = to_lower(url.substr(0, scheme_end));
    if (out.scheme != "http" && out.scheme != "https") {
        throw std::runtime_error("Unsupported URL scheme: " + out.scheme);
    }

    std::size_t host_start = scheme_end + 3;
    std::size_t path_start = url.find('/', host_start);
    std::string authority = url.substr(host_start, path_start == std::string::npos ? std::string::npos
                                                                                   : path_start - host_start);
    out.path = path_start == std::string::npos ? "/" : url.substr(path_start);

    std::size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        out.host = authority.substr(0, colon);
        out.port = authority.substr(colon + 1);
    } else {
        out.host = authority;
        out.port = out.scheme == "https" ? "443" : "80";
    }
    if (out.host.empty()) throw std::runtime_error("Invalid URL: " + url);
    return out;
}

std::string decode_chunked(const std::string& body) {
    std::string out;
    std::size_t pos = 0;
    while (pos < body.size()) {
        std::size_t line_end = body.find("\r\n", pos);
        if (line_end == std::string::npos) throw std::runtime_error("Malformed chunked body");
        std::string size_line = body.substr(pos, line_end - pos);
        std::size_t ext = size_line.find(';');
        if (ext != std::string::npos) size_line.resize(ext);
        char* end = nullptr;
        unsigned long size = std::strtoul(size_line.c_str(), &end, 16);
        if (end == size_line.c_str()) throw std::runtime_error("Malformed chunk size");
        pos = line_end + 2;
        if (size == 0) break;
        if (pos + size > body.size()) throw std::runtime_error("Truncated chunked body");
        out.append(body, pos, size);
        pos += size + 2;
    }
    return out;
}

HttpResponse parse_http_response(const std::string& raw) {
    std::size_t header_end = raw.find("\r\n\r\n");
    if (header_end == std::string::npos) throw std::runtime_error("Malformed HTTP response");

    HttpResponse response;
    std::istringstream head(raw.substr(0, header_end));
    std::string line;
    std::getline(head, line);
    std::istringstream status_line(line);
    std::string version;
    status_line >> version >> response.status;
    if (version.compare(0, 5, "HTTP/") != 0 || response.status == 0) {
        throw std::runtime_error("Malformed HTTP status line: " + line);
    }

    while (std::getline(head, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        response.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }

    response.body = raw.substr(header_end + 4);
    auto te = response.headers.find("transfer-encoding");
    if (te != response.headers.end() && to_lower(te->second).find("chunked") != std::string::npos) {
        response.body = decode_chunked(response.body);
    }
    return response;
}

struct HttpClient::Impl {
    SSL_CTX* ctx{nullptr};

    Impl() {
        ctx = SSL_CTX_new(TLS_client_method());
        if (!ctx) throw std::runtime_error(openssl_error("SSL_CTX_new"));
        SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
        if (SSL_CTX_set_default_verify_paths(ctx) != 1) {
            SSL_CTX_free(ctx);
            throw std::runtime_error(openssl_error("SSL_CTX_set_default_verify_paths"));
        }
    }

    ~Impl() {
        if (ctx) SSL_CTX_free(ctx);
    }

    BioPtr connect(const Url& url) {
        const std::string target = url.host + ":" + url.port;
        BioPtr bio;
        if (url.scheme == "https") {
            bio.reset(BIO_new_ssl_connect(ctx));
            if (!bio) throw std::runtime_error(openssl_error("BIO_new_ssl_connect"));
            SSL* ssl = nullptr;
            BIO_get_ssl(bio.get(), &ssl);
            SSL_set_mode(ssl, SSL_MODE_AUTO_RETRY);
            SSL_set_tlsext_host_name(ssl, url.host.c_str());
            SSL_set1_host(ssl, url.host.c_str());
            BIO_set_conn_hostname(bio.get(), target.c_str());
        } else {
            bio.reset(BIO_new_connect(target.c_str()));
            if (!bio) throw std::runtime_error(openssl_error("BIO_new_connect"));
        }

        if (BIO_do_connect(bio.get()) <= 0) {
            throw std::runtime_error(openssl_error("connect to " + target + " failed"));
        }
        if (url.scheme == "https" && BIO_do_handshake(bio.get()) <= 0) {
            throw std::runtime_error(openssl_error("TLS handshake with " + target + " failed"));
        }
        return bio;
    }
};

HttpClient::HttpClient() : impl_(new Impl()) {}

HttpClient::~HttpClient() { delete impl_; }

HttpResponse HttpClient::post(const std::string& url, const HttpHeaders& headers, const std::string& body) {
    Url target = Url::parse(url);

    std::ostringstream request;
    request << "POST " << target.path << " HTTP/1.1\r\n"
            << "Host: " << target.host << "\r\n"
            << "Connection: close\r\n"
            << "Content-Length: " << body.size() << "\r\n";
    for (const auto& header : headers) {
        request << header.first << ": " << header.second << "\r\n";
    }
    request << "\r\n" << body;
    const std::string payload = request.str();

    BioPtr bio = impl_->connect(target);

    std::size_t sent = 0;
    while (sent < payload.size()) {
        int n = BIO_write(bio.get(), payload.data() + sent, static_cast<int>(payload.size() - sent));
        if (n <= 0) {
            if (BIO_should_retry(bio.get())) continue;
            throw std::runtime_error(openssl_error("sending request to " + target.host + " failed"));
        }
        sent += static_cast<std::size_t>(n);
    }

    std::string raw;
    char buffer[16384];
    while (true) {
        int n = BIO_read(bio.get(), buffer, sizeof(buffer));
        if (n > 0) {
            raw.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && BIO_should_retry(bio.get())) continue;
        break;
    }

    HttpResponse response = parse_http_response(raw);
    log_debug("HttpClient", "POST " + url + " -> " + std::to_string(response.status) + " (" +
                                std::to_string(response.body.size()) + " bytes)");
    return response;
}
