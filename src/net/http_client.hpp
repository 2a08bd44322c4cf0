#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace chromadex {

struct HttpRequest {
    std::string url;
    std::map<std::string, std::string> headers;
    int timeout_sec = 30;
};

struct HttpResponseHead {
    long status = 0;
    // Keys are lowercased.
    std::map<std::string, std::string> headers;

    std::optional<std::string> header(const std::string& name) const;
    bool ok() const { return status >= 200 && status < 300; }
};

// Receives a response incrementally. Returning false from either callback
// aborts the transfer.
class HttpBodyHandler {
public:
    virtual ~HttpBodyHandler() = default;
    virtual bool on_head(const HttpResponseHead& head) = 0;
    virtual bool on_data(const uint8_t* data, size_t size) = 0;
};

struct HttpOutcome {
    enum class Kind {
        Completed,
        TransportError,
        Aborted
    };

    Kind kind = Kind::Completed;
    long status = 0;
    std::string error;

    bool completed() const { return kind == Kind::Completed; }
};

class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpOutcome get(const HttpRequest& request, HttpBodyHandler& handler) = 0;
};

// Blocking GET over libcurl. Follows redirects. Safe to share between
// threads: every call uses its own easy handle.
class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();
    explicit CurlHttpClient(std::string user_agent);

    HttpOutcome get(const HttpRequest& request, HttpBodyHandler& handler) override;

private:
    std::string user_agent_;
};

// Collects the whole body, optionally refusing bodies above max_bytes.
class BufferingHandler : public HttpBodyHandler {
public:
    explicit BufferingHandler(size_t max_bytes = 0) : max_bytes_(max_bytes) {}

    bool on_head(const HttpResponseHead& head) override;
    bool on_data(const uint8_t* data, size_t size) override;

    const HttpResponseHead& head() const { return head_; }
    const std::vector<uint8_t>& body() const { return body_; }
    std::string body_text() const { return std::string(body_.begin(), body_.end()); }
    bool overflowed() const { return overflowed_; }

private:
    size_t max_bytes_;
    HttpResponseHead head_;
    std::vector<uint8_t> body_;
    bool overflowed_ = false;
};

std::string to_lower_ascii(std::string s);
std::string trim_ascii(const std::string& s);

}
