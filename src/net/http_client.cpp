#include "net/http_client.hpp"

#include <curl/curl.h>

#include <cctype>
#include <cstdlib>
#include <mutex>

namespace chromadex {

namespace {

struct TransferState {
    HttpBodyHandler* handler = nullptr;
    HttpResponseHead head;
    bool head_sent = false;
    bool aborted = false;
};

void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

bool deliver_head(TransferState& state) {
    if (state.head_sent) return !state.aborted;
    state.head_sent = true;
    if (!state.handler->on_head(state.head)) {
        state.aborted = true;
    }
    return !state.aborted;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    const size_t n = size * nitems;
    auto* state = static_cast<TransferState*>(userp);
    std::string line(buffer, n);

    // Each response in a redirect chain starts with a status line.
    if (line.compare(0, 5, "HTTP/") == 0) {
        state->head = HttpResponseHead();
        size_t space = line.find(' ');
        if (space != std::string::npos) {
            state->head.status = std::strtol(line.c_str() + space + 1, nullptr, 10);
        }
        return n;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = to_lower_ascii(trim_ascii(line.substr(0, colon)));
        std::string value = trim_ascii(line.substr(colon + 1));
        state->head.headers[name] = value;
    }
    return n;
}

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t n = size * nmemb;
    auto* state = static_cast<TransferState*>(userp);
    if (!deliver_head(*state)) return 0;

    if (!state->handler->on_data(static_cast<const uint8_t*>(contents), n)) {
        state->aborted = true;
        return 0;
    }
    return n;
}

}

std::string to_lower_ascii(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

std::string trim_ascii(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

std::optional<std::string> HttpResponseHead::header(const std::string& name) const {
    auto it = headers.find(to_lower_ascii(name));
    if (it == headers.end()) return std::nullopt;
    return it->second;
}

CurlHttpClient::CurlHttpClient() : CurlHttpClient("chromadex/1.0") {}

CurlHttpClient::CurlHttpClient(std::string user_agent) : user_agent_(std::move(user_agent)) {
    ensure_curl_global_init();
}

HttpOutcome CurlHttpClient::get(const HttpRequest& request, HttpBodyHandler& handler) {
    HttpOutcome outcome;

    CURL* curl = curl_easy_init();
    if (!curl) {
        outcome.kind = HttpOutcome::Kind::TransportError;
        outcome.error = "curl_easy_init failed";
        return outcome;
    }

    TransferState state;
    state.handler = &handler;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &state);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_sec) * 1000L);

    curl_slist* hdrs = nullptr;
    for (const auto& kv : request.headers) {
        std::string line = kv.first + ": " + kv.second;
        hdrs = curl_slist_append(hdrs, line.c_str());
    }
    if (hdrs) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, hdrs);
    }

    const CURLcode code = curl_easy_perform(curl);

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    outcome.status = status;

    if (hdrs) {
        curl_slist_free_all(hdrs);
    }
    curl_easy_cleanup(curl);

    if (state.aborted) {
        outcome.kind = HttpOutcome::Kind::Aborted;
        outcome.error = "transfer aborted by handler";
        return outcome;
    }
    if (code != CURLE_OK) {
        outcome.kind = HttpOutcome::Kind::TransportError;
        outcome.error = curl_easy_strerror(code);
        return outcome;
    }

    // Responses without a body never reached the write callback.
    if (!deliver_head(state)) {
        outcome.kind = HttpOutcome::Kind::Aborted;
        outcome.error = "transfer aborted by handler";
        return outcome;
    }

    outcome.kind = HttpOutcome::Kind::Completed;
    return outcome;
}

bool BufferingHandler::on_head(const HttpResponseHead& head) {
    head_ = head;
    body_.clear();
    return true;
}

bool BufferingHandler::on_data(const uint8_t* data, size_t size) {
    if (max_bytes_ > 0 && body_.size() + size > max_bytes_) {
        overflowed_ = true;
        return false;
    }
    body_.insert(body_.end(), data, data + size);
    return true;
}

}
