#include "mtgtools/fetch.h"
#include "mtgtools/errors.h"

#include <curl/curl.h>

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>
#include <vector>

namespace fs = std::filesystem;

namespace mtgtools::fetch {

static constexpr const char* user_agent = "mtgtools/1.0";

static void global_init_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

// ---------------------------------------------------------------------------
// Easy handle
// ---------------------------------------------------------------------------

namespace {

struct EasyHandle {
    CURL* curl = nullptr;

    EasyHandle() {
        global_init_once();
        curl = curl_easy_init();
        if (!curl) throw NetworkError("fetch: curl_easy_init failed");
    }
    ~EasyHandle() { curl_easy_cleanup(curl); }
    EasyHandle(const EasyHandle&) = delete;
    EasyHandle& operator=(const EasyHandle&) = delete;
};

struct DownloadSink {
    CURL* curl = nullptr;
    std::ofstream out;
    std::vector<char> chunk;
    uint64_t bytes_done = 0;
    const DownloadProgressFunc* on_progress = nullptr;
    bool write_failed = false;

    uint64_t expected_total() const {
        curl_off_t len = -1;
        if (curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &len) != CURLE_OK || len < 0)
            return 0;
        return static_cast<uint64_t>(len);
    }

    bool flush() {
        if (chunk.empty()) return true;
        out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        if (!out) return false;
        bytes_done += chunk.size();
        chunk.clear();
        if (*on_progress) (*on_progress)(bytes_done, expected_total());
        return true;
    }
};

} // namespace

static size_t text_write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

// Buffers incoming data and writes it to disk in kChunkSize pieces.
static size_t file_write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<DownloadSink*>(userdata);
    size_t n = size * nmemb;
    size_t off = 0;
    while (off < n) {
        size_t room = kChunkSize - sink->chunk.size();
        size_t take = std::min(room, n - off);
        sink->chunk.insert(sink->chunk.end(), ptr + off, ptr + off + take);
        off += take;
        if (sink->chunk.size() == kChunkSize && !sink->flush()) {
            sink->write_failed = true;
            return 0;
        }
    }
    return n;
}

static void apply_options(CURL* curl, const std::string& url, const Timeouts& t) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(t.connect.count()));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(t.stall.count()));
    if (t.total.count() > 0)
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(t.total.count()));
}

// Throws NetworkError for a transport failure or an HTTP error status.
// Non-HTTP schemes report a zero response code, which is accepted.
static void check_result(CURL* curl, CURLcode res, const std::string& url) {
    if (res != CURLE_OK) {
        throw NetworkError(std::format("fetch: {}: {}", url, curl_easy_strerror(res)));
    }
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code >= 400) {
        throw NetworkError(std::format("fetch: {}: HTTP {}", url, http_code), http_code);
    }
}

// ---------------------------------------------------------------------------
// CurlTransport
// ---------------------------------------------------------------------------

CurlTransport::CurlTransport(Timeouts timeouts) : timeouts_(timeouts) {
    global_init_once();
}

CurlTransport::~CurlTransport() = default;

std::string CurlTransport::get_text(const std::string& url) {
    EasyHandle h;
    std::string body;
    apply_options(h.curl, url, timeouts_);
    curl_easy_setopt(h.curl, CURLOPT_WRITEFUNCTION, text_write_cb);
    curl_easy_setopt(h.curl, CURLOPT_WRITEDATA, &body);

    CURLcode res = curl_easy_perform(h.curl);
    check_result(h.curl, res, url);
    return body;
}

void CurlTransport::download(const std::string& url, const std::string& dest_path,
                             const DownloadProgressFunc& on_progress) {
    EasyHandle h;
    DownloadSink sink;
    sink.curl = h.curl;
    sink.on_progress = &on_progress;
    sink.chunk.reserve(kChunkSize);
    sink.out.open(dest_path, std::ios::binary | std::ios::trunc);
    if (!sink.out) {
        throw NetworkError(std::format("fetch: cannot create {}", dest_path));
    }

    apply_options(h.curl, url, timeouts_);
    curl_easy_setopt(h.curl, CURLOPT_WRITEFUNCTION, file_write_cb);
    curl_easy_setopt(h.curl, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(h.curl, CURLOPT_BUFFERSIZE, static_cast<long>(kChunkSize));

    auto discard = [&] {
        sink.out.close();
        std::error_code ec;
        fs::remove(dest_path, ec);
    };

    CURLcode res = curl_easy_perform(h.curl);
    if (sink.write_failed) {
        discard();
        throw NetworkError(std::format("fetch: write failed for {}", dest_path));
    }
    try {
        check_result(h.curl, res, url);
    } catch (const NetworkError&) {
        discard();
        throw;
    }
    if (!sink.flush()) {
        discard();
        throw NetworkError(std::format("fetch: write failed for {}", dest_path));
    }
    sink.out.close();
    if (!sink.out) {
        discard();
        throw NetworkError(std::format("fetch: write failed for {}", dest_path));
    }
}

} // namespace mtgtools::fetch
