#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace mtgtools::fetch {

// Downloads are written to disk in chunks of this size.
inline constexpr std::size_t kChunkSize = 64 * 1024;

// Timeouts bounds how long a stalled remote can hold a request.
struct Timeouts {
    std::chrono::seconds connect{60};
    // A transfer slower than one byte per second for this long is aborted.
    std::chrono::seconds stall{600};
    // Whole-request limit; zero disables it (large downloads rely on stall).
    std::chrono::seconds total{0};
};

// DownloadProgressFunc receives cumulative bytes written and the expected
// total (0 when the server did not announce a length).
using DownloadProgressFunc = std::function<void(uint64_t bytes_done, uint64_t bytes_total)>;

// Transport is the network boundary of the pipeline. Every failure is
// reported as NetworkError; there are no retries.
class Transport {
public:
    virtual ~Transport() = default;

    // get_text fetches a small document into memory.
    virtual std::string get_text(const std::string& url) = 0;

    // download streams url to dest_path, calling on_progress per chunk.
    // A partially written dest_path is removed on failure.
    virtual void download(const std::string& url, const std::string& dest_path,
                          const DownloadProgressFunc& on_progress) = 0;
};

// CurlTransport implements Transport with libcurl.
class CurlTransport : public Transport {
public:
    explicit CurlTransport(Timeouts timeouts = {});
    ~CurlTransport() override;

    std::string get_text(const std::string& url) override;
    void download(const std::string& url, const std::string& dest_path,
                  const DownloadProgressFunc& on_progress) override;

    const Timeouts& timeouts() const { return timeouts_; }

private:
    Timeouts timeouts_;
};

} // namespace mtgtools::fetch
