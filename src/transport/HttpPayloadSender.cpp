#include "HttpPayloadSender.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <utility>
#include <httplib.h>

#ifdef LOGSHIP_USE_ZSTD
#include <zstd.h>
#endif

namespace fs = std::filesystem;

namespace {

#ifdef LOGSHIP_USE_ZSTD
// Archives are JSON text; anything ZSTD_compress rejects goes out raw.
bool compressArchive(const std::string& archive, std::string& compressed, int level) {
    const size_t bound = ZSTD_compressBound(archive.size());
    compressed.resize(bound);
    const size_t written = ZSTD_compress(compressed.data(), bound, archive.data(), archive.size(), level);
    if (ZSTD_isError(written)) {
        std::cerr << "HttpPayloadSender: zstd failed: " << ZSTD_getErrorName(written) << "\n";
        return false;
    }
    compressed.resize(written);
    return true;
}
#endif

// Returns the content encoding applied to body, empty when sent raw.
std::string maybeCompress(std::string& body, const logship::CollectorConfig& config) {
    if (!config.compress) return "";
#ifdef LOGSHIP_USE_ZSTD
    std::string compressed;
    if (compressArchive(body, compressed, config.compressionLevel)) {
        body.swap(compressed);
        return "zstd";
    }
#endif
    return "";
}

void removeArchive(const fs::path& archive) {
    std::error_code ec;
    fs::remove(archive, ec);
    if (ec) {
        std::cerr << "HttpPayloadSender: failed to remove " << archive.filename().string() << ": " << ec.message() << "\n";
    }
}

} // namespace

namespace logship {

HttpPayloadSender::HttpPayloadSender(CollectorConfig config) : config_(std::move(config)) {}

bool HttpPayloadSender::send(const fs::path& archive) {
    std::ifstream in(archive, std::ios::binary);
    if (!in) {
        std::cerr << "HttpPayloadSender: cannot read " << archive << "\n";
        return false;
    }
    std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    in.close();

    httplib::Headers headers;
    if (!config_.licenseKey.empty()) {
        headers.emplace("X-License-Key", config_.licenseKey);
    }
    std::string encoding = maybeCompress(body, config_);
    if (!encoding.empty()) {
        headers.emplace("Content-Encoding", encoding);
    }

    httplib::Client client(config_.host, config_.port);
    client.set_connection_timeout(config_.timeout);
    client.set_read_timeout(config_.timeout);
    client.set_write_timeout(config_.timeout);

    auto res = client.Post(config_.path, headers, body, "application/json");
    if (!res) {
        lastStatus_ = 0;
        std::cerr << "HttpPayloadSender: " << config_.host << ":" << config_.port << " unreachable ("
                  << httplib::to_string(res.error()) << "); keeping " << archive.filename().string() << "\n";
        return false;
    }

    lastStatus_ = res->status;
    if (res->status >= 200 && res->status < 300) {
        ++sent_;
        std::cerr << "HttpPayloadSender: delivered " << archive.filename().string() << " (" << body.size() << " bytes)\n";
        removeArchive(archive);
        return true;
    }
    if (res->status == 400 || res->status == 413) {
        // The collector will never accept this payload.
        std::cerr << "HttpPayloadSender: collector rejected " << archive.filename().string()
                  << " with status " << res->status << "; discarding\n";
        removeArchive(archive);
        return false;
    }

    std::cerr << "HttpPayloadSender: collector returned " << res->status << "; keeping "
              << archive.filename().string() << " for retry\n";
    return false;
}

} // namespace logship
