//LogReporter.cpp
#include "LogReporter.hpp"

#include <algorithm>
#include <iostream>
#include <limits>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include "logship/Errors.hpp"
#include "logship/LogRecord.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::mutex g_instanceMutex;
std::shared_ptr<logship::LogReporter> g_instance;

constexpr fs::perms kReadOnly = fs::perms::owner_read | fs::perms::group_read | fs::perms::others_read;

void markReadOnly(const fs::path& file) {
    std::error_code ec;
    fs::permissions(file, kReadOnly, fs::perm_options::replace, ec);
    if (ec) {
        std::cerr << "LogReporter: failed to mark " << file << " read-only: " << ec.message() << "\n";
    }
}

void markWritable(const fs::path& file) {
    std::error_code ec;
    fs::permissions(file, fs::perms::owner_write, fs::perm_options::add, ec);
    if (ec) {
        std::cerr << "LogReporter: failed to mark " << file << " writable: " << ec.message() << "\n";
    }
}

} // namespace

namespace logship {

LogReporter::LogReporter(const fs::path& dataDir,
                         std::shared_ptr<AgentConfig> config,
                         std::shared_ptr<PayloadSender> sender)
    : config_(std::move(config)), sender_(std::move(sender)), enabled_(false), payloadBudget_(0) {
    if (!config_) {
        throw ConfigurationError("LogReporter: missing agent configuration");
    }
    if (dataDir.empty()) {
        throw ConfigurationError("LogReporter: missing report directory");
    }

    std::error_code ec;
    auto status = fs::status(dataDir, ec);
    if (ec || !fs::exists(status)) {
        throw ConfigurationError("LogReporter: report directory " + dataDir.string() + " does not exist");
    }
    if (!fs::is_directory(status)) {
        throw ConfigurationError("LogReporter: " + dataDir.string() + " is not a directory");
    }
    if (::access(dataDir.c_str(), W_OK | X_OK) != 0) {
        throw ConfigurationError("LogReporter: report directory " + dataDir.string() + " is not writable");
    }

    dataDir_ = fs::absolute(dataDir, ec);
    if (ec) dataDir_ = dataDir;
    enabled_ = config_->loggingEnabled();
    payloadBudget_ = config_->payloadBudget;
}

LogReporter::~LogReporter() {
    std::lock_guard<std::mutex> lk(writerMutex_);
    closeWriterLocked();
}

std::shared_ptr<LogReporter> LogReporter::initialize(const fs::path& dataDir,
                                                     std::shared_ptr<AgentConfig> config,
                                                     std::shared_ptr<PayloadSender> sender) {
    auto reporter = std::make_shared<LogReporter>(dataDir, std::move(config), std::move(sender));
    reporter->getWorkingFile();
    reporter->recover();

    {
        std::lock_guard<std::mutex> lk(g_instanceMutex);
        g_instance = reporter;
    }
    std::cerr << "LogReporter: dataDir=" << reporter->dataDir_.string()
              << " enabled=" << (reporter->isEnabled() ? "on" : "off")
              << " maxPayload=" << reporter->config_->maxPayloadSize
              << " payloadBudget=" << reporter->payloadBudget() << "\n";
    return reporter;
}

std::shared_ptr<LogReporter> LogReporter::instance() {
    std::lock_guard<std::mutex> lk(g_instanceMutex);
    return g_instance;
}

void LogReporter::resetInstance() {
    std::lock_guard<std::mutex> lk(g_instanceMutex);
    g_instance.reset();
}

// --- Harvest lifecycle ---

void LogReporter::start() {
    if (isEnabled()) {
        onHarvestStart();
    }
}

void LogReporter::stop() {
    if (isEnabled()) {
        onHarvestStop();
    }
}

bool LogReporter::isEnabled() const {
    return enabled_.load();
}

void LogReporter::setEnabled(bool enabled) {
    enabled_.store(enabled);
}

void LogReporter::onHarvestConfigurationChanged() {
    bool enabled = config_->loggingEnabled();
    if (enabled != isEnabled()) {
        std::cerr << "LogReporter: log reporting " << (enabled ? "enabled" : "disabled") << "\n";
    }
    setEnabled(enabled);
}

void LogReporter::onHarvestStart() {
    try {
        expire(config_->reportTTL);
    } catch (const std::exception& e) {
        std::cerr << "LogReporter: expire failed: " << e.what() << "\n";
    }
    try {
        cleanup();
    } catch (const std::exception& e) {
        std::cerr << "LogReporter: cleanup failed: " << e.what() << "\n";
    }
}

void LogReporter::onHarvestStop() {
    try {
        rollWorkingFile();
    } catch (const std::exception& e) {
        std::cerr << "LogReporter: failed to roll working file: " << e.what() << "\n";
    }
    onHarvest();
}

void LogReporter::onHarvest() {
    // Archives a previous send could not deliver go out first.
    for (const auto& leftover : getCachedReports(LogReportState::Rollup)) {
        postLogReport(leftover);
    }

    auto archive = rollupDataFiles();
    if (archive) {
        postLogReport(*archive);
    }
}

bool LogReporter::postLogReport(const fs::path& archive) {
    std::shared_ptr<PayloadSender> sender;
    {
        std::lock_guard<std::mutex> lk(senderMutex_);
        sender = sender_;
    }
    if (!sender) {
        std::cerr << "LogReporter: no payload sender; keeping " << archive.filename().string() << "\n";
        return false;
    }
    try {
        return sender->send(archive);
    } catch (const std::exception& e) {
        std::cerr << "LogReporter: send failed for " << archive.filename().string() << ": " << e.what() << "\n";
        return false;
    }
}

void LogReporter::setPayloadSender(std::shared_ptr<PayloadSender> sender) {
    std::lock_guard<std::mutex> lk(senderMutex_);
    sender_ = std::move(sender);
}

// --- Working file ---

fs::path LogReporter::workingPath() const {
    return dataDir_ / filename::make(LogReportState::Working);
}

fs::path LogReporter::uniquePath(LogReportState state, int64_t timestamp) const {
    fs::path candidate = dataDir_ / filename::make(state, timestamp);
    std::error_code ec;
    while (fs::exists(candidate, ec) || fs::exists(dataDir_ / filename::expiredNameOf(candidate.filename().string()), ec)) {
        candidate = dataDir_ / filename::make(state, ++timestamp);
    }
    return candidate;
}

bool LogReporter::openWriterLocked() {
    closeWriterLocked();
    const fs::path path = workingPath();
    writer_.clear();
    writer_.open(path, std::ios::binary | std::ios::app | std::ios::out);
    if (!writer_) {
        std::cerr << "LogReporter: failed to open working file " << path << "\n";
        return false;
    }
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    workingBytes_ = ec ? 0 : static_cast<std::size_t>(size);
    ++writerGeneration_;
    return true;
}

void LogReporter::closeWriterLocked() {
    if (writer_.is_open()) {
        writer_.flush();
        writer_.close();
    }
    writer_.clear();
}

fs::path LogReporter::getWorkingFile() {
    std::lock_guard<std::mutex> lk(writerMutex_);
    const fs::path path = workingPath();
    std::error_code ec;
    if (!writer_.is_open() || !fs::exists(path, ec)) {
        openWriterLocked();
    }
    return path;
}

fs::path LogReporter::rollLogFileLocked(const fs::path& workingFile) {
    std::error_code ec;
    if (!fs::exists(workingFile, ec)) {
        throw NotFoundError("LogReporter: working file " + workingFile.string() + " not found");
    }
    if (fs::equivalent(workingFile, workingPath(), ec)) {
        // Appends must never reach a file that has been closed.
        closeWriterLocked();
    }

    fs::path closed = uniquePath(LogReportState::Closed, std::max(currentTimeMillis(), lastClosedTimestamp_ + 1));
    fs::rename(workingFile, closed);
    if (auto parsed = filename::parse(closed.filename().string())) {
        lastClosedTimestamp_ = parsed->timestamp.value_or(lastClosedTimestamp_);
    }
    markReadOnly(closed);
    return closed;
}

fs::path LogReporter::rollLogFile(const fs::path& workingFile) {
    std::lock_guard<std::mutex> lk(writerMutex_);
    return rollLogFileLocked(workingFile);
}

fs::path LogReporter::rollWorkingFile() {
    std::lock_guard<std::mutex> lk(writerMutex_);
    const fs::path path = workingPath();
    closeWriterLocked();

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        std::ofstream touch(path, std::ios::binary | std::ios::app);
    }
    fs::path closed = rollLogFileLocked(path);
    openWriterLocked();
    return closed;
}

void LogReporter::finalizeWorkingFile() {
    std::lock_guard<std::mutex> lk(writerMutex_);
    closeWriterLocked();
}

std::size_t LogReporter::appendToWorkingFile(std::string_view data) {
    std::lock_guard<std::mutex> lk(writerMutex_);
    if (!writer_.is_open() || !writer_.good()) {
        if (writer_.is_open()) {
            std::cerr << "LogReporter: append handle failed; reopening working file\n";
        }
        if (!openWriterLocked()) {
            return workingBytes_;
        }
    }

    writer_.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!writer_) {
        std::cerr << "LogReporter: append failed for " << workingPath() << "\n";
        return workingBytes_;
    }
    workingBytes_ += data.size();
    return workingBytes_;
}

void LogReporter::flushWorkingFile() {
    std::lock_guard<std::mutex> lk(writerMutex_);
    if (writer_.is_open()) {
        writer_.flush();
    }
}

bool LogReporter::hasWorkingWriter() const {
    std::lock_guard<std::mutex> lk(writerMutex_);
    return writer_.is_open();
}

uint64_t LogReporter::writerGeneration() const {
    std::lock_guard<std::mutex> lk(writerMutex_);
    return writerGeneration_;
}

std::size_t LogReporter::payloadBudget() const {
    return payloadBudget_.load();
}

void LogReporter::setPayloadBudget(std::size_t bytes) {
    payloadBudget_.store(bytes);
}

// --- Rollup ---

std::optional<fs::path> LogReporter::rollupDataFiles() {
    auto closedFiles = getCachedReports(LogReportState::Closed);
    if (config_->rollupOrder == RollupOrder::NewestFirst) {
        std::reverse(closedFiles.begin(), closedFiles.end());
    }

    std::vector<std::pair<fs::path, std::uintmax_t>> candidates;
    std::uintmax_t totalSize = 0;
    for (const auto& file : closedFiles) {
        std::error_code ec;
        auto size = fs::file_size(file, ec);
        if (ec) {
            std::cerr << "LogReporter: cannot size " << file.filename().string() << ": " << ec.message() << "\n";
            continue;
        }
        if (size == 0) {
            safeDelete(file);
            continue;
        }
        candidates.emplace_back(file, size);
        totalSize += size;
    }

    if (candidates.empty()) {
        return std::nullopt;
    }
    if (totalSize < config_->minPayloadThreshold) {
        std::cerr << "LogReporter: " << totalSize << " bytes of log data is below the "
                  << config_->minPayloadThreshold << " byte threshold; not archiving\n";
        return std::nullopt;
    }

    const std::size_t limit = config_->maxPayloadSize;
    std::string payload = "[";
    std::size_t records = 0;
    std::vector<fs::path> consumed;

    for (const auto& candidate : candidates) {
        const fs::path& file = candidate.first;
        if (candidate.second + 1 > limit) {
            std::cerr << "LogReporter: " << file.filename().string() << " (" << candidate.second
                      << " bytes) exceeds the payload limit; leaving it for expiry\n";
            continue;
        }

        std::ifstream in(file, std::ios::binary);
        if (!in) {
            std::cerr << "LogReporter: failed to open " << file.filename().string() << "\n";
            continue;
        }

        // File bytes map onto the array almost 1:1; each newline becomes a separator.
        std::string chunk;
        std::size_t chunkRecords = 0;
        std::string line;
        while (std::getline(in, line)) {
            if (line.empty()) continue;
            auto rec = json::parse(line, nullptr, false);
            if (rec.is_discarded() || !rec.is_object()) {
                std::cerr << "LogReporter: dropping malformed record in " << file.filename().string() << "\n";
                continue;
            }
            if (records + chunkRecords > 0) chunk.push_back(',');
            chunk.append(line);
            ++chunkRecords;
        }

        if (payload.size() + chunk.size() + 1 > limit) {
            // Overflow: this file and every later one wait for the next cycle.
            break;
        }
        payload.append(chunk);
        records += chunkRecords;
        consumed.push_back(file);
    }

    if (records == 0) {
        for (const auto& file : consumed) {
            safeDelete(file);
        }
        return std::nullopt;
    }
    payload.push_back(']');

    const int64_t now = currentTimeMillis();
    fs::path archive = uniquePath(LogReportState::Rollup, now);
    fs::path tmp = archive;
    tmp += filename::kTempSuffix;
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        out.flush();
        if (!out) {
            std::cerr << "LogReporter: failed to write archive " << tmp << "\n";
            out.close();
            std::error_code ec;
            fs::remove(tmp, ec);
            return std::nullopt;
        }
    }
    markReadOnly(tmp);

    std::error_code ec;
    fs::rename(tmp, archive, ec);
    if (ec) {
        std::cerr << "LogReporter: failed to publish archive " << archive << ": " << ec.message() << "\n";
        fs::remove(tmp, ec);
        return std::nullopt;
    }

    for (const auto& file : consumed) {
        safeDelete(file);
    }

    std::cerr << "LogReporter: rolled up " << records << " records from " << consumed.size()
              << " files into " << archive.filename().string() << " (" << payload.size() << " bytes)\n";
    return archive;
}

// --- Queries ---

std::vector<fs::path> LogReporter::getCachedReports(LogReportState state) const {
    std::vector<std::pair<ParsedLogFileName, fs::path>> found;

    std::error_code ec;
    for (fs::directory_iterator it(dataDir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entryEc;
        if (!it->is_regular_file(entryEc)) continue;
        auto parsed = filename::parse(it->path().filename().string());
        if (!parsed) continue;
        if (state == LogReportState::All || parsed->state == state) {
            found.emplace_back(*parsed, it->path());
        }
    }
    if (ec) {
        std::cerr << "LogReporter: failed to list " << dataDir_ << ": " << ec.message() << "\n";
    }

    std::sort(found.begin(), found.end(), [](const auto& a, const auto& b) {
        int64_t ta = a.first.timestamp.value_or(std::numeric_limits<int64_t>::max());
        int64_t tb = b.first.timestamp.value_or(std::numeric_limits<int64_t>::max());
        if (ta != tb) return ta < tb;
        return a.second.filename() < b.second.filename();
    });

    std::vector<fs::path> out;
    out.reserve(found.size());
    for (auto& entry : found) {
        out.push_back(std::move(entry.second));
    }
    return out;
}

LogReportState LogReporter::typeOfFile(const fs::path& file) const {
    std::error_code ec;
    if (!fs::exists(file, ec)) {
        throw NotFoundError("LogReporter: " + file.string() + " does not exist");
    }
    auto parsed = filename::parse(file.filename().string());
    if (!parsed) {
        throw NotFoundError("LogReporter: " + file.string() + " is not a log data file");
    }
    return parsed->state;
}

bool LogReporter::isFileTypeOf(const fs::path& file, LogReportState state) const {
    if (state == LogReportState::All) return false;
    try {
        return typeOfFile(file) == state;
    } catch (const NotFoundError&) {
        return false;
    }
}

FileNameParts LogReporter::fileNameAsParts(const fs::path& file) const {
    return filename::split(file);
}

// --- Maintenance ---

bool LogReporter::quarantine(const fs::path& file) {
    fs::path target = file.parent_path() / filename::expiredNameOf(file.filename().string());
    std::error_code ec;
    fs::rename(file, target, ec);
    if (ec) {
        std::cerr << "LogReporter: failed to quarantine " << file.filename().string() << ": " << ec.message() << "\n";
        return false;
    }
    markReadOnly(target);
    return true;
}

bool LogReporter::safeDelete(const fs::path& file) {
    auto parsed = filename::parse(file.filename().string());
    if (parsed && parsed->state == LogReportState::Expired) {
        // Only cleanup() removes quarantined data.
        return false;
    }

    std::error_code ec;
    if (fs::remove(file, ec) && !ec) {
        return true;
    }
    std::cerr << "LogReporter: failed to delete " << file.filename().string() << ": "
              << (ec ? ec.message() : std::string("no such file")) << "; quarantining\n";
    quarantine(file);
    return false;
}

void LogReporter::expire(std::chrono::milliseconds ttl) {
    const auto cutoff = fs::file_time_type::clock::now() - ttl;
    std::size_t expired = 0;

    for (auto state : {LogReportState::Closed, LogReportState::Rollup}) {
        for (const auto& file : getCachedReports(state)) {
            std::error_code ec;
            auto modified = fs::last_write_time(file, ec);
            if (ec) {
                std::cerr << "LogReporter: cannot stat " << file.filename().string() << ": " << ec.message() << "\n";
                continue;
            }
            if (modified < cutoff && quarantine(file)) {
                ++expired;
            }
        }
    }
    if (expired > 0) {
        std::cerr << "LogReporter: expired " << expired << " files\n";
    }
}

void LogReporter::cleanup() {
    for (const auto& file : getCachedReports(LogReportState::Expired)) {
        std::error_code ec;
        if (!fs::remove(file, ec) || ec) {
            std::cerr << "LogReporter: failed to remove expired " << file.filename().string() << ": "
                      << (ec ? ec.message() : std::string("no such file")) << "\n";
        }
    }
    removeStaleArchives();
}

void LogReporter::removeStaleArchives() {
    std::vector<fs::path> stale;
    std::error_code ec;
    for (fs::directory_iterator it(dataDir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entryEc;
        if (it->is_regular_file(entryEc) && filename::isArchiveTemporary(it->path().filename().string())) {
            stale.push_back(it->path());
        }
    }
    for (const auto& file : stale) {
        std::error_code removeEc;
        fs::remove(file, removeEc);
        if (removeEc) {
            std::cerr << "LogReporter: failed to remove stale archive " << file.filename().string() << ": "
                      << removeEc.message() << "\n";
        } else {
            std::cerr << "LogReporter: removed stale archive " << file.filename().string() << "\n";
        }
    }
}

void LogReporter::recover() {
    for (const auto& file : getCachedReports(LogReportState::Expired)) {
        auto parsed = filename::parse(file.filename().string());
        if (!parsed) continue;

        const std::string name = file.filename().string();
        const std::string restored = name.substr(0, name.size() - filename::expiredNameOf("").size());
        fs::path target = dataDir_ / restored;
        LogReportState state = parsed->baseState;

        std::error_code ec;
        if (state == LogReportState::Working || fs::exists(target, ec)) {
            // A quarantined working file holds finished records; it rejoins the rollup pool.
            state = LogReportState::Closed;
            target = uniquePath(LogReportState::Closed, parsed->timestamp.value_or(currentTimeMillis()));
        }

        fs::rename(file, target, ec);
        if (ec) {
            std::cerr << "LogReporter: failed to recover " << name << ": " << ec.message() << "\n";
            continue;
        }
        if (state == LogReportState::Closed) {
            markWritable(target);
        }
        std::cerr << "LogReporter: recovered " << target.filename().string() << "\n";
    }
}

} // namespace logship
