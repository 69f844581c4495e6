//LogReporter.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "PayloadSender.hpp"
#include "logship/AgentConfig.hpp"
#include "logship/LogFileName.hpp"

namespace logship {

// Owns the log data directory. The state of each file lives in its name, so the
// directory listing is the index. Every state transition is a single rename or
// delete.
class LogReporter {
public:
    // Validates the directory and configuration; throws ConfigurationError.
    // Does not touch the directory.
    LogReporter(const std::filesystem::path& dataDir,
                std::shared_ptr<AgentConfig> config,
                std::shared_ptr<PayloadSender> sender = nullptr);
    virtual ~LogReporter();

    LogReporter(const LogReporter&) = delete;
    LogReporter& operator=(const LogReporter&) = delete;

    // Construct, create the working file, recover quarantined files and install
    // the result as the process-wide handle. Nothing is installed on failure.
    static std::shared_ptr<LogReporter> initialize(const std::filesystem::path& dataDir,
                                                   std::shared_ptr<AgentConfig> config,
                                                   std::shared_ptr<PayloadSender> sender = nullptr);
    static std::shared_ptr<LogReporter> instance();
    static void resetInstance();

    // --- Harvest lifecycle ---
    void start();
    void stop();
    bool isEnabled() const;
    void setEnabled(bool enabled);
    void onHarvestConfigurationChanged();

    virtual void onHarvestStart();
    virtual void onHarvestStop();
    virtual void onHarvest();
    virtual bool postLogReport(const std::filesystem::path& archive);

    void setPayloadSender(std::shared_ptr<PayloadSender> sender);

    // --- Working file ---
    std::filesystem::path getWorkingFile();
    std::filesystem::path rollLogFile(const std::filesystem::path& workingFile);
    virtual std::filesystem::path rollWorkingFile();
    void finalizeWorkingFile();

    // Append one encoded record; returns the byte size of the working file.
    std::size_t appendToWorkingFile(std::string_view data);
    void flushWorkingFile();

    bool hasWorkingWriter() const;
    // Increments whenever a new append handle replaces a rotated one.
    uint64_t writerGeneration() const;

    std::size_t payloadBudget() const;
    void setPayloadBudget(std::size_t bytes);

    // --- Rollup ---
    virtual std::optional<std::filesystem::path> rollupDataFiles();

    // --- Queries ---
    std::vector<std::filesystem::path> getCachedReports(LogReportState state) const;
    LogReportState typeOfFile(const std::filesystem::path& file) const;
    bool isFileTypeOf(const std::filesystem::path& file, LogReportState state) const;
    FileNameParts fileNameAsParts(const std::filesystem::path& file) const;

    // --- Maintenance ---
    bool safeDelete(const std::filesystem::path& file);
    virtual void expire(std::chrono::milliseconds ttl);
    virtual void cleanup();
    void recover();

    const std::filesystem::path& dataDir() const { return dataDir_; }
    const std::shared_ptr<AgentConfig>& config() const { return config_; }

private:
    std::filesystem::path dataDir_;
    std::shared_ptr<AgentConfig> config_;
    std::shared_ptr<PayloadSender> sender_;
    mutable std::mutex senderMutex_;
    std::atomic<bool> enabled_;
    std::atomic<std::size_t> payloadBudget_;

    // Guards the append handle and every rotation of the working file.
    mutable std::mutex writerMutex_;
    std::ofstream writer_;
    std::size_t workingBytes_ = 0;
    uint64_t writerGeneration_ = 0;
    // Closed names carry strictly increasing timestamps within a process.
    int64_t lastClosedTimestamp_ = 0;

    std::filesystem::path workingPath() const;
    std::filesystem::path uniquePath(LogReportState state, int64_t timestamp) const;
    bool quarantine(const std::filesystem::path& file);
    // Drops archive temporaries an interrupted rollup left behind.
    void removeStaleArchives();
    bool openWriterLocked();
    void closeWriterLocked();
    std::filesystem::path rollLogFileLocked(const std::filesystem::path& workingFile);
};

} // namespace logship
