#include "logship/LogFileName.hpp"

#include <cctype>

namespace logship {

const char* toString(LogReportState state) {
    switch (state) {
        case LogReportState::Working: return "WORKING";
        case LogReportState::Closed: return "CLOSED";
        case LogReportState::Rollup: return "ROLLUP";
        case LogReportState::Expired: return "EXPIRED";
        case LogReportState::All: return "ALL";
    }
    return "ALL";
}

const char* extensionOf(LogReportState state) {
    switch (state) {
        case LogReportState::Working: return "dat";
        case LogReportState::Closed: return "log";
        case LogReportState::Rollup: return "rollup";
        case LogReportState::Expired: return "bak";
        case LogReportState::All: return "";
    }
    return "";
}

namespace filename {

namespace {

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::optional<ParsedLogFileName> parseLive(const std::string& name) {
    const std::string base = kBaseName;
    if (name.compare(0, base.size(), base) != 0) return std::nullopt;

    auto dot = name.find('.', base.size());
    if (dot == std::string::npos) return std::nullopt;

    std::string digits = name.substr(base.size(), dot - base.size());
    std::string ext = name.substr(dot + 1);

    std::optional<int64_t> timestamp;
    if (!digits.empty()) {
        if (digits.size() > 18) return std::nullopt;
        for (unsigned char ch : digits) {
            if (!std::isdigit(ch)) return std::nullopt;
        }
        timestamp = std::stoll(digits);
    }

    LogReportState state;
    if (ext == extensionOf(LogReportState::Working)) {
        // The working file never carries a timestamp.
        if (timestamp) return std::nullopt;
        state = LogReportState::Working;
    } else if (ext == extensionOf(LogReportState::Closed)) {
        if (!timestamp) return std::nullopt;
        state = LogReportState::Closed;
    } else if (ext == extensionOf(LogReportState::Rollup)) {
        if (!timestamp) return std::nullopt;
        state = LogReportState::Rollup;
    } else {
        return std::nullopt;
    }
    return ParsedLogFileName{state, timestamp, state};
}

} // namespace

std::string make(LogReportState state, std::optional<int64_t> timestamp) {
    std::string name = kBaseName;
    if (state != LogReportState::Working && timestamp) {
        name += std::to_string(*timestamp);
    }
    name += ".";
    name += extensionOf(state);
    return name;
}

std::string expiredNameOf(const std::string& name) {
    return name + "." + extensionOf(LogReportState::Expired);
}

std::optional<ParsedLogFileName> parse(const std::string& name) {
    const std::string bakSuffix = std::string(".") + extensionOf(LogReportState::Expired);
    if (endsWith(name, bakSuffix)) {
        auto inner = parseLive(name.substr(0, name.size() - bakSuffix.size()));
        if (!inner) return std::nullopt;
        return ParsedLogFileName{LogReportState::Expired, inner->timestamp, inner->state};
    }
    return parseLive(name);
}

bool isArchiveTemporary(const std::string& name) {
    const std::string suffix(kTempSuffix);
    if (name.size() <= suffix.size() || name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return false;
    }
    auto parsed = parse(name.substr(0, name.size() - suffix.size()));
    return parsed && parsed->state == LogReportState::Rollup;
}

FileNameParts split(const std::filesystem::path& file) {
    FileNameParts parts;
    parts.path = file.parent_path().string();
    parts.file = file.stem().string();
    std::string ext = file.extension().string();
    parts.extension = ext.empty() ? ext : ext.substr(1);
    return parts;
}

} // namespace filename

} // namespace logship
