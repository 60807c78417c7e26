#include "logger.hpp"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <vector>

namespace streetwise {

// =====================================================
// State
// =====================================================
#if defined(_DEBUG)
static constexpr bool kDebugBuild = true;
#else
static constexpr bool kDebugBuild = false;
#endif

namespace {

struct LoggerState {
    std::mutex mutex;
    std::ofstream file;
    LogLevel threshold = kDebugBuild ? LogLevel::Trace : LogLevel::Phase;

    // 🔹 Phase lines held back between beginPhaseGroup() and endPhaseGroup()
    bool grouping = false;
    std::vector<std::string> pending;

    PhaseInfo last{};
    LogCounts counts{};
};

LoggerState& state() {
    static LoggerState s;
    return s;
}

} // namespace

// =====================================================
// Helpers
// =====================================================
static std::string stamp(const std::chrono::system_clock::time_point& tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

static const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Phase: return "PHASE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Trace: return "TRACE";
    }
    return "?";
}

static std::string fileOf(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

// Caller holds the mutex
static void sink(LoggerState& s, const std::string& line) {
    if (s.file.is_open()) {
        s.file << line << '\n';
        s.file.flush();
    }
    std::cerr << line << std::endl;
}

// =====================================================
// Verbosity / introspection
// =====================================================
void setVerboseLogging(bool verbose) {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.threshold = (verbose || kDebugBuild) ? LogLevel::Trace : LogLevel::Phase;
}

bool verboseLogging() {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.threshold >= LogLevel::Debug;
}

PhaseInfo lastPhase() {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.last;
}

LogCounts logCounts() {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.counts;
}

// =====================================================
// Phase groups
// =====================================================
void beginPhaseGroup() {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.grouping = true;
    s.pending.clear();
}

void endPhaseGroup() {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    for (const auto& line : s.pending) {
        sink(s, line);
    }
    s.pending.clear();
    s.grouping = false;
}

// =====================================================
// Writers
// =====================================================
void logPhaseInternal(const std::string& file,
                      const std::string& phase,
                      bool success)
{
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    s.last.timestamp = std::chrono::system_clock::now();
    s.last.fileName  = fileOf(file);
    s.last.phaseName = phase;
    s.last.success   = success;

    s.counts.phases++;
    if (!success) s.counts.failedPhases++;

    if (s.threshold < LogLevel::Phase) return;

    std::ostringstream oss;
    oss << "| " << stamp(s.last.timestamp)
        << " | " << s.last.fileName
        << " | " << s.last.phaseName
        << " | " << (success ? "true" : "false")
        << " |";

    if (s.grouping) {
        s.pending.push_back(oss.str());
    } else {
        sink(s, oss.str());
    }
}

void logMessage(LogLevel level, const std::string& tag, const std::string& msg) {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    if (level == LogLevel::Error) s.counts.errors++;
    if (level > s.threshold) return;

    sink(s, "[" + stamp(std::chrono::system_clock::now()) + "][" + levelName(level) + "][" + tag + "] " + msg);
}

// =====================================================
// Lifecycle
// =====================================================
void initLogger(const std::string& filename) {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    if (s.file.is_open()) s.file.close();

    std::filesystem::path logPath = std::filesystem::absolute(filename);
    s.file.open(logPath, std::ios::out | std::ios::app);
    if (!s.file.is_open()) {
        std::cerr << "[Logger] ERROR: Could not open log file: " << logPath.string() << std::endl;
        return;
    }

    s.file << "==== streetwise log opened ====\n";
    sink(s, "[" + stamp(std::chrono::system_clock::now()) + "][Logger] Writing logs to: " + logPath.string());
}

void shutdownLogger() {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (!s.file.is_open()) return;

    s.file << "==== streetwise log closed (" << s.counts.errors << " errors, "
           << s.counts.failedPhases << "/" << s.counts.phases << " phases failed) ====\n";
    s.file.close();
}

} // namespace streetwise
