#pragma once
#include <string>
#include <chrono>
#include <cstddef>

namespace streetwise {

// =====================================================
// Levels (lower = more important)
// =====================================================
enum class LogLevel {
    Error = 0,
    Phase = 1,
    Debug = 2,
    Trace = 3
};

// =====================================================
// Phase Info Struct
// =====================================================
struct PhaseInfo {
    std::chrono::system_clock::time_point timestamp; // when entered
    std::string fileName;    // file containing this phase
    std::string phaseName;   // descriptive phase string
    bool success = false;    // true = success, false = failure
};

// Running totals since process start, reported when the log closes
struct LogCounts {
    std::size_t errors = 0;
    std::size_t phases = 0;
    std::size_t failedPhases = 0;
};

// =====================================================
// Lifecycle
// =====================================================
void initLogger(const std::string& filename);
void shutdownLogger();

// Verbose lets DEBUG and TRACE through. Debug builds (_DEBUG) are always verbose.
void setVerboseLogging(bool verbose);
bool verboseLogging();

PhaseInfo lastPhase();
LogCounts logCounts();

// =====================================================
// Core Logging Functions
// =====================================================
void logPhaseInternal(const std::string& file,
                      const std::string& phase,
                      bool success);

void logMessage(LogLevel level, const std::string& tag, const std::string& msg);

// =====================================================
// Phase Group Controls (buffered block logging)
// =====================================================
void beginPhaseGroup();
void endPhaseGroup();

} // namespace streetwise

// =====================================================
// Macros for convenience
// =====================================================
#define LOG_PHASE(phase, success) ::streetwise::logPhaseInternal(__FILE__, phase, success)
#define LOG_DEBUG(tag, msg) ::streetwise::logMessage(::streetwise::LogLevel::Debug, tag, msg)
#define LOG_TRACE(tag, msg) ::streetwise::logMessage(::streetwise::LogLevel::Trace, tag, msg)
#define LOG_ERROR(tag, msg) ::streetwise::logMessage(::streetwise::LogLevel::Error, tag, msg)
