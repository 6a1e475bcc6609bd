#pragma once

#include <string>
#include <vector>
#include <memory>
#include <stdexcept>
#include <chrono>
#include <mutex>
#include <atomic>
#include <thread>
#include <functional>
#include <ostream>
#include <iostream>
#include <cstdint>

namespace RDKit {
    class ROMol;
}

namespace specfact {

enum class ErrorCode {
    SUCCESS = 0,
    PARSE_ERROR,
    IO_ERROR,
    CALCULATION_ERROR,
    MEMORY_ERROR,
    NOT_IMPLEMENTED,
    UNKNOWN_ERROR
};

const char* errorCodeToString(ErrorCode code);

class SpectrumException : public std::runtime_error {
private:
    ErrorCode code;

public:
    SpectrumException(const std::string& message, ErrorCode code = ErrorCode::UNKNOWN_ERROR);
    ErrorCode getCode() const;
};

struct Config {
    int numThreads = 1;
    bool verbose = false;
    std::string logLevel = "WARNING";
    size_t batchSize = 64;
    uint64_t seed = 0; // 0 = draw from std::random_device
};

extern Config globalConfig;

namespace util {
    std::string getTimeStamp();
    // Seed 0 asks for a fresh one; the resolved value is never 0 so runs can be replayed.
    uint64_t resolveSeed(uint64_t requested);
    std::string formatDuration(std::chrono::milliseconds duration);
}


enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

LogLevel parseLogLevel(const std::string& name);

class ProgressBar;

// Level-filtered console logger. WARNING and above go to the error stream.
// While a progress bar owns the terminal, messages below ERROR are held back
// and replayed when it finishes.
class Logger {
private:
    struct PendingMessage {
        LogLevel level;
        std::string text;
    };

    LogLevel minLevel;
    std::mutex logMutex;
    std::ostream& out;
    std::ostream& errOut;
    bool colorEnabled;
    ProgressBar* activeProgressBar = nullptr;
    std::vector<PendingMessage> pending;

    std::string formatMessage(LogLevel level, const std::string& message) const;
    std::ostream& streamFor(LogLevel level);
    void emitPending();

public:
    Logger(LogLevel minLevel = LogLevel::WARNING,
           std::ostream& outStream = std::cout,
           std::ostream& errStream = std::cerr,
           bool colorEnabled = true);

    void log(LogLevel level, const std::string& message);
    void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    void info(const std::string& message) { log(LogLevel::INFO, message); }
    void warning(const std::string& message) { log(LogLevel::WARNING, message); }
    void error(const std::string& message) { log(LogLevel::ERROR, message); }
    void fatal(const std::string& message) { log(LogLevel::FATAL, message); }

    void setMinLevel(LogLevel level);
    LogLevel getMinLevel() const { return minLevel; }

    void setActiveProgressBar(ProgressBar* progressBar);
    void clearActiveProgressBar();
};

extern Logger globalLogger;

// One-line batch progress: descriptors done, peak rows emitted, rate and ETA.
// Redrawn from a background thread until finish().
class ProgressBar {
private:
    size_t total;
    std::atomic<size_t> current{0};
    std::atomic<size_t> peakRows{0};
    std::string description;
    std::atomic<bool> active{false};
    std::chrono::steady_clock::time_point startTime;
    std::chrono::milliseconds refreshInterval;
    std::mutex drawMutex;
    std::thread displayThread;

    void displayLoop();
    void draw(bool finished);
    static int terminalWidth();
    static std::string bar(double fraction, int width);

public:
    ProgressBar(size_t total,
                const std::string& description = std::string("Synthesizing"),
                int refreshMs = 100);
    ~ProgressBar();

    void start();
    void update(size_t descriptors, size_t rows = 0);
    void finish();
    double getProgress() const;
    std::chrono::milliseconds getElapsedTime() const;
    std::chrono::milliseconds getEstimatedTimeRemaining() const;
    // Runs callback with the bar line cleared.
    void temporarilyPauseDisplay(const std::function<void()>& callback);
};


// RDKit-backed view of a SMILES string. Used by the command line front end to
// report descriptors RDKit cannot read; synthesis itself works on the raw text.
class Molecule {
private:
    std::shared_ptr<RDKit::ROMol> mol;
    std::string smiles;
    bool valid = false;
    std::string errorMessage;

public:
    explicit Molecule(const std::string& smiles);

    bool parse(const std::string& smiles);
    bool isValid() const { return valid; }
    const std::string& getErrorMessage() const { return errorMessage; }

    const std::string& getSmiles() const { return smiles; }
    int getNumHeavyAtoms() const;
};

} // namespace specfact
