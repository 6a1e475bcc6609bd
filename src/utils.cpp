#include "utils.hpp"

#include <GraphMol/GraphMol.h>
#include <GraphMol/SmilesParse/SmilesParse.h>
#include <GraphMol/SmilesParse/SmilesWrite.h>

#include <unistd.h>
#include <sys/ioctl.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <random>
#include <sstream>

namespace specfact {

Config globalConfig;
Logger globalLogger(LogLevel::WARNING, std::cout, std::cerr, true);

const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:           return "success";
        case ErrorCode::PARSE_ERROR:       return "parse error";
        case ErrorCode::IO_ERROR:          return "I/O error";
        case ErrorCode::CALCULATION_ERROR: return "calculation error";
        case ErrorCode::MEMORY_ERROR:      return "memory error";
        case ErrorCode::NOT_IMPLEMENTED:   return "not implemented";
        case ErrorCode::UNKNOWN_ERROR:     break;
    }
    return "unknown error";
}

SpectrumException::SpectrumException(const std::string& message, ErrorCode code)
    : std::runtime_error(message), code(code) {}

ErrorCode SpectrumException::getCode() const { return code; }

namespace util {

std::string getTimeStamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::ostringstream ss;
    ss << std::put_time(std::localtime(&now), "%Y-%m-%dT%H:%M:%S");
    return ss.str();
}

uint64_t resolveSeed(uint64_t requested) {
    if (requested != 0) return requested;
    std::random_device rd;
    const uint64_t seed = (static_cast<uint64_t>(rd()) << 32) ^ rd();
    return seed == 0 ? 1 : seed;
}

std::string formatDuration(std::chrono::milliseconds duration) {
    const long long totalSeconds = std::max<long long>(0, duration.count() / 1000);
    std::ostringstream ss;
    ss << std::setfill('0');
    if (totalSeconds >= 3600) {
        ss << totalSeconds / 3600 << ":" << std::setw(2) << (totalSeconds % 3600) / 60 << ":"
           << std::setw(2) << totalSeconds % 60;
    } else {
        ss << std::setw(2) << totalSeconds / 60 << ":" << std::setw(2) << totalSeconds % 60;
    }
    return ss.str();
}

} // namespace util

LogLevel parseLogLevel(const std::string& name) {
    std::string upper(name.size(), ' ');
    std::transform(name.begin(), name.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "FATAL") return LogLevel::FATAL;
    throw SpectrumException("Unknown log level: " + name, ErrorCode::PARSE_ERROR);
}

// --- Logger ---
namespace {

struct LevelStyle {
    const char* tag;
    const char* color;
};

const LevelStyle& styleFor(LogLevel level) {
    static const LevelStyle styles[] = {
        {"DEBUG",   "\033[38;5;246m"},
        {"INFO",    "\033[38;5;39m"},
        {"WARNING", "\033[38;5;214m"},
        {"ERROR",   "\033[38;5;196m"},
        {"FATAL",   "\033[1;38;5;201m"},
    };
    return styles[static_cast<int>(level)];
}

} // namespace

Logger::Logger(LogLevel minLevel, std::ostream& outStream, std::ostream& errStream, bool colorEnabled)
    : minLevel(minLevel), out(outStream), errOut(errStream), colorEnabled(colorEnabled) {}

std::string Logger::formatMessage(LogLevel level, const std::string& message) const {
    const LevelStyle& style = styleFor(level);
    std::ostringstream ss;
    if (colorEnabled && isatty(fileno(stderr))) {
        ss << style.color << "[" << style.tag << "]\033[0m " << message;
    } else {
        ss << "[" << style.tag << "] " << message;
    }
    return ss.str();
}

std::ostream& Logger::streamFor(LogLevel level) {
    return level >= LogLevel::WARNING ? errOut : out;
}

void Logger::emitPending() {
    for (const auto& message : pending) {
        streamFor(message.level) << formatMessage(message.level, message.text) << std::endl;
    }
    pending.clear();
}

void Logger::log(LogLevel level, const std::string& message) {
    if (level < minLevel) return;
    std::lock_guard<std::mutex> lock(logMutex);

    if (!activeProgressBar) {
        streamFor(level) << formatMessage(level, message) << std::endl;
        return;
    }
    if (level < LogLevel::ERROR) {
        pending.push_back({level, message});
        return;
    }
    // Errors break through the bar immediately, after anything held back.
    activeProgressBar->temporarilyPauseDisplay([this, level, &message]() {
        emitPending();
        streamFor(level) << formatMessage(level, message) << std::endl;
    });
}

void Logger::setMinLevel(LogLevel level) { minLevel = level; }

void Logger::setActiveProgressBar(ProgressBar* progressBar) {
    std::lock_guard<std::mutex> lock(logMutex);
    activeProgressBar = progressBar;
    pending.clear();
}

void Logger::clearActiveProgressBar() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (!activeProgressBar) return;
    activeProgressBar = nullptr;
    emitPending();
}

// --- ProgressBar ---
ProgressBar::ProgressBar(size_t total, const std::string& description, int refreshMs)
    : total(total), description(description), refreshInterval(std::max(10, refreshMs)) {}

ProgressBar::~ProgressBar() {
    finish();
}

void ProgressBar::start() {
    if (active.exchange(true)) return;
    startTime = std::chrono::steady_clock::now();
    globalLogger.setActiveProgressBar(this);
    displayThread = std::thread(&ProgressBar::displayLoop, this);
}

void ProgressBar::update(size_t descriptors, size_t rows) {
    current.fetch_add(descriptors, std::memory_order_relaxed);
    peakRows.fetch_add(rows, std::memory_order_relaxed);
}

void ProgressBar::finish() {
    if (!active.exchange(false)) return;
    if (displayThread.joinable()) {
        displayThread.join();
    }
    draw(true);
    globalLogger.clearActiveProgressBar();
}

double ProgressBar::getProgress() const {
    if (total == 0) return 0.0;
    return std::min(static_cast<double>(current.load(std::memory_order_relaxed)) / total, 1.0);
}

std::chrono::milliseconds ProgressBar::getElapsedTime() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime);
}

std::chrono::milliseconds ProgressBar::getEstimatedTimeRemaining() const {
    const double fraction = getProgress();
    const double elapsed = static_cast<double>(getElapsedTime().count());
    if (fraction <= 1e-6 || elapsed <= 0.0) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::milliseconds(static_cast<long long>(std::max(0.0, elapsed / fraction - elapsed)));
}

void ProgressBar::displayLoop() {
    while (active.load()) {
        draw(false);
        std::this_thread::sleep_for(refreshInterval);
    }
}

int ProgressBar::terminalWidth() {
    struct winsize w;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return std::clamp(static_cast<int>(w.ws_col), 40, 250);
    }
    if (const char* columns = std::getenv("COLUMNS")) {
        return std::clamp(std::atoi(columns), 40, 250);
    }
    return 80;
}

std::string ProgressBar::bar(double fraction, int width) {
    const int filled = static_cast<int>(std::round(fraction * width));
    std::string cells;
    for (int i = 0; i < width; ++i) {
        cells += i < filled ? "█" : "░";
    }
    return "\033[38;5;39m" + cells + "\033[0m";
}

void ProgressBar::draw(bool finished) {
    std::lock_guard<std::mutex> lock(drawMutex);
    const size_t done = finished ? total : current.load(std::memory_order_relaxed);
    const size_t rows = peakRows.load(std::memory_order_relaxed);
    const int width = terminalWidth();
    const double seconds = getElapsedTime().count() / 1000.0;

    std::ostringstream line;
    line << "\r\033[K";
    if (finished) {
        const double rate = seconds > 0.01 ? current.load() / seconds : 0.0;
        line << "\033[38;5;40m✓\033[0m " << description << " \033[1m" << current.load() << "\033[0m descriptors, "
             << rows << " peak rows, " << std::fixed << std::setprecision(1) << rate << " /s in "
             << util::formatDuration(getElapsedTime()) << "\n";
    } else {
        const double fraction = total == 0 ? 0.0 : std::min(static_cast<double>(done) / total, 1.0);
        line << description << " " << bar(fraction, std::clamp(width / 4, 10, 40)) << " "
             << std::setw(3) << static_cast<int>(fraction * 100) << "% \033[1m" << done << "/" << total << "\033[0m";
        if (width >= 70) {
            line << " " << rows << " peaks";
        }
        if (width >= 90) {
            line << " \033[38;5;105mETA " << util::formatDuration(getEstimatedTimeRemaining()) << "\033[0m";
        }
    }
    std::cout << line.str() << std::flush;
}

void ProgressBar::temporarilyPauseDisplay(const std::function<void()>& callback) {
    std::lock_guard<std::mutex> lock(drawMutex);
    std::cout << "\r\033[K" << std::flush;
    callback();
}

// --- Molecule ---
Molecule::Molecule(const std::string& smilesStr) {
    parse(smilesStr);
}

bool Molecule::parse(const std::string& smilesStr) {
    mol.reset();
    smiles.clear();
    valid = false;
    errorMessage.clear();

    if (smilesStr.empty()) {
        errorMessage = "empty SMILES";
        return false;
    }

    try {
        std::shared_ptr<RDKit::ROMol> parsed(RDKit::SmilesToMol(smilesStr));
        if (!parsed) {
            errorMessage = "not a valid SMILES string";
            return false;
        }
        smiles = RDKit::MolToSmiles(*parsed);
        mol = std::move(parsed);
        valid = true;
    } catch (const RDKit::MolSanitizeException& e) {
        errorMessage = "sanitization failed: " + std::string(e.what());
    } catch (const std::exception& e) {
        errorMessage = e.what();
    }
    return valid;
}

int Molecule::getNumHeavyAtoms() const {
    return mol ? static_cast<int>(mol->getNumHeavyAtoms()) : 0;
}

} // namespace specfact
