#include "utils/logger.hpp"

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>

#if defined(UUUIDV7_PLATFORM_WINDOWS)
#include <windows.h>
#endif

#include "utils/compiler.hpp"

namespace {
// Префикс сообщений в консоли
constexpr char CONSOLE_PREFIX[] = "UUUIDV7: ";

/**
 * ANSI коды цветов для консольного вывода
 */
namespace ConsoleColor {
constexpr const char *RESET = "\033[0m";
constexpr const char *RED = "\033[31m";
constexpr const char *GREEN = "\033[32m";
constexpr const char *YELLOW = "\033[33m";
constexpr const char *BLUE = "\033[34m";
constexpr const char *MAGENTA = "\033[35m";
constexpr const char *CYAN = "\033[36m";
} // namespace ConsoleColor

const char *levelColor(uuuidv7::utils::LogLevel level)
{
    using uuuidv7::utils::LogLevel;
    switch (level) {
    case LogLevel::TRACE:
        return ConsoleColor::CYAN;
    case LogLevel::DEBUG:
        return ConsoleColor::BLUE;
    case LogLevel::INFO:
        return ConsoleColor::GREEN;
    case LogLevel::WARNING:
        return ConsoleColor::YELLOW;
    case LogLevel::ERROR:
        return ConsoleColor::RED;
    case LogLevel::CRITICAL:
        return ConsoleColor::MAGENTA;
    }
    return ConsoleColor::RESET;
}

/**
 * @brief Получение текущего времени в формате для лога
 * @return Строка с текущим временем в формате "YYYY-MM-DD HH:MM:SS.mmm"
 */
std::string getCurrentTimeFormatted()
{
    const auto now = std::chrono::system_clock::now();
    const auto timeNow = std::chrono::system_clock::to_time_t(now);
    const auto ms
        = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm localTime{};
#if defined(UUUIDV7_PLATFORM_WINDOWS)
    localtime_s(&localTime, &timeNow);
#else
    localtime_r(&timeNow, &localTime);
#endif

    std::ostringstream oss;
    oss << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << ms.count();
    return oss.str();
}

// Имя файла без пути
std::string_view extractFileName(std::string_view fullPath)
{
    const auto pos = fullPath.find_last_of("/\\");
    return pos == std::string_view::npos ? fullPath : fullPath.substr(pos + 1);
}
} // namespace

namespace uuuidv7::utils {
std::string errnoToString(int errnum)
{
    char buffer[128] = { 0 };
#if defined(UUUIDV7_PLATFORM_WINDOWS)
    if (strerror_s(buffer, sizeof(buffer), errnum) == 0) {
        return std::string(buffer);
    }
    return "Unknown error";
#elif defined(UUUIDV7_PLATFORM_UNIX)
#if defined(__GLIBC__) && defined(_GNU_SOURCE)
    // GNU-версия strerror_r возвращает char*
    return std::string(strerror_r(errnum, buffer, sizeof(buffer)));
#else
    // XSI-совместимая версия strerror_r возвращает int
    if (strerror_r(errnum, buffer, sizeof(buffer)) == 0) {
        return std::string(buffer);
    }
    return "Unknown error";
#endif
#else
    UNREACHABLE("Unsupported platform");
#endif
}

Logger &Logger::getInstance()
{
    static Logger instance;
    return instance;
}

Logger::Logger()
    : enabled_(false)
    , minimumLevel_(LogLevel::INFO)
    , consoleOutput_(false)
    , colorOutput_(false)
{
}

void Logger::enable(bool logToConsole, std::optional<std::filesystem::path> logFile,
                    LogLevel minLevel, bool useColors)
{
    std::lock_guard<std::mutex> lock(logMutex_);

    consoleOutput_ = logToConsole;
    colorOutput_ = useColors && isColorSupportedByTerminal();
    minimumLevel_ = minLevel;

    if (logFile_.is_open()) {
        logFile_.close();
    }
    const bool fileOpened = logFile.has_value() && openLogFile(*logFile);

    enabled_ = true;

    if (logFile.has_value() && !fileOpened) {
        write(LogLevel::WARNING, "Не удалось открыть файл лога: " + logFile->string(), __FILE__,
              __LINE__);
    }
    if (useColors && !colorOutput_) {
        write(LogLevel::WARNING,
              "Включена поддержка цветного вывода, однако текущая консоль не поддерживает ANSI "
              "цвета",
              __FILE__, __LINE__);
    }

    std::ostringstream configMsg;
    configMsg << "Логирование включено (минимальный уровень: " << levelToString(minLevel)
              << ", вывод в консоль: " << (consoleOutput_ ? "да" : "нет")
              << ", файл: " << (fileOpened ? logFile->string() : "нет") << ")";
    write(LogLevel::INFO, configMsg.str(), __FILE__, __LINE__);
}

void Logger::disable()
{
    std::lock_guard<std::mutex> lock(logMutex_);
    if (!enabled_) {
        return;
    }

    write(LogLevel::INFO, "Логирование отключено", __FILE__, __LINE__);
    enabled_ = false;
    if (logFile_.is_open()) {
        logFile_.close();
    }
}

bool Logger::isEnabled() const
{
    return enabled_;
}

void Logger::setMinLogLevel(LogLevel level)
{
    std::lock_guard<std::mutex> lock(logMutex_);
    minimumLevel_ = level;
    write(LogLevel::INFO, "Минимальный уровень логирования установлен на " + levelToString(level),
          __FILE__, __LINE__);
}

LogLevel Logger::getMinLogLevel() const
{
    return minimumLevel_;
}

void Logger::setUseColors(bool useColors)
{
    std::lock_guard<std::mutex> lock(logMutex_);
    colorOutput_ = useColors && isColorSupportedByTerminal();
}

bool Logger::getUseColors() const
{
    return colorOutput_;
}

bool Logger::shouldLog(LogLevel level) const
{
    return enabled_ && level >= minimumLevel_;
}

void Logger::log(LogLevel level, const std::string &message, std::string_view file, int line)
{
    if (!shouldLog(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(logMutex_);
    write(level, message, file, line);
}

std::string Logger::levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::TRACE:
        return "TRACE";
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERROR:
        return "ERROR";
    case LogLevel::CRITICAL:
        return "CRITICAL";
    }
    // Вызывается под logMutex_, поэтому без UNREACHABLE
    return "UNKNOWN";
}

void Logger::write(LogLevel level, const std::string &message, std::string_view file, int line)
{
    if (!enabled_ || level < minimumLevel_) {
        return;
    }

    // Формат: [ВРЕМЯ] [УРОВЕНЬ] [ФАЙЛ:СТРОКА] Сообщение
    std::ostringstream oss;
    oss << "[" << getCurrentTimeFormatted() << "] [" << levelToString(level) << "] ";
    if (!file.empty()) {
        oss << "[" << extractFileName(file) << ":" << line << "] ";
    }
    oss << message;
    const auto formatted = oss.str();

    if (consoleOutput_) {
        if (colorOutput_) {
            std::cerr << levelColor(level) << CONSOLE_PREFIX << formatted << ConsoleColor::RESET
                      << std::endl;
        }
        else {
            std::cerr << CONSOLE_PREFIX << formatted << std::endl;
        }
    }

    if (logFile_.is_open()) {
        logFile_ << formatted << std::endl;
    }
}

bool Logger::openLogFile(const std::filesystem::path &path)
{
    std::error_code ec;
    const auto dir = path.parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return false;
        }
    }

    logFile_.open(path, std::ios::out | std::ios::app);
    if (!logFile_) {
        return false;
    }
    logFile_ << "--- UUUIDV7 логирование начато в " << getCurrentTimeFormatted() << " ---"
             << std::endl;
    return true;
}

bool Logger::isColorSupportedByTerminal()
{
#if defined(UUUIDV7_PLATFORM_UNIX)
    const char *term = std::getenv("TERM");
    if (term == nullptr) {
        return false;
    }
    return std::strcmp(term, "dumb") != 0 && std::strcmp(term, "unknown") != 0;
#elif defined(UUUIDV7_PLATFORM_WINDOWS)
    // Флаг ENABLE_VIRTUAL_TERMINAL_PROCESSING означает поддержку ANSI (Windows 10+)
    HANDLE hErr = GetStdHandle(STD_ERROR_HANDLE);
    DWORD mode = 0;
    if (hErr == INVALID_HANDLE_VALUE || !GetConsoleMode(hErr, &mode)) {
        return false;
    }
    return (mode & ENABLE_VIRTUAL_TERMINAL_PROCESSING) != 0;
#else
    return false;
#endif
}

LogStream::LogStream(LogLevel level, std::string_view file, int line)
    : level_(level)
    , file_(file)
    , line_(line)
{
}

LogStream::~LogStream()
{
    Logger::getInstance().log(level_, stream_.str(), file_, line_);
}

} // namespace uuuidv7::utils
