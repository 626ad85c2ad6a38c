#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace uuuidv7::utils {
/**
 * @brief Потокобезопасное преобразование кода ошибки в строковое описание
 * @return Строковое описание ошибки
 */
std::string errnoToString(int errnum);

/**
 * @enum LogLevel
 * @brief Уровни логирования, определяющие важность сообщения
 */
enum class LogLevel {
    TRACE, // Детальная трассировка (каждый сгенерированный UUID)
    DEBUG, // Отладочные сообщения (причины отклонения UUID при декодировании)
    INFO, // Информационные сообщения
    WARNING, // Предупреждения, не являющиеся ошибками
    ERROR, // Ошибки внешних источников (ГСЧ, часы)
    CRITICAL // Критические ошибки, прерывающие работу программы
};

/**
 * @class Logger
 * @brief Управляет логированием сообщений библиотеки
 *
 * Logger является синглтоном. По умолчанию логирование отключено: библиотека
 * ничего не выводит, пока приложение явно не включит логгер.
 */
class Logger {
public:
    /**
     * @brief Получение единственного экземпляра логгера
     * @return Ссылка на экземпляр логгера
     */
    static Logger &getInstance();

    /**
     * @brief Включает логирование
     * @param logToConsole Включить вывод в stderr
     * @param logFile Путь к файлу для логирования (опционально)
     * @param minLevel Минимальный уровень сообщений для логирования
     * @param useColors Использовать цветной вывод в консоли (если поддерживается)
     */
    void enable(bool logToConsole = true,
                std::optional<std::filesystem::path> logFile = std::nullopt,
                LogLevel minLevel = LogLevel::INFO, bool useColors = true);

    /**
     * @brief Отключает логирование и закрывает файл лога
     */
    void disable();

    bool isEnabled() const;

    void setMinLogLevel(LogLevel level);
    LogLevel getMinLogLevel() const;

    /**
     * @brief Включение или отключение цветного вывода в консоль
     * @param useColors true для использования цветного вывода, false для обычного текста
     */
    void setUseColors(bool useColors);
    bool getUseColors() const;

    /**
     * @brief Проверяет, будет ли записано сообщение указанного уровня
     * @param level Уровень сообщения
     */
    bool shouldLog(LogLevel level) const;

    /**
     * @brief Логирование сообщения с указанным уровнем
     * @param level Уровень сообщения
     * @param message Текст сообщения
     * @param file Имя файла, из которого вызвана функция логирования
     * @param line Номер строки, из которой вызвана функция логирования
     */
    void log(LogLevel level, const std::string &message, std::string_view file = {},
             int line = 0);

    static std::string levelToString(LogLevel level);

private:
    Logger();
    ~Logger() = default;
    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    std::atomic<bool> enabled_;
    std::atomic<LogLevel> minimumLevel_;
    bool consoleOutput_; // Вывод в stderr
    bool colorOutput_; // Цветной вывод в stderr
    std::ofstream logFile_; // Открытый файл лога
    std::mutex logMutex_; // Защищает настройки вывода и сами потоки

    // Вызываются под logMutex_
    void write(LogLevel level, const std::string &message, std::string_view file, int line);
    bool openLogFile(const std::filesystem::path &path);

    static bool isColorSupportedByTerminal();
};

/**
 * @brief Вспомогательный класс для логирования с использованием потокового синтаксиса
 *
 * Сообщение отправляется в логгер в деструкторе.
 */
class LogStream {
public:
    LogStream(LogLevel level, std::string_view file, int line);
    ~LogStream();

    template <typename T> LogStream &operator<<(const T &val)
    {
        stream_ << val;
        return *this;
    }

private:
    LogLevel level_;
    std::ostringstream stream_;
    std::string_view file_;
    int line_;
};

} // namespace uuuidv7::utils

// Макросы для удобного логирования с автоматическим указанием файла и строки.
// Аргументы оператора << не вычисляются, если уровень отфильтрован.
#define UUUIDV7_LOG(level)                                                                         \
    if (!uuuidv7::utils::Logger::getInstance().shouldLog(level)) {                                 \
    }                                                                                              \
    else                                                                                           \
        uuuidv7::utils::LogStream(level, __FILE__, __LINE__)

#define LOG_TRACE UUUIDV7_LOG(uuuidv7::utils::LogLevel::TRACE)
#define LOG_DEBUG UUUIDV7_LOG(uuuidv7::utils::LogLevel::DEBUG)
#define LOG_INFO UUUIDV7_LOG(uuuidv7::utils::LogLevel::INFO)
#define LOG_WARNING UUUIDV7_LOG(uuuidv7::utils::LogLevel::WARNING)
#define LOG_ERROR UUUIDV7_LOG(uuuidv7::utils::LogLevel::ERROR)
#define LOG_CRITICAL UUUIDV7_LOG(uuuidv7::utils::LogLevel::CRITICAL)
