#ifndef HAT_LOG_HPP
#define HAT_LOG_HPP

#include <functional>
#include <string>

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

// Destino dos logs, injetado em cada componente (sem logger global)
using LogSink = std::function<void(LogLevel, const std::string& tag, const std::string& message)>;

// "[TAG] mensagem" em stdout (debug/info) ou stderr (warning/error), igual ao journalctl espera
LogSink console_log_sink(LogLevel min_level = LogLevel::Info);

// Descarta tudo
LogSink null_log_sink();

const char* to_string(LogLevel level);

#endif
