#include "hat_log.hpp"
#include <iostream>
#include <mutex>

static std::mutex g_console_mutex;

const char* to_string(LogLevel level)
{
    switch(level)
    {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warning:
        return "warning";
    case LogLevel::Error:
        return "error";
    }
    return "?";
}

LogSink console_log_sink(LogLevel min_level)
{
    return [min_level](LogLevel level, const std::string& tag, const std::string& message) {
        if(level < min_level)
            return;

        // Linhas de threads diferentes (feeder, IRQ, main) nao podem se misturar
        std::lock_guard<std::mutex> lock(g_console_mutex);
        if(level >= LogLevel::Warning)
            std::cerr << "[" << tag << "] " << message << std::endl;
        else
            std::cout << "[" << tag << "] " << message << std::endl;
    };
}

LogSink null_log_sink()
{
    return [](LogLevel, const std::string&, const std::string&) {};
}
