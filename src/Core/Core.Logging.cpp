module;

#include <iostream>
#include <mutex>
#include <string_view>
#include <utility>

module Core.Logging;

namespace Core::Log
{
    namespace
    {
        std::mutex s_LogMutex;
        Sink s_Sink;
        Level s_MinLevel = Level::Debug;

        const char* LevelColor(Level level)
        {
            switch (level) {
            case Level::Info:    return "\033[32m"; // Green
            case Level::Warning: return "\033[33m"; // Yellow
            case Level::Error:   return "\033[31m"; // Red
            case Level::Debug:   return "\033[36m"; // Cyan
            }
            return "\033[0m";
        }
    }

    std::string_view LevelLabel(Level level)
    {
        switch (level) {
        case Level::Info:    return "[INFO] ";
        case Level::Warning: return "[WARN] ";
        case Level::Error:   return "[ERR]  ";
        case Level::Debug:   return "[DBG]  ";
        }
        return "[?]    ";
    }

    void SetSink(Sink sink)
    {
        std::lock_guard lock(s_LogMutex);
        s_Sink = std::move(sink);
    }

    void SetMinLevel(Level level)
    {
        std::lock_guard lock(s_LogMutex);
        s_MinLevel = level;
    }

    Level GetMinLevel()
    {
        std::lock_guard lock(s_LogMutex);
        return s_MinLevel;
    }

    void Write(Level level, std::string_view msg)
    {
        std::lock_guard lock(s_LogMutex);
        if (level < s_MinLevel) return;

        if (s_Sink)
        {
            s_Sink(level, msg);
            return;
        }

        // Warnings and errors go to stderr so they survive stdout redirection.
        std::ostream& out = level >= Level::Warning ? std::cerr : std::cout;
        out << LevelColor(level) << LevelLabel(level) << msg << "\033[0m" << std::endl;
    }
}
