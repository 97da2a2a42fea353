module;
#include <format>
#include <functional>
#include <string_view>
#include <utility>

export module Core.Logging;

export namespace Core::Log {

    // Ordered by severity; SetMinLevel drops everything below the threshold.
    enum class Level {
        Debug,
        Info,
        Warning,
        Error
    };

    // Receives every line that passes the level filter. An empty sink restores
    // the coloured console output.
    using Sink = std::function<void(Level, std::string_view)>;

    void SetSink(Sink sink);
    void SetMinLevel(Level level);
    [[nodiscard]] Level GetMinLevel();
    [[nodiscard]] std::string_view LevelLabel(Level level);

    // Defined in Core.Logging.cpp. Serialized by a global lock so lines from
    // several threads never interleave.
    void Write(Level level, std::string_view msg);

    // -------------------------------------------------------------------------
    // Public API
    // -------------------------------------------------------------------------

    template<typename... Args>
    void Info(std::format_string<Args...> fmt, Args&&... args) {
        Write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Warn(std::format_string<Args...> fmt, Args&&... args) {
        Write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Error(std::format_string<Args...> fmt, Args&&... args) {
        Write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
    }

    // Only prints in Debug builds
    template<typename... Args>
    void Debug([[maybe_unused]] std::format_string<Args...> fmt, [[maybe_unused]] Args&&... args) {
#ifndef NDEBUG
        Write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
#endif
    }
}
