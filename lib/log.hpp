#pragma once

#include <string>

// Leveled stderr logging. The threshold comes from DOCKWIRE_LOG on first use.
namespace Dockwire::Log {
    enum class Level { Trace, Debug, Info, Warn, Error, Off };

    Level threshold();
    void setThreshold(Level level);
    Level parseLevel(const std::string& name, Level fallback);

    void write(Level level, const std::string& message);

    inline bool enabled(Level level) { return level >= threshold(); }

    inline void trace(const std::string& message) { write(Level::Trace, message); }
    inline void debug(const std::string& message) { write(Level::Debug, message); }
    inline void info(const std::string& message) { write(Level::Info, message); }
    inline void warn(const std::string& message) { write(Level::Warn, message); }
    inline void error(const std::string& message) { write(Level::Error, message); }
}
