#include "log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace Dockwire::Log {
    namespace {
        std::mutex outputMutex;

        Level initialThreshold() {
            const char* value = std::getenv("DOCKWIRE_LOG");
            return value == nullptr ? Level::Warn : parseLevel(value, Level::Warn);
        }

        std::atomic<Level>& current() {
            static std::atomic<Level> level{initialThreshold()};
            return level;
        }

        const char* label(Level level) {
            switch (level) {
                case Level::Trace: return "trace";
                case Level::Debug: return "debug";
                case Level::Info: return "info";
                case Level::Warn: return "warn";
                case Level::Error: return "error";
                case Level::Off: return "off";
            }
            return "?";
        }
    }

    Level threshold() {
        return current().load(std::memory_order_relaxed);
    }

    void setThreshold(Level level) {
        current().store(level, std::memory_order_relaxed);
    }

    Level parseLevel(const std::string& name, Level fallback) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
        if (lower == "trace") return Level::Trace;
        if (lower == "debug") return Level::Debug;
        if (lower == "info") return Level::Info;
        if (lower == "warn" || lower == "warning") return Level::Warn;
        if (lower == "error") return Level::Error;
        if (lower == "off" || lower == "none") return Level::Off;
        return fallback;
    }

    void write(Level level, const std::string& message) {
        if (level == Level::Off || !enabled(level)) return;
        std::lock_guard<std::mutex> lock(outputMutex);
        std::cerr << "[dockwire] [" << label(level) << "] " << message << std::endl;
    }
}
