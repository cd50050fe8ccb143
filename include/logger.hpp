#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <functional>
#include <mutex>
#include <string>


///////////////////////////
///       LOGGER        ///
///////////////////////////
/**
 * @brief Thread-safe line logger.
 *
 * Each call takes one static mutex, writes the whole line and flushes, so a
 * background resolve and concurrent move validations never interleave.
 *
 *  - Info  -> stdout
 *  - Debug -> stdout, only when debug output is enabled (ROTATION_DEBUG or config)
 *  - Warn  -> stderr
 *  - Error -> stderr
 */
class Logger {
public:
    static void Info(const std::string& line);
    static void Debug(const std::string& line);
    static void Warn(const std::string& line);
    static void Error(const std::string& line);

    /// Force debug output on or off (the ROTATION_DEBUG variable also enables it).
    static void SetDebug(bool enabled);
    static bool DebugEnabled();

    /**
     * @brief Capture every line in addition to the streams (tests).
     *
     * The sink receives the level name and the line. Pass nullptr to clear.
     */
    static void SetSink(std::function<void(const char*, const std::string&)> sink);

private:
    static std::mutex mutex_;
    static bool debug_;
    static std::function<void(const char*, const std::string&)> sink_;
};
