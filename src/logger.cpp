///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "logger.hpp"
#include <cstdlib>
#include <iostream>
#include <utility>


///////////////////////////
///       LOGGER        ///
///////////////////////////
std::mutex Logger::mutex_;
bool Logger::debug_ = false;
std::function<void(const char*, const std::string&)> Logger::sink_;

void Logger::SetDebug(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    debug_ = enabled;
}

/// ROTATION_DEBUG is read once, on the first check.
bool Logger::DebugEnabled() {
    static const bool fromEnvironment = std::getenv("ROTATION_DEBUG") != nullptr;
    std::lock_guard<std::mutex> lock(mutex_);
    return debug_ || fromEnvironment;
}

void Logger::SetSink(std::function<void(const char*, const std::string&)> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Logger::Info(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) sink_("INFO", line);
    std::cout << line << '\n';
    std::cout.flush();
}

void Logger::Debug(const std::string& line) {
    if (!DebugEnabled()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) sink_("DEBUG", line);
    std::cout << "[debug] " << line << '\n';
    std::cout.flush();
}

void Logger::Warn(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) sink_("WARN", line);
    std::cerr << "[warn] " << line << '\n';
    std::cerr.flush();
}

void Logger::Error(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) sink_("ERROR", line);
    std::cerr << "[error] " << line << '\n';
    std::cerr.flush();
}
