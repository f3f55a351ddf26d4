// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "LogManager.hpp"
#include <cstdarg>
#include <cstdio>
#include <string>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace
{
    std::string format_string(const char* fmt, va_list args)
    {
        va_list args_copy;
        va_copy(args_copy, args);
        int length = vsnprintf(nullptr, 0, fmt, args_copy);
        va_end(args_copy);

        if (length <= 0)
            return {};

        std::string buffer(length, '\0');
        vsnprintf(buffer.data(), length + 1, fmt, args);
        return buffer;
    }

    std::string relative_time_string()
    {
        using namespace std::chrono;
        static auto start = steady_clock::now();
        auto now = steady_clock::now();
        auto elapsed = duration_cast<milliseconds>(now - start);

        int seconds = static_cast<int>(elapsed.count() / 1000);
        int millis = static_cast<int>(elapsed.count() % 1000);

        std::ostringstream oss;
        oss << "[+" << seconds << '.' << std::setw(3) << std::setfill('0') << millis << ']';
        return oss.str();
    }
}

namespace vrig
{
    struct LogManager::Buffer
    {
        std::vector<std::string> lines;
        std::vector<size_t> message_offsets; // Start of message text within each line

        void clear()
        {
            lines.clear();
            message_offsets.clear();
        }

        void add_line(const std::string& prefix, const std::string& text)
        {
            message_offsets.push_back(prefix.size() + 1);
            lines.push_back(prefix + " " + text);
        }
    };

    LogManager::LogManager()
        : buffer_ptr(std::make_unique<Buffer>())
    {
    }

    LogManager::LogManager(std::ostream& echo_stream)
        : buffer_ptr(std::make_unique<Buffer>())
        , echo(&echo_stream)
    {
    }

    LogManager::~LogManager() = default;

    void LogManager::log(const char* fmt, ...)
    {
        va_list args;
        va_start(args, fmt);
        std::string formatted = format_string(fmt, args);
        va_end(args);

        buffer_ptr->add_line(relative_time_string(), formatted);

        if (echo)
            (*echo) << buffer_ptr->lines.back() << '\n';
    }

    void LogManager::clear()
    {
        buffer_ptr->clear();
    }

    std::vector<std::string> LogManager::messages() const
    {
        std::vector<std::string> result;
        result.reserve(buffer_ptr->lines.size());
        for (size_t i = 0; i < buffer_ptr->lines.size(); ++i)
            result.push_back(buffer_ptr->lines[i].substr(buffer_ptr->message_offsets[i]));
        return result;
    }

    const std::vector<std::string>& LogManager::lines() const
    {
        return buffer_ptr->lines;
    }

    size_t LogManager::size() const
    {
        return buffer_ptr->lines.size();
    }
}
