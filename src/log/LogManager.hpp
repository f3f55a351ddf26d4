// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "ILogManager.hpp"
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace vrig
{
    /// @brief Line-buffered logger with relative time stamps.
    /// Lines are kept in memory for the host to display and can optionally be
    /// echoed to a stream as they arrive.
    class LogManager : public ILogManager
    {
    public:
        LogManager();
        explicit LogManager(std::ostream& echo_stream);
        ~LogManager();

        void log(const char* fmt, ...) override;
        void clear() override;

        /// Logged lines, without the time stamp prefix
        std::vector<std::string> messages() const;

        /// Logged lines including time stamps
        const std::vector<std::string>& lines() const;

        size_t size() const;

    private:
        struct Buffer;
        std::unique_ptr<Buffer> buffer_ptr;
        std::ostream* echo = nullptr;
    };
}
