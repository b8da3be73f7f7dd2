#pragma once

#include <spdlog/sinks/ostream_sink.h>

#include <algorithm>
#include <memory>
#include <sstream>
#include <string>

#include "libtune/logging.hpp"

namespace libtune::testing {

// Adds an in-memory sink to the library logger and sets its level while in scope.
class LogCapture {
public:
    explicit LogCapture(spdlog::level::level_enum level)
        : sink_(std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_)),
          previous_level_(logger()->level()) {
        sink_->set_pattern("[%l] %v");
        logger()->sinks().push_back(sink_);
        logger()->set_level(level);
    }

    ~LogCapture() {
        auto& sinks = logger()->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), sink_), sinks.end());
        logger()->set_level(previous_level_);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    [[nodiscard]] std::string text() const { return stream_.str(); }

    [[nodiscard]] bool contains(const std::string& needle) const { return text().find(needle) != std::string::npos; }

private:
    std::ostringstream stream_;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
    spdlog::level::level_enum previous_level_;
};

}  // namespace libtune::testing
