#include "domain/Types.hpp"

#include <cctype>

#include "domain/Errors.hpp"

namespace phub::domain {

const char* toString(ConnectorStatus status) noexcept {
    switch (status) {
        case ConnectorStatus::Disconnected:
            return "Disconnected";
        case ConnectorStatus::Connecting:
            return "Connecting";
        case ConnectorStatus::Connected:
            return "Connected";
    }
    return "Unknown";
}

const char* toString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::UnsupportedSymbol:
            return "UnsupportedSymbol";
        case ErrorKind::ConnectFailure:
            return "ConnectFailure";
        case ErrorKind::ConnectionUnavailable:
            return "ConnectionUnavailable";
        case ErrorKind::Timeout:
            return "Timeout";
        case ErrorKind::Cancelled:
            return "Cancelled";
    }
    return "Unknown";
}

std::string normalizeSymbol(std::string_view symbol) {
    std::size_t start = 0;
    while (start < symbol.size() && std::isspace(static_cast<unsigned char>(symbol[start]))) {
        ++start;
    }
    std::size_t end = symbol.size();
    while (end > start && std::isspace(static_cast<unsigned char>(symbol[end - 1]))) {
        --end;
    }

    std::string result;
    result.reserve(end - start);
    for (std::size_t i = start; i < end; ++i) {
        result.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(symbol[i]))));
    }
    return result;
}

std::int64_t toEpochMs(TimePoint tp) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint fromEpochMs(std::int64_t ms) noexcept {
    return TimePoint{std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds{ms})};
}

}  // namespace phub::domain
