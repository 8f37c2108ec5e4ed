#include <dufs_mcp/core/time.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace dufs_mcp {

Clock SystemClock() {
    return [] { return std::chrono::system_clock::now(); };
}

std::string FormatRfc3339(Timestamp ts) {
    const auto time_t_ts = std::chrono::system_clock::to_time_t(ts);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
    }

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &time_t_ts);
#else
    gmtime_r(&time_t_ts, &utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << 'Z';
    return oss.str();
}

std::string FormatDateStamp(Timestamp ts) {
    const auto time_t_ts = std::chrono::system_clock::to_time_t(ts);

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &time_t_ts);
#else
    localtime_r(&time_t_ts, &local);
#endif

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y%m%d");
    return oss.str();
}

} // namespace dufs_mcp
