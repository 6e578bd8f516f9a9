#include "uploadguard/core/time.h"

#include <Poco/DateTimeFormat.h>
#include <Poco/DateTimeFormatter.h>
#include <Poco/Timestamp.h>

namespace uploadguard::core {

std::string NowIso8601() {
    return Poco::DateTimeFormatter::format(Poco::Timestamp(), Poco::DateTimeFormat::ISO8601_FORMAT);
}

std::int64_t NowUnixMillis() {
    return static_cast<std::int64_t>(Poco::Timestamp().epochMicroseconds() / 1000);
}

}  // namespace uploadguard::core
