#include "uploadguard/upload/content_scanner.h"

#include <algorithm>
#include <memory>

#include <Poco/RegularExpression.h>

namespace uploadguard::upload {

namespace {

using PatternList = std::vector<std::unique_ptr<Poco::RegularExpression>>;

const PatternList& Patterns() {
    static const PatternList kPatterns = [] {
        const int options = Poco::RegularExpression::RE_CASELESS;
        PatternList patterns;
        patterns.push_back(std::make_unique<Poco::RegularExpression>(
            R"(<script\b[^<]*(?:(?!</script>)<[^<]*)*</script>)", options));
        patterns.push_back(std::make_unique<Poco::RegularExpression>(R"(javascript:)", options));
        patterns.push_back(std::make_unique<Poco::RegularExpression>(R"(vbscript:)", options));
        patterns.push_back(std::make_unique<Poco::RegularExpression>(R"(onload\s*=)", options));
        patterns.push_back(std::make_unique<Poco::RegularExpression>(R"(onerror\s*=)", options));
        return patterns;
    }();
    return kPatterns;
}

}  // namespace

bool LooksMalicious(const std::string& leading_text) {
    // Bytes are matched as-is; invalid UTF-8 cannot form any of the ASCII patterns.
    const std::string window = leading_text.substr(0, std::min(leading_text.size(),
                                                               kScanWindowBytes));
    for (const auto& pattern : Patterns()) {
        Poco::RegularExpression::Match match;
        if (pattern->match(window, 0, match) > 0) {
            return true;
        }
    }
    return false;
}

bool LooksMalicious(const std::vector<unsigned char>& leading_bytes) {
    const auto count = std::min(leading_bytes.size(), kScanWindowBytes);
    return LooksMalicious(
        std::string(reinterpret_cast<const char*>(leading_bytes.data()), count));
}

}  // namespace uploadguard::upload
