#include "uploadguard/upload/filename_sanitizer.h"

#include <cctype>

namespace uploadguard::upload {

namespace {

constexpr std::size_t kMaxFilenameBytes = 255;

bool IsDangerousChar(unsigned char c) {
    if (c < 0x20) {
        return true;
    }
    switch (c) {
        case '<':
        case '>':
        case ':':
        case '"':
        case '/':
        case '\\':
        case '|':
        case '?':
        case '*':
            return true;
        default:
            return false;
    }
}

bool IsReservedDeviceName(const std::string& upper_stem) {
    if (upper_stem == "CON" || upper_stem == "PRN" || upper_stem == "AUX" ||
        upper_stem == "NUL") {
        return true;
    }
    if (upper_stem.size() == 4) {
        const auto prefix = upper_stem.substr(0, 3);
        const char digit = upper_stem[3];
        return (prefix == "COM" || prefix == "LPT") && digit >= '1' && digit <= '9';
    }
    return false;
}

// Index of the dot that starts the extension, or npos. A leading dot does not count.
std::string::size_type ExtensionDot(const std::string& filename) {
    const auto dot = filename.find_last_of('.');
    if (dot == std::string::npos || dot == 0) {
        return std::string::npos;
    }
    return dot;
}

}  // namespace

bool IsSafeFilename(const std::string& filename) {
    if (filename.empty() || filename.size() > kMaxFilenameBytes) {
        return false;
    }
    if (filename == "." || filename == "..") {
        return false;
    }
    for (char c : filename) {
        if (IsDangerousChar(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    std::string upper = StemOf(filename);
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return !IsReservedDeviceName(upper);
}

std::string ExtensionOf(const std::string& filename) {
    const auto dot = ExtensionDot(filename);
    if (dot == std::string::npos) {
        return "";
    }
    std::string extension = filename.substr(dot);
    for (auto& c : extension) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return extension;
}

std::string StemOf(const std::string& filename) {
    const auto dot = ExtensionDot(filename);
    if (dot == std::string::npos) {
        return filename;
    }
    return filename.substr(0, dot);
}

}  // namespace uploadguard::upload
