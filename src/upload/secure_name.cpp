#include "uploadguard/upload/secure_name.h"

#include "uploadguard/core/ids.h"
#include "uploadguard/core/time.h"
#include "uploadguard/upload/filename_sanitizer.h"

namespace uploadguard::upload {

core::Result<std::string> GenerateSecureName(const std::string& original_name) {
    auto random = core::RandomHex(kSecureNameRandomBytes);
    if (!random.ok()) {
        return random.error();
    }
    return std::to_string(core::NowUnixMillis()) + "_" + random.value() +
           ExtensionOf(original_name);
}

}  // namespace uploadguard::upload
