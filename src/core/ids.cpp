#include "uploadguard/core/ids.h"

#include <vector>

#include <Poco/DigestEngine.h>
#include <Poco/UUIDGenerator.h>

#include <openssl/rand.h>

namespace uploadguard::core {

std::string GenerateRequestId() {
    return Poco::UUIDGenerator().createOne().toString();
}

Result<std::string> RandomHex(std::size_t byte_count) {
    Poco::DigestEngine::Digest bytes(byte_count);
    if (byte_count > 0 && RAND_bytes(bytes.data(), static_cast<int>(byte_count)) != 1) {
        return Error{ErrorCode::kInternal, "random number generator failure"};
    }
    return Poco::DigestEngine::digestToHex(bytes);
}

}  // namespace uploadguard::core
