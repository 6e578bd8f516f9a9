#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "uploadguard/upload/signature_verifier.h"

using uploadguard::upload::HasSignature;
using uploadguard::upload::MatchesSignature;

namespace {

std::vector<unsigned char> Bytes(const std::string& text) {
    return std::vector<unsigned char>(text.begin(), text.end());
}

}  // namespace

TEST(SignatureVerifier, AcceptsGenuineHeaders) {
    EXPECT_TRUE(MatchesSignature({0xFF, 0xD8, 0xFF, 0xE0, 0x00}, "image/jpeg"));
    EXPECT_TRUE(MatchesSignature({0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A, 0x00},
                                 "image/png"));
    EXPECT_TRUE(MatchesSignature(Bytes("GIF89a"), "image/gif"));
    EXPECT_TRUE(MatchesSignature(Bytes("RIFF\x24\x10\x01\x02WEBP"), "image/webp"));
    EXPECT_TRUE(MatchesSignature(Bytes("%PDF-1.7\n"), "application/pdf"));
    EXPECT_TRUE(MatchesSignature({0xFF, 0xFB, 0x90, 0x44}, "audio/mpeg"));
}

TEST(SignatureVerifier, Mp4BoxTypeSitsAtOffsetFour) {
    EXPECT_TRUE(MatchesSignature(Bytes(std::string("\x00\x00\x00\x18", 4) + "ftypmp42"),
                                 "video/mp4"));
    EXPECT_FALSE(MatchesSignature(Bytes("ftypmp42"), "video/mp4"));
}

TEST(SignatureVerifier, RejectsDisguisedPayload) {
    EXPECT_FALSE(MatchesSignature(Bytes("<html><script>alert(1)</script>"), "image/png"));
    EXPECT_FALSE(MatchesSignature(Bytes("MZ\x90\x00"), "image/jpeg"));
}

TEST(SignatureVerifier, ShortInputIsAMismatch) {
    EXPECT_FALSE(MatchesSignature({}, "image/jpeg"));
    EXPECT_FALSE(MatchesSignature({0xFF, 0xD8}, "image/jpeg"));
    EXPECT_FALSE(MatchesSignature({0x00, 0x00, 0x00, 0x18, 'f', 't'}, "video/mp4"));
}

TEST(SignatureVerifier, UnmappedTypesAreNotChecked) {
    // Known gap: types without a table entry pass regardless of content.
    EXPECT_FALSE(HasSignature("audio/wav"));
    EXPECT_FALSE(HasSignature("text/plain"));
    EXPECT_TRUE(MatchesSignature(Bytes("<html>not audio</html>"), "audio/wav"));
    EXPECT_TRUE(HasSignature("image/png"));
}
