#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "uploadguard/upload/content_scanner.h"

using uploadguard::upload::kScanWindowBytes;
using uploadguard::upload::LooksMalicious;

TEST(ContentScanner, FlagsScriptBlocks) {
    EXPECT_TRUE(LooksMalicious(std::string("<script>alert(1)</script>")));
    EXPECT_TRUE(LooksMalicious(std::string("GIF89a<SCRIPT src=x>steal()</ScRiPt>")));
}

TEST(ContentScanner, FlagsScriptUrlsAndHandlers) {
    EXPECT_TRUE(LooksMalicious(std::string("<a href=\"javascript:alert(1)\">")));
    EXPECT_TRUE(LooksMalicious(std::string("VBScript:MsgBox")));
    EXPECT_TRUE(LooksMalicious(std::string("<svg onload = \"x()\">")));
    EXPECT_TRUE(LooksMalicious(std::string("<img src=x ONERROR=x()>")));
}

TEST(ContentScanner, IgnoresOrdinaryContent) {
    EXPECT_FALSE(LooksMalicious(std::string("%PDF-1.7\nplain document text")));
    const std::vector<unsigned char> png = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A, 0x00};
    EXPECT_FALSE(LooksMalicious(png));
    EXPECT_FALSE(LooksMalicious(std::string("a <script> tag without a closing tag")));
}

TEST(ContentScanner, OnlyTheFirstKilobyteIsScanned) {
    const std::string padding(kScanWindowBytes, 'A');
    EXPECT_FALSE(LooksMalicious(padding + "javascript:alert(1)"));
    EXPECT_TRUE(LooksMalicious(padding.substr(20) + "javascript:alert(1)"));
}

TEST(ContentScanner, EntityEncodingEvadesTheHeuristic) {
    // Known weakness: the scanner matches raw text and does not decode entities.
    EXPECT_FALSE(LooksMalicious(std::string("<a href=\"java&#x73;cript:alert(1)\">")));
}
