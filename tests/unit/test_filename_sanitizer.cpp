#include <string>

#include <gtest/gtest.h>

#include "uploadguard/upload/filename_sanitizer.h"

using uploadguard::upload::ExtensionOf;
using uploadguard::upload::IsSafeFilename;
using uploadguard::upload::StemOf;

TEST(FilenameSanitizer, AcceptsOrdinaryNames) {
    EXPECT_TRUE(IsSafeFilename("photo.jpg"));
    EXPECT_TRUE(IsSafeFilename("Family Reunion 2023.PNG"));
    EXPECT_TRUE(IsSafeFilename("console.txt"));
    EXPECT_TRUE(IsSafeFilename("com10.txt"));
}

TEST(FilenameSanitizer, RejectsTraversal) {
    EXPECT_FALSE(IsSafeFilename("../secret.jpg"));
    EXPECT_FALSE(IsSafeFilename(".."));
    EXPECT_FALSE(IsSafeFilename("."));
    EXPECT_FALSE(IsSafeFilename("a/b.png"));
    EXPECT_FALSE(IsSafeFilename("a\\b.png"));
}

TEST(FilenameSanitizer, RejectsDangerousCharacters) {
    for (const char* name : {"a<b.jpg", "a>b.jpg", "c:x.jpg", "q\"x.jpg", "p|x.jpg", "w?x.jpg",
                             "s*x.jpg"}) {
        EXPECT_FALSE(IsSafeFilename(name)) << name;
    }
    EXPECT_FALSE(IsSafeFilename(std::string("null\0byte.jpg", 13)));
    EXPECT_FALSE(IsSafeFilename("tab\tname.jpg"));
}

TEST(FilenameSanitizer, RejectsReservedDeviceNames) {
    EXPECT_FALSE(IsSafeFilename("CON.jpg"));
    EXPECT_FALSE(IsSafeFilename("con.jpg"));
    EXPECT_FALSE(IsSafeFilename("nul"));
    EXPECT_FALSE(IsSafeFilename("Com1.png"));
    EXPECT_FALSE(IsSafeFilename("LPT9.pdf"));
}

TEST(FilenameSanitizer, RejectsEmptyAndOverlongNames) {
    EXPECT_FALSE(IsSafeFilename(""));
    EXPECT_TRUE(IsSafeFilename(std::string(251, 'a') + ".jpg"));
    EXPECT_FALSE(IsSafeFilename(std::string(252, 'a') + ".jpg"));
}

TEST(FilenameSanitizer, ExtensionIsLowerCasedAndDotPrefixed) {
    EXPECT_EQ(ExtensionOf("PHOTO.JPG"), ".jpg");
    EXPECT_EQ(ExtensionOf("archive.tar.gz"), ".gz");
    EXPECT_EQ(ExtensionOf("README"), "");
    EXPECT_EQ(ExtensionOf(".bashrc"), "");
    EXPECT_EQ(StemOf("archive.tar.gz"), "archive.tar");
    EXPECT_EQ(StemOf(".bashrc"), ".bashrc");
}
