#include <gtest/gtest.h>
#include "digest.h"
#include "fs.h"
#include <algorithm>
#include <string>

using namespace lanmeet;

namespace {

std::vector<uint8_t> bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

} // namespace

TEST(DigestTest, KnownVectors) {
    EXPECT_EQ(md5_hex(bytes("")), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(md5_hex(bytes("abc")), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(md5_hex(bytes("The quick brown fox jumps over the lazy dog")),
              "9e107d9d372bb6826bd81d3542a419d6");
}

TEST(DigestTest, IncrementalMatchesOneShot) {
    std::vector<uint8_t> data(100000);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>(i * 17 + 3);
    }

    Md5 md5;
    for (size_t offset = 0; offset < data.size(); offset += 777) {
        size_t n = std::min<size_t>(777, data.size() - offset);
        md5.update(data.data() + offset, n);
    }
    EXPECT_EQ(md5.hex_digest(), md5_hex(data));
}

TEST(DigestTest, HexDigestResetsForReuse) {
    Md5 md5;
    md5.update(bytes("abc"));
    EXPECT_EQ(md5.hex_digest(), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(md5.hex_digest(), "d41d8cd98f00b204e9800998ecf8427e");

    md5.update(bytes("junk"));
    md5.reset();
    md5.update(bytes("abc"));
    EXPECT_EQ(md5.hex_digest(), "900150983cd24fb0d6963f7d28e17f72");
}

TEST(DigestTest, SingleBitChangesDigest) {
    std::vector<uint8_t> data = bytes("meeting notes");
    std::string before = md5_hex(data);
    data[3] ^= 0x01;
    EXPECT_NE(md5_hex(data), before);
}

TEST(DigestTest, FileDigest) {
    const std::string path = "test_digest_file.txt";
    const std::string content = "abc";
    ASSERT_TRUE(create_file_binary(path, content.data(), content.size()));

    EXPECT_EQ(md5_file_hex(path), "900150983cd24fb0d6963f7d28e17f72");
    delete_file(path);
}

TEST(DigestTest, MissingFileHasNoDigest) {
    EXPECT_EQ(md5_file_hex("definitely_missing_file.bin"), "");
}
