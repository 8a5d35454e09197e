#include <gtest/gtest.h>
#include "fs.h"
#include <cstdio>
#include <string>

using namespace lanmeet;

class FSTest : public ::testing::Test {
protected:
    void SetUp() override {
        cleanup();
    }

    void TearDown() override {
        cleanup();
    }

    void cleanup() {
        std::remove("test_fs_file.bin");
        std::remove("test_fs_dir/nested/deep/file.txt");
        std::remove("test_fs_dir/nested/deep");
        std::remove("test_fs_dir/nested");
        std::remove("test_fs_dir");
    }
};

TEST_F(FSTest, CreateAndInspectFile) {
    const std::string content = "binary data";
    EXPECT_FALSE(file_exists("test_fs_file.bin"));

    ASSERT_TRUE(create_file_binary("test_fs_file.bin", content.data(), content.size()));
    EXPECT_TRUE(file_exists("test_fs_file.bin"));
    EXPECT_FALSE(directory_exists("test_fs_file.bin"));
    EXPECT_EQ(get_file_size("test_fs_file.bin"), static_cast<int64_t>(content.size()));
}

TEST_F(FSTest, CreateFileReplacesContent) {
    const std::string longer = "a longer first version";
    const std::string shorter = "short";
    ASSERT_TRUE(create_file_binary("test_fs_file.bin", longer.data(), longer.size()));
    ASSERT_TRUE(create_file_binary("test_fs_file.bin", shorter.data(), shorter.size()));
    EXPECT_EQ(get_file_size("test_fs_file.bin"), static_cast<int64_t>(shorter.size()));
}

TEST_F(FSTest, EmptyFile) {
    ASSERT_TRUE(create_file_binary("test_fs_file.bin", nullptr, 0));
    EXPECT_TRUE(file_exists("test_fs_file.bin"));
    EXPECT_EQ(get_file_size("test_fs_file.bin"), 0);
}

TEST_F(FSTest, DeleteFile) {
    ASSERT_TRUE(create_file_binary("test_fs_file.bin", "x", 1));
    EXPECT_TRUE(delete_file("test_fs_file.bin"));
    EXPECT_FALSE(file_exists("test_fs_file.bin"));
    EXPECT_FALSE(delete_file("test_fs_file.bin"));
}

TEST_F(FSTest, MissingPaths) {
    EXPECT_FALSE(file_exists("no_such_file.bin"));
    EXPECT_FALSE(directory_exists("no_such_dir"));
    EXPECT_EQ(get_file_size("no_such_file.bin"), -1);
    EXPECT_FALSE(file_exists(static_cast<const char*>(nullptr)));
}

TEST_F(FSTest, CreateNestedDirectories) {
    ASSERT_TRUE(create_directories("test_fs_dir/nested/deep"));
    EXPECT_TRUE(directory_exists("test_fs_dir"));
    EXPECT_TRUE(directory_exists("test_fs_dir/nested/deep"));

    // Already present is fine
    EXPECT_TRUE(create_directories("test_fs_dir/nested/deep"));

    ASSERT_TRUE(create_file_binary(combine_paths("test_fs_dir/nested/deep", "file.txt"), "hi", 2));
    EXPECT_TRUE(file_exists("test_fs_dir/nested/deep/file.txt"));
}

TEST_F(FSTest, FilenameFromPath) {
    EXPECT_EQ(get_filename_from_path("report.pdf"), "report.pdf");
    EXPECT_EQ(get_filename_from_path("/home/user/report.pdf"), "report.pdf");
    EXPECT_EQ(get_filename_from_path("C:\\Users\\me\\report.pdf"), "report.pdf");
    EXPECT_EQ(get_filename_from_path("../up/mixed\\name.txt"), "name.txt");
    EXPECT_EQ(get_filename_from_path("dir/"), "");
}

TEST_F(FSTest, CombinePaths) {
    EXPECT_EQ(combine_paths("downloads", "a.txt"), "downloads/a.txt");
    EXPECT_EQ(combine_paths("downloads/", "a.txt"), "downloads/a.txt");
    EXPECT_EQ(combine_paths("", "a.txt"), "a.txt");
    EXPECT_EQ(combine_paths("downloads", ""), "downloads");
}
