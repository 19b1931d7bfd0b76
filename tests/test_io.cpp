#include <gtest/gtest.h>

#include <io.hpp>

using namespace hamgen;

namespace {

class IoTest : public ::testing::Test {
  protected:
    boost::filesystem::path m_dir;

    void SetUp() override {
        m_dir = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("hamgen-%%%%-%%%%");
        boost::filesystem::create_directories(m_dir);
    }
    void TearDown() override {
        boost::system::error_code ec;
        boost::filesystem::remove_all(m_dir, ec);
    }

    std::string path_of(const std::string& name) const {
        return (m_dir / name).string();
    }
};

}  // namespace

TEST_F(IoTest, LoadAppendsEveryLine) {
    {
        std::ofstream ofs(path_of("old.txt"));
        ofs << "123456\r\n\nS0654321\n42\n";
    }
    code_array used;
    used.append("000000");

    EXPECT_EQ(load_codes_from_txt(path_of("old.txt"), used), 3u);
    ASSERT_EQ(used.get_size(), 4u);
    EXPECT_EQ(used.access(1), "123456");
    EXPECT_EQ(used.access(2), "S0654321");
    EXPECT_EQ(used.access(3), "42");
}

TEST_F(IoTest, LoadMissingFileThrows) {
    code_array used;
    EXPECT_THROW(load_codes_from_txt(path_of("missing.txt"), used), std::runtime_error);
    EXPECT_EQ(used.get_size(), 0u);
}

TEST_F(IoTest, SavedCodesLoadBack) {
    const std::vector<std::string> codes = {"A001", "A110", "A222"};
    save_codes_to_txt(path_of("prefix_A.txt"), codes);

    code_array used;
    EXPECT_EQ(load_codes_from_txt(path_of("prefix_A.txt"), used), 3u);
    EXPECT_EQ(used.get_codes(), codes);
}

TEST_F(IoTest, CodeFilePathUsesPrefix) {
    EXPECT_EQ(code_file_path(m_dir.string(), "AB3"), path_of("prefix_AB3.txt"));
    EXPECT_EQ(code_file_path(m_dir.string(), ""), path_of("prefix_.txt"));
}

TEST_F(IoTest, MakeDirectoryCreatesNestedDirs) {
    const std::string dir = path_of("a/b/c");
    EXPECT_FALSE(exists_path(dir));
    make_directory(dir);
    EXPECT_TRUE(exists_path(dir));
    make_directory(dir);
}

TEST_F(IoTest, MakeOfstreamInMissingDirThrows) {
    EXPECT_THROW(make_ofstream(path_of("no/such/dir.txt")), std::runtime_error);
}

TEST(SplitListTest, Items) {
    EXPECT_EQ(split_list("a.txt,b.txt"), (std::vector<std::string>{"a.txt", "b.txt"}));
    EXPECT_EQ(split_list("a.txt"), std::vector<std::string>{"a.txt"});
    EXPECT_TRUE(split_list("").empty());
}

TEST(CodeArrayTest, AppendReturnsIds) {
    code_array used;
    EXPECT_EQ(used.append("12"), 0u);
    EXPECT_EQ(used.append("12"), 1u);
    EXPECT_EQ(used.append(""), 2u);
    EXPECT_EQ(used.get_size(), 3u);
    EXPECT_EQ(used.access(1), "12");
    EXPECT_THROW(used.access(3), std::out_of_range);
}
