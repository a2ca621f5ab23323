#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "../pipeline/include/stratum/pipeline/walk.h"

namespace fs = std::filesystem;

namespace {

class WalkTest : public ::testing::Test {
   protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("stratum_walk_" + std::string{::testing::UnitTest::GetInstance()->current_test_info()->name()});
        fs::remove_all(root_);
        fs::create_directories(root_ / "pkg" / "inner");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void touch(const fs::path& relative) const { std::ofstream(root_ / relative) << "package x\n"; }

    [[nodiscard]] auto visited() const -> std::vector<std::string> {
        std::vector<std::string> names;
        const auto error = stratum::pipeline::walk_sources(root_, [&names, this](const fs::path& path) {
            names.push_back(fs::relative(path, root_).generic_string());
            return std::optional<std::string>{};
        });
        EXPECT_FALSE(error.has_value());
        return names;
    }

    fs::path root_;
};

}  // namespace

TEST_F(WalkTest, VisitsGoSourcesInLexicalOrder) {
    touch("b.go");
    touch("a.go");
    touch("a_test.go");
    touch("notes.txt");
    touch("pkg/inner/c.go");
    touch("pkg/z.go");

    EXPECT_EQ(visited(), (std::vector<std::string>{"a.go", "b.go", "pkg/inner/c.go", "pkg/z.go"}));
}

TEST_F(WalkTest, DoesNotFollowSymlinks) {
    touch("pkg/inner/c.go");
    std::error_code ec;
    fs::create_directory_symlink(root_, root_ / "pkg" / "inner" / "loop", ec);
    ASSERT_FALSE(ec) << ec.message();
    fs::create_symlink(root_ / "pkg" / "inner" / "c.go", root_ / "pkg" / "alias.go", ec);
    ASSERT_FALSE(ec) << ec.message();

    EXPECT_EQ(visited(), std::vector<std::string>{"pkg/inner/c.go"});
}

TEST_F(WalkTest, VisitorErrorStopsWalk) {
    touch("a.go");
    touch("b.go");
    int calls = 0;
    const auto error = stratum::pipeline::walk_sources(root_, [&calls](const fs::path& path) {
        ++calls;
        return std::optional<std::string>{"failed to parse " + path.filename().string()};
    });
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(*error, "failed to parse a.go");
    EXPECT_EQ(calls, 1);
}

TEST_F(WalkTest, MissingRootIsAnError) {
    const auto error = stratum::pipeline::walk_sources(root_ / "absent", [](const fs::path&) {
        return std::optional<std::string>{};
    });
    EXPECT_TRUE(error.has_value());
}

TEST(WalkSourceFilterTest, AcceptsOnlyNonTestGoFiles) {
    EXPECT_TRUE(stratum::pipeline::is_analysed_source("dir/main.go"));
    EXPECT_FALSE(stratum::pipeline::is_analysed_source("dir/main_test.go"));
    EXPECT_FALSE(stratum::pipeline::is_analysed_source("dir/main.go.bak"));
}
