#include "storage/directory_materializer.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <vector>

namespace MediaShuttle::Storage
{
namespace
{

using Testing::RecordingNormalizer;
using Testing::TempDir;

class DirectoryMaterializerTest : public ::testing::Test
{
    protected:
    TempDir temp_;
    RecordingNormalizer normalizer_;
    DirectoryMaterializer materializer_{normalizer_};
};

TEST_F(DirectoryMaterializerTest, CreatesEveryLevelIndividually)
{
    const auto& root  = temp_.Path();
    const auto target = root / "Show (2020)" / "Season 01" / "Extras";

    ASSERT_TRUE(materializer_.EnsureDirectory(target, root).has_value());
    EXPECT_TRUE(fs::is_directory(target));

    const std::vector<fs::path> expected{
        root / "Show (2020)", root / "Show (2020)" / "Season 01", target
    };
    EXPECT_EQ(normalizer_.dirs, expected);
}

TEST_F(DirectoryMaterializerTest, ExistingLevelsAreNormalizedToo)
{
    const auto& root = temp_.Path();
    fs::create_directories(root / "a");

    ASSERT_TRUE(materializer_.EnsureDirectory(root / "a" / "b", root).has_value());
    const std::vector<fs::path> expected{root / "a", root / "a" / "b"};
    EXPECT_EQ(normalizer_.dirs, expected);
}

TEST_F(DirectoryMaterializerTest, RootItselfIsUntouched)
{
    ASSERT_TRUE(materializer_.EnsureDirectory(temp_.Path(), temp_.Path()).has_value());
    EXPECT_TRUE(normalizer_.dirs.empty());
}

TEST_F(DirectoryMaterializerTest, FileInTheWayIsNotADirectory)
{
    const auto& root = temp_.Path();
    Testing::WriteFile(root / "a", "not a dir");

    auto res = materializer_.EnsureDirectory(root / "a" / "b", root);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), StorageErrc::NotADirectory);
}

TEST_F(DirectoryMaterializerTest, TargetOutsideRootIsCreatedAsLeaf)
{
    const auto root = temp_.Path() / "root";
    fs::create_directories(root);
    const auto target = temp_.Path() / "elsewhere";

    ASSERT_TRUE(materializer_.EnsureDirectory(target, root).has_value());
    EXPECT_TRUE(fs::is_directory(target));
    ASSERT_EQ(normalizer_.dirs.size(), 1u);
    EXPECT_EQ(normalizer_.dirs.front(), target);
}

TEST_F(DirectoryMaterializerTest, StopsWhenCancelled)
{
    CancellationToken token;
    token.Cancel();

    auto res = materializer_.EnsureDirectory(temp_.Path() / "x" / "y", temp_.Path(), &token);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), StorageErrc::Cancelled);
    EXPECT_FALSE(fs::exists(temp_.Path() / "x"));
}

}  // namespace
}  // namespace MediaShuttle::Storage
