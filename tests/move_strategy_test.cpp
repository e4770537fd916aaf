#include "transfer/move_strategy.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <cerrno>
#include <cstdint>
#include <system_error>
#include <utility>
#include <vector>

namespace MediaShuttle::Transfer
{
namespace
{

using Storage::StorageErrc;
using Testing::Pattern;
using Testing::ReadFile;
using Testing::RecordingNormalizer;
using Testing::TempDir;
using Testing::WriteFile;

MoveHooks FailingRename(int err_no, std::size_t *calls = nullptr)
{
    MoveHooks hooks;
    hooks.rename = [err_no, calls](const fs::path &, const fs::path &) {
        if (calls) {
            ++*calls;
        }
        return std::error_code(err_no, std::generic_category());
    };
    return hooks;
}

class MoveStrategyTest : public ::testing::Test
{
    protected:
    void SetUp() override
    {
        src_root_ = temp_.Path() / "downloads";
        dst_root_ = temp_.Path() / "media";
        fs::create_directories(src_root_);
        fs::create_directories(dst_root_);
    }

    MoveStrategy Make(MoveHooks hooks = {})
    {
        return MoveStrategy(file_copier_, directory_copier_, normalizer_, std::move(hooks));
    }

    TempDir temp_;
    fs::path src_root_;
    fs::path dst_root_;
    RecordingNormalizer normalizer_;
    FileCopier file_copier_{32};
    Storage::DirectoryMaterializer materializer_{normalizer_};
    DirectoryCopier directory_copier_{file_copier_, materializer_, normalizer_};
};

TEST_F(MoveStrategyTest, RenameMovesFileInPlace)
{
    const auto src = src_root_ / "a.mkv";
    const auto dst = dst_root_ / "b.mkv";
    WriteFile(src, Pattern(100));

    auto strategy = Make();
    auto outcome  = strategy.Move(src, dst, dst_root_, false, false, {});

    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->renamed);
    EXPECT_FALSE(outcome->rename_error);
    EXPECT_FALSE(fs::exists(src));
    EXPECT_EQ(ReadFile(dst), Pattern(100));
    ASSERT_EQ(normalizer_.files.size(), 1u);
    EXPECT_EQ(normalizer_.files.front(), dst);
}

TEST_F(MoveStrategyTest, RenameFailureFallsBackToCopyAndDelete)
{
    const auto src = src_root_ / "a.mkv";
    const auto dst = dst_root_ / "b.mkv";
    WriteFile(src, Pattern(100));

    std::size_t rename_calls = 0;
    auto strategy            = Make(FailingRename(EXDEV, &rename_calls));
    std::vector<std::pair<std::uint64_t, std::uint64_t>> log;
    auto outcome = strategy.Move(src, dst, dst_root_, false, false, [&](std::uint64_t c, std::uint64_t t) {
        log.emplace_back(c, t);
    });

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(rename_calls, 1u);
    EXPECT_FALSE(outcome->renamed);
    EXPECT_EQ(outcome->rename_error, std::errc::cross_device_link);
    EXPECT_EQ(outcome->bytes_copied, 100u);
    EXPECT_FALSE(fs::exists(src));
    EXPECT_EQ(ReadFile(dst), Pattern(100));
    ASSERT_FALSE(log.empty());
    EXPECT_EQ(log.back(), std::make_pair(std::uint64_t{100}, std::uint64_t{100}));
}

TEST_F(MoveStrategyTest, PermissionFailureTakesTheSameFallback)
{
    const auto src = src_root_ / "a.mkv";
    const auto dst = dst_root_ / "b.mkv";
    WriteFile(src, "data");

    auto strategy = Make(FailingRename(EACCES));
    auto outcome  = strategy.Move(src, dst, dst_root_, false, false, {});

    ASSERT_TRUE(outcome.has_value());
    EXPECT_FALSE(outcome->renamed);
    EXPECT_EQ(outcome->rename_error, std::errc::permission_denied);
    EXPECT_EQ(ReadFile(dst), "data");
}

TEST_F(MoveStrategyTest, DirectoryFallbackMovesWholeTree)
{
    const auto src = src_root_ / "Show";
    const auto dst = dst_root_ / "Show (2020)";
    WriteFile(src / "S01" / "e1.mkv", Pattern(50));
    WriteFile(src / "S01" / "e2.mkv", Pattern(70));

    auto strategy = Make(FailingRename(EXDEV));
    auto outcome  = strategy.Move(src, dst, dst_root_, true, false, {});

    ASSERT_TRUE(outcome.has_value());
    EXPECT_FALSE(outcome->renamed);
    EXPECT_EQ(outcome->bytes_copied, 120u);
    EXPECT_FALSE(fs::exists(src));
    EXPECT_EQ(ReadFile(dst / "S01" / "e1.mkv"), Pattern(50));
    EXPECT_EQ(ReadFile(dst / "S01" / "e2.mkv"), Pattern(70));
}

TEST_F(MoveStrategyTest, FailedFallbackKeepsSourceIntact)
{
    const auto src = src_root_ / "Show";
    const auto dst = dst_root_ / "Show";
    WriteFile(src / "e1.mkv", Pattern(64));
    WriteFile(src / "e2.mkv", Pattern(64));

    CancellationToken token;
    auto strategy = Make(FailingRename(EXDEV));
    auto outcome  = strategy.Move(
        src, dst, dst_root_, true, false,
        [&](std::uint64_t copied, std::uint64_t) {
            if (copied > 64) {
                token.Cancel();
            }
        },
        &token
    );

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error(), StorageErrc::Cancelled);
    EXPECT_EQ(ReadFile(src / "e1.mkv"), Pattern(64));
    EXPECT_EQ(ReadFile(src / "e2.mkv"), Pattern(64));
    EXPECT_FALSE(fs::exists(dst));
}

TEST_F(MoveStrategyTest, ExistingDestinationWithoutOverwriteIsRefused)
{
    const auto src = src_root_ / "a.mkv";
    const auto dst = dst_root_ / "a.mkv";
    WriteFile(src, "new");
    WriteFile(dst, "old");

    auto strategy = Make();
    auto outcome  = strategy.Move(src, dst, dst_root_, false, false, {});

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error(), StorageErrc::AlreadyExists);
    EXPECT_EQ(ReadFile(src), "new");
    EXPECT_EQ(ReadFile(dst), "old");
}

TEST_F(MoveStrategyTest, OverwriteReplacesExistingTree)
{
    const auto src = src_root_ / "Show";
    const auto dst = dst_root_ / "Show";
    WriteFile(src / "new.mkv", "new");
    WriteFile(dst / "stale.mkv", "stale");

    auto strategy = Make();
    auto outcome  = strategy.Move(src, dst, dst_root_, true, true, {});

    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->renamed);
    EXPECT_EQ(ReadFile(dst / "new.mkv"), "new");
    EXPECT_FALSE(fs::exists(dst / "stale.mkv"));
    EXPECT_FALSE(fs::exists(src));
}

TEST_F(MoveStrategyTest, OverwriteOntoOwnAncestorKeepsSource)
{
    const auto src = src_root_ / "Show" / "a.mkv";
    WriteFile(src, "episode");

    std::size_t rename_calls = 0;
    auto strategy = Make(FailingRename(ENOENT, &rename_calls));
    auto onto_parent = strategy.Move(src, src_root_ / "Show", src_root_, false, true, {});
    auto onto_self   = strategy.Move(src, src, src_root_, false, true, {});

    ASSERT_FALSE(onto_parent.has_value());
    EXPECT_EQ(onto_parent.error(), StorageErrc::InvalidPath);
    ASSERT_FALSE(onto_self.has_value());
    EXPECT_EQ(onto_self.error(), StorageErrc::InvalidPath);
    EXPECT_EQ(rename_calls, 0u);
    EXPECT_EQ(ReadFile(src), "episode");
}

}  // namespace
}  // namespace MediaShuttle::Transfer
