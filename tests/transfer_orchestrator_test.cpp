#include "transfer/transfer_orchestrator.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <cerrno>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

namespace MediaShuttle::Transfer
{
namespace
{

using Testing::Pattern;
using Testing::ReadFile;
using Testing::RecordingNormalizer;
using Testing::TempDir;
using Testing::WriteFile;

template <typename T>
std::vector<T> OfType(const std::vector<TransferEvent> &events)
{
    std::vector<T> out;
    for (const auto &event : events) {
        if (const auto *typed = std::get_if<T>(&event)) {
            out.push_back(*typed);
        }
    }
    return out;
}

FileTransferItem Item(std::string src, std::string dst, std::optional<bool> overwrite = std::nullopt)
{
    return FileTransferItem{std::move(src), std::move(dst), overwrite};
}

class TransferOrchestratorTest : public ::testing::Test
{
    protected:
    void SetUp() override
    {
        downloads_ = temp_.Path() / "downloads";
        media_     = temp_.Path() / "media";
        fs::create_directories(downloads_);
        fs::create_directories(media_);
        config_ = Testing::MakeConfig(downloads_, media_);
    }

    TransferSummary Run(const TransferRequest &request, MoveHooks hooks = {})
    {
        TransferOrchestrator orchestrator(config_, normalizer_, std::move(hooks));
        return orchestrator.Run(
            request,
            [this](const TransferEvent &event) {
                events_.push_back(event);
            },
            token_
        );
    }

    static TransferRequest Request(
        TransferOperation op, std::vector<FileTransferItem> files, bool overwrite = false
    )
    {
        TransferRequest request;
        request.operation = op;
        request.overwrite = overwrite;
        request.files     = std::move(files);
        return request;
    }

    const CompleteEvent &Complete() const
    {
        EXPECT_FALSE(events_.empty());
        return std::get<CompleteEvent>(events_.back());
    }

    TempDir temp_;
    fs::path downloads_;
    fs::path media_;
    Config::ServiceConfig config_;
    RecordingNormalizer normalizer_;
    CancellationToken token_;
    std::vector<TransferEvent> events_;
};

constexpr const char *kEpisode = "/Show (2020)/Season 01/Show S01E01.mkv";

TEST_F(TransferOrchestratorTest, MoveByRenameEmitsInstantCompletion)
{
    WriteFile(downloads_ / "downloads" / "a.mkv", Pattern(5000));

    auto summary = Run(Request(TransferOperation::Move, {Item("/downloads/a.mkv", kEpisode)}));

    ASSERT_EQ(events_.size(), 3u);
    const auto &progress = std::get<ProgressEvent>(events_[0]);
    EXPECT_EQ(progress.counters.current, 1u);
    EXPECT_EQ(progress.counters.total, 1u);
    EXPECT_EQ(progress.counters.completed, 0u);
    EXPECT_EQ(progress.current_file, "Show S01E01.mkv");

    const auto &bytes = std::get<FileProgressEvent>(events_[1]);
    EXPECT_EQ(bytes.bytes_copied, 5000u);
    EXPECT_EQ(bytes.bytes_total, 5000u);
    EXPECT_DOUBLE_EQ(bytes.bytes_per_second, 0.0);

    const auto &complete = Complete();
    EXPECT_EQ(complete.counters.completed, 1u);
    EXPECT_EQ(complete.counters.failed, 0u);
    EXPECT_EQ(complete.counters.current, 1u);
    EXPECT_EQ(complete.message, "All files processed successfully");

    EXPECT_EQ(ReadFile(media_ / "Show (2020)" / "Season 01" / "Show S01E01.mkv"), Pattern(5000));
    EXPECT_FALSE(fs::exists(downloads_ / "downloads"));
    EXPECT_TRUE(fs::is_directory(downloads_));
    EXPECT_EQ(summary.completed, 1u);
    EXPECT_FALSE(summary.aborted);
}

TEST_F(TransferOrchestratorTest, MoveFallbackStreamsByteProgress)
{
    WriteFile(downloads_ / "downloads" / "a.mkv", Pattern(10000));
    MoveHooks hooks;
    hooks.rename = [](const fs::path &, const fs::path &) {
        return std::error_code(EXDEV, std::generic_category());
    };

    Run(Request(TransferOperation::Move, {Item("/downloads/a.mkv", kEpisode)}), std::move(hooks));

    ASSERT_TRUE(std::holds_alternative<ProgressEvent>(events_.front()));
    const auto bytes = OfType<FileProgressEvent>(events_);
    ASSERT_FALSE(bytes.empty());
    for (std::size_t i = 1; i < bytes.size(); ++i) {
        EXPECT_GE(bytes[i].bytes_copied, bytes[i - 1].bytes_copied);
    }
    EXPECT_EQ(bytes.back().bytes_copied, 10000u);
    EXPECT_EQ(bytes.back().bytes_total, 10000u);

    EXPECT_EQ(Complete().counters.completed, 1u);
    EXPECT_FALSE(fs::exists(downloads_ / "downloads" / "a.mkv"));
    EXPECT_EQ(ReadFile(media_ / "Show (2020)" / "Season 01" / "Show S01E01.mkv"), Pattern(10000));
}

TEST_F(TransferOrchestratorTest, ExistingDestinationIsAConflict)
{
    WriteFile(downloads_ / "downloads" / "a.mkv", "new");
    WriteFile(media_ / "Show (2020)" / "Season 01" / "Show S01E01.mkv", "old");

    auto summary = Run(Request(TransferOperation::Move, {Item("/downloads/a.mkv", kEpisode)}));

    const auto &complete = Complete();
    EXPECT_EQ(complete.counters.completed, 0u);
    EXPECT_EQ(complete.counters.failed, 1u);
    EXPECT_EQ(complete.counters.errors, std::vector<std::string>{"Already exists: Show S01E01.mkv"});
    EXPECT_EQ(complete.message, "Completed with 1 error(s)");
    EXPECT_EQ(ReadFile(downloads_ / "downloads" / "a.mkv"), "new");
    EXPECT_EQ(ReadFile(media_ / "Show (2020)" / "Season 01" / "Show S01E01.mkv"), "old");
    EXPECT_EQ(summary.failed, 1u);
}

TEST_F(TransferOrchestratorTest, PerItemOverwriteReplacesFile)
{
    WriteFile(downloads_ / "a.mkv", "new content");
    WriteFile(media_ / "a.mkv", "old");

    Run(Request(TransferOperation::Copy, {Item("a.mkv", "a.mkv", true)}, false));

    EXPECT_EQ(Complete().counters.completed, 1u);
    EXPECT_EQ(ReadFile(media_ / "a.mkv"), "new content");
    EXPECT_EQ(ReadFile(downloads_ / "a.mkv"), "new content");
}

TEST_F(TransferOrchestratorTest, OverwriteReplacesDirectoryTree)
{
    WriteFile(downloads_ / "Show" / "e1.mkv", "e1");
    WriteFile(media_ / "Show" / "stale.mkv", "stale");

    Run(Request(TransferOperation::Copy, {Item("Show", "Show")}, true));

    EXPECT_EQ(Complete().counters.completed, 1u);
    EXPECT_EQ(ReadFile(media_ / "Show" / "e1.mkv"), "e1");
    EXPECT_FALSE(fs::exists(media_ / "Show" / "stale.mkv"));
}

TEST_F(TransferOrchestratorTest, SharedParentIsMaterializedOnce)
{
    WriteFile(downloads_ / "e1.mkv", "one");
    WriteFile(downloads_ / "e2.mkv", "two");

    Run(Request(
        TransferOperation::Copy,
        {Item("e1.mkv", "Show/Season 01/e1.mkv"), Item("e2.mkv", "Show/Season 01/e2.mkv")}
    ));

    EXPECT_EQ(Complete().counters.completed, 2u);
    EXPECT_EQ(normalizer_.DirCount(media_ / "Show"), 1u);
    EXPECT_EQ(normalizer_.DirCount(media_ / "Show" / "Season 01"), 1u);
    const std::vector<fs::path> files{
        media_ / "Show" / "Season 01" / "e1.mkv", media_ / "Show" / "Season 01" / "e2.mkv"
    };
    EXPECT_EQ(normalizer_.files, files);
}

TEST_F(TransferOrchestratorTest, InvalidPathsNeverTouchTheFilesystem)
{
    WriteFile(temp_.Path() / "secret.txt", "secret");

    Run(Request(
        TransferOperation::Move,
        {Item("../secret.txt", "stolen.txt"), Item("", "root.txt"), Item("x.mkv", "/.."),
         Item(std::string("a\0b", 3), "nul.txt")}
    ));

    const auto &complete = Complete();
    EXPECT_EQ(complete.counters.completed, 0u);
    EXPECT_EQ(complete.counters.failed, 4u);
    const std::vector<std::string> errors{
        "Invalid source: ../secret.txt", "Invalid source: ", "Invalid destination: /..",
        "Invalid source: " + std::string("a\0b", 3)
    };
    EXPECT_EQ(complete.counters.errors, errors);
    EXPECT_TRUE(fs::is_empty(media_));
    EXPECT_EQ(ReadFile(temp_.Path() / "secret.txt"), "secret");
}

TEST_F(TransferOrchestratorTest, MissingSourceFailsByName)
{
    Run(Request(TransferOperation::Copy, {Item("Show/missing.mkv", "out.mkv")}));

    EXPECT_EQ(Complete().counters.errors, std::vector<std::string>{"Failed: missing.mkv"});
}

TEST_F(TransferOrchestratorTest, DirectoryIntoItselfIsRejected)
{
    config_.media_path = downloads_;
    WriteFile(downloads_ / "Show" / "e1.mkv", "e1");

    Run(Request(TransferOperation::Copy, {Item("Show", "Show/Backup")}));

    EXPECT_EQ(Complete().counters.errors, std::vector<std::string>{"Invalid destination: Show/Backup"});
    EXPECT_FALSE(fs::exists(downloads_ / "Show" / "Backup"));
}

TEST_F(TransferOrchestratorTest, CopyOntoItselfWithOverwriteKeepsSource)
{
    config_.media_path = downloads_;
    WriteFile(downloads_ / "a.mkv", "episode");

    auto summary = Run(Request(TransferOperation::Copy, {Item("a.mkv", "a.mkv")}, true));

    EXPECT_EQ(summary.completed, 0u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(Complete().counters.errors, std::vector<std::string>{"Invalid destination: a.mkv"});
    EXPECT_EQ(ReadFile(downloads_ / "a.mkv"), "episode");
}

TEST_F(TransferOrchestratorTest, MoveOntoSourceParentWithOverwriteKeepsSource)
{
    config_.media_path = downloads_;
    WriteFile(downloads_ / "Show" / "a.mkv", "episode");

    auto summary = Run(Request(TransferOperation::Move, {Item("Show/a.mkv", "Show")}, true));

    EXPECT_EQ(summary.completed, 0u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(Complete().counters.errors, std::vector<std::string>{"Invalid destination: Show"});
    EXPECT_EQ(ReadFile(downloads_ / "Show" / "a.mkv"), "episode");
}

TEST_F(TransferOrchestratorTest, RenamedDirectoryReportsZeroBytes)
{
    WriteFile(downloads_ / "Show" / "e1.mkv", "e1");

    Run(Request(TransferOperation::Move, {Item("Show", "Library/Show")}));

    const auto bytes = OfType<FileProgressEvent>(events_);
    ASSERT_EQ(bytes.size(), 1u);
    EXPECT_EQ(bytes.front().bytes_copied, 0u);
    EXPECT_EQ(bytes.front().bytes_total, 0u);
    EXPECT_EQ(ReadFile(media_ / "Library" / "Show" / "e1.mkv"), "e1");
    EXPECT_EQ(normalizer_.DirCount(media_ / "Library" / "Show"), 1u);
}

TEST_F(TransferOrchestratorTest, CleanupOnlyRemovesEmptiedParents)
{
    WriteFile(downloads_ / "A" / "x.mkv", "x");
    WriteFile(downloads_ / "B" / "y.mkv", "y");
    WriteFile(downloads_ / "B" / "keep.nfo", "keep");

    Run(Request(TransferOperation::Move, {Item("A/x.mkv", "x.mkv"), Item("B/y.mkv", "y.mkv")}));

    EXPECT_EQ(Complete().counters.completed, 2u);
    EXPECT_FALSE(fs::exists(downloads_ / "A"));
    EXPECT_TRUE(fs::exists(downloads_ / "B" / "keep.nfo"));
    EXPECT_TRUE(fs::is_directory(downloads_));
}

TEST_F(TransferOrchestratorTest, CopyNeverCleansUp)
{
    WriteFile(downloads_ / "A" / "x.mkv", "x");

    Run(Request(TransferOperation::Copy, {Item("A/x.mkv", "x.mkv")}));

    EXPECT_TRUE(fs::exists(downloads_ / "A" / "x.mkv"));
    EXPECT_EQ(ReadFile(media_ / "x.mkv"), "x");
}

TEST_F(TransferOrchestratorTest, CancelledBeforeStartEmitsOnlyError)
{
    WriteFile(downloads_ / "a.mkv", "a");
    token_.Cancel();

    auto summary = Run(Request(TransferOperation::Copy, {Item("a.mkv", "a.mkv")}));

    ASSERT_EQ(events_.size(), 1u);
    const auto &error = std::get<ErrorEvent>(events_.front());
    EXPECT_EQ(error.message, "Operation cancelled");
    EXPECT_EQ(error.counters.current, 0u);
    EXPECT_TRUE(summary.aborted);
    EXPECT_FALSE(fs::exists(media_ / "a.mkv"));
}

TEST_F(TransferOrchestratorTest, CancellationMidRequestKeepsCounters)
{
    WriteFile(downloads_ / "b.mkv", "b");
    WriteFile(downloads_ / "A" / "c.mkv", "c");

    TransferOrchestrator orchestrator(config_, normalizer_);
    std::size_t progress_seen = 0;
    orchestrator.Run(
        Request(
            TransferOperation::Move,
            {Item("../nope", "x"), Item("b.mkv", "Dir/b.mkv"), Item("A/c.mkv", "c.mkv")}
        ),
        [&](const TransferEvent &event) {
            events_.push_back(event);
            if (std::holds_alternative<ProgressEvent>(event) && ++progress_seen == 2) {
                token_.Cancel();
            }
        },
        token_
    );

    ASSERT_TRUE(std::holds_alternative<ErrorEvent>(events_.back()));
    const auto &error = std::get<ErrorEvent>(events_.back());
    EXPECT_EQ(error.message, "Operation cancelled");
    EXPECT_EQ(error.counters.current, 2u);
    EXPECT_EQ(error.counters.failed, 1u);
    EXPECT_EQ(error.counters.errors, std::vector<std::string>{"Invalid source: ../nope"});
    EXPECT_TRUE(OfType<CompleteEvent>(events_).empty());
    // No cleanup after cancellation
    EXPECT_TRUE(fs::exists(downloads_ / "A" / "c.mkv"));
    EXPECT_TRUE(fs::exists(downloads_ / "b.mkv"));
}

TEST_F(TransferOrchestratorTest, MissingRootIsFatal)
{
    config_.downloads_path = temp_.Path() / "absent";

    auto summary = Run(Request(TransferOperation::Copy, {Item("a.mkv", "a.mkv")}));

    ASSERT_EQ(events_.size(), 1u);
    const auto &error = std::get<ErrorEvent>(events_.front());
    EXPECT_EQ(error.message, "Operation failed");
    EXPECT_EQ(error.counters.errors.size(), 1u);
    EXPECT_TRUE(summary.aborted);
}

}  // namespace
}  // namespace MediaShuttle::Transfer
