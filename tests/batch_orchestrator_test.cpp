//
// Created on 25/10/26.
//

#include <gtest/gtest.h>
#include "fake_sanitizer.hpp"
#include "../libunmark/include/batch_orchestrator.hpp"
#include "../libunmark/include/events.hpp"

using namespace unmark;
using unmark::test::FakeSanitizer;
using unmark::test::TempDir;
using unmark::test::read_text;
using unmark::test::write_text;

namespace fs = std::filesystem;

class BatchOrchestratorTest : public ::testing::Test {
protected:
    TempDir tmp;
    Dispatcher dispatcher{unmark::test::extension_only_classifier()};
    EventBus bus;
    BatchOrchestrator orchestrator{dispatcher, bus};

    void SetUp() override {
        dispatcher.registry().add(
            std::make_unique<FakeSanitizer>(FileCategory::Image, std::vector<std::string>{"EXIF"}));
        dispatcher.registry().add(
            std::make_unique<FakeSanitizer>(FileCategory::Office, std::vector<std::string>{"docProps/core.xml"}));
    }

    [[nodiscard]] ProcessOptions copy_to(const std::string& dir) const {
        ProcessOptions options;
        options.output_dir = tmp / dir;
        return options;
    }

    static ProcessOptions overwrite(const bool backup = false) {
        ProcessOptions options;
        options.overwrite_source = true;
        options.backup_original = backup;
        return options;
    }

    [[nodiscard]] std::vector<ProcessItem> items(std::initializer_list<std::string> names) const {
        std::vector<ProcessItem> out;
        for (const auto& n : names) out.push_back(ProcessItem{tmp / n});
        return out;
    }

    // nothing but the given names is left in the temp dir
    void expect_only(std::initializer_list<std::string> names) const {
        std::vector<std::string> present;
        for (const auto& e : fs::directory_iterator(tmp.dir())) present.push_back(e.path().filename().string());
        std::ranges::sort(present);
        std::vector<std::string> expected(names);
        std::ranges::sort(expected);
        EXPECT_EQ(present, expected);
    }
};

TEST_F(BatchOrchestratorTest, CopyModeWritesSuffixedOutputsInOrder) {
    write_text(tmp / "a.jpg", "A");
    write_text(tmp / "b.docx", "B");

    const auto results = orchestrator.run(items({"a.jpg", "b.docx"}), copy_to("out"));

    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].ok());
    EXPECT_EQ(results[0].input_path, tmp / "a.jpg");
    EXPECT_EQ(results[0].output_path, tmp / "out" / "a-clean.jpg");
    EXPECT_EQ(results[0].type, "image");
    EXPECT_EQ(results[1].output_path, tmp / "out" / "b-clean.docx");
    EXPECT_EQ(results[1].removed, std::vector<std::string>{"docProps/core.xml"});

    EXPECT_EQ(read_text(tmp / "out" / "a-clean.jpg"), "clean:A");
    EXPECT_EQ(read_text(tmp / "a.jpg"), "A");
}

TEST_F(BatchOrchestratorTest, NestedOutputDirectoryIsCreated) {
    write_text(tmp / "a.jpg", "A");

    const auto results = orchestrator.run(items({"a.jpg"}), copy_to("x/y/z"));

    ASSERT_TRUE(results[0].ok());
    EXPECT_TRUE(fs::exists(tmp / "x" / "y" / "z" / "a-clean.jpg"));
}

TEST_F(BatchOrchestratorTest, FailuresDoNotStopTheBatch) {
    write_text(tmp / "good.jpg", "G");
    write_text(tmp / "bad.jpg", "fail:truncated");
    write_text(tmp / "notes.txt", "N");
    write_text(tmp / "late.png", "L");

    const auto results = orchestrator.run(items({"good.jpg", "bad.jpg", "notes.txt", "late.png"}), copy_to("out"));

    ASSERT_EQ(results.size(), 4u);
    EXPECT_EQ(results[0].status, ProcessStatus::Success);
    EXPECT_EQ(results[1].status, ProcessStatus::Error);
    EXPECT_EQ(results[1].message, "truncated");
    EXPECT_EQ(results[2].status, ProcessStatus::Error);
    EXPECT_EQ(results[2].message, "unsupported file type");
    EXPECT_EQ(results[3].status, ProcessStatus::Success);
    EXPECT_FALSE(fs::exists(tmp / "out" / "bad-clean.jpg"));
}

TEST_F(BatchOrchestratorTest, MissingOutputDirectoryFailsEveryItem) {
    write_text(tmp / "a.jpg", "A");

    const auto results = orchestrator.run(items({"a.jpg"}), ProcessOptions{});

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].status, ProcessStatus::Error);
    EXPECT_EQ(results[0].message, "output directory is required");
}

TEST_F(BatchOrchestratorTest, EmptyPathIsInvalid) {
    const auto results = orchestrator.run({ProcessItem{}}, copy_to("out"));

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].status, ProcessStatus::Error);
    EXPECT_EQ(results[0].message, "invalid file path");
}

TEST_F(BatchOrchestratorTest, MissingInputIsAnError) {
    const auto results = orchestrator.run(items({"ghost.jpg"}), copy_to("out"));

    EXPECT_EQ(results[0].status, ProcessStatus::Error);
    EXPECT_TRUE(results[0].message.has_value());
}

TEST_F(BatchOrchestratorTest, OverwriteReplacesTheOriginalAndLeavesNoTemp) {
    write_text(tmp / "a.jpg", "A");

    const auto results = orchestrator.run(items({"a.jpg"}), overwrite());

    ASSERT_TRUE(results[0].ok());
    EXPECT_EQ(results[0].output_path, tmp / "a.jpg");
    EXPECT_EQ(read_text(tmp / "a.jpg"), "clean:A");
    expect_only({"a.jpg"});
}

TEST_F(BatchOrchestratorTest, OverwriteFailureKeepsTheOriginalUntouched) {
    write_text(tmp / "bad.jpg", "fail:boom");

    const auto results = orchestrator.run(items({"bad.jpg"}), overwrite());

    EXPECT_EQ(results[0].status, ProcessStatus::Error);
    EXPECT_FALSE(results[0].output_path.has_value());
    EXPECT_EQ(read_text(tmp / "bad.jpg"), "fail:boom");
    expect_only({"bad.jpg"});
}

TEST_F(BatchOrchestratorTest, BackupKeepsTheOriginalBytes) {
    write_text(tmp / "report.docx", "original");

    const auto results = orchestrator.run(items({"report.docx"}), overwrite(true));

    ASSERT_TRUE(results[0].ok());
    EXPECT_EQ(read_text(tmp / "report.docx"), "clean:original");
    EXPECT_EQ(read_text(tmp / "report.orig.docx"), "original");
    expect_only({"report.docx", "report.orig.docx"});
}

TEST_F(BatchOrchestratorTest, ModificationTimeIsCarriedOver) {
    write_text(tmp / "a.jpg", "A");
    const auto past = fs::last_write_time(tmp / "a.jpg") - std::chrono::hours(24 * 30);
    fs::last_write_time(tmp / "a.jpg", past);

    const auto results = orchestrator.run(items({"a.jpg"}), copy_to("out"));

    ASSERT_TRUE(results[0].ok());
    const auto out_time = fs::last_write_time(tmp / "out" / "a-clean.jpg");
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(out_time.time_since_epoch()),
              std::chrono::duration_cast<std::chrono::seconds>(past.time_since_epoch()));
}

TEST_F(BatchOrchestratorTest, EventsFollowTheBatch) {
    write_text(tmp / "a.jpg", "A");
    write_text(tmp / "b.jpg", "fail:nope");

    std::vector<ItemStartEvent> starts;
    std::vector<ItemCompleteEvent> completes;
    std::vector<ItemErrorEvent> errors;
    std::vector<BatchCompleteEvent> done;
    bus.subscribe<ItemStartEvent>([&](const ItemStartEvent& e) { starts.push_back(e); });
    bus.subscribe<ItemCompleteEvent>([&](const ItemCompleteEvent& e) { completes.push_back(e); });
    bus.subscribe<ItemErrorEvent>([&](const ItemErrorEvent& e) { errors.push_back(e); });
    bus.subscribe<BatchCompleteEvent>([&](const BatchCompleteEvent& e) { done.push_back(e); });

    (void)orchestrator.run(items({"a.jpg", "b.jpg"}), copy_to("out"));

    ASSERT_EQ(starts.size(), 2u);
    EXPECT_EQ(starts[1].index, 1u);
    EXPECT_EQ(starts[1].total, 2u);
    ASSERT_EQ(completes.size(), 1u);
    EXPECT_EQ(completes[0].category, "image");
    EXPECT_EQ(completes[0].output_path, tmp / "out" / "a-clean.jpg");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].error_message, "nope");
    ASSERT_EQ(done.size(), 1u);
    EXPECT_EQ(done[0].succeeded, 1u);
    EXPECT_EQ(done[0].failed, 1u);
    EXPECT_EQ(done[0].skipped, 0u);
}

TEST_F(BatchOrchestratorTest, StopRequestSkipsRemainingItems) {
    write_text(tmp / "a.jpg", "A");
    write_text(tmp / "b.jpg", "B");
    write_text(tmp / "c.jpg", "C");

    std::vector<std::string> skipped;
    bus.subscribe<ItemCompleteEvent>([this](const ItemCompleteEvent&) { orchestrator.request_stop(); });
    bus.subscribe<ItemSkippedEvent>([&](const ItemSkippedEvent& e) { skipped.push_back(e.reason); });

    const auto results = orchestrator.run(items({"a.jpg", "b.jpg", "c.jpg"}), copy_to("out"));

    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results[0].ok());
    EXPECT_EQ(results[1].status, ProcessStatus::Skipped);
    EXPECT_EQ(results[1].message, "cancelled");
    EXPECT_EQ(results[2].status, ProcessStatus::Skipped);
    EXPECT_EQ(skipped, (std::vector<std::string>{"cancelled", "cancelled"}));
    EXPECT_FALSE(fs::exists(tmp / "out" / "b-clean.jpg"));
    EXPECT_TRUE(orchestrator.is_stopped());
}
