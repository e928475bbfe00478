//
// Created on 25/10/26.
//

#include <gtest/gtest.h>
#include <CLI/CLI.hpp>
#include "test_support.hpp"
#include "../unmark_cli/src/cli/cli_parser.hpp"
#include "../unmark_cli/src/report/report_generator.hpp"

using namespace unmark;
using unmark::test::TempDir;

class CliParserTest : public ::testing::Test {
protected:
    TempDir tmp;
    CLI::App app{"unmark"};
    Settings settings;

    void SetUp() override {
        unmark::test::write_text(tmp / "a.jpg", "A");
        unmark::test::write_text(tmp / "b.pdf", "B");
        setup_cli_parser(app, settings);
    }

    void parse(const std::string& args) { app.parse(args, false); }

    [[nodiscard]] std::string input(const std::string& name) const { return (tmp / name).string(); }
};

TEST_F(CliParserTest, CopyModeWithSuffix) {
    parse("-o " + (tmp / "out").string() + " --suffix _x " + input("a.jpg") + " " + input("b.pdf"));

    EXPECT_EQ(settings.inputs.size(), 2u);
    const ProcessOptions o = settings.to_process_options();
    EXPECT_EQ(o.output_dir, tmp / "out");
    EXPECT_EQ(o.copy_suffix, "_x");
    EXPECT_FALSE(o.overwrite_source);
}

TEST_F(CliParserTest, OverwriteWithBackup) {
    parse("--overwrite --backup " + input("a.jpg"));

    const ProcessOptions o = settings.to_process_options();
    EXPECT_TRUE(o.overwrite_source);
    EXPECT_TRUE(o.backup_original);
    EXPECT_EQ(o.copy_suffix, "-clean");
}

TEST_F(CliParserTest, DestinationIsRequired) {
    EXPECT_THROW(parse(input("a.jpg")), CLI::ValidationError);
}

TEST_F(CliParserTest, OutputAndOverwriteExcludeEachOther) {
    EXPECT_THROW(parse("--overwrite -o " + (tmp / "out").string() + " " + input("a.jpg")), CLI::ParseError);
}

TEST_F(CliParserTest, BackupNeedsOverwrite) {
    EXPECT_THROW(parse("--backup -o " + (tmp / "out").string() + " " + input("a.jpg")), CLI::ParseError);
}

TEST_F(CliParserTest, InspectStandsAlone) {
    parse("--inspect " + input("a.jpg"));
    EXPECT_TRUE(settings.inspect);
}

TEST_F(CliParserTest, MissingInputIsRejected) {
    EXPECT_THROW(parse("-o " + (tmp / "out").string() + " " + input("ghost.jpg")), CLI::ParseError);
}

TEST_F(CliParserTest, UnknownLogLevelIsRejected) {
    EXPECT_THROW(parse("--log-level LOUD --overwrite " + input("a.jpg")), CLI::ParseError);
}

TEST(CsvReportTest, OneRowPerResultWithEscaping) {
    TempDir tmp;
    ProcessResult ok;
    ok.input_path = "/in/photo.jpg";
    ok.output_path = std::filesystem::path("/out/photo-clean.jpg");
    ok.status = ProcessStatus::Success;
    ok.type = "image";
    ok.removed = {"EXIF", "comment"};

    ProcessResult failed;
    failed.input_path = "/in/odd,name.pdf";
    failed.status = ProcessStatus::Error;
    failed.message = "cannot parse PDF: \"bad\" xref";

    ASSERT_TRUE(export_csv_report({ok, failed}, tmp / "report.csv", 1.5));

    const std::string csv = unmark::test::read_text(tmp / "report.csv");
    EXPECT_TRUE(csv.starts_with("File,Output,Type,Result,Removed,Error\n"));
    EXPECT_NE(csv.find("/in/photo.jpg,/out/photo-clean.jpg,image,success,EXIF; comment,\n"), std::string::npos);
    EXPECT_NE(csv.find("\"/in/odd,name.pdf\",,,error,,\"cannot parse PDF: \"\"bad\"\" xref\"\n"), std::string::npos);
}

TEST(CsvReportTest, UnwritableTargetReturnsFalse) {
    TempDir tmp;
    EXPECT_FALSE(export_csv_report({}, tmp.dir() / "missing" / "report.csv", 0.0));
}
