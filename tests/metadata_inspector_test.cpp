//
// Created on 25/10/26.
//

#include <gtest/gtest.h>
#include "fake_sanitizer.hpp"
#include "../libunmark/include/metadata_inspector.hpp"

using namespace unmark;
using unmark::test::TempDir;

namespace {

class CannedRemuxer final : public IMediaRemuxer {
public:
    MediaProbe canned;
    MediaProbe probe(const std::filesystem::path&) override { return canned; }
    void remux(const std::filesystem::path&, const std::filesystem::path&, const RemuxOptions&) override {
        throw ToolError("remux is not expected while inspecting");
    }
};

} // namespace

class MetadataInspectorTest : public ::testing::Test {
protected:
    TempDir tmp;
    NativeImageCodec images;
    LibarchiveCodec archives;
    QpdfEngine pdfs;
    CannedRemuxer media;
    MetadataInspector inspector{images, archives, pdfs, media, unmark::test::extension_only_classifier()};
};

TEST_F(MetadataInspectorTest, ImageFacts) {
    unmark::test::JpegOptions options;
    options.exif = true;
    options.comment = true;
    unmark::test::write_jpeg(tmp / "photo.jpg", 32, 24, options);

    const FileDetails d = inspector.inspect(tmp / "photo.jpg");

    EXPECT_TRUE(d.exists);
    EXPECT_EQ(d.name, "photo.jpg");
    EXPECT_GT(d.size, 0u);
    EXPECT_GT(d.mtime, 0);
    EXPECT_EQ(d.category, FileCategory::Image);
    EXPECT_EQ(d.value("format"), "jpeg");
    EXPECT_EQ(d.value("width"), "32");
    EXPECT_EQ(d.value("height"), "24");
    EXPECT_EQ(d.value("has_exif"), "true");
    EXPECT_EQ(d.value("blocks"), "EXIF, comment");
    EXPECT_EQ(d.value("error"), "");
}

TEST_F(MetadataInspectorTest, OfficeCoreProperties) {
    const auto path = tmp / "budget.docx";
    unmark::test::write_stored_zip(path, unmark::test::sample_docx_entries());

    const FileDetails d = inspector.inspect(path);

    EXPECT_EQ(d.category, FileCategory::Office);
    EXPECT_EQ(d.value("entries"), std::to_string(unmark::test::sample_docx_entries().size()));
    EXPECT_EQ(d.value("title"), "Budget");
    EXPECT_EQ(d.value("creator"), "Alice Example");
    EXPECT_EQ(d.value("last_modified_by"), "Bob Example");
    EXPECT_EQ(d.value("created"), "2024-01-02T03:04:05Z");
}

TEST_F(MetadataInspectorTest, PdfInfo) {
    unmark::test::write_pdf(tmp / "plan.pdf");

    const FileDetails d = inspector.inspect(tmp / "plan.pdf");

    EXPECT_EQ(d.category, FileCategory::Pdf);
    EXPECT_EQ(d.value("title"), "Quarterly plan");
    EXPECT_EQ(d.value("author"), "Alice Example");
    EXPECT_EQ(d.value("creator"), "");
    EXPECT_EQ(d.value("pages"), "1");
}

TEST_F(MetadataInspectorTest, ZipFacts) {
    unmark::test::ZipOptions options;
    options.comment = "built by ci";
    unmark::test::write_stored_zip(tmp / "bundle.zip", {{"d", "", true}, {"d/a.txt", "a"}, {"b.txt", "b"}}, options);

    const FileDetails d = inspector.inspect(tmp / "bundle.zip");

    EXPECT_EQ(d.category, FileCategory::Zip);
    EXPECT_EQ(d.value("files"), "2");
    EXPECT_EQ(d.value("comment"), "built by ci");
}

TEST_F(MetadataInspectorTest, MediaFacts) {
    unmark::test::write_text(tmp / "clip.mkv", "matroska-ish");
    media.canned.format_name = "matroska,webm";
    media.canned.duration_seconds = 12.3456;
    media.canned.bit_rate = 128000;
    media.canned.format_tags = {{"ENCODER", "Lavf60.3.100"}};
    media.canned.streams = {
        MediaStreamInfo{0, "video", "mjpeg", true, {}},
        MediaStreamInfo{1, "video", "vp9", false, {}},
        MediaStreamInfo{2, "audio", "opus", false, {}},
    };

    const FileDetails d = inspector.inspect(tmp / "clip.mkv");

    EXPECT_EQ(d.category, FileCategory::Video);
    EXPECT_EQ(d.value("format"), "matroska,webm");
    EXPECT_EQ(d.value("duration"), "12.35");
    EXPECT_EQ(d.value("bit_rate"), "128000");
    EXPECT_EQ(d.value("video_codec"), "vp9");
    EXPECT_EQ(d.value("audio_codec"), "opus");
    EXPECT_EQ(d.value("encoder"), "Lavf60.3.100");
}

TEST_F(MetadataInspectorTest, MissingFileIsReportedNotThrown) {
    const FileDetails d = inspector.inspect(tmp / "ghost.pdf");

    EXPECT_FALSE(d.exists);
    EXPECT_EQ(d.size, 0u);
    EXPECT_EQ(d.value("error"), "file not found");
}

TEST_F(MetadataInspectorTest, UnreadableContentIsReportedNotThrown) {
    unmark::test::write_text(tmp / "junk.pdf", "not a pdf");

    const FileDetails d = inspector.inspect(tmp / "junk.pdf");

    EXPECT_TRUE(d.exists);
    EXPECT_NE(d.value("error"), "");
}

TEST_F(MetadataInspectorTest, InspectionLeavesTheFileUntouched) {
    unmark::test::write_pdf(tmp / "plan.pdf");
    const auto before = read_file_bytes(tmp / "plan.pdf");

    (void)inspector.inspect(tmp / "plan.pdf");

    EXPECT_EQ(read_file_bytes(tmp / "plan.pdf"), before);
}
