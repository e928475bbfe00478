//
// Created on 21/10/26.
//

#include "image_formats.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <jpeglib.h>
#include <algorithm>
#include <cstring>
#include <map>
#include <ranges>

namespace {

const char* codec_tag() {
    return "libjpeg";
}

constexpr char kIccSignature[] = "ICC_PROFILE";       // 11 chars + NUL
constexpr std::size_t kIccHeaderLen = 14;             // signature, seq_no, count
constexpr std::size_t kMaxIccChunk = 65533 - kIccHeaderLen;
constexpr int kEncodeQuality = 95;

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto* err = reinterpret_cast<JpegErrorMgr*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    throw unmark::DecodeError(std::string("JPEG decode failed: ") + err->msg);
}

void jpeg_output_message_log(const j_common_ptr cinfo) {
    char buffer[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buffer);
    Logger::log(LogLevel::Warning, buffer, codec_tag());
}

void install_error_mgr(jpeg_error_mgr* pub) {
    jpeg_std_error(pub);
    pub->error_exit = jpeg_error_exit_throw;
    pub->output_message = jpeg_output_message_log;
}

/**
 * @brief Owns a decompress struct for the lifetime of a scope.
 */
struct JpegRead {
    jpeg_decompress_struct info{};
    JpegErrorMgr err{};
    bool created = false;

    JpegRead() {
        info.err = &err.pub;
        install_error_mgr(&err.pub);
        jpeg_create_decompress(&info);
        created = true;
    }
    ~JpegRead() { if (created) jpeg_destroy_decompress(&info); }
    JpegRead(const JpegRead&) = delete;
    JpegRead& operator=(const JpegRead&) = delete;
};

struct JpegWrite {
    jpeg_compress_struct info{};
    JpegErrorMgr err{};
    bool created = false;

    JpegWrite() {
        info.err = &err.pub;
        install_error_mgr(&err.pub);
        jpeg_create_compress(&info);
        created = true;
    }
    ~JpegWrite() { if (created) jpeg_destroy_compress(&info); }
    JpegWrite(const JpegWrite&) = delete;
    JpegWrite& operator=(const JpegWrite&) = delete;
};

bool marker_starts_with(const jpeg_saved_marker_ptr m, const char* prefix, const std::size_t len) {
    return m->data_length >= len && std::memcmp(m->data, prefix, len) == 0;
}

void add_block(std::vector<std::string>& blocks, std::string name) {
    if (std::ranges::find(blocks, name) == blocks.end()) {
        blocks.push_back(std::move(name));
    }
}

// ICC profile split over APP2 segments, after jpeg_start_compress / jpeg_write_coefficients
void write_icc_markers(j_compress_ptr info, const std::optional<std::vector<unsigned char>>& icc_profile) {
    if (!icc_profile || icc_profile->empty()) return;
    const std::size_t count = (icc_profile->size() + kMaxIccChunk - 1) / kMaxIccChunk;
    std::vector<JOCTET> buf;
    for (std::size_t i = 0; i < count; ++i) {
        const std::size_t off = i * kMaxIccChunk;
        const std::size_t len = std::min(kMaxIccChunk, icc_profile->size() - off);
        buf.assign(kIccSignature, kIccSignature + sizeof(kIccSignature));
        buf.push_back(static_cast<JOCTET>(i + 1));
        buf.push_back(static_cast<JOCTET>(count));
        buf.insert(buf.end(), icc_profile->begin() + static_cast<std::ptrdiff_t>(off),
                   icc_profile->begin() + static_cast<std::ptrdiff_t>(off + len));
        jpeg_write_marker(info, JPEG_APP0 + 2, buf.data(), static_cast<unsigned int>(buf.size()));
    }
}

} // namespace

namespace unmark::detail {

ImageProbe probe_jpeg(const std::filesystem::path& path) {
    const unique_FILE in(open_file(path, "rb"));
    if (!in) {
        throw IoError("cannot open " + path.string());
    }

    JpegRead rd;
    jpeg_stdio_src(&rd.info, in.get());
    for (int m = 0; m < 16; ++m) {
        jpeg_save_markers(&rd.info, JPEG_APP0 + m, 0xFFFF);
    }
    jpeg_save_markers(&rd.info, JPEG_COM, 0xFFFF);

    if (jpeg_read_header(&rd.info, TRUE) != JPEG_HEADER_OK) {
        throw DecodeError("invalid JPEG header");
    }

    ImageProbe probe;
    probe.format = ImageFormat::Jpeg;
    probe.width = rd.info.image_width;
    probe.height = rd.info.image_height;

    std::map<int, std::vector<unsigned char>> icc_chunks;
    for (jpeg_saved_marker_ptr m = rd.info.marker_list; m; m = m->next) {
        if (m->marker == JPEG_COM) {
            add_block(probe.metadata_blocks, "comment");
        } else if (m->marker == JPEG_APP0) {
            if (marker_starts_with(m, "JFXX", 4)) add_block(probe.metadata_blocks, "thumbnail (JFXX)");
        } else if (m->marker == JPEG_APP0 + 1) {
            if (marker_starts_with(m, "Exif\0\0", 6)) add_block(probe.metadata_blocks, "EXIF");
            else if (marker_starts_with(m, "http://ns.adobe.com/", 20)) add_block(probe.metadata_blocks, "XMP");
            else add_block(probe.metadata_blocks, "APP1 segment");
        } else if (m->marker == JPEG_APP0 + 2) {
            if (marker_starts_with(m, kIccSignature, sizeof(kIccSignature)) && m->data_length > kIccHeaderLen) {
                const int seq = m->data[12];
                icc_chunks[seq].assign(m->data + kIccHeaderLen, m->data + m->data_length);
            } else if (marker_starts_with(m, "MPF", 3)) {
                add_block(probe.metadata_blocks, "MPF");
            } else {
                add_block(probe.metadata_blocks, "APP2 segment");
            }
        } else if (m->marker == JPEG_APP0 + 13) {
            add_block(probe.metadata_blocks, marker_starts_with(m, "Photoshop 3.0", 13) ? "IPTC" : "APP13 segment");
        } else if (m->marker == JPEG_APP0 + 14) {
            // adobe colour transform marker, regenerated by libjpeg on write
            continue;
        } else {
            add_block(probe.metadata_blocks, "APP" + std::to_string(m->marker - JPEG_APP0) + " segment");
        }
    }

    if (!icc_chunks.empty()) {
        std::vector<unsigned char> icc;
        for (const auto& chunk : icc_chunks | std::views::values) {
            icc.insert(icc.end(), chunk.begin(), chunk.end());
        }
        probe.icc_profile = std::move(icc);
    }
    return probe;
}

void strip_jpeg(const std::filesystem::path& input, const std::filesystem::path& output,
                const std::optional<std::vector<unsigned char>>& icc_profile) {
    Logger::log(LogLevel::Debug, "JPEG coefficient copy: " + input.string(), codec_tag());

    const unique_FILE infile(open_file(input, "rb"));
    if (!infile) {
        throw IoError("cannot open " + input.string());
    }
    unique_FILE outfile(open_file(output, "wb"));
    if (!outfile) {
        throw IoError("cannot create " + output.string());
    }

    {
        JpegRead src;
        JpegWrite dst;

        jpeg_stdio_src(&src.info, infile.get());
        // no jpeg_save_markers: every APPn/COM segment is discarded on read
        if (jpeg_read_header(&src.info, TRUE) != JPEG_HEADER_OK) {
            throw DecodeError("invalid JPEG header");
        }

        jvirt_barray_ptr* coef_arrays = jpeg_read_coefficients(&src.info);
        jpeg_copy_critical_parameters(&src.info, &dst.info);
        if (src.info.progressive_mode) {
            jpeg_simple_progression(&dst.info);
        }
        dst.info.optimize_coding = TRUE;

        jpeg_stdio_dest(&dst.info, outfile.get());
        jpeg_write_coefficients(&dst.info, coef_arrays);

        write_icc_markers(&dst.info, icc_profile);

        jpeg_finish_compress(&dst.info);
        jpeg_finish_decompress(&src.info);
    }

    if (std::fclose(outfile.release()) != 0) {
        throw IoError("cannot flush " + output.string());
    }
}

void write_jpeg_rgba(const RgbaImage& image, const std::filesystem::path& output,
                     const std::optional<std::vector<unsigned char>>& icc_profile) {
    Logger::log(LogLevel::Debug, "JPEG encode -> " + output.string(), codec_tag());

    unique_FILE outfile(open_file(output, "wb"));
    if (!outfile) {
        throw IoError("cannot create " + output.string());
    }

    {
        JpegWrite dst;
        jpeg_stdio_dest(&dst.info, outfile.get());
        dst.info.image_width = image.width;
        dst.info.image_height = image.height;
        dst.info.input_components = 3;
        dst.info.in_color_space = JCS_RGB;
        jpeg_set_defaults(&dst.info);
        jpeg_set_quality(&dst.info, kEncodeQuality, TRUE);
        dst.info.optimize_coding = TRUE;

        jpeg_start_compress(&dst.info, TRUE);
        write_icc_markers(&dst.info, icc_profile);

        // alpha has no place in JPEG and is dropped
        std::vector<JSAMPLE> row(static_cast<std::size_t>(image.width) * 3);
        while (dst.info.next_scanline < dst.info.image_height) {
            const unsigned char* src = image.pixels.data() +
                static_cast<std::size_t>(dst.info.next_scanline) * image.width * 4;
            for (uint32_t x = 0; x < image.width; ++x) {
                row[x * 3] = src[x * 4];
                row[x * 3 + 1] = src[x * 4 + 1];
                row[x * 3 + 2] = src[x * 4 + 2];
            }
            JSAMPROW rows[1] = {row.data()};
            jpeg_write_scanlines(&dst.info, rows, 1);
        }
        jpeg_finish_compress(&dst.info);
    }

    if (std::fclose(outfile.release()) != 0) {
        throw IoError("cannot flush " + output.string());
    }
}

} // namespace unmark::detail
