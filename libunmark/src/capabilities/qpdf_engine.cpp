//
// Created on 20/10/26.
//

#include "../../include/pdf_engine.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFLogger.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFWriter.hh>
#include <ostream>
#include <sstream>
#include <vector>

namespace {

const char* engine_tag() {
    return "QpdfEngine";
}

// redirects qpdf diagnostics into the logger
struct LoggerStreamBuf final : std::stringbuf {
    LogLevel level;
    std::string module;
    LoggerStreamBuf(const LogLevel lvl, const char* mod) : level(lvl), module(mod) {}
    int sync() override {
        std::string s = str();
        while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
        if (!s.empty()) {
            Logger::log(level, s, module);
        }
        str("");
        return 0;
    }
    ~LoggerStreamBuf() override { LoggerStreamBuf::sync(); }
};

std::string slash_key(const std::string_view key) {
    std::string k = "/";
    k.append(key);
    return k;
}

class QpdfDocument final : public unmark::IPdfDocument {
public:
    explicit QpdfDocument(const std::filesystem::path& path) {
        auto qlogger = QPDFLogger::create();
        qlogger->setOutputStreams(&info_os_, &warn_os_);
        pdf_.setLogger(qlogger);
        pdf_.setAttemptRecovery(true);

        try {
            pdf_.processFile(path.c_str());
            pages_ = pdf_.getAllPages();
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, "qpdf failed on " + path.filename().string() + ": " + e.what(), engine_tag());
            throw unmark::DecodeError(std::string("cannot parse PDF: ") + e.what());
        }
        warn_os_.flush();
    }

    [[nodiscard]] std::optional<std::string> info_field(const std::string_view key) const override {
        auto info = pdf_.getTrailer().getKey("/Info");
        if (!info.isDictionary()) return std::nullopt;
        auto value = info.getKey(slash_key(key));
        if (!value.isString()) return std::nullopt;
        return value.getUTF8Value();
    }

    void set_info_field(const std::string_view key, const std::string_view value) override {
        auto trailer = pdf_.getTrailer();
        auto info = trailer.getKey("/Info");
        if (!info.isDictionary()) {
            info = pdf_.makeIndirectObject(QPDFObjectHandle::newDictionary());
            trailer.replaceKey("/Info", info);
        }
        info.replaceKey(slash_key(key), QPDFObjectHandle::newUnicodeString(std::string(value)));
    }

    [[nodiscard]] std::optional<std::string> language() const override {
        auto lang = pdf_.getRoot().getKey("/Lang");
        if (!lang.isString()) return std::nullopt;
        return lang.getUTF8Value();
    }

    void set_language(const std::string_view value) override {
        pdf_.getRoot().replaceKey("/Lang", QPDFObjectHandle::newUnicodeString(std::string(value)));
    }

    [[nodiscard]] bool has_xmp_metadata() const override {
        return !pdf_.getRoot().getKey("/Metadata").isNull();
    }

    void remove_xmp_metadata() override {
        auto root = pdf_.getRoot();
        if (root.hasKey("/Metadata")) {
            root.removeKey("/Metadata");
        }
    }

    [[nodiscard]] std::size_t page_count() const override {
        return pages_.size();
    }

    [[nodiscard]] std::size_t annotation_count(const std::size_t index) const override {
        auto annots = pages_.at(index).getKey("/Annots");
        if (annots.isArray()) return static_cast<std::size_t>(annots.getArrayNItems());
        return annots.isNull() ? 0 : 1;
    }

    void remove_annotations(const std::size_t index) override {
        auto page = pages_.at(index);
        if (page.hasKey("/Annots")) {
            page.removeKey("/Annots");
        }
    }

    void save(const std::filesystem::path& path) override {
        try {
            QPDFWriter writer(pdf_, path.c_str());
            writer.setObjectStreamMode(qpdf_o_disable);
            writer.write();
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, "QPDFWriter failed: " + std::string(e.what()), engine_tag());
            throw unmark::IoError(std::string("cannot write PDF: ") + e.what());
        }
        warn_os_.flush();
    }

private:
    // streams must outlive pdf_, which keeps pointers to them
    LoggerStreamBuf info_buf_{LogLevel::Debug, "qpdf"};
    LoggerStreamBuf warn_buf_{LogLevel::Warning, "qpdf"};
    std::ostream info_os_{&info_buf_};
    std::ostream warn_os_{&warn_buf_};
    mutable QPDF pdf_;
    mutable std::vector<QPDFObjectHandle> pages_;
};

} // namespace

namespace unmark {

std::unique_ptr<IPdfDocument> QpdfEngine::open(const std::filesystem::path& path) {
    Logger::log(LogLevel::Debug, "Opening PDF " + path.string(), engine_tag());
    return std::make_unique<QpdfDocument>(path);
}

} // namespace unmark
