/**
 * @file test_cli_options.cpp
 * @brief Command line grammar
 */

#include <gtest/gtest.h>
#include "cli_options.h"
#include "common/temp_dir.h"

#include <initializer_list>
#include <string>
#include <vector>

using namespace ocrlayer;

namespace {

/// Owns a mutable argv; getopt may permute it
class Args {
public:
    Args(std::initializer_list<const char*> args) : storage_(args.begin(), args.end()) {
        for (auto& arg : storage_) {
            argv_.push_back(&arg[0]);
        }
        argv_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return argv_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> argv_;
};

CliOptions Parse(std::initializer_list<const char*> list) {
    Args args(list);
    return ParseCommandLine(args.argc(), args.argv());
}

} // namespace

// ==================== Output options ====================

TEST(CliOptions, BundledOutput) {
    CliOptions options = Parse({"ocrlayer", "-o", "out.pdf", "in.pdf"});
    EXPECT_EQ(options.output, OutputMode::Bundled);
    EXPECT_EQ(options.outputPath, "out.pdf");
    EXPECT_EQ(options.inputPath, "in.pdf");
    EXPECT_FALSE(options.ocrOnly);
}

TEST(CliOptions, OutputModes) {
    EXPECT_EQ(Parse({"ocrlayer", "--save-indirect", "index.json", "in.pdf"}).output,
              OutputMode::Indirect);
    EXPECT_EQ(Parse({"ocrlayer", "--save-script", "x.script", "in.pdf"}).output, OutputMode::Script);
    EXPECT_EQ(Parse({"ocrlayer", "--in-place", "in.pdf"}).output, OutputMode::InPlace);
    EXPECT_EQ(Parse({"ocrlayer", "in.pdf", "--dry-run"}).output, OutputMode::DryRun);
}

TEST(CliOptions, ExactlyOneOutputRequired) {
    EXPECT_THROW(Parse({"ocrlayer", "in.pdf"}), UsageError);
    EXPECT_THROW(Parse({"ocrlayer", "-o", "a.pdf", "--dry-run", "in.pdf"}), UsageError);
    EXPECT_THROW(Parse({"ocrlayer", "--in-place", "--in-place", "in.pdf"}), UsageError);
}

TEST(CliOptions, ExactlyOneInputFile) {
    EXPECT_THROW(Parse({"ocrlayer", "--dry-run"}), UsageError);
    EXPECT_THROW(Parse({"ocrlayer", "--dry-run", "a.pdf", "b.pdf"}), UsageError);
}

TEST(CliOptions, InformationalOptionsSkipChecks) {
    EXPECT_TRUE(Parse({"ocrlayer", "--help"}).showHelp);
    EXPECT_TRUE(Parse({"ocrlayer", "-v"}).showVersion);
    EXPECT_TRUE(Parse({"ocrlayer", "--list-engines"}).listEngines);

    CliOptions options = Parse({"ocrlayer", "--list-languages", "-X", "psm=3"});
    EXPECT_TRUE(options.listLanguages);
    EXPECT_EQ(options.engineProperties.at("psm"), "3");
}

// ==================== Recognition options ====================

TEST(CliOptions, Defaults) {
    CliOptions options = Parse({"ocrlayer", "--dry-run", "in.pdf"});
    EXPECT_TRUE(options.engine.empty());
    EXPECT_TRUE(options.pages.empty());
    EXPECT_EQ(options.pipeline.numJobs, 1);
    EXPECT_EQ(options.pipeline.onError, ErrorPolicy::Abort);
    EXPECT_EQ(options.pipeline.details, TextDetails::Words);
    EXPECT_EQ(options.pipeline.render.mode, RenderMode::Color);
    EXPECT_EQ(options.pipeline.render.dpi, 300);
    EXPECT_FALSE(options.pipeline.clearText);
    EXPECT_FALSE(options.pipeline.debug);
    EXPECT_EQ(options.logger.level, "info");
}

TEST(CliOptions, RecognitionSettings) {
    CliOptions options = Parse({"ocrlayer", "--dry-run", "-e", "tesseract", "-l", "deu+eng",
                                "-t", "lines", "--render", "mono", "--dpi", "150",
                                "-p", "1,3-4", "--on-error", "resume", "--clear-text",
                                "--ocr-only", "-D", "in.pdf"});
    EXPECT_EQ(options.engine, "tesseract");
    EXPECT_EQ(options.pipeline.language, "deu+eng");
    EXPECT_EQ(options.pipeline.details, TextDetails::Lines);
    EXPECT_EQ(options.pipeline.render.mode, RenderMode::Mono);
    EXPECT_EQ(options.pipeline.render.dpi, 150);
    EXPECT_EQ(options.pages, "1,3-4");
    EXPECT_EQ(options.pipeline.onError, ErrorPolicy::Resume);
    EXPECT_TRUE(options.pipeline.clearText);
    EXPECT_TRUE(options.ocrOnly);
    EXPECT_TRUE(options.pipeline.debug);
}

TEST(CliOptions, EmptyPageSelection) {
    EXPECT_THROW(Parse({"ocrlayer", "--ocr-only", "-o", "out.pdf", "-p", "42-37", "in.pdf"}), UsageError);
    EXPECT_THROW(Parse({"ocrlayer", "--dry-run", "--pages=5-2", "in.pdf"}), UsageError);
    EXPECT_EQ(Parse({"ocrlayer", "--dry-run", "-p", "42-37,3", "in.pdf"}).pages, "42-37,3");
}

TEST(CliOptions, Jobs) {
    EXPECT_EQ(Parse({"ocrlayer", "--dry-run", "-j", "in.pdf"}).pipeline.numJobs, 0);
    EXPECT_EQ(Parse({"ocrlayer", "--dry-run", "-j4", "in.pdf"}).pipeline.numJobs, 4);
    EXPECT_EQ(Parse({"ocrlayer", "--dry-run", "--jobs=2", "in.pdf"}).pipeline.numJobs, 2);
    EXPECT_THROW(Parse({"ocrlayer", "--dry-run", "-j0", "in.pdf"}), UsageError);
    EXPECT_THROW(Parse({"ocrlayer", "--dry-run", "--jobs=many", "in.pdf"}), UsageError);
}

TEST(CliOptions, EngineProperties) {
    CliOptions options = Parse({"ocrlayer", "--dry-run", "-X", "psm=6", "-X", "tessdata-dir=/a=b",
                                "in.pdf"});
    EXPECT_EQ(options.engineProperties.size(), 2u);
    EXPECT_EQ(options.engineProperties.at("psm"), "6");
    EXPECT_EQ(options.engineProperties.at("tessdata-dir"), "/a=b");

    EXPECT_THROW(Parse({"ocrlayer", "--dry-run", "-X", "psm", "in.pdf"}), UsageError);
    EXPECT_THROW(Parse({"ocrlayer", "--dry-run", "-X", "=6", "in.pdf"}), UsageError);
}

TEST(CliOptions, InvalidValues) {
    EXPECT_THROW(Parse({"ocrlayer", "--dry-run", "--render", "gray", "in.pdf"}), UsageError);
    EXPECT_THROW(Parse({"ocrlayer", "--dry-run", "--dpi", "10", "in.pdf"}), UsageError);
    EXPECT_THROW(Parse({"ocrlayer", "--dry-run", "--dpi", "3OO", "in.pdf"}), UsageError);
    EXPECT_THROW(Parse({"ocrlayer", "--dry-run", "-t", "pixels", "in.pdf"}), UsageError);
    EXPECT_THROW(Parse({"ocrlayer", "--dry-run", "--on-error", "ignore", "in.pdf"}), UsageError);
    EXPECT_THROW(Parse({"ocrlayer", "--dry-run", "-p", "1-x", "in.pdf"}), UsageError);
    EXPECT_THROW(Parse({"ocrlayer", "--dry-run", "--log-level", "chatty", "in.pdf"}), UsageError);
}

TEST(CliOptions, UnknownOrIncompleteOptions) {
    EXPECT_THROW(Parse({"ocrlayer", "--dry-run", "--bogus", "in.pdf"}), UsageError);
    EXPECT_THROW(Parse({"ocrlayer", "in.pdf", "-o"}), UsageError);
}

// ==================== Raw OCR output ====================

TEST(CliOptions, RawOcrDirectoryMustExist) {
    EXPECT_THROW(Parse({"ocrlayer", "--dry-run", "--save-raw-ocr", "/nonexistent/ocrlayer-test",
                        "in.pdf"}),
                 UsageError);

    TempDir dir("ocrlayer-test.");
    Args args({"ocrlayer", "--dry-run", "--save-raw-ocr", dir.path().c_str(),
               "--raw-ocr-filename-template", "{page:03}", "in.pdf"});
    CliOptions options = ParseCommandLine(args.argc(), args.argv());
    EXPECT_EQ(options.pipeline.rawOcr.directory, dir.path());
    EXPECT_EQ(options.pipeline.rawOcr.filenameTemplate, "{page:03}");

    Args bad({"ocrlayer", "--dry-run", "--save-raw-ocr", dir.path().c_str(),
              "--raw-ocr-filename-template", "{nope}", "in.pdf"});
    EXPECT_THROW(ParseCommandLine(bad.argc(), bad.argv()), UsageError);
}

// ==================== Savers ====================

TEST(CliOptions, CreateSaverMatchesOutputMode) {
    EXPECT_EQ(CreateSaver(Parse({"ocrlayer", "-o", "a.pdf", "in.pdf"}))->Name(), "bundled");
    EXPECT_EQ(CreateSaver(Parse({"ocrlayer", "-i", "a.json", "in.pdf"}))->Name(), "indirect");
    EXPECT_EQ(CreateSaver(Parse({"ocrlayer", "--save-script", "a", "in.pdf"}))->Name(), "script");
    EXPECT_EQ(CreateSaver(Parse({"ocrlayer", "--dry-run", "in.pdf"}))->Name(), "dry-run");

    auto inPlace = CreateSaver(Parse({"ocrlayer", "--in-place", "in.pdf"}));
    EXPECT_EQ(inPlace->Name(), "in-place");
    EXPECT_TRUE(inPlace->InPlace());

    EXPECT_THROW(CreateSaver(CliOptions()), UsageError);
}

TEST(CliOptions, UsageTextListsOptions) {
    std::string usage = UsageText("ocrlayer");
    EXPECT_EQ(usage.rfind("Usage: ocrlayer [options] FILE", 0), 0u);
    EXPECT_NE(usage.find("--save-bundled"), std::string::npos);
    EXPECT_NE(usage.find("--on-error"), std::string::npos);
    EXPECT_NE(usage.find("{id-ext}"), std::string::npos);
}
