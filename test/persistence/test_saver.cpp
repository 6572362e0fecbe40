/**
 * @file test_saver.cpp
 * @brief Text-layer writing and output strategies
 */

#include <gtest/gtest.h>
#include "common/errors.h"
#include "common/temp_dir.h"
#include "document/pdf_document.h"
#include "fixtures/minimal_pdf.h"
#include "persistence/pdf_text_layer.h"
#include "persistence/saver.h"
#include "pipeline/transcript.h"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace ocrlayer;
using testing_support::WriteBlankPdf;

namespace fs = std::filesystem;

namespace {

/// Two words on one line, in 72 dpi pixels
std::shared_ptr<const TextZone> TwoWords(const cv::Size& size) {
    auto page = std::make_shared<TextZone>(ZoneType::Page, BBox(0, 0, size.width, size.height));
    TextZone& line = page->AddChild(TextZone(ZoneType::Line, BBox(72, 700, 300, 720)));
    line.AddChild(TextZone(ZoneType::Word, BBox(72, 700, 150, 720), "Hello"));
    line.AddChild(TextZone(ZoneType::Word, BBox(160, 700, 300, 720), "world"));
    return page;
}

/**
 * @brief A blank document and a transcript with text on its first page
 */
class SaverTest : public ::testing::Test {
protected:
    void SetUp() override {
        WriteBlankPdf(Input(), rotations_);
        RenderConfig config;
        config.dpi = 72;
        PdfDocument document(Input(), config);
        std::vector<int> numbers;
        for (size_t i = 0; i < rotations_.size(); ++i) {
            numbers.push_back(static_cast<int>(i) + 1);
        }
        pages_ = document.Describe(numbers);
    }

    std::unique_ptr<Transcript> MakeTranscript(bool clearText, bool withText = true) {
        auto transcript = std::make_unique<Transcript>(dir_.File("t.script"), clearText);
        for (const auto& page : pages_) {
            bool text = withText && page.index == 0;
            transcript->Append(page, text ? TwoWords(page.pixelSize) : nullptr);
        }
        transcript->Close();
        return transcript;
    }

    std::string Input() const { return dir_.File("in.pdf"); }
    std::string Output(const std::string& name) const { return dir_.File(name); }

    static int HiddenTextObjects(const std::string& path, int documentIndex) {
        PdfWriter writer(path);
        return writer.RemoveHiddenText(documentIndex);
    }

    TempDir dir_{"ocrlayer-test."};
    std::vector<int> rotations_ = {0, 90};
    std::vector<PageDescriptor> pages_;
};

} // namespace

// ==================== PdfWriter ====================

TEST_F(SaverTest, TextLayerSurvivesSave) {
    {
        PdfWriter writer(Input());
        EXPECT_EQ(writer.AddTextLayer(0, *TwoWords(pages_[0].pixelSize), pages_[0].pixelSize, 0), 2);
        writer.SaveAs(Output("out.pdf"));
    }
    EXPECT_EQ(HiddenTextObjects(Output("out.pdf"), 0), 2);
    EXPECT_EQ(HiddenTextObjects(Output("out.pdf"), 1), 0);
}

TEST_F(SaverTest, RotatedPageGetsText) {
    PdfWriter writer(Input());
    TextZone zone = *TwoWords(pages_[1].pixelSize);
    zone.Rotate(90, pages_[1].pixelSize);
    EXPECT_EQ(writer.AddTextLayer(1, zone, pages_[1].pixelSize, 90), 2);
}

TEST_F(SaverTest, SaveSubset) {
    PdfWriter writer(Input());
    writer.SaveAs(Output("subset.pdf"), {1});
    EXPECT_EQ(PdfWriter(Output("subset.pdf")).PageCount(), 1);
    EXPECT_FALSE(fs::exists(Output("subset.pdf.tmp")));
}

TEST_F(SaverTest, SaveToMissingDirectoryFails) {
    PdfWriter writer(Input());
    EXPECT_THROW(writer.SaveAs("/nonexistent/ocrlayer-test/out.pdf"), PersistenceError);
}

// ==================== Savers ====================

TEST_F(SaverTest, BundledSaver) {
    auto transcript = MakeTranscript(false);
    BundledSaver saver(Output("bundled.pdf"));
    saver.Save(Input(), *transcript, {});

    EXPECT_EQ(PdfWriter(Output("bundled.pdf")).PageCount(), 2);
    EXPECT_EQ(HiddenTextObjects(Output("bundled.pdf"), 0), 2);
    // The input is left alone
    EXPECT_EQ(HiddenTextObjects(Input(), 0), 0);
}

TEST_F(SaverTest, BundledSaverOcrOnlyPages) {
    auto transcript = MakeTranscript(false);
    BundledSaver saver(Output("bundled.pdf"));
    saver.Save(Input(), *transcript, {0});
    EXPECT_EQ(PdfWriter(Output("bundled.pdf")).PageCount(), 1);
}

TEST_F(SaverTest, ClearTextRemovesExistingLayer) {
    BundledSaver(Output("first.pdf")).Save(Input(), *MakeTranscript(false), {});
    ASSERT_EQ(HiddenTextObjects(Output("first.pdf"), 0), 2);

    auto transcript = MakeTranscript(true, false);
    BundledSaver(Output("second.pdf")).Save(Output("first.pdf"), *transcript, {});
    EXPECT_EQ(HiddenTextObjects(Output("second.pdf"), 0), 0);
}

TEST_F(SaverTest, NewLayerReplacesExistingOne) {
    BundledSaver(Output("first.pdf")).Save(Input(), *MakeTranscript(false), {});
    ASSERT_EQ(HiddenTextObjects(Output("first.pdf"), 0), 2);

    BundledSaver(Output("second.pdf")).Save(Output("first.pdf"), *MakeTranscript(false), {});
    EXPECT_EQ(HiddenTextObjects(Output("second.pdf"), 0), 2);
}

TEST_F(SaverTest, PageWithoutTextLosesExistingLayer) {
    BundledSaver(Output("first.pdf")).Save(Input(), *MakeTranscript(false), {});
    ASSERT_EQ(HiddenTextObjects(Output("first.pdf"), 0), 2);

    BundledSaver(Output("second.pdf")).Save(Output("first.pdf"), *MakeTranscript(false, false), {});
    EXPECT_EQ(HiddenTextObjects(Output("second.pdf"), 0), 0);
}

TEST_F(SaverTest, PagesOutsideTranscriptKeepLayer) {
    BundledSaver(Output("first.pdf")).Save(Input(), *MakeTranscript(false), {});

    // Only the second page was requested
    PageDescriptor second = pages_[1];
    second.index = 0;
    Transcript transcript(dir_.File("second.script"), false);
    transcript.Append(second, nullptr);
    transcript.Close();
    BundledSaver(Output("second.pdf")).Save(Output("first.pdf"), transcript, {});
    EXPECT_EQ(HiddenTextObjects(Output("second.pdf"), 0), 2);
}

TEST_F(SaverTest, InPlaceSaver) {
    auto transcript = MakeTranscript(false);
    InPlaceSaver saver;
    EXPECT_TRUE(saver.InPlace());
    saver.Save(Input(), *transcript, {});
    EXPECT_EQ(HiddenTextObjects(Input(), 0), 2);
}

TEST_F(SaverTest, InPlaceSaverKeepsEveryPage) {
    auto transcript = MakeTranscript(false);
    InPlaceSaver().Save(Input(), *transcript, {0});
    EXPECT_EQ(PdfWriter(Input()).PageCount(), 2);
    EXPECT_EQ(HiddenTextObjects(Input(), 0), 2);
}

TEST_F(SaverTest, IndirectSaver) {
    auto transcript = MakeTranscript(false);
    IndirectSaver saver(Output("index.json"));
    EXPECT_EQ(saver.PagePath(2), Output("index_0002.pdf"));
    saver.Save(Input(), *transcript, {});

    std::ifstream in(Output("index.json"));
    nlohmann::json index = nlohmann::json::parse(in);
    ASSERT_EQ(index["pages"].size(), 2u);
    EXPECT_EQ(index["pages"][0]["page"], 1);
    EXPECT_EQ(index["pages"][0]["file"], "index_0001.pdf");
    EXPECT_EQ(index["pages"][0]["id"], "p1");
    EXPECT_EQ(index["pages"][0]["text"], true);
    EXPECT_EQ(index["pages"][1]["text"], false);

    EXPECT_EQ(PdfWriter(Output("index_0001.pdf")).PageCount(), 1);
    EXPECT_EQ(HiddenTextObjects(Output("index_0001.pdf"), 0), 2);
    EXPECT_TRUE(fs::exists(Output("index_0002.pdf")));
}

TEST_F(SaverTest, ScriptSaverCopiesTranscript) {
    auto transcript = MakeTranscript(true);
    ScriptSaver saver(Output("copy.script"));
    saver.Save(Input(), *transcript, {});

    std::ifstream in(Output("copy.script"));
    std::ostringstream content;
    content << in.rdbuf();
    EXPECT_EQ(content.str().rfind("remove-txt\nselect 'p1'\n", 0), 0u);
}

TEST_F(SaverTest, DryRunChangesNothing) {
    auto transcript = MakeTranscript(false);
    DryRunSaver().Save(Input(), *transcript, {});
    EXPECT_EQ(HiddenTextObjects(Input(), 0), 0);
}
