/**
 * @file test_pdf_document.cpp
 * @brief PDFium page source
 */

#include <gtest/gtest.h>
#include "common/errors.h"
#include "common/temp_dir.h"
#include "document/image_io.h"
#include "document/pdf_document.h"
#include "fixtures/minimal_pdf.h"

#include <opencv2/core.hpp>
#include <fstream>
#include <stdexcept>

using namespace ocrlayer;
using testing_support::WriteBlankPdf;

// ==================== Error codes ====================

TEST(PdfDocument, MapPdfiumError) {
    EXPECT_EQ(MapPdfiumError(0), DocumentErrorCode::SUCCESS);
    EXPECT_EQ(MapPdfiumError(1), DocumentErrorCode::UNKNOWN_ERROR);
    EXPECT_EQ(MapPdfiumError(2), DocumentErrorCode::FILE_ERROR);
    EXPECT_EQ(MapPdfiumError(3), DocumentErrorCode::FORMAT_ERROR);
    EXPECT_EQ(MapPdfiumError(4), DocumentErrorCode::PASSWORD_REQUIRED);
    EXPECT_EQ(MapPdfiumError(5), DocumentErrorCode::SECURITY_ERROR);
    EXPECT_EQ(MapPdfiumError(6), DocumentErrorCode::PAGE_ERROR);
    EXPECT_EQ(MapPdfiumError(99), DocumentErrorCode::UNKNOWN_ERROR);
}

TEST(PdfDocument, GetErrorMessage) {
    EXPECT_EQ(GetErrorMessage(DocumentErrorCode::FILE_ERROR), "PDF file cannot be opened");
    EXPECT_EQ(GetErrorMessage(DocumentErrorCode::PASSWORD_REQUIRED), "PDF is password protected");
    EXPECT_EQ(GetErrorMessage(9999), "Unknown PDF processing error");
}

// ==================== RenderConfig ====================

TEST(RenderConfig, DefaultValues) {
    RenderConfig config;
    EXPECT_EQ(config.dpi, 300);
    EXPECT_EQ(config.mode, RenderMode::Color);

    std::string error_msg;
    EXPECT_TRUE(config.Validate(error_msg));
}

TEST(RenderConfig, DpiRange) {
    RenderConfig config;
    std::string error_msg;
    config.dpi = 71;
    EXPECT_FALSE(config.Validate(error_msg));
    config.dpi = 601;
    EXPECT_FALSE(config.Validate(error_msg));
    config.dpi = 72;
    EXPECT_TRUE(config.Validate(error_msg));
}

TEST(RenderConfig, Modes) {
    EXPECT_EQ(ParseRenderMode("mono"), RenderMode::Mono);
    EXPECT_EQ(ParseRenderMode("color"), RenderMode::Color);
    EXPECT_THROW(ParseRenderMode("gray"), std::invalid_argument);
    EXPECT_EQ(RenderBitsPerPixel(RenderMode::Mono), 1);
    EXPECT_EQ(RenderBitsPerPixel(RenderMode::Color), 24);
}

// ==================== Loading ====================

TEST(PdfDocument, MissingFile) {
    try {
        PdfDocument document("/nonexistent/ocrlayer-test.pdf", RenderConfig());
        FAIL() << "expected DocumentError";
    } catch (const DocumentError& e) {
        EXPECT_EQ(e.code(), DocumentErrorCode::FILE_ERROR);
    }
}

TEST(PdfDocument, NotAPdf) {
    TempDir dir("ocrlayer-test.");
    std::ofstream(dir.File("bad.pdf")) << "this is not a PDF";
    EXPECT_THROW(PdfDocument(dir.File("bad.pdf"), RenderConfig()), DocumentError);
}

TEST(PdfDocument, DescribePages) {
    TempDir dir("ocrlayer-test.");
    WriteBlankPdf(dir.File("doc.pdf"), {0, 90, 0});

    RenderConfig config;
    config.dpi = 144;
    PdfDocument document(dir.File("doc.pdf"), config);
    ASSERT_EQ(document.PageCount(), 3);

    auto pages = document.Describe({2, 1});
    ASSERT_EQ(pages.size(), 2u);
    EXPECT_EQ(pages[0].index, 0);
    EXPECT_EQ(pages[0].documentIndex, 1);
    EXPECT_EQ(pages[0].identifier, "p2");
    EXPECT_EQ(pages[0].rotation, 90);
    // Rotated page: the upright raster is landscape
    EXPECT_EQ(pages[0].pixelSize, cv::Size(1584, 1224));

    EXPECT_EQ(pages[1].identifier, "p1");
    EXPECT_EQ(pages[1].rotation, 0);
    EXPECT_EQ(pages[1].pixelSize, cv::Size(1224, 1584));
}

TEST(PdfDocument, RenderBlankPage) {
    TempDir dir("ocrlayer-test.");
    WriteBlankPdf(dir.File("doc.pdf"), {0});

    RenderConfig config;
    config.dpi = 72;
    PdfDocument document(dir.File("doc.pdf"), config);
    auto pages = document.Describe({1});
    cv::Mat image = document.Render(pages[0]);

    EXPECT_EQ(image.size(), cv::Size(612, 792));
    EXPECT_EQ(image.channels(), 3);
    EXPECT_EQ(cv::mean(image)[0], 255.0);
}

TEST(PdfDocument, MonoRenderIsSingleChannel) {
    TempDir dir("ocrlayer-test.");
    WriteBlankPdf(dir.File("doc.pdf"), {0});

    RenderConfig config;
    config.dpi = 72;
    config.mode = RenderMode::Mono;
    PdfDocument document(dir.File("doc.pdf"), config);
    cv::Mat image = document.Render(document.Describe({1})[0]);
    EXPECT_EQ(image.channels(), 1);

    cv::Mat binary = ConvertForEngine(image, 1);
    EXPECT_EQ(binary.type(), CV_8UC1);
}

TEST(PdfDocument, PageSizeLimit) {
    TempDir dir("ocrlayer-test.");
    WriteBlankPdf(dir.File("doc.pdf"), {0});

    RenderConfig config;
    config.dpi = 72;
    config.maxPixelsPerPage = 1000;
    PdfDocument document(dir.File("doc.pdf"), config);
    try {
        document.Render(document.Describe({1})[0]);
        FAIL() << "expected DocumentError";
    } catch (const DocumentError& e) {
        EXPECT_EQ(e.code(), DocumentErrorCode::PAGE_SIZE_ERROR);
    }
}

TEST(PdfDocument, FailedRenderLeavesDocumentUsable) {
    TempDir dir("ocrlayer-test.");
    WriteBlankPdf(dir.File("doc.pdf"), {0, 90});

    RenderConfig config;
    config.dpi = 72;
    PdfDocument document(dir.File("doc.pdf"), config);
    auto pages = document.Describe({1, 2});

    PageDescriptor missing = pages[0];
    missing.documentIndex = 7;
    try {
        document.Render(missing);
        FAIL() << "expected DocumentError";
    } catch (const DocumentError& e) {
        EXPECT_EQ(e.code(), DocumentErrorCode::PAGE_ERROR);
    }

    for (int round = 0; round < 3; ++round) {
        for (const auto& page : pages) {
            EXPECT_EQ(document.Render(page).size(), page.pixelSize);
        }
    }
}

TEST(PdfDocument, EmptyPageHasNoImage) {
    TempDir dir("ocrlayer-test.");
    WriteBlankPdf(dir.File("doc.pdf"), {0});
    PdfDocument document(dir.File("doc.pdf"), RenderConfig());

    PageDescriptor page;
    page.pixelSize = cv::Size(0, 0);
    EXPECT_THROW(document.Render(page), NoImageError);
}

TEST(PdfDocument, CloseIsIdempotent) {
    TempDir dir("ocrlayer-test.");
    WriteBlankPdf(dir.File("doc.pdf"), {0});
    PdfDocument document(dir.File("doc.pdf"), RenderConfig());
    auto pages = document.Describe({1});

    document.Close();
    document.Close();
    EXPECT_THROW(document.Render(pages[0]), DocumentError);
}
