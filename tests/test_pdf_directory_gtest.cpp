#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "pdf/PdfDirectory.hpp"

namespace fs = std::filesystem;

TEST(PdfDirectoryTest, ListsOnlyPdfsSortedByPath) {
    const fs::path dir = fs::temp_directory_path() / "docpersona_pdf_dir_test";
    fs::remove_all(dir);
    fs::create_directories(dir / "nested");

    for (const char* name : {"b.pdf", "a.PDF", "notes.txt", "c.pdf"}) {
        std::ofstream(dir / name) << "x";
    }
    std::ofstream(dir / "nested" / "d.pdf") << "x";

    const auto pdfs = pdf::list_pdfs(dir.string());
    ASSERT_EQ(pdfs.size(), 3u);
    EXPECT_EQ(fs::path(pdfs[0]).filename().string(), "a.PDF");
    EXPECT_EQ(fs::path(pdfs[1]).filename().string(), "b.pdf");
    EXPECT_EQ(fs::path(pdfs[2]).filename().string(), "c.pdf");

    fs::remove_all(dir);
}

TEST(PdfDirectoryTest, MissingDirectoryThrows) {
    EXPECT_THROW(pdf::list_pdfs("does/not/exist"), std::runtime_error);
}
