#include <gtest/gtest.h>

#include <filesystem>
#include <map>
#include <set>
#include <stdexcept>
#include <system_error>

#include "outline/Errors.hpp"
#include "persona/AnalysisArtifact.hpp"
#include "persona/PersonaAnalyzer.hpp"
#include "test_support.hpp"

using testsupport::FakePdfSource;
using testsupport::KeywordEmbedder;

namespace {

struct FakeLibrary {
    std::map<std::string, std::vector<std::string>> pages;
    std::map<std::string, int> broken_page;
    std::set<std::string> permission_denied;
    std::set<std::string> runtime_failure;

    persona::SourceOpener opener() const {
        return [this](const std::string& path) -> std::unique_ptr<pdf::PdfSource> {
            auto it = pages.find(path);
            if (permission_denied.count(path)) {
                throw std::filesystem::filesystem_error(
                    "status", path, std::make_error_code(std::errc::permission_denied));
            }
            if (runtime_failure.count(path)) throw std::runtime_error("decoder crashed");
            if (it == pages.end()) throw outline::DocumentReadError(path, "file not found");
            auto src = std::make_unique<FakePdfSource>(path, it->second);
            auto b = broken_page.find(path);
            if (b != broken_page.end()) src->break_page(b->second);
            return src;
        };
    }
};

class PersonaAnalyzerTest : public ::testing::TestWithParam<bool> {
protected:
    FakeLibrary lib;
    KeywordEmbedder embedder{"data", "scientist", "implement", "ml", "pipeline",
                             "machine", "learning", "architecture", "appendix", "glossary",
                             "feature", "engineering", "budget"};

    void SetUp() override {
        lib.pages["a.pdf"] = {"INTRODUCTION\nbody text.\n",
                              "Machine Learning Pipeline Architecture\nmore body.\n",
                              "Appendix: Glossary\n"};
        lib.pages["b.pdf"] = {"2. Feature Engineering\nbody.\n"};
        lib.pages["c.pdf"] = {"BUDGET\nnumbers.\n"};
    }

    persona::AnalyzerOptions options() const {
        persona::AnalyzerOptions o;
        o.parallel = GetParam();
        o.open_source = lib.opener();
        return o;
    }
};

}  // namespace

TEST_P(PersonaAnalyzerTest, RejectsTooFewOrTooManyDocuments) {
    const std::vector<std::string> two = {"a.pdf", "b.pdf"};
    EXPECT_THROW(persona::analyze_persona(two, "Data Scientist", "Implement ML pipeline", embedder, options()),
                 outline::InvalidInputError);

    std::vector<std::string> eleven;
    for (int i = 0; i < 11; ++i) eleven.push_back("a.pdf");
    EXPECT_THROW(persona::analyze_persona(eleven, "Data Scientist", "Implement ML pipeline", embedder, options()),
                 outline::InvalidInputError);

    // nothing was embedded before the rejection
    EXPECT_EQ(embedder.calls, 0u);
}

TEST_P(PersonaAnalyzerTest, AcceptsExactlyTenDocuments) {
    std::vector<std::string> ten;
    for (int i = 0; i < 10; ++i) ten.push_back("c.pdf");

    const auto a = persona::analyze_persona(ten, "Data Scientist", "Implement ML pipeline", embedder, options());
    EXPECT_EQ(a.documents.size(), 10u);
    EXPECT_EQ(a.sections.size(), 10u);
    EXPECT_TRUE(a.metadata.warnings.empty());
}

TEST_P(PersonaAnalyzerTest, RelevantSectionOutranksGlossary) {
    const auto a = persona::analyze_persona({"a.pdf", "b.pdf", "c.pdf"},
                                            "Data Scientist", "Implement ML pipeline", embedder, options());

    int ml_pos = -1, glossary_pos = -1;
    for (size_t i = 0; i < a.sections.size(); ++i) {
        if (a.sections[i].section_title == "Machine Learning Pipeline Architecture") ml_pos = static_cast<int>(i);
        if (a.sections[i].section_title == "Appendix: Glossary") glossary_pos = static_cast<int>(i);
    }
    ASSERT_GE(ml_pos, 0);
    ASSERT_GE(glossary_pos, 0);
    EXPECT_LT(ml_pos, glossary_pos);
    EXPECT_EQ(a.sections[static_cast<size_t>(ml_pos)].page, 2);

    for (size_t i = 1; i < a.sections.size(); ++i) {
        EXPECT_GE(a.sections[i - 1].importance, a.sections[i].importance);
    }
    EXPECT_EQ(a.insights.size(), a.sections.size());
    EXPECT_TRUE(a.metadata.warnings.empty());
    EXPECT_EQ(a.metadata.documents.size(), 3u);
}

TEST_P(PersonaAnalyzerTest, TiesFollowSuppliedDocumentOrder) {
    lib.pages["x.pdf"] = {"SUMMARY\n"};
    lib.pages["y.pdf"] = {"SUMMARY\n"};
    lib.pages["z.pdf"] = {"SUMMARY\n"};

    const auto a = persona::analyze_persona({"z.pdf", "x.pdf", "y.pdf"},
                                            "Data Scientist", "Implement ML pipeline", embedder, options());
    ASSERT_EQ(a.sections.size(), 3u);
    EXPECT_EQ(a.sections[0].document, "z.pdf");
    EXPECT_EQ(a.sections[1].document, "x.pdf");
    EXPECT_EQ(a.sections[2].document, "y.pdf");
}

TEST_P(PersonaAnalyzerTest, UnreadableDocumentIsReportedNotFatal) {
    lib.broken_page["b.pdf"] = 0;

    const auto a = persona::analyze_persona({"a.pdf", "b.pdf", "missing.pdf"},
                                            "Data Scientist", "Implement ML pipeline", embedder, options());

    ASSERT_EQ(a.documents.size(), 3u);
    EXPECT_EQ(a.documents[0].status, persona::DocumentStatus::Ok);
    EXPECT_EQ(a.documents[1].status, persona::DocumentStatus::Failed);
    EXPECT_EQ(a.documents[2].status, persona::DocumentStatus::Failed);
    EXPECT_EQ(a.metadata.warnings.size(), 2u);

    for (const auto& s : a.sections) EXPECT_EQ(s.document, "a.pdf");
}

TEST_P(PersonaAnalyzerTest, ForeignExceptionsMarkOnlyThatDocumentFailed) {
    lib.pages["bad.pdf"] = {"SUMMARY\n"};
    lib.pages["odd.pdf"] = {"SUMMARY\n"};
    lib.permission_denied.insert("bad.pdf");
    lib.runtime_failure.insert("odd.pdf");

    const auto a = persona::analyze_persona({"a.pdf", "bad.pdf", "odd.pdf", "c.pdf"},
                                            "Data Scientist", "Implement ML pipeline", embedder, options());

    ASSERT_EQ(a.documents.size(), 4u);
    EXPECT_EQ(a.documents[0].status, persona::DocumentStatus::Ok);
    EXPECT_EQ(a.documents[1].status, persona::DocumentStatus::Failed);
    EXPECT_EQ(a.documents[2].status, persona::DocumentStatus::Failed);
    EXPECT_EQ(a.documents[3].status, persona::DocumentStatus::Ok);
    EXPECT_NE(a.documents[2].reason.find("decoder crashed"), std::string::npos);
    EXPECT_EQ(a.metadata.warnings.size(), 2u);

    for (const auto& s : a.sections) {
        EXPECT_TRUE(s.document == "a.pdf" || s.document == "c.pdf") << s.document;
    }
    EXPECT_FALSE(a.sections.empty());
}

TEST_P(PersonaAnalyzerTest, EmptyDocumentKeepsMinimalOutline) {
    lib.pages["blank.pdf"] = {"just prose, no headings.\n"};

    const auto a = persona::analyze_persona({"a.pdf", "blank.pdf", "c.pdf"},
                                            "Data Scientist", "Implement ML pipeline", embedder, options());
    EXPECT_EQ(a.documents[1].status, persona::DocumentStatus::Empty);
    EXPECT_EQ(a.documents[1].outline.title, outline::kUntitledDocument);
    EXPECT_EQ(a.metadata.warnings.size(), 1u);
}

TEST_P(PersonaAnalyzerTest, AllDocumentsUnreadableIsAnError) {
    EXPECT_THROW(persona::analyze_persona({"m1.pdf", "m2.pdf", "m3.pdf"},
                                          "Data Scientist", "Implement ML pipeline", embedder, options()),
                 outline::DocumentReadError);
}

TEST_P(PersonaAnalyzerTest, ArtifactMatchesContract) {
    const auto a = persona::analyze_persona({"a.pdf", "b.pdf", "c.pdf"},
                                            "Data Scientist", "Implement ML pipeline", embedder, options());
    const auto j = persona::analysis_to_json(a);

    EXPECT_EQ(j.at("metadata").at("persona_description"), "Data Scientist");
    EXPECT_EQ(j.at("metadata").at("job_to_be_done"), "Implement ML pipeline");
    ASSERT_EQ(j.at("extracted_sections").size(), a.sections.size());

    const auto& first = j.at("extracted_sections")[0];
    EXPECT_EQ(first.at("section_title"), a.sections[0].section_title);
    EXPECT_EQ(first.at("level"), outline::to_string(a.sections[0].level));
    EXPECT_TRUE(first.contains("importance_rank"));
    EXPECT_TRUE(first.contains("similarity_score"));

    const auto& insight = j.at("sub_section_analyses")[0];
    EXPECT_EQ(insight.at("original_title"), a.sections[0].section_title);
    EXPECT_TRUE(insight.contains("refined_text"));
    EXPECT_TRUE(insight.contains("relevance_explanation"));
}

INSTANTIATE_TEST_SUITE_P(SerialAndParallel, PersonaAnalyzerTest, ::testing::Bool());
