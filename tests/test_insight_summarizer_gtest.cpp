#include <gtest/gtest.h>

#include "persona/InsightSummarizer.hpp"

static persona::RankedSection section(double similarity, const std::string& title = "Data Pipelines", int page = 4) {
    persona::RankedSection s;
    s.document = "doc.pdf";
    s.page = page;
    s.section_title = title;
    s.similarity = similarity;
    s.importance = similarity;
    return s;
}

TEST(InsightSummarizerTest, ExplanationBands) {
    EXPECT_EQ(persona::explain_relevance(section(0.85)),
              "'Data Pipelines' directly addresses your primary objectives with high relevance.");
    EXPECT_EQ(persona::explain_relevance(section(0.8)),
              "'Data Pipelines' provides valuable context and supporting information for your goals.");
    EXPECT_EQ(persona::explain_relevance(section(0.61)),
              "'Data Pipelines' provides valuable context and supporting information for your goals.");
    EXPECT_EQ(persona::explain_relevance(section(0.6)),
              "'Data Pipelines' offers background information that may be useful for your research.");
}

TEST(InsightSummarizerTest, RefinedTextBands) {
    EXPECT_EQ(persona::refine_text(section(0.71)),
              "This section on 'Data Pipelines' is highly relevant to your needs. "
              "It appears on page 4 and addresses key aspects related to your persona and objectives.");
    EXPECT_NE(persona::refine_text(section(0.7)).find("moderately relevant"), std::string::npos);
    EXPECT_NE(persona::refine_text(section(0.5)).find("somewhat relevant"), std::string::npos);
    EXPECT_NE(persona::refine_text(section(-0.1)).find("somewhat relevant"), std::string::npos);
}

TEST(InsightSummarizerTest, SummarizesAtMostTenInRankOrder) {
    std::vector<persona::RankedSection> ranked;
    for (int i = 0; i < 14; ++i) ranked.push_back(section(1.0 - i * 0.05, "S" + std::to_string(i), i + 1));

    const auto insights = persona::summarize_top(ranked);
    ASSERT_EQ(insights.size(), persona::kInsightCount);
    for (size_t i = 0; i < insights.size(); ++i) {
        EXPECT_EQ(insights[i].section.section_title, ranked[i].section_title);
    }

    ranked.resize(3);
    EXPECT_EQ(persona::summarize_top(ranked).size(), 3u);
}
