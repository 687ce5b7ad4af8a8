#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "emb/Embedder.hpp"
#include "outline/Models.hpp"
#include "pdf/PdfSource.hpp"
#include "persona/InsightSummarizer.hpp"
#include "persona/SectionRanker.hpp"

namespace persona {

inline constexpr size_t kMinDocuments = 3;
inline constexpr size_t kMaxDocuments = 10;

enum class DocumentStatus {
    Ok,      // outline extracted
    Empty,   // no pages or no headings; minimal outline kept
    Failed   // unreadable; excluded from ranking
};

const char* to_string(DocumentStatus s);

// Per-document result of the extraction stage.
struct DocumentOutcome {
    std::string document;
    DocumentStatus status = DocumentStatus::Ok;
    outline::Outline outline;   // meaningful unless status == Failed
    std::string reason;         // set unless status == Ok
};

struct AnalysisMetadata {
    std::vector<std::string> documents;
    std::string persona_description;
    std::string job_to_be_done;
    double timestamp = 0.0;        // Unix seconds
    double processing_time = 0.0;  // seconds
    std::vector<std::string> warnings;
};

struct PersonaAnalysis {
    AnalysisMetadata metadata;
    std::vector<DocumentOutcome> documents;   // same order as the input
    std::vector<RankedSection> sections;
    std::vector<Insight> insights;
};

using SourceOpener = std::function<std::unique_ptr<pdf::PdfSource>(const std::string& path)>;

struct AnalyzerOptions {
    bool parallel = true;   // one extraction task per document
    SourceOpener open_source;   // default: PopplerPdfSource
};

// Throws outline::InvalidInputError unless kMinDocuments <= n <= kMaxDocuments.
void require_document_count(size_t n);

// Never throws for a single bad document; see DocumentOutcome.
DocumentOutcome extract_document(const std::string& path, const SourceOpener& open_source);

// Throws outline::InvalidInputError when documents.size() is outside
// [kMinDocuments, kMaxDocuments], and outline::DocumentReadError when no
// document produced an outline.
PersonaAnalysis analyze_persona(const std::vector<std::string>& documents,
                                const std::string& persona_description,
                                const std::string& job_to_be_done,
                                const emb::Embedder& embedder,
                                const AnalyzerOptions& opts = {});

}  // namespace persona
