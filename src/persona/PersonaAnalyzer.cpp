#include "persona/PersonaAnalyzer.hpp"

#include "outline/Errors.hpp"
#include "outline/OutlineBuilder.hpp"
#include "pdf/PopplerPdfSource.hpp"
#include "persona/PersonaEmbedder.hpp"

#include <chrono>
#include <future>
#include <iostream>

namespace persona {

const char* to_string(DocumentStatus s) {
    switch (s) {
        case DocumentStatus::Ok: return "ok";
        case DocumentStatus::Empty: return "empty";
        case DocumentStatus::Failed: return "failed";
    }
    return "unknown";
}

static std::unique_ptr<pdf::PdfSource> open_poppler(const std::string& path) {
    return std::make_unique<pdf::PopplerPdfSource>(path);
}

DocumentOutcome extract_document(const std::string& path, const SourceOpener& open_source) {
    DocumentOutcome r;
    r.document = path;

    try {
        std::unique_ptr<pdf::PdfSource> src = open_source ? open_source(path) : open_poppler(path);
        r.outline = outline::extract_outline(*src);
        r.status = DocumentStatus::Ok;
    } catch (const outline::DocumentEmptyError& e) {
        r.status = DocumentStatus::Empty;
        r.outline = e.outline();
        r.reason = e.what();
    } catch (const outline::DocumentReadError& e) {
        r.status = DocumentStatus::Failed;
        r.outline = outline::Outline{};
        r.outline.document_id = path;
        r.reason = e.what();
    } catch (const std::exception& e) {
        r.status = DocumentStatus::Failed;
        r.outline = outline::Outline{};
        r.outline.document_id = path;
        r.reason = e.what();
    }
    return r;
}

void require_document_count(size_t n) {
    if (n < kMinDocuments || n > kMaxDocuments) {
        throw outline::InvalidInputError(
            "persona analysis needs between " + std::to_string(kMinDocuments) + " and " +
            std::to_string(kMaxDocuments) + " documents, got " + std::to_string(n));
    }
}

static double unix_now() {
    using namespace std::chrono;
    return duration<double>(system_clock::now().time_since_epoch()).count();
}

PersonaAnalysis analyze_persona(const std::vector<std::string>& documents,
                                const std::string& persona_description,
                                const std::string& job_to_be_done,
                                const emb::Embedder& embedder,
                                const AnalyzerOptions& opts) {
    require_document_count(documents.size());

    const auto t0 = std::chrono::steady_clock::now();

    PersonaAnalysis out;
    out.metadata.documents = documents;
    out.metadata.persona_description = persona_description;
    out.metadata.job_to_be_done = job_to_be_done;
    out.metadata.timestamp = unix_now();

    // Futures are drained in input order, so completion order never leaks
    // into the ranking tie-break.
    if (opts.parallel) {
        std::vector<std::future<DocumentOutcome>> pending;
        pending.reserve(documents.size());
        for (const auto& path : documents) {
            pending.push_back(std::async(std::launch::async, extract_document, path, opts.open_source));
        }
        for (auto& f : pending) out.documents.push_back(f.get());
    } else {
        for (const auto& path : documents) out.documents.push_back(extract_document(path, opts.open_source));
    }

    std::vector<outline::Outline> outlines;
    for (const auto& d : out.documents) {
        if (d.status != DocumentStatus::Ok) {
            const std::string w = d.document + ": " + d.reason;
            std::cerr << "warning: " << w << "\n";
            out.metadata.warnings.push_back(w);
        }
        if (d.status != DocumentStatus::Failed) outlines.push_back(d.outline);
    }

    if (outlines.empty()) {
        throw outline::DocumentReadError("persona analysis", "none of the " +
                                         std::to_string(documents.size()) + " documents could be read");
    }

    const PersonaVector pv = embed_persona(embedder, persona_description, job_to_be_done);
    out.sections = rank_sections(outlines, pv, embedder);
    out.insights = summarize_top(out.sections);

    out.metadata.processing_time =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    return out;
}

}  // namespace persona
