#include "emb/WordPieceTokenizer.hpp"
#include <cctype>
#include <fstream>

namespace emb {

// BERT caps a single word at 100 characters before giving up with [UNK]
static constexpr size_t kMaxWordChars = 100;

bool WordPieceTokenizer::load_vocab(const std::string& vocab_path) {
    std::ifstream in(vocab_path);
    if (!in) return false;

    m_id_to_tok.clear();
    m_tok_to_id.clear();

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        int64_t id = (int64_t)m_id_to_tok.size();
        m_id_to_tok.push_back(line);
        m_tok_to_id.emplace(line, id);
    }
    return !m_id_to_tok.empty() && cls_id() >= 0 && sep_id() >= 0;
}

int64_t WordPieceTokenizer::id_or(int64_t def, const std::string& tok) const {
    auto it = m_tok_to_id.find(tok);
    return it == m_tok_to_id.end() ? def : it->second;
}

bool WordPieceTokenizer::is_ws(char c) {
    // PDF page text carries form feeds and vertical tabs between blocks
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool WordPieceTokenizer::is_punct(char c) {
    unsigned char uc = (unsigned char)c;
    return uc < 128 && std::ispunct(uc);
}

std::string WordPieceTokenizer::lower_ascii(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::vector<std::string> WordPieceTokenizer::basic_tokenize(const std::string& text) const {
    std::vector<std::string> out;
    std::string cur;

    for (char c : lower_ascii(text)) {
        if (is_ws(c) || is_punct(c)) {
            if (!cur.empty()) out.push_back(std::move(cur));
            cur.clear();
            if (is_punct(c)) out.emplace_back(1, c);
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) out.push_back(std::move(cur));
    return out;
}

// greedy longest-match-first; any unmatched remainder makes the whole word [UNK]
std::vector<std::string> WordPieceTokenizer::wordpiece(const std::string& token) const {
    if (token.empty() || token.size() > kMaxWordChars) return {"[UNK]"};

    std::vector<std::string> pieces;
    size_t start = 0;

    while (start < token.size()) {
        size_t end = token.size();
        std::string match;

        for (; end > start; --end) {
            std::string sub = (start > 0 ? "##" : "") + token.substr(start, end - start);
            if (m_tok_to_id.count(sub)) {
                match = std::move(sub);
                break;
            }
        }

        if (match.empty()) return {"[UNK]"};
        pieces.push_back(std::move(match));
        start = end;
    }

    return pieces;
}

std::vector<int64_t> WordPieceTokenizer::encode(const std::string& text, size_t max_len) const {
    const int64_t unk = unk_id();

    std::vector<int64_t> ids;
    ids.reserve(max_len);
    ids.push_back(cls_id());

    // one slot stays free for [SEP]
    bool full = false;
    for (const auto& word : basic_tokenize(text)) {
        for (const auto& piece : wordpiece(word)) {
            if (ids.size() + 1 >= max_len) {
                full = true;
                break;
            }
            ids.push_back(id_or(unk, piece));
        }
        if (full) break;
    }

    ids.push_back(sep_id());
    return ids;
}

}  // namespace emb
