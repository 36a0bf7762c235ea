#include "dub/chunker.hpp"
#include <cctype>
#include <sstream>

namespace dub {

namespace {

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }
bool is_terminal(char c) { return c == '.' || c == '!' || c == '?'; }
bool is_closer(char c) { return c == '"' || c == '\'' || c == ')' || c == ']'; }

std::string trim(const std::string& s) {
    size_t a = 0, b = s.size();
    while (a < b && is_space(s[a])) ++a;
    while (b > a && is_space(s[b - 1])) --b;
    return s.substr(a, b - a);
}

std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> words;
    std::istringstream in(s);
    std::string w;
    while (in >> w) words.push_back(w);
    return words;
}

// Appends `piece` to the open chunk, or flushes and starts a new one.
void pack(std::vector<std::string>& chunks, std::string& cur, const std::string& piece, size_t max_len) {
    if (cur.empty()) {
        cur = piece;
    } else if (cur.size() + 1 + piece.size() <= max_len) {
        cur += ' ';
        cur += piece;
    } else {
        chunks.push_back(cur);
        cur = piece;
    }
}

} // namespace

std::vector<std::string> split_sentences(const std::string& text) {
    std::vector<std::string> out;
    size_t begin = 0;
    size_t i = 0;
    while (i < text.size()) {
        if (!is_terminal(text[i])) {
            ++i;
            continue;
        }
        size_t j = i;
        while (j < text.size() && is_terminal(text[j])) ++j;
        while (j < text.size() && is_closer(text[j])) ++j;
        if (j == text.size() || is_space(text[j])) {
            const std::string s = trim(text.substr(begin, j - begin));
            if (!s.empty()) out.push_back(s);
            begin = j;
        }
        i = j;
    }
    const std::string tail = trim(text.substr(begin));
    if (!tail.empty()) out.push_back(tail);
    return out;
}

std::vector<std::string> split_for_processing(const std::string& text, size_t max_len) {
    const std::string whole = trim(text);
    if (whole.empty()) return {};
    if (max_len == 0 || whole.size() <= max_len) return {whole};

    std::vector<std::string> chunks;
    std::string cur;
    for (const auto& sentence : split_sentences(whole)) {
        if (sentence.size() <= max_len) {
            pack(chunks, cur, sentence, max_len);
            continue;
        }
        for (const auto& word : split_words(sentence)) pack(chunks, cur, word, max_len);
    }
    if (!cur.empty()) chunks.push_back(cur);
    return chunks;
}

std::string join_translated(const std::vector<std::string>& chunks) {
    std::string out;
    for (const auto& c : chunks) {
        if (c.empty()) continue;
        if (!out.empty()) out += ' ';
        out += c;
    }
    return out;
}

}
