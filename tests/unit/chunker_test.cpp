#include <cassert>
#include <sstream>
#include <string>
#include <vector>
#include "dub/chunker.hpp"

static std::vector<std::string> words_of(const std::string& s) {
    std::vector<std::string> w;
    std::istringstream in(s);
    std::string x;
    while (in >> x) w.push_back(x);
    return w;
}

int main() {
    // short text bypasses splitting but is shaped the same way (one trimmed chunk)
    {
        auto c = dub::split_for_processing("  Hello world.  ", 1000);
        assert(c.size() == 1 && c[0] == "Hello world.");
        assert(dub::split_for_processing("   ", 10).empty());
    }

    // exactly at the limit stays whole
    {
        const std::string t = "Abc def. Ghi jk.";  // 16 chars
        auto c = dub::split_for_processing(t, 16);
        assert(c.size() == 1 && c[0] == t);
        auto d = dub::split_for_processing(t, 15);
        assert(d.size() == 2 && d[0] == "Abc def." && d[1] == "Ghi jk.");
    }

    // sentences are packed greedily
    {
        auto s = dub::split_sentences("One. Two! Three? \"Four.\" Five");
        assert(s.size() == 5);
        assert(s[3] == "\"Four.\"");
        auto c = dub::split_for_processing("One. Two! Three? Four. Five.", 11);
        assert(c.size() == 3);
        assert(c[0] == "One. Two!");
        assert(c[1] == "Three?");
        assert(c[2] == "Four. Five.");
    }

    // decimals and abbreviations without a following space do not split
    {
        auto s = dub::split_sentences("Pi is 3.14 roughly. Next");
        assert(s.size() == 2 && s[0] == "Pi is 3.14 roughly.");
    }

    // an over-long sentence falls back to word boundaries; words are never cut
    {
        std::string sentence;
        for (int i = 0; i < 60; ++i) sentence += "word" + std::to_string(i) + " ";
        sentence += "end.";
        auto c = dub::split_for_processing(sentence, 40);
        assert(c.size() > 1);
        std::vector<std::string> rejoined;
        for (const auto& chunk : c) {
            assert(chunk.size() <= 40);
            for (const auto& w : words_of(chunk)) rejoined.push_back(w);
        }
        assert(rejoined == words_of(sentence));
    }

    // a single word longer than the limit is its own chunk
    {
        auto c = dub::split_for_processing("tiny Supercalifragilisticexpialidocious tiny", 12);
        assert(c.size() == 3);
        assert(c[1] == "Supercalifragilisticexpialidocious");
    }

    // reassembly keeps sentence order
    {
        std::string text;
        for (int i = 0; i < 30; ++i) text += "Sentence number " + std::to_string(i) + " is here. ";
        auto c = dub::split_for_processing(text, 100);
        assert(c.size() > 1);
        assert(words_of(dub::join_translated(c)) == words_of(text));
        assert(dub::join_translated({"a", "", "b"}) == "a b");
    }
    return 0;
}
