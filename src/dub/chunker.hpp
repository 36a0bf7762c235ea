#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace dub {

// Splits text for translation/synthesis. Text within `max_len` is one chunk.
// Longer text is split after sentence punctuation, sentences are packed greedily,
// over-long sentences are packed word by word. Words are never split; a single
// word longer than `max_len` is a chunk of its own.
std::vector<std::string> split_for_processing(const std::string& text, size_t max_len);

// Sentences in order (terminal punctuation kept, surrounding whitespace dropped).
std::vector<std::string> split_sentences(const std::string& text);

// Joins translated chunks with single spaces.
std::string join_translated(const std::vector<std::string>& chunks);

}
