#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

// SentencePiece vocabulary exported next to a Parakeet ONNX model.
// vocab.txt holds one "<piece> <id>" pair per line; the blank token is "<blk>".
class ParakeetVocab {
public:
    static std::expected<ParakeetVocab, std::string> load(const std::string& path);
    static std::expected<ParakeetVocab, std::string> parse(const std::string& text);

    // Number of token ids, blank included. Joint logits start with this many
    // token scores followed by the duration scores.
    size_t size() const { return pieces_.size(); }
    int32_t blank_id() const { return blank_id_; }

    // Joins pieces, turns the word-boundary marker into spaces and trims.
    std::string detokenize(std::span<const int32_t> tokens) const;

private:
    std::vector<std::string> pieces_;
    int32_t blank_id_ = -1;
};
