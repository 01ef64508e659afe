#include "engine/parakeet_vocab.hpp"

#include <charconv>
#include <fstream>
#include <sstream>
#include <string_view>

namespace {

// U+2581 LOWER ONE EIGHTH BLOCK, SentencePiece's word boundary.
constexpr std::string_view word_marker = "\xE2\x96\x81";

} // namespace

std::expected<ParakeetVocab, std::string> ParakeetVocab::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        return std::unexpected("could not open " + path);
    }
    std::stringstream ss;
    ss << f.rdbuf();
    return parse(ss.str());
}

std::expected<ParakeetVocab, std::string> ParakeetVocab::parse(const std::string& text) {
    ParakeetVocab vocab;
    std::istringstream in(text);
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        auto space = line.rfind(' ');
        if (space == std::string::npos || space == 0) {
            return std::unexpected("vocab line " + std::to_string(line_no) + ": expected '<piece> <id>'");
        }

        int32_t id = -1;
        const char* first = line.data() + space + 1;
        const char* last = line.data() + line.size();
        auto [ptr, ec] = std::from_chars(first, last, id);
        if (ec != std::errc{} || ptr != last || id < 0) {
            return std::unexpected("vocab line " + std::to_string(line_no) + ": bad token id");
        }

        if (static_cast<size_t>(id) >= vocab.pieces_.size()) {
            vocab.pieces_.resize(static_cast<size_t>(id) + 1);
        }
        std::string piece = line.substr(0, space);
        if (piece == "<blk>") vocab.blank_id_ = id;
        vocab.pieces_[static_cast<size_t>(id)] = std::move(piece);
    }

    if (vocab.pieces_.empty()) {
        return std::unexpected("vocab is empty");
    }
    if (vocab.blank_id_ < 0) {
        return std::unexpected("vocab has no <blk> token");
    }
    return vocab;
}

std::string ParakeetVocab::detokenize(std::span<const int32_t> tokens) const {
    std::string joined;
    for (int32_t id : tokens) {
        if (id < 0 || static_cast<size_t>(id) >= pieces_.size() || id == blank_id_) continue;
        const auto& piece = pieces_[static_cast<size_t>(id)];
        if (piece.starts_with("<") && piece.ends_with(">")) continue;
        joined += piece;
    }

    std::string text;
    text.reserve(joined.size());
    size_t pos = 0;
    while (pos < joined.size()) {
        if (joined.compare(pos, word_marker.size(), word_marker) == 0) {
            if (!text.empty() && text.back() != ' ') text += ' ';
            pos += word_marker.size();
        } else {
            text += joined[pos++];
        }
    }

    while (!text.empty() && text.back() == ' ') text.pop_back();
    return text;
}
