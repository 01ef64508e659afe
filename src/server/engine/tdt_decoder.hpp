#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <iterator>
#include <span>
#include <string>
#include <vector>

// Greedy decoding for token-and-duration transducers (Parakeet TDT).
//
// step(frame, last_token) runs the prediction + joint network for one encoder
// frame and returns vocab_size token logits followed by the duration logits
// (duration i means "advance i frames"). commit() is invoked whenever a
// non-blank token is emitted, telling the caller to keep the prediction
// network state produced by the last step; on blank the old state is reused.
namespace tdt {

inline constexpr size_t max_symbols_per_frame = 10;

template <typename StepFn, typename CommitFn>
std::expected<std::vector<int32_t>, std::string>
greedy_decode(size_t num_frames, size_t vocab_size, int32_t blank_id,
              StepFn&& step, CommitFn&& commit) {
    std::vector<int32_t> tokens;
    size_t t = 0;
    size_t emitted = 0;

    while (t < num_frames) {
        int32_t last = tokens.empty() ? blank_id : tokens.back();
        auto logits = step(t, last);
        if (!logits) {
            return std::unexpected(logits.error());
        }

        std::span<const float> all(*logits);
        if (all.size() < vocab_size) {
            return std::unexpected("joint output has " + std::to_string(all.size()) +
                                   " logits, expected at least " + std::to_string(vocab_size));
        }
        auto token_logits = all.first(vocab_size);
        auto duration_logits = all.subspan(vocab_size);

        auto token = static_cast<int32_t>(std::distance(
            token_logits.begin(), std::ranges::max_element(token_logits)));
        size_t skip = 0;
        if (!duration_logits.empty()) {
            skip = static_cast<size_t>(std::distance(
                duration_logits.begin(), std::ranges::max_element(duration_logits)));
        }

        if (token != blank_id) {
            commit();
            tokens.push_back(token);
            ++emitted;
        }

        if (skip > 0) {
            t += skip;
            emitted = 0;
        } else if (token == blank_id || emitted == max_symbols_per_frame) {
            t += 1;
            emitted = 0;
        }
    }
    return tokens;
}

} // namespace tdt
