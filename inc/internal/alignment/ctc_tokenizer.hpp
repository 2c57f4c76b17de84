/**
 * @file ctc_tokenizer.hpp
 * @brief Character tokenizer for CTC forced alignment
 *
 * Maps transcript characters to label indices of a CTC vocabulary
 * (MMS-FA style: one character per label, "-" blank, "*" word separator).
 */

#ifndef INFER_ALIGN_CTC_TOKENIZER_HPP
#define INFER_ALIGN_CTC_TOKENIZER_HPP

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../infer_types.hpp"

namespace infer {
namespace align {

class CtcTokenizer {
public:
    static constexpr char BLANK_LABEL = '-';
    static constexpr char SPACE_LABEL = '*';

    CtcTokenizer() = default;

    /// @param labels Labels in vocabulary order; only the first character of each is used
    explicit CtcTokenizer(const std::vector<std::string>& labels);

    /**
     * @brief Load labels from a file (one label per line, blank lines skipped)
     * @return Tokenizer, or IO_ERROR / INVALID_MODEL
     */
    static Result<CtcTokenizer> fromFile(const std::string& labels_path);

    /**
     * @brief Convert text to label indices
     *
     * Text is lower-cased; ' ' becomes the space token when include_spaces is
     * set and the vocabulary has one. Unknown characters are skipped.
     */
    std::vector<int> tokenize(const std::string& text, bool include_spaces = true) const;

    /// @brief Label for an index, empty for out-of-range indices
    std::optional<char> label(int index) const;

    /// @brief Reconstruct text from indices (space token becomes ' ')
    std::string detokenize(const std::vector<int>& tokens) const;

    /// @brief Whether a character maps to a label after lower-casing
    bool isKnown(char c) const;

    int blankIndex() const { return blank_index_; }
    std::optional<int> spaceIndex() const { return space_index_; }
    size_t vocabSize() const { return vocab_size_; }

private:
    std::unordered_map<char, int> label_to_index_;
    std::unordered_map<int, char> index_to_label_;

    int blank_index_ = 0;
    std::optional<int> space_index_;
    size_t vocab_size_ = 0;
};

}  // namespace align
}  // namespace infer

#endif  // INFER_ALIGN_CTC_TOKENIZER_HPP
