#include "alignment/ctc_tokenizer.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace infer {
namespace align {

CtcTokenizer::CtcTokenizer(const std::vector<std::string>& labels)
    : vocab_size_(labels.size())
{
    for (size_t i = 0; i < labels.size(); ++i) {
        if (labels[i].empty()) {
            continue;
        }
        char c = labels[i][0];
        label_to_index_[c] = static_cast<int>(i);
        index_to_label_[static_cast<int>(i)] = c;
    }

    auto blank = label_to_index_.find(BLANK_LABEL);
    blank_index_ = blank != label_to_index_.end() ? blank->second : 0;

    auto space = label_to_index_.find(SPACE_LABEL);
    if (space != label_to_index_.end()) {
        space_index_ = space->second;
    }
}

Result<CtcTokenizer> CtcTokenizer::fromFile(const std::string& labels_path) {
    std::ifstream file(labels_path);
    if (!file.is_open()) {
        std::cerr << "[CtcTokenizer] Cannot open labels file: " << labels_path << std::endl;
        return Result<CtcTokenizer>::failure(ErrorInfo::error(ErrorCode::IO_ERROR,
            "Cannot open labels file", labels_path));
    }

    std::vector<std::string> labels;
    std::string line;
    while (std::getline(file, line)) {
        // Windows line endings
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            labels.push_back(line);
        }
    }

    if (labels.empty()) {
        return Result<CtcTokenizer>::failure(ErrorInfo::error(ErrorCode::INVALID_MODEL,
            "Labels file is empty", labels_path));
    }

    return Result<CtcTokenizer>::success(CtcTokenizer(labels));
}

std::vector<int> CtcTokenizer::tokenize(const std::string& text, bool include_spaces) const {
    std::vector<int> tokens;
    tokens.reserve(text.size());

    for (char raw : text) {
        if (raw == ' ') {
            if (include_spaces && space_index_) {
                tokens.push_back(*space_index_);
            }
            continue;
        }

        char c = static_cast<char>(std::tolower(static_cast<unsigned char>(raw)));
        auto it = label_to_index_.find(c);
        if (it != label_to_index_.end()) {
            tokens.push_back(it->second);
        }
    }

    return tokens;
}

std::optional<char> CtcTokenizer::label(int index) const {
    auto it = index_to_label_.find(index);
    if (it == index_to_label_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string CtcTokenizer::detokenize(const std::vector<int>& tokens) const {
    std::string text;
    text.reserve(tokens.size());

    for (int token : tokens) {
        auto c = label(token);
        if (!c) {
            continue;
        }
        text += (*c == SPACE_LABEL) ? ' ' : *c;
    }
    return text;
}

bool CtcTokenizer::isKnown(char c) const {
    char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return label_to_index_.count(lower) > 0;
}

}  // namespace align
}  // namespace infer
