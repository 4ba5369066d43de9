// tokenizer.hpp
// Author: Jason Hughes
// Date:   2026
//
// CLIP BPE tokenizer feeding the GLIGEN text encoder.

#pragma once

#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <json/json.h>

namespace Gligen
{

/// Token ids for one text, truncated and optionally padded.
struct TokenizedText
{
    std::vector<int> ids;             ///< SOT, BPE tokens, EOT, then padding
    std::vector<int> attention_mask;  ///< 1 for real tokens, 0 for padding
    std::vector<int> dropped;         ///< BPE ids cut off by truncation
};

class CLIPTokenizer
{
public:
    CLIPTokenizer() = default;
    /// @param merges_path  Path to merges.txt (BPE merge rules)
    /// @param vocab_path   Path to vocab.json  (token -> id mapping)
    CLIPTokenizer(const std::string& merges_path, const std::string& vocab_path);

    /// BPE ids for a single text, without start/end tokens.
    std::vector<int> tokenize(const std::string& text) const;

    /// Wrap with SOT/EOT, truncate to max_length and, if pad is set, fill
    /// the remainder with the EOT token.
    TokenizedText encode(const std::string& text, int max_length, bool pad) const;

    /// Inverse lookup used for warnings about truncated prompt text.
    std::string decode(const std::vector<int>& ids) const;

    int getPaddingToken() const { return eot_; }
    int getSOTToken()     const { return sot_; }

private:
    void loadMerges(const std::string& path);
    void loadVocab (const std::string& path);

    std::vector<std::string> bpe(const std::string& word) const;

    // merge -> rank, lower rank merges first
    std::map<std::pair<std::string,std::string>, int> mergeRank_;
    std::unordered_map<std::string,int> vocab_;
    std::unordered_map<int,std::string> inverse_;
    int sot_ = 49406;  // <|startoftext|>
    int eot_ = 49407;  // <|endoftext|>
};

}  // namespace Gligen
