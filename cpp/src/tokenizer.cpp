// tokenizer.cpp
// Author: Jason Hughes
// Date:   2026
//
// CLIP BPE tokenizer implementation.

#include "gligen/tokenizer.hpp"
#include "gligen/errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>

namespace Gligen
{

namespace
{
const std::string kWordEnd = "</w>";
}

CLIPTokenizer::CLIPTokenizer(const std::string& merges_path,
                             const std::string& vocab_path)
{
    loadMerges(merges_path);
    loadVocab(vocab_path);
}

// ---------------------------------------------------------------------------

void CLIPTokenizer::loadMerges(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        throw ResourceError("CLIPTokenizer: cannot open merges file: " + path);

    std::string line;
    int rank = 0;
    while (std::getline(f, line))
    {
        if (line.empty() || line[0] == '#') continue;  // "#version" header

        std::istringstream ss(line);
        std::string a, b;
        if (!(ss >> a >> b)) continue;

        mergeRank_.emplace(std::make_pair(a, b), rank++);
    }
}

void CLIPTokenizer::loadVocab(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        throw ResourceError("CLIPTokenizer: cannot open vocab file: " + path);

    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    if (!Json::parseFromStream(builder, f, &root, &errors))
        throw ResourceError("CLIPTokenizer: failed to parse vocab JSON: " + errors);

    for (const auto& key : root.getMemberNames())
    {
        const int id = root[key].asInt();
        vocab_[key]  = id;
        inverse_[id] = key;
    }

    auto sot = vocab_.find("<|startoftext|>");
    if (sot != vocab_.end()) sot_ = sot->second;
    auto eot = vocab_.find("<|endoftext|>");
    if (eot != vocab_.end()) eot_ = eot->second;
}

// ---------------------------------------------------------------------------

std::vector<std::string> CLIPTokenizer::bpe(const std::string& word) const
{
    std::vector<std::string> parts;
    parts.reserve(word.size());
    for (std::size_t i = 0; i < word.size(); ++i)
    {
        std::string ch(1, word[i]);
        if (i + 1 == word.size())
            ch += kWordEnd;
        parts.push_back(ch);
    }

    while (parts.size() > 1)
    {
        int         best_rank = std::numeric_limits<int>::max();
        std::size_t best_idx  = parts.size();

        for (std::size_t i = 0; i + 1 < parts.size(); ++i)
        {
            auto it = mergeRank_.find({parts[i], parts[i + 1]});
            if (it != mergeRank_.end() && it->second < best_rank)
            {
                best_rank = it->second;
                best_idx  = i;
            }
        }

        if (best_idx == parts.size()) break;

        parts[best_idx] += parts[best_idx + 1];
        parts.erase(parts.begin() + static_cast<std::ptrdiff_t>(best_idx) + 1);
    }

    return parts;
}

std::vector<int> CLIPTokenizer::tokenize(const std::string& text) const
{
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::vector<int> ids;
    std::istringstream ss(lower);
    std::string word;
    while (ss >> word)
    {
        for (const auto& piece : bpe(word))
        {
            auto it = vocab_.find(piece);
            if (it != vocab_.end())
                ids.push_back(it->second);
            // pieces missing from the vocabulary are skipped
        }
    }
    return ids;
}

TokenizedText CLIPTokenizer::encode(const std::string& text, int max_length, bool pad) const
{
    std::vector<int> body = tokenize(text);

    TokenizedText out;
    const std::size_t room = max_length > 2 ? static_cast<std::size_t>(max_length - 2) : 0;
    if (body.size() > room)
    {
        out.dropped.assign(body.begin() + static_cast<std::ptrdiff_t>(room), body.end());
        body.resize(room);
    }

    out.ids.reserve(static_cast<std::size_t>(max_length));
    out.ids.push_back(sot_);
    out.ids.insert(out.ids.end(), body.begin(), body.end());
    out.ids.push_back(eot_);
    out.attention_mask.assign(out.ids.size(), 1);

    if (pad)
    {
        while (static_cast<int>(out.ids.size()) < max_length)
        {
            out.ids.push_back(eot_);
            out.attention_mask.push_back(0);
        }
    }
    return out;
}

std::string CLIPTokenizer::decode(const std::vector<int>& ids) const
{
    std::string text;
    for (int id : ids)
    {
        auto it = inverse_.find(id);
        if (it == inverse_.end()) continue;

        std::string piece = it->second;
        const auto end = piece.rfind(kWordEnd);
        const bool word_end = end != std::string::npos && end + kWordEnd.size() == piece.size();
        if (word_end)
            piece.erase(end);
        text += piece;
        if (word_end)
            text += ' ';
    }
    while (!text.empty() && text.back() == ' ')
        text.pop_back();
    return text;
}

}  // namespace Gligen
