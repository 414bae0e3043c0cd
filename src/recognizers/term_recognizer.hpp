#ifndef PIIANON_RECOGNIZERS_TERM_RECOGNIZER_HPP
#define PIIANON_RECOGNIZERS_TERM_RECOGNIZER_HPP

#include <string>
#include <vector>
#include <algorithm>
#include <utility>
#include "recognizer.hpp"

/**
 * @file term_recognizer.hpp
 * @brief Recognizes a configured list of phrases for one entity type.
 *
 * This fills the registry's model-backed slot (PERSON, LOCATION, ...) from
 * configuration: every listed phrase is reported wherever it occurs on word
 * boundaries, case-sensitively. "Alice" does not match inside "Alicent".
 */

namespace piianon {
namespace recognizers {

class TermRecognizer : public Recognizer
{
public:
    TermRecognizer(std::string entityType, std::vector<std::string> terms, double score)
        : name_("TermListRecognizer(" + entityType + ")"),
          entityType_(std::move(entityType)),
          score_(score)
    {
        for (auto &t : terms) {
            if (!t.empty() && std::find(terms_.begin(), terms_.end(), t) == terms_.end()) {
                terms_.push_back(std::move(t));
            }
        }
        // Longer phrases first so "Alice Johnson" is reported before "Alice".
        std::stable_sort(terms_.begin(), terms_.end(),
                         [](const std::string &a, const std::string &b) { return a.size() > b.size(); });
    }

    const std::string& name() const override
    {
        return name_;
    }

    std::vector<std::string> supportedEntities() const override
    {
        return {entityType_};
    }

    std::vector<RecognizerResult> analyze(const std::string &text) const override
    {
        std::vector<RecognizerResult> results;
        for (const auto &term : terms_) {
            std::size_t pos = text.find(term);
            while (pos != std::string::npos) {
                std::size_t end = pos + term.size();
                if (onBoundary(text, pos, end)) {
                    RecognizerResult r;
                    r.entityType = entityType_;
                    r.start = pos;
                    r.end = end;
                    r.score = score_;
                    r.explanation = Json::Value(Json::objectValue);
                    r.explanation["recognizer"] = name_;
                    r.explanation["original_score"] = score_;
                    r.explanation["score"] = score_;
                    r.explanation["textual_explanation"] =
                        "Matched a configured " + entityType_ + " term";
                    results.push_back(std::move(r));
                }
                pos = text.find(term, pos + 1);
            }
        }
        return results;
    }

private:
    static bool onBoundary(const std::string &text, std::size_t start, std::size_t end)
    {
        bool leftOk = start == 0 || !isWordChar(static_cast<unsigned char>(text[start - 1])) ||
                      !isWordChar(static_cast<unsigned char>(text[start]));
        bool rightOk = end >= text.size() || !isWordChar(static_cast<unsigned char>(text[end])) ||
                       !isWordChar(static_cast<unsigned char>(text[end - 1]));
        return leftOk && rightOk;
    }

    std::string name_;
    std::string entityType_;
    std::vector<std::string> terms_;
    double score_;
};

} // namespace recognizers
} // namespace piianon

#endif // PIIANON_RECOGNIZERS_TERM_RECOGNIZER_HPP
