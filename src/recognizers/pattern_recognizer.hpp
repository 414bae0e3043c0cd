#ifndef PIIANON_RECOGNIZERS_PATTERN_RECOGNIZER_HPP
#define PIIANON_RECOGNIZERS_PATTERN_RECOGNIZER_HPP

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <optional>
#include <algorithm>
#include <utility>
#include <cctype>
#include <re2/re2.h>
#include "recognizer.hpp"
#include "../core/errors.hpp"

/**
 * @file pattern_recognizer.hpp
 * @brief Regex-rule recognizer with optional validation and context-word boosting.
 *
 * DESIGN GOALS:
 *   - An ordered list of (name, regex, base_score) rules for one entity type.
 *   - Rules are RE2 expressions. RE2 matches in linear time without recursion, so a
 *     leaf of any length is scanned in bounded stack space.
 *   - An optional validator confirms a match (score 1.0), rejects it (dropped), or
 *     abstains (base score kept). Its verdict is reported as validation_result.
 *   - Context words found among the N words before / M words after a match raise the
 *     score by a fixed boost, capped at 1.0. The word and the applied increase are
 *     reported as supportive_context_word and score_context_improvement.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piianon::recognizers;
 *
 *   PatternRecognizer zip("ZipRecognizer", "US_ZIP",
 *                         {{"zip5", R"(\b\d{5}\b)", 0.1}},
 *                         {"zip", "postal"});
 *   auto results = zip.analyze("postal code 94107");
 *   // results[0].score == 0.45, explanation["supportive_context_word"] == "postal"
 *   @endcode
 */

namespace piianon {
namespace recognizers {

struct Pattern
{
    std::string name;
    std::string regex;
    double score = 0.5;
};

struct ContextSettings
{
    double boost = 0.35;
    std::size_t prefixCount = 5;
    std::size_t suffixCount = 0;
};

/// true: confirmed, false: rejected, nullopt: no opinion.
using Validator = std::function<std::optional<bool>(const std::string &)>;

class PatternRecognizer : public Recognizer
{
public:
    /**
     * @throw core::ConfigError if a rule's regex does not compile.
     */
    PatternRecognizer(std::string name,
                      std::string entityType,
                      std::vector<Pattern> patterns,
                      std::vector<std::string> context = {},
                      ContextSettings contextSettings = ContextSettings(),
                      Validator validator = nullptr)
        : name_(std::move(name)),
          entityType_(std::move(entityType)),
          contextSettings_(contextSettings),
          validator_(std::move(validator))
    {
        RE2::Options options;
        options.set_log_errors(false);
        for (auto &p : patterns) {
            auto re = std::make_unique<RE2>(p.regex, options);
            if (!re->ok()) {
                throw core::ConfigError("PatternRecognizer " + name_ + ": invalid regex in rule '" +
                                        p.name + "': " + re->error());
            }
            rules_.push_back({std::move(p), std::move(re)});
        }
        for (const auto &word : context) {
            std::string normalized = normalizeWord(word);
            if (!normalized.empty()) {
                context_.push_back(std::move(normalized));
            }
        }
    }

    const std::string& name() const override
    {
        return name_;
    }

    std::vector<std::string> supportedEntities() const override
    {
        return {entityType_};
    }

    const std::vector<std::string>& context() const
    {
        return context_;
    }

    std::vector<RecognizerResult> analyze(const std::string &text) const override
    {
        std::vector<RecognizerResult> results;

        const re2::StringPiece input(text);
        for (const auto &rule : rules_) {
            re2::StringPiece m;
            std::size_t pos = 0;
            while (pos <= text.size() &&
                   rule.re->Match(input, pos, text.size(), RE2::UNANCHORED, &m, 1)) {
                std::size_t start = static_cast<std::size_t>(m.data() - input.data());
                std::size_t end = start + m.size();
                if (end == start) {
                    pos = end + 1;
                    continue;
                }
                pos = end;

                RecognizerResult r;
                r.entityType = entityType_;
                r.start = start;
                r.end = end;
                r.score = rule.pattern.score;
                r.explanation = Json::Value(Json::objectValue);
                r.explanation["recognizer"] = name_;
                r.explanation["pattern_name"] = rule.pattern.name;
                r.explanation["pattern"] = rule.pattern.regex;
                r.explanation["original_score"] = rule.pattern.score;

                if (validator_) {
                    std::optional<bool> verdict = validator_(text.substr(start, end - start));
                    if (verdict.has_value()) {
                        r.explanation["validation_result"] = *verdict;
                        if (!*verdict) {
                            continue;
                        }
                        r.score = 1.0;
                    }
                }

                r.explanation["score"] = r.score;
                r.explanation["textual_explanation"] =
                    "Detected by `" + name_ + "` using pattern `" + rule.pattern.name + "`";

                enhanceWithContext(text, r);
                results.push_back(std::move(r));
            }
        }
        return results;
    }

    /**
     * @brief Lower-cased word characters only: "Tel:" -> "tel".
     */
    static std::string normalizeWord(const std::string &word)
    {
        std::string out;
        out.reserve(word.size());
        for (unsigned char c : word) {
            if (isWordChar(c)) {
                out.push_back(static_cast<char>(std::tolower(c)));
            }
        }
        return out;
    }

private:
    struct Rule
    {
        Pattern pattern;
        std::unique_ptr<RE2> re;
    };

    void enhanceWithContext(const std::string &text, RecognizerResult &r) const
    {
        if (context_.empty() || r.score >= 1.0) {
            return;
        }

        std::vector<std::string> window = wordsBefore(text, r.start, contextSettings_.prefixCount);
        std::vector<std::string> after = wordsAfter(text, r.end, contextSettings_.suffixCount);
        window.insert(window.end(), after.begin(), after.end());

        for (const auto &word : window) {
            if (std::find(context_.begin(), context_.end(), word) != context_.end()) {
                double boosted = std::min(1.0, r.score + contextSettings_.boost);
                r.explanation["score_context_improvement"] = boosted - r.score;
                r.explanation["supportive_context_word"] = word;
                r.score = boosted;
                return;
            }
        }
    }

    // Nearest word first.
    static std::vector<std::string> wordsBefore(const std::string &text, std::size_t pos, std::size_t count)
    {
        std::vector<std::string> words;
        std::size_t i = pos;
        while (i > 0 && words.size() < count) {
            while (i > 0 && !isWordChar(static_cast<unsigned char>(text[i - 1]))) {
                --i;
            }
            std::size_t wordEnd = i;
            while (i > 0 && isWordChar(static_cast<unsigned char>(text[i - 1]))) {
                --i;
            }
            if (i < wordEnd) {
                words.push_back(normalizeWord(text.substr(i, wordEnd - i)));
            }
        }
        return words;
    }

    static std::vector<std::string> wordsAfter(const std::string &text, std::size_t pos, std::size_t count)
    {
        std::vector<std::string> words;
        std::size_t i = pos;
        while (i < text.size() && words.size() < count) {
            while (i < text.size() && !isWordChar(static_cast<unsigned char>(text[i]))) {
                ++i;
            }
            std::size_t wordStart = i;
            while (i < text.size() && isWordChar(static_cast<unsigned char>(text[i]))) {
                ++i;
            }
            if (wordStart < i) {
                words.push_back(normalizeWord(text.substr(wordStart, i - wordStart)));
            }
        }
        return words;
    }

    std::string name_;
    std::string entityType_;
    std::vector<Rule> rules_;
    std::vector<std::string> context_;
    ContextSettings contextSettings_;
    Validator validator_;
};

} // namespace recognizers
} // namespace piianon

#endif // PIIANON_RECOGNIZERS_PATTERN_RECOGNIZER_HPP
