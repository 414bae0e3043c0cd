#ifndef PIIANON_CORE_FINDING_HPP
#define PIIANON_CORE_FINDING_HPP

#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <variant>
#include <cstdint>
#include <cstddef>

/**
 * @file finding.hpp
 * @brief Request-scoped data model of the anonymizer: findings, explanations,
 *        per-request recognizer configuration and summaries.
 *
 * Everything here is created for one call and discarded with its response.
 */

namespace piianon {
namespace core {

/// Entity type used for deny-list injections.
inline const std::string kGenericPii = "GENERIC_PII";

/// Default minimum score when a request does not set one.
constexpr double kDefaultScoreThreshold = 0.35;

/**
 * @brief A single explanation field. Null is not representable: absent fields are simply not stored.
 */
using FieldValue = std::variant<bool, std::int64_t, double, std::string>;

/**
 * @class Explanation
 * @brief Bag of explanation fields carrying only those actually populated by the engine.
 *
 * Known fields: recognizer, original_score, textual_explanation, pattern_name,
 * pattern, score, validation_result, score_context_improvement,
 * supportive_context_word. Any other field the engine reports is kept as well.
 */
class Explanation
{
public:
    void set(const std::string &name, FieldValue value)
    {
        fields_[name] = std::move(value);
    }

    // Keeps string literals from converting to bool.
    void set(const std::string &name, const char *value)
    {
        fields_[name] = std::string(value);
    }

    bool has(const std::string &name) const
    {
        return fields_.find(name) != fields_.end();
    }

    /**
     * @brief Typed read of a field; nullopt when absent or of a different type.
     */
    template <typename T>
    std::optional<T> get(const std::string &name) const
    {
        auto it = fields_.find(name);
        if (it == fields_.end()) {
            return std::nullopt;
        }
        if (const T *v = std::get_if<T>(&it->second)) {
            return *v;
        }
        return std::nullopt;
    }

    const std::map<std::string, FieldValue>& fields() const
    {
        return fields_;
    }

    std::size_t size() const
    {
        return fields_.size();
    }

    bool empty() const
    {
        return fields_.empty();
    }

private:
    std::map<std::string, FieldValue> fields_;
};

/**
 * @struct Finding
 * @brief One detected PII occurrence.
 *
 * start/end are byte offsets into the analyzed string, 0 <= start < end <= size.
 * path is the JSON Pointer of the string leaf in structure mode, empty in text mode.
 */
struct Finding
{
    std::string entityType;
    std::string text;
    std::size_t start = 0;
    std::size_t end = 0;
    double score = 0.0;
    std::optional<Explanation> explanation;
    std::string path;

    std::size_t length() const
    {
        return end - start;
    }

    bool overlaps(const Finding &other) const
    {
        return start < other.end && other.start < end;
    }
};

/**
 * @struct RecognizerConfig
 * @brief Per-request detection settings.
 *
 * entities == nullopt means every entity type the engine supports.
 * Allow-list entries suppress findings whose exact text matches (case-sensitive).
 * Deny-list entries are injected as GENERIC_PII at score 1.0 wherever they occur.
 */
struct RecognizerConfig
{
    std::optional<std::set<std::string>> entities;
    double scoreThreshold = kDefaultScoreThreshold;
    std::set<std::string> allowList;
    std::set<std::string> denyList;
    bool returnExplanation = false;
};

/// entity type -> number of findings.
using EntitySummary = std::map<std::string, std::size_t>;

inline EntitySummary summarize(const std::vector<Finding> &findings)
{
    EntitySummary summary;
    for (const auto &f : findings) {
        ++summary[f.entityType];
    }
    return summary;
}

inline std::size_t totalCount(const EntitySummary &summary)
{
    std::size_t total = 0;
    for (const auto &kv : summary) {
        total += kv.second;
    }
    return total;
}

} // namespace core
} // namespace piianon

#endif // PIIANON_CORE_FINDING_HPP
