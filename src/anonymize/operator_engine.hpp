#ifndef PIIANON_ANONYMIZE_OPERATOR_ENGINE_HPP
#define PIIANON_ANONYMIZE_OPERATOR_ENGINE_HPP

#include <string>
#include <vector>
#include <optional>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include "token_cache.hpp"
#include "../core/finding.hpp"
#include "../core/errors.hpp"
#include "../util/crypto.hpp"

/**
 * @file operator_engine.hpp
 * @brief Rewrites detected spans of a string according to an operator.
 *
 * DESIGN:
 *   - The operator is validated before any text is touched.
 *   - Overlapping findings (of any entity type) are reduced to a non-overlapping set:
 *     accepted greedily by score, then length, then earlier start.
 *   - Replacements are computed in ascending order, so replace tokens are numbered in
 *     reading order, then spliced in descending start order over the unchanged source.
 *     Offsets of later spans are never shifted by earlier edits.
 *
 * OPERATORS:
 *   redact     ""
 *   replace    token from the request's TokenCache, e.g. <PERSON_1>
 *   mask       maskChar repeated numberOfChars times
 *   hash       <TYPE_xxxxxxxx>, first 8 hex chars of SHA-256 of the span
 *   encrypt    base64(IV || AES-128-CBC ciphertext), 16-byte key required
 *   highlight  unchanged; findings are still reported
 */

namespace piianon {
namespace anonymize {

enum class OperatorKind
{
    Redact,
    Replace,
    Mask,
    Hash,
    Encrypt,
    Highlight
};

inline std::string toString(OperatorKind kind)
{
    switch (kind) {
    case OperatorKind::Redact:
        return "redact";
    case OperatorKind::Replace:
        return "replace";
    case OperatorKind::Mask:
        return "mask";
    case OperatorKind::Hash:
        return "hash";
    case OperatorKind::Encrypt:
        return "encrypt";
    case OperatorKind::Highlight:
        return "highlight";
    }
    return "unknown";
}

/**
 * @throw core::InvalidOperatorError for a name that is not an operator (case-insensitive).
 */
inline OperatorKind parseOperatorKind(const std::string &name)
{
    std::string lower;
    lower.reserve(name.size());
    for (unsigned char c : name) {
        lower.push_back(static_cast<char>(std::tolower(c)));
    }
    if (lower == "redact") {
        return OperatorKind::Redact;
    }
    if (lower == "replace") {
        return OperatorKind::Replace;
    }
    if (lower == "mask") {
        return OperatorKind::Mask;
    }
    if (lower == "hash") {
        return OperatorKind::Hash;
    }
    if (lower == "encrypt") {
        return OperatorKind::Encrypt;
    }
    if (lower == "highlight") {
        return OperatorKind::Highlight;
    }
    throw core::InvalidOperatorError("unknown operator '" + name + "'");
}

struct OperatorSpec
{
    OperatorKind kind = OperatorKind::Replace;
    char maskChar = '*';
    int numberOfChars = 15;
    std::optional<std::vector<uint8_t>> encryptKey;
};

/// A run of the source text, labeled with the entity type covering it (if any).
struct AnnotationSegment
{
    std::string text;
    std::optional<std::string> entityType;
    std::size_t start = 0;
    std::size_t end = 0;
};

class OperatorEngine
{
public:
    /**
     * @throw core::InvalidOperatorError, core::InvalidOperatorParamsError or core::MissingKeyError.
     */
    static void validate(const OperatorSpec &spec)
    {
        switch (spec.kind) {
        case OperatorKind::Redact:
        case OperatorKind::Replace:
        case OperatorKind::Hash:
        case OperatorKind::Highlight:
            return;
        case OperatorKind::Mask:
            if (spec.numberOfChars < 0) {
                throw core::InvalidOperatorParamsError("mask: number_of_chars must not be negative, got " +
                                                       std::to_string(spec.numberOfChars));
            }
            return;
        case OperatorKind::Encrypt:
            if (!spec.encryptKey) {
                throw core::MissingKeyError("encrypt: no key supplied");
            }
            if (spec.encryptKey->size() != util::crypto::kAesKeySize) {
                throw core::InvalidOperatorParamsError("encrypt: key must be 16 bytes, got " +
                                                       std::to_string(spec.encryptKey->size()));
            }
            return;
        }
        throw core::InvalidOperatorError("unknown operator kind");
    }

    /**
     * @brief Non-overlapping subset of @p findings, sorted by start.
     */
    static std::vector<core::Finding> resolveOverlaps(const std::vector<core::Finding> &findings)
    {
        std::vector<const core::Finding*> order;
        order.reserve(findings.size());
        for (const auto &f : findings) {
            order.push_back(&f);
        }
        std::stable_sort(order.begin(), order.end(), [](const core::Finding *a, const core::Finding *b) {
            if (a->score != b->score) {
                return a->score > b->score;
            }
            if (a->length() != b->length()) {
                return a->length() > b->length();
            }
            return a->start < b->start;
        });

        std::vector<core::Finding> accepted;
        for (const core::Finding *f : order) {
            bool clash = std::any_of(accepted.begin(), accepted.end(),
                                     [f](const core::Finding &a) { return a.overlaps(*f); });
            if (!clash) {
                accepted.push_back(*f);
            }
        }
        std::sort(accepted.begin(), accepted.end(),
                  [](const core::Finding &a, const core::Finding &b) { return a.start < b.start; });
        return accepted;
    }

    /**
     * @brief Apply @p spec to every accepted finding of @p text.
     * @throw the validate() errors, core::InvalidRequestError for a span outside @p text,
     *        std::runtime_error if OpenSSL fails during encrypt.
     */
    static std::string apply(const std::string &text,
                             const std::vector<core::Finding> &findings,
                             const OperatorSpec &spec,
                             TokenCache &cache)
    {
        validate(spec);
        checkSpans(text, findings);
        if (findings.empty() || spec.kind == OperatorKind::Highlight) {
            return text;
        }

        std::vector<core::Finding> accepted = resolveOverlaps(findings);

        std::vector<std::string> replacements;
        replacements.reserve(accepted.size());
        for (const auto &f : accepted) {
            replacements.push_back(replacementFor(text.substr(f.start, f.length()), f.entityType, spec, cache));
        }

        std::string out = text;
        for (std::size_t i = accepted.size(); i-- > 0;) {
            out.replace(accepted[i].start, accepted[i].length(), replacements[i]);
        }
        return out;
    }

    /**
     * @brief Split @p text into consecutive labeled segments. Empty segments are skipped.
     */
    static std::vector<AnnotationSegment> annotate(const std::string &text, const std::vector<core::Finding> &findings)
    {
        checkSpans(text, findings);
        std::vector<AnnotationSegment> segments;
        std::size_t cursor = 0;
        for (const auto &f : resolveOverlaps(findings)) {
            if (f.start > cursor) {
                segments.push_back({text.substr(cursor, f.start - cursor), std::nullopt, cursor, f.start});
            }
            segments.push_back({text.substr(f.start, f.length()), f.entityType, f.start, f.end});
            cursor = f.end;
        }
        if (cursor < text.size()) {
            segments.push_back({text.substr(cursor), std::nullopt, cursor, text.size()});
        }
        return segments;
    }

private:
    static void checkSpans(const std::string &text, const std::vector<core::Finding> &findings)
    {
        for (const auto &f : findings) {
            if (f.start >= f.end || f.end > text.size()) {
                throw core::InvalidRequestError("finding span [" + std::to_string(f.start) + ", " +
                                                std::to_string(f.end) + ") is outside the text");
            }
        }
    }

    static std::string replacementFor(const std::string &value,
                                      const std::string &entityType,
                                      const OperatorSpec &spec,
                                      TokenCache &cache)
    {
        switch (spec.kind) {
        case OperatorKind::Redact:
            return std::string();
        case OperatorKind::Replace:
            return cache.tokenFor(entityType, value);
        case OperatorKind::Mask:
            return std::string(static_cast<std::size_t>(spec.numberOfChars), spec.maskChar);
        case OperatorKind::Hash:
            return TokenCache::hashToken(entityType, value);
        case OperatorKind::Encrypt:
            return util::crypto::aesEncryptToBase64(value, *spec.encryptKey);
        case OperatorKind::Highlight:
            return value;
        }
        throw core::InvalidOperatorError("unknown operator kind");
    }
};

} // namespace anonymize
} // namespace piianon

#endif // PIIANON_ANONYMIZE_OPERATOR_ENGINE_HPP
