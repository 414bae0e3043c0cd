#ifndef PIIANON_RECOGNIZERS_PHONE_RECOGNIZER_HPP
#define PIIANON_RECOGNIZERS_PHONE_RECOGNIZER_HPP

#include <string>
#include <vector>
#include <memory>
#include "pattern_recognizer.hpp"

/**
 * @file phone_recognizer.hpp
 * @brief PHONE_NUMBER recognizer built from structurally distinct phone formats.
 *
 * Each rule targets one format that a generic digit run cannot produce:
 *   - phone_with_parens:          (555) 123-4567, 555-123-4567, 555.123.4567
 *   - phone_with_plus_and_dashes: +1-555-123-4567, +44 20 7123 4567
 *   - phone_with_extension:       555-123-4567 x123, 555-1234 ext. 12
 *   - phone_tollfree_alpha:       1-800-FLOWERS
 *   - phone_simple_seven_digit:   555-1234 (low score, needs context to be confident)
 *
 * There is no catch-all "N digits" rule: those collide with credit card, IBAN and
 * crypto address formats.
 */

namespace piianon {
namespace recognizers {

inline std::vector<Pattern> phonePatterns()
{
    return {
        // Area code in parentheses, or followed by a mandatory '-' or '.' separator.
        {"phone_with_parens", R"((?:\(\d{3}\)\s?|\b\d{3}[-.])\d{3}[-.]\d{4}\b)", 0.7},
        {"phone_with_plus_and_dashes", R"(\+\d{1,3}[-\s.]?\(?\d{1,4}\)?[-\s.]?\d{1,4}[-\s.]?\d{1,9}\b)", 0.7},
        {"phone_with_extension",
         R"((?:\(?\d{3}\)?[-\s.]?)?\b\d{3}[-\s.]?\d{4}[-\s]?(?:x|ext\.?|extension)[-\s]?\d{1,5}\b)", 0.7},
        {"phone_tollfree_alpha", R"(\b1[-\s.]?(?:800|888|877|866)[-\s.]?[A-Z]{3,7}\b)", 0.6},
        {"phone_simple_seven_digit", R"(\b\d{3}[-\s.]\d{4}\b)", 0.4},
    };
}

inline std::vector<std::string> defaultPhoneContext()
{
    return {"phone", "telephone", "cell", "mobile", "fax", "call", "number",
            "contact", "cellphone", "tel", "ph", "mob"};
}

/**
 * @param context Context words; the built-in list is used when empty.
 */
inline std::shared_ptr<PatternRecognizer> makePhoneRecognizer(const ContextSettings &contextSettings,
                                                              std::vector<std::string> context = {})
{
    if (context.empty()) {
        context = defaultPhoneContext();
    }
    return std::make_shared<PatternRecognizer>("PhoneRecognizer", "PHONE_NUMBER", phonePatterns(),
                                               std::move(context), contextSettings);
}

} // namespace recognizers
} // namespace piianon

#endif // PIIANON_RECOGNIZERS_PHONE_RECOGNIZER_HPP
