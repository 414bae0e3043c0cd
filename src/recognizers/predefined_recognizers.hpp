#ifndef PIIANON_RECOGNIZERS_PREDEFINED_RECOGNIZERS_HPP
#define PIIANON_RECOGNIZERS_PREDEFINED_RECOGNIZERS_HPP

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <cctype>
#include "pattern_recognizer.hpp"
#include "phone_recognizer.hpp"

/**
 * @file predefined_recognizers.hpp
 * @brief Built-in pattern recognizers and their checksum/format validators.
 *
 * PHONE_NUMBER comes from phone_recognizer.hpp. The remaining built-ins are
 * EMAIL_ADDRESS, US_SSN, CREDIT_CARD, IP_ADDRESS, URL, IBAN and DATE_TIME.
 * PERSON and LOCATION have no built-in recognizer. They are served by term
 * lists or an external engine.
 */

namespace piianon {
namespace recognizers {

// ----------------------------------------------------------------------------
//  Validators
// ----------------------------------------------------------------------------

/**
 * @brief Luhn checksum over the digits of @p candidate (separators ignored).
 */
inline bool luhnValid(const std::string &candidate)
{
    int sum = 0;
    int digits = 0;
    bool doubleIt = false;
    for (auto it = candidate.rbegin(); it != candidate.rend(); ++it) {
        unsigned char c = static_cast<unsigned char>(*it);
        if (!std::isdigit(c)) {
            continue;
        }
        int d = c - '0';
        if (doubleIt) {
            d *= 2;
            if (d > 9) {
                d -= 9;
            }
        }
        sum += d;
        doubleIt = !doubleIt;
        ++digits;
    }
    return digits >= 12 && sum % 10 == 0;
}

/**
 * @brief Rejects SSNs that are never issued: area 000, 666 or 9xx, group 00, serial 0000.
 *        Abstains otherwise, because a well-formed number is still only a guess.
 */
inline std::optional<bool> validateUsSsn(const std::string &candidate)
{
    std::string digits;
    for (unsigned char c : candidate) {
        if (std::isdigit(c)) {
            digits.push_back(static_cast<char>(c));
        }
    }
    if (digits.size() != 9) {
        return false;
    }
    const std::string area = digits.substr(0, 3);
    if (area == "000" || area == "666" || digits[0] == '9') {
        return false;
    }
    if (digits.substr(3, 2) == "00" || digits.substr(5, 4) == "0000") {
        return false;
    }
    return std::nullopt;
}

inline std::optional<bool> validateIpv4(const std::string &candidate)
{
    std::size_t pos = 0;
    for (int octet = 0; octet < 4; ++octet) {
        std::size_t next = candidate.find('.', pos);
        std::string part = candidate.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
        if (part.empty() || part.size() > 3) {
            return false;
        }
        if (part.size() > 1 && part[0] == '0') {
            return false;
        }
        if (std::stoi(part) > 255) {
            return false;
        }
        if (next == std::string::npos) {
            return octet == 3;
        }
        pos = next + 1;
    }
    return false;
}

/**
 * @brief ISO 13616 mod-97 check.
 */
inline std::optional<bool> validateIban(const std::string &candidate)
{
    std::string compact;
    for (unsigned char c : candidate) {
        if (!std::isspace(c)) {
            compact.push_back(static_cast<char>(std::toupper(c)));
        }
    }
    if (compact.size() < 15 || compact.size() > 34) {
        return false;
    }
    std::string rearranged = compact.substr(4) + compact.substr(0, 4);
    int remainder = 0;
    for (unsigned char c : rearranged) {
        if (std::isdigit(c)) {
            remainder = (remainder * 10 + (c - '0')) % 97;
        }
        else if (std::isupper(c)) {
            int v = c - 'A' + 10;
            remainder = (remainder * 100 + v) % 97;
        }
        else {
            return false;
        }
    }
    return remainder == 1;
}

inline std::optional<bool> validateEmail(const std::string &candidate)
{
    auto at = candidate.find('@');
    if (at == std::string::npos || at == 0) {
        return false;
    }
    std::string domain = candidate.substr(at + 1);
    if (domain.empty() || domain.find("..") != std::string::npos || domain.front() == '.' || domain.back() == '.' ||
        domain.front() == '-') {
        return false;
    }
    return true;
}

// ----------------------------------------------------------------------------
//  Recognizers
// ----------------------------------------------------------------------------

inline std::shared_ptr<PatternRecognizer> makeEmailRecognizer(const ContextSettings &ctx)
{
    return std::make_shared<PatternRecognizer>(
        "EmailRecognizer", "EMAIL_ADDRESS",
        std::vector<Pattern>{
            {"email_basic", R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9-]+(?:\.[A-Za-z0-9-]+)*\.[A-Za-z]{2,}\b)", 0.5}},
        std::vector<std::string>{"email", "mail", "e-mail"}, ctx, validateEmail);
}

inline std::shared_ptr<PatternRecognizer> makeUsSsnRecognizer(const ContextSettings &ctx)
{
    return std::make_shared<PatternRecognizer>(
        "UsSsnRecognizer", "US_SSN",
        std::vector<Pattern>{
            {"ssn_dashed", R"(\b\d{3}-\d{2}-\d{4}\b)", 0.5},
            {"ssn_spaced", R"(\b\d{3} \d{2} \d{4}\b)", 0.3}},
        std::vector<std::string>{"ssn", "ssns", "social", "security"}, ctx, validateUsSsn);
}

inline std::shared_ptr<PatternRecognizer> makeCreditCardRecognizer(const ContextSettings &ctx)
{
    return std::make_shared<PatternRecognizer>(
        "CreditCardRecognizer", "CREDIT_CARD",
        std::vector<Pattern>{
            {"credit_card_grouped",
             R"(\b(?:4\d{3}|5[0-5]\d{2}|6\d{3}|3\d{3}|1\d{3})[- ]?\d{3,4}[- ]?\d{3,4}[- ]?\d{3,5}\b)", 0.3}},
        std::vector<std::string>{"credit", "card", "visa", "mastercard", "amex", "cc"}, ctx,
        [](const std::string &s) -> std::optional<bool> { return luhnValid(s); });
}

inline std::shared_ptr<PatternRecognizer> makeIpRecognizer(const ContextSettings &ctx)
{
    return std::make_shared<PatternRecognizer>(
        "IpRecognizer", "IP_ADDRESS",
        std::vector<Pattern>{{"ipv4", R"(\b(?:\d{1,3}\.){3}\d{1,3}\b)", 0.6}},
        std::vector<std::string>{"ip", "ipv4", "address"}, ctx, validateIpv4);
}

inline std::shared_ptr<PatternRecognizer> makeUrlRecognizer(const ContextSettings &ctx)
{
    return std::make_shared<PatternRecognizer>(
        "UrlRecognizer", "URL",
        std::vector<Pattern>{
            {"url_with_scheme", R"(\bhttps?://[^\s<>"']*[^\s<>"'.,;:!?)])", 0.6},
            {"url_www", R"(\bwww\.[^\s<>"']*[^\s<>"'.,;:!?)])", 0.5}},
        std::vector<std::string>{"url", "website", "link", "site"}, ctx);
}

inline std::shared_ptr<PatternRecognizer> makeIbanRecognizer(const ContextSettings &ctx)
{
    return std::make_shared<PatternRecognizer>(
        "IbanRecognizer", "IBAN",
        std::vector<Pattern>{
            {"iban_generic", R"(\b[A-Z]{2}\d{2}(?: ?[A-Z0-9]{4}){2,7}(?: ?[A-Z0-9]{1,3})?\b)", 0.5}},
        std::vector<std::string>{"iban", "bank", "account"}, ctx, validateIban);
}

inline std::shared_ptr<PatternRecognizer> makeDateRecognizer(const ContextSettings &ctx)
{
    return std::make_shared<PatternRecognizer>(
        "DateRecognizer", "DATE_TIME",
        std::vector<Pattern>{
            {"date_month_name",
             R"(\b(?:January|February|March|April|May|June|July|August|September|October|November|December)(?:\s+\d{1,2}(?:st|nd|rd|th)?)?(?:,?\s+\d{4})?\b)",
             0.6},
            {"date_numeric", R"(\b\d{1,2}/\d{1,2}/\d{2,4}\b)", 0.6},
            {"date_iso", R"(\b\d{4}-\d{2}-\d{2}\b)", 0.6}},
        std::vector<std::string>{"date", "birthday", "born", "dob"}, ctx);
}

/**
 * @brief Every built-in recognizer, phone included.
 * @param phoneContext Replaces the built-in phone context words when non-empty.
 */
inline std::vector<std::shared_ptr<const Recognizer>> predefinedRecognizers(
    const ContextSettings &ctx, const std::vector<std::string> &phoneContext = {})
{
    return {
        makePhoneRecognizer(ctx, phoneContext),
        makeEmailRecognizer(ctx),
        makeUsSsnRecognizer(ctx),
        makeCreditCardRecognizer(ctx),
        makeIpRecognizer(ctx),
        makeUrlRecognizer(ctx),
        makeIbanRecognizer(ctx),
        makeDateRecognizer(ctx),
    };
}

} // namespace recognizers
} // namespace piianon

#endif // PIIANON_RECOGNIZERS_PREDEFINED_RECOGNIZERS_HPP
