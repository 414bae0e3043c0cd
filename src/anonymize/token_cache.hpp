#ifndef PIIANON_ANONYMIZE_TOKEN_CACHE_HPP
#define PIIANON_ANONYMIZE_TOKEN_CACHE_HPP

#include <string>
#include <map>
#include <utility>
#include <cstddef>
#include "../util/hashing.hpp"

/**
 * @file token_cache.hpp
 * @brief Request-scoped mapping from (entity type, value) to a stable placeholder token.
 *
 * DESIGN:
 *   - Replace strategy: the first new value of a type takes the next counter value,
 *     e.g. <PERSON_1>, <PERSON_2>. Counters start at 1 and are kept per entity type.
 *   - Hash strategy: <PERSON_1a2b3c4d>, the first 8 hex chars of SHA-256 of the value.
 *   - Values are taken literally: case-sensitive, no trimming.
 *   - One cache belongs to one request. It is movable but not copyable, so it can
 *     never be shared between requests by accident.
 *
 * USAGE:
 *   @code
 *   piianon::anonymize::TokenCache cache;
 *   cache.tokenFor("PERSON", "Alice");   // "<PERSON_1>"
 *   cache.tokenFor("PERSON", "Bob");     // "<PERSON_2>"
 *   cache.tokenFor("PERSON", "Alice");   // "<PERSON_1>"
 *   @endcode
 */

namespace piianon {
namespace anonymize {

enum class TokenStrategy
{
    Replace,
    Hash
};

class TokenCache
{
public:
    explicit TokenCache(TokenStrategy strategy = TokenStrategy::Replace)
        : strategy_(strategy)
    {
    }

    TokenCache(const TokenCache &) = delete;
    TokenCache& operator=(const TokenCache &) = delete;
    TokenCache(TokenCache &&) = default;
    TokenCache& operator=(TokenCache &&) = default;

    /**
     * @brief Token for @p value of @p entityType, created on first use.
     */
    const std::string& tokenFor(const std::string &entityType, const std::string &value)
    {
        auto key = std::make_pair(entityType, value);
        auto it = tokens_.find(key);
        if (it != tokens_.end()) {
            return it->second;
        }

        std::string token;
        if (strategy_ == TokenStrategy::Hash) {
            token = hashToken(entityType, value);
        }
        else {
            std::size_t n = ++counters_[entityType];
            token = "<" + entityType + "_" + std::to_string(n) + ">";
        }
        return tokens_.emplace(std::move(key), std::move(token)).first->second;
    }

    /// Hash token without touching any cache state.
    static std::string hashToken(const std::string &entityType, const std::string &value)
    {
        return "<" + entityType + "_" + util::hashing::shortDigest(value) + ">";
    }

    TokenStrategy strategy() const
    {
        return strategy_;
    }

    /// Distinct values seen so far.
    std::size_t size() const
    {
        return tokens_.size();
    }

    /// Counter value for @p entityType (0 when unseen, always 0 in hash strategy).
    std::size_t counter(const std::string &entityType) const
    {
        auto it = counters_.find(entityType);
        return it == counters_.end() ? 0 : it->second;
    }

private:
    TokenStrategy strategy_;
    std::map<std::pair<std::string, std::string>, std::string> tokens_;
    std::map<std::string, std::size_t> counters_;
};

} // namespace anonymize
} // namespace piianon

#endif // PIIANON_ANONYMIZE_TOKEN_CACHE_HPP
