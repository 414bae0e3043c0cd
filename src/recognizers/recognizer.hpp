#ifndef PIIANON_RECOGNIZERS_RECOGNIZER_HPP
#define PIIANON_RECOGNIZERS_RECOGNIZER_HPP

#include <string>
#include <vector>
#include <cstddef>
#include <cctype>
#include <json/json.h>

/**
 * @file recognizer.hpp
 * @brief Base contract of an entity recognizer and its raw result type.
 *
 * Recognizers are immutable once constructed and are shared by every request through
 * the RecognizerRegistry, so analyze() must be const and free of side effects.
 *
 * The raw explanation is an open JSON object: recognizers add whatever fields they know
 * about, and the explanation assembler copies them without a fixed field list.
 */

namespace piianon {
namespace recognizers {

/**
 * @struct RecognizerResult
 * @brief One raw match reported by a recognizer, before thresholds and list filtering.
 */
struct RecognizerResult
{
    std::string entityType;
    std::size_t start = 0;
    std::size_t end = 0;
    double score = 0.0;
    Json::Value explanation; ///< objectValue, or nullValue when nothing to explain
};

/**
 * @class Recognizer
 * @brief Abstract entity recognizer.
 */
class Recognizer
{
public:
    virtual ~Recognizer() = default;

    /// Unique name, reported as the "recognizer" explanation field.
    virtual const std::string& name() const = 0;

    /// Entity types this recognizer can report.
    virtual std::vector<std::string> supportedEntities() const = 0;

    /// All matches in @p text. Offsets are byte offsets.
    virtual std::vector<RecognizerResult> analyze(const std::string &text) const = 0;
};

/**
 * @brief Word characters for boundary and context checks.
 *        Bytes >= 0x80 count as word characters so UTF-8 words stay whole.
 */
inline bool isWordChar(unsigned char c)
{
    return c >= 0x80 || std::isalnum(c) || c == '_';
}

} // namespace recognizers
} // namespace piianon

#endif // PIIANON_RECOGNIZERS_RECOGNIZER_HPP
