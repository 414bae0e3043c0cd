#ifndef PIIANON_UTIL_JSON_WRITER_HPP
#define PIIANON_UTIL_JSON_WRITER_HPP

#include <string>
#include <vector>
#include <memory>
#include <sstream>
#include <algorithm>
#include <cstdlib>
#include <json/json.h>

/**
 * @file json_writer.hpp
 * @brief Compact jsoncpp serialization that keeps object members in document order.
 *
 * jsoncpp stores object members sorted by name. Its CharReader records the byte offset
 * of every value it parses, so the member order of a parsed document can be recovered
 * from the offsets of the member values. Values built in code carry no offsets and
 * keep name order.
 *
 * Reals are written with the fewest significant digits (15 to 17) that read back to
 * the same double, so 0.1 stays "0.1".
 *
 * USAGE EXAMPLE:
 *   @code
 *   Json::Value doc;   // parsed from {"zeta":1,"alpha":2}
 *   std::string out = piianon::util::json::writeCompact(doc);
 *   // out == "{\"zeta\":1,\"alpha\":2}"
 *   @endcode
 */

namespace piianon {
namespace util {
namespace json {

/**
 * @brief Carry the parse offsets of @p from over to @p to.
 */
inline void copyOffsets(Json::Value &to, const Json::Value &from)
{
    to.setOffsetStart(from.getOffsetStart());
    to.setOffsetLimit(from.getOffsetLimit());
}

/**
 * @brief Member names of @p object in document order when every member was parsed,
 *        otherwise in name order.
 */
inline std::vector<std::string> memberNamesInDocumentOrder(const Json::Value &object)
{
    std::vector<std::string> names = object.getMemberNames();
    bool parsed = std::all_of(names.begin(), names.end(), [&object](const std::string &name) {
        return object[name].getOffsetLimit() > 0;
    });
    if (parsed) {
        std::stable_sort(names.begin(), names.end(), [&object](const std::string &a, const std::string &b) {
            return object[a].getOffsetStart() < object[b].getOffsetStart();
        });
    }
    return names;
}

/**
 * @brief Shortest text for @p value that parses back to the same double.
 */
inline std::string formatReal(double value)
{
    for (unsigned int precision = 15; precision < 17; ++precision) {
        std::string text = Json::valueToString(value, precision);
        if (std::strtod(text.c_str(), nullptr) == value) {
            return text;
        }
    }
    return Json::valueToString(value, 17);
}

class CompactWriter
{
public:
    CompactWriter()
    {
        builder_["indentation"] = "";
        builder_["emitUTF8"] = true;
        scalar_.reset(builder_.newStreamWriter());
    }

    CompactWriter(const CompactWriter &) = delete;
    CompactWriter& operator=(const CompactWriter &) = delete;

    std::string write(const Json::Value &value)
    {
        std::ostringstream out;
        emit(value, out);
        return out.str();
    }

private:
    void emit(const Json::Value &value, std::ostream &out)
    {
        switch (value.type()) {
        case Json::objectValue: {
            out << '{';
            bool first = true;
            for (const auto &name : memberNamesInDocumentOrder(value)) {
                if (!first) {
                    out << ',';
                }
                first = false;
                scalar_->write(Json::Value(name), &out);
                out << ':';
                emit(value[name], out);
            }
            out << '}';
            break;
        }
        case Json::arrayValue:
            out << '[';
            for (Json::ArrayIndex i = 0; i < value.size(); ++i) {
                if (i > 0) {
                    out << ',';
                }
                emit(value[i], out);
            }
            out << ']';
            break;
        case Json::realValue:
            out << formatReal(value.asDouble());
            break;
        default:
            scalar_->write(value, &out);
            break;
        }
    }

    Json::StreamWriterBuilder builder_;
    std::unique_ptr<Json::StreamWriter> scalar_;
};

/**
 * @brief Compact JSON text of @p value, members in document order.
 */
inline std::string writeCompact(const Json::Value &value)
{
    CompactWriter writer;
    return writer.write(value);
}

} // namespace json
} // namespace util
} // namespace piianon

#endif // PIIANON_UTIL_JSON_WRITER_HPP
