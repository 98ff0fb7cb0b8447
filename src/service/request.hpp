#ifndef PIIGUARD_SERVICE_REQUEST_HPP
#define PIIGUARD_SERVICE_REQUEST_HPP

#include <string>
#include <stdexcept>
#include <vector>
#include <utility>
#include <cctype>
#include <cstdint>
#include "util/logger.hpp"

/**
 * @file request.hpp
 * @brief Parses minimal JSON request objects for the redaction service.
 *
 * DESIGN GOALS:
 *   - Provide a "Request" struct: mode, optional display name, inbound
 *     fields or a single outbound text.
 *   - Provide "parseRequest", a naive scanner for one flat JSON object.
 *     No external JSON library; nested values other than "fields" are
 *     rejected.
 *   - Whitespace inside strings is preserved (documents are multi-line).
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piiguard::service;
 *
 *   std::string incoming = R"({
 *       "mode":"inbound",
 *       "displayName":"Max Mustermann",
 *       "fields":{"resumeText":"Max Mustermann\nmax@example.com ..."}
 *   })";
 *
 *   Request req = parseRequest(incoming);
 *   // req.mode == "inbound", req.fields[0].first == "resumeText"
 *   @endcode
 */

namespace piiguard {
namespace service {

/**
 * @struct Request
 * @brief One call into the redaction service.
 */
struct Request
{
    std::string mode;          ///< "inbound", "outbound" or "audit"
    std::string displayName;   ///< empty when absent or null
    std::vector<std::pair<std::string, std::string>> fields; ///< inbound texts, in request order
    std::string text;          ///< outbound / audit text
};

namespace detail {

/**
 * @class JsonScanner
 * @brief Cursor over a JSON document with just enough grammar for Request.
 */
class JsonScanner
{
public:
    explicit JsonScanner(const std::string &json)
        : json_(json), pos_(0)
    {
    }

    void skipWhitespace()
    {
        while (pos_ < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos_]))) {
            pos_++;
        }
    }

    bool atEnd()
    {
        skipWhitespace();
        return pos_ >= json_.size();
    }

    char peek()
    {
        skipWhitespace();
        if (pos_ >= json_.size()) {
            throw std::runtime_error("parseRequest: unexpected end of input.");
        }
        return json_[pos_];
    }

    void expect(char c)
    {
        if (peek() != c) {
            throw std::runtime_error(std::string("parseRequest: expected '") + c
                                     + "' at pos " + std::to_string(pos_));
        }
        pos_++;
    }

    /**
     * @brief Consume @p c if it is the next non-space character.
     */
    bool consume(char c)
    {
        if (!atEnd() && json_[pos_] == c) {
            pos_++;
            return true;
        }
        return false;
    }

    bool consumeLiteral(const std::string &word)
    {
        skipWhitespace();
        if (json_.compare(pos_, word.size(), word) == 0) {
            pos_ += word.size();
            return true;
        }
        return false;
    }

    /**
     * @brief Read a quoted string and decode its escapes to UTF-8.
     */
    std::string parseString()
    {
        expect('"');
        std::string out;
        while (true) {
            if (pos_ >= json_.size()) {
                throw std::runtime_error("parseRequest: unterminated string.");
            }
            char c = json_[pos_++];
            if (c == '"') {
                break;
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= json_.size()) {
                throw std::runtime_error("parseRequest: dangling escape at end of input.");
            }
            char esc = json_[pos_++];
            switch (esc) {
            case '"':  out.push_back('"');  break;
            case '\\': out.push_back('\\'); break;
            case '/':  out.push_back('/');  break;
            case 'n':  out.push_back('\n'); break;
            case 'r':  out.push_back('\r'); break;
            case 't':  out.push_back('\t'); break;
            case 'b':  out.push_back('\b'); break;
            case 'f':  out.push_back('\f'); break;
            case 'u':  appendUtf8(out, parseUnicodeEscape()); break;
            default:
                throw std::runtime_error(std::string("parseRequest: invalid escape '\\") + esc + "'.");
            }
        }
        return out;
    }

    /**
     * @brief Skip a scalar value (string, number, true/false/null).
     */
    void skipScalar()
    {
        char c = peek();
        if (c == '"') {
            parseString();
            return;
        }
        if (consumeLiteral("true") || consumeLiteral("false") || consumeLiteral("null")) {
            return;
        }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            while (pos_ < json_.size()
                   && (std::isdigit(static_cast<unsigned char>(json_[pos_]))
                       || json_[pos_] == '-' || json_[pos_] == '+' || json_[pos_] == '.'
                       || json_[pos_] == 'e' || json_[pos_] == 'E')) {
                pos_++;
            }
            return;
        }
        throw std::runtime_error("parseRequest: unsupported value at pos " + std::to_string(pos_));
    }

    size_t position() const { return pos_; }

private:
    uint32_t parseHex4()
    {
        if (pos_ + 4 > json_.size()) {
            throw std::runtime_error("parseRequest: truncated \\u escape.");
        }
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            char h = json_[pos_++];
            value <<= 4;
            if (h >= '0' && h <= '9') value |= static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') value |= static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') value |= static_cast<uint32_t>(h - 'A' + 10);
            else throw std::runtime_error("parseRequest: invalid hex digit in \\u escape.");
        }
        return value;
    }

    uint32_t parseUnicodeEscape()
    {
        uint32_t cp = parseHex4();
        if (cp >= 0xD800 && cp <= 0xDBFF) {
            // high surrogate must be followed by \uDC00..\uDFFF
            if (pos_ + 2 > json_.size() || json_[pos_] != '\\' || json_[pos_ + 1] != 'u') {
                throw std::runtime_error("parseRequest: unpaired surrogate in \\u escape.");
            }
            pos_ += 2;
            uint32_t low = parseHex4();
            if (low < 0xDC00 || low > 0xDFFF) {
                throw std::runtime_error("parseRequest: invalid low surrogate in \\u escape.");
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
            throw std::runtime_error("parseRequest: unpaired surrogate in \\u escape.");
        }
        return cp;
    }

    static void appendUtf8(std::string &out, uint32_t cp)
    {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    const std::string &json_;
    size_t pos_;
};

/**
 * @brief Parse the "fields" sub-object: { "name":"text", ... } with string values only.
 */
inline std::vector<std::pair<std::string, std::string>> parseFieldsObject(JsonScanner &scanner)
{
    std::vector<std::pair<std::string, std::string>> result;
    scanner.expect('{');
    if (scanner.consume('}')) {
        return result;
    }
    while (true) {
        std::string key = scanner.parseString();
        scanner.expect(':');
        if (scanner.peek() != '"') {
            throw std::runtime_error("parseRequest: field '" + key + "' must be a string.");
        }
        std::string value = scanner.parseString();
        for (const auto &existing : result) {
            if (existing.first == key) {
                throw std::runtime_error("parseRequest: duplicate field '" + key + "'.");
            }
        }
        result.emplace_back(key, value);

        if (scanner.consume(',')) {
            continue;
        }
        scanner.expect('}');
        break;
    }
    return result;
}

} // namespace detail

/**
 * @brief Parse one JSON object into a Request.
 *
 * Recognised keys: "mode" (string), "displayName" (string or null),
 * "fields" (object of strings), "text" (string). Other scalar keys are
 * ignored with a debug log line.
 *
 * @throw std::runtime_error if the document is malformed or "mode" is missing.
 */
inline Request parseRequest(const std::string &json)
{
    detail::JsonScanner scanner(json);
    Request req;
    bool foundMode = false;

    scanner.expect('{');
    if (!scanner.consume('}')) {
        while (true) {
            std::string key = scanner.parseString();
            scanner.expect(':');

            if (key == "mode") {
                req.mode = scanner.parseString();
                foundMode = true;
            } else if (key == "displayName") {
                if (!scanner.consumeLiteral("null")) {
                    req.displayName = scanner.parseString();
                }
            } else if (key == "fields") {
                req.fields = detail::parseFieldsObject(scanner);
            } else if (key == "text") {
                req.text = scanner.parseString();
            } else {
                scanner.skipScalar();
                piiguard::util::logger::debug("parseRequest: ignoring unknown key='" + key + "'");
            }

            if (scanner.consume(',')) {
                continue;
            }
            scanner.expect('}');
            break;
        }
    }

    if (!scanner.atEnd()) {
        throw std::runtime_error("parseRequest: trailing characters after object at pos "
                                 + std::to_string(scanner.position()));
    }
    if (!foundMode || req.mode.empty()) {
        throw std::runtime_error("parseRequest: request missing 'mode'.");
    }
    return req;
}

} // namespace service
} // namespace piiguard

#endif // PIIGUARD_SERVICE_REQUEST_HPP
