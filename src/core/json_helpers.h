/**
 * @file json_helpers.h
 * @brief JSON string escaping and a minimal streaming writer.
 */

#ifndef CHORDMAP_CORE_JSON_HELPERS_H
#define CHORDMAP_CORE_JSON_HELPERS_H

#include <cstdio>
#include <ostream>
#include <string>

namespace chordmap {
namespace json {

/**
 * @brief Escapes a string for use inside JSON double quotes.
 *
 * Quote, backslash, newline, carriage return and tab use their short
 * escapes; other control characters are written as \u00XX.
 *
 * @example
 * ```cpp
 * json::escape("say \"hi\"");  // returns: say \"hi\"
 * ```
 */
inline std::string escape(const std::string& s) {
  std::string result;
  result.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '"':
        result += "\\\"";
        break;
      case '\\':
        result += "\\\\";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      case '\t':
        result += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          result += buf;
        } else {
          result += c;
        }
        break;
    }
  }
  return result;
}

/**
 * @brief Compact streaming JSON writer with automatic comma handling.
 *
 * @example
 * ```cpp
 * json::Writer w(os);
 * w.beginObject().beginArray("entries");
 * w.beginObject().write("word", "the").writeNull("rank").endObject();
 * w.endArray().endObject();
 * // {"entries":[{"word":"the","rank":null}]}
 * ```
 */
class Writer {
 public:
  explicit Writer(std::ostream& os) : os_(os) {}

  Writer& beginObject(const char* key = nullptr) {
    open(key, '{');
    return *this;
  }

  Writer& endObject() {
    close('}');
    return *this;
  }

  Writer& beginArray(const char* key = nullptr) {
    open(key, '[');
    return *this;
  }

  Writer& endArray() {
    close(']');
    return *this;
  }

  /// @brief Numeric key-value pair.
  template <typename T>
  Writer& write(const char* key, T value) {
    writeKey(key);
    os_ << value;
    return *this;
  }

  Writer& write(const char* key, bool value) {
    writeKey(key);
    os_ << (value ? "true" : "false");
    return *this;
  }

  Writer& write(const char* key, const std::string& value) {
    writeKey(key);
    os_ << '"' << escape(value) << '"';
    return *this;
  }

  Writer& write(const char* key, const char* value) { return write(key, std::string(value)); }

  Writer& writeNull(const char* key) {
    writeKey(key);
    os_ << "null";
    return *this;
  }

  /// @brief String element of the current array.
  Writer& value(const std::string& v) {
    separate();
    os_ << '"' << escape(v) << '"';
    return *this;
  }

 private:
  void open(const char* key, char bracket) {
    if (key) {
      writeKey(key);
    } else {
      separate();
    }
    os_ << bracket;
    first_ = true;
  }

  void close(char bracket) {
    os_ << bracket;
    first_ = false;
  }

  void writeKey(const char* key) {
    separate();
    os_ << '"' << escape(key) << "\":";
  }

  void separate() {
    if (!first_) os_ << ',';
    first_ = false;
  }

  std::ostream& os_;
  bool first_ = true;
};

}  // namespace json
}  // namespace chordmap

#endif  // CHORDMAP_CORE_JSON_HELPERS_H
