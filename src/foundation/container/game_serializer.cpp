/// @file game_serializer.cpp
/// @brief Tokenizer and number formatting behind GameSerializer.

#include "arc/foundation/game_serializer.hpp"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace arc::foundation {

namespace detail {

// ── Scalar text conversion ──────────────────────────────────────────────────

std::string escapeJson(std::string_view sv) {
    std::string out;
    out.reserve(sv.size());
    for (char c : sv) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:   out += c; break;
        }
    }
    return out;
}

std::string formatDouble(double value, int maxDigits) {
    if (!std::isfinite(value)) {
        return "null";
    }
    // Grow precision until the text parses back to the same value.
    char buf[40];
    for (int digits = 6; digits <= maxDigits; ++digits) {
        std::snprintf(buf, sizeof(buf), "%.*g", digits, value);
        double back = std::strtod(buf, nullptr);
        if (maxDigits <= 9 ? static_cast<float>(back) == static_cast<float>(value)
                           : back == value) {
            return buf;
        }
    }
    std::snprintf(buf, sizeof(buf), "%.*g", maxDigits, value);
    return buf;
}

bool parseDouble(const std::string& raw, double& out) {
    if (raw.empty()) return false;
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(raw.c_str(), &end);
    if (end != raw.c_str() + raw.size() || errno == ERANGE || !std::isfinite(v)) {
        return false;
    }
    out = v;
    return true;
}

bool parseSigned(const std::string& raw, int64_t& out) {
    if (raw.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(raw.c_str(), &end, 10);
    if (end != raw.c_str() + raw.size() || errno == ERANGE) {
        return false;
    }
    out = static_cast<int64_t>(v);
    return true;
}

bool parseUnsigned(const std::string& raw, uint64_t& out) {
    if (raw.empty() || raw.front() == '-') return false;
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(raw.c_str(), &end, 10);
    if (end != raw.c_str() + raw.size() || errno == ERANGE) {
        return false;
    }
    out = static_cast<uint64_t>(v);
    return true;
}

// ── JsonReader ──────────────────────────────────────────────────────────────

void JsonReader::skipWhitespace() {
    while (pos_ < data_.size() &&
           (data_[pos_] == ' ' || data_[pos_] == '\t' ||
            data_[pos_] == '\n' || data_[pos_] == '\r')) {
        ++pos_;
    }
}

bool JsonReader::expect(char c) {
    skipWhitespace();
    if (pos_ < data_.size() && data_[pos_] == c) {
        ++pos_;
        return true;
    }
    return false;
}

bool JsonReader::atEnd() {
    skipWhitespace();
    return pos_ >= data_.size();
}

char JsonReader::peek() {
    skipWhitespace();
    return pos_ < data_.size() ? data_[pos_] : '\0';
}

bool JsonReader::readQuotedString(std::string& out) {
    skipWhitespace();
    if (pos_ >= data_.size() || data_[pos_] != '"') return false;
    ++pos_;
    out.clear();
    while (pos_ < data_.size() && data_[pos_] != '"') {
        if (data_[pos_] == '\\') {
            ++pos_;
            if (pos_ >= data_.size()) return false;
            switch (data_[pos_]) {
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                default:   out += data_[pos_]; break;
            }
        } else {
            out += data_[pos_];
        }
        ++pos_;
    }
    if (pos_ >= data_.size()) return false;
    ++pos_;  // closing quote
    return true;
}

bool JsonReader::readScalar(std::string& out) {
    skipWhitespace();
    if (pos_ >= data_.size()) return false;
    if (data_[pos_] == '"') {
        return readQuotedString(out);
    }
    std::size_t start = pos_;
    while (pos_ < data_.size() && data_[pos_] != ',' && data_[pos_] != '}' &&
           data_[pos_] != ']' && data_[pos_] != ' ' && data_[pos_] != '\t' &&
           data_[pos_] != '\n' && data_[pos_] != '\r') {
        ++pos_;
    }
    out = std::string(data_.substr(start, pos_ - start));
    return !out.empty();
}

bool JsonReader::readArray(std::vector<std::string>& out) {
    if (!expect('[')) return false;
    out.clear();
    if (expect(']')) return true;
    while (true) {
        std::string element;
        if (!readScalar(element)) return false;
        out.push_back(std::move(element));
        if (expect(']')) return true;
        if (!expect(',')) return false;
    }
}

bool JsonReader::skipValue() {
    skipWhitespace();
    if (pos_ >= data_.size()) return false;
    char open = data_[pos_];
    if (open != '[' && open != '{') {
        std::string dummy;
        return readScalar(dummy);
    }
    int depth = 0;
    while (pos_ < data_.size()) {
        char c = data_[pos_];
        if (c == '"') {
            std::string dummy;
            if (!readQuotedString(dummy)) return false;
            continue;
        }
        if (c == '[' || c == '{') {
            ++depth;
        } else if (c == ']' || c == '}') {
            --depth;
            if (depth == 0) {
                ++pos_;
                return true;
            }
        }
        ++pos_;
    }
    return false;
}

}  // namespace detail

// ── Impl ────────────────────────────────────────────────────────────────────

struct GameSerializer::Impl {};

GameSerializer::GameSerializer() : impl_(std::make_unique<Impl>()) {}

GameSerializer::~GameSerializer() = default;

GameSerializer::GameSerializer(GameSerializer&&) noexcept = default;

GameSerializer& GameSerializer::operator=(GameSerializer&&) noexcept = default;

GameSerializer& GameSerializer::instance() {
    static GameSerializer inst;
    return inst;
}

}  // namespace arc::foundation
