#pragma once

/// @file game_serializer.hpp
/// @brief GameSerializer: JSON encoding of registered record types with
///        schema versioning and compile-time field registration via
///        ARC_SERIALIZABLE.
///
/// The persistence collaborator stores opaque JSON text per key; this header
/// turns plain structs (StatSnapshot, SkillLoadoutRecord, ...) into that text
/// and back. Field walking is template code and lives here; the tokenizer and
/// number formatting live in game_serializer.cpp.

#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "arc/foundation/game_result.hpp"

namespace arc::foundation {

// ── Field registration ──────────────────────────────────────────────────────

/// Specialization point filled in by ARC_SERIALIZABLE.
template <typename T>
struct SerializableTraits {
    static constexpr bool is_serializable = false;
};

/// A serializable field: JSON key and pointer-to-member.
template <typename T, typename M>
struct FieldDescriptor {
    const char* name;
    M T::*pointer;
};

template <typename T, typename M>
constexpr FieldDescriptor<T, M> field(const char* name, M T::*ptr) {
    return {name, ptr};
}

// ── detail:: implementation helpers ─────────────────────────────────────────

namespace detail {

template <typename T, typename = void>
struct is_serializable : std::false_type {};

template <typename T>
struct is_serializable<
    T, std::void_t<decltype(SerializableTraits<T>::schema_version)>>
    : std::true_type {};

template <typename T>
inline constexpr bool is_serializable_v = is_serializable<T>::value;

template <typename T>
struct is_vector : std::false_type {};

template <typename T, typename A>
struct is_vector<std::vector<T, A>> : std::true_type {};

template <typename T>
inline constexpr bool is_vector_v = is_vector<T>::value;

template <typename Tuple, typename Func, std::size_t... Is>
void forEachFieldImpl(const Tuple& t, Func&& f, std::index_sequence<Is...>) {
    (f(std::get<Is>(t)), ...);
}

template <typename Tuple, typename Func>
void forEachField(const Tuple& t, Func&& f) {
    forEachFieldImpl(
        t, std::forward<Func>(f),
        std::make_index_sequence<std::tuple_size_v<Tuple>>{});
}

// ── Scalar text conversion (game_serializer.cpp) ────────────────────────

std::string escapeJson(std::string_view sv);

/// Shortest text that reads back to the identical value; "null" when the
/// value is not finite.
std::string formatDouble(double value, int maxDigits);

bool parseDouble(const std::string& raw, double& out);
bool parseSigned(const std::string& raw, int64_t& out);
bool parseUnsigned(const std::string& raw, uint64_t& out);

// ── JSON writing ────────────────────────────────────────────────────────

template <typename T>
void writeJsonScalar(std::ostringstream& out, const T& val) {
    if constexpr (std::is_same_v<T, bool>) {
        out << (val ? "true" : "false");
    } else if constexpr (std::is_same_v<T, std::string>) {
        out << '"' << escapeJson(val) << '"';
    } else if constexpr (std::is_same_v<T, float>) {
        out << formatDouble(static_cast<double>(val), 9);
    } else if constexpr (std::is_floating_point_v<T>) {
        out << formatDouble(static_cast<double>(val), 17);
    } else if constexpr (std::is_enum_v<T>) {
        out << static_cast<int64_t>(val);
    } else if constexpr (std::is_signed_v<T>) {
        out << static_cast<int64_t>(val);
    } else {
        static_assert(std::is_unsigned_v<T>, "unsupported field type");
        out << static_cast<uint64_t>(val);
    }
}

template <typename T>
void writeJsonValue(std::ostringstream& out, const T& val) {
    if constexpr (is_vector_v<T>) {
        out << '[';
        bool first = true;
        for (const auto& element : val) {
            if (!first) {
                out << ',';
            }
            writeJsonScalar(out, element);
            first = false;
        }
        out << ']';
    } else {
        writeJsonScalar(out, val);
    }
}

// ── JSON reading ────────────────────────────────────────────────────────

/// Cursor over a JSON object of flat fields.
///
/// Values are returned as raw tokens: strings unescaped, numbers and
/// literals verbatim. Nested objects are skipped, arrays of scalars are
/// returned element by element.
class JsonReader {
public:
    explicit JsonReader(std::string_view data) : data_(data) {}

    void skipWhitespace();
    bool expect(char c);
    [[nodiscard]] bool atEnd();
    [[nodiscard]] char peek();

    bool readQuotedString(std::string& out);
    bool readScalar(std::string& out);
    bool readArray(std::vector<std::string>& out);
    bool skipValue();

private:
    std::string_view data_;
    std::size_t pos_ = 0;
};

template <typename T>
bool parseJsonScalar(const std::string& raw, T& val) {
    if constexpr (std::is_same_v<T, bool>) {
        if (raw == "true") { val = true; return true; }
        if (raw == "false") { val = false; return true; }
        return false;
    } else if constexpr (std::is_same_v<T, std::string>) {
        val = raw;
        return true;
    } else if constexpr (std::is_floating_point_v<T>) {
        double d = 0.0;
        if (!parseDouble(raw, d)) return false;
        val = static_cast<T>(d);
        return true;
    } else if constexpr (std::is_enum_v<T>) {
        int64_t i = 0;
        if (!parseSigned(raw, i)) return false;
        val = static_cast<T>(i);
        return true;
    } else if constexpr (std::is_signed_v<T>) {
        int64_t i = 0;
        if (!parseSigned(raw, i)) return false;
        val = static_cast<T>(i);
        return true;
    } else {
        uint64_t u = 0;
        if (!parseUnsigned(raw, u)) return false;
        val = static_cast<T>(u);
        return true;
    }
}

/// Read the next value into a field. On a type mismatch the field keeps its
/// default; false only when the text itself is malformed.
template <typename T>
bool readJsonField(JsonReader& reader, T& val) {
    if constexpr (is_vector_v<T>) {
        if (reader.peek() != '[') {
            return reader.skipValue();
        }
        std::vector<std::string> raws;
        if (!reader.readArray(raws)) return false;
        T parsed;
        parsed.reserve(raws.size());
        for (const auto& raw : raws) {
            typename T::value_type element{};
            if (!parseJsonScalar(raw, element)) {
                return true;
            }
            parsed.push_back(std::move(element));
        }
        val = std::move(parsed);
        return true;
    } else {
        if (reader.peek() == '[' || reader.peek() == '{') {
            return reader.skipValue();
        }
        std::string raw;
        if (!reader.readScalar(raw)) return false;
        T parsed{};
        if (parseJsonScalar(raw, parsed)) {
            val = std::move(parsed);
        }
        return true;
    }
}

}  // namespace detail

// ── GameSerializer ──────────────────────────────────────────────────────────

/// JSON encoder/decoder for types registered with ARC_SERIALIZABLE.
///
/// Output always carries "__v" (the schema version) as its first key.
/// Decoding skips unknown keys, leaves missing fields at their defaults and
/// rejects records written by a newer schema version.
///
/// Example:
/// @code
///   struct SkillLoadoutRecord {
///       std::vector<std::string> skills;
///   };
///   ARC_SERIALIZABLE(SkillLoadoutRecord, 1,
///       field("skills", &SkillLoadoutRecord::skills)
///   );
///
///   auto json = GameSerializer::instance().serializeJson(record);
///   auto back = GameSerializer::instance()
///                   .deserializeJson<SkillLoadoutRecord>(json);
/// @endcode
class GameSerializer {
public:
    GameSerializer();
    ~GameSerializer();

    GameSerializer(const GameSerializer&) = delete;
    GameSerializer& operator=(const GameSerializer&) = delete;
    GameSerializer(GameSerializer&&) noexcept;
    GameSerializer& operator=(GameSerializer&&) noexcept;

    template <typename T>
    [[nodiscard]] std::string serializeJson(const T& obj) const {
        static_assert(detail::is_serializable_v<T>,
                      "Type must be registered with ARC_SERIALIZABLE");

        std::ostringstream out;
        out << "{\"__v\":" << SerializableTraits<T>::schema_version;

        detail::forEachField(SerializableTraits<T>::fields(), [&](const auto& fd) {
            out << ",\"" << fd.name << "\":";
            detail::writeJsonValue(out, obj.*(fd.pointer));
        });

        out << '}';
        return out.str();
    }

    template <typename T>
    [[nodiscard]] GameResult<T> deserializeJson(std::string_view json) const {
        static_assert(detail::is_serializable_v<T>,
                      "Type must be registered with ARC_SERIALIZABLE");

        auto malformed = [](const char* what) {
            return GameResult<T>::err(GameError(ErrorCode::InvalidJsonData, what));
        };

        detail::JsonReader reader(json);
        if (!reader.expect('{')) {
            return malformed("expected '{'");
        }

        T obj{};
        auto fields = SerializableTraits<T>::fields();

        bool first = true;
        while (true) {
            if (reader.atEnd()) {
                return malformed("unexpected end of JSON");
            }
            if (reader.expect('}')) {
                break;
            }
            if (!first && !reader.expect(',')) {
                return malformed("expected ','");
            }
            first = false;

            std::string key;
            if (!reader.readQuotedString(key)) {
                return malformed("expected key string");
            }
            if (!reader.expect(':')) {
                return malformed("expected ':'");
            }

            if (key == "__v") {
                std::string raw;
                uint64_t version = 0;
                if (!reader.readScalar(raw) || !detail::parseUnsigned(raw, version)) {
                    return malformed("invalid schema version");
                }
                if (version > SerializableTraits<T>::schema_version) {
                    return GameResult<T>::err(GameError(
                        ErrorCode::UnsupportedSchemaVersion,
                        "record written by a newer schema version", version));
                }
                continue;
            }

            bool matched = false;
            bool ok = true;
            detail::forEachField(fields, [&](const auto& fd) {
                if (matched || key != fd.name) return;
                matched = true;
                ok = detail::readJsonField(reader, obj.*(fd.pointer));
            });

            if (!matched) {
                ok = reader.skipValue();
            }
            if (!ok) {
                return malformed("malformed value");
            }
        }

        return GameResult<T>::ok(std::move(obj));
    }

    static GameSerializer& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace arc::foundation

// ── ARC_SERIALIZABLE macro ──────────────────────────────────────────────────
/// Register a type with its schema version and field descriptors.
///
/// Must be used at global namespace scope.
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define ARC_SERIALIZABLE(Type, Version, ...)                                   \
    template <>                                                                \
    struct arc::foundation::SerializableTraits<Type> {                         \
        static constexpr bool is_serializable = true;                          \
        static constexpr uint32_t schema_version = Version;                    \
        static constexpr auto fields() {                                       \
            using arc::foundation::field;                                      \
            return std::make_tuple(__VA_ARGS__);                               \
        }                                                                      \
    }
