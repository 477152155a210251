#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace execbox::protocol {

// Closed set of values a sandboxed program can hand back. Anything the
// program could not serialize arrives as Opaque with its textual repr.
class Value {
public:
    struct Opaque {
        std::string repr;

        bool operator==(const Opaque& other) const { return repr == other.repr; }
    };

    using Sequence = std::vector<Value>;
    using Mapping = std::vector<std::pair<std::string, Value>>;

    enum class Kind {
        kNull,
        kBool,
        kInteger,
        kNumber,
        kString,
        kSequence,
        kMapping,
        kOpaque
    };

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool value) : data_(value) {}
    Value(int value) : data_(static_cast<std::int64_t>(value)) {}
    Value(std::int64_t value) : data_(value) {}
    Value(double value) : data_(value) {}
    Value(const char* value) : data_(std::string(value)) {}
    Value(std::string value) : data_(std::move(value)) {}
    Value(Sequence value) : data_(std::move(value)) {}
    Value(Mapping value) : data_(std::move(value)) {}
    Value(Opaque value) : data_(std::move(value)) {}

    static Value FromJson(const nlohmann::ordered_json& json);
    nlohmann::ordered_json ToJson() const;

    // Human-facing rendering: strings are printed raw, everything else as JSON.
    std::string ToDisplayString() const;

    Kind kind() const { return static_cast<Kind>(data_.index()); }
    bool is_null() const { return kind() == Kind::kNull; }
    bool is_number() const { return kind() == Kind::kInteger || kind() == Kind::kNumber; }

    bool AsBool() const;
    std::int64_t AsInteger() const;
    double AsNumber() const;
    const std::string& AsString() const;
    const Sequence& AsSequence() const;
    const Mapping& AsMapping() const;
    const Opaque& AsOpaque() const;

    const Value* Find(const std::string& key) const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    std::variant<std::monostate,
                 bool,
                 std::int64_t,
                 double,
                 std::string,
                 Sequence,
                 Mapping,
                 Opaque> data_;
};

}  // namespace execbox::protocol
