#include "protocol/value.hpp"

#include <limits>
#include <stdexcept>

namespace execbox::protocol {
namespace {

constexpr const char* kOpaqueKey = "__opaque__";

[[noreturn]] void ThrowKindMismatch(const char* expected) {
    throw std::logic_error(std::string("value is not a ") + expected);
}

}  // namespace

Value Value::FromJson(const nlohmann::ordered_json& json) {
    switch (json.type()) {
        case nlohmann::ordered_json::value_t::boolean:
            return Value(json.get<bool>());
        case nlohmann::ordered_json::value_t::number_integer:
            return Value(json.get<std::int64_t>());
        case nlohmann::ordered_json::value_t::number_unsigned: {
            const auto value = json.get<std::uint64_t>();
            if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return Value(static_cast<double>(value));
            }
            return Value(static_cast<std::int64_t>(value));
        }
        case nlohmann::ordered_json::value_t::number_float:
            return Value(json.get<double>());
        case nlohmann::ordered_json::value_t::string:
            return Value(json.get<std::string>());
        case nlohmann::ordered_json::value_t::array: {
            Sequence items;
            items.reserve(json.size());
            for (const auto& item : json) {
                items.push_back(FromJson(item));
            }
            return Value(std::move(items));
        }
        case nlohmann::ordered_json::value_t::object: {
            if (json.size() == 1 && json.contains(kOpaqueKey) && json[kOpaqueKey].is_string()) {
                return Value(Opaque{json[kOpaqueKey].get<std::string>()});
            }
            Mapping entries;
            entries.reserve(json.size());
            for (const auto& [key, item] : json.items()) {
                entries.emplace_back(key, FromJson(item));
            }
            return Value(std::move(entries));
        }
        case nlohmann::ordered_json::value_t::binary:
            return Value(Opaque{"<binary>"});
        case nlohmann::ordered_json::value_t::discarded:
        case nlohmann::ordered_json::value_t::null:
            break;
    }
    return Value();
}

nlohmann::ordered_json Value::ToJson() const {
    switch (kind()) {
        case Kind::kNull:
            return nullptr;
        case Kind::kBool:
            return std::get<bool>(data_);
        case Kind::kInteger:
            return std::get<std::int64_t>(data_);
        case Kind::kNumber:
            return std::get<double>(data_);
        case Kind::kString:
            return std::get<std::string>(data_);
        case Kind::kSequence: {
            auto array = nlohmann::ordered_json::array();
            for (const auto& item : std::get<Sequence>(data_)) {
                array.push_back(item.ToJson());
            }
            return array;
        }
        case Kind::kMapping: {
            auto object = nlohmann::ordered_json::object();
            for (const auto& [key, item] : std::get<Mapping>(data_)) {
                object[key] = item.ToJson();
            }
            return object;
        }
        case Kind::kOpaque:
            return nlohmann::ordered_json{{kOpaqueKey, std::get<Opaque>(data_).repr}};
    }
    return nullptr;
}

std::string Value::ToDisplayString() const {
    if (kind() == Kind::kString) {
        return std::get<std::string>(data_);
    }
    if (kind() == Kind::kOpaque) {
        return std::get<Opaque>(data_).repr;
    }
    return ToJson().dump();
}

bool Value::AsBool() const {
    if (kind() != Kind::kBool) {
        ThrowKindMismatch("bool");
    }
    return std::get<bool>(data_);
}

std::int64_t Value::AsInteger() const {
    if (kind() != Kind::kInteger) {
        ThrowKindMismatch("integer");
    }
    return std::get<std::int64_t>(data_);
}

double Value::AsNumber() const {
    if (kind() == Kind::kInteger) {
        return static_cast<double>(std::get<std::int64_t>(data_));
    }
    if (kind() != Kind::kNumber) {
        ThrowKindMismatch("number");
    }
    return std::get<double>(data_);
}

const std::string& Value::AsString() const {
    if (kind() != Kind::kString) {
        ThrowKindMismatch("string");
    }
    return std::get<std::string>(data_);
}

const Value::Sequence& Value::AsSequence() const {
    if (kind() != Kind::kSequence) {
        ThrowKindMismatch("sequence");
    }
    return std::get<Sequence>(data_);
}

const Value::Mapping& Value::AsMapping() const {
    if (kind() != Kind::kMapping) {
        ThrowKindMismatch("mapping");
    }
    return std::get<Mapping>(data_);
}

const Value::Opaque& Value::AsOpaque() const {
    if (kind() != Kind::kOpaque) {
        ThrowKindMismatch("opaque value");
    }
    return std::get<Opaque>(data_);
}

const Value* Value::Find(const std::string& key) const {
    if (kind() != Kind::kMapping) {
        return nullptr;
    }
    for (const auto& [name, item] : std::get<Mapping>(data_)) {
        if (name == key) {
            return &item;
        }
    }
    return nullptr;
}

bool Value::operator==(const Value& other) const {
    return data_ == other.data_;
}

}  // namespace execbox::protocol
