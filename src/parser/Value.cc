#include "chronicle/parser/Value.hh"

#include <charconv>
#include <cmath>
#include <sstream>

namespace chronicle {

std::string keyToString(const Key& key) {
    if (const auto* id = std::get_if<std::int64_t>(&key)) {
        return std::to_string(*id);
    }
    return std::get<std::string>(key);
}

// -- ValueMap --

const Value* ValueMap::find(const Key& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return nullptr;
    }
    return &values_[it->second];
}

Value* ValueMap::find(const Key& key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return nullptr;
    }
    return &values_[it->second];
}

bool ValueMap::contains(const Key& key) const {
    return index_.find(key) != index_.end();
}

Value& ValueMap::set(Key key, Value value) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        values_[it->second] = std::move(value);
        repeated_[it->second] = false;
        return values_[it->second];
    }
    index_.emplace(key, keys_.size());
    keys_.push_back(std::move(key));
    values_.push_back(std::move(value));
    repeated_.push_back(false);
    return values_.back();
}

void ValueMap::markRepeated(const Key& key) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        repeated_[it->second] = true;
    }
}

bool ValueMap::isRepeated(const Key& key) const {
    auto it = index_.find(key);
    return it != index_.end() && repeated_[it->second];
}

const Value& ValueMap::valueAt(size_t index) const {
    return values_[index];
}

Value& ValueMap::valueAt(size_t index) {
    return values_[index];
}

bool ValueMap::operator==(const ValueMap& other) const {
    return keys_ == other.keys_ && values_ == other.values_;
}

// -- Value --

Value::Value() : data_(List{}) {}
Value::Value(std::int64_t v) : data_(v) {}
Value::Value(int v) : data_(static_cast<std::int64_t>(v)) {}
Value::Value(double v) : data_(v) {}
Value::Value(std::string v) : data_(std::move(v)) {}
Value::Value(const char* v) : data_(std::string(v)) {}
Value::Value(List v) : data_(std::move(v)) {}
Value::Value(ValueMap v) : data_(std::move(v)) {}

Value::Type Value::type() const {
    return static_cast<Type>(data_.index());
}

std::int64_t Value::asInt() const {
    if (!isInt()) {
        throwError("Value is " + std::string(valueTypeToString(type())) + ", expected Int");
    }
    return std::get<std::int64_t>(data_);
}

double Value::asNumber() const {
    if (isInt()) {
        return static_cast<double>(std::get<std::int64_t>(data_));
    }
    if (!isFloat()) {
        throwError("Value is " + std::string(valueTypeToString(type())) + ", expected a number");
    }
    return std::get<double>(data_);
}

const std::string& Value::asString() const {
    if (!isString()) {
        throwError("Value is " + std::string(valueTypeToString(type())) + ", expected String");
    }
    return std::get<std::string>(data_);
}

const Value::List& Value::asList() const {
    if (!isList()) {
        throwError("Value is " + std::string(valueTypeToString(type())) + ", expected List");
    }
    return std::get<List>(data_);
}

Value::List& Value::asList() {
    if (!isList()) {
        throwError("Value is " + std::string(valueTypeToString(type())) + ", expected List");
    }
    return std::get<List>(data_);
}

const ValueMap& Value::asMap() const {
    if (!isMap()) {
        throwError("Value is " + std::string(valueTypeToString(type())) + ", expected Map");
    }
    return std::get<ValueMap>(data_);
}

ValueMap& Value::asMap() {
    if (!isMap()) {
        throwError("Value is " + std::string(valueTypeToString(type())) + ", expected Map");
    }
    return std::get<ValueMap>(data_);
}

const Value* Value::get(const Key& key) const {
    if (const auto* map = std::get_if<ValueMap>(&data_)) {
        return map->find(key);
    }
    return nullptr;
}

bool Value::operator==(const Value& other) const {
    return data_ == other.data_;
}

std::string_view valueTypeToString(Value::Type type) {
    switch (type) {
    case Value::Type::Int:
        return "Int";
    case Value::Type::Float:
        return "Float";
    case Value::Type::String:
        return "String";
    case Value::Type::List:
        return "List";
    case Value::Type::Map:
        return "Map";
    }
    return "Unknown";
}

// -- Typed extraction --

namespace {

std::string describe(const Key& key, std::string_view problem) {
    return "key '" + keyToString(key) + "' " + std::string(problem);
}

template <typename T>
Result<T> lookupError(const Value& node, const Key& key) {
    if (!node.isMap()) {
        return Result<T>::error(ErrorCode::TypeMismatch,
                                describe(key, "looked up in a " + std::string(valueTypeToString(node.type()))));
    }
    return Result<T>::error(ErrorCode::NotFound, describe(key, "not found"));
}

} // namespace

Result<std::int64_t> getInt(const Value& node, const Key& key) {
    const auto* v = node.get(key);
    if (!v) {
        return lookupError<std::int64_t>(node, key);
    }
    if (!v->isInt()) {
        return Result<std::int64_t>::error(ErrorCode::TypeMismatch, describe(key, "is not an integer"));
    }
    return Result<std::int64_t>::ok(v->asInt());
}

Result<double> getNumber(const Value& node, const Key& key) {
    const auto* v = node.get(key);
    if (!v) {
        return lookupError<double>(node, key);
    }
    if (!v->isNumber()) {
        return Result<double>::error(ErrorCode::TypeMismatch, describe(key, "is not a number"));
    }
    return Result<double>::ok(v->asNumber());
}

Result<std::string> getString(const Value& node, const Key& key) {
    const auto* v = node.get(key);
    if (!v) {
        return lookupError<std::string>(node, key);
    }
    if (!v->isString()) {
        return Result<std::string>::error(ErrorCode::TypeMismatch, describe(key, "is not a string"));
    }
    return Result<std::string>::ok(v->asString());
}

Result<const ValueMap*> getMap(const Value& node, const Key& key) {
    const auto* v = node.get(key);
    if (!v) {
        return lookupError<const ValueMap*>(node, key);
    }
    if (!v->isMap()) {
        return Result<const ValueMap*>::error(ErrorCode::TypeMismatch, describe(key, "is not a map"));
    }
    return Result<const ValueMap*>::ok(&v->asMap());
}

Result<const Value::List*> getList(const Value& node, const Key& key) {
    const auto* v = node.get(key);
    if (!v) {
        return lookupError<const Value::List*>(node, key);
    }
    if (!v->isList()) {
        return Result<const Value::List*>::error(ErrorCode::TypeMismatch, describe(key, "is not a list"));
    }
    return Result<const Value::List*>::ok(&v->asList());
}

std::int64_t getIntOr(const Value& node, const Key& key, std::int64_t defaultValue) {
    const auto* v = node.get(key);
    return (v && v->isInt()) ? v->asInt() : defaultValue;
}

double getNumberOr(const Value& node, const Key& key, double defaultValue) {
    const auto* v = node.get(key);
    return (v && v->isNumber()) ? v->asNumber() : defaultValue;
}

std::string getStringOr(const Value& node, const Key& key, std::string_view defaultValue) {
    const auto* v = node.get(key);
    return (v && v->isString()) ? v->asString() : std::string(defaultValue);
}

bool getFlag(const Value& node, const Key& key) {
    const auto* v = node.get(key);
    return v && v->isString() && v->asString() == "yes";
}

const Value* childMap(const Value& node, const Key& key) {
    const auto* v = node.get(key);
    return (v && v->isMap()) ? v : nullptr;
}

std::vector<const Value*> itemsOf(const Value* node) {
    std::vector<const Value*> items;
    if (!node) {
        return items;
    }
    if (node->isList()) {
        items.reserve(node->asList().size());
        for (const auto& item : node->asList()) {
            items.push_back(&item);
        }
    } else {
        items.push_back(node);
    }
    return items;
}

std::vector<const Value*> itemsAt(const Value& node, const Key& key) {
    return itemsOf(node.get(key));
}

std::vector<std::int64_t> intsAt(const Value& node, const Key& key) {
    std::vector<std::int64_t> ids;
    for (const auto* item : itemsAt(node, key)) {
        if (item->isInt()) {
            ids.push_back(item->asInt());
        }
    }
    return ids;
}

std::vector<std::string> stringsAt(const Value& node, const Key& key) {
    std::vector<std::string> names;
    for (const auto* item : itemsAt(node, key)) {
        if (item->isString()) {
            names.push_back(item->asString());
        }
    }
    return names;
}

// -- Serialization --

namespace {

void writeQuoted(std::ostringstream& out, const std::string& text) {
    out << '"';
    for (char c : text) {
        if (c == '"' || c == '\\') {
            out << '\\';
        }
        out << c;
    }
    out << '"';
}

void writeFloat(std::ostringstream& out, double value) {
    if (!std::isfinite(value)) {
        throwError("Cannot serialize non-finite float " + std::to_string(value));
    }
    char buffer[64];
    auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    std::string text(buffer, ec == std::errc() ? ptr : buffer);
    if (text.find('.') == std::string::npos) {
        // Keep the decimal point so the tokenizer reads it back as a float.
        auto exponent = text.find('e');
        if (exponent == std::string::npos) {
            text += ".0";
        } else {
            text.insert(exponent, ".0");
        }
    }
    out << text;
}

void writeKey(std::ostringstream& out, const Key& key) {
    if (const auto* id = std::get_if<std::int64_t>(&key)) {
        out << *id;
    } else {
        writeQuoted(out, std::get<std::string>(key));
    }
}

void writeValue(std::ostringstream& out, const Value& value, int indent);

void writeEntries(std::ostringstream& out, const ValueMap& map, int indent) {
    std::string pad(static_cast<size_t>(indent) * 2, ' ');
    for (size_t i = 0; i < map.size(); ++i) {
        const Value& value = map.valueAt(i);
        if (map.isRepeatedAt(i) && value.isList() && value.asList().size() > 1) {
            for (const auto& item : value.asList()) {
                out << pad;
                writeKey(out, map.keyAt(i));
                out << '=';
                writeValue(out, item, indent);
                out << '\n';
            }
            continue;
        }
        out << pad;
        writeKey(out, map.keyAt(i));
        out << '=';
        writeValue(out, value, indent);
        out << '\n';
    }
}

void writeValue(std::ostringstream& out, const Value& value, int indent) {
    switch (value.type()) {
    case Value::Type::Int:
        out << value.asInt();
        break;
    case Value::Type::Float:
        writeFloat(out, value.asNumber());
        break;
    case Value::Type::String:
        writeQuoted(out, value.asString());
        break;
    case Value::Type::List:
        out << '{';
        for (const auto& item : value.asList()) {
            out << ' ';
            writeValue(out, item, indent + 1);
        }
        out << " }";
        break;
    case Value::Type::Map:
        out << "{\n";
        writeEntries(out, value.asMap(), indent + 1);
        out << std::string(static_cast<size_t>(indent) * 2, ' ') << '}';
        break;
    }
}

} // namespace

std::string serialize(const Value& value) {
    std::ostringstream out;
    if (value.isMap()) {
        writeEntries(out, value.asMap(), 0);
    } else {
        writeValue(out, value, 0);
        out << '\n';
    }
    return out.str();
}

} // namespace chronicle
