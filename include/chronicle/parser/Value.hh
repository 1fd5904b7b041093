#pragma once

#include "chronicle/utils/ErrorHandling.hh"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace chronicle {

class Value;

// Map keys are either integer ids ("123={...}") or names ("country={...}").
using Key = std::variant<std::int64_t, std::string>;

std::string keyToString(const Key& key);

// Ordered key -> value map. Iteration follows first-occurrence order; lookup
// is hashed.
class ValueMap {
  public:
    size_t size() const { return keys_.size(); }
    bool empty() const { return keys_.empty(); }

    const Value* find(const Key& key) const;
    Value* find(const Key& key);
    bool contains(const Key& key) const;

    // Appends a new key, or replaces the value stored under an existing key
    // without changing its position.
    Value& set(Key key, Value value);

    // A repeated key: its value is the list of every occurrence. Cleared by set().
    void markRepeated(const Key& key);
    bool isRepeated(const Key& key) const;
    bool isRepeatedAt(size_t index) const { return repeated_[index]; }

    const Key& keyAt(size_t index) const { return keys_[index]; }
    const Value& valueAt(size_t index) const;
    Value& valueAt(size_t index);

    bool operator==(const ValueMap& other) const;

  private:
    std::vector<Key> keys_;
    std::vector<Value> values_;
    std::vector<bool> repeated_;
    std::unordered_map<Key, size_t> index_;
};

/**
 * @brief Generic node of a parsed save file.
 *
 * Tagged union of Int, Float, String, List and Map. A default constructed
 * Value is an empty list, which is also what the parser produces for "{}".
 */
class Value {
  public:
    enum class Type : uint8_t { Int, Float, String, List, Map };
    using List = std::vector<Value>;

    Value();
    Value(std::int64_t v);
    Value(int v);
    Value(double v);
    Value(std::string v);
    Value(const char* v);
    Value(List v);
    Value(ValueMap v);

    Type type() const;
    bool isInt() const { return type() == Type::Int; }
    bool isFloat() const { return type() == Type::Float; }
    bool isNumber() const { return isInt() || isFloat(); }
    bool isString() const { return type() == Type::String; }
    bool isList() const { return type() == Type::List; }
    bool isMap() const { return type() == Type::Map; }

    // Checked accessors; throw ChronicleException on a type mismatch.
    std::int64_t asInt() const;
    double asNumber() const;
    const std::string& asString() const;
    const List& asList() const;
    List& asList();
    const ValueMap& asMap() const;
    ValueMap& asMap();

    // Map lookup. nullptr when this is not a map or the key is absent.
    const Value* get(const Key& key) const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

  private:
    std::variant<std::int64_t, double, std::string, List, ValueMap> data_;
};

std::string_view valueTypeToString(Value::Type type);

// Typed extraction helpers. Each returns a descriptive error when the node is
// not a map, the key is missing, or the value has a different shape.
Result<std::int64_t> getInt(const Value& node, const Key& key);
Result<double> getNumber(const Value& node, const Key& key);
Result<std::string> getString(const Value& node, const Key& key);
Result<const ValueMap*> getMap(const Value& node, const Key& key);
Result<const Value::List*> getList(const Value& node, const Key& key);

// Optional variants: return the default when the key is absent or has
// another shape.
std::int64_t getIntOr(const Value& node, const Key& key, std::int64_t defaultValue);
double getNumberOr(const Value& node, const Key& key, double defaultValue);
std::string getStringOr(const Value& node, const Key& key, std::string_view defaultValue);

// "yes"/"no" flags; anything but "yes" reads as false.
bool getFlag(const Value& node, const Key& key);

// Child map under key, or nullptr.
const Value* childMap(const Value& node, const Key& key);

// Repeated keys hold a list, single keys hold the value itself. Both shapes
// come back as a flat sequence; a missing node yields an empty one.
std::vector<const Value*> itemsOf(const Value* node);
std::vector<const Value*> itemsAt(const Value& node, const Key& key);

// Integer elements of a list (or of a single integer) under key.
std::vector<std::int64_t> intsAt(const Value& node, const Key& key);

// String elements of a list (or of a single string) under key.
std::vector<std::string> stringsAt(const Value& node, const Key& key);

// Writes the tree back in save-file syntax. A top-level map is written as a
// bare key/value document and repeated keys are written out once per
// element. Throws ChronicleException for NaN or infinite floats, which the
// grammar cannot express.
std::string serialize(const Value& value);

} // namespace chronicle
