#pragma once
#include "logfirecpp/encoding/value.hpp"
#include "logfirecpp/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace logfirecpp::encoding
{

/// Wire attribute value. The string list carries `logfire.tags` and `logfire.null_args`.
using AttributeValue = std::variant<std::string, int64_t, double, bool, std::vector<std::string>>;

/// Insertion-ordered attribute map with unique keys.
class AttributeMap
{
  public:
    using Entry = std::pair<std::string, AttributeValue>;
    using const_iterator = std::vector<Entry>::const_iterator;

    /// Inserts at the end, or replaces the value in place when the key exists.
    void set(const std::string& key, AttributeValue value);
    void erase(const std::string& key);
    /// Appends every entry of `other` (replacing existing keys in place).
    void merge(const AttributeMap& other);

    const AttributeValue* find(const std::string& key) const;
    bool contains(const std::string& key) const
    {
        return find(key) != nullptr;
    }

    template <typename T>
    const T* get_if(const std::string& key) const
    {
        auto* v = find(key);
        return v ? std::get_if<T>(v) : nullptr;
    }

    size_t size() const
    {
        return entries_.size();
    }
    bool empty() const
    {
        return entries_.empty();
    }
    const_iterator begin() const
    {
        return entries_.begin();
    }
    const_iterator end() const
    {
        return entries_.end();
    }

    OrderedJson to_json() const;

    bool operator==(const AttributeMap& other) const
    {
        return entries_ == other.entries_;
    }
    bool operator!=(const AttributeMap& other) const
    {
        return !(*this == other);
    }

  private:
    std::vector<Entry> entries_;
};

OrderedJson attribute_to_json(const AttributeValue& value);

/// True for `code.*` and `logfire.*` keys and anything ending in `__JSON`.
bool is_reserved_key(const std::string& key);

/// Stores one named value into `out` following the typed-value rules:
/// primitives as-is, null appended to `null_args`, anything else as `<name>__JSON`.
/// An unencodable value is replaced by a placeholder string and logged.
void encode_argument(AttributeMap& out, const std::string& name, const Value& value,
                     std::vector<std::string>& null_args);

struct EncodedMessage
{
    std::string message;
    AttributeMap attributes;
};

/// Renders `msg_template` with `args` and builds the attribute map:
/// arguments in order, then `logfire.null_args`, `logfire.tags`,
/// `logfire.msg_template` and `logfire.msg`.
/// `{span_name}` falls back to `span_name` when no argument has that name.
/// Throws TemplateArgumentError for unbound names and reserved argument names.
EncodedMessage encode(const std::string& msg_template, const std::optional<std::string>& span_name,
                      const TagList& tags, const Args& args);

} // namespace logfirecpp::encoding
