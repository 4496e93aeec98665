#pragma once
#include "logfirecpp/types.hpp"

#include <cstdint>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace logfirecpp::encoding
{

class Value;
struct NamedValue;

/// null, string, int64, float64 or bool. Stored on the wire as-is (null aside).
using Primitive = std::variant<std::nullptr_t, std::string, int64_t, double, bool>;

enum class SequenceKind
{
    List,
    Tuple,
    Set
};

struct Sequence
{
    std::vector<Value> items;
    SequenceKind kind{SequenceKind::List};
};

struct Mapping
{
    std::vector<NamedValue> entries;
};

/// A named structure with named fields (a struct, dataclass or model).
struct Record
{
    std::string cls;
    std::vector<NamedValue> fields;
    std::string datatype{"dataclass"};
};

/// A value the encoder cannot look inside: only a class name and a textual form.
struct Opaque
{
    std::string cls;
    std::function<std::string()> repr;
};

/// Closed set of argument values accepted by the attribute encoder.
class Value
{
  public:
    enum class Kind
    {
        Primitive,
        Sequence,
        Mapping,
        Record,
        Opaque
    };

    Value() : data_(Primitive(std::in_place_type<std::nullptr_t>, nullptr)) {}
    Value(std::nullptr_t) : data_(Primitive(std::in_place_type<std::nullptr_t>, nullptr)) {}
    Value(const char* s) : data_(Primitive(std::in_place_type<std::string>, s)) {}
    Value(std::string s) : data_(Primitive(std::in_place_type<std::string>, std::move(s))) {}
    Value(std::string_view s) : data_(Primitive(std::in_place_type<std::string>, s)) {}
    Value(bool b) : data_(Primitive(std::in_place_type<bool>, b)) {}

    template <typename T,
              typename std::enable_if<std::is_integral<T>::value && !std::is_same<T, bool>::value,
                                      int>::type = 0>
    Value(T v) : data_(Primitive(std::in_place_type<int64_t>, static_cast<int64_t>(v)))
    {
    }

    template <typename T,
              typename std::enable_if<std::is_floating_point<T>::value, int>::type = 0>
    Value(T v) : data_(Primitive(std::in_place_type<double>, static_cast<double>(v)))
    {
    }

    Value(Sequence s);
    Value(Mapping m);
    Value(Record r);
    Value(Opaque o);

    static Value list(std::vector<Value> items);
    static Value tuple(std::vector<Value> items);
    static Value set(std::vector<Value> items);
    static Value mapping(std::vector<NamedValue> entries);
    static Value record(std::string cls, std::vector<NamedValue> fields,
                        std::string datatype = "dataclass");
    static Value opaque(std::string cls, std::function<std::string()> repr);

    Kind kind() const;
    bool is_null() const;
    bool is_primitive() const
    {
        return kind() == Kind::Primitive;
    }

    const Primitive& primitive() const
    {
        return std::get<Primitive>(data_);
    }
    const Sequence& sequence() const
    {
        return std::get<Sequence>(data_);
    }
    const Mapping& mapping() const
    {
        return std::get<Mapping>(data_);
    }
    const Record& record() const
    {
        return std::get<Record>(data_);
    }
    const Opaque& opaque() const
    {
        return std::get<Opaque>(data_);
    }

    /// Text used when the value is rendered into a message.
    std::string display() const;
    /// Textual representation used for nested values (strings quoted).
    std::string repr() const;
    /// JSON form used for `<name>__JSON` attributes. Throws EncodingError.
    OrderedJson to_json() const;

  private:
    std::variant<Primitive, Sequence, Mapping, Record, Opaque> data_;
};

struct NamedValue
{
    NamedValue(std::string n, Value v) : name(std::move(n)), value(std::move(v)) {}

    std::string name;
    Value value;
};

/// Ordered named template arguments, e.g. {{"name", "foo"}, {"number", 3}}.
using Args = std::vector<NamedValue>;

/// Shortest round-trip text for a double ("3.0", "0.1", "nan", "inf").
std::string format_double(double v);

} // namespace logfirecpp::encoding
