#include "logfirecpp/encoding/value.hpp"

#include "logfirecpp/constants.hpp"
#include "logfirecpp/exceptions.hpp"

#include <cmath>
#include <sstream>

namespace logfirecpp::encoding
{
namespace
{

std::string quote(const std::string& s)
{
    std::string out = "'";
    for (char c : s)
    {
        if (c == '\'' || c == '\\')
            out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

template <typename Items, typename Fn>
std::string join(const Items& items, Fn&& fn)
{
    std::string out;
    bool first = true;
    for (const auto& item : items)
    {
        if (!first)
            out += ", ";
        first = false;
        out += fn(item);
    }
    return out;
}

std::string primitive_display(const Primitive& p, bool quoted)
{
    struct Visitor
    {
        bool quoted;
        std::string operator()(std::nullptr_t) const
        {
            return "null";
        }
        std::string operator()(const std::string& s) const
        {
            return quoted ? quote(s) : s;
        }
        std::string operator()(int64_t v) const
        {
            return std::to_string(v);
        }
        std::string operator()(double v) const
        {
            return format_double(v);
        }
        std::string operator()(bool v) const
        {
            return v ? "true" : "false";
        }
    };
    return std::visit(Visitor{quoted}, p);
}

OrderedJson primitive_json(const Primitive& p)
{
    struct Visitor
    {
        OrderedJson operator()(std::nullptr_t) const
        {
            return nullptr;
        }
        OrderedJson operator()(const std::string& s) const
        {
            return s;
        }
        OrderedJson operator()(int64_t v) const
        {
            return v;
        }
        OrderedJson operator()(double v) const
        {
            return v;
        }
        OrderedJson operator()(bool v) const
        {
            return v;
        }
    };
    return std::visit(Visitor{}, p);
}

OrderedJson tagged(const std::string& datatype, OrderedJson data)
{
    OrderedJson out = OrderedJson::object();
    out[DATATYPE_KEY] = datatype;
    out["data"] = std::move(data);
    return out;
}

std::string opaque_text(const Opaque& o)
{
    if (!o.repr)
        return "<" + o.cls + " object>";
    try
    {
        return o.repr();
    }
    catch (const std::exception& e)
    {
        throw EncodingError("repr of " + o.cls + " failed: " + e.what());
    }
}

} // namespace

Value::Value(Sequence s) : data_(std::move(s)) {}
Value::Value(Mapping m) : data_(std::move(m)) {}
Value::Value(Record r) : data_(std::move(r)) {}
Value::Value(Opaque o) : data_(std::move(o)) {}

Value Value::list(std::vector<Value> items)
{
    return Value(Sequence{std::move(items), SequenceKind::List});
}

Value Value::tuple(std::vector<Value> items)
{
    return Value(Sequence{std::move(items), SequenceKind::Tuple});
}

Value Value::set(std::vector<Value> items)
{
    return Value(Sequence{std::move(items), SequenceKind::Set});
}

Value Value::mapping(std::vector<NamedValue> entries)
{
    return Value(Mapping{std::move(entries)});
}

Value Value::record(std::string cls, std::vector<NamedValue> fields, std::string datatype)
{
    return Value(Record{std::move(cls), std::move(fields), std::move(datatype)});
}

Value Value::opaque(std::string cls, std::function<std::string()> repr)
{
    return Value(Opaque{std::move(cls), std::move(repr)});
}

Value::Kind Value::kind() const
{
    switch (data_.index())
    {
    case 0:
        return Kind::Primitive;
    case 1:
        return Kind::Sequence;
    case 2:
        return Kind::Mapping;
    case 3:
        return Kind::Record;
    default:
        return Kind::Opaque;
    }
}

bool Value::is_null() const
{
    return is_primitive() && std::holds_alternative<std::nullptr_t>(primitive());
}

std::string Value::display() const
{
    if (is_primitive())
        return primitive_display(primitive(), false);
    return repr();
}

std::string Value::repr() const
{
    switch (kind())
    {
    case Kind::Primitive:
        return primitive_display(primitive(), true);
    case Kind::Sequence:
    {
        const auto& seq = sequence();
        auto body = join(seq.items, [](const Value& v) { return v.repr(); });
        if (seq.kind == SequenceKind::Tuple)
            return "(" + body + (seq.items.size() == 1 ? ",)" : ")");
        if (seq.kind == SequenceKind::Set)
            return seq.items.empty() ? "set()" : "{" + body + "}";
        return "[" + body + "]";
    }
    case Kind::Mapping:
        return "{" +
               join(mapping().entries,
                    [](const NamedValue& e) { return quote(e.name) + ": " + e.value.repr(); }) +
               "}";
    case Kind::Record:
        return record().cls + "(" +
               join(record().fields,
                    [](const NamedValue& f) { return f.name + "=" + f.value.repr(); }) +
               ")";
    case Kind::Opaque:
        return opaque_text(opaque());
    }
    return "";
}

OrderedJson Value::to_json() const
{
    switch (kind())
    {
    case Kind::Primitive:
        return primitive_json(primitive());
    case Kind::Sequence:
    {
        const auto& seq = sequence();
        OrderedJson items = OrderedJson::array();
        for (const auto& v : seq.items)
            items.push_back(v.to_json());
        if (seq.kind == SequenceKind::Tuple)
            return tagged("tuple", std::move(items));
        if (seq.kind == SequenceKind::Set)
            return tagged("set", std::move(items));
        return items;
    }
    case Kind::Mapping:
    {
        OrderedJson obj = OrderedJson::object();
        for (const auto& e : mapping().entries)
            obj[e.name] = e.value.to_json();
        return obj;
    }
    case Kind::Record:
    {
        OrderedJson fields = OrderedJson::object();
        for (const auto& f : record().fields)
            fields[f.name] = f.value.to_json();
        auto out = tagged(record().datatype, std::move(fields));
        out["cls"] = record().cls;
        return out;
    }
    case Kind::Opaque:
    {
        auto out = tagged("unknown", opaque_text(opaque()));
        out["cls"] = opaque().cls;
        return out;
    }
    }
    return nullptr;
}

std::string format_double(double v)
{
    if (std::isnan(v))
        return "nan";
    if (std::isinf(v))
        return v > 0 ? "inf" : "-inf";
    // nlohmann prints the shortest round-trip form and keeps a trailing ".0".
    return Json(v).dump();
}

} // namespace logfirecpp::encoding
