#include "logfirecpp/encoding/attributes.hpp"

#include "logfirecpp/constants.hpp"
#include "logfirecpp/encoding/message_template.hpp"
#include "logfirecpp/exceptions.hpp"
#include "logfirecpp/logging.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace logfirecpp::encoding
{
namespace
{

bool starts_with(const std::string& s, const std::string& prefix)
{
    return s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix)
{
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string placeholder_for(const Value& value)
{
    switch (value.kind())
    {
    case Value::Kind::Record:
        return "<unencodable " + value.record().cls + ">";
    case Value::Kind::Opaque:
        return "<unencodable " + value.opaque().cls + ">";
    default:
        return "<unencodable value>";
    }
}

AttributeValue primitive_attribute(const Primitive& p)
{
    if (auto* s = std::get_if<std::string>(&p))
        return *s;
    if (auto* i = std::get_if<int64_t>(&p))
        return *i;
    if (auto* d = std::get_if<double>(&p))
        return *d;
    return std::get<bool>(p);
}

const Value* find_arg(const Args& args, const std::string& name)
{
    // Later duplicates win, matching AttributeMap::set.
    for (auto it = args.rbegin(); it != args.rend(); ++it)
        if (it->name == name)
            return &it->value;
    return nullptr;
}

} // namespace

void AttributeMap::set(const std::string& key, AttributeValue value)
{
    for (auto& entry : entries_)
    {
        if (entry.first == key)
        {
            entry.second = std::move(value);
            return;
        }
    }
    entries_.emplace_back(key, std::move(value));
}

void AttributeMap::erase(const std::string& key)
{
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&](const Entry& e) { return e.first == key; }),
                   entries_.end());
}

void AttributeMap::merge(const AttributeMap& other)
{
    for (const auto& entry : other)
        set(entry.first, entry.second);
}

const AttributeValue* AttributeMap::find(const std::string& key) const
{
    for (const auto& entry : entries_)
        if (entry.first == key)
            return &entry.second;
    return nullptr;
}

OrderedJson AttributeMap::to_json() const
{
    OrderedJson out = OrderedJson::object();
    for (const auto& entry : entries_)
        out[entry.first] = attribute_to_json(entry.second);
    return out;
}

OrderedJson attribute_to_json(const AttributeValue& value)
{
    return std::visit([](const auto& v) { return OrderedJson(v); }, value);
}

bool is_reserved_key(const std::string& key)
{
    return starts_with(key, ATTRIBUTES_NAMESPACE) || key == ATTRIBUTES_CODE_FILEPATH_KEY ||
           key == ATTRIBUTES_CODE_LINENO_KEY || key == ATTRIBUTES_CODE_FUNCTION_KEY ||
           ends_with(key, JSON_SUFFIX);
}

void encode_argument(AttributeMap& out, const std::string& name, const Value& value,
                     std::vector<std::string>& null_args)
{
    if (value.is_null())
    {
        if (std::find(null_args.begin(), null_args.end(), name) == null_args.end())
            null_args.push_back(name);
        return;
    }
    if (value.is_primitive())
    {
        out.set(name, primitive_attribute(value.primitive()));
        return;
    }
    try
    {
        out.set(name + JSON_SUFFIX, value.to_json().dump());
    }
    catch (const EncodingError& e)
    {
        logging::logger()->warn("Failed to encode argument '{}': {}", name, e.what());
        out.set(name, placeholder_for(value));
    }
    catch (const nlohmann::json::exception& e)
    {
        logging::logger()->warn("Failed to encode argument '{}': {}", name, e.what());
        out.set(name, placeholder_for(value));
    }
}

EncodedMessage encode(const std::string& msg_template, const std::optional<std::string>& span_name,
                      const TagList& tags, const Args& args)
{
    for (const auto& arg : args)
    {
        if (is_reserved_key(arg.name))
            throw TemplateArgumentError("Argument name '" + arg.name + "' is reserved", arg.name);
    }

    EncodedMessage encoded;
    encoded.message = render_template(
        msg_template,
        [&](const std::string& name) -> std::optional<std::string>
        {
            const Value* value = find_arg(args, name);
            if (!value)
            {
                if (name == "span_name" && span_name)
                    return *span_name;
                return std::nullopt;
            }
            try
            {
                return value->display();
            }
            catch (const EncodingError& e)
            {
                logging::logger()->warn("Failed to render argument '{}': {}", name, e.what());
                return placeholder_for(*value);
            }
        });

    std::vector<std::string> null_args;
    for (const auto& arg : args)
        encode_argument(encoded.attributes, arg.name, arg.value, null_args);

    if (!null_args.empty())
        encoded.attributes.set(NULL_ARGS_KEY, null_args);
    if (!tags.empty())
        encoded.attributes.set(ATTRIBUTES_TAGS_KEY, tags.values());
    encoded.attributes.set(ATTRIBUTES_MESSAGE_TEMPLATE_KEY, msg_template);
    encoded.attributes.set(ATTRIBUTES_MESSAGE_KEY, encoded.message);
    return encoded;
}

} // namespace logfirecpp::encoding
