#include "logfirecpp/encoding/message_template.hpp"

#include "logfirecpp/exceptions.hpp"

#include <algorithm>

namespace logfirecpp::encoding
{
namespace
{

std::string trim(const std::string& s)
{
    auto begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos)
        return "";
    auto end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

TemplatePart make_field(const std::string& msg_template, std::string body)
{
    TemplatePart part;
    part.kind = TemplatePart::Kind::Field;
    if (!body.empty() && body.back() == '=')
    {
        part.kind = TemplatePart::Kind::FieldWithName;
        body.pop_back();
    }
    body = trim(body);
    if (body.empty())
        throw TemplateArgumentError("Empty placeholder in template: " + msg_template);
    if (body.find_first_of(":!{") != std::string::npos)
        throw TemplateArgumentError("Unsupported placeholder '{" + body + "}' in template: " +
                                    msg_template);
    part.text = std::move(body);
    return part;
}

} // namespace

std::vector<TemplatePart> parse_template(const std::string& msg_template)
{
    std::vector<TemplatePart> parts;
    std::string literal;

    auto flush_literal = [&]()
    {
        if (literal.empty())
            return;
        parts.push_back(TemplatePart{TemplatePart::Kind::Literal, literal});
        literal.clear();
    };

    size_t i = 0;
    while (i < msg_template.size())
    {
        char c = msg_template[i];
        if (c == '{')
        {
            if (i + 1 < msg_template.size() && msg_template[i + 1] == '{')
            {
                literal.push_back('{');
                i += 2;
                continue;
            }
            auto close = msg_template.find('}', i + 1);
            if (close == std::string::npos)
                throw TemplateArgumentError("Unbalanced '{' in template: " + msg_template);
            flush_literal();
            parts.push_back(make_field(msg_template, msg_template.substr(i + 1, close - i - 1)));
            i = close + 1;
            continue;
        }
        if (c == '}')
        {
            if (i + 1 < msg_template.size() && msg_template[i + 1] == '}')
            {
                literal.push_back('}');
                i += 2;
                continue;
            }
            throw TemplateArgumentError("Single '}' encountered in template: " + msg_template);
        }
        literal.push_back(c);
        ++i;
    }
    flush_literal();
    return parts;
}

std::vector<std::string> template_fields(const std::string& msg_template)
{
    std::vector<std::string> names;
    for (const auto& part : parse_template(msg_template))
    {
        if (part.kind == TemplatePart::Kind::Literal)
            continue;
        if (std::find(names.begin(), names.end(), part.text) == names.end())
            names.push_back(part.text);
    }
    return names;
}

std::string render_template(const std::string& msg_template, const FieldLookup& lookup)
{
    std::string out;
    for (const auto& part : parse_template(msg_template))
    {
        if (part.kind == TemplatePart::Kind::Literal)
        {
            out += part.text;
            continue;
        }
        auto text = lookup(part.text);
        if (!text)
            throw TemplateArgumentError("Missing template argument '" + part.text + "'",
                                        part.text);
        if (part.kind == TemplatePart::Kind::FieldWithName)
            out += part.text + "=";
        out += *text;
    }
    return out;
}

} // namespace logfirecpp::encoding
