#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace logfirecpp::encoding
{

/// One piece of a parsed template: literal text, `{name}` or `{name=}`.
struct TemplatePart
{
    enum class Kind
    {
        Literal,
        Field,
        FieldWithName
    };

    Kind kind{Kind::Literal};
    std::string text; ///< literal text, or the field name
};

/// Parses `{x}`, `{x=}` and the `{{` / `}}` escapes.
/// Throws TemplateArgumentError on unbalanced braces, empty fields or format specs.
std::vector<TemplatePart> parse_template(const std::string& msg_template);

/// Names referenced by the template, in order of first appearance.
std::vector<std::string> template_fields(const std::string& msg_template);

/// Looks a field up; returns its display text or nullopt when unbound.
using FieldLookup = std::function<std::optional<std::string>(const std::string& name)>;

/// Renders the template. An unbound field raises TemplateArgumentError naming it.
std::string render_template(const std::string& msg_template, const FieldLookup& lookup);

} // namespace logfirecpp::encoding
