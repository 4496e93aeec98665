#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace logfirecpp
{

using Json = nlohmann::json;
/// Insertion-ordered JSON, used wherever key order is part of the output.
using OrderedJson = nlohmann::ordered_json;

constexpr const char* VERSION = "0.1.0";

/// Static source location of a call site. Filled by LOGFIRECPP_HERE.
struct SourceLocation
{
    std::string filename;
    int lineno{0};
    std::string function;
};

/// Severity of a one-shot log record.
enum class Level
{
    Debug,
    Info,
    Notice,
    Warning,
    Error,
    Critical
};

inline std::string to_string(Level level)
{
    switch (level)
    {
    case Level::Debug:
        return "debug";
    case Level::Info:
        return "info";
    case Level::Notice:
        return "notice";
    case Level::Warning:
        return "warning";
    case Level::Error:
        return "error";
    case Level::Critical:
        return "critical";
    }
    return "info";
}

inline Level level_from_string(const std::string& s)
{
    if (s == "debug")
        return Level::Debug;
    if (s == "notice")
        return Level::Notice;
    if (s == "warning" || s == "warn")
        return Level::Warning;
    if (s == "error")
        return Level::Error;
    if (s == "critical")
        return Level::Critical;
    return Level::Info;
}

/// Ordered, append-only list of tags bound to a handle.
class TagList
{
  public:
    TagList() = default;
    explicit TagList(std::vector<std::string> tags) : tags_(std::move(tags)) {}

    /// New list holding this list's tags followed by `more`, duplicates kept.
    TagList concat(const std::vector<std::string>& more) const
    {
        std::vector<std::string> out = tags_;
        out.insert(out.end(), more.begin(), more.end());
        return TagList(std::move(out));
    }

    bool empty() const
    {
        return tags_.empty();
    }
    const std::vector<std::string>& values() const
    {
        return tags_;
    }

  private:
    std::vector<std::string> tags_;
};

// nlohmann::json adapters
inline void to_json(Json& j, const SourceLocation& loc)
{
    j = Json{{"filename", loc.filename}, {"lineno", loc.lineno}, {"function", loc.function}};
}
inline void from_json(const Json& j, SourceLocation& loc)
{
    loc.filename = j.at("filename").get<std::string>();
    loc.lineno = j.at("lineno").get<int>();
    loc.function = j.value("function", "");
}

} // namespace logfirecpp

#define LOGFIRECPP_HERE                                                                          \
    ::logfirecpp::SourceLocation                                                                 \
    {                                                                                            \
        __FILE__, __LINE__, __func__                                                             \
    }
