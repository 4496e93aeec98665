#pragma once
#include "logfirecpp/encoding/attributes.hpp"
#include "logfirecpp/telemetry/exception_capture.hpp"
#include "logfirecpp/telemetry/provider.hpp"
#include "logfirecpp/telemetry/span.hpp"
#include "logfirecpp/types.hpp"

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace logfirecpp
{

using encoding::Args;
using encoding::Value;

struct SpanOptions
{
    /// Record name. Defaults to the message template.
    std::optional<std::string> span_name;
    std::optional<SourceLocation> location;
};

namespace detail
{

template <typename T>
Value to_value(const T& v)
{
    if constexpr (std::is_constructible<Value, const T&>::value)
        return Value(v);
    else
        return Value::opaque(telemetry::exception_type_name(typeid(T)), nullptr);
}

template <typename... Ts>
Args bind_arguments(const std::vector<std::string>& names, const Ts&... values)
{
    Args out;
    std::size_t index = 0;
    auto bind = [&](const auto& v)
    {
        if (index < names.size())
            out.emplace_back(names[index], to_value(v));
        ++index;
    };
    (bind(values), ...);
    return out;
}

} // namespace detail

/// Entry point for producing spans and logs. Handles are cheap values; each
/// carries an immutable tag list. The tracer provider is resolved on every call,
/// so handles made before configure() follow the installed configuration.
class Logfire
{
  public:
    Logfire() = default;
    explicit Logfire(TagList tags, std::shared_ptr<telemetry::TracerProvider> provider = nullptr)
        : tags_(std::move(tags)), provider_(std::move(provider))
    {
    }

    /// New handle whose tags are this handle's tags followed by `names`.
    Logfire tags(const std::vector<std::string>& names) const;

    template <typename... Names>
    Logfire tags(const std::string& first, const Names&... rest) const
    {
        return tags(std::vector<std::string>{first, std::string(rest)...});
    }

    const TagList& tag_list() const
    {
        return tags_;
    }

    /// Starts a span and makes it active until the returned scope is destroyed.
    /// Emits the start_span shadow immediately. Leaving the scope by an exception
    /// only marks the span as failed; use the overload taking a callable to
    /// also record the exception event.
    /// Throws TemplateArgumentError for an unbound or reserved argument name.
    telemetry::SpanScope span(const std::string& msg_template, const Args& args = {},
                              const SpanOptions& options = {}) const;

    /// Runs `fn` inside a span. `fn` takes either no arguments or the active
    /// `SpanScope&`. An exception leaving `fn` is recorded on the span as an
    /// exception event and rethrown unchanged.
    template <typename Fn>
    auto span(const std::string& msg_template, const Args& args, const SpanOptions& options,
              Fn&& fn) const
    {
        auto scope = span(msg_template, args, options);
        try
        {
            if constexpr (std::is_invocable_v<Fn&, telemetry::SpanScope&>)
                return fn(scope);
            else
                return fn();
        }
        catch (...)
        {
            scope.record_exception(std::current_exception());
            throw;
        }
    }

    /// Starts a span without activating it. Call activate() or end() on the handle.
    telemetry::SpanHandle start_span(const std::string& msg_template, const Args& args = {},
                                     const SpanOptions& options = {}) const;

    void log(Level level, const std::string& msg_template, const Args& args = {},
             const std::optional<SourceLocation>& location = std::nullopt) const;

    void debug(const std::string& msg_template, const Args& args = {},
               const std::optional<SourceLocation>& location = std::nullopt) const
    {
        log(Level::Debug, msg_template, args, location);
    }
    void info(const std::string& msg_template, const Args& args = {},
              const std::optional<SourceLocation>& location = std::nullopt) const
    {
        log(Level::Info, msg_template, args, location);
    }
    void notice(const std::string& msg_template, const Args& args = {},
                const std::optional<SourceLocation>& location = std::nullopt) const
    {
        log(Level::Notice, msg_template, args, location);
    }
    void warning(const std::string& msg_template, const Args& args = {},
                 const std::optional<SourceLocation>& location = std::nullopt) const
    {
        log(Level::Warning, msg_template, args, location);
    }
    void error(const std::string& msg_template, const Args& args = {},
               const std::optional<SourceLocation>& location = std::nullopt) const
    {
        log(Level::Error, msg_template, args, location);
    }
    void critical(const std::string& msg_template, const Args& args = {},
                  const std::optional<SourceLocation>& location = std::nullopt) const
    {
        log(Level::Critical, msg_template, args, location);
    }

    /// Error-level log carrying the exception currently being handled, if any.
    void exception(const std::string& msg_template, const Args& args = {},
                   const std::optional<SourceLocation>& location = std::nullopt) const;

    /// Wraps `fn` so every call runs inside a span. Positional arguments are bound
    /// to `arg_names` in order and become template arguments. Exceptions from `fn`
    /// are recorded on the span and rethrown unchanged.
    template <typename Fn>
    auto instrument(std::string msg_template, std::optional<std::string> span_name,
                    std::vector<std::string> arg_names, Fn fn) const
    {
        Logfire self = *this;
        return [self, msg_template = std::move(msg_template), span_name = std::move(span_name),
                arg_names = std::move(arg_names), fn = std::move(fn)](auto&&... args) mutable
        {
            auto bound = detail::bind_arguments(arg_names, args...);
            auto scope = self.span(msg_template, bound, SpanOptions{span_name, std::nullopt});
            try
            {
                return fn(std::forward<decltype(args)>(args)...);
            }
            catch (...)
            {
                scope.record_exception(std::current_exception());
                throw;
            }
        };
    }

    template <typename Fn>
    auto instrument(std::string msg_template, std::optional<std::string> span_name, Fn fn) const
    {
        return instrument(std::move(msg_template), std::move(span_name), {}, std::move(fn));
    }

  private:
    std::shared_ptr<telemetry::TracerProvider> provider() const
    {
        return provider_ ? provider_ : telemetry::global_provider();
    }
    void emit_log(Level level, const std::string& msg_template, const Args& args,
                  const std::optional<SourceLocation>& location,
                  const std::exception_ptr& error) const;

    TagList tags_;
    std::shared_ptr<telemetry::TracerProvider> provider_;
};

/// The default, untagged handle bound to the global provider.
const Logfire& logfire();

} // namespace logfirecpp
