#pragma once
#include "logfirecpp/telemetry/span_record.hpp"

#include <optional>
#include <utility>

namespace logfirecpp::telemetry
{

/// The ActiveContext of one execution unit: the currently open span, or none at root.
/// Values are immutable; each thread holds its own current value.
class Context
{
  public:
    Context() = default;
    explicit Context(SpanContext active) : active_(active) {}

    const std::optional<SpanContext>& active_span() const
    {
        return active_;
    }
    bool is_root() const
    {
        return !active_.has_value();
    }

  private:
    std::optional<SpanContext> active_;
};

/// Current value for the calling thread.
Context current_context();

/// Makes `ctx` current for the calling thread until destroyed, then restores the prior value.
/// Must be destroyed on the thread that created it.
class ContextToken
{
  public:
    explicit ContextToken(Context ctx);
    ContextToken(const ContextToken&) = delete;
    ContextToken& operator=(const ContextToken&) = delete;
    ContextToken(ContextToken&& other) noexcept;
    ContextToken& operator=(ContextToken&& other) noexcept;
    ~ContextToken();

    /// Restores the prior value now. Idempotent.
    void detach();

  private:
    Context prior_;
    bool attached_{false};
};

inline ContextToken attach(Context ctx)
{
    return ContextToken(std::move(ctx));
}

/// Captures the caller's context; the returned callable runs `fn` with it attached.
template <typename Fn>
auto wrap_with_context(Fn fn)
{
    return [ctx = current_context(), fn = std::move(fn)](auto&&... args) mutable
    {
        ContextToken token(ctx);
        return fn(std::forward<decltype(args)>(args)...);
    };
}

} // namespace logfirecpp::telemetry
