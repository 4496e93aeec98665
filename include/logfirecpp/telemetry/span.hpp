#pragma once
#include "logfirecpp/encoding/attributes.hpp"
#include "logfirecpp/telemetry/context.hpp"
#include "logfirecpp/telemetry/provider.hpp"
#include "logfirecpp/telemetry/span_record.hpp"

#include <exception>
#include <memory>
#include <optional>
#include <string>

namespace logfirecpp::telemetry
{

enum class SpanState
{
    Created,
    Active,
    Ended
};

class SpanScope;

/// Shared handle to one real span. Copies refer to the same span.
/// The start_span shadow is emitted when the span is started; the real record
/// is emitted once, on the transition to Ended.
class SpanHandle
{
  public:
    SpanHandle() = default;

    /// Allocates the real span id parented to the calling thread's context,
    /// emits the shadow record and returns the handle in state Created.
    /// `attributes` are the encoded message attributes (args, tags, template, msg).
    static SpanHandle start(std::shared_ptr<TracerProvider> provider, std::string name,
                            encoding::AttributeMap attributes,
                            std::optional<SourceLocation> location);

    bool valid() const
    {
        return static_cast<bool>(data_);
    }

    SpanContext context() const;
    std::optional<SpanContext> parent() const;
    std::string name() const;
    std::string message() const;
    int64_t start_time() const;
    std::optional<int64_t> end_time() const;
    encoding::AttributeMap attributes() const;
    SpanState state() const;
    StatusCode status() const;

    /// Late attribute, encoded like a template argument. Only the final record sees it.
    void set_attribute(const std::string& key, const encoding::Value& value);
    void set_status(StatusCode code, const std::string& description = {});
    void set_end_on_exit(bool end_on_exit);
    bool end_on_exit() const;

    /// Attaches an `exception` event and marks the span as failed.
    void record_exception(const std::exception_ptr& error);

    /// Makes this span the active context until the returned scope is destroyed.
    SpanScope activate(bool end_on_exit = true);

    /// Transition to Ended: stamps the end time (never before start) and emits the record.
    /// Later calls do nothing.
    void end();

  private:
    friend class SpanScope;
    struct Data;
    explicit SpanHandle(std::shared_ptr<Data> data) : data_(std::move(data)) {}

    void mark_active(bool end_on_exit);

    std::shared_ptr<Data> data_;
};

/// Scoped activation of a span. Restores the prior context on exit and, when
/// end_on_exit is set, ends the span. Leaving by exception marks it as failed.
class SpanScope
{
  public:
    SpanScope() = default;
    SpanScope(SpanHandle handle, bool end_on_exit);
    SpanScope(const SpanScope&) = delete;
    SpanScope& operator=(const SpanScope&) = delete;
    SpanScope(SpanScope&& other) noexcept;
    SpanScope& operator=(SpanScope&& other) noexcept;
    ~SpanScope();

    SpanHandle& handle()
    {
        return handle_;
    }
    const SpanHandle& handle() const
    {
        return handle_;
    }

    void set_attribute(const std::string& key, const encoding::Value& value)
    {
        handle_.set_attribute(key, value);
    }
    void record_exception(const std::exception_ptr& error)
    {
        handle_.record_exception(error);
    }
    void set_end_on_exit(bool end_on_exit)
    {
        handle_.set_end_on_exit(end_on_exit);
    }

  private:
    void exit(bool record_error) noexcept;

    SpanHandle handle_;
    std::optional<ContextToken> token_;
    int uncaught_on_enter_{0};
};

} // namespace logfirecpp::telemetry
