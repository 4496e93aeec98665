#include "logfirecpp/telemetry/span.hpp"

#include "logfirecpp/constants.hpp"
#include "logfirecpp/exceptions.hpp"
#include "logfirecpp/logging.hpp"
#include "logfirecpp/telemetry/exception_capture.hpp"

#include <algorithm>
#include <mutex>
#include <spdlog/spdlog.h>

namespace logfirecpp::telemetry
{

struct SpanHandle::Data
{
    std::shared_ptr<TracerProvider> provider;
    mutable std::mutex mutex;
    SpanRecord record;
    std::optional<SourceLocation> location;
    SpanState state{SpanState::Created};
    bool end_on_exit{true};
};

namespace
{

encoding::AttributeMap code_attributes(const std::optional<SourceLocation>& location)
{
    encoding::AttributeMap attrs;
    if (!location)
        return attrs;
    attrs.set(ATTRIBUTES_CODE_FILEPATH_KEY, location->filename);
    attrs.set(ATTRIBUTES_CODE_LINENO_KEY, static_cast<int64_t>(location->lineno));
    attrs.set(ATTRIBUTES_CODE_FUNCTION_KEY, location->function);
    return attrs;
}

} // namespace

SpanHandle SpanHandle::start(std::shared_ptr<TracerProvider> provider, std::string name,
                             encoding::AttributeMap attributes,
                             std::optional<SourceLocation> location)
{
    if (!provider)
        provider = global_provider();

    auto parent = current_context().active_span();
    auto& ids = provider->id_generator();

    SpanContext ctx;
    ctx.trace_id = parent ? parent->trace_id : ids.generate_trace_id();
    ctx.span_id = ids.generate_span_id();
    SpanContext shadow_ctx{ctx.trace_id, ids.generate_span_id()};
    int64_t start_time = provider->now();

    auto base = code_attributes(location);
    base.merge(attributes);

    SpanRecord shadow;
    shadow.name = name + START_SPAN_NAME_SUFFIX;
    shadow.context = shadow_ctx;
    shadow.parent = ctx;
    shadow.start_time = start_time;
    shadow.end_time = start_time;
    shadow.kind = SpanKind::StartSpan;
    shadow.attributes = base;
    shadow.attributes.set(ATTRIBUTES_SPAN_TYPE_KEY, to_string(SpanKind::StartSpan));
    shadow.attributes.set(ATTRIBUTES_START_PARENT_ID_KEY,
                          parent ? std::to_string(parent->span_id)
                                 : std::string(ROOT_START_PARENT_ID));

    auto data = std::make_shared<Data>();
    data->provider = provider;
    data->location = std::move(location);
    data->record.name = std::move(name);
    data->record.context = ctx;
    data->record.parent = parent;
    data->record.start_time = start_time;
    data->record.kind = SpanKind::Span;
    data->record.attributes = std::move(base);
    data->record.attributes.set(ATTRIBUTES_SPAN_TYPE_KEY, to_string(SpanKind::Span));

    provider->emit(shadow);
    return SpanHandle(std::move(data));
}

SpanContext SpanHandle::context() const
{
    if (!data_)
        return {};
    std::lock_guard<std::mutex> lock(data_->mutex);
    return data_->record.context;
}

std::optional<SpanContext> SpanHandle::parent() const
{
    if (!data_)
        return std::nullopt;
    std::lock_guard<std::mutex> lock(data_->mutex);
    return data_->record.parent;
}

std::string SpanHandle::name() const
{
    if (!data_)
        return {};
    std::lock_guard<std::mutex> lock(data_->mutex);
    return data_->record.name;
}

std::string SpanHandle::message() const
{
    if (!data_)
        return {};
    std::lock_guard<std::mutex> lock(data_->mutex);
    if (auto* msg = data_->record.attributes.get_if<std::string>(ATTRIBUTES_MESSAGE_KEY))
        return *msg;
    return data_->record.name;
}

int64_t SpanHandle::start_time() const
{
    if (!data_)
        return 0;
    std::lock_guard<std::mutex> lock(data_->mutex);
    return data_->record.start_time;
}

std::optional<int64_t> SpanHandle::end_time() const
{
    if (!data_)
        return std::nullopt;
    std::lock_guard<std::mutex> lock(data_->mutex);
    if (data_->state != SpanState::Ended)
        return std::nullopt;
    return data_->record.end_time;
}

encoding::AttributeMap SpanHandle::attributes() const
{
    if (!data_)
        return {};
    std::lock_guard<std::mutex> lock(data_->mutex);
    return data_->record.attributes;
}

SpanState SpanHandle::state() const
{
    if (!data_)
        return SpanState::Ended;
    std::lock_guard<std::mutex> lock(data_->mutex);
    return data_->state;
}

StatusCode SpanHandle::status() const
{
    if (!data_)
        return StatusCode::Unset;
    std::lock_guard<std::mutex> lock(data_->mutex);
    return data_->record.status;
}

void SpanHandle::set_attribute(const std::string& key, const encoding::Value& value)
{
    if (!data_)
        return;
    if (encoding::is_reserved_key(key))
        throw TemplateArgumentError("Attribute name '" + key + "' is reserved", key);

    std::lock_guard<std::mutex> lock(data_->mutex);
    if (data_->state == SpanState::Ended)
    {
        logging::logger()->debug("Ignoring attribute '{}' set on ended span '{}'", key,
                                 data_->record.name);
        return;
    }

    auto& attrs = data_->record.attributes;
    std::vector<std::string> null_args;
    if (auto* existing = attrs.get_if<std::vector<std::string>>(NULL_ARGS_KEY))
        null_args = *existing;
    null_args.erase(std::remove(null_args.begin(), null_args.end(), key), null_args.end());
    attrs.erase(key);
    attrs.erase(key + JSON_SUFFIX);

    encoding::encode_argument(attrs, key, value, null_args);
    if (null_args.empty())
        attrs.erase(NULL_ARGS_KEY);
    else
        attrs.set(NULL_ARGS_KEY, null_args);
}

void SpanHandle::set_status(StatusCode code, const std::string& description)
{
    if (!data_)
        return;
    std::lock_guard<std::mutex> lock(data_->mutex);
    if (data_->state == SpanState::Ended)
        return;
    data_->record.status = code;
    data_->record.status_description = code == StatusCode::Error ? description : std::string();
}

void SpanHandle::set_end_on_exit(bool end_on_exit)
{
    if (!data_)
        return;
    std::lock_guard<std::mutex> lock(data_->mutex);
    data_->end_on_exit = end_on_exit;
}

bool SpanHandle::end_on_exit() const
{
    if (!data_)
        return false;
    std::lock_guard<std::mutex> lock(data_->mutex);
    return data_->end_on_exit;
}

void SpanHandle::record_exception(const std::exception_ptr& error)
{
    if (!data_ || !error)
        return;
    auto event = capture_exception(error, data_->location, data_->provider->now());

    std::lock_guard<std::mutex> lock(data_->mutex);
    if (data_->state == SpanState::Ended)
        return;
    data_->record.status = StatusCode::Error;
    if (auto* message = event.attributes.get_if<std::string>(EXCEPTION_MESSAGE_KEY))
    {
        auto* type = event.attributes.get_if<std::string>(EXCEPTION_TYPE_KEY);
        data_->record.status_description = (type ? *type + ": " : std::string()) + *message;
    }
    data_->record.events.push_back(std::move(event));
}

SpanScope SpanHandle::activate(bool end_on_exit)
{
    return SpanScope(*this, end_on_exit);
}

void SpanHandle::mark_active(bool end_on_exit)
{
    std::lock_guard<std::mutex> lock(data_->mutex);
    data_->end_on_exit = end_on_exit;
    if (data_->state == SpanState::Created)
        data_->state = SpanState::Active;
}

void SpanHandle::end()
{
    if (!data_)
        return;
    SpanRecord finished;
    {
        std::lock_guard<std::mutex> lock(data_->mutex);
        if (data_->state == SpanState::Ended)
            return;
        data_->record.end_time = std::max(data_->provider->now(), data_->record.start_time);
        data_->state = SpanState::Ended;
        finished = data_->record;
    }
    data_->provider->emit(finished);
}

SpanScope::SpanScope(SpanHandle handle, bool end_on_exit) : handle_(std::move(handle))
{
    if (!handle_.valid())
        return;
    handle_.mark_active(end_on_exit);
    uncaught_on_enter_ = std::uncaught_exceptions();
    token_.emplace(Context(handle_.context()));
}

SpanScope::SpanScope(SpanScope&& other) noexcept
    : handle_(std::move(other.handle_)), token_(std::move(other.token_)),
      uncaught_on_enter_(other.uncaught_on_enter_)
{
    other.handle_ = SpanHandle();
    other.token_.reset();
}

SpanScope& SpanScope::operator=(SpanScope&& other) noexcept
{
    if (this == &other)
        return *this;

    exit(false);

    handle_ = std::move(other.handle_);
    token_ = std::move(other.token_);
    uncaught_on_enter_ = other.uncaught_on_enter_;

    other.handle_ = SpanHandle();
    other.token_.reset();
    return *this;
}

SpanScope::~SpanScope()
{
    exit(std::uncaught_exceptions() > uncaught_on_enter_);
}

void SpanScope::exit(bool record_error) noexcept
{
    if (!handle_.valid())
        return;
    try
    {
        if (record_error && handle_.status() != StatusCode::Error)
            handle_.set_status(StatusCode::Error);
        if (handle_.end_on_exit())
            handle_.end();
    }
    catch (const std::exception& e)
    {
        logging::logger()->error("Failed to finish span '{}': {}", handle_.name(), e.what());
    }
    token_.reset();
    handle_ = SpanHandle();
}

} // namespace logfirecpp::telemetry
