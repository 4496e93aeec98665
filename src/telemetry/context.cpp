#include "logfirecpp/telemetry/context.hpp"

namespace logfirecpp::telemetry
{
namespace
{

thread_local Context current;

} // namespace

Context current_context()
{
    return current;
}

ContextToken::ContextToken(Context ctx) : prior_(current), attached_(true)
{
    current = std::move(ctx);
}

ContextToken::ContextToken(ContextToken&& other) noexcept
    : prior_(std::move(other.prior_)), attached_(other.attached_)
{
    other.attached_ = false;
}

ContextToken& ContextToken::operator=(ContextToken&& other) noexcept
{
    if (this == &other)
        return *this;
    detach();
    prior_ = std::move(other.prior_);
    attached_ = other.attached_;
    other.attached_ = false;
    return *this;
}

ContextToken::~ContextToken()
{
    detach();
}

void ContextToken::detach()
{
    if (!attached_)
        return;
    current = prior_;
    attached_ = false;
}

} // namespace logfirecpp::telemetry
