#pragma once
#include "logfirecpp/types.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace logfirecpp
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;

    Error(const std::string& message, SourceLocation where)
        : std::runtime_error(message), where_(std::move(where))
    {
    }

    /// Where the error was raised, when the thrower recorded it.
    const std::optional<SourceLocation>& where() const
    {
        return where_;
    }

  private:
    std::optional<SourceLocation> where_;
};

/// Invalid or inconsistent configuration, raised once at setup.
struct ConfigurationError : public Error
{
    using Error::Error;
};

/// A message template references an argument that was not supplied, or is malformed.
struct TemplateArgumentError : public Error
{
    TemplateArgumentError(const std::string& message, std::string missing_name = {})
        : Error(message), missing_name_(std::move(missing_name))
    {
    }

    const std::string& missing_name() const
    {
        return missing_name_;
    }

  private:
    std::string missing_name_;
};

/// A value could not be converted to its wire form.
struct EncodingError : public Error
{
    using Error::Error;
};

/// The network boundary rejected or failed to deliver a payload.
struct TransportError : public Error
{
    using Error::Error;
};

struct BodyTooLargeError : public TransportError
{
    BodyTooLargeError(std::size_t observed, std::size_t limit)
        : TransportError("Request body is too large (" + std::to_string(observed) +
                         " bytes), must be less than " + std::to_string(limit) + " bytes."),
          observed_(observed), limit_(limit)
    {
    }

    std::size_t observed_size() const
    {
        return observed_;
    }
    std::size_t limit() const
    {
        return limit_;
    }

  private:
    std::size_t observed_;
    std::size_t limit_;
};

/// Internal failure while serializing an exception trace. Never escapes capture.
struct CaptureError : public Error
{
    using Error::Error;
};

/// One failed field of a structured validation.
struct FieldError
{
    std::string type;
    Json loc = Json::array(); ///< path segments, strings or indices
    std::string msg;
    Json input;
};

/// Structured field-validation failure carrying every failed field in order.
class ValidationError : public Error
{
  public:
    ValidationError(std::string title, std::vector<FieldError> errors)
        : Error(render(title, errors)), title_(std::move(title)), errors_(std::move(errors))
    {
    }

    const std::string& title() const
    {
        return title_;
    }
    const std::vector<FieldError>& errors() const
    {
        return errors_;
    }

  private:
    static std::string render(const std::string& title, const std::vector<FieldError>& errors)
    {
        std::string out = std::to_string(errors.size()) +
                          (errors.size() == 1 ? " validation error for " : " validation errors for ") +
                          title;
        for (const auto& e : errors)
        {
            std::string path;
            for (const auto& seg : e.loc)
            {
                if (!path.empty())
                    path += ".";
                path += seg.is_string() ? seg.get<std::string>() : seg.dump();
            }
            out += "\n" + path + "\n  " + e.msg + " [type=" + e.type +
                   ", input_value=" + e.input.dump() + "]";
        }
        return out;
    }

    std::string title_;
    std::vector<FieldError> errors_;
};

} // namespace logfirecpp
