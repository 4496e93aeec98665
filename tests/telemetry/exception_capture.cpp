#include "logfirecpp/constants.hpp"
#include "logfirecpp/exceptions.hpp"
#include "logfirecpp/telemetry/exception_capture.hpp"

#include <cassert>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace logfirecpp;
using namespace logfirecpp::telemetry;

namespace
{

ValidationError make_validation_error()
{
    return ValidationError("Model", {FieldError{"int_parsing", Json::array({"x"}),
                                                "Input should be a valid integer", "abc"},
                                     FieldError{"missing", Json::array({"items", 0, "name"}),
                                                "Field required", Json::object()}});
}

std::exception_ptr nested_chain()
{
    try
    {
        try
        {
            throw make_validation_error();
        }
        catch (const ValidationError&)
        {
            std::throw_with_nested(Error("loading config failed", SourceLocation{"svc.cpp", 10, "load"}));
        }
    }
    catch (const Error&)
    {
        return std::current_exception();
    }
    return nullptr;
}

const std::string& attr(const SpanEvent& e, const std::string& key)
{
    auto* v = e.attributes.get_if<std::string>(key);
    assert(v != nullptr);
    return *v;
}

} // namespace

int main()
{
    std::cout << "=== Exception Capture Tests ===" << std::endl;

    std::cout << "test_validation_error_text..." << std::endl;
    {
        auto err = make_validation_error();
        std::string text = err.what();
        assert(text.rfind("2 validation errors for Model\n", 0) == 0);
        assert(text.find("x\n  Input should be a valid integer [type=int_parsing, input_value=\"abc\"]") !=
               std::string::npos);
        assert(text.find("items.0.name\n  Field required") != std::string::npos);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_validation_error_event..." << std::endl;
    {
        std::exception_ptr ep;
        try
        {
            throw make_validation_error();
        }
        catch (const ValidationError&)
        {
            ep = std::current_exception();
        }
        auto event = capture_exception(ep, SourceLocation{"app.cpp", 5, "main"}, 123);
        assert(event.name == "exception");
        assert(event.timestamp == 123);
        assert(attr(event, EXCEPTION_TYPE_KEY) == "logfirecpp::ValidationError");

        auto data = Json::parse(attr(event, EXCEPTION_DATA_KEY));
        assert(data.size() == 2);
        assert(data[0]["type"] == "int_parsing");
        assert(data[0]["loc"] == Json::array({"x"}));
        assert(data[0]["msg"] == "Input should be a valid integer");
        assert(data[0]["input"] == "abc");
        assert(data[1]["loc"][1] == 0);

        auto trace = Json::parse(attr(event, EXCEPTION_TRACE_KEY));
        assert(trace["stacks"].size() == 1);
        const auto& frame = trace["stacks"][0]["frames"][0];
        assert(frame["filename"] == "app.cpp");
        assert(frame["lineno"] == 5);
        assert(frame["name"] == "main");
        assert(frame["locals"].is_null());
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_nested_chain..." << std::endl;
    {
        auto ep = nested_chain();
        auto stacks = walk_exception_chain(ep, std::nullopt);
        assert(stacks.size() == 2);
        assert(stacks[0].exc_type == "logfirecpp::Error");
        assert(stacks[0].exc_value == "loading config failed");
        assert(!stacks[0].is_cause);
        assert(stacks[0].frames.size() == 1);
        assert(stacks[0].frames[0].filename == "svc.cpp");
        assert(stacks[1].exc_type == "logfirecpp::ValidationError");
        assert(stacks[1].is_cause);

        auto event = capture_exception(ep, std::nullopt, 1);
        // Only the outer error decides whether structured data is attached.
        assert(!event.attributes.contains(EXCEPTION_DATA_KEY));
        const auto& text = attr(event, EXCEPTION_STACKTRACE_KEY);
        assert(text.find("logfirecpp::Error: loading config failed") == 0);
        assert(text.find("Caused by: logfirecpp::ValidationError") != std::string::npos);
        auto trace = Json::parse(attr(event, EXCEPTION_TRACE_KEY));
        assert(trace["stacks"][1]["is_cause"] == true);
        assert(trace["stacks"][0]["syntax_error"].is_null());
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_repeated_frames_deduplicated..." << std::endl;
    {
        SourceLocation same{"repo.cpp", 7, "save"};
        std::exception_ptr ep;
        try
        {
            try
            {
                throw Error("inner", same);
            }
            catch (const Error&)
            {
                std::throw_with_nested(Error("outer", same));
            }
        }
        catch (const Error&)
        {
            ep = std::current_exception();
        }
        auto stacks = walk_exception_chain(ep, same);
        assert(stacks.size() == 2);
        assert(stacks[0].frames.size() == 1);
        assert(stacks[1].frames.empty());
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_non_std_exception..." << std::endl;
    {
        std::exception_ptr ep;
        try
        {
            throw 42;
        }
        catch (int)
        {
            ep = std::current_exception();
        }
        auto event = capture_exception(ep, std::nullopt, 1);
        assert(attr(event, EXCEPTION_TYPE_KEY) == "unknown");
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_capture_never_throws..." << std::endl;
    {
        auto event = capture_exception(nullptr, std::nullopt, 9);
        assert(attr(event, EXCEPTION_TYPE_KEY) == "unknown");
        assert(Json::parse(attr(event, EXCEPTION_TRACE_KEY))["stacks"].empty());
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "All exception capture tests passed!" << std::endl;
    return 0;
}
