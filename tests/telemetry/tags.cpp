#include "logfirecpp/constants.hpp"
#include "logfirecpp/logfire.hpp"
#include "logfirecpp/testing.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace logfirecpp;

int main()
{
    std::cout << "=== Tag Handle Tests ===" << std::endl;

    auto exporter = std::make_shared<testing::TestExporter>();
    auto provider = std::make_shared<telemetry::TracerProvider>(
        std::make_shared<testing::IncrementalIdGenerator>(), testing::TimeGenerator());
    provider->add_span_processor(std::make_shared<telemetry::SimpleSpanProcessor>(exporter));

    // Handle created before the provider is installed still reaches it.
    auto early = logfire().tags("early");
    telemetry::set_global_provider(provider);

    std::cout << "test_tags_concatenate_in_order..." << std::endl;
    {
        auto lf = logfire().tags("a").tags("b");
        auto derived = lf.tags("c", "d");
        std::vector<std::string> expected = {"a", "b", "c", "d"};
        assert(derived.tag_list().values() == expected);
        assert(lf.tag_list().values().size() == 2);
        assert(logfire().tag_list().empty());

        {
            auto span = derived.span("tagged");
        }
        auto spans = exporter->finished_spans();
        assert(spans.size() == 2);
        for (const auto& s : spans)
        {
            auto* tags = s.attributes.get_if<std::vector<std::string>>(ATTRIBUTES_TAGS_KEY);
            assert(tags != nullptr);
            assert(*tags == expected);
        }
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_duplicates_kept..." << std::endl;
    {
        auto lf = logfire().tags("x").tags(std::vector<std::string>{"x", "y"});
        std::vector<std::string> expected = {"x", "x", "y"};
        assert(lf.tag_list().values() == expected);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_no_tags_attribute_when_empty..." << std::endl;
    {
        exporter->reset();
        logfire().info("plain");
        auto spans = exporter->finished_spans();
        assert(spans.size() == 1);
        assert(!spans[0].attributes.contains(ATTRIBUTES_TAGS_KEY));
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_handle_resolves_provider_per_call..." << std::endl;
    {
        exporter->reset();
        early.info("late bound");
        auto spans = exporter->finished_spans();
        assert(spans.size() == 1);
        auto* tags = spans[0].attributes.get_if<std::vector<std::string>>(ATTRIBUTES_TAGS_KEY);
        assert(tags && tags->size() == 1 && (*tags)[0] == "early");
    }
    std::cout << "  PASSED" << std::endl;

    telemetry::set_global_provider(nullptr);
    std::cout << "All tag handle tests passed!" << std::endl;
    return 0;
}
