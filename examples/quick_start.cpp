#include <logfirecpp.hpp>

#include <iostream>
#include <stdexcept>

// Example: spans, logs and a counter sent to a local OTLP collector
//
// Configuration comes from the environment, for example:
//   LOGFIRE_SEND_TO_LOGFIRE=true LOGFIRE_TOKEN=dev-token \
//   LOGFIRE_BASE_URL=http://localhost:4318 ./logfirecpp_example_quick_start
//
// Batches the collector rejects land in logfire_spans.bin and can be resent
// with exporting::replay_fallback_file().

int main()
{
    using namespace logfirecpp;

    try
    {
        configure(LogfireConfig::from_env());
    }
    catch (const ConfigurationError& e)
    {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    auto lf = logfire().tags("example", "quick-start");
    auto processed = meter_provider()->create_counter("rows_processed", "Rows read", "1");

    auto parse = lf.instrument("parse {line}", std::nullopt, {"line"},
                               [](const std::string& line)
                               {
                                   if (line.empty())
                                       throw std::invalid_argument("empty line");
                                   return static_cast<int>(line.size());
                               });

    {
        auto span = lf.span("import {file}", {{"file", std::string("data.csv")}});
        for (const std::string line : {"a,b", "c,d,e", ""})
        {
            try
            {
                int width = parse(line);
                processed.add(1);
                lf.debug("parsed {width} chars", {{"width", width}});
            }
            catch (const std::invalid_argument&)
            {
                lf.exception("skipping line");
            }
        }
        span.set_attribute("rows", static_cast<int64_t>(2));
    }

    lf.info("done");
    shutdown();
    return 0;
}
