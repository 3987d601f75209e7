#include <catch2/catch_test_macros.hpp>

#include <cctype>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "test_support.hpp"
#include "tracelink/core/observability/log_tracer.hpp"

using namespace tracelink::core;
using namespace tracelink::core::observability;
using propagation::BinaryCarrier;
using propagation::Builtin;
using propagation::TextMapExtractAdapter;
using propagation::TextMapInjectAdapter;

namespace {

using Headers = std::unordered_map<std::string, std::string>;

std::shared_ptr<const LogSpanContext> as_log_context(const SpanContextPtr& context) {
    auto log_context = std::dynamic_pointer_cast<const LogSpanContext>(context);
    REQUIRE(log_context != nullptr);
    return log_context;
}

}  // namespace

TEST_CASE("Text map propagation round trip", "[propagation]") {
    LogTracer tracer{{}, tracelink::testing::quiet_logger()};
    auto span = tracer.build_span("client")->start();
    span->set_baggage_item("user", "alice smith");
    auto original = as_log_context(span->context());

    Headers carrier;
    TextMapInjectAdapter writer{carrier};
    tracer.inject(*span->context(), Builtin::text_map, writer);

    REQUIRE(carrier.size() == 3);
    REQUIRE(carrier.at("trace-id").size() == 16);
    REQUIRE(carrier.at("baggage-user") == "alice smith");

    auto extracted = as_log_context(tracer.extract(Builtin::text_map, TextMapExtractAdapter{carrier}));
    REQUIRE(extracted->trace_id() == original->trace_id());
    REQUIRE(extracted->span_id() == original->span_id());
    REQUIRE(extracted->baggage_item("user") == "alice smith");
}

TEST_CASE("HTTP header propagation encodes baggage", "[propagation]") {
    LogTracer tracer{{}, tracelink::testing::quiet_logger()};
    auto span = tracer.build_span("client")->start();
    span->set_baggage_item("route", "a b/c%");

    Headers carrier;
    TextMapInjectAdapter writer{carrier};
    tracer.inject(*span->context(), Builtin::http_headers, writer);
    REQUIRE(carrier.at("baggage-route") == "a%20b%2Fc%25");

    SECTION("round trip") {
        auto extracted = as_log_context(tracer.extract(Builtin::http_headers, TextMapExtractAdapter{carrier}));
        REQUIRE(extracted->baggage_item("route") == "a b/c%");
    }

    SECTION("header names are case-insensitive") {
        Headers upper{{"Trace-Id", carrier.at("trace-id")},
                      {"SPAN-ID", carrier.at("span-id")},
                      {"Baggage-Route", carrier.at("baggage-route")}};
        auto extracted = as_log_context(tracer.extract(Builtin::http_headers, TextMapExtractAdapter{upper}));
        REQUIRE(extracted->trace_id() == as_log_context(span->context())->trace_id());
        REQUIRE(extracted->baggage_item("route") == "a b/c%");
    }

    SECTION("malformed escapes are rejected") {
        carrier["baggage-route"] = "bad%zz";
        REQUIRE_THROWS_AS(tracer.extract(Builtin::http_headers, TextMapExtractAdapter{carrier}),
                          std::invalid_argument);
        carrier["baggage-route"] = "cut%4";
        REQUIRE_THROWS_AS(tracer.extract(Builtin::http_headers, TextMapExtractAdapter{carrier}),
                          std::invalid_argument);
    }
}

TEST_CASE("HTTP header propagation encodes baggage keys", "[propagation]") {
    LogTracer tracer{{}, tracelink::testing::quiet_logger()};
    auto span = tracer.build_span("client")->start();
    span->set_baggage_item("User Id", "42");

    Headers carrier;
    TextMapInjectAdapter writer{carrier};
    tracer.inject(*span->context(), Builtin::http_headers, writer);
    REQUIRE(carrier.count("baggage-%55ser%20%49d") == 1);
    REQUIRE(carrier.at("baggage-%55ser%20%49d") == "42");

    SECTION("round trip keeps the original key") {
        auto extracted = as_log_context(tracer.extract(Builtin::http_headers, TextMapExtractAdapter{carrier}));
        REQUIRE(extracted->baggage_item("User Id") == "42");
        REQUIRE(extracted->baggage().size() == 1);
    }

    SECTION("header names folded to lower case still round trip") {
        Headers folded;
        for (const auto& [key, value] : carrier) {
            std::string lower_key;
            for (char c : key) {
                lower_key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            }
            folded.emplace(lower_key, value);
        }
        auto extracted = as_log_context(tracer.extract(Builtin::http_headers, TextMapExtractAdapter{folded}));
        REQUIRE(extracted->baggage_item("User Id") == "42");
    }

    SECTION("text maps keep keys verbatim") {
        Headers plain;
        TextMapInjectAdapter plain_writer{plain};
        tracer.inject(*span->context(), Builtin::text_map, plain_writer);
        REQUIRE(plain.count("baggage-User Id") == 1);

        auto extracted = as_log_context(tracer.extract(Builtin::text_map, TextMapExtractAdapter{plain}));
        REQUIRE(extracted->baggage_item("User Id") == "42");
    }
}

TEST_CASE("Binary propagation round trip", "[propagation]") {
    LogTracer tracer{{}, tracelink::testing::quiet_logger()};
    auto span = tracer.build_span("producer")->start();
    span->set_baggage_item("tenant", "acme");
    auto original = as_log_context(span->context());

    BinaryCarrier carrier{0xff, 0xff};
    tracer.inject(*span->context(), Builtin::binary, carrier);
    REQUIRE(carrier.front() == LogTracer::binary_version);
    // version + two ids + count + one entry of "tenant" and "acme"
    REQUIRE(carrier.size() == 1 + 8 + 8 + 4 + (4 + 6) + (4 + 4));

    auto extracted = as_log_context(tracer.extract(Builtin::binary, carrier));
    REQUIRE(extracted->trace_id() == original->trace_id());
    REQUIRE(extracted->span_id() == original->span_id());
    REQUIRE(extracted->baggage() == original->baggage());

    SECTION("unknown version") {
        carrier[0] = 2;
        REQUIRE_THROWS_AS(tracer.extract(Builtin::binary, carrier), std::invalid_argument);
    }

    SECTION("truncated") {
        carrier.pop_back();
        REQUIRE_THROWS_AS(tracer.extract(Builtin::binary, carrier), std::invalid_argument);
        carrier.resize(5);
        REQUIRE_THROWS_AS(tracer.extract(Builtin::binary, carrier), std::invalid_argument);
    }

    SECTION("trailing bytes") {
        carrier.push_back(0);
        REQUIRE_THROWS_AS(tracer.extract(Builtin::binary, carrier), std::invalid_argument);
    }

    SECTION("absurd baggage count") {
        carrier[17] = 0xff;
        REQUIRE_THROWS_AS(tracer.extract(Builtin::binary, carrier), std::invalid_argument);
    }
}

TEST_CASE("Carriers without a context extract to nothing", "[propagation]") {
    LogTracer tracer{{}, tracelink::testing::quiet_logger()};

    Headers empty;
    REQUIRE(tracer.extract(Builtin::text_map, TextMapExtractAdapter{empty}) == nullptr);

    Headers unrelated{{"content-type", "text/plain"}, {"baggage-user", "alice"}};
    REQUIRE(tracer.extract(Builtin::http_headers, TextMapExtractAdapter{unrelated}) == nullptr);

    REQUIRE(tracer.extract(Builtin::binary, BinaryCarrier{}) == nullptr);
}

TEST_CASE("Corrupt text contexts are rejected", "[propagation]") {
    LogTracer tracer{{}, tracelink::testing::quiet_logger()};

    auto extract = [&](const Headers& headers) {
        return tracer.extract(Builtin::text_map, TextMapExtractAdapter{headers});
    };

    REQUIRE_THROWS_AS(extract({{"trace-id", "42"}}), std::invalid_argument);
    REQUIRE_THROWS_AS(extract({{"span-id", "7"}}), std::invalid_argument);
    REQUIRE_THROWS_AS(extract({{"trace-id", "xyz"}, {"span-id", "7"}}), std::invalid_argument);
    REQUIRE_THROWS_AS(extract({{"trace-id", "42"}, {"span-id", ""}}), std::invalid_argument);
    REQUIRE_THROWS_AS(extract({{"trace-id", "0"}, {"span-id", "7"}}), std::invalid_argument);
    REQUIRE_THROWS_AS(extract({{"trace-id", "10000000000000000"}, {"span-id", "7"}}), std::invalid_argument);
}

TEST_CASE("Extracted contexts parent new spans", "[propagation]") {
    LogTracer tracer{{}, tracelink::testing::quiet_logger()};

    Headers incoming{{"trace-id", "42"}, {"span-id", "7"}, {"baggage-tenant", "acme"}};
    auto parent = as_log_context(tracer.extract(Builtin::text_map, TextMapExtractAdapter{incoming}));
    REQUIRE(parent->trace_id() == 0x42);
    REQUIRE(parent->span_id() == 0x7);

    auto span = std::dynamic_pointer_cast<LogSpan>(tracer.build_span("server")->as_child_of(parent).start());
    REQUIRE(span != nullptr);
    REQUIRE(as_log_context(span->context())->trace_id() == 0x42);
    REQUIRE(span->parent_id() == 0x7);
    REQUIRE(span->baggage_item("tenant") == "acme");

    Headers outgoing;
    TextMapInjectAdapter writer{outgoing};
    tracer.inject(*span->context(), Builtin::text_map, writer);
    REQUIRE(outgoing.at("trace-id") == "0000000000000042");
}

TEST_CASE("Foreign contexts are not injected", "[propagation]") {
    LogTracer tracer{{}, tracelink::testing::quiet_logger()};
    tracelink::testing::StaticSpanContext foreign{Headers{{"user", "alice"}}};

    Headers carrier;
    TextMapInjectAdapter writer{carrier};
    tracer.inject(foreign, Builtin::text_map, writer);
    REQUIRE(carrier.empty());

    BinaryCarrier bytes{1, 2, 3};
    tracer.inject(foreign, Builtin::binary, bytes);
    REQUIRE(bytes == BinaryCarrier{1, 2, 3});
}
