#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>

#include "test_support.hpp"
#include "tracelink/core/log_fields.hpp"
#include "tracelink/core/observability/log_tracer.hpp"
#include "tracelink/core/tags.hpp"

using namespace tracelink::core;
using namespace tracelink::core::observability;
using Catch::Matchers::ContainsSubstring;

namespace {

std::shared_ptr<LogSpan> as_log_span(const SpanPtr& span) {
    auto log_span = std::dynamic_pointer_cast<LogSpan>(span);
    REQUIRE(log_span != nullptr);
    return log_span;
}

std::shared_ptr<const LogSpanContext> as_log_context(const SpanContextPtr& context) {
    auto log_context = std::dynamic_pointer_cast<const LogSpanContext>(context);
    REQUIRE(log_context != nullptr);
    return log_context;
}

}  // namespace

TEST_CASE("Root spans start a new trace", "[log_tracer]") {
    LogTracer tracer{{"checkout"}, tracelink::testing::quiet_logger()};

    auto first = as_log_span(tracer.build_span("a")->start());
    auto second = as_log_span(tracer.build_span("b")->start());

    auto first_context = as_log_context(first->context());
    auto second_context = as_log_context(second->context());
    REQUIRE(first_context->trace_id() != 0);
    REQUIRE(first_context->span_id() != 0);
    REQUIRE(first_context->trace_id() != second_context->trace_id());
    REQUIRE(first->parent_id() == 0);
    REQUIRE(first->references().empty());
    REQUIRE(first->operation_name() == "a");
}

TEST_CASE("Explicit parents are honoured", "[log_tracer]") {
    LogTracer tracer{{}, tracelink::testing::quiet_logger()};
    auto parent = tracer.build_span("parent")->start();
    auto parent_context = as_log_context(parent->context());

    SECTION("as_child_of a span") {
        auto child = as_log_span(tracer.build_span("child")->as_child_of(parent).start());
        auto child_context = as_log_context(child->context());
        REQUIRE(child_context->trace_id() == parent_context->trace_id());
        REQUIRE(child_context->span_id() != parent_context->span_id());
        REQUIRE(child->parent_id() == parent_context->span_id());
        REQUIRE(child->references().size() == 1);
        REQUIRE(child->references()[0].type == ReferenceType::child_of);
    }

    SECTION("follows_from keeps the trace") {
        auto next = as_log_span(
            tracer.build_span("next")->add_reference(ReferenceType::follows_from, parent->context()).start());
        REQUIRE(as_log_context(next->context())->trace_id() == parent_context->trace_id());
        REQUIRE(next->parent_id() == parent_context->span_id());
    }

    SECTION("child_of wins over an earlier follows_from") {
        auto other = tracer.build_span("other")->start();
        auto span = as_log_span(tracer.build_span("mixed")
                                    ->add_reference(ReferenceType::follows_from, other->context())
                                    .as_child_of(parent)
                                    .start());
        REQUIRE(span->parent_id() == parent_context->span_id());
        REQUIRE(span->references().size() == 2);
    }

    SECTION("null parents are ignored") {
        auto span = as_log_span(tracer.build_span("orphan")->as_child_of(SpanPtr{}).start());
        REQUIRE(span->references().empty());
        REQUIRE(span->parent_id() == 0);
    }

    SECTION("foreign contexts carry baggage but no identity") {
        auto foreign = std::make_shared<tracelink::testing::StaticSpanContext>(
            std::unordered_map<std::string, std::string>{{"tenant", "acme"}});
        auto span = as_log_span(tracer.build_span("foreign")->as_child_of(foreign).start());
        REQUIRE(span->parent_id() == 0);
        REQUIRE(span->baggage_item("tenant") == "acme");
    }
}

TEST_CASE("The active span is the implicit parent", "[log_tracer]") {
    LogTracer tracer{{}, tracelink::testing::quiet_logger()};

    auto outer = tracer.build_span("outer")->start_active(true);
    REQUIRE(tracer.active_span() == outer->span());
    auto outer_id = as_log_context(outer->span()->context())->span_id();

    SECTION("implicit child") {
        auto inner = as_log_span(tracer.build_span("inner")->start());
        REQUIRE(inner->parent_id() == outer_id);
    }

    SECTION("ignore_active_span starts a new trace") {
        auto detached = as_log_span(tracer.build_span("detached")->ignore_active_span().start());
        REQUIRE(detached->parent_id() == 0);
        REQUIRE(as_log_context(detached->context())->trace_id() !=
                as_log_context(outer->span()->context())->trace_id());
    }

    SECTION("explicit reference replaces the active span") {
        auto other = tracer.build_span("other")->ignore_active_span().start();
        auto span = as_log_span(tracer.build_span("explicit")->as_child_of(other).start());
        REQUIRE(span->parent_id() == as_log_context(other->context())->span_id());
    }

    SECTION("nested activation and close") {
        {
            auto inner = tracer.build_span("inner")->start_active(true);
            REQUIRE(as_log_span(inner->span())->parent_id() == outer_id);
            REQUIRE(tracer.active_span() == inner->span());
        }
        REQUIRE(tracer.active_span() == outer->span());
    }

    auto outer_span = as_log_span(outer->span());
    outer->close();
    REQUIRE(tracer.active_span() == nullptr);
    REQUIRE(outer_span->finished());
}

TEST_CASE("Baggage flows to children", "[log_tracer]") {
    LogTracer tracer{{}, tracelink::testing::quiet_logger()};

    auto root = tracer.build_span("root")->start();
    root->set_baggage_item("user", "alice");
    REQUIRE(root->baggage_item("user") == "alice");
    REQUIRE_FALSE(root->baggage_item("missing").has_value());

    auto child = tracer.build_span("child")->as_child_of(root).start();
    REQUIRE(child->baggage_item("user") == "alice");

    child->set_baggage_item("user", "bob");
    REQUIRE(child->baggage_item("user") == "bob");
    REQUIRE(root->baggage_item("user") == "alice");
}

TEST_CASE("Tags and logs are recorded", "[log_tracer]") {
    LogTracer tracer{{}, tracelink::testing::quiet_logger()};

    auto span = as_log_span(tracer.build_span("db")
                                ->with_tag("component", Value{std::string{"postgres"}})
                                .with_tag("retries", Value{std::int64_t{1}})
                                .start());
    span->set_tag("retries", Value{std::int64_t{2}});
    tag::error.set(*span, true);
    tag::http_status.set(*span, 503);
    tag::peer_host_ipv4.set(*span, std::string{"10.0.0.1"});
    tag::span_kind.set(*span, std::string{tag::span_kind_client});

    REQUIRE(span->tag("component") == Value{std::string{"postgres"}});
    REQUIRE(span->tag("retries") == Value{std::int64_t{2}});
    REQUIRE(span->tag("error") == Value{true});
    REQUIRE(span->tag("http.status_code") == Value{std::int64_t{503}});
    REQUIRE(span->tag("peer.ipv4") == Value{std::string{"10.0.0.1"}});
    REQUIRE(span->tag("span.kind") == Value{std::string{"client"}});
    REQUIRE_FALSE(span->tag("missing").has_value());

    span->log("cache miss");
    span->log(LogFields{{std::string{log_fields::error_kind}, Value{std::string{"timeout"}}}});
    auto logs = span->logs();
    REQUIRE(logs.size() == 2);
    REQUIRE(logs[0].fields.at(std::string{log_fields::event}) == Value{std::string{"cache miss"}});
    REQUIRE(logs[1].fields.count(std::string{log_fields::error_kind}) == 1);

    span->set_operation_name("db.query");
    REQUIRE(span->operation_name() == "db.query");
}

TEST_CASE("Spans finish once with the given timestamps", "[log_tracer]") {
    LogTracer tracer{{}, tracelink::testing::quiet_logger()};

    auto start = std::chrono::system_clock::now() - std::chrono::seconds(5);
    auto span = as_log_span(tracer.build_span("timed")->with_start_timestamp(start).start());
    REQUIRE(span->start_time() == start);
    REQUIRE_FALSE(span->finished());

    auto end = start + std::chrono::milliseconds(250);
    span->finish(end);
    span->finish();
    REQUIRE(span->finished());
    REQUIRE(span->finish_time() == end);
}

TEST_CASE("Finished spans are reported to the logger", "[log_tracer]") {
    using namespace tracelink::core::logging;

    auto path = std::filesystem::temp_directory_path() / "tracelink_log_tracer_test.log";
    std::filesystem::remove(path);

    LogConfig config;
    config.pattern = "%v";
    SinkConfig file_sink;
    file_sink.type = SinkType::File;
    file_sink.path = path;
    config.sinks.push_back(file_sink);
    auto logger = create_logger("spans", config);

    LogTracer tracer{{"orders", Level::info}, logger};
    auto span = tracer.build_span("place-order")->with_tag("items", Value{std::int64_t{3}}).start();
    auto start = as_log_span(span)->start_time();
    span->finish(start + std::chrono::microseconds(1500));
    span->finish();
    logger->flush();

    std::ifstream input{path};
    std::stringstream contents;
    contents << input.rdbuf();
    auto text = contents.str();

    REQUIRE_THAT(text, ContainsSubstring("service=orders operation=place-order"));
    REQUIRE_THAT(text, ContainsSubstring("duration_us=1500 tags=[items=3] logs=0"));
    REQUIRE(text.find("span finished") == text.rfind("span finished"));

    input.close();
    std::filesystem::remove(path);
}

TEST_CASE("LogTracer construction", "[log_tracer]") {
    REQUIRE_THROWS_AS(LogTracer({}, nullptr), std::invalid_argument);

    LogTracer tracer{{"billing"}, tracelink::testing::quiet_logger()};
    REQUIRE(tracer.to_string() == "LogTracer{service=billing}");
    REQUIRE(tracer.options().report_level == logging::Level::info);
}

TEST_CASE("Generated ids are never zero", "[log_tracer]") {
    for (int i = 0; i < 1000; ++i) {
        REQUIRE(generate_id() != 0);
    }
}
