/**
 * @file test_scoped_span.cpp
 * @brief Unit tests for the ScopedSpan RAII handle.
 */

#include "core/logger.hpp"
#include "telemetry/observability_client.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <utility>

using namespace telemetry_hub;

namespace {

/// Sink whose writes always fail; NonStd selects a non-std::exception payload.
template <bool NonStd>
class FailingSink : public ILogSink {
public:
    void write(std::string_view) override {
        if constexpr (NonStd) {
            throw 42;
        } else {
            throw std::runtime_error("disk full");
        }
    }
    void flush() override {}
};

template <bool NonStd>
ObservabilityClient::Options failing_logger_options() {
    return ObservabilityClient::Options{
        .logger = std::make_shared<Logger>(std::make_unique<FailingSink<NonStd>>(),
                                           LogLevel::Error)};
}

}  // namespace

TEST(ScopedSpanTest, CompletesOnScopeExit) {
    ObservabilityClient client;
    {
        auto scope = client.span("render", {{"page", "home"}});
        EXPECT_EQ(client.active_span_count(), 1u);
        scope.add_tag("widgets", 4);
    }
    EXPECT_EQ(client.active_span_count(), 0u);

    auto spans = client.get_completed_spans();
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].name, "render");
    EXPECT_EQ(spans[0].status, "ok");
    EXPECT_EQ(spans[0].tags.at("page"), "home");
    EXPECT_EQ(spans[0].tags.at("widgets"), "4");
}

TEST(ScopedSpanTest, KeepsLastStatusSet) {
    ObservabilityClient client;
    {
        auto scope = client.span("render");
        scope.set_status("Cancelled");
    }
    auto spans = client.get_completed_spans();
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].status, "cancelled");
}

TEST(ScopedSpanTest, ExceptionMarksSpanAsError) {
    ObservabilityClient client;
    try {
        auto scope = client.span("risky");
        throw std::runtime_error("kaboom");
    } catch (const std::runtime_error&) {
    }

    auto spans = client.get_completed_spans();
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].status, "error");
    EXPECT_EQ(spans[0].error, "unhandled exception");
}

TEST(ScopedSpanTest, RecordedExceptionTextIsUsed) {
    ObservabilityClient client;
    try {
        auto scope = client.span("risky");
        try {
            throw std::invalid_argument("bad input");
        } catch (const std::exception& e) {
            scope.record_exception(e.what());
            throw;
        }
    } catch (const std::invalid_argument&) {
    }

    auto spans = client.get_completed_spans();
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].status, "error");
    EXPECT_EQ(spans[0].error, "bad input");
}

TEST(ScopedSpanTest, ExplicitFinishCompletesOnce) {
    ObservabilityClient client;
    {
        auto scope = client.span("manual");
        auto record = scope.finish();
        ASSERT_TRUE(record.has_value());
        EXPECT_EQ(record->name, "manual");
        EXPECT_FALSE(scope.finish().has_value());
    }
    EXPECT_EQ(client.get_completed_spans().size(), 1u);
}

TEST(ScopedSpanTest, MovedFromHandleDoesNotComplete) {
    ObservabilityClient client;
    {
        auto outer = client.span("moved");
        auto id = outer.span_id();
        {
            ScopedSpan inner = std::move(outer);
            EXPECT_EQ(inner.span_id(), id);
        }
        EXPECT_EQ(client.get_completed_spans().size(), 1u);
    }
    EXPECT_EQ(client.get_completed_spans().size(), 1u);
}

TEST(ScopedSpanTest, NestedSpansCompleteInnerFirst) {
    ObservabilityClient client;
    {
        auto outer = client.span("outer");
        {
            auto inner = client.span("inner");
        }
    }
    auto spans = client.get_completed_spans();
    ASSERT_EQ(spans.size(), 2u);
    EXPECT_EQ(spans[0].name, "inner");
    EXPECT_EQ(spans[1].name, "outer");
}

TEST(ScopedSpanTest, HandledExceptionLeavesSpanClean) {
    ObservabilityClient client;
    {
        auto scope = client.span("recovering");
        try {
            throw std::runtime_error("handled");
        } catch (const std::exception& e) {
            scope.record_exception(e.what());
        }
    }

    auto spans = client.get_completed_spans();
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].status, "ok");
    EXPECT_FALSE(spans[0].error.has_value());
}

// ═══════════════════════════════════════════════
// Failing log sink during completion
// ═══════════════════════════════════════════════

TEST(ScopedSpanTest, FailingSinkDoesNotEscapeDestructor) {
    ObservabilityClient client(failing_logger_options<false>());
    EXPECT_THROW({
        auto scope = client.span("unwinding");
        throw std::logic_error("original");
    }, std::logic_error);

    EXPECT_EQ(client.active_span_count(), 0u);
    ASSERT_EQ(client.get_completed_spans().size(), 1u);
    EXPECT_EQ(client.get_completed_spans()[0].status, "error");
}

TEST(ScopedSpanTest, NonStandardSinkFailureDoesNotEscapeDestructor) {
    ObservabilityClient client(failing_logger_options<true>());
    EXPECT_THROW({
        auto scope = client.span("unwinding");
        scope.record_exception("original");
        throw std::logic_error("original");
    }, std::logic_error);

    EXPECT_EQ(client.active_span_count(), 0u);
    ASSERT_EQ(client.get_completed_spans().size(), 1u);
    EXPECT_EQ(client.get_completed_spans()[0].error, "original");
}
