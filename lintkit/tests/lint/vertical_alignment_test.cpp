//! # Vertical Parameter Alignment Tests
//!
//! Runs the rule's documented examples, then the edge cases around closure
//! realignment, trailing closures and unresolvable offsets.

#include "lint/vertical_alignment.hpp"

#include "call_fixture.hpp"

#include "log/log.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <thread>
#include <vector>

using namespace lintkit;
using namespace lintkit::lint;
using lintkit::lint::test_support::CallFixture;

namespace {

const std::vector<std::string>& non_triggering() {
    return VerticalParameterAlignmentOnCallRule::rule_description().non_triggering_examples;
}

const std::vector<std::string>& triggering() {
    return VerticalParameterAlignmentOnCallRule::rule_description().triggering_examples;
}

} // namespace

// ============================================================================
// Documented Examples
// ============================================================================

TEST(VerticalAlignmentExamples, DescriptionListsExamples) {
    const auto& description = VerticalParameterAlignmentOnCallRule::rule_description();
    EXPECT_EQ(description.identifier, "vertical_parameter_alignment_on_call");
    ASSERT_EQ(non_triggering().size(), 8u);
    ASSERT_EQ(triggering().size(), 6u);
    for (const auto& example : triggering()) {
        EXPECT_NE(example.find(lint::test_support::VIOLATION_MARKER), std::string::npos) << example;
    }
}

TEST(VerticalAlignmentExamples, SameColumnOnNextLine) {
    CallFixture fx(non_triggering()[0]);
    fx.arg("param1:", "1").arg("param2:", "bar").arg("param3:", "false").arg("param4:", "true");
    EXPECT_TRUE(fx.check().empty());
}

TEST(VerticalAlignmentExamples, SingleLine) {
    CallFixture fx(non_triggering()[1]);
    fx.arg("param1:", "1").arg("param2:", "bar");
    EXPECT_TRUE(fx.check().empty());
}

TEST(VerticalAlignmentExamples, OneArgumentPerLine) {
    CallFixture fx(non_triggering()[2]);
    fx.arg("param1:", "1").arg("param2:", "bar").arg("param3:", "false").arg("param4:", "true");
    EXPECT_TRUE(fx.check().empty());
}

TEST(VerticalAlignmentExamples, TrailingClosureAfterParenthesis) {
    CallFixture fx(non_triggering()[3]);
    fx.arg("param1:", "1").closure("{");
    EXPECT_TRUE(fx.check().empty());
}

TEST(VerticalAlignmentExamples, ClosureFollowedOnClosingLine) {
    CallFixture fx(non_triggering()[4]);
    fx.arg("withDuration:", "0.4").closure("animations:").closure("completion:");
    EXPECT_TRUE(fx.check().empty());
}

TEST(VerticalAlignmentExamples, ClosureFollowedOnOwnLine) {
    CallFixture fx(non_triggering()[5]);
    fx.arg("withDuration:", "0.4").closure("animations:").closure("completion:");
    EXPECT_TRUE(fx.check().empty());
}

TEST(VerticalAlignmentExamples, SingleLineClosureThenAligned) {
    CallFixture fx(non_triggering()[6]);
    fx.arg("param1:", "1").closure("param2:").arg("param3:", "false").arg("param4:", "true");
    EXPECT_TRUE(fx.check().empty());
}

TEST(VerticalAlignmentExamples, FirstArgumentMultilineClosure) {
    CallFixture fx(non_triggering()[7]);
    fx.closure("{").closure("completion:");
    EXPECT_TRUE(fx.check().empty());
}

TEST(VerticalAlignmentExamples, IndentedTooFar) {
    CallFixture fx(triggering()[0]);
    fx.arg("param1:", "1").arg("param2:", "bar").arg("param3:", "false").arg("param4:", "true");
    ASSERT_EQ(fx.expected().size(), 1u);
    EXPECT_EQ(fx.check(), fx.expected());
}

TEST(VerticalAlignmentExamples, IndentedTooLittle) {
    CallFixture fx(triggering()[1]);
    fx.arg("param1:", "1").arg("param2:", "bar").arg("param3:", "false").arg("param4:", "true");
    EXPECT_EQ(fx.check(), fx.expected());
}

TEST(VerticalAlignmentExamples, EveryMisalignedLineReported) {
    CallFixture fx(triggering()[2]);
    fx.arg("param1:", "1").arg("param2:", "bar").arg("param3:", "false").arg("param4:", "true");
    ASSERT_EQ(fx.expected().size(), 2u);
    EXPECT_EQ(fx.check(), fx.expected());
}

TEST(VerticalAlignmentExamples, MisalignedClosureInsideParentheses) {
    CallFixture fx(triggering()[3]);
    fx.arg("param1:", "1").closure("param2:");
    EXPECT_EQ(fx.check(), fx.expected());
}

TEST(VerticalAlignmentExamples, RealignmentAppliesOnce) {
    CallFixture fx(triggering()[4]);
    fx.arg("param1:", "1").closure("param2:").arg("param3:", "2").arg("param4:", "0");
    EXPECT_EQ(fx.check(), fx.expected());
}

TEST(VerticalAlignmentExamples, SingleLineClosureDoesNotRealign) {
    CallFixture fx(triggering()[5]);
    fx.arg("param1:", "1").closure("param2:").arg("param3:", "false").arg("param4:", "true");
    EXPECT_EQ(fx.check(), fx.expected());
}

// ============================================================================
// Edge Cases
// ============================================================================

TEST(VerticalAlignmentTest, SingleArgumentNeverMisaligned) {
    CallFixture fx("foo(\n      param1: 1)");
    fx.arg("param1:", "1");
    EXPECT_TRUE(fx.check().empty());
}

TEST(VerticalAlignmentTest, NoArguments) {
    CallFixture fx("foo()");
    EXPECT_TRUE(fx.check().empty());
}

TEST(VerticalAlignmentTest, SameLineArgumentsNeverFlagged) {
    CallFixture fx("foo(a: 1, b: 2,   c: 3, d: { _ in })");
    fx.arg("a:", "1").arg("b:", "2").arg("c:", "3").closure("d:");
    EXPECT_TRUE(fx.check().empty());
}

TEST(VerticalAlignmentTest, MisalignedTrailingClosureOnOwnLine) {
    CallFixture fx("foo(param1: 1,\n    param2: 2)\n{ _ in }");
    fx.arg("param1:", "1").arg("param2:", "2").closure("{");
    EXPECT_TRUE(fx.check().empty());
}

TEST(VerticalAlignmentTest, LastClosureInsideParenthesesIsJudged) {
    CallFixture fx("foo(param1: 1,\n  ↓{ _ in })");
    fx.arg("param1:", "1").closure("{");
    EXPECT_EQ(fx.check(), fx.expected());
}

TEST(VerticalAlignmentTest, TrailingExemptionOnlyForLastArgument) {
    CallFixture fx("foo(param1: 1,\n ↓{ _ in },\n    param3: 2) { }");
    fx.arg("param1:", "1").closure("{").arg("param3:", "2").closure("{");
    ASSERT_EQ(fx.expected().size(), 1u);
    EXPECT_EQ(fx.check(), fx.expected());
}

TEST(VerticalAlignmentTest, TrailingClosureNeedsClosureArgument) {
    // The call text does not end with ')' but the last argument is no closure.
    CallFixture fx("foo(param1: 1,\n  ↓param2: 2) // done");
    fx.arg("param1:", "1").arg("param2:", "2");
    EXPECT_EQ(fx.check(), fx.expected());
}

TEST(VerticalAlignmentTest, MultilineClosureMovesReference) {
    CallFixture fx("foo(param1: 1, param2: {\n    bar()\n},\n  param3: 2,\n  param4: 3)");
    fx.arg("param1:", "1").closure("param2:").arg("param3:", "2").arg("param4:", "3");
    EXPECT_TRUE(fx.check().empty());
}

TEST(VerticalAlignmentTest, FormerReferenceColumnMisalignedAfterMove) {
    CallFixture fx("foo(param1: 1, param2: {\n    bar()\n},\n  param3: 2,\n    ↓param4: 3)");
    fx.arg("param1:", "1").closure("param2:").arg("param3:", "2").arg("param4:", "3");
    EXPECT_EQ(fx.check(), fx.expected());
}

TEST(VerticalAlignmentTest, AlignedMultilineClosureStillMovesReference) {
    CallFixture fx("foo(param1: 1,\n    param2: {\n    },\n  param3: 2)");
    fx.arg("param1:", "1").closure("param2:").arg("param3:", "2");
    EXPECT_TRUE(fx.check().empty());
}

TEST(VerticalAlignmentTest, ArgumentsWithoutBodiesAreNotClosures) {
    CallFixture fx("foo(param1: 1, param2: {\n},\n  ↓param3: 2)");
    fx.arg("param1:").arg("param2:").arg("param3:");
    EXPECT_EQ(fx.check(), fx.expected());
}

TEST(VerticalAlignmentTest, ColumnsCountCharactersNotBytes) {
    CallFixture fx("\xC3\xA9(x: 1,\n  y: 2)");
    fx.arg("x:", "1").arg("y:", "2");
    EXPECT_TRUE(fx.check().empty());
}

TEST(VerticalAlignmentTest, UnresolvableArgumentSkipped) {
    auto file = source::SourceFile::from_string("foo(a: 1,\n b: 2)");
    Call call{.kind = ExpressionKind::Call, .offset = 0, .length = file.length()};
    call.arguments.push_back({.offset = 4, .body = std::nullopt});
    call.arguments.push_back({.offset = 500, .body = std::nullopt});

    EXPECT_TRUE(check_call_alignment(call, file).empty());
}

TEST(VerticalAlignmentTest, UnresolvableFirstArgument) {
    auto file = source::SourceFile::from_string("foo(a: 1,\n b: 2)");
    Call call{.kind = ExpressionKind::Call, .offset = 0, .length = file.length()};
    call.arguments.push_back({.offset = 500, .body = std::nullopt});
    call.arguments.push_back({.offset = 11, .body = std::nullopt});

    EXPECT_TRUE(check_call_alignment(call, file).empty());
}

// ============================================================================
// Concurrency
// ============================================================================

namespace {

// Counts records; the logger serializes writes.
class CountingSink : public log::LogSink {
public:
    explicit CountingSink(size_t& count) : count_(count) {}
    void write(const log::LogRecord& /*record*/) override {
        ++count_;
    }

private:
    size_t& count_;
};

} // namespace

TEST(VerticalAlignmentTest, ParallelChecksMatchSerial) {
    CallFixture fx("foo(param1: 1, param2: bar\n"
                   "    param3: false, param4: true)\n"
                   "foo(param1: 1, param2: bar\n"
                   " \xE2\x86\x93param3: false, param4: true)\n"
                   "foo(param1: 1,\n"
                   "    param2: { _ in\n"
                   "}, param3: 2,\n"
                   " \xE2\x86\x93param4: 0)\n"
                   "foo(\n"
                   "   param1: 1\n"
                   ") { _ in }");
    fx.arg("param1:", "1").arg("param2:", "bar").arg("param3:", "false").arg("param4:", "true");
    fx.next_call("foo(");
    fx.arg("param1:", "1").arg("param2:", "bar").arg("param3:", "false").arg("param4:", "true");
    fx.next_call("foo(");
    fx.arg("param1:", "1").closure("param2:").arg("param3:", "2").arg("param4:", "0");
    fx.next_call("foo(");
    fx.arg("param1:", "1").closure("{");

    const auto calls = fx.calls();
    ASSERT_EQ(calls.size(), 4u);

    std::vector<std::vector<size_t>> serial;
    std::vector<size_t> all_flagged;
    for (const auto& call : calls) {
        serial.push_back(check_call_alignment(call, fx.file()));
        all_flagged.insert(all_flagged.end(), serial.back().begin(), serial.back().end());
    }
    ASSERT_EQ(all_flagged, fx.expected());

    // Trace output for "lint" runs alongside: the third call realigns once per check.
    size_t realignments = 0;
    auto& logger = log::Logger::instance();
    logger.reset();
    logger.clear_sinks();
    logger.add_sink(std::make_unique<CountingSink>(realignments));
    logger.set_module_level("lint", log::LogLevel::Trace);

    constexpr size_t threads = 8;
    constexpr size_t rounds = 50;
    std::vector<std::vector<std::vector<size_t>>> results(threads);

    std::vector<std::thread> workers;
    for (size_t t = 0; t < threads; ++t) {
        workers.emplace_back([&, t] {
            for (size_t round = 0; round < rounds; ++round) {
                for (const auto& call : calls) {
                    results[t].push_back(check_call_alignment(call, fx.file()));
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    logger.reset();

    for (size_t t = 0; t < threads; ++t) {
        ASSERT_EQ(results[t].size(), rounds * calls.size());
        for (size_t i = 0; i < results[t].size(); ++i) {
            EXPECT_EQ(results[t][i], serial[i % calls.size()]) << "thread " << t << " check " << i;
        }
    }
    EXPECT_EQ(realignments, threads * rounds);
}
