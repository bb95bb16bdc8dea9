/**
 * @file test_mapping.cpp
 * @brief Tests for mapping execution using Google Test
 */

#include <gtest/gtest.h>
#include "jtl/Errors.hpp"
#include "jtl/Jq.hpp"
#include "jtl/Mapping.hpp"

#include <stdexcept>

using namespace jtl;

namespace {

Mapping make_mapping(const std::string& src, const std::string& dst,
                     std::optional<Mode> mode = std::nullopt) {
    Mapping m;
    m.source = src;
    m.destination = dst;
    m.mode = mode;
    return m;
}

/**
 * @brief Evaluator returning fixed results and remembering its inputs
 */
class RecordingEvaluator : public Evaluator {
public:
    explicit RecordingEvaluator(std::vector<Value> results)
        : results_(std::move(results))
    {}

    std::vector<Value> evaluate(const std::string& program,
                                const Value& document,
                                const Bindings& variables) const override {
        last_program = program;
        last_document = document;
        last_variables = variables;
        return results_;
    }

    mutable std::string last_program;
    mutable Value last_document;
    mutable Bindings last_variables;

private:
    std::vector<Value> results_;
};

class ThrowingEvaluator : public Evaluator {
public:
    std::vector<Value> evaluate(const std::string&, const Value&, const Bindings&) const override {
        throw std::runtime_error("backend exploded");
    }
};

class MappingTest : public ::testing::Test {
protected:
    JqEvaluator evaluator;
    MappingExecutor executor{evaluator};

    void apply(const Mapping& m, const Value& source, Value& dest,
               const Value& ctx = Value::object(), const std::string& prelude = "") {
        executor.apply(m, source, ctx, prelude, dest, "\n");
    }
};

} // namespace

// ============================================================================
// Reference scenarios
// ============================================================================

TEST_F(MappingTest, UpsertConcatenatesOntoExistingString) {
    Value source = {{"a", "src1"}, {"b", "src2"}};
    Value dest = {{"t", "existingvalue"}};

    EtlSpec spec;
    spec.mappings = {make_mapping(".a", ".t"), make_mapping(".b", ".t")};
    executor.run(spec, source, dest, "\n");

    EXPECT_EQ(dest["t"], "existingvalue\nsrc1\nsrc2");
}

TEST_F(MappingTest, ReplaceCollectsMultipleResultsIntoArray) {
    Value source = Value::parse(R"({"arr": [1, 2, 3]})");
    Value dest = Value::object();
    apply(make_mapping(".arr[]", ".nums", Mode::Replace), source, dest);
    EXPECT_EQ(dest, Value::parse(R"({"nums": [1, 2, 3]})"));
}

TEST_F(MappingTest, MissingContainersCreatedAlongPath) {
    Value source = {{"val", "hello"}};
    Value dest = Value::object();
    apply(make_mapping(".val", ".a.b[2].c"), source, dest);
    EXPECT_EQ(dest, Value::parse(R"({"a": {"b": [null, null, {"c": "hello"}]}})"));
}

TEST_F(MappingTest, UpsertDeepMergesObjects) {
    Value source = Value::parse(R"({"u": {"x": 1}, "v": {"y": 2}})");
    Value dest = Value::parse(R"({"t": {"x": 0, "z": 9}})");

    EtlSpec spec;
    spec.mappings = {make_mapping(".u", ".t"), make_mapping(".v", ".t")};
    executor.run(spec, source, dest, "\n");

    EXPECT_EQ(dest["t"], Value::parse(R"({"x": 1, "z": 9, "y": 2})"));
}

TEST_F(MappingTest, ReplaceOfAbsentFieldWritesNull) {
    Value source = {{"a", 1}};
    Value dest = {{"t", "old"}};
    apply(make_mapping(".b", ".t", Mode::Replace), source, dest);
    ASSERT_TRUE(dest.contains("t"));
    EXPECT_TRUE(dest["t"].is_null());
}

// ============================================================================
// Replace
// ============================================================================

TEST_F(MappingTest, ReplaceWithNoResultsWritesNull) {
    Value source = Value::parse(R"({"xs": []})");
    Value dest = {{"t", 5}};
    apply(make_mapping(".xs[]", ".t", Mode::Replace), source, dest);
    EXPECT_TRUE(dest["t"].is_null());
}

TEST_F(MappingTest, ReplaceIsIdempotent) {
    Value source = Value::parse(R"({"xs": [1, 2]})");
    Value dest = {{"t", "old"}};
    const Mapping m = make_mapping(".xs", ".t", Mode::Replace);

    apply(m, source, dest);
    const Value once = dest;
    apply(m, source, dest);
    EXPECT_EQ(dest, once);
}

TEST_F(MappingTest, ReplaceAtRootSwapsWholeDocument) {
    Value source = {{"inner", {{"k", 1}}}};
    Value dest = {{"stale", true}};
    apply(make_mapping(".inner", ".", Mode::Replace), source, dest);
    EXPECT_EQ(dest, (Value{{"k", 1}}));
}

// ============================================================================
// Upsert
// ============================================================================

TEST_F(MappingTest, UpsertNoResultsLeavesDestinationUntouched) {
    Value source = Value::parse(R"({"xs": []})");
    Value dest = Value::object();
    apply(make_mapping(".xs[]", ".a.b"), source, dest);
    EXPECT_EQ(dest, Value::object());
}

TEST_F(MappingTest, UpsertAppliesEachResultInOrder) {
    Value source = Value::parse(R"({"xs": ["a", "b", "c"]})");
    Value dest = Value::object();
    apply(make_mapping(".xs[]", ".joined"), source, dest);
    EXPECT_EQ(dest["joined"], "a\nb\nc");
}

TEST_F(MappingTest, UpsertExtendsExistingArray) {
    Value source = Value::parse(R"({"more": [3, 4], "one": 5})");
    Value dest = Value::parse(R"({"list": [1, 2]})");
    apply(make_mapping(".more", ".list"), source, dest);
    apply(make_mapping(".one", ".list"), source, dest);
    EXPECT_EQ(dest["list"], Value::parse("[1, 2, 3, 4, 5]"));
}

TEST_F(MappingTest, UpsertAtRootMergesIntoDocument) {
    Value source = Value::parse(R"({"patch": {"b": 2}})");
    Value dest = {{"a", 1}};
    apply(make_mapping(".patch", "."), source, dest);
    EXPECT_EQ(dest, (Value{{"a", 1}, {"b", 2}}));
}

TEST_F(MappingTest, MappingDelimiterOverridesDefault) {
    Value source = Value::parse(R"({"xs": ["a", "b"]})");
    Value dest = Value::object();
    Mapping m = make_mapping(".xs[]", ".t");
    m.delimiter = ", ";
    apply(m, source, dest);
    EXPECT_EQ(dest["t"], "a, b");
}

TEST_F(MappingTest, CallerDelimiterUsedWithoutOverride) {
    Value source = Value::parse(R"({"xs": ["a", "b"]})");
    Value dest = Value::object();
    executor.apply(make_mapping(".xs[]", ".t"), source, Value::object(), "", dest, "|");
    EXPECT_EQ(dest["t"], "a|b");
}

// ============================================================================
// Context, prelude and evaluation
// ============================================================================

TEST_F(MappingTest, ContextBoundAsCtx) {
    Value source = {{"name", "ann"}};
    Value dest = Value::object();
    Value ctx = {{"region", "eu"}};
    apply(make_mapping("\"\\(.name)@\\($ctx.region)\"", ".id"), source, dest, ctx);
    EXPECT_EQ(dest["id"], "ann@eu");
}

TEST_F(MappingTest, PreludeDefinitionsVisible) {
    Value source = {{"name", "ann"}};
    Value dest = Value::object();
    apply(make_mapping(".name | up", ".name"), source, dest, Value::object(),
          "def up: ascii_upcase;");
    EXPECT_EQ(dest["name"], "ANN");
}

TEST_F(MappingTest, PreludeTrailingCommentDoesNotSwallowExpression) {
    Value source = {{"n", 2}};
    Value dest = Value::object();
    apply(make_mapping(".n | dbl", ".n"), source, dest, Value::object(),
          "def dbl: . * 2; # helpers");
    EXPECT_EQ(dest["n"], 4);
}

TEST_F(MappingTest, ExpressionsReadSourceNotDestination) {
    Value source = {{"a", "x"}};
    Value dest = Value::object();

    EtlSpec spec;
    spec.mappings = {
        make_mapping(".a", ".first"),
        make_mapping(".first // \"absent\"", ".second"),
    };
    executor.run(spec, source, dest, "\n");

    // Expressions run against the source, not the destination being built
    EXPECT_EQ(dest, (Value{{"first", "x"}, {"second", "absent"}}));
}

TEST(MappingEvaluator, ProgramComposedAndContextBound) {
    RecordingEvaluator evaluator(std::vector<Value>{Value(1)});
    MappingExecutor executor(evaluator);
    Value source = {{"s", 1}};
    Value ctx = {{"k", "v"}};
    Value dest = Value::object();

    executor.apply(make_mapping(".s", ".out"), source, ctx, "def f: 1;", dest, "\n");

    EXPECT_EQ(evaluator.last_program, "def f: 1;\n(.s)");
    EXPECT_EQ(evaluator.last_document, source);
    ASSERT_EQ(evaluator.last_variables.count("ctx"), 1u);
    EXPECT_EQ(evaluator.last_variables.at("ctx"), ctx);
    EXPECT_EQ(dest["out"], 1);
}

TEST(MappingEvaluator, NoPreludeStillParenthesized) {
    RecordingEvaluator evaluator(std::vector<Value>{});
    MappingExecutor executor(evaluator);
    Value dest = Value::object();
    executor.apply(make_mapping(".a, .b", ".out"), Value::object(), Value::object(), "", dest, "\n");
    EXPECT_EQ(evaluator.last_program, "(.a, .b)");
}

TEST(MappingEvaluator, ForeignExceptionsBecomeExpressionError) {
    ThrowingEvaluator evaluator;
    MappingExecutor executor(evaluator);
    Value dest = Value::object();
    try {
        executor.apply(make_mapping(".x", ".y"), Value::object(), Value::object(), "", dest, "\n");
        FAIL() << "expected ExpressionError";
    } catch (const ExpressionError& e) {
        EXPECT_EQ(e.details(), "backend exploded");
        EXPECT_EQ(e.expression(), "(.x)");
    }
    EXPECT_EQ(dest, Value::object());
}

TEST(MappingEvaluator, WrittenValuesDoNotAliasSource) {
    JqEvaluator evaluator;
    MappingExecutor executor(evaluator);
    Value source = Value::parse(R"({"obj": {"k": [1]}})");
    Value dest = Value::object();

    executor.apply(make_mapping(".obj", ".copy"), source, Value::object(), "", dest, "\n");
    source["obj"]["k"].push_back(2);

    EXPECT_EQ(dest["copy"], Value::parse(R"({"k": [1]})"));
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(MappingTest, ExpressionErrorsPropagate) {
    Value dest = Value::object();
    EXPECT_THROW(apply(make_mapping(".a |", ".t"), Value::object(), dest), ExpressionError);
    EXPECT_THROW(apply(make_mapping(".a.b", ".t"), Value(5), dest), ExpressionError);
}

TEST_F(MappingTest, BadDestinationPathRaisesSyntaxError) {
    Value dest = Value::object();
    EXPECT_THROW(apply(make_mapping(".a", "a.b"), Value::object(), dest), SyntaxError);
    EXPECT_THROW(apply(make_mapping(".a", ".a[]"), Value::object(), dest), SyntaxError);
}

TEST_F(MappingTest, PathConflictRaisesTypeMismatch) {
    Value source = {{"v", 1}};
    Value dest = {{"a", "text"}};
    EXPECT_THROW(apply(make_mapping(".v", ".a.b.c"), source, dest), TypeMismatchError);
}

TEST_F(MappingTest, RunTagsFailingMappingIndex) {
    EtlSpec spec;
    spec.mappings = {
        make_mapping(".a", ".ok"),
        make_mapping(".a", "broken"),
    };
    Value dest = Value::object();
    try {
        executor.run(spec, Value{{"a", 1}}, dest, "\n");
        FAIL() << "expected SyntaxError";
    } catch (const SyntaxError& e) {
        ASSERT_TRUE(e.mapping().has_value());
        EXPECT_EQ(*e.mapping(), 2u);
        EXPECT_FALSE(e.step().has_value());
        EXPECT_EQ(std::string(e.what()).rfind("mapping 2: ", 0), 0u);
    }
}

// ============================================================================
// Engine options
// ============================================================================

TEST(MappingOptions, DefaultModeApplies) {
    JqEvaluator evaluator;
    EngineOptions options;
    options.default_mode = Mode::Replace;
    MappingExecutor executor(evaluator, options);

    Value source = {{"s", "new"}};
    Value dest = {{"t", "old"}};
    executor.apply(make_mapping(".s", ".t"), source, Value::object(), "", dest, "\n");
    EXPECT_EQ(dest["t"], "new");

    executor.apply(make_mapping(".s", ".t", Mode::Upsert), source, Value::object(), "", dest, "\n");
    EXPECT_EQ(dest["t"], "new\nnew");
}

TEST(MappingOptions, RunUsesConfiguredDelimiter) {
    JqEvaluator evaluator;
    EngineOptions options;
    options.delimiter = "; ";
    MappingExecutor executor(evaluator, options);

    EtlSpec spec;
    spec.mappings = {make_mapping(".a", ".t"), make_mapping(".b", ".t")};
    Value dest = Value::object();
    executor.run(spec, Value{{"a", "x"}, {"b", "y"}}, dest);
    EXPECT_EQ(dest["t"], "x; y");
}

TEST(MappingOptions, NonPositiveTimeoutRejected) {
    JqEvaluator evaluator;
    EngineOptions options;
    options.evaluation_timeout = std::chrono::milliseconds(0);
    EXPECT_THROW(MappingExecutor executor(evaluator, options), ConfigError);
}

TEST(MappingOptions, TimeoutSurfacesFromEvaluator) {
    JqEvaluator evaluator(std::chrono::milliseconds(20));
    MappingExecutor executor(evaluator);
    Value dest = Value::object();
    EXPECT_THROW(executor.apply(make_mapping("range(1000000000000)", ".n"),
                                Value::object(), Value::object(), "", dest, "\n"),
                 EvaluationTimeout);
}
