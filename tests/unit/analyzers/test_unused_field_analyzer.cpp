//
// Created by gregorian-rayne on 2/13/26.
//

#include "dua/analyzers/unused_field_analyzer.hpp"

#include <gtest/gtest.h>

namespace dua::analyzers
{
    class UnusedFieldAnalyzerTest : public ::testing::Test {
    protected:
        void SetUp() override {
            analyzer_ = std::make_unique<UnusedFieldAnalyzer>();
        }

        static frontend::FieldSite field(const std::string& name, const std::size_t line,
                                         const std::string& file = "Cart.cs") {
            frontend::FieldSite site;
            site.symbol = "F:Cart." + name;
            site.name = name;
            site.location = {file, line, 17};
            return site;
        }

        static Occurrence access(const std::string& name, const SyntacticContext context) {
            return {"F:Cart." + name, context, {}};
        }

        /**
         * Cart.cs declares items, total and handler; Checkout.cs reads items.
         * total is only assigned, handler is only captured by a lambda.
         */
        static frontend::Program create_test_program() {
            frontend::SourceUnit cart;
            cart.id = "Cart.cs";
            cart.fields = {field("items", 4), field("total", 5), field("handler", 6)};
            cart.field_occurrences = {
                access("total", SyntacticContext::AssignmentLeftSimple),
                access("total", SyntacticContext::AssignmentLeftCompound),
                access("handler", SyntacticContext::ClosureCapture),
            };

            frontend::SourceUnit checkout;
            checkout.id = "Checkout.cs";
            checkout.field_occurrences = {access("items", SyntacticContext::MemberAccessReceiver)};

            frontend::Program program;
            program.units = {cart, checkout};
            return program;
        }

        std::unique_ptr<UnusedFieldAnalyzer> analyzer_;
    };

    TEST_F(UnusedFieldAnalyzerTest, Name) {
        EXPECT_EQ(analyzer_->name(), "UnusedFieldAnalyzer");
        EXPECT_FALSE(analyzer_->description().empty());
        EXPECT_EQ(analyzer_->rule().id, "DUA0001");
    }

    TEST_F(UnusedFieldAnalyzerTest, AnalyzeEmptyProgram) {
        const frontend::Program empty;
        const AnalysisOptions options;

        auto result = analyzer_->analyze(empty, options);

        ASSERT_TRUE(result.is_ok());
        EXPECT_TRUE(result.value().diagnostics.empty());
        EXPECT_EQ(result.value().declarations_seen, 0u);
    }

    TEST_F(UnusedFieldAnalyzerTest, ReportsAssignedOnlyField) {
        const auto program = create_test_program();
        const AnalysisOptions options;

        auto result = analyzer_->analyze(program, options);

        ASSERT_TRUE(result.is_ok());
        const auto& diagnostics = result.value().diagnostics;
        ASSERT_EQ(diagnostics.size(), 1u);
        EXPECT_EQ(diagnostics[0].name, "total");
        EXPECT_EQ(diagnostics[0].rule_id, "DUA0001");
        EXPECT_EQ(diagnostics[0].kind, DeclarationKind::Field);
        EXPECT_EQ(diagnostics[0].location.line, 5u);
        EXPECT_TRUE(diagnostics[0].usage.has_write);
        EXPECT_EQ(diagnostics[0].message, "Private field 'total' is assigned but its value is never read");
        EXPECT_EQ(result.value().declarations_seen, 3u);
    }

    TEST_F(UnusedFieldAnalyzerTest, NeverReferencedFieldMessage) {
        frontend::SourceUnit unit;
        unit.id = "Cart.cs";
        unit.fields = {field("cache", 3)};
        frontend::Program program;
        program.units = {unit};

        auto result = analyzer_->analyze(program, AnalysisOptions{});

        ASSERT_TRUE(result.is_ok());
        ASSERT_EQ(result.value().diagnostics.size(), 1u);
        EXPECT_EQ(result.value().diagnostics[0].message, "Private field 'cache' is never read");
    }

    TEST_F(UnusedFieldAnalyzerTest, ReadInAnotherUnitBeforeDeclaration) {
        auto program = create_test_program();
        std::swap(program.units[0], program.units[1]);

        auto result = analyzer_->analyze(program, AnalysisOptions{});

        ASSERT_TRUE(result.is_ok());
        ASSERT_EQ(result.value().diagnostics.size(), 1u);
        EXPECT_EQ(result.value().diagnostics[0].name, "total");
    }

    TEST_F(UnusedFieldAnalyzerTest, ExemptFieldsAreCounted) {
        auto public_field = field("Name", 7);
        public_field.accessibility = Accessibility::Public;
        auto backing = field("<Count>k__BackingField", 8);
        backing.is_implicit = true;
        auto constant = field("Limit", 9);
        constant.is_constant = true;

        frontend::SourceUnit unit;
        unit.id = "Cart.cs";
        unit.fields = {public_field, backing, constant};
        frontend::Program program;
        program.units = {unit};

        auto result = analyzer_->analyze(program, AnalysisOptions{});

        ASSERT_TRUE(result.is_ok());
        const auto& analysis = result.value();
        EXPECT_TRUE(analysis.diagnostics.empty());
        EXPECT_EQ(analysis.declarations_seen, 3u);
        EXPECT_EQ(analysis.declarations_exempted, 3u);
        EXPECT_EQ(analysis.exemptions.at("not_private"), 1u);
        EXPECT_EQ(analysis.exemptions.at("compiler_synthesized"), 1u);
        EXPECT_EQ(analysis.exemptions.at("constant"), 1u);
    }

    TEST_F(UnusedFieldAnalyzerTest, ReadsOfExemptFieldsAreNotMalformed) {
        auto public_field = field("Name", 7);
        public_field.accessibility = Accessibility::Public;
        auto constant = field("Max", 8);
        constant.is_constant = true;

        frontend::SourceUnit cart;
        cart.id = "Cart.cs";
        cart.fields = {public_field, constant, field("count", 9)};
        cart.field_occurrences = {
            access("Name", SyntacticContext::AssignmentRight),
            access("count", SyntacticContext::Other),
        };

        frontend::SourceUnit checkout;
        checkout.id = "Checkout.cs";
        checkout.field_occurrences = {access("Max", SyntacticContext::ValueArgument)};

        frontend::Program program;
        program.units = {checkout, cart};

        auto result = analyzer_->analyze(program, AnalysisOptions{});

        ASSERT_TRUE(result.is_ok());
        const auto& analysis = result.value();
        EXPECT_TRUE(analysis.diagnostics.empty());
        EXPECT_EQ(analysis.declarations_exempted, 2u);
        EXPECT_EQ(analysis.stats.orphan_occurrences, 0u);
        EXPECT_EQ(analysis.stats.malformed_events(), 0u);
        EXPECT_EQ(analysis.stats.declarations, 1u);
    }

    TEST_F(UnusedFieldAnalyzerTest, ReadOfUndeclaredFieldIsOrphan) {
        frontend::SourceUnit checkout;
        checkout.id = "Checkout.cs";
        checkout.field_occurrences = {access("missing", SyntacticContext::AssignmentRight)};
        frontend::Program program;
        program.units = {checkout};

        auto result = analyzer_->analyze(program, AnalysisOptions{});

        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().stats.orphan_occurrences, 1u);
        EXPECT_EQ(result.value().stats.malformed_events(), 1u);
    }

    TEST_F(UnusedFieldAnalyzerTest, GeneratedUnitReadsButDoesNotDeclare) {
        frontend::SourceUnit designer;
        designer.id = "Form.Designer.cs";
        designer.generated = true;
        designer.fields = {field("button", 2, "Form.Designer.cs")};
        designer.field_occurrences = {access("items", SyntacticContext::ValueArgument)};

        frontend::SourceUnit cart;
        cart.id = "Cart.cs";
        cart.fields = {field("items", 4)};

        frontend::Program program;
        program.units = {designer, cart};

        auto result = analyzer_->analyze(program, AnalysisOptions{});

        ASSERT_TRUE(result.is_ok());
        EXPECT_TRUE(result.value().diagnostics.empty());
        EXPECT_EQ(result.value().exemptions.at("generated_code"), 1u);
    }

    TEST_F(UnusedFieldAnalyzerTest, PartialDeclarationReportedOnce) {
        frontend::SourceUnit first;
        first.id = "Cart.Part2.cs";
        first.fields = {field("items", 12, "Cart.Part2.cs")};
        frontend::SourceUnit second;
        second.id = "Cart.Part1.cs";
        second.fields = {field("items", 3, "Cart.Part1.cs")};

        frontend::Program program;
        program.units = {first, second};

        auto result = analyzer_->analyze(program, AnalysisOptions{});

        ASSERT_TRUE(result.is_ok());
        ASSERT_EQ(result.value().diagnostics.size(), 1u);
        EXPECT_EQ(result.value().diagnostics[0].location.file, "Cart.Part1.cs");
        EXPECT_EQ(result.value().stats.duplicate_declarations, 1u);
    }

    TEST_F(UnusedFieldAnalyzerTest, SiblingGroupIsCarried) {
        auto a = field("a", 4);
        auto b = field("b", 4);
        a.sibling_group = "Cart.cs:4";
        b.sibling_group = "Cart.cs:4";
        b.location.column = 20;

        frontend::SourceUnit unit;
        unit.id = "Cart.cs";
        unit.fields = {a, b};
        unit.field_occurrences = {access("a", SyntacticContext::ReturnValue)};
        frontend::Program program;
        program.units = {unit};

        auto result = analyzer_->analyze(program, AnalysisOptions{});

        ASSERT_TRUE(result.is_ok());
        ASSERT_EQ(result.value().diagnostics.size(), 1u);
        EXPECT_EQ(result.value().diagnostics[0].name, "b");
        EXPECT_EQ(result.value().diagnostics[0].sibling_group, std::optional<std::string>("Cart.cs:4"));
    }

    TEST_F(UnusedFieldAnalyzerTest, DisabledByConfig) {
        AnalysisOptions options;
        options.config.analyze_fields = false;

        auto result = analyzer_->analyze(create_test_program(), options);

        ASSERT_TRUE(result.is_ok());
        EXPECT_TRUE(result.value().diagnostics.empty());
        EXPECT_EQ(result.value().declarations_seen, 0u);
    }

    TEST_F(UnusedFieldAnalyzerTest, ResultIndependentOfThreadCount) {
        frontend::Program program;
        for (int u = 0; u < 20; ++u) {
            frontend::SourceUnit unit;
            unit.id = "Unit" + std::to_string(u) + ".cs";
            for (int f = 0; f < 5; ++f) {
                auto site = field("f" + std::to_string(u) + "_" + std::to_string(f),
                                  static_cast<std::size_t>(f + 1), unit.id);
                unit.fields.push_back(site);
            }
            // Each unit reads the first field of the previous one.
            const int previous = (u + 19) % 20;
            unit.field_occurrences.push_back(
                access("f" + std::to_string(previous) + "_0", SyntacticContext::Condition));
            program.units.push_back(unit);
        }

        AnalysisOptions single;
        single.config.max_threads = 1;
        AnalysisOptions many;
        many.config.max_threads = 8;

        auto a = analyzer_->analyze(program, single);
        auto b = analyzer_->analyze(program, many);

        ASSERT_TRUE(a.is_ok());
        ASSERT_TRUE(b.is_ok());
        ASSERT_EQ(a.value().diagnostics.size(), 80u);
        ASSERT_EQ(b.value().diagnostics.size(), 80u);
        for (std::size_t i = 0; i < a.value().diagnostics.size(); ++i) {
            EXPECT_EQ(a.value().diagnostics[i].symbol, b.value().diagnostics[i].symbol);
        }
    }

}  // namespace dua::analyzers
