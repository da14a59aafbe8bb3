//
// Created by gregorian-rayne on 2/11/26.
//

#include "dua/analysis/usage_tracker.hpp"
#include "dua/utils/parallel.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace dua::analysis
{
    namespace {

        Declaration field(const std::string& name, const std::size_t line, const std::string& file = "Cart.cs") {
            Declaration declaration;
            declaration.symbol = "F:Cart." + name;
            declaration.name = name;
            declaration.kind = DeclarationKind::Field;
            declaration.location = {file, line, 17};
            return declaration;
        }

        Declaration parameter(const std::string& callable, const std::string& name, const std::size_t line) {
            Declaration declaration;
            declaration.symbol = "P:" + callable + "." + name;
            declaration.name = name;
            declaration.kind = DeclarationKind::Parameter;
            declaration.location = {"Cart.cs", line, 20};
            return declaration;
        }

        std::vector<std::string> names_of(const std::vector<UnusedDeclaration>& unused) {
            std::vector<std::string> names;
            names.reserve(unused.size());
            for (const auto& entry : unused) {
                names.push_back(entry.declaration.name);
            }
            return names;
        }

    }  // namespace

    class UsageTrackerTest : public ::testing::Test {
    protected:
        UsageTracker fields_{DeclarationScope::WholeProgram};
    };

    // ============================================================================
    // Scenarios
    // ============================================================================

    TEST_F(UsageTrackerTest, NeverReferencedFieldIsReported) {
        fields_.declare(field("items", 4));

        auto unused = fields_.finalize();

        ASSERT_TRUE(unused.is_ok());
        ASSERT_EQ(unused.value().size(), 1u);
        EXPECT_EQ(unused.value()[0].declaration.name, "items");
        EXPECT_FALSE(unused.value()[0].usage.has_write);
    }

    TEST_F(UsageTrackerTest, AssignedOnlyFieldIsReported) {
        const auto id = fields_.declare(field("total", 5));
        for (int i = 0; i < 3; ++i) {
            fields_.record_access(id, SyntacticContext::AssignmentLeftSimple);
        }

        auto unused = fields_.finalize();

        ASSERT_TRUE(unused.is_ok());
        ASSERT_EQ(unused.value().size(), 1u);
        EXPECT_TRUE(unused.value()[0].usage.has_write);
        EXPECT_FALSE(unused.value()[0].usage.has_read);
    }

    TEST_F(UsageTrackerTest, RightOperandReadMakesFieldUsed) {
        const auto id = fields_.declare(field("total", 5));
        fields_.record_access(id, SyntacticContext::AssignmentRight);

        auto unused = fields_.finalize();

        ASSERT_TRUE(unused.is_ok());
        EXPECT_TRUE(unused.value().empty());
    }

    TEST_F(UsageTrackerTest, ClosureCaptureMakesFieldUsed) {
        const auto id = fields_.declare(field("handler", 6));
        fields_.record_access(id, SyntacticContext::ClosureCapture);

        auto unused = fields_.finalize();

        ASSERT_TRUE(unused.is_ok());
        EXPECT_TRUE(unused.value().empty());
    }

    TEST_F(UsageTrackerTest, OutputArgumentOnlyParameterIsReported) {
        UsageTracker tracker(DeclarationScope::SingleBody);
        const auto id = tracker.declare(parameter("M:Cart.TryGet(int)", "result", 12));
        tracker.record_access(id, SyntacticContext::OutputArgument);

        auto unused = tracker.finalize();

        ASSERT_TRUE(unused.is_ok());
        ASSERT_EQ(unused.value().size(), 1u);
        EXPECT_EQ(unused.value()[0].declaration.name, "result");
        EXPECT_TRUE(unused.value()[0].usage.has_write);
    }

    // ============================================================================
    // Properties
    // ============================================================================

    TEST_F(UsageTrackerTest, IncrementsWithoutReadAreReported) {
        const auto counter = fields_.declare(field("counter", 3));
        const auto total = fields_.declare(field("total", 4));
        fields_.record_access(counter, SyntacticContext::PostfixIncrement);
        fields_.record_access(total, SyntacticContext::AssignmentLeftCompound);

        auto unused = fields_.finalize();

        ASSERT_TRUE(unused.is_ok());
        EXPECT_EQ(names_of(unused.value()), (std::vector<std::string>{"counter", "total"}));
    }

    TEST_F(UsageTrackerTest, ReadIsMonotonic) {
        const auto id = fields_.declare(field("items", 4));
        fields_.record_access(id, SyntacticContext::MemberAccessReceiver);
        fields_.record_access(id, SyntacticContext::AssignmentLeftSimple);
        fields_.record_access(id, SyntacticContext::PostfixDecrement);

        const auto usage = fields_.usage(id);
        ASSERT_TRUE(usage.has_value());
        EXPECT_TRUE(usage->has_read);
        EXPECT_TRUE(usage->has_write);

        auto unused = fields_.finalize();
        ASSERT_TRUE(unused.is_ok());
        EXPECT_TRUE(unused.value().empty());
    }

    TEST_F(UsageTrackerTest, DeclareIsIdempotent) {
        const auto first = fields_.declare(field("items", 9, "Cart.Part2.cs"));
        const auto second = fields_.declare(field("items", 4, "Cart.Part1.cs"));

        EXPECT_EQ(first, second);
        EXPECT_EQ(fields_.stats().declarations, 1u);
        EXPECT_EQ(fields_.stats().duplicate_declarations, 1u);

        auto unused = fields_.finalize();
        ASSERT_TRUE(unused.is_ok());
        ASSERT_EQ(unused.value().size(), 1u);
        EXPECT_EQ(unused.value()[0].declaration.location.file, "Cart.Part1.cs");
    }

    TEST(SingleBodyTrackerTest, ConflictingKindIsIgnoredAndCounted) {
        UsageTracker parameters(DeclarationScope::SingleBody);
        const auto id = parameters.declare(parameter("M:A()", "x", 2));

        auto lambda = parameter("M:A()", "x", 2);
        lambda.kind = DeclarationKind::LambdaParameter;

        EXPECT_EQ(parameters.declare(lambda), id);
        EXPECT_EQ(parameters.stats().conflicting_declarations, 1u);
        EXPECT_EQ(parameters.stats().declarations, 1u);
        EXPECT_EQ(parameters.declaration(id)->kind, DeclarationKind::Parameter);
    }

    TEST_F(UsageTrackerTest, DuplicateAtSameSiteIsIndependentOfOrder) {
        auto renamed = field("items", 4);
        renamed.name = "renamed";

        const auto id = fields_.declare(renamed);
        fields_.declare(field("items", 4));

        UsageTracker reversed(DeclarationScope::WholeProgram);
        const auto reversed_id = reversed.declare(field("items", 4));
        reversed.declare(renamed);

        EXPECT_EQ(fields_.declaration(id)->name, "items");
        EXPECT_EQ(reversed.declaration(reversed_id)->name, "items");
    }

    TEST_F(UsageTrackerTest, DuplicateKeepsEarliestRecordWhole) {
        auto part_a = field("count", 3, "Cart.A.cs");
        part_a.sibling_group = "Cart.A.cs:3";
        const auto part_b = field("count", 9, "Cart.B.cs");

        const auto a_first = fields_.declare(part_a);
        fields_.declare(part_b);

        UsageTracker reversed(DeclarationScope::WholeProgram);
        const auto b_first = reversed.declare(part_b);
        reversed.declare(part_a);

        const auto kept = fields_.declaration(a_first);
        const auto kept_reversed = reversed.declaration(b_first);
        ASSERT_TRUE(kept.has_value());
        ASSERT_TRUE(kept_reversed.has_value());

        EXPECT_EQ(kept->location.file, "Cart.A.cs");
        EXPECT_EQ(kept->sibling_group, std::optional<std::string>("Cart.A.cs:3"));
        EXPECT_EQ(kept_reversed->location, kept->location);
        EXPECT_EQ(kept_reversed->sibling_group, kept->sibling_group);
        EXPECT_EQ(kept_reversed->id, b_first);

        auto unused = reversed.finalize();
        ASSERT_TRUE(unused.is_ok());
        ASSERT_EQ(unused.value().size(), 1u);
        EXPECT_EQ(unused.value()[0].declaration.sibling_group, std::optional<std::string>("Cart.A.cs:3"));
    }

    TEST_F(UsageTrackerTest, ScopeMismatchIsRejected) {
        const auto id = fields_.declare(parameter("M:A()", "x", 2));

        EXPECT_EQ(id, INVALID_DECLARATION_ID);
        EXPECT_EQ(fields_.stats().scope_mismatches, 1u);
        EXPECT_EQ(fields_.stats().declarations, 0u);
    }

    TEST_F(UsageTrackerTest, UnknownIdIsDroppedAndCounted) {
        fields_.record_access(DeclarationId{42}, SyntacticContext::AssignmentRight);
        fields_.record_access(INVALID_DECLARATION_ID, SyntacticContext::AssignmentRight);

        EXPECT_EQ(fields_.stats().unknown_ids, 2u);
        EXPECT_EQ(fields_.stats().occurrences, 0u);
    }

    TEST_F(UsageTrackerTest, OccurrenceBeforeDeclarationStillCounts) {
        fields_.record_access("F:Cart.items", SyntacticContext::ValueArgument);
        fields_.declare(field("items", 4));

        auto unused = fields_.finalize();

        ASSERT_TRUE(unused.is_ok());
        EXPECT_TRUE(unused.value().empty());
        EXPECT_EQ(fields_.stats().orphan_occurrences, 0u);
    }

    TEST_F(UsageTrackerTest, OrphanOccurrencesAreCounted) {
        fields_.declare(field("items", 4));
        fields_.record({"F:Other.value", SyntacticContext::AssignmentRight, {}});
        fields_.record({"F:Other.value", SyntacticContext::AssignmentRight, {}});

        auto unused = fields_.finalize();

        ASSERT_TRUE(unused.is_ok());
        EXPECT_EQ(unused.value().size(), 1u);
        EXPECT_EQ(fields_.stats().orphan_occurrences, 2u);
        EXPECT_EQ(fields_.stats().malformed_events(), 2u);
    }

    TEST_F(UsageTrackerTest, ReportIsOrderedByLocation) {
        fields_.declare(field("c", 30, "B.cs"));
        fields_.declare(field("a", 10, "B.cs"));
        fields_.declare(field("b", 20, "A.cs"));

        auto unused = fields_.finalize();

        ASSERT_TRUE(unused.is_ok());
        EXPECT_EQ(names_of(unused.value()), (std::vector<std::string>{"b", "a", "c"}));
    }

    TEST_F(UsageTrackerTest, LookupAndIntern) {
        EXPECT_FALSE(fields_.lookup("F:Cart.items").has_value());

        const auto id = fields_.intern("F:Cart.items");
        EXPECT_NE(id, INVALID_DECLARATION_ID);
        EXPECT_EQ(fields_.intern("F:Cart.items"), id);
        EXPECT_EQ(fields_.lookup("F:Cart.items"), id);
        EXPECT_EQ(fields_.declare(field("items", 4)), id);
    }

    // ============================================================================
    // Finalize contract
    // ============================================================================

    TEST_F(UsageTrackerTest, FinalizeRefusedWhileProducersActive) {
        fields_.declare(field("items", 4));

        {
            ProducerScope producer(fields_);
            EXPECT_EQ(fields_.active_producers(), 1u);

            auto refused = fields_.finalize();
            ASSERT_TRUE(refused.is_err());
            EXPECT_EQ(refused.error().code(), ErrorCode::ContractViolation);
            EXPECT_FALSE(fields_.is_finalized());
        }

        EXPECT_EQ(fields_.active_producers(), 0u);
        auto unused = fields_.finalize();
        ASSERT_TRUE(unused.is_ok());
        EXPECT_EQ(unused.value().size(), 1u);
    }

    TEST_F(UsageTrackerTest, FinalizeTwiceIsContractViolation) {
        ASSERT_TRUE(fields_.finalize().is_ok());

        auto second = fields_.finalize();

        ASSERT_TRUE(second.is_err());
        EXPECT_EQ(second.error().code(), ErrorCode::ContractViolation);
    }

    TEST_F(UsageTrackerTest, EventsAfterFinalizeAreLate) {
        const auto id = fields_.declare(field("items", 4));
        ASSERT_TRUE(fields_.finalize().is_ok());

        fields_.record_access(id, SyntacticContext::AssignmentRight);
        EXPECT_EQ(fields_.declare(field("other", 8)), INVALID_DECLARATION_ID);

        EXPECT_EQ(fields_.stats().late_events, 2u);
        EXPECT_FALSE(fields_.usage(id).has_value());
    }

    TEST(SingleBodyTrackerTest, TrackersAreIsolated) {
        UsageTracker first(DeclarationScope::SingleBody);
        UsageTracker second(DeclarationScope::SingleBody);

        first.declare(parameter("M:A(int)", "x", 2));
        second.declare(parameter("M:B(int)", "x", 7));
        first.record_access("P:M:A(int).x", SyntacticContext::ValueArgument);

        auto first_unused = first.finalize();
        auto second_unused = second.finalize();

        ASSERT_TRUE(first_unused.is_ok());
        ASSERT_TRUE(second_unused.is_ok());
        EXPECT_TRUE(first_unused.value().empty());
        ASSERT_EQ(second_unused.value().size(), 1u);
        EXPECT_EQ(second_unused.value()[0].declaration.location.line, 7u);
    }

    TEST(SingleBodyTrackerTest, FinalizeIgnoresProducerCount) {
        UsageTracker tracker(DeclarationScope::SingleBody);
        tracker.declare(parameter("M:A(int)", "x", 2));
        tracker.begin_producer();

        EXPECT_TRUE(tracker.finalize().is_ok());
        tracker.end_producer();
    }

    TEST(TrackerStatsTest, Merge) {
        TrackerStats a;
        a.declarations = 2;
        a.orphan_occurrences = 1;
        TrackerStats b;
        b.declarations = 3;
        b.late_events = 4;

        a.merge(b);

        EXPECT_EQ(a.declarations, 5u);
        EXPECT_EQ(a.orphan_occurrences, 1u);
        EXPECT_EQ(a.late_events, 4u);
        EXPECT_EQ(a.malformed_events(), 5u);
    }

    // ============================================================================
    // Concurrency
    // ============================================================================

    namespace {

        struct UnitEvents {
            std::vector<Declaration> declarations;
            std::vector<Occurrence> occurrences;
        };

        /**
         * 64 units, each declaring 8 fields. Every third field is read from
         * the next unit, every fifth one is only assigned.
         */
        std::vector<UnitEvents> make_program() {
            constexpr std::size_t unit_count = 64;
            constexpr std::size_t fields_per_unit = 8;

            std::vector<UnitEvents> units(unit_count);
            for (std::size_t u = 0; u < unit_count; ++u) {
                for (std::size_t f = 0; f < fields_per_unit; ++f) {
                    const auto name = "f" + std::to_string(u) + "_" + std::to_string(f);
                    Declaration declaration;
                    declaration.symbol = "F:T." + name;
                    declaration.name = name;
                    declaration.kind = DeclarationKind::Field;
                    declaration.location = {"Unit" + std::to_string(u) + ".cs", f + 1, 5};
                    units[u].declarations.push_back(declaration);

                    const auto index = u * fields_per_unit + f;
                    if (index % 3 == 0) {
                        units[(u + 1) % unit_count].occurrences.push_back(
                            {declaration.symbol, SyntacticContext::MemberAccessReceiver, {}});
                    } else if (index % 5 == 0) {
                        units[u].occurrences.push_back(
                            {declaration.symbol, SyntacticContext::AssignmentLeftSimple, {}});
                    }
                }
            }
            return units;
        }

        std::vector<std::string> run_shuffled(std::vector<UnitEvents> units, const unsigned seed) {
            std::mt19937 rng(seed);
            std::shuffle(units.begin(), units.end(), rng);
            for (auto& unit : units) {
                std::shuffle(unit.occurrences.begin(), unit.occurrences.end(), rng);
            }

            UsageTracker tracker(DeclarationScope::WholeProgram);
            parallel::ThreadPool pool(8);
            parallel::for_each(units, [&](const UnitEvents& unit) {
                ProducerScope producer(tracker);
                // Occurrences first: cross-unit reads may precede their declaration.
                for (const auto& occurrence : unit.occurrences) {
                    tracker.record(occurrence);
                }
                for (const auto& declaration : unit.declarations) {
                    tracker.declare(declaration);
                }
            }, pool);

            auto unused = tracker.finalize();
            EXPECT_TRUE(unused.is_ok());
            EXPECT_EQ(tracker.stats().orphan_occurrences, 0u);
            return unused.is_ok() ? names_of(unused.value()) : std::vector<std::string>{};
        }

    }  // namespace

    TEST(UsageTrackerConcurrencyTest, ReportIsIndependentOfProducerOrder) {
        const auto program = make_program();
        const auto baseline = run_shuffled(program, 1);

        // 512 fields, 171 read
        EXPECT_EQ(baseline.size(), 512u - 171u);

        for (unsigned seed = 2; seed < 12; ++seed) {
            EXPECT_EQ(run_shuffled(program, seed), baseline) << "seed " << seed;
        }
    }

    TEST(UsageTrackerConcurrencyTest, ConcurrentDuplicateDeclarationsCollapse) {
        UsageTracker tracker(DeclarationScope::WholeProgram);
        std::vector<std::size_t> producers(16);
        for (std::size_t i = 0; i < producers.size(); ++i) {
            producers[i] = i;
        }

        parallel::ThreadPool pool(8);
        parallel::for_each(producers, [&](const std::size_t i) {
            ProducerScope producer(tracker);
            tracker.declare(field("shared", 100 - i, "Partial" + std::to_string(i % 4) + ".cs"));
        }, pool);

        auto unused = tracker.finalize();

        ASSERT_TRUE(unused.is_ok());
        ASSERT_EQ(unused.value().size(), 1u);
        EXPECT_EQ(tracker.stats().declarations, 1u);
        EXPECT_EQ(tracker.stats().duplicate_declarations, 15u);
        EXPECT_EQ(unused.value()[0].declaration.location.file, "Partial0.cs");
        EXPECT_EQ(unused.value()[0].declaration.location.line, 88u);
    }

}  // namespace dua::analysis
