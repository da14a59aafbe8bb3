//
// Created by gregorian-rayne on 2/9/26.
//

#include "dua/result.hpp"
#include "dua/error.hpp"
#include "dua/analysis/usage_tracker.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace dua
{
    namespace {

        using UnusedList = std::vector<analysis::UnusedDeclaration>;

        Declaration field(const std::string& name, const std::size_t line) {
            Declaration declaration;
            declaration.symbol = "F:Cart." + name;
            declaration.name = name;
            declaration.kind = DeclarationKind::Field;
            declaration.location = {"Cart.cs", line, 17};
            return declaration;
        }

        Result<std::size_t, Error> count_unused(const UnusedList& unused) {
            if (unused.empty()) {
                return Result<std::size_t, Error>::failure(Error::not_found("nothing to report"));
            }
            return Result<std::size_t, Error>::success(unused.size());
        }

    }  // namespace

    TEST(ResultTest, FinalizeYieldsUnusedList) {
        analysis::UsageTracker tracker(DeclarationScope::WholeProgram);
        tracker.declare(field("items", 4));

        auto result = tracker.finalize();

        ASSERT_TRUE(result.is_ok());
        EXPECT_TRUE(static_cast<bool>(result));
        EXPECT_THROW((void)result.error(), std::logic_error);

        const UnusedList unused = std::move(result).value();
        ASSERT_EQ(unused.size(), 1u);
        EXPECT_EQ(unused[0].declaration.name, "items");
    }

    TEST(ResultTest, SecondFinalizeCarriesContractViolation) {
        analysis::UsageTracker tracker(DeclarationScope::WholeProgram);
        ASSERT_TRUE(tracker.finalize().is_ok());

        const auto second = tracker.finalize();

        EXPECT_TRUE(second.is_err());
        EXPECT_FALSE(static_cast<bool>(second));
        EXPECT_EQ(second.error().code(), ErrorCode::ContractViolation);
        EXPECT_THROW((void)second.value(), std::logic_error);
        EXPECT_TRUE(second.value_or(UnusedList{}).empty());
    }

    TEST(ResultTest, MapAndThenOverUnusedList) {
        analysis::UsageTracker tracker(DeclarationScope::WholeProgram);
        tracker.declare(field("items", 4));
        tracker.declare(field("total", 5));

        const auto result = tracker.finalize();
        const auto names = result.map([](const UnusedList& unused) {
            std::string joined;
            for (const auto& entry : unused) {
                joined += entry.declaration.name + ";";
            }
            return joined;
        });
        const auto count = result.and_then(count_unused);

        ASSERT_TRUE(names.is_ok());
        EXPECT_EQ(names.value(), "items;total;");
        ASSERT_TRUE(count.is_ok());
        EXPECT_EQ(count.value(), 2u);
    }

    TEST(ResultTest, AndThenPropagatesBothFailures) {
        analysis::UsageTracker clean(DeclarationScope::WholeProgram);
        const auto empty = clean.finalize().and_then(count_unused);
        ASSERT_TRUE(empty.is_err());
        EXPECT_EQ(empty.error().code(), ErrorCode::NotFound);

        const auto refused = clean.finalize().and_then(count_unused);
        ASSERT_TRUE(refused.is_err());
        EXPECT_EQ(refused.error().code(), ErrorCode::ContractViolation);
    }

    TEST(ResultTest, OrElseRecoversFromContractViolationOnly) {
        analysis::UsageTracker tracker(DeclarationScope::WholeProgram);
        tracker.declare(field("items", 4));
        ASSERT_TRUE(tracker.finalize().is_ok());

        auto recover = [](const Error& error) {
            if (error.code() == ErrorCode::ContractViolation) {
                return Result<UnusedList, Error>::success({});
            }
            return Result<UnusedList, Error>::failure(error.with_context("unrecoverable"));
        };

        const auto recovered = tracker.finalize().or_else(recover);
        ASSERT_TRUE(recovered.is_ok());
        EXPECT_TRUE(recovered.value().empty());

        const auto untouched = Result<UnusedList, Error>::failure(Error::io_error("read failed")).or_else(recover);
        ASSERT_TRUE(untouched.is_err());
        EXPECT_EQ(untouched.error().code(), ErrorCode::IoError);
    }

    TEST(VoidResultTest, SuccessAndFailure) {
        const auto ok = Result<void, Error>::success();
        EXPECT_TRUE(ok.is_ok());
        EXPECT_THROW((void)ok.error(), std::logic_error);

        const auto failed = Result<void, Error>::failure(Error::config_error("bad key", "analysis.max_threads"));
        EXPECT_TRUE(failed.is_err());
        EXPECT_EQ(failed.error().code(), ErrorCode::ConfigError);
    }

}  // namespace dua
