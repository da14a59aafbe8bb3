//
// Created by gregorian-rayne on 2/10/26.
//

#include "dua/analysis/usage_tracker.hpp"
#include "dua/analysis/access_classifier.hpp"

#include <algorithm>
#include <mutex>
#include <string>
#include <tuple>

namespace dua::analysis
{
    namespace {

        constexpr std::size_t DEFAULT_WHOLE_PROGRAM_SHARDS = 32;

        std::size_t resolve_shard_count(const DeclarationScope scope, const std::size_t requested) {
            if (requested > 0) {
                return requested;
            }
            return scope == DeclarationScope::WholeProgram ? DEFAULT_WHOLE_PROGRAM_SHARDS : 1;
        }

        /**
         * Partial declarations of one binding: the record with the earliest
         * site is kept whole, whichever producer arrived first.
         */
        bool is_primary_over(const Declaration& candidate, const Declaration& stored) {
            if (candidate.location.has_location() != stored.location.has_location()) {
                return candidate.location.has_location();
            }
            return std::tie(candidate.location, candidate.name, candidate.sibling_group) <
                   std::tie(stored.location, stored.name, stored.sibling_group);
        }

        bool report_order(const UnusedDeclaration& a, const UnusedDeclaration& b) {
            const auto& da = a.declaration;
            const auto& db = b.declaration;
            return std::tie(da.location, da.symbol, da.id) <
                   std::tie(db.location, db.symbol, db.id);
        }

    }  // namespace

    void TrackerStats::merge(const TrackerStats& other) noexcept {
        declarations += other.declarations;
        occurrences += other.occurrences;
        duplicate_declarations += other.duplicate_declarations;
        conflicting_declarations += other.conflicting_declarations;
        scope_mismatches += other.scope_mismatches;
        unknown_ids += other.unknown_ids;
        orphan_occurrences += other.orphan_occurrences;
        late_events += other.late_events;
    }

    UsageTracker::UsageTracker(const DeclarationScope scope, const std::size_t shard_count)
        : scope_(scope)
        , declared_(resolve_shard_count(scope, shard_count))
        , used_(resolve_shard_count(scope, shard_count)) {}

    bool UsageTracker::reject_if_finalized() noexcept {
        if (finalized_.load(std::memory_order_acquire)) {
            late_events_.fetch_add(1, std::memory_order_relaxed);
            return true;
        }
        return false;
    }

    DeclarationId UsageTracker::intern(const SymbolKey& symbol) {
        {
            std::shared_lock lock(interner_mutex_);
            if (const auto it = ids_.find(symbol); it != ids_.end()) {
                return it->second;
            }
        }

        std::unique_lock lock(interner_mutex_);
        auto [it, inserted] = ids_.try_emplace(symbol, next_id_);
        if (inserted) {
            ++next_id_;
        }
        return it->second;
    }

    std::optional<DeclarationId> UsageTracker::lookup(const SymbolKey& symbol) const {
        std::shared_lock lock(interner_mutex_);
        if (const auto it = ids_.find(symbol); it != ids_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool UsageTracker::is_issued(const DeclarationId id) const {
        std::shared_lock lock(interner_mutex_);
        return id != INVALID_DECLARATION_ID && id < next_id_;
    }

    DeclarationId UsageTracker::declare(Declaration declaration) {
        if (reject_if_finalized()) {
            return INVALID_DECLARATION_ID;
        }

        if (declaration.scope() != scope_) {
            scope_mismatches_.fetch_add(1, std::memory_order_relaxed);
            return INVALID_DECLARATION_ID;
        }

        const DeclarationId id = intern(declaration.symbol);
        declaration.id = id;

        enum class Outcome { Inserted, Duplicate, Conflict };
        Outcome outcome = Outcome::Inserted;

        declared_.upsert(id, [&](Declaration& stored) {
            if (stored.id == INVALID_DECLARATION_ID) {
                stored = std::move(declaration);
                return;
            }
            if (stored.kind != declaration.kind) {
                outcome = Outcome::Conflict;
                return;
            }
            outcome = Outcome::Duplicate;
            if (is_primary_over(declaration, stored)) {
                declaration.id = stored.id;
                stored = std::move(declaration);
            }
        });

        switch (outcome) {
            case Outcome::Inserted:
                declarations_.fetch_add(1, std::memory_order_relaxed);
                break;
            case Outcome::Duplicate:
                duplicate_declarations_.fetch_add(1, std::memory_order_relaxed);
                break;
            case Outcome::Conflict:
                conflicting_declarations_.fetch_add(1, std::memory_order_relaxed);
                break;
        }

        return id;
    }

    void UsageTracker::merge_access(const DeclarationId id, const SyntacticContext context) {
        const AccessRole role = classify(context);
        used_.upsert(id, [role](UsageEntry& entry) {
            entry.record.merge(role);
            ++entry.occurrences;
        });
        occurrences_.fetch_add(1, std::memory_order_relaxed);
    }

    void UsageTracker::record_access(const DeclarationId id, const SyntacticContext context) {
        if (reject_if_finalized()) {
            return;
        }
        if (!is_issued(id)) {
            unknown_ids_.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        merge_access(id, context);
    }

    void UsageTracker::record_access(const SymbolKey& symbol, const SyntacticContext context) {
        if (reject_if_finalized()) {
            return;
        }
        merge_access(intern(symbol), context);
    }

    std::optional<Declaration> UsageTracker::declaration(const DeclarationId id) const {
        return declared_.find(id);
    }

    std::optional<UsageRecord> UsageTracker::usage(const DeclarationId id) const {
        if (const auto entry = used_.find(id)) {
            return entry->record;
        }
        return std::nullopt;
    }

    void UsageTracker::begin_producer() noexcept {
        active_producers_.fetch_add(1, std::memory_order_acq_rel);
    }

    void UsageTracker::end_producer() noexcept {
        active_producers_.fetch_sub(1, std::memory_order_acq_rel);
    }

    Result<std::vector<UnusedDeclaration>, Error> UsageTracker::finalize() {
        using FinalizeResult = Result<std::vector<UnusedDeclaration>, Error>;

        if (scope_ == DeclarationScope::WholeProgram) {
            if (const auto active = active_producers(); active > 0) {
                return FinalizeResult::failure(Error::contract_violation(
                    "finalize called while producers are active",
                    std::to_string(active) + " producer(s) still running"));
            }
        }

        if (bool expected = false; !finalized_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            return FinalizeResult::failure(Error::contract_violation(
                "finalize called more than once"));
        }

        std::vector<UnusedDeclaration> unused;
        for (auto& [id, declaration] : declared_.snapshot()) {
            UsageRecord record;
            if (const auto entry = used_.find(id)) {
                record = entry->record;
            }
            if (record.is_unused()) {
                unused.push_back({std::move(declaration), record});
            }
        }

        std::size_t orphans = 0;
        for (const auto& [id, entry] : used_.snapshot()) {
            if (!declared_.contains(id)) {
                orphans += entry.occurrences;
            }
        }
        orphan_occurrences_.store(orphans, std::memory_order_relaxed);

        std::ranges::sort(unused, report_order);
        return FinalizeResult::success(std::move(unused));
    }

    TrackerStats UsageTracker::stats() const {
        TrackerStats stats;
        stats.declarations = declarations_.load(std::memory_order_relaxed);
        stats.occurrences = occurrences_.load(std::memory_order_relaxed);
        stats.duplicate_declarations = duplicate_declarations_.load(std::memory_order_relaxed);
        stats.conflicting_declarations = conflicting_declarations_.load(std::memory_order_relaxed);
        stats.scope_mismatches = scope_mismatches_.load(std::memory_order_relaxed);
        stats.unknown_ids = unknown_ids_.load(std::memory_order_relaxed);
        stats.orphan_occurrences = orphan_occurrences_.load(std::memory_order_relaxed);
        stats.late_events = late_events_.load(std::memory_order_relaxed);
        return stats;
    }

}  // namespace dua::analysis
