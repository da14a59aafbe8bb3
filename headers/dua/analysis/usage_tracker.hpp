//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef DUA_USAGE_TRACKER_HPP
#define DUA_USAGE_TRACKER_HPP

/**
 * @file usage_tracker.hpp
 * @brief Aggregates declarations and their accesses, then sweeps the unused.
 *
 * A tracker owns two sets for one analysis run:
 * - declared: DeclarationId -> Declaration
 * - used:     DeclarationId -> UsageRecord
 *
 * finalize() returns every declared entry without a recorded read, ordered
 * by (location, symbol, id) so reports are reproducible.
 *
 * Two scopes share this class:
 * - WholeProgram (fields): units are processed concurrently. Each producer
 *   holds a ProducerScope; finalize() is refused while any is alive.
 * - SingleBody (parameters): one tracker per callable, finalized as soon as
 *   the body (and, for constructors, the initializer) has been walked.
 *
 * Identity: front-end SymbolKeys are interned into DeclarationIds at first
 * sight, whether that first sight is a declaration or an occurrence, so an
 * occurrence in one unit may arrive before the declaration in another.
 *
 * Malformed input never fails. It is dropped and counted in TrackerStats.
 */

#include "dua/types.hpp"
#include "dua/result.hpp"
#include "dua/error.hpp"
#include "dua/utils/concurrent_map.hpp"

#include <atomic>
#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace dua::analysis {

    /**
     * Internal diagnostics for one tracker. Never surfaced as errors.
     */
    struct TrackerStats {
        std::size_t declarations = 0;              ///< Distinct declarations registered
        std::size_t occurrences = 0;               ///< Occurrences merged into a usage record
        std::size_t duplicate_declarations = 0;    ///< Same binding declared again (partial declarations)
        std::size_t conflicting_declarations = 0;  ///< Same binding declared again with another kind
        std::size_t scope_mismatches = 0;          ///< Declaration kind does not belong to this tracker's scope
        std::size_t unknown_ids = 0;               ///< Accesses naming an id this tracker never issued
        std::size_t orphan_occurrences = 0;        ///< Occurrences of bindings that were never declared
        std::size_t late_events = 0;               ///< Events delivered after finalize()

        void merge(const TrackerStats& other) noexcept;

        [[nodiscard]] std::size_t malformed_events() const noexcept {
            return conflicting_declarations + scope_mismatches + unknown_ids +
                   orphan_occurrences + late_events;
        }
    };

    /**
     * A finalize() result entry.
     */
    struct UnusedDeclaration {
        Declaration declaration;
        UsageRecord usage;
    };

    class UsageTracker {
    public:
        /**
         * @param scope       Which declarations this tracker accepts.
         * @param shard_count Shards for the backing maps; single-body
         *                    trackers are confined to one worker and use 1.
         */
        explicit UsageTracker(DeclarationScope scope, std::size_t shard_count = 0);

        UsageTracker(const UsageTracker&) = delete;
        UsageTracker& operator=(const UsageTracker&) = delete;

        [[nodiscard]] DeclarationScope scope() const noexcept {
            return scope_;
        }

        /**
         * Registers a declaration and returns its id.
         *
         * Idempotent per symbol: declaring a known binding returns the
         * existing id. A re-declaration with another kind is ignored. A
         * kind outside this tracker's scope returns INVALID_DECLARATION_ID.
         * The id field of the argument is ignored.
         */
        DeclarationId declare(Declaration declaration);

        /**
         * Returns the id for a symbol, issuing one on first sight.
         */
        DeclarationId intern(const SymbolKey& symbol);

        [[nodiscard]] std::optional<DeclarationId> lookup(const SymbolKey& symbol) const;

        /**
         * Classifies the context and OR-merges the role into the usage
         * record. An id this tracker never issued is dropped and counted.
         */
        void record_access(DeclarationId id, SyntacticContext context);

        /**
         * Same as above, addressed by symbol. The symbol need not be
         * declared yet.
         */
        void record_access(const SymbolKey& symbol, SyntacticContext context);

        void record(const Occurrence& occurrence) {
            record_access(occurrence.symbol, occurrence.context);
        }

        [[nodiscard]] std::optional<Declaration> declaration(DeclarationId id) const;
        [[nodiscard]] std::optional<UsageRecord> usage(DeclarationId id) const;

        /**
         * Producer barrier. Whole-program finalize() is refused while the
         * count is non-zero. Prefer ProducerScope.
         */
        void begin_producer() noexcept;
        void end_producer() noexcept;

        [[nodiscard]] std::size_t active_producers() const noexcept {
            return active_producers_.load(std::memory_order_acquire);
        }

        /**
         * Sweeps declared minus used-with-read.
         *
         * Fails with ContractViolation if producers are still active on a
         * whole-program tracker, or if finalize() already ran. A refused
         * call leaves the tracker usable.
         */
        [[nodiscard]] Result<std::vector<UnusedDeclaration>, Error> finalize();

        [[nodiscard]] bool is_finalized() const noexcept {
            return finalized_.load(std::memory_order_acquire);
        }

        [[nodiscard]] TrackerStats stats() const;

    private:
        struct UsageEntry {
            UsageRecord record;
            std::size_t occurrences = 0;
        };

        bool reject_if_finalized() noexcept;
        [[nodiscard]] bool is_issued(DeclarationId id) const;
        void merge_access(DeclarationId id, SyntacticContext context);

        DeclarationScope scope_;

        mutable std::shared_mutex interner_mutex_;
        std::unordered_map<SymbolKey, DeclarationId> ids_;
        DeclarationId next_id_ = INVALID_DECLARATION_ID + 1;

        utils::ConcurrentMap<DeclarationId, Declaration> declared_;
        utils::ConcurrentMap<DeclarationId, UsageEntry> used_;

        std::atomic<std::size_t> active_producers_{0};
        std::atomic<bool> finalized_{false};

        std::atomic<std::size_t> declarations_{0};
        std::atomic<std::size_t> occurrences_{0};
        std::atomic<std::size_t> duplicate_declarations_{0};
        std::atomic<std::size_t> conflicting_declarations_{0};
        std::atomic<std::size_t> scope_mismatches_{0};
        std::atomic<std::size_t> unknown_ids_{0};
        std::atomic<std::size_t> orphan_occurrences_{0};
        std::atomic<std::size_t> late_events_{0};
    };

    /**
     * RAII producer registration for one source unit.
     *
     * @code
     *     parallel::for_each(units, [&](const SourceUnit& unit) {
     *         ProducerScope producer(tracker);
     *         feed(unit, tracker);
     *     }, pool);
     *     auto unused = tracker.finalize();
     * @endcode
     */
    class ProducerScope {
    public:
        explicit ProducerScope(UsageTracker& tracker) noexcept
            : tracker_(tracker) {
            tracker_.begin_producer();
        }

        ~ProducerScope() {
            tracker_.end_producer();
        }

        ProducerScope(const ProducerScope&) = delete;
        ProducerScope& operator=(const ProducerScope&) = delete;

    private:
        UsageTracker& tracker_;
    };

}  // namespace dua::analysis

#endif //DUA_USAGE_TRACKER_HPP
