#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "rule_catalog.hpp"
#include "solver_base.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>


///////////////////////////
///     SOLVE MODEL     ///
///////////////////////////
/**
 * @brief Why a cell has the domain it starts with.
 */
enum class CellKind : std::uint8_t {
    Decision, ///< Free variable of the search.
    Anchor, ///< Caller-fixed station.
    Leave, ///< Pinned to the Leave station.
    History ///< At or before the boundary with a committed station.
};

/**
 * @brief One (trainee, month index) variable of the model.
 */
struct SolveCell {
    int ordinal; ///< Roster ordinal.
    int monthIndex; ///< Index relative to the trainee's start.
    MonthSerial month; ///< Absolute calendar month.
    CellKind kind;
};

/**
 * @brief Headcount bounds of one capacity rule in one calendar month.
 */
struct CapacityConstraint {
    int ruleIndex;
    MonthSerial month;
    int minOccupancy;
    int maxOccupancy;
    std::uint32_t pool; ///< Station mask of the pool.
    std::vector<int> cells; ///< Cells in that calendar month.
};

/**
 * @brief Ordering of two stations within one trainee's row.
 */
struct SequenceConstraint {
    int ruleIndex;
    int ordinal;
    StationId predecessor;
    StationId dependent;
};

/// Single-station mask.
inline std::uint32_t stationBit(StationId s) { return 1u << s; }

/// True if the mask holds exactly one station.
inline bool isSingleton(std::uint32_t mask) { return mask != 0 && (mask & (mask - 1)) == 0; }

/// Lowest station of a non-empty mask.
StationId lowestStation(std::uint32_t mask);

/**
 * @brief Compiled constraint model of one solve.
 *
 * Rows of active trainees are laid out contiguously, one cell per month index
 * of the revised length; inactive trainees have empty rows. Anchors, leave
 * months and history start with singleton domains, so they are constants
 * before the first decision. Enabled calendar windows are folded into the
 * initial domains of non-history cells.
 */
class SolveModel {
public:
    /**
     * @brief Build the model.
     *
     * @throws std::invalid_argument if the input is inconsistent (missing
     *         targets, row lengths that differ from the targets, anchors of
     *         unknown trainees or outside a row).
     */
    explicit SolveModel(const SolveInput& input);

    const SolveInput& input() const { return input_; }
    const SyllabusRuleSet& rules() const { return *input_.rules; }

    int traineeCount() const { return (int)rowStart_.size(); }
    int stationCount() const { return stationCount_; }

    int cellCount() const { return (int)cells_.size(); }
    const SolveCell& cell(int id) const { return cells_[id]; }
    std::uint32_t initialDomain(int id) const { return initialDomains_[id]; }

    int rowStart(int ordinal) const { return rowStart_[ordinal]; }
    int rowLength(int ordinal) const { return rowLength_[ordinal]; }

    /// Months the trainee must spend at a station.
    int need(int ordinal, StationId station) const { return need_[ordinal * stationCount_ + station]; }

    const std::vector<CapacityConstraint>& capacity() const { return capacity_; }
    const std::vector<SequenceConstraint>& sequences() const { return sequences_; }

    /// Capacity constraints binding a calendar month.
    const std::vector<int>& capacityAt(MonthSerial month) const;

    /// Sequence constraints of a trainee.
    const std::vector<int>& sequencesOf(int ordinal) const { return sequencesByRow_[ordinal]; }

    /// Stations that carry a calendar window.
    std::uint32_t windowedStations() const { return windowed_; }

    /// Decision cells in (ordinal, month index) order.
    const std::vector<int>& decisionOrder() const { return order_; }

    /// False if some cell has an empty initial domain.
    bool consistent() const { return failure_.empty(); }
    const std::string& failure() const { return failure_; }

private:
    SolveInput input_;
    int stationCount_ = 0;

    std::vector<SolveCell> cells_;
    std::vector<std::uint32_t> initialDomains_;
    std::vector<int> rowStart_;
    std::vector<int> rowLength_;
    std::vector<int> need_;

    std::vector<CapacityConstraint> capacity_;
    std::vector<SequenceConstraint> sequences_;
    MonthSerial monthBase_ = 0;
    std::vector<std::vector<int>> capacityByMonth_;
    std::vector<std::vector<int>> sequencesByRow_;
    std::uint32_t windowed_ = 0;
    std::vector<int> order_;
    std::string failure_;

    void buildCells();
    void buildCapacity();
    void buildSequences();
};


///////////////////////////
///    SEARCH STATE     ///
///////////////////////////
/**
 * @brief Domains of all cells during search, with trail-based undo.
 *
 * A cell counts as assigned once its domain is a single station. Every
 * domain change is recorded on the trail and schedules the propagators that
 * watch it:
 *  - duration per (trainee, station): assigned + possible months bracket the need,
 *  - capacity per (rule, month): certain + possible pool members bracket the bounds,
 *  - sequence per (trainee, rule): no dependent month before the earliest point
 *    the predecessor can be complete, no predecessor month after the latest
 *    point the dependent can start.
 */
class SearchState {
public:
    explicit SearchState(const SolveModel& model);

    std::uint32_t domain(int cell) const { return domains_[cell]; }
    bool fixed(int cell) const { return isSingleton(domains_[cell]); }

    /// Station of a fixed cell, kNoStation otherwise.
    StationId value(int cell) const;

    /// Fixed months of a trainee at a station.
    int assigned(int ordinal, StationId station) const {
        return assigned_[ordinal * model_.stationCount() + station];
    }

    /**
     * @brief Intersect a cell's domain with a mask.
     *
     * @return false (leaving the domain untouched) if the result is empty.
     */
    bool restrict(int cell, std::uint32_t mask);

    /**
     * @brief Run queued propagators to a fixpoint.
     *
     * @return false on a wipe-out or a violated bound; the queue is cleared.
     */
    bool propagate();

    /// Schedule every propagator and propagate (root consistency).
    bool initialize();

    std::size_t mark() const { return trail_.size(); }
    void undoTo(std::size_t mark);

private:
    const SolveModel& model_;
    int durationCount_;

    std::vector<std::uint32_t> domains_;
    std::vector<int> assigned_; ///< [ordinal * S + s]
    std::vector<int> possible_; ///< [ordinal * S + s]
    std::vector<int> capCertain_; ///< Cells surely in the pool, per capacity constraint.
    std::vector<int> capPossible_; ///< Cells that may still join the pool.

    std::vector<std::pair<int, std::uint32_t>> trail_; ///< (cell, previous domain)
    std::vector<int> queue_;
    std::size_t head_ = 0;
    std::vector<char> inQueue_;

    void count(int cell, std::uint32_t domain, int sign);
    void enqueue(int propagator);
    void schedule(int cell, std::uint32_t before, std::uint32_t after);
    void clearQueue();

    bool runDuration(int ordinal, StationId station);
    bool runCapacity(int index);
    bool runSequence(int index);
};
