#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <cstdint>
#include <string>
#include <vector>


///////////////////////////
///      CALENDAR       ///
///////////////////////////
/// Absolute month number (year * 12 + month - 1), used for all calendar arithmetic.
using MonthSerial = int;

/**
 * @brief A calendar month (e.g. 2024-06).
 */
struct YearMonth {
    int year; ///< Four-digit year.
    int month; ///< Month of the year, 1..12.
};

bool operator==(const YearMonth& a, const YearMonth& b);
bool operator!=(const YearMonth& a, const YearMonth& b);
bool operator<(const YearMonth& a, const YearMonth& b);

MonthSerial toSerial(const YearMonth& ym);
YearMonth fromSerial(MonthSerial serial);

/**
 * @brief Month of the year (1..12) of an absolute month number.
 */
int calendarMonthOf(MonthSerial serial);

/// Formats as "YYYY-MM".
std::string formatYearMonth(const YearMonth& ym);

/**
 * @brief Parse "YYYY-MM".
 *
 * @throws std::invalid_argument if the text is not a valid year-month.
 */
YearMonth parseYearMonth(const std::string& text);


///////////////////////////
///       MODELS        ///
///////////////////////////
/// Small integer station identifier, an index into the bound rule set.
using StationId = std::uint8_t;

/// Marks an empty matrix cell.
static constexpr StationId kNoStation = 0xFF;

/// Station domains are 32-bit masks, so a rule set holds at most 32 stations.
static constexpr int kMaxStations = 32;

static constexpr int kModelAMonths = 72;
static constexpr int kModelBMonths = 66;

/**
 * @brief Syllabus track of a trainee.
 */
enum class Track { ModelA, ModelB };

/**
 * @brief Department partition, fixed at intake.
 */
enum class Department { A, B };

/// Nominal program length of a track (72 or 66 months).
int trackLength(Track track);

const char* trackName(Track track);
const char* departmentName(Department department);

/**
 * @brief A trainee on the program roster.
 *
 * The roster ordinal (position in the roster vector) addresses the trainee's
 * row in the schedule matrix; the id is the caller's stable identity.
 */
struct Trainee {
    int id; ///< Stable identity supplied by the caller.
    std::string name; ///< Display name.
    Track track; ///< ModelA (72 months) or ModelB (66 months).
    Department department; ///< Department partition.
    YearMonth start; ///< Calendar month of month-index 0.
    int targetLength; ///< Months to complete; only leave processing changes it.
    bool active = true; ///< False once graduated.
};

/**
 * @brief Create a trainee with the nominal length of its track.
 */
Trainee makeTrainee(int id, std::string name, Track track, Department department, YearMonth start);

/**
 * @brief One (trainee, month-index) -> station value.
 *
 * Anchors are Assignments the caller has fixed.
 */
struct Assignment {
    int traineeId; ///< Trainee identity (not the roster ordinal).
    int monthIndex; ///< Month relative to the trainee's start month.
    StationId station; ///< Assigned station.
};

bool operator==(const Assignment& a, const Assignment& b);

/**
 * @brief How a reported leave affects the syllabus.
 */
enum class LeaveClass {
    WithinSyllabus, ///< Deducts from the rotation allotment, up to the policy cap.
    Extension ///< Pushes the completion date by the full duration.
};

/**
 * @brief A life event reported by an authorized caller.
 */
struct LeaveEvent {
    int traineeId; ///< Affected trainee.
    YearMonth start; ///< First calendar month of the leave.
    int durationMonths; ///< Number of whole months.
    LeaveClass classification; ///< Within-syllabus or extension.
    std::string note; ///< Free text (e.g. "maternity", "unpaid").
};
