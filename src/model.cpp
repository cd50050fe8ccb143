///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <cstdio>
#include <stdexcept>
#include <utility>


///////////////////////////
///      CALENDAR       ///
///////////////////////////
bool operator==(const YearMonth& a, const YearMonth& b) {
    return a.year == b.year && a.month == b.month;
}

bool operator!=(const YearMonth& a, const YearMonth& b) {
    return !(a == b);
}

bool operator<(const YearMonth& a, const YearMonth& b) {
    return toSerial(a) < toSerial(b);
}

MonthSerial toSerial(const YearMonth& ym) {
    return ym.year * 12 + (ym.month - 1);
}

YearMonth fromSerial(MonthSerial serial) {
    YearMonth ym;
    ym.year = serial / 12;
    ym.month = serial % 12 + 1;
    return ym;
}

int calendarMonthOf(MonthSerial serial) {
    return serial % 12 + 1;
}

std::string formatYearMonth(const YearMonth& ym) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d", ym.year, ym.month);
    return buf;
}

/**
 * @brief Parse a "YYYY-MM" string.
 *
 * Rejects anything else, including out-of-range months, so configuration
 * typos surface at load time.
 */
YearMonth parseYearMonth(const std::string& text) {
    int year = 0;
    int month = 0;
    char tail = 0;
    if (std::sscanf(text.c_str(), "%d-%d%c", &year, &month, &tail) != 2) {
        throw std::invalid_argument("malformed year-month '" + text + "' (expected YYYY-MM)");
    }
    if (month < 1 || month > 12 || year < 1900 || year > 9999) {
        throw std::invalid_argument("year-month out of range: '" + text + "'");
    }
    return YearMonth{year, month};
}


///////////////////////////
///       MODELS        ///
///////////////////////////
int trackLength(Track track) {
    return track == Track::ModelA ? kModelAMonths : kModelBMonths;
}

const char* trackName(Track track) {
    switch (track) {
        case Track::ModelA: return "ModelA";
        case Track::ModelB: return "ModelB";
    }
    return "Unknown";
}

const char* departmentName(Department department) {
    switch (department) {
        case Department::A: return "A";
        case Department::B: return "B";
    }
    return "?";
}

Trainee makeTrainee(int id, std::string name, Track track, Department department, YearMonth start) {
    Trainee t;
    t.id = id;
    t.name = std::move(name);
    t.track = track;
    t.department = department;
    t.start = start;
    t.targetLength = trackLength(track);
    t.active = true;
    return t;
}

bool operator==(const Assignment& a, const Assignment& b) {
    return a.traineeId == b.traineeId && a.monthIndex == b.monthIndex && a.station == b.station;
}
