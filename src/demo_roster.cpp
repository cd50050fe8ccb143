///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "demo_roster.hpp"
#include <string>


///////////////////////////
///     DEMO ROSTER     ///
///////////////////////////
static const char* kNames[] = {
        "Avery", "Blake", "Casey", "Devon", "Emery", "Finley", "Gray", "Harper",
        "Indigo", "Jordan", "Kai", "Logan", "Morgan", "Noa", "Oakley", "Parker",
        "Quinn", "Riley", "Sage", "Taylor", "Umber", "Val", "Wren", "Yael"
};

int demoTraineeCount(DemoSize size) {
    switch (size) {
        case DemoSize::S: return 4;
        case DemoSize::M: return 12;
        case DemoSize::L: return 24;
    }
    return 4;
}

std::vector<Trainee> makeDemoRoster(DemoSize size, YearMonth firstIntake) {
    std::vector<Trainee> roster;
    const int count = demoTraineeCount(size);
    const MonthSerial first = toSerial(firstIntake);

    for (int i = 0; i < count; ++i) {
        const Track track = (i % 4 == 3) ? Track::ModelB : Track::ModelA;
        const Department department = (i % 2 == 0) ? Department::A : Department::B;
        roster.push_back(makeTrainee(100 + i, kNames[i], track, department, fromSerial(first + 2 * i)));
    }
    return roster;
}

std::vector<LeaveEvent> makeDemoLeave(const std::vector<Trainee>& roster) {
    std::vector<LeaveEvent> events;
    if (roster.size() < 2) return events;

    // Leave starting in the second program year.
    const Trainee& t = roster[1];
    events.push_back(LeaveEvent{t.id, fromSerial(toSerial(t.start) + 18), 8, LeaveClass::WithinSyllabus, "maternity"});
    return events;
}
