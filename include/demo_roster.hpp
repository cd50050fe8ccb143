#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <vector>


///////////////////////////
///        DEMO         ///
///////////////////////////
/**
 * @brief Size of a synthetic cohort.
 */
enum class DemoSize {
    S, ///< 4 trainees.
    M, ///< 12 trainees.
    L ///< 24 trainees.
};

int demoTraineeCount(DemoSize size);

/**
 * @brief Synthetic roster with staggered intakes.
 *
 * One trainee starts every two months from the first intake, departments
 * alternate, and every fourth trainee follows Model B.
 */
std::vector<Trainee> makeDemoRoster(DemoSize size, YearMonth firstIntake);

/**
 * @brief One maternity leave (8 months, within syllabus) for the second trainee.
 */
std::vector<LeaveEvent> makeDemoLeave(const std::vector<Trainee>& roster);
