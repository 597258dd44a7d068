#pragma once
#include <string>

// Display projection of an interval. Persisted scheduled_days stay unrounded;
// only what the learner sees is snapped to whole minutes (< 1 day) or whole days.
double displayInterval(double days);

// Short label for rating buttons: "< 1 min", "10 min", "3 hr", "1 day", "12 days", "4 mo", "1.5 yr"
std::string formatInterval(double days);
