#pragma once

#include <vector>

#include "journal/journal_types.hpp"

namespace dailyfeels::journal {

// The fixed seven-mood palette used whenever no configuration is stored.
const std::vector<MoodDefinition>& DefaultMoods();

}  // namespace dailyfeels::journal
