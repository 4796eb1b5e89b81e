#include "journal/mood_config_service.hpp"

#include <utility>

#include "journal/default_moods.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace dailyfeels::journal {

MoodConfigService::MoodConfigService(store::DocumentStore& store, Clock clock)
    : store_(store)
    , clock_(clock ? std::move(clock) : Clock(utils::NowIsoUtc)) {}

std::vector<MoodDefinition> MoodConfigService::GetConfiguration() {
    auto stored = store_.LoadMoodConfig();
    if (!stored.has_value() || stored->empty()) {
        return DefaultMoods();
    }
    return *stored;
}

std::vector<MoodDefinition> MoodConfigService::SetConfiguration(const std::vector<MoodDefinition>& moods) {
    store_.ReplaceMoodConfig(moods, clock_());
    utils::LogInfo("config", "mood configuration replaced with " + std::to_string(moods.size()) + " moods");
    return moods;
}

const std::vector<MoodDefinition>& MoodConfigService::Defaults() {
    return DefaultMoods();
}

}  // namespace dailyfeels::journal
