#include "journal/default_moods.hpp"

namespace dailyfeels::journal {

const std::vector<MoodDefinition>& DefaultMoods() {
    static const std::vector<MoodDefinition> kDefaults = {
        {"happy", "\xF0\x9F\x98\x80", "Happy", std::string("#22c55e")},
        {"content", "\xF0\x9F\x99\x82", "Content", std::string("#10b981")},
        {"meh", "\xF0\x9F\x98\x90", "Meh", std::string("#a3a3a3")},
        {"anxious", "\xF0\x9F\x98\x95", "Anxious", std::string("#f59e0b")},
        {"sad", "\xF0\x9F\x98\xA2", "Sad", std::string("#3b82f6")},
        {"angry", "\xF0\x9F\x98\xA0", "Angry", std::string("#ef4444")},
        {"tired", "\xF0\x9F\x98\xB4", "Tired", std::string("#8b5cf6")},
    };
    return kDefaults;
}

}  // namespace dailyfeels::journal
