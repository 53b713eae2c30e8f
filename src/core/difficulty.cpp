/**
 * @file difficulty.cpp
 * @brief Difficulty profile table
 */

#include "core/difficulty.h"

#include <algorithm>
#include <cctype>

namespace pongsim {

namespace {

const AiProfile kEasy   {15, 0.03, 0.70, 0.15};
const AiProfile kMedium { 8, 0.05, 0.85, 0.08};
const AiProfile kHard   { 3, 0.08, 0.95, 0.03};

} // namespace

const AiProfile& profile_for(Difficulty d) {
    switch (d) {
        case Difficulty::Easy: return kEasy;
        case Difficulty::Medium: return kMedium;
        case Difficulty::Hard: return kHard;
    }
    return kMedium;
}

Difficulty next_difficulty(Difficulty d) {
    switch (d) {
        case Difficulty::Easy: return Difficulty::Medium;
        case Difficulty::Medium: return Difficulty::Hard;
        case Difficulty::Hard: return Difficulty::Easy;
    }
    return Difficulty::Medium;
}

const char* difficulty_name(Difficulty d) {
    switch (d) {
        case Difficulty::Easy: return "easy";
        case Difficulty::Medium: return "medium";
        case Difficulty::Hard: return "hard";
    }
    return "medium";
}

bool parse_difficulty(const std::string& name, Difficulty& out) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (n == "easy") { out = Difficulty::Easy; return true; }
    if (n == "medium") { out = Difficulty::Medium; return true; }
    if (n == "hard") { out = Difficulty::Hard; return true; }
    return false;
}

} // namespace pongsim
