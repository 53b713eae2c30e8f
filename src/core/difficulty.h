/**
 * @file difficulty.h
 * @brief AI difficulty levels and their tuning profiles
 */

#pragma once

#include <string>

namespace pongsim {

/**
 * @brief Available AI difficulty levels
 */
enum class Difficulty {
    Easy = 0,
    Medium,
    Hard
};

/**
 * @brief Tuning for one difficulty level
 *
 * The AI only reacts every reaction_delay ticks. When it reacts it moves
 * at most speed units toward its target, but only with probability
 * accuracy; the target itself is off by up to prediction_error.
 */
struct AiProfile {
    int reaction_delay;       ///< Ticks between AI reactions (>= 3 for every level)
    double speed;             ///< Max paddle travel per reaction, arena units
    double accuracy;          ///< Probability of acting on a reaction cycle
    double prediction_error;  ///< Max absolute error added to the predicted intercept
};

/**
 * @brief Profile for a difficulty level
 */
const AiProfile& profile_for(Difficulty d);

/**
 * @brief Next level in the easy -> medium -> hard -> easy cycle
 */
Difficulty next_difficulty(Difficulty d);

const char* difficulty_name(Difficulty d);

/**
 * @brief Parse "easy", "medium" or "hard" (case-insensitive)
 *
 * @return true if the name was recognised; out is untouched otherwise
 */
bool parse_difficulty(const std::string& name, Difficulty& out);

} // namespace pongsim
