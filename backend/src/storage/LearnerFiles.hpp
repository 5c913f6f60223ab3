#pragma once
#include <string>

// Per-learner file names, all relative to the working directory.
// Learner names are restricted so they can never leave it.
class LearnerFiles {
public:
    // Letters, digits, '-', '_' and '.', at most 64 characters, not starting
    // with '.'
    static bool isValidName(const std::string& learner);

    // Throw ValidationError for an invalid learner name
    static std::string itemFile(const std::string& learner);
    static std::string reviewFile(const std::string& learner);
    static std::string saltFile(const std::string& learner);
    static std::string configFile(const std::string& learner);

    static constexpr size_t MAX_NAME_LENGTH = 64;

private:
    static void require(const std::string& learner);
};
