#include "LearnerFiles.hpp"
#include "../core/Errors.hpp"
#include <cctype>
#include <spdlog/spdlog.h>

bool LearnerFiles::isValidName(const std::string& learner) {
    if (learner.empty() || learner.size() > MAX_NAME_LENGTH) return false;
    if (learner.front() == '.') return false;
    for (char c : learner) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_' && c != '.') return false;
    }
    return true;
}

void LearnerFiles::require(const std::string& learner) {
    if (!isValidName(learner)) {
        spdlog::warn("Rejected learner name of length {}", learner.size());
        throw ValidationError("Learner name may only use letters, digits, '-', '_' and '.'");
    }
}

std::string LearnerFiles::itemFile(const std::string& learner) {
    require(learner);
    return "data_" + learner + ".dat";
}

std::string LearnerFiles::reviewFile(const std::string& learner) {
    require(learner);
    return "reviews_" + learner + ".dat";
}

std::string LearnerFiles::saltFile(const std::string& learner) {
    require(learner);
    return learner + ".salt";
}

std::string LearnerFiles::configFile(const std::string& learner) {
    require(learner);
    return learner + ".cfg";
}
