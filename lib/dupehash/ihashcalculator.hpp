#ifndef IHASHCALCULATOR_HPP
#define IHASHCALCULATOR_HPP

#include <atomic>
#include <string>

#include "hashresult.hpp"

class IHashCalculator {
public:
    // Must be safe to call from several worker threads at once
    virtual HashResult calculate(const std::string& filePath,
                                 const std::atomic<bool>& cancel) const = 0;
    virtual ~IHashCalculator() = default;
};

#endif // IHASHCALCULATOR_HPP
