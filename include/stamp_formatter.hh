#ifndef STAMP_FORMATTER_HH
#define STAMP_FORMATTER_HH

#include <array>
#include <string>
#include <vector>
#include "stamp_clock.hh"

// Renders a clock reading as the stamp text, e.g. "05 мар. 2025 г. 14:07:09"
class StampFormatter {
public:
    // Known locales: "ru", "en". Throws std::invalid_argument otherwise.
    explicit StampFormatter(const std::string& locale = "ru");

    std::string Format(const ClockReading& reading) const;

    // Overrides the locale's month table, exactly 12 entries
    void SetMonthNames(const std::vector<std::string>& names);
    void SetDateSuffix(const std::string& suffix) { date_suffix_ = suffix; }

private:
    std::array<std::string, 12> month_names_;
    std::string date_suffix_;
};

#endif // STAMP_FORMATTER_HH
