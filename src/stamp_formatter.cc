#include "stamp_formatter.hh"
#include <iomanip>
#include <sstream>
#include <stdexcept>

StampFormatter::StampFormatter(const std::string& locale) {
    if (locale == "ru") {
        month_names_ = {"янв", "фев", "мар", "апр", "мая", "июн",
                        "июл", "авг", "сен", "окт", "ноя", "дек"};
        date_suffix_ = " г.";
    } else if (locale == "en") {
        month_names_ = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                        "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    } else {
        throw std::invalid_argument("Unsupported stamp locale: '" + locale + "'");
    }
}

void StampFormatter::SetMonthNames(const std::vector<std::string>& names) {
    if (names.size() != month_names_.size()) {
        throw std::invalid_argument("Expected 12 month names, got " + std::to_string(names.size()));
    }
    for (size_t i = 0; i < names.size(); ++i) {
        month_names_[i] = names[i];
    }
}

std::string StampFormatter::Format(const ClockReading& reading) const {
    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(2) << reading.date.day << ' '
        << month_names_[reading.date.month - 1] << ". "
        << std::setw(4) << reading.date.year << date_suffix_ << ' '
        << std::setw(2) << reading.Hours() << ':'
        << std::setw(2) << reading.Minutes() << ':'
        << std::setw(2) << reading.Seconds();
    return oss.str();
}
