#include "stamp_clock.hh"
#include <cmath>
#include <iomanip>
#include <regex>
#include <sstream>
#include <stdexcept>

// --- CALENDAR DATE ---

// Civil-from-days and days-from-civil, see H. Hinnant's date algorithms
int64_t CalendarDate::ToDays() const {
    int64_t y = year;
    const int64_t m = month;
    const int64_t d = day;
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CalendarDate CalendarDate::FromDays(int64_t days) {
    days += 719468;
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const int64_t doe = days - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    const int64_t d = doy - (153 * mp + 2) / 5 + 1;
    const int64_t m = mp < 10 ? mp + 3 : mp - 9;
    const int64_t y = yoe + era * 400 + (m <= 2);

    CalendarDate date;
    date.year = static_cast<int>(y);
    date.month = static_cast<int>(m);
    date.day = static_cast<int>(d);
    return date;
}

bool CalendarDate::IsValid() const {
    if (month < 1 || month > 12 || day < 1) {
        return false;
    }
    static const int days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    int limit = days_in_month[month - 1] + ((month == 2 && leap) ? 1 : 0);
    return day <= limit;
}

CalendarDate CalendarDate::Parse(const std::string& text) {
    static const std::regex dotted(R"(^(\d{2})\.(\d{2})\.(\d{4})$)");
    static const std::regex iso(R"(^(\d{4})-(\d{2})-(\d{2})$)");

    std::smatch match;
    CalendarDate date;
    if (std::regex_match(text, match, dotted)) {
        date.day = std::stoi(match[1]);
        date.month = std::stoi(match[2]);
        date.year = std::stoi(match[3]);
    } else if (std::regex_match(text, match, iso)) {
        date.year = std::stoi(match[1]);
        date.month = std::stoi(match[2]);
        date.day = std::stoi(match[3]);
    } else {
        throw std::invalid_argument("Unrecognized date format: '" + text + "'");
    }

    if (!date.IsValid()) {
        throw std::invalid_argument("Date out of range: '" + text + "'");
    }
    return date;
}

bool CalendarDate::ExtractFromName(const std::string& name, CalendarDate& out) {
    static const std::regex dotted(R"((\d{2})\.(\d{2})\.(\d{4}))");
    std::smatch match;
    if (!std::regex_search(name, match, dotted)) {
        return false;
    }
    CalendarDate date;
    date.day = std::stoi(match[1]);
    date.month = std::stoi(match[2]);
    date.year = std::stoi(match[3]);
    if (!date.IsValid()) {
        return false;
    }
    out = date;
    return true;
}

std::string CalendarDate::ToString() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << day << '.'
        << std::setw(2) << month << '.' << std::setw(4) << year;
    return oss.str();
}

int64_t ParseClockTime(const std::string& text, bool allow_over_24h) {
    static const std::regex hms(R"(^(\d{1,3}):(\d{2}):(\d{2})$)");
    std::smatch match;
    if (!std::regex_match(text, match, hms)) {
        throw std::invalid_argument("Expected HH:MM:SS, got '" + text + "'");
    }
    int64_t h = std::stoll(match[1]);
    int64_t m = std::stoll(match[2]);
    int64_t s = std::stoll(match[3]);
    if (m > 59 || s > 59 || (!allow_over_24h && h > 23)) {
        throw std::invalid_argument("Time component out of range: '" + text + "'");
    }
    return h * 3600 + m * 60 + s;
}

// --- CLOCK ---

StampClock::StampClock(const CalendarDate& nominal_date, double start_seconds_of_day)
    : nominal_date_(nominal_date), elapsed_(start_seconds_of_day) {}

void StampClock::Advance(double seconds) {
    if (seconds < 0.0 || !std::isfinite(seconds)) {
        throw std::invalid_argument("Clock can only advance forward");
    }
    elapsed_ += seconds;
}

void StampClock::Shift(double seconds) {
    if (!std::isfinite(seconds)) {
        throw std::invalid_argument("Clock shift must be finite");
    }
    elapsed_ += seconds;
}

ClockReading StampClock::ReadingAt(double elapsed) const {
    double whole_days = std::floor(elapsed / static_cast<double>(SECONDS_PER_DAY));

    ClockReading reading;
    reading.elapsed = elapsed;
    reading.date = nominal_date_.AddDays(static_cast<int64_t>(whole_days));
    reading.seconds_of_day = elapsed - whole_days * static_cast<double>(SECONDS_PER_DAY);
    // Guard against 86400 - epsilon rounding up in the display
    if (reading.seconds_of_day >= static_cast<double>(SECONDS_PER_DAY)) {
        reading.seconds_of_day = 0.0;
        reading.date = reading.date.AddDays(1);
    }
    return reading;
}
