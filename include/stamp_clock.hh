#ifndef STAMP_CLOCK_HH
#define STAMP_CLOCK_HH

#include <cstdint>
#include <string>

constexpr int64_t SECONDS_PER_DAY = 86400;

// --- CALENDAR DATE ---

struct CalendarDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    // Days since 1970-01-01 (proleptic Gregorian)
    int64_t ToDays() const;
    static CalendarDate FromDays(int64_t days);

    CalendarDate AddDays(int64_t days) const { return FromDays(ToDays() + days); }
    bool IsValid() const;

    // Accepts "DD.MM.YYYY" or "YYYY-MM-DD". Throws std::invalid_argument.
    static CalendarDate Parse(const std::string& text);
    // Finds the first DD.MM.YYYY occurrence inside a folder name
    static bool ExtractFromName(const std::string& name, CalendarDate& out);

    std::string ToString() const; // DD.MM.YYYY

    bool operator==(const CalendarDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const CalendarDate& other) const { return !(*this == other); }
};

// "HH:MM:SS" -> seconds. Hours may exceed 23 when used as a duration.
// Throws std::invalid_argument on malformed input.
int64_t ParseClockTime(const std::string& text, bool allow_over_24h = false);

// --- CLOCK ---

struct ClockReading {
    CalendarDate date;
    double seconds_of_day = 0.0; // [0, 86400)
    double elapsed = 0.0;        // seconds since nominal midnight, for ordering

    int Hours() const { return static_cast<int>(seconds_of_day) / 3600; }
    int Minutes() const { return (static_cast<int>(seconds_of_day) % 3600) / 60; }
    int Seconds() const { return static_cast<int>(seconds_of_day) % 60; }
};

// Run-scoped clock. Only ever moves forward once the run has started;
// the date follows from how many whole days have elapsed since the
// nominal date's midnight.
class StampClock {
public:
    StampClock(const CalendarDate& nominal_date, double start_seconds_of_day);

    void Advance(double seconds);
    // Signed one-off correction of the starting point (start jitter)
    void Shift(double seconds);

    ClockReading Now() const { return ReadingAt(elapsed_); }
    ClockReading ReadingAt(double elapsed) const;
    double Elapsed() const { return elapsed_; }
    const CalendarDate& NominalDate() const { return nominal_date_; }

private:
    CalendarDate nominal_date_;
    double elapsed_;
};

#endif // STAMP_CLOCK_HH
