#include <Pocket/time.hpp>

#include <iomanip>
#include <regex>
#include <sstream>

namespace Pocket {

    timestamp now () {
        return std::chrono::floor<std::chrono::seconds> (std::chrono::system_clock::now ());
    }

    date day_of (const timestamp &t) {
        return date {std::chrono::floor<std::chrono::days> (t)};
    }

    std::chrono::day last_day_of_month (const date &d) {
        return std::chrono::year_month_day_last {d.year (), std::chrono::month_day_last {d.month ()}}.day ();
    }

    date add_months (const date &d, int32 months) {
        std::chrono::year_month ym = std::chrono::year_month {d.year (), d.month ()} + std::chrono::months {months};
        std::chrono::day last = std::chrono::year_month_day_last {ym.year (), std::chrono::month_day_last {ym.month ()}}.day ();
        return date {ym.year (), ym.month (), std::min (d.day (), last)};
    }

    std::string write_date (const date &d) {
        std::stringstream ss;
        ss << std::setfill ('0') << std::setw (4) << int (d.year ()) << "-"
            << std::setw (2) << unsigned (d.month ()) << "-"
            << std::setw (2) << unsigned (d.day ());
        return ss.str ();
    }

    std::string write_timestamp (const timestamp &t) {
        auto day = std::chrono::floor<std::chrono::days> (t);
        std::chrono::hh_mm_ss<std::chrono::seconds> time {t - day};
        std::stringstream ss;
        ss << write_date (date {day}) << " " << std::setfill ('0')
            << std::setw (2) << time.hours ().count () << ":"
            << std::setw (2) << time.minutes ().count () << ":"
            << std::setw (2) << time.seconds ().count ();
        return ss.str ();
    }

    maybe<timestamp> read_timestamp (const std::string &x) {
        static const std::regex pattern {R"(^\s*(\d{4})-(\d{1,2})-(\d{1,2})(?:[ T](\d{1,2}):(\d{2})(?::(\d{2}))?)?\s*$)"};

        std::smatch match;
        if (!std::regex_match (x, match, pattern)) return {};

        date d {std::chrono::year {std::stoi (match[1])},
            std::chrono::month {unsigned (std::stoi (match[2]))},
            std::chrono::day {unsigned (std::stoi (match[3]))}};

        if (!d.ok ()) return {};

        int hours = match[4].matched ? std::stoi (match[4]) : 0;
        int minutes = match[5].matched ? std::stoi (match[5]) : 0;
        int seconds = match[6].matched ? std::stoi (match[6]) : 0;

        if (hours > 23 || minutes > 59 || seconds > 59) return {};

        return {start_of (d) + std::chrono::hours {hours} + std::chrono::minutes {minutes} + std::chrono::seconds {seconds}};
    }

    maybe<date> read_date (const std::string &x) {
        maybe<timestamp> t = read_timestamp (x);
        if (!bool (t)) return {};
        return {day_of (*t)};
    }

}
