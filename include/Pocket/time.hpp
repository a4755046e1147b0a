#ifndef POCKET_TIME
#define POCKET_TIME

#include <Pocket/types.hpp>

namespace Pocket {

    timestamp now ();

    date day_of (const timestamp &);

    date inline today () {
        return day_of (now ());
    }

    // advance by a number of calendar months. If the day does not
    // exist in the resulting month, use the last day of that month.
    date add_months (const date &, int32 months);

    std::chrono::day last_day_of_month (const date &);

    // YYYY-MM-DD
    std::string write_date (const date &);

    // YYYY-MM-DD HH:MM:SS
    std::string write_timestamp (const timestamp &);

    // accepts YYYY-MM-DD, optionally followed by HH:MM or HH:MM:SS
    // separated by a space or a 'T'.
    maybe<timestamp> read_timestamp (const std::string &);
    maybe<date> read_date (const std::string &);

    timestamp inline start_of (const date &d) {
        return timestamp {std::chrono::sys_days {d}};
    }

}

#endif
