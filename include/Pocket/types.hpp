#ifndef POCKET_TYPES
#define POCKET_TYPES

#include <chrono>
#include <stdexcept>
#include <string>

#include <data/tools.hpp>
#include <data/net/JSON.hpp>
#include <data/io/exception.hpp>

namespace Pocket {
    using namespace data;

    // all times are UTC with second precision.
    using timestamp = std::chrono::sys_seconds;
    using date = std::chrono::year_month_day;

    // thrown when a caller provides something that the ledger cannot accept,
    // such as a non-positive amount or a duplicate wallet name.
    struct validation_error : std::logic_error {
        using std::logic_error::logic_error;
    };

    // thrown when the ledger finds itself in a state that should be impossible,
    // for example a transfer whose partner has disappeared. This indicates a bug
    // somewhere else and is not something a user can fix.
    struct invariant_violation : std::logic_error {
        using std::logic_error::logic_error;
    };

}

#endif
