#ifndef POCKET_OPTIONS
#define POCKET_OPTIONS

#include <Pocket/types.hpp>

namespace Pocket {

    struct ledger_options {
        constexpr static char DefaultCurrency[] {"USD"};

        // category of the transaction that records the
        // starting value of a new wallet.
        constexpr static char StartingBalanceCategory[] {"Starting balance"};

        // thresholds for the large and small amount filters.
        constexpr static double DefaultLargeAmount {1000};
        constexpr static double DefaultSmallAmount {100};

        // limits on deposit terms.
        constexpr static double MaxInterestRate {100};
        constexpr static uint32 MinTermMonths {1};
        constexpr static uint32 MaxTermMonths {1200};
    };
}

#endif
