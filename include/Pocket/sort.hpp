#ifndef POCKET_SORT
#define POCKET_SORT

#include <algorithm>
#include <map>
#include <vector>

#include <Pocket/transaction.hpp>

namespace Pocket {

    // a way of ordering X, chosen by a short key.
    template <typename X> struct sorting_strategy {
        std::string Key;
        std::string Name;

        // strict total order; ties must be broken so that
        // no two distinct elements compare equivalent.
        bool (*Before) (const X &, const X &);
    };

    // holds the active sorting strategy for a collection. The set of
    // strategies is fixed; the first one in the table is the default.
    template <typename X> struct sorting_context {
        using strategy = sorting_strategy<X>;

        static const std::vector<strategy> &strategies ();

        // key -> display name.
        static std::map<std::string, std::string> available ();

        sorting_context () : Current {0} {}

        const strategy &current () const {
            return strategies ()[Current];
        }

        // returns false and leaves the current strategy
        // in place if the key is unknown.
        bool set_strategy (const std::string &key);

        std::vector<const X *> sort (std::vector<const X *>) const;

    private:
        size_t Current;
    };

    using transaction_sorting = sorting_context<transaction>;

    template <> const std::vector<sorting_strategy<transaction>> &sorting_context<transaction>::strategies ();

    template <typename X> std::map<std::string, std::string> sorting_context<X>::available () {
        std::map<std::string, std::string> x;
        for (const strategy &s : strategies ()) x[s.Key] = s.Name;
        return x;
    }

    template <typename X> bool sorting_context<X>::set_strategy (const std::string &key) {
        const auto &table = strategies ();
        for (size_t i = 0; i < table.size (); i++) if (table[i].Key == key) {
            Current = i;
            return true;
        }

        return false;
    }

    template <typename X> std::vector<const X *> sorting_context<X>::sort (std::vector<const X *> x) const {
        auto before = current ().Before;
        std::stable_sort (x.begin (), x.end (), [before] (const X *a, const X *b) -> bool {
            return before (*a, *b);
        });
        return x;
    }

}

#endif
