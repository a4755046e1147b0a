#include <Pocket/sort.hpp>

#include <cmath>

namespace Pocket {

    namespace {

        std::string lower (const std::string &x) {
            return data::to_lower (x);
        }

        bool most_recent (const transaction &a, const transaction &b) {
            if (a.Created != b.Created) return a.Created > b.Created;
            return a.ID < b.ID;
        }

        bool high_to_low (const transaction &a, const transaction &b) {
            double x = std::abs (a.Amount);
            double y = std::abs (b.Amount);
            if (x != y) return x > y;
            return a.ID < b.ID;
        }

        bool category_alphabetical (const transaction &a, const transaction &b) {
            std::string x = lower (a.Category);
            std::string y = lower (b.Category);
            if (x != y) return x < y;
            return a.ID < b.ID;
        }

    }

    template <> const std::vector<sorting_strategy<transaction>> &sorting_context<transaction>::strategies () {
        static const std::vector<sorting_strategy<transaction>> Strategies {
            {"1", "Most Recent", &most_recent},
            {"2", "High to Low", &high_to_low},
            {"3", "Alphabetical by Category", &category_alphabetical}};
        return Strategies;
    }

}
