#ifndef POCKET_CATEGORY
#define POCKET_CATEGORY

#include <set>

#include <Pocket/transaction.hpp>

namespace Pocket {

    // Known category names for each direction. One of these is shared by
    // all the wallets belonging to a wallet_manager. Categories are never
    // removed; they accumulate as transactions are recorded.
    struct category_manager {
        category_manager ();

        std::set<std::string> categories (direction) const;

        void add (const std::string &, direction);

        bool contains (const std::string &, direction) const;

        explicit category_manager (const JSON &);
        explicit operator JSON () const;

    private:
        std::set<std::string> Income;
        std::set<std::string> Expense;

        std::set<std::string> &get (direction d) {
            return d == direction::income ? Income : Expense;
        }

        const std::set<std::string> &get (direction d) const {
            return d == direction::income ? Income : Expense;
        }
    };

    std::set<std::string> inline category_manager::categories (direction d) const {
        return get (d);
    }

    void inline category_manager::add (const std::string &x, direction d) {
        get (d).insert (x);
    }

    bool inline category_manager::contains (const std::string &x, direction d) const {
        return get (d).contains (x);
    }

}

#endif
