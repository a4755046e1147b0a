#ifndef POCKET_FILTER
#define POCKET_FILTER

#include <set>
#include <vector>

#include <Pocket/transaction.hpp>
#include <Pocket/options.hpp>

namespace Pocket {

    // a predicate over transactions that can be shown to the user by name.
    struct filter {
        virtual bool matches (const transaction &) const = 0;
        virtual std::string name () const = 0;
        virtual ~filter () {}
    };

    struct date_filter final : filter {
        enum period {
            today,
            this_week,
            last_week,
            this_month,
            last_month,
            this_year,
            last_year,
            range
        };

        period Period;

        // inclusive bounds, used when Period is range. Either may be left open.
        maybe<date> From;
        maybe<date> To;

        // the day that the relative periods are measured from.
        // If not set, the current day is used whenever the filter runs.
        maybe<date> Reference;

        date_filter (period p, maybe<date> reference = {}) : Period {p}, From {}, To {}, Reference {reference} {}

        static date_filter between (maybe<date> from, maybe<date> to) {
            date_filter f {range};
            f.From = from;
            f.To = to;
            return f;
        }

        struct bounds {
            maybe<date> From;
            maybe<date> To;
        };

        bounds get_bounds () const;

        bool matches (const transaction &) const final override;
        std::string name () const final override;
    };

    struct direction_filter final : filter {
        enum mode {
            income,
            expense,
            transfers,
            no_transfers
        };

        mode Mode;

        // only meaningful for income and expense.
        bool IncludeTransfers;

        direction_filter (mode m, bool include_transfers = true) : Mode {m}, IncludeTransfers {include_transfers} {}

        bool matches (const transaction &) const final override;
        std::string name () const final override;
    };

    struct category_filter final : filter {
        std::set<std::string> Categories;

        // if true, match everything except the given categories.
        bool Exclude;

        category_filter (std::set<std::string> categories, bool exclude = false) :
            Categories {categories}, Exclude {exclude} {}

        bool matches (const transaction &) const final override;
        std::string name () const final override;
    };

    // inclusive bounds on the size of the transaction.
    struct amount_filter final : filter {
        maybe<double> Min;
        maybe<double> Max;

        amount_filter (maybe<double> min, maybe<double> max) : Min {min}, Max {max} {}

        static amount_filter large (double threshold = ledger_options::DefaultLargeAmount) {
            return amount_filter {threshold, {}};
        }

        static amount_filter small (double threshold = ledger_options::DefaultSmallAmount) {
            return amount_filter {{}, threshold};
        }

        bool matches (const transaction &) const final override;
        std::string name () const final override;
    };

    struct description_filter final : filter {
        std::string Text;
        bool CaseSensitive;

        description_filter (const std::string &text, bool case_sensitive = false) :
            Text {text}, CaseSensitive {case_sensitive} {}

        bool matches (const transaction &) const final override;
        std::string name () const final override;
    };

    // filters that need no parameters and can be chosen by a short key.
    enum class filter_preset {
        today,
        this_week,
        last_week,
        this_month,
        last_month,
        this_year,
        last_year,
        income,
        income_no_transfers,
        expense,
        expense_no_transfers,
        transfers,
        no_transfers,
        large,
        small
    };

    struct filter_preset_entry {
        std::string Key;
        filter_preset Preset;
    };

    const std::vector<filter_preset_entry> &filter_presets ();

    maybe<filter_preset> read_filter_preset (const std::string &key);

    ptr<const filter> make_filter (filter_preset);

    // Active filters for a view. A transaction is shown only
    // if it matches every one of them.
    struct filtering_context {

        void add (ptr<const filter> f) {
            if (f != nullptr) Filters.push_back (f);
        }

        // returns false if there is no filter at that (zero-based) index.
        bool remove (size_t index);

        void clear () {
            Filters.clear ();
        }

        bool has_filters () const {
            return !Filters.empty ();
        }

        std::string summary () const;

        const std::vector<ptr<const filter>> &active () const {
            return Filters;
        }

        bool matches (const transaction &) const;

        // keeps the order of the input.
        std::vector<const transaction *> apply (const std::vector<const transaction *> &) const;

    private:
        std::vector<ptr<const filter>> Filters;
    };

}

#endif
