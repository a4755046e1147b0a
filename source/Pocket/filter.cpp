#include <Pocket/filter.hpp>

#include <iomanip>
#include <sstream>

namespace Pocket {

    namespace {

        date first_of_month (const date &d) {
            return date {d.year (), d.month (), std::chrono::day {1}};
        }

        date last_of_month (const date &d) {
            return date {d.year (), d.month (), last_day_of_month (d)};
        }

        date monday_of (const date &d) {
            std::chrono::sys_days day {d};
            std::chrono::weekday wd {day};
            return date {day - std::chrono::days {wd.iso_encoding () - 1}};
        }

        std::string write_amount (double x) {
            std::stringstream ss;
            ss << std::fixed << std::setprecision (2) << x;
            return ss.str ();
        }

    }

    date_filter::bounds date_filter::get_bounds () const {
        if (Period == range) return bounds {From, To};

        date day = bool (Reference) ? *Reference : Pocket::today ();

        switch (Period) {
            case today:
                return bounds {day, day};

            case this_week: {
                date monday = monday_of (day);
                return bounds {monday, date {std::chrono::sys_days {monday} + std::chrono::days {6}}};
            }

            case last_week: {
                std::chrono::sys_days monday {monday_of (day)};
                return bounds {date {monday - std::chrono::days {7}}, date {monday - std::chrono::days {1}}};
            }

            case this_month:
                return bounds {first_of_month (day), last_of_month (day)};

            case last_month: {
                date previous = add_months (first_of_month (day), -1);
                return bounds {previous, last_of_month (previous)};
            }

            case this_year:
                return bounds {date {day.year (), std::chrono::January, std::chrono::day {1}},
                    date {day.year (), std::chrono::December, std::chrono::day {31}}};

            case last_year: {
                std::chrono::year y = day.year () - std::chrono::years {1};
                return bounds {date {y, std::chrono::January, std::chrono::day {1}},
                    date {y, std::chrono::December, std::chrono::day {31}}};
            }

            default:
                throw exception {} << "unknown date filter period";
        }
    }

    bool date_filter::matches (const transaction &t) const {
        bounds b = get_bounds ();
        date d = day_of (t.Created);
        if (bool (b.From) && d < *b.From) return false;
        if (bool (b.To) && d > *b.To) return false;
        return true;
    }

    std::string date_filter::name () const {
        switch (Period) {
            case today: return "Today";
            case this_week: return "This week";
            case last_week: return "Last week";
            case this_month: return "This month";
            case last_month: return "Last month";
            case this_year: return "This year";
            case last_year: return "Last year";
            default: break;
        }

        if (bool (From) && bool (To)) return "From " + write_date (*From) + " to " + write_date (*To);
        if (bool (From)) return "From " + write_date (*From);
        if (bool (To)) return "Until " + write_date (*To);
        return "All dates";
    }

    bool direction_filter::matches (const transaction &t) const {
        switch (Mode) {
            case income:
                return t.Direction == direction::income && (IncludeTransfers || !t.is_transfer ());
            case expense:
                return t.Direction == direction::expense && (IncludeTransfers || !t.is_transfer ());
            case transfers:
                return t.is_transfer ();
            case no_transfers:
                return !t.is_transfer ();
            default:
                return false;
        }
    }

    std::string direction_filter::name () const {
        switch (Mode) {
            case income: return IncludeTransfers ? "Income only" : "Income only (no transfers)";
            case expense: return IncludeTransfers ? "Expenses only" : "Expenses only (no transfers)";
            case transfers: return "Transfers only";
            default: return "No transfers";
        }
    }

    bool category_filter::matches (const transaction &t) const {
        return Categories.contains (t.Category) != Exclude;
    }

    std::string category_filter::name () const {
        std::stringstream ss;
        ss << (Exclude ? "Excluding categories: " : "Categories: ");
        bool first = true;
        for (const std::string &x : Categories) {
            if (!first) ss << ", ";
            ss << x;
            first = false;
        }
        return ss.str ();
    }

    bool amount_filter::matches (const transaction &t) const {
        if (bool (Min) && t.Amount < *Min) return false;
        if (bool (Max) && t.Amount > *Max) return false;
        return true;
    }

    std::string amount_filter::name () const {
        if (bool (Min) && bool (Max)) return "Amount " + write_amount (*Min) + " - " + write_amount (*Max);
        if (bool (Min)) return "Amount >= " + write_amount (*Min);
        if (bool (Max)) return "Amount <= " + write_amount (*Max);
        return "Any amount";
    }

    bool description_filter::matches (const transaction &t) const {
        if (CaseSensitive) return t.Description.find (Text) != std::string::npos;
        return std::string (data::to_lower (t.Description)).find (std::string (data::to_lower (Text))) != std::string::npos;
    }

    std::string description_filter::name () const {
        return "Description contains \"" + Text + "\"" + (CaseSensitive ? " (case sensitive)" : "");
    }

    const std::vector<filter_preset_entry> &filter_presets () {
        static const std::vector<filter_preset_entry> Presets {
            {"today", filter_preset::today},
            {"this_week", filter_preset::this_week},
            {"last_week", filter_preset::last_week},
            {"this_month", filter_preset::this_month},
            {"last_month", filter_preset::last_month},
            {"this_year", filter_preset::this_year},
            {"last_year", filter_preset::last_year},
            {"income", filter_preset::income},
            {"income_no_transfers", filter_preset::income_no_transfers},
            {"expense", filter_preset::expense},
            {"expense_no_transfers", filter_preset::expense_no_transfers},
            {"transfers", filter_preset::transfers},
            {"no_transfers", filter_preset::no_transfers},
            {"large", filter_preset::large},
            {"small", filter_preset::small}};
        return Presets;
    }

    maybe<filter_preset> read_filter_preset (const std::string &key) {
        for (const filter_preset_entry &e : filter_presets ()) if (e.Key == key) return {e.Preset};
        return {};
    }

    ptr<const filter> make_filter (filter_preset p) {
        switch (p) {
            case filter_preset::today: return std::make_shared<date_filter> (date_filter::today);
            case filter_preset::this_week: return std::make_shared<date_filter> (date_filter::this_week);
            case filter_preset::last_week: return std::make_shared<date_filter> (date_filter::last_week);
            case filter_preset::this_month: return std::make_shared<date_filter> (date_filter::this_month);
            case filter_preset::last_month: return std::make_shared<date_filter> (date_filter::last_month);
            case filter_preset::this_year: return std::make_shared<date_filter> (date_filter::this_year);
            case filter_preset::last_year: return std::make_shared<date_filter> (date_filter::last_year);
            case filter_preset::income: return std::make_shared<direction_filter> (direction_filter::income, true);
            case filter_preset::income_no_transfers: return std::make_shared<direction_filter> (direction_filter::income, false);
            case filter_preset::expense: return std::make_shared<direction_filter> (direction_filter::expense, true);
            case filter_preset::expense_no_transfers: return std::make_shared<direction_filter> (direction_filter::expense, false);
            case filter_preset::transfers: return std::make_shared<direction_filter> (direction_filter::transfers);
            case filter_preset::no_transfers: return std::make_shared<direction_filter> (direction_filter::no_transfers);
            case filter_preset::large: return std::make_shared<amount_filter> (amount_filter::large ());
            case filter_preset::small: return std::make_shared<amount_filter> (amount_filter::small ());
            default: throw exception {} << "unknown filter preset";
        }
    }

    bool filtering_context::remove (size_t index) {
        if (index >= Filters.size ()) return false;
        Filters.erase (Filters.begin () + index);
        return true;
    }

    std::string filtering_context::summary () const {
        if (Filters.empty ()) return "No filters";
        std::stringstream ss;
        for (size_t i = 0; i < Filters.size (); i++) {
            if (i != 0) ss << ", ";
            ss << Filters[i]->name ();
        }
        return ss.str ();
    }

    bool filtering_context::matches (const transaction &t) const {
        for (const auto &f : Filters) if (!f->matches (t)) return false;
        return true;
    }

    std::vector<const transaction *> filtering_context::apply (const std::vector<const transaction *> &x) const {
        std::vector<const transaction *> result;
        for (const transaction *t : x) if (matches (*t)) result.push_back (t);
        return result;
    }

}
