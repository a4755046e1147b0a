#include <Pocket/wallet/deposit.hpp>

#include <cmath>
#include <cstdint>
#include <iomanip>

namespace Pocket {

    void deposit_terms::validate () const {
        if (!std::isfinite (InterestRate) || InterestRate < 0 || InterestRate > ledger_options::MaxInterestRate)
            throw validation_error {"interest rate must be between 0 and 100"};

        if (TermMonths < ledger_options::MinTermMonths)
            throw validation_error {"deposit term must be at least one month"};

        if (TermMonths > ledger_options::MaxTermMonths)
            throw validation_error {"deposit term cannot be longer than " + std::to_string (ledger_options::MaxTermMonths) + " months"};
    }

    deposit_wallet::deposit_wallet (const std::string &name, const deposit_terms &terms,
        const std::string &currency, const std::string &description,
        maybe<double> initial_deposit, maybe<timestamp> created) :
        wallet {name, currency, description, initial_deposit, created}, Terms {terms} {
        Terms.validate ();
        Maturity = add_months (day_of (this->created ()), Terms.TermMonths);
    }

    void deposit_wallet::set_interest_rate (double rate) {
        deposit_terms t = Terms;
        t.InterestRate = rate;
        t.validate ();
        Terms = t;
    }

    uint32 deposit_wallet::months_elapsed (const timestamp &now) const {
        date end = day_of (now);
        if (end >= Maturity) return Terms.TermMonths;

        date start = day_of (created ());
        if (end <= start) return 0;

        int32 months = (int (end.year ()) - int (start.year ())) * 12 +
            (int32 (unsigned (end.month ())) - int32 (unsigned (start.month ())));

        if (end.day () < std::min (start.day (), last_day_of_month (end))) months--;

        return months < 0 ? 0 : uint32 (months);
    }

    double deposit_wallet::interest (uint32 months) const {
        double p = principal ();
        double m = monthly_rate ();
        if (Terms.Capitalization) return p * std::pow (1 + m, months) - p;
        return p * m * months;
    }

    double deposit_wallet::accrued_interest (const timestamp &now) const {
        return interest (months_elapsed (now));
    }

    double deposit_wallet::total_interest () const {
        return interest (Terms.TermMonths);
    }

    int32 deposit_wallet::days_until_maturity (const timestamp &now) const {
        if (is_matured (now)) return 0;
        return int32 ((std::chrono::sys_days {Maturity} - std::chrono::sys_days {day_of (now)}).count ());
    }

    deposit_summary deposit_wallet::summary (const timestamp &now) const {
        return deposit_summary {
            principal (),
            Terms.InterestRate,
            Terms.TermMonths,
            Terms.Capitalization,
            Maturity,
            is_matured (now),
            days_until_maturity (now),
            accrued_interest (now),
            total_interest (),
            maturity_amount ()};
    }

    std::ostream &operator << (std::ostream &o, const deposit_summary &s) {
        o << std::fixed << std::setprecision (2)
            << "Principal: " << s.Principal
            << "\nInterest rate: " << s.InterestRate << "%"
            << "\nTerm: " << s.TermMonths << " months"
            << "\nCapitalization: " << (s.Capitalization ? "monthly" : "none")
            << "\nMaturity date: " << write_date (s.Maturity);
        if (s.Matured) o << " (matured)";
        else o << " (" << s.DaysUntilMaturity << " days left)";
        return o << "\nAccrued interest: " << s.AccruedInterest
            << "\nTotal interest: " << s.TotalInterest
            << "\nMaturity amount: " << s.MaturityAmount;
    }

    deposit_wallet::operator JSON () const {
        JSON j = wallet::operator JSON ();
        j["type"] = "deposit";
        j["interest_rate"] = Terms.InterestRate;
        j["term_months"] = Terms.TermMonths;
        j["capitalization"] = Terms.Capitalization;
        return j;
    }

    namespace {
        deposit_terms read_terms (const JSON::object_t &j) {
            auto rate = j.find ("interest_rate");
            auto term = j.find ("term_months");
            auto cap = j.find ("capitalization");

            if (rate == j.end () || !rate->second.is_number ())
                throw exception {} << "invalid deposit JSON format: 'interest_rate'";
            if (term == j.end () || !term->second.is_number_unsigned () ||
                term->second.get<std::uint64_t> () > ledger_options::MaxTermMonths)
                throw exception {} << "invalid deposit JSON format: 'term_months'";
            if (cap != j.end () && !cap->second.is_boolean ())
                throw exception {} << "invalid deposit JSON format: 'capitalization'";

            return deposit_terms {double (rate->second), uint32 (term->second), cap == j.end () || bool (cap->second)};
        }
    }

    deposit_wallet::deposit_wallet (const JSON::object_t &j) : wallet {j}, Terms {read_terms (j)} {
        Terms.validate ();
        Maturity = add_months (day_of (created ()), Terms.TermMonths);
    }

}
