#ifndef POCKET_WALLET_DEPOSIT
#define POCKET_WALLET_DEPOSIT

#include <Pocket/wallet/wallet.hpp>

namespace Pocket {

    struct deposit_terms {
        // annual, in percent.
        double InterestRate;
        uint32 TermMonths;

        // if true, interest is compounded monthly.
        bool Capitalization {true};

        // throws validation_error.
        void validate () const;
    };

    struct deposit_summary {
        double Principal;
        double InterestRate;
        uint32 TermMonths;
        bool Capitalization;
        date Maturity;
        bool Matured;
        int32 DaysUntilMaturity;
        double AccruedInterest;
        double TotalInterest;
        double MaturityAmount;
    };

    std::ostream &operator << (std::ostream &, const deposit_summary &);

    // A wallet that earns interest over a fixed term. The principal is
    // whatever income has been recorded on the wallet.
    struct deposit_wallet final : wallet {

        deposit_wallet (const std::string &name, const deposit_terms &terms,
            const std::string &currency = ledger_options::DefaultCurrency,
            const std::string &description = "",
            maybe<double> initial_deposit = {},
            maybe<timestamp> created = {});

        explicit deposit_wallet (const JSON::object_t &);

        bool is_deposit () const final override {
            return true;
        }

        const deposit_terms &terms () const {
            return Terms;
        }

        double interest_rate () const {
            return Terms.InterestRate;
        }

        uint32 term_months () const {
            return Terms.TermMonths;
        }

        bool capitalization () const {
            return Terms.Capitalization;
        }

        // throws validation_error if the rate is out of range.
        void set_interest_rate (double);

        date maturity () const {
            return Maturity;
        }

        double monthly_rate () const {
            return Terms.InterestRate / 12 / 100;
        }

        double principal () const {
            return total_income ();
        }

        // whole calendar months from creation to the given
        // time or to maturity, whichever comes first.
        uint32 months_elapsed (const timestamp &now) const;

        double accrued_interest (const timestamp &now) const;

        // interest over the whole term.
        double total_interest () const;

        double maturity_amount () const {
            return principal () + total_interest ();
        }

        bool is_matured (const timestamp &now) const {
            return day_of (now) >= Maturity;
        }

        int32 days_until_maturity (const timestamp &now) const;

        deposit_summary summary (const timestamp &now) const;

        explicit operator JSON () const final override;

    private:
        deposit_terms Terms;
        date Maturity;

        double interest (uint32 months) const;
    };

}

#endif
