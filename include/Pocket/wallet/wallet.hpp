#ifndef POCKET_WALLET_WALLET
#define POCKET_WALLET_WALLET

#include <map>
#include <memory>

#include <Pocket/category.hpp>
#include <Pocket/sort.hpp>
#include <Pocket/filter.hpp>
#include <Pocket/options.hpp>

namespace Pocket {

    struct wallet;

    // totals over a selection of the transactions of a wallet.
    struct wallet_report {
        struct entry {
            double Total {0};
            size_t Count {0};
        };

        double TotalIncome {0};
        double TotalExpense {0};
        size_t Count {0};

        // by category, for each direction.
        std::map<std::string, entry> Income;
        std::map<std::string, entry> Expense;

        double net () const {
            return TotalIncome - TotalExpense;
        }

        // share of total income or total expense. Empty if the total is zero.
        std::map<std::string, double> income_percentages () const;
        std::map<std::string, double> expense_percentages () const;
    };

    // how a wallet finds the other wallets that it shares transfers with.
    struct wallet_directory {
        virtual wallet *find (uint32 id) = 0;
        virtual ~wallet_directory () {}
    };

    // A wallet owns its transactions and keeps the totals in step with them.
    // The totals are changed incrementally every time a transaction is
    // added, edited or removed; they are only summed from scratch when the
    // wallet is read from JSON.
    //
    // Pointers to transactions that are returned by a wallet remain valid
    // until that transaction is edited or deleted.
    struct wallet {

        wallet (const std::string &name,
            const std::string &currency = ledger_options::DefaultCurrency,
            const std::string &description = "",
            maybe<double> starting_value = {},
            maybe<timestamp> created = {});

        wallet (const wallet &) = delete;
        wallet &operator = (const wallet &) = delete;

        virtual ~wallet () {}

        uint32 id () const {
            return ID;
        }

        const std::string &name () const {
            return Name;
        }

        const std::string &currency () const {
            return Currency;
        }

        const std::string &description () const {
            return Description;
        }

        timestamp created () const {
            return Created;
        }

        double balance () const {
            return Balance;
        }

        double total_income () const {
            return TotalIncome;
        }

        double total_expense () const {
            return TotalExpense;
        }

        void set_currency (const std::string &c) {
            Currency = c;
        }

        void set_description (const std::string &d) {
            Description = d;
        }

        virtual bool is_deposit () const {
            return false;
        }

        size_t transaction_count () const {
            return Transactions.size ();
        }

        // record a new transaction and register its category. Throws
        // validation_error if the wallet already has a transaction with that id.
        const transaction &add_transaction (std::unique_ptr<transaction>);

        const transaction &add_transaction (double amount, direction d, const std::string &category,
            const std::string &description = "", maybe<timestamp> created = {});

        // position is 1-based in the current sort order. nullptr if there is none.
        const transaction *get_by_position (size_t position) const;
        const transaction *get_by_id (const std::string &id) const;

        // return false if the transaction does not exist.
        bool update_by_position (size_t position, const transaction_edit &);
        bool update_by_id (const std::string &id, const transaction_edit &);

        // return false if the transaction does not exist. If the transaction is a
        // transfer and cascade is true, its partner in the other wallet is deleted too.
        bool delete_by_position (size_t position, bool cascade = true);
        bool delete_by_id (const std::string &id, bool cascade = true);

        // in no particular order.
        std::vector<const transaction *> transactions () const;

        std::vector<const transaction *> sorted_transactions () const;

        // transactions matching the active filters, in the current sort order.
        std::vector<const transaction *> filtered_transactions () const;

        transaction_sorting &sorting () {
            return Sorting;
        }

        const transaction_sorting &sorting () const {
            return Sorting;
        }

        filtering_context &filters () {
            return Filtering;
        }

        const filtering_context &filters () const {
            return Filtering;
        }

        // signed total per category, leaving out those that come to zero.
        std::map<std::string, double> category_totals () const;

        std::map<std::string, double> income_category_totals () const;
        std::map<std::string, double> expense_category_totals () const;

        // percentages of total income and total expense. Empty if the total is zero.
        std::map<std::string, double> income_category_percentages () const;
        std::map<std::string, double> expense_category_percentages () const;

        // share of each category in the sum of the sizes of all transactions,
        // with income and expense counted together.
        std::map<std::string, double> category_percentages () const;

        // totals and counts per category over the transactions that match
        // the given filters. With no filters, the whole wallet is covered.
        wallet_report report (const filtering_context & = filtering_context {}) const;

        explicit virtual operator JSON () const;

        // read a plain or a deposit wallet.
        static std::unique_ptr<wallet> read (const JSON &);

    protected:
        // takes a JSON object rather than JSON so that it is never
        // confused with the constructor that takes a name.
        explicit wallet (const JSON::object_t &);

    private:
        uint32 ID {0};
        std::string Name;
        std::string Currency;
        std::string Description;
        timestamp Created;

        // recorded as a transaction once the wallet has been given categories.
        maybe<double> StartingValue;

        std::map<std::string, std::unique_ptr<transaction>> Transactions;

        double TotalIncome {0};
        double TotalExpense {0};
        double Balance {0};

        category_manager *Categories {nullptr};
        wallet_directory *Directory {nullptr};

        transaction_sorting Sorting {};
        filtering_context Filtering {};

        transaction *find (const std::string &id);

        void include (const transaction &);
        void retract (const transaction &);

        // the wallet holding the other side of a transfer and the other side itself.
        std::pair<wallet *, transfer *> partner (const transfer &);

        void attach (uint32 id, category_manager &, wallet_directory &);

        std::map<std::string, double> totals (maybe<direction>) const;

        friend struct wallet_manager;
    };

    using wallet_sorting = sorting_context<wallet>;

    template <> const std::vector<sorting_strategy<wallet>> &sorting_context<wallet>::strategies ();

    std::ostream &operator << (std::ostream &, const wallet &);

}

#endif
