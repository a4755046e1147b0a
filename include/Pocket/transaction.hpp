#ifndef POCKET_TRANSACTION
#define POCKET_TRANSACTION

#include <memory>
#include <ostream>

#include <Pocket/time.hpp>

namespace Pocket {

    enum class direction {
        income,
        expense
    };

    std::ostream &operator << (std::ostream &, direction);

    JSON write (direction);
    direction read_direction (const JSON &);

    // both sides of a transfer are filed under this category.
    const std::string &transfer_category ();

    // 8 random hex digits.
    std::string new_transaction_id ();

    // new values for an existing transaction. Whatever is left empty stays the same.
    struct transaction_edit {
        maybe<double> Amount {};
        maybe<direction> Direction {};
        maybe<std::string> Category {};
        maybe<std::string> Description {};
        maybe<timestamp> Created {};
    };

    // a single movement of money into or out of a wallet. Amount is always
    // positive; whether it counts for or against the wallet is given by Direction.
    struct transaction {
        std::string ID;
        double Amount;
        direction Direction;
        std::string Category;
        std::string Description;
        timestamp Created;

        // throws validation_error if amount is not positive.
        transaction (double amount, direction d, const std::string &category,
            const std::string &description = "", maybe<timestamp> created = {});

        transaction (const std::string &id, double amount, direction d, const std::string &category,
            const std::string &description, const timestamp &created);

        virtual ~transaction () {}

        double signed_amount () const {
            return Direction == direction::income ? Amount : -Amount;
        }

        virtual bool is_transfer () const {
            return false;
        }

        // a new transaction with the same id and the edit applied.
        transaction edited (const transaction_edit &) const;

        virtual std::string detailed () const;

        explicit virtual operator JSON () const;

        // read either a plain transaction or a transfer.
        static std::unique_ptr<transaction> read (const JSON &, uint32 wallet);
    };

    // one line, as in "Food - -12.50".
    std::ostream &operator << (std::ostream &, const transaction &);

    // where to find the other side of a transfer.
    struct transfer_link {
        uint32 Wallet;
        std::string Transaction;

        bool operator == (const transfer_link &) const = default;
    };

    // one side of a movement between two wallets. The source wallet
    // has an expense and the target wallet has an income.
    struct transfer final : transaction {
        // the wallet holding this side.
        uint32 SourceWallet;

        // the other side. Empty only while the pair is being deleted.
        maybe<transfer_link> Connected;

        transfer (uint32 source_wallet, double amount, direction d,
            const std::string &description = "", maybe<timestamp> created = {});

        transfer (const std::string &id, uint32 source_wallet, double amount, direction d,
            const std::string &description, const timestamp &created);

        bool is_transfer () const final override {
            return true;
        }

        transfer_link link () const {
            return transfer_link {SourceWallet, ID};
        }

        // Apply the edit to both sides. Amount, description and time may
        // change. Returns false without changing anything if the partner is
        // missing or does not link back to this transfer. Throws
        // validation_error if the edit names a category or a direction,
        // even the current one, or if the new amount is not positive.
        bool update (const transaction_edit &, transfer *partner);

        std::string detailed () const final override;

        explicit operator JSON () const final override;
    };

    void inline link (transfer &a, transfer &b) {
        a.Connected = b.link ();
        b.Connected = a.link ();
    }

    void inline detach (transfer &a, transfer &b) {
        a.Connected = {};
        b.Connected = {};
    }

}

#endif
