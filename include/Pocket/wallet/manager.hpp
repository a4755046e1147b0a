#ifndef POCKET_WALLET_MANAGER
#define POCKET_WALLET_MANAGER

#include <Pocket/wallet/deposit.hpp>

namespace Pocket {

    // everything needed to create a wallet.
    struct wallet_options {
        std::string Name;
        std::string Currency {ledger_options::DefaultCurrency};
        std::string Description {};
        maybe<double> StartingValue {};

        // a deposit wallet must have an interest rate and a term;
        // a plain wallet must have neither.
        bool Deposit {false};
        maybe<double> InterestRate {};
        maybe<uint32> TermMonths {};
        bool Capitalization {true};

        maybe<timestamp> Created {};
    };

    // Whatever is left empty stays the same.
    struct wallet_update {
        maybe<std::string> Name {};
        maybe<std::string> Currency {};
        maybe<std::string> Description {};

        // deposit wallets only.
        maybe<double> InterestRate {};
    };

    // Owns all the wallets and the categories that they share. Wallet names
    // are unique without regard to case. Transfers between wallets are
    // created here so that both sides are always linked.
    //
    // The wallets keep pointers back to their manager, so
    // a manager can be neither copied nor moved.
    struct wallet_manager final : wallet_directory {

        wallet_manager () {}

        // null is read as an empty manager.
        explicit wallet_manager (const JSON &);

        wallet_manager (const wallet_manager &) = delete;
        wallet_manager &operator = (const wallet_manager &) = delete;

        // throws validation_error if the name is already taken.
        // The first wallet added becomes the current wallet.
        wallet &add_wallet (std::unique_ptr<wallet>);

        // throws validation_error.
        wallet &create_wallet (const wallet_options &);

        // nullptr if there is no wallet by that name.
        wallet *get_wallet (const std::string &name);
        const wallet *get_wallet (const std::string &name) const;

        wallet *find (uint32 id) final override;

        // Deletes every transaction of the wallet first so that the other
        // sides of its transfers are removed from their wallets as well.
        // Returns false if there is no such wallet.
        bool remove_wallet (const std::string &name);

        // returns false if there is no such wallet. Throws validation_error if the
        // new name is taken or if an interest rate is given for a plain wallet.
        bool update_wallet (const std::string &name, const wallet_update &);

        bool switch_wallet (const std::string &name);

        wallet *current_wallet () {
            return Current;
        }

        const wallet *current_wallet () const {
            return Current;
        }

        // in order of lower case name.
        std::vector<const wallet *> wallets () const;

        std::vector<const wallet *> sorted_wallets () const;

        size_t wallet_count () const {
            return Wallets.size ();
        }

        // Move money from one wallet to another. Returns false without doing
        // anything if either wallet does not exist, if they are the same
        // wallet or if the amount is not positive.
        bool transfer (const std::string &from, const std::string &to, double amount,
            const std::string &description = "", maybe<timestamp> when = {});

        // Record both sides of a transfer and link them. Each side goes into the
        // wallet named by its SourceWallet. Throws validation_error if the two do
        // not make a transfer between two wallets of this manager. If the second
        // side cannot be added, the first is taken out again before the
        // exception is passed on.
        void transfer (std::unique_ptr<Pocket::transfer> outgoing, std::unique_ptr<Pocket::transfer> incoming);

        category_manager &categories () {
            return Categories;
        }

        const category_manager &categories () const {
            return Categories;
        }

        wallet_sorting &sorting () {
            return Sorting;
        }

        const wallet_sorting &sorting () const {
            return Sorting;
        }

        explicit operator JSON () const;

    private:
        // by lower case name.
        std::map<std::string, std::unique_ptr<wallet>> Wallets;
        std::map<uint32, wallet *> ByID;
        uint32 NextID {1};

        wallet *Current {nullptr};

        category_manager Categories {};
        wallet_sorting Sorting {};

        // throws exception if any transfer is not linked to its partner.
        void check_links ();
    };

}

#endif
