#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <data/io/exception.hpp>
#include <data/io/error.hpp>

#include <Pocket/wallet/manager.hpp>
#include <Pocket/files.hpp>

#include "source/cli/options.hpp"

using namespace data;

using error = io::error;

error run (const options &);

enum class method {
    UNSET,
    HELP,       // print help messages
    VERSION,    // print a version message
    WALLETS,    // list wallets
    CREATE,     // create a wallet
    REMOVE,     // remove a wallet and everything in it
    RENAME,     // change the name or other details of a wallet
    SWITCH,     // change the current wallet
    ADD,        // record a transaction
    SHOW,       // show one transaction in detail
    EDIT,       // change a transaction
    DELETE,     // delete a transaction
    TRANSFER,   // move money between wallets
    LIST,       // list transactions
    CATEGORIES, // list known categories
    REPORT,     // totals per category
    DEPOSIT,    // interest on a deposit wallet
    SORTS,      // list sorting options
    FILTERS     // list filter presets
};

int main (int arg_count, char **arg_values) {

    auto err = run (options {arg_parser {arg_count, arg_values}});

    if (err.Message) std::cout << "Error: " << static_cast<std::string> (*err.Message) << std::endl;
    else if (err.Code) std::cout << "Error: unknown." << std::endl;

    return err.Code;
}

void version ();

void help (method meth = method::UNSET);

void command_wallets (const options &);
void command_create (const options &);
void command_remove (const options &);
void command_rename (const options &);
void command_switch (const options &);
void command_add (const options &);
void command_show (const options &);
void command_edit (const options &);
void command_delete (const options &);
void command_transfer (const options &);
void command_list (const options &);
void command_categories (const options &);
void command_report (const options &);
void command_deposit (const options &);
void command_sorts (const options &);
void command_filters (const options &);

method read_method (const arg_parser &, uint32 index = 1);

error run (const options &p) {

    try {

        if (p.has ("version")) version ();

        else if (p.has ("help")) help ();

        else {

            method cmd = read_method (p);

            switch (cmd) {
                case method::VERSION: {
                    version ();
                    break;
                }

                case method::HELP: {
                    help (read_method (p, 2));
                    break;
                }

                case method::WALLETS: {
                    command_wallets (p);
                    break;
                }

                case method::CREATE: {
                    command_create (p);
                    break;
                }

                case method::REMOVE: {
                    command_remove (p);
                    break;
                }

                case method::RENAME: {
                    command_rename (p);
                    break;
                }

                case method::SWITCH: {
                    command_switch (p);
                    break;
                }

                case method::ADD: {
                    command_add (p);
                    break;
                }

                case method::SHOW: {
                    command_show (p);
                    break;
                }

                case method::EDIT: {
                    command_edit (p);
                    break;
                }

                case method::DELETE: {
                    command_delete (p);
                    break;
                }

                case method::TRANSFER: {
                    command_transfer (p);
                    break;
                }

                case method::LIST: {
                    command_list (p);
                    break;
                }

                case method::CATEGORIES: {
                    command_categories (p);
                    break;
                }

                case method::REPORT: {
                    command_report (p);
                    break;
                }

                case method::DEPOSIT: {
                    command_deposit (p);
                    break;
                }

                case method::SORTS: {
                    command_sorts (p);
                    break;
                }

                case method::FILTERS: {
                    command_filters (p);
                    break;
                }

                default: {
                    std::cout << "Error: could not read user's command." << std::endl;
                    help ();
                }
            }
        }

    } catch (const data::exception &x) {
        return error {x.Code, std::string {x.what ()}};
    } catch (const Pocket::validation_error &x) {
        return error {1, std::string {x.what ()}};
    } catch (const Pocket::invariant_violation &x) {
        return error {3, std::string {"internal error: "} + x.what ()};
    } catch (const std::exception &x) {
        return error {1, std::string {x.what ()}};
    }

    return {};
}

method read_method (const arg_parser &p, uint32 index) {
    maybe<std::string> m;
    p.get (index, m);
    if (!bool (m)) return method::UNSET;

    std::string x = data::to_lower (*m);

    if (x == "help") return method::HELP;
    if (x == "version") return method::VERSION;
    if (x == "wallets") return method::WALLETS;
    if (x == "create") return method::CREATE;
    if (x == "remove") return method::REMOVE;
    if (x == "rename") return method::RENAME;
    if (x == "switch") return method::SWITCH;
    if (x == "add") return method::ADD;
    if (x == "show") return method::SHOW;
    if (x == "edit") return method::EDIT;
    if (x == "delete") return method::DELETE;
    if (x == "transfer") return method::TRANSFER;
    if (x == "list") return method::LIST;
    if (x == "categories") return method::CATEGORIES;
    if (x == "report") return method::REPORT;
    if (x == "deposit") return method::DEPOSIT;
    if (x == "sorts") return method::SORTS;
    if (x == "filters") return method::FILTERS;

    return method::UNSET;
}

void help (method meth) {
    switch (meth) {
        default : {
            version ();
            std::cout << "input should be <method> <args>... where method is "
                "\n\twallets    -- list wallets."
                "\n\tcreate     -- create a new wallet."
                "\n\tremove     -- remove a wallet and all of its transactions."
                "\n\trename     -- change the name, currency, description or interest rate of a wallet."
                "\n\tswitch     -- choose the current wallet."
                "\n\tadd        -- record income or an expense."
                "\n\tshow       -- show a transaction in detail."
                "\n\tedit       -- change a transaction."
                "\n\tdelete     -- delete a transaction."
                "\n\ttransfer   -- move money from one wallet to another."
                "\n\tlist       -- list the transactions in a wallet."
                "\n\tcategories -- list categories."
                "\n\treport     -- totals and percentages per category."
                "\n\tdeposit    -- interest earned by a deposit wallet."
                "\n\tsorts      -- list the ways transactions and wallets can be sorted."
                "\n\tfilters    -- list the filter presets."
                "\nall methods accept (--file=<path>) (= $POCKET_FILE or pocket.json)"
                "\nuse help \"method\" for information on a specific method" << std::endl;
        } break;
        case method::WALLETS : {
            std::cout << "List wallets."
                "\narguments for method wallets:"
                "\n\t(--sort=<key>) (use method sorts to see the options)" << std::endl;
        } break;
        case method::CREATE : {
            std::cout << "Create a new wallet."
                "\narguments for method create:"
                "\n\t(--name=)<wallet name>"
                "\n\t(--currency=<string>) (= USD)"
                "\n\t(--description=<string>)"
                "\n\t(--starting=<number>) (starting balance)"
                "\n\t(--deposit) (make a deposit wallet)"
                "\n\t(--rate=<annual percent>) (deposit wallets only)"
                "\n\t(--term=<months>) (deposit wallets only)"
                "\n\t(--simple_interest) (deposit wallets only; interest is compounded monthly otherwise)"
                "\n\t(--date=<YYYY-MM-DD>) (= today)" << std::endl;
        } break;
        case method::REMOVE : {
            std::cout << "Remove a wallet. Transfers to and from other wallets are removed from them as well."
                "\narguments for method remove:"
                "\n\t(--name=)<wallet name>" << std::endl;
        } break;
        case method::RENAME : {
            std::cout << "Change the details of a wallet."
                "\narguments for method rename:"
                "\n\t(--name=)<wallet name>"
                "\n\t(--new_name=)<new name>"
                "\n\t(--currency=<string>)"
                "\n\t(--description=<string>)"
                "\n\t(--rate=<annual percent>) (deposit wallets only)" << std::endl;
        } break;
        case method::SWITCH : {
            std::cout << "Choose the current wallet."
                "\narguments for method switch:"
                "\n\t(--name=)<wallet name>" << std::endl;
        } break;
        case method::ADD : {
            std::cout << "Record a transaction in the current wallet."
                "\narguments for method add:"
                "\n\t(--direction=)\"income\"|\"expense\""
                "\n\t(--amount=)<positive number>"
                "\n\t(--category=)<string>"
                "\n\t(--description=<string>)"
                "\n\t(--date=<YYYY-MM-DD( HH:MM:SS)>) (= now)"
                "\n\t(--wallet=<wallet name>) (= current wallet)" << std::endl;
        } break;
        case method::SHOW : {
            std::cout << "Show a transaction in detail."
                "\narguments for method show:"
                "\n\t(--position=)<number> | --id=<transaction id>"
                "\n\t(--wallet=<wallet name>) (= current wallet)" << std::endl;
        } break;
        case method::EDIT : {
            std::cout << "Change a transaction. Only amount, description and date can be changed for a transfer."
                "\narguments for method edit:"
                "\n\t(--position=)<number> | --id=<transaction id>"
                "\n\t(--amount=<positive number>)"
                "\n\t(--direction=\"income\"|\"expense\")"
                "\n\t(--category=<string>)"
                "\n\t(--description=<string>)"
                "\n\t(--date=<YYYY-MM-DD( HH:MM:SS)>)"
                "\n\t(--wallet=<wallet name>) (= current wallet)" << std::endl;
        } break;
        case method::DELETE : {
            std::cout << "Delete a transaction. Deleting one side of a transfer deletes the other side."
                "\narguments for method delete:"
                "\n\t(--position=)<number> | --id=<transaction id>"
                "\n\t(--wallet=<wallet name>) (= current wallet)" << std::endl;
        } break;
        case method::TRANSFER : {
            std::cout << "Move money from one wallet to another."
                "\narguments for method transfer:"
                "\n\t(--from=)<wallet name>"
                "\n\t(--to=)<wallet name>"
                "\n\t(--amount=)<positive number>"
                "\n\t(--description=<string>)"
                "\n\t(--date=<YYYY-MM-DD( HH:MM:SS)>) (= now)" << std::endl;
        } break;
        case method::LIST : {
            std::cout << "List the transactions in a wallet."
                "\narguments for method list:"
                "\n\t(--wallet=<wallet name>) (= current wallet)"
                "\n\t(--sort=<key>) (the choice is saved with the wallet)"
                "\n\t(--filter=<preset>) (use method filters to see the options)"
                "\n\t(--from=<YYYY-MM-DD>)"
                "\n\t(--to=<YYYY-MM-DD>)"
                "\n\t(--category=<name>(,<name>)...)"
                "\n\t(--exclude_category=<name>(,<name>)...)"
                "\n\t(--min=<number>)"
                "\n\t(--max=<number>)"
                "\n\t(--search=<text>) (--case_sensitive)" << std::endl;
        } break;
        case method::CATEGORIES : {
            std::cout << "List categories."
                "\narguments for method categories:"
                "\n\t(--direction=)\"income\"|\"expense\" (= both)" << std::endl;
        } break;
        case method::REPORT : {
            std::cout << "Show totals, counts and percentages per category for the transactions that match the filters."
                "\narguments for method report:"
                "\n\t(--wallet=<wallet name>) (= current wallet)"
                "\n\t(--from=<YYYY-MM-DD>)"
                "\n\t(--to=<YYYY-MM-DD>)"
                "\n\t(--filter=<preset>) (use method filters to see the options)"
                "\n\t(--category=<name>(,<name>)...)"
                "\n\t(--exclude_category=<name>(,<name>)...)"
                "\n\t(--min=<number>)"
                "\n\t(--max=<number>)"
                "\n\t(--search=<text>) (--case_sensitive)" << std::endl;
        } break;
        case method::DEPOSIT : {
            std::cout << "Show the interest earned by a deposit wallet."
                "\narguments for method deposit:"
                "\n\t(--wallet=<wallet name>) (= current wallet)"
                "\n\t(--date=<YYYY-MM-DD>) (= today)" << std::endl;
        } break;
        case method::SORTS : {
            std::cout << "List the ways transactions and wallets can be sorted. No parameters." << std::endl;
        } break;
        case method::FILTERS : {
            std::cout << "List the filter presets. No parameters." << std::endl;
        }
    }
}

void version () {
    std::cout << "Pocket ledger version 0.0.1 alpha" << std::endl;
}

// the ledger as it is stored on disk.
struct ledger {
    std::string Path;
    Pocket::wallet_manager Manager;

    ledger (const std::string &path) : Path {path}, Manager {Pocket::read_from_file (path)} {}

    void save () const {
        Pocket::write_to_file (JSON (Manager), Path);
    }

    // the wallet given by --wallet, or the current wallet.
    Pocket::wallet &wallet (const options &p) {
        maybe<std::string> name = p.wallet ();
        if (bool (name)) {
            Pocket::wallet *w = Manager.get_wallet (*name);
            if (w == nullptr) throw exception {2} << "no wallet named " << *name;
            return *w;
        }

        Pocket::wallet *w = Manager.current_wallet ();
        if (w == nullptr) throw exception {2} << "no wallet has been created yet; use method create";
        return *w;
    }
};

std::string write_amount (double x) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision (2) << x;
    return ss.str ();
}

maybe<Pocket::direction> read_direction (const std::string &x) {
    std::string d = data::to_lower (x);
    if (d == "income" || d == "+") return {Pocket::direction::income};
    if (d == "expense" || d == "-") return {Pocket::direction::expense};
    return {};
}

std::string read_name (const options &p, uint32 index = 2, const std::string &option = "name") {
    maybe<std::string> name;
    p.get (index, option, name);
    if (!bool (name)) throw exception {2} << "could not read " << option << ".";
    return *name;
}

void command_wallets (const options &p) {
    ledger l {p.filepath ()};

    maybe<std::string> sort = p.sort ();
    if (bool (sort) && !l.Manager.sorting ().set_strategy (*sort))
        throw exception {2} << "unknown sort " << *sort << "; use method sorts to see the options";

    if (l.Manager.wallet_count () == 0) {
        std::cout << "No wallets." << std::endl;
        return;
    }

    const Pocket::wallet *current = l.Manager.current_wallet ();
    for (const Pocket::wallet *w : l.Manager.sorted_wallets ())
        std::cout << (w == current ? " * " : "   ") << *w << (w->is_deposit () ? " [deposit]" : "") << std::endl;

    if (bool (sort)) l.save ();
}

void command_create (const options &p) {
    ledger l {p.filepath ()};

    Pocket::wallet_options o;
    o.Name = read_name (p);

    maybe<std::string> currency;
    p.get ("currency", currency);
    if (bool (currency)) o.Currency = *currency;

    maybe<std::string> description;
    p.get ("description", description);
    if (bool (description)) o.Description = *description;

    p.get ("starting", o.StartingValue);

    o.Deposit = p.has ("deposit");
    p.get ("rate", o.InterestRate);
    p.get ("term", o.TermMonths);
    o.Capitalization = !p.has ("simple_interest");
    o.Created = p.time ("date");

    const Pocket::wallet &w = l.Manager.create_wallet (o);
    l.save ();

    std::cout << "created wallet " << w << std::endl;
    if (l.Manager.current_wallet () == &w) std::cout << "this is now the current wallet." << std::endl;
}

void command_remove (const options &p) {
    ledger l {p.filepath ()};
    std::string name = read_name (p);
    if (!l.Manager.remove_wallet (name)) throw exception {2} << "no wallet named " << name;
    l.save ();
    std::cout << "removed wallet " << name << std::endl;
}

void command_rename (const options &p) {
    ledger l {p.filepath ()};
    std::string name = read_name (p);

    Pocket::wallet_update u;
    p.get (3, "new_name", u.Name);
    p.get ("currency", u.Currency);
    p.get ("description", u.Description);
    p.get ("rate", u.InterestRate);

    if (!l.Manager.update_wallet (name, u)) throw exception {2} << "no wallet named " << name;
    l.save ();

    std::cout << "updated wallet " << *l.Manager.get_wallet (bool (u.Name) ? *u.Name : name) << std::endl;
}

void command_switch (const options &p) {
    ledger l {p.filepath ()};
    std::string name = read_name (p);
    if (!l.Manager.switch_wallet (name)) throw exception {2} << "no wallet named " << name;
    l.save ();
    std::cout << "current wallet is " << *l.Manager.current_wallet () << std::endl;
}

void command_add (const options &p) {
    ledger l {p.filepath ()};
    Pocket::wallet &w = l.wallet (p);

    maybe<std::string> direction_string;
    p.get (2, "direction", direction_string);
    if (!bool (direction_string)) throw exception {2} << "could not read direction.";
    maybe<Pocket::direction> d = read_direction (*direction_string);
    if (!bool (d)) throw exception {2} << "direction must be income or expense.";

    maybe<double> amount;
    p.get (3, "amount", amount);
    if (!bool (amount)) throw exception {2} << "could not read amount.";

    maybe<std::string> category;
    p.get (4, "category", category);
    if (!bool (category)) throw exception {2} << "could not read category.";

    maybe<std::string> description;
    p.get ("description", description);

    const Pocket::transaction &t = w.add_transaction (*amount, *d, *category,
        bool (description) ? *description : std::string {}, p.time ("date"));

    std::string id = t.ID;
    l.save ();

    std::cout << "added " << *w.get_by_id (id) << " to " << w << std::endl;
}

// find the transaction given by --id or by its position in the current order.
const Pocket::transaction &select_transaction (const options &p, const Pocket::wallet &w) {
    maybe<std::string> id;
    p.get ("id", id);
    if (bool (id)) {
        const Pocket::transaction *t = w.get_by_id (*id);
        if (t == nullptr) throw exception {2} << "no transaction " << *id << " in wallet " << w.name ();
        return *t;
    }

    maybe<uint32> position;
    p.get (2, "position", position);
    if (!bool (position)) throw exception {2} << "could not read position or id of transaction.";

    const Pocket::transaction *t = w.get_by_position (*position);
    if (t == nullptr) throw exception {2} << "no transaction at position " << *position << " in wallet " << w.name ();
    return *t;
}

void command_show (const options &p) {
    ledger l {p.filepath ()};
    std::cout << select_transaction (p, l.wallet (p)).detailed () << std::endl;
}

void command_edit (const options &p) {
    ledger l {p.filepath ()};
    Pocket::wallet &w = l.wallet (p);
    std::string id = select_transaction (p, w).ID;

    Pocket::transaction_edit e;
    p.get ("amount", e.Amount);
    p.get ("category", e.Category);
    p.get ("description", e.Description);
    e.Created = p.time ("date");

    maybe<std::string> direction_string;
    p.get ("direction", direction_string);
    if (bool (direction_string)) {
        e.Direction = read_direction (*direction_string);
        if (!bool (e.Direction)) throw exception {2} << "direction must be income or expense.";
    }

    if (!w.update_by_id (id, e)) throw exception {2} << "no transaction " << id << " in wallet " << w.name ();
    l.save ();

    std::cout << w.get_by_id (id)->detailed () << std::endl;
}

void command_delete (const options &p) {
    ledger l {p.filepath ()};
    Pocket::wallet &w = l.wallet (p);
    std::string id = select_transaction (p, w).ID;
    bool was_transfer = w.get_by_id (id)->is_transfer ();

    if (!w.delete_by_id (id)) throw exception {2} << "no transaction " << id << " in wallet " << w.name ();
    l.save ();

    std::cout << "deleted transaction " << id << (was_transfer ? " and the other side of the transfer" : "") << std::endl;
}

void command_transfer (const options &p) {
    ledger l {p.filepath ()};

    std::string from = read_name (p, 2, "from");
    std::string to = read_name (p, 3, "to");

    maybe<double> amount;
    p.get (4, "amount", amount);
    if (!bool (amount)) throw exception {2} << "could not read amount.";

    maybe<std::string> description;
    p.get ("description", description);

    if (!l.Manager.transfer (from, to, *amount, bool (description) ? *description : std::string {}, p.time ("date")))
        throw exception {2} << "could not transfer " << write_amount (*amount) << " from " << from << " to " << to
            << "; both wallets must exist and be different and the amount must be positive.";

    l.save ();

    std::cout << "transferred " << write_amount (*amount) << " from " << from << " to " << to << std::endl;
    std::cout << "\t" << *l.Manager.get_wallet (from) << "\n\t" << *l.Manager.get_wallet (to) << std::endl;
}

void command_list (const options &p) {
    ledger l {p.filepath ()};
    Pocket::wallet &w = l.wallet (p);

    maybe<std::string> sort = p.sort ();
    if (bool (sort) && !w.sorting ().set_strategy (*sort))
        throw exception {2} << "unknown sort " << *sort << "; use method sorts to see the options";

    w.filters () = p.filters ();

    std::cout << w << "\nsorted by " << w.sorting ().current ().Name << "; " << w.filters ().summary () << std::endl;

    auto txs = w.filtered_transactions ();
    if (txs.empty ()) std::cout << "No transactions." << std::endl;

    // positions refer to the sorted list without filters so that they
    // can be given to methods show, edit and delete.
    auto all = w.sorted_transactions ();
    for (const Pocket::transaction *t : txs) {
        size_t position = std::find (all.begin (), all.end (), t) - all.begin () + 1;
        std::cout << std::setw (4) << position << ". " << Pocket::write_date (Pocket::day_of (t->Created))
            << "  " << *t << (t->Description.empty () ? "" : "  " + t->Description) << std::endl;
    }

    if (bool (sort)) l.save ();
}

void command_categories (const options &p) {
    ledger l {p.filepath ()};

    maybe<std::string> direction_string;
    p.get (2, "direction", direction_string);

    std::vector<Pocket::direction> directions {Pocket::direction::income, Pocket::direction::expense};
    if (bool (direction_string)) {
        maybe<Pocket::direction> d = read_direction (*direction_string);
        if (!bool (d)) throw exception {2} << "direction must be income or expense.";
        directions = {*d};
    }

    for (Pocket::direction d : directions) {
        std::cout << d << ":" << std::endl;
        for (const std::string &c : l.Manager.categories ().categories (d)) std::cout << "\t" << c << std::endl;
    }
}

void print_breakdown (const std::string &title, const std::map<std::string, Pocket::wallet_report::entry> &entries, const std::map<std::string, double> &percentages) {
    std::cout << title << ":" << std::endl;
    if (entries.empty ()) std::cout << "\tnone" << std::endl;
    for (const auto &[category, e] : entries) {
        std::cout << "\t" << category << ": " << write_amount (e.Total) << " in " << e.Count << (e.Count == 1 ? " transaction" : " transactions");
        auto pc = percentages.find (category);
        if (pc != percentages.end ()) std::cout << " (" << write_amount (pc->second) << "%)";
        std::cout << std::endl;
    }
}

void command_report (const options &p) {
    ledger l {p.filepath ()};
    const Pocket::wallet &w = l.wallet (p);

    Pocket::filtering_context f = p.filters ();
    Pocket::wallet_report r = w.report (f);

    std::cout << w << "\n" << f.summary ()
        << "\ntransactions: " << r.Count
        << "\ntotal income: " << write_amount (r.TotalIncome)
        << "\ntotal expense: " << write_amount (r.TotalExpense)
        << "\nnet change: " << write_amount (r.net ()) << std::endl;

    print_breakdown ("income", r.Income, r.income_percentages ());
    print_breakdown ("expense", r.Expense, r.expense_percentages ());

    if (f.has_filters ()) return;

    std::cout << "net by category (share of turnover):" << std::endl;
    auto totals = w.category_totals ();
    auto shares = w.category_percentages ();
    if (totals.empty ()) std::cout << "\tnone" << std::endl;
    for (const auto &[category, total] : totals) {
        std::cout << "\t" << category << ": " << write_amount (total);
        auto pc = shares.find (category);
        if (pc != shares.end ()) std::cout << " (" << write_amount (pc->second) << "%)";
        std::cout << std::endl;
    }
}

void command_deposit (const options &p) {
    ledger l {p.filepath ()};
    const Pocket::wallet &w = l.wallet (p);

    const auto *d = dynamic_cast<const Pocket::deposit_wallet *> (&w);
    if (d == nullptr) throw exception {2} << "wallet " << w.name () << " is not a deposit wallet";

    maybe<Pocket::timestamp> when = p.time ("date");
    std::cout << w << "\n" << d->summary (bool (when) ? *when : Pocket::now ()) << std::endl;
}

void command_sorts (const options &) {
    std::cout << "transactions (use with method list):" << std::endl;
    for (const auto &[key, name] : Pocket::transaction_sorting::available ())
        std::cout << "\t" << key << " -- " << name << std::endl;

    std::cout << "wallets (use with method wallets):" << std::endl;
    for (const auto &[key, name] : Pocket::wallet_sorting::available ())
        std::cout << "\t" << key << " -- " << name << std::endl;
}

void command_filters (const options &) {
    std::cout << "filter presets (use with method list as --filter=<preset>):" << std::endl;
    for (const Pocket::filter_preset_entry &e : Pocket::filter_presets ())
        std::cout << "\t" << std::left << std::setw (22) << e.Key << Pocket::make_filter (e.Preset)->name () << std::endl;
}
