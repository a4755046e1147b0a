#include <Pocket/wallet/wallet.hpp>
#include <Pocket/wallet/deposit.hpp>

#include <cmath>
#include <iomanip>

namespace Pocket {

    wallet::wallet (const std::string &name, const std::string &currency, const std::string &description,
        maybe<double> starting_value, maybe<timestamp> created) :
        Name {name}, Currency {currency}, Description {description},
        Created {bool (created) ? *created : now ()}, StartingValue {starting_value} {
        if (Name.empty ()) throw validation_error {"wallet name cannot be empty"};
        if (bool (StartingValue) && !std::isfinite (*StartingValue))
            throw validation_error {"starting value must be a number"};
    }

    void wallet::attach (uint32 id, category_manager &c, wallet_directory &d) {
        if (ID == 0) ID = id;
        Categories = &c;
        Directory = &d;

        for (const auto &[_, t] : Transactions) {
            if (auto *x = dynamic_cast<transfer *> (t.get ()); x != nullptr) x->SourceWallet = ID;
            Categories->add (t->Category, t->Direction);
        }

        if (bool (StartingValue)) {
            double v = *StartingValue;
            StartingValue = {};
            if (v != 0) add_transaction (std::abs (v), v > 0 ? direction::income : direction::expense,
                ledger_options::StartingBalanceCategory, "", Created);
        }
    }

    void wallet::include (const transaction &t) {
        if (t.Direction == direction::income) TotalIncome += t.Amount;
        else TotalExpense += t.Amount;
        Balance += t.signed_amount ();
    }

    void wallet::retract (const transaction &t) {
        if (t.Direction == direction::income) TotalIncome -= t.Amount;
        else TotalExpense -= t.Amount;
        Balance -= t.signed_amount ();
    }

    transaction *wallet::find (const std::string &id) {
        auto it = Transactions.find (id);
        if (it == Transactions.end ()) return nullptr;
        return it->second.get ();
    }

    std::pair<wallet *, transfer *> wallet::partner (const transfer &t) {
        if (!bool (t.Connected) || Directory == nullptr) return {nullptr, nullptr};
        wallet *w = Directory->find (t.Connected->Wallet);
        if (w == nullptr) return {nullptr, nullptr};
        return {w, dynamic_cast<transfer *> (w->find (t.Connected->Transaction))};
    }

    const transaction &wallet::add_transaction (std::unique_ptr<transaction> t) {
        if (t == nullptr) throw validation_error {"no transaction provided"};
        if (Transactions.contains (t->ID)) throw validation_error {"wallet " + Name + " already has a transaction " + t->ID};
        if (!t->is_transfer () && t->Category == transfer_category ())
            throw validation_error {"category " + transfer_category () + " is kept for transfers between wallets"};
        if (Categories != nullptr) Categories->add (t->Category, t->Direction);
        include (*t);
        const transaction &x = *t;
        Transactions[t->ID] = std::move (t);
        return x;
    }

    const transaction &wallet::add_transaction (double amount, direction d, const std::string &category,
        const std::string &description, maybe<timestamp> created) {
        return add_transaction (std::make_unique<transaction> (amount, d, category, description, created));
    }

    const transaction *wallet::get_by_position (size_t position) const {
        if (position == 0) return nullptr;
        auto sorted = sorted_transactions ();
        if (position > sorted.size ()) return nullptr;
        return sorted[position - 1];
    }

    const transaction *wallet::get_by_id (const std::string &id) const {
        auto it = Transactions.find (id);
        if (it == Transactions.end ()) return nullptr;
        return it->second.get ();
    }

    bool wallet::update_by_position (size_t position, const transaction_edit &e) {
        const transaction *t = get_by_position (position);
        if (t == nullptr) return false;
        return update_by_id (t->ID, e);
    }

    bool wallet::update_by_id (const std::string &id, const transaction_edit &e) {
        auto it = Transactions.find (id);
        if (it == Transactions.end ()) return false;

        if (auto *t = dynamic_cast<transfer *> (it->second.get ()); t != nullptr) {
            auto [other_wallet, other] = partner (*t);
            if (other == nullptr) throw invariant_violation {"transfer " + id + " in wallet " + Name + " has no partner"};

            transaction before = *t;
            transaction other_before = *other;

            if (!t->update (e, other))
                throw invariant_violation {"transfer " + id + " in wallet " + Name + " is not linked to its partner"};

            retract (before);
            include (*t);
            other_wallet->retract (other_before);
            other_wallet->include (*other);
            return true;
        }

        auto replacement = std::make_unique<transaction> (it->second->edited (e));
        if (replacement->Category == transfer_category ())
            throw validation_error {"category " + transfer_category () + " is kept for transfers between wallets"};

        retract (*it->second);
        if (Categories != nullptr) Categories->add (replacement->Category, replacement->Direction);
        include (*replacement);
        it->second = std::move (replacement);
        return true;
    }

    bool wallet::delete_by_position (size_t position, bool cascade) {
        const transaction *t = get_by_position (position);
        if (t == nullptr) return false;
        return delete_by_id (t->ID, cascade);
    }

    bool wallet::delete_by_id (const std::string &id, bool cascade) {
        auto it = Transactions.find (id);
        if (it == Transactions.end ()) return false;

        if (auto *t = dynamic_cast<transfer *> (it->second.get ()); t != nullptr && cascade && bool (t->Connected)) {
            auto [other_wallet, other] = partner (*t);
            if (other == nullptr || !bool (other->Connected) || *other->Connected != t->link ())
                throw invariant_violation {"transfer " + id + " in wallet " + Name + " is not linked to its partner"};

            detach (*t, *other);
            other_wallet->delete_by_id (other->ID, false);
        }

        retract (*it->second);
        Transactions.erase (it);
        return true;
    }

    std::vector<const transaction *> wallet::transactions () const {
        std::vector<const transaction *> x;
        x.reserve (Transactions.size ());
        for (const auto &[_, t] : Transactions) x.push_back (t.get ());
        return x;
    }

    std::vector<const transaction *> wallet::sorted_transactions () const {
        return Sorting.sort (transactions ());
    }

    std::vector<const transaction *> wallet::filtered_transactions () const {
        return Filtering.apply (sorted_transactions ());
    }

    std::map<std::string, double> wallet::totals (maybe<direction> d) const {
        std::map<std::string, double> x;
        for (const auto &[_, t] : Transactions)
            if (!bool (d)) x[t->Category] += t->signed_amount ();
            else if (t->Direction == *d) x[t->Category] += t->Amount;
        return x;
    }

    std::map<std::string, double> wallet::category_totals () const {
        std::map<std::string, double> x = totals ({});
        std::erase_if (x, [] (const auto &e) -> bool {
            return e.second == 0;
        });
        return x;
    }

    std::map<std::string, double> wallet::income_category_totals () const {
        return totals (direction::income);
    }

    std::map<std::string, double> wallet::expense_category_totals () const {
        return totals (direction::expense);
    }

    namespace {
        std::map<std::string, double> percentages (std::map<std::string, double> x, double total) {
            if (total == 0) return {};
            for (auto &[_, v] : x) v = v / total * 100;
            return x;
        }
    }

    std::map<std::string, double> wallet::income_category_percentages () const {
        return percentages (income_category_totals (), TotalIncome);
    }

    std::map<std::string, double> wallet::expense_category_percentages () const {
        return percentages (expense_category_totals (), TotalExpense);
    }

    std::map<std::string, double> wallet_report::income_percentages () const {
        std::map<std::string, double> x;
        for (const auto &[category, e] : Income) x[category] = e.Total;
        return percentages (x, TotalIncome);
    }

    std::map<std::string, double> wallet_report::expense_percentages () const {
        std::map<std::string, double> x;
        for (const auto &[category, e] : Expense) x[category] = e.Total;
        return percentages (x, TotalExpense);
    }

    wallet_report wallet::report (const filtering_context &f) const {
        wallet_report r {};
        for (const auto &[_, t] : Transactions) {
            if (!f.matches (*t)) continue;

            r.Count++;
            wallet_report::entry &e = t->Direction == direction::income ? r.Income[t->Category] : r.Expense[t->Category];
            e.Total += t->Amount;
            e.Count++;

            if (t->Direction == direction::income) r.TotalIncome += t->Amount;
            else r.TotalExpense += t->Amount;
        }

        return r;
    }

    std::map<std::string, double> wallet::category_percentages () const {
        std::map<std::string, double> x;
        double total = 0;
        for (const auto &[_, t] : Transactions) {
            x[t->Category] += t->Amount;
            total += t->Amount;
        }

        return percentages (x, total);
    }

    std::ostream &operator << (std::ostream &o, const wallet &w) {
        return o << w.name () << " (" << w.currency () << "): " << std::fixed << std::setprecision (2) << w.balance ();
    }

    wallet::operator JSON () const {
        JSON::object_t o;
        o["id"] = ID;
        o["type"] = "simple";
        o["name"] = Name;
        o["currency"] = Currency;
        o["description"] = Description;
        o["created"] = write_timestamp (Created);
        o["sort"] = Sorting.current ().Key;

        JSON::array_t txs;
        for (const auto &[_, t] : Transactions) txs.push_back (JSON (*t));
        o["transactions"] = txs;
        return o;
    }

    wallet::wallet (const JSON::object_t &j) {
        auto id = j.find ("id");
        auto name = j.find ("name");
        auto currency = j.find ("currency");
        auto description = j.find ("description");
        auto created = j.find ("created");
        auto sort = j.find ("sort");
        auto txs = j.find ("transactions");

        if (id == j.end () || !id->second.is_number_unsigned () || uint32 (id->second) == 0)
            throw exception {} << "invalid wallet JSON format: 'id'";
        if (name == j.end () || !name->second.is_string () || std::string (name->second).empty ())
            throw exception {} << "invalid wallet JSON format: 'name'";
        if (created == j.end () || !created->second.is_string ())
            throw exception {} << "invalid wallet JSON format: 'created'";
        if (txs == j.end () || !txs->second.is_array ())
            throw exception {} << "invalid wallet JSON format: 'transactions'";

        maybe<timestamp> when = read_timestamp (std::string (created->second));
        if (!bool (when)) throw exception {} << "invalid wallet JSON format: could not read time " << std::string (created->second);

        ID = uint32 (id->second);
        Name = std::string (name->second);
        Currency = currency != j.end () && currency->second.is_string () ?
            std::string (currency->second) : std::string {ledger_options::DefaultCurrency};
        Description = description != j.end () && description->second.is_string () ?
            std::string (description->second) : std::string {};
        Created = *when;

        if (sort != j.end () && sort->second.is_string () && !Sorting.set_strategy (std::string (sort->second)))
            throw exception {} << "invalid wallet JSON format: unknown sort " << std::string (sort->second);

        for (const JSON &x : txs->second) {
            std::unique_ptr<transaction> t = transaction::read (x, ID);
            if (Transactions.contains (t->ID))
                throw exception {} << "invalid wallet JSON format: transaction " << t->ID << " appears twice";
            include (*t);
            Transactions[t->ID] = std::move (t);
        }
    }

    std::unique_ptr<wallet> wallet::read (const JSON &j) {
        if (!j.is_object ()) throw exception {} << "invalid wallet JSON format";

        auto type = j.find ("type");
        if (type == j.end () || !type->is_string ()) throw exception {} << "invalid wallet JSON format: 'type'";

        const auto &o = j.get_ref<const JSON::object_t &> ();
        if (std::string (*type) == "simple") return std::unique_ptr<wallet> (new wallet (o));
        if (std::string (*type) == "deposit") return std::make_unique<deposit_wallet> (o);

        throw exception {} << "invalid wallet JSON format: unknown type " << std::string (*type);
    }

    namespace {

        bool by_balance (const wallet &a, const wallet &b) {
            if (a.balance () != b.balance ()) return a.balance () > b.balance ();
            return data::to_lower (a.name ()) < data::to_lower (b.name ());
        }

        bool by_name (const wallet &a, const wallet &b) {
            std::string x = data::to_lower (a.name ());
            std::string y = data::to_lower (b.name ());
            if (x != y) return x < y;
            return a.id () < b.id ();
        }

        bool newest_first (const wallet &a, const wallet &b) {
            if (a.created () != b.created ()) return a.created () > b.created ();
            return data::to_lower (a.name ()) < data::to_lower (b.name ());
        }

    }

    template <> const std::vector<sorting_strategy<wallet>> &sorting_context<wallet>::strategies () {
        static const std::vector<sorting_strategy<wallet>> Strategies {
            {"1", "By Balance", &by_balance},
            {"2", "By Name", &by_name},
            {"3", "Newest First", &newest_first}};
        return Strategies;
    }

}
