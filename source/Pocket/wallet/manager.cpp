#include <Pocket/wallet/manager.hpp>

#include <cmath>

namespace Pocket {

    namespace {
        std::string key (const std::string &name) {
            return data::to_lower (name);
        }
    }

    wallet &wallet_manager::add_wallet (std::unique_ptr<wallet> w) {
        if (w == nullptr) throw validation_error {"no wallet provided"};

        std::string k = key (w->name ());
        if (Wallets.contains (k)) throw validation_error {"wallet " + w->name () + " already exists"};

        if (w->id () != 0 && ByID.contains (w->id ()))
            throw validation_error {"wallet id " + std::to_string (w->id ()) + " is already in use"};

        w->attach (NextID, Categories, *this);
        if (w->id () >= NextID) NextID = w->id () + 1;

        wallet &x = *w;
        ByID[x.id ()] = &x;
        Wallets[k] = std::move (w);

        if (Current == nullptr) Current = &x;
        return x;
    }

    wallet &wallet_manager::create_wallet (const wallet_options &o) {
        if (!o.Deposit) {
            if (bool (o.InterestRate) || bool (o.TermMonths))
                throw validation_error {"only a deposit wallet can have an interest rate or a term"};

            return add_wallet (std::make_unique<wallet> (o.Name, o.Currency, o.Description, o.StartingValue, o.Created));
        }

        if (!bool (o.InterestRate)) throw validation_error {"a deposit wallet needs an interest rate"};
        if (!bool (o.TermMonths)) throw validation_error {"a deposit wallet needs a term"};

        return add_wallet (std::make_unique<deposit_wallet> (o.Name,
            deposit_terms {*o.InterestRate, *o.TermMonths, o.Capitalization},
            o.Currency, o.Description, o.StartingValue, o.Created));
    }

    wallet *wallet_manager::get_wallet (const std::string &name) {
        auto it = Wallets.find (key (name));
        if (it == Wallets.end ()) return nullptr;
        return it->second.get ();
    }

    const wallet *wallet_manager::get_wallet (const std::string &name) const {
        auto it = Wallets.find (key (name));
        if (it == Wallets.end ()) return nullptr;
        return it->second.get ();
    }

    wallet *wallet_manager::find (uint32 id) {
        auto it = ByID.find (id);
        if (it == ByID.end ()) return nullptr;
        return it->second;
    }

    bool wallet_manager::remove_wallet (const std::string &name) {
        auto it = Wallets.find (key (name));
        if (it == Wallets.end ()) return false;

        wallet &w = *it->second;

        std::vector<std::string> ids;
        for (const transaction *t : w.transactions ()) ids.push_back (t->ID);
        for (const std::string &id : ids) w.delete_by_id (id, true);

        ByID.erase (w.id ());
        bool was_current = Current == &w;
        Wallets.erase (it);

        if (was_current) Current = Wallets.empty () ? nullptr : Wallets.begin ()->second.get ();
        return true;
    }

    bool wallet_manager::update_wallet (const std::string &name, const wallet_update &u) {
        auto it = Wallets.find (key (name));
        if (it == Wallets.end ()) return false;

        wallet &w = *it->second;
        auto *d = dynamic_cast<deposit_wallet *> (&w);

        if (bool (u.InterestRate) && d == nullptr)
            throw validation_error {"wallet " + w.name () + " is not a deposit wallet"};

        if (bool (u.Name)) {
            if (u.Name->empty ()) throw validation_error {"wallet name cannot be empty"};
            std::string k = key (*u.Name);
            if (k != it->first && Wallets.contains (k)) throw validation_error {"wallet " + *u.Name + " already exists"};
        }

        if (bool (u.InterestRate)) d->set_interest_rate (*u.InterestRate);
        if (bool (u.Currency)) w.set_currency (*u.Currency);
        if (bool (u.Description)) w.set_description (*u.Description);

        if (bool (u.Name)) {
            auto node = Wallets.extract (it);
            node.key () = key (*u.Name);
            node.mapped ()->Name = *u.Name;
            Wallets.insert (std::move (node));
        }

        return true;
    }

    bool wallet_manager::switch_wallet (const std::string &name) {
        wallet *w = get_wallet (name);
        if (w == nullptr) return false;
        Current = w;
        return true;
    }

    std::vector<const wallet *> wallet_manager::wallets () const {
        std::vector<const wallet *> x;
        x.reserve (Wallets.size ());
        for (const auto &[_, w] : Wallets) x.push_back (w.get ());
        return x;
    }

    std::vector<const wallet *> wallet_manager::sorted_wallets () const {
        return Sorting.sort (wallets ());
    }

    bool wallet_manager::transfer (const std::string &from, const std::string &to, double amount,
        const std::string &description, maybe<timestamp> when) {
        wallet *source = get_wallet (from);
        wallet *target = get_wallet (to);

        if (source == nullptr || target == nullptr || source == target) return false;
        if (!std::isfinite (amount) || amount <= 0) return false;

        timestamp t = bool (when) ? *when : now ();

        transfer (
            std::make_unique<Pocket::transfer> (source->id (), amount, direction::expense, description, t),
            std::make_unique<Pocket::transfer> (target->id (), amount, direction::income, description, t));

        return true;
    }

    void wallet_manager::transfer (std::unique_ptr<Pocket::transfer> outgoing, std::unique_ptr<Pocket::transfer> incoming) {
        if (outgoing == nullptr || incoming == nullptr) throw validation_error {"a transfer needs two sides"};

        wallet *source = find (outgoing->SourceWallet);
        wallet *target = find (incoming->SourceWallet);

        if (source == nullptr || target == nullptr) throw validation_error {"a transfer must be between two known wallets"};
        if (source == target) throw validation_error {"cannot transfer from a wallet to itself"};
        if (outgoing->Direction != direction::expense || incoming->Direction != direction::income)
            throw validation_error {"a transfer goes out of one wallet and into another"};
        if (outgoing->Amount != incoming->Amount || outgoing->Description != incoming->Description ||
            outgoing->Created != incoming->Created)
            throw validation_error {"both sides of a transfer must be the same"};

        link (*outgoing, *incoming);

        std::string outgoing_id = outgoing->ID;
        source->add_transaction (std::move (outgoing));

        try {
            target->add_transaction (std::move (incoming));
        } catch (...) {
            source->delete_by_id (outgoing_id, false);
            throw;
        }
    }

    void wallet_manager::check_links () {
        for (auto &[_, w] : Wallets) for (auto &[id, t] : w->Transactions) {
            auto *x = dynamic_cast<Pocket::transfer *> (t.get ());
            if (x == nullptr) continue;

            if (!bool (x->Connected))
                throw exception {} << "transfer " << id << " in wallet " << w->name () << " is not linked";

            auto [other_wallet, other] = w->partner (*x);
            if (other == nullptr)
                throw exception {} << "transfer " << id << " in wallet " << w->name () << " has no partner";

            if (other_wallet == w.get () || !bool (other->Connected) || *other->Connected != x->link () ||
                other->Amount != x->Amount || other->Direction == x->Direction ||
                other->Description != x->Description || other->Created != x->Created)
                throw exception {} << "transfer " << id << " in wallet " << w->name () << " does not match its partner";
        }
    }

    wallet_manager::wallet_manager (const JSON &j) {
        if (j == JSON (nullptr)) return;
        if (!j.is_object ()) throw exception {} << "invalid wallet manager JSON format";

        auto categories = j.find ("categories");
        auto wallets = j.find ("wallets");
        auto current = j.find ("current");
        auto sort = j.find ("sort");

        if (categories != j.end ()) Categories = category_manager {*categories};

        if (wallets == j.end () || !wallets->is_array ())
            throw exception {} << "invalid wallet manager JSON format: 'wallets'";

        for (const JSON &w : *wallets) {
            std::unique_ptr<wallet> x = wallet::read (w);
            if (Wallets.contains (key (x->name ())) || ByID.contains (x->id ()))
                throw exception {} << "invalid wallet manager JSON format: wallet " << x->name () << " appears twice";
            add_wallet (std::move (x));
        }

        check_links ();

        Current = nullptr;
        if (current != j.end () && !current->is_null ()) {
            if (!current->is_string () || !switch_wallet (std::string (*current)))
                throw exception {} << "invalid wallet manager JSON format: 'current'";
        } else if (!Wallets.empty ()) Current = Wallets.begin ()->second.get ();

        if (sort != j.end () && sort->is_string () && !Sorting.set_strategy (std::string (*sort)))
            throw exception {} << "invalid wallet manager JSON format: unknown sort " << std::string (*sort);
    }

    wallet_manager::operator JSON () const {
        JSON::array_t wallets;
        for (const auto &[_, w] : Wallets) wallets.push_back (JSON (*w));

        JSON::object_t o;
        o["wallets"] = wallets;
        o["current"] = Current == nullptr ? JSON (nullptr) : JSON (Current->name ());
        o["categories"] = JSON (Categories);
        o["sort"] = Sorting.current ().Key;
        return o;
    }

}
