#include <Pocket/transaction.hpp>

#include <cmath>
#include <iomanip>
#include <random>
#include <sstream>

namespace Pocket {

    std::ostream &operator << (std::ostream &o, direction d) {
        return o << (d == direction::income ? "income" : "expense");
    }

    JSON write (direction d) {
        return d == direction::income ? "income" : "expense";
    }

    direction read_direction (const JSON &j) {
        if (j.is_string ()) {
            if (std::string (j) == "income") return direction::income;
            if (std::string (j) == "expense") return direction::expense;
        }

        throw exception {} << "invalid transaction direction format";
    }

    const std::string &transfer_category () {
        static const std::string Transfer {"Transfer"};
        return Transfer;
    }

    std::string new_transaction_id () {
        static thread_local std::mt19937 generator {std::random_device {} ()};
        std::uniform_int_distribution<uint32> digits {0, 0xffffffff};
        std::stringstream ss;
        ss << std::hex << std::setfill ('0') << std::setw (8) << digits (generator);
        return ss.str ();
    }

    namespace {

        void check_amount (double amount) {
            if (!std::isfinite (amount) || amount <= 0)
                throw validation_error {"amount must be a positive number"};
        }

        std::string write_amount (double x) {
            std::stringstream ss;
            ss << std::fixed << std::setprecision (2) << x;
            return ss.str ();
        }

    }

    transaction::transaction (double amount, direction d, const std::string &category,
        const std::string &description, maybe<timestamp> created) :
        transaction {new_transaction_id (), amount, d, category, description, bool (created) ? *created : now ()} {}

    transaction::transaction (const std::string &id, double amount, direction d, const std::string &category,
        const std::string &description, const timestamp &created) :
        ID {id}, Amount {amount}, Direction {d}, Category {category}, Description {description}, Created {created} {
        check_amount (Amount);
    }

    transaction transaction::edited (const transaction_edit &e) const {
        return transaction {ID,
            bool (e.Amount) ? *e.Amount : Amount,
            bool (e.Direction) ? *e.Direction : Direction,
            bool (e.Category) ? *e.Category : Category,
            bool (e.Description) ? *e.Description : Description,
            bool (e.Created) ? *e.Created : Created};
    }

    std::ostream &operator << (std::ostream &o, const transaction &t) {
        return o << t.Category << " - " << (t.Direction == direction::income ? "+" : "-") << write_amount (t.Amount);
    }

    std::string transaction::detailed () const {
        bool income = Direction == direction::income;
        std::stringstream ss;
        ss << "ID: " << ID
            << "\nType: " << (income ? "+ (Income)" : "- (Expense)")
            << "\nAmount: " << (income ? "+" : "-") << write_amount (Amount)
            << "\nCategory: " << Category
            << "\nDescription: " << (Description.empty () ? std::string {"N/A"} : Description)
            << "\nDate: " << write_timestamp (Created);
        return ss.str ();
    }

    transaction::operator JSON () const {
        JSON::object_t o;
        o["id"] = ID;
        o["amount"] = Amount;
        o["direction"] = write (Direction);
        o["category"] = Category;
        o["description"] = Description;
        o["created"] = write_timestamp (Created);
        return o;
    }

    transfer::transfer (uint32 source_wallet, double amount, direction d,
        const std::string &description, maybe<timestamp> created) :
        transfer {new_transaction_id (), source_wallet, amount, d, description, bool (created) ? *created : now ()} {}

    transfer::transfer (const std::string &id, uint32 source_wallet, double amount, direction d,
        const std::string &description, const timestamp &created) :
        transaction {id, amount, d, transfer_category (), description, created},
        SourceWallet {source_wallet}, Connected {} {}

    bool transfer::update (const transaction_edit &e, transfer *partner) {
        if (bool (e.Category))
            throw validation_error {"the category of a transfer cannot be edited"};

        if (bool (e.Direction))
            throw validation_error {"the direction of a transfer cannot be edited"};

        if (bool (e.Amount)) check_amount (*e.Amount);

        if (partner == nullptr || !bool (Connected) || !bool (partner->Connected) ||
            *Connected != partner->link () || *partner->Connected != link ()) return false;

        for (transfer *side : {static_cast<transfer *> (this), partner}) {
            if (bool (e.Amount)) side->Amount = *e.Amount;
            if (bool (e.Description)) side->Description = *e.Description;
            if (bool (e.Created)) side->Created = *e.Created;
        }

        return true;
    }

    std::string transfer::detailed () const {
        std::stringstream ss;
        ss << transaction::detailed () << "\nTransfer: ";
        if (bool (Connected)) ss << (Direction == direction::expense ? "to" : "from")
            << " wallet #" << Connected->Wallet << " (transaction " << Connected->Transaction << ")";
        else ss << "detached";
        return ss.str ();
    }

    transfer::operator JSON () const {
        JSON j = transaction::operator JSON ();
        if (bool (Connected)) {
            JSON::object_t link;
            link["wallet"] = Connected->Wallet;
            link["transaction"] = Connected->Transaction;
            j["transfer"] = link;
        } else j["transfer"] = nullptr;
        return j;
    }

    std::unique_ptr<transaction> transaction::read (const JSON &j, uint32 wallet) {
        if (!j.is_object ()) throw exception {} << "invalid transaction JSON format";

        auto id = j.find ("id");
        auto amount = j.find ("amount");
        auto dir = j.find ("direction");
        auto category = j.find ("category");
        auto description = j.find ("description");
        auto created = j.find ("created");

        if (id == j.end () || !id->is_string ()) throw exception {} << "invalid transaction JSON format: 'id'";
        if (amount == j.end () || !amount->is_number () || !std::isfinite (double (*amount)) || double (*amount) <= 0)
            throw exception {} << "invalid transaction JSON format: 'amount'";
        if (dir == j.end ()) throw exception {} << "invalid transaction JSON format: 'direction'";
        if (category == j.end () || !category->is_string ()) throw exception {} << "invalid transaction JSON format: 'category'";
        if (created == j.end () || !created->is_string ()) throw exception {} << "invalid transaction JSON format: 'created'";

        maybe<timestamp> when = read_timestamp (std::string (*created));
        if (!bool (when)) throw exception {} << "invalid transaction JSON format: could not read time " << std::string (*created);

        std::string desc = description != j.end () && description->is_string () ? std::string (*description) : std::string {};

        auto link = j.find ("transfer");
        if (link == j.end ()) {
            if (std::string (*category) == transfer_category ())
                throw exception {} << "invalid transaction JSON format: category " << transfer_category () << " without a transfer";
            return std::make_unique<transaction> (std::string (*id), double (*amount),
                read_direction (*dir), std::string (*category), desc, *when);
        }

        auto t = std::make_unique<transfer> (std::string (*id), wallet, double (*amount), read_direction (*dir), desc, *when);

        if (!link->is_null ()) {
            auto w = link->find ("wallet");
            auto tx = link->find ("transaction");
            if (w == link->end () || !w->is_number_unsigned () || tx == link->end () || !tx->is_string ())
                throw exception {} << "invalid transaction JSON format: 'transfer'";
            t->Connected = transfer_link {uint32 (*w), std::string (*tx)};
        }

        return t;
    }

}
