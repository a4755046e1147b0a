#include <Pocket/category.hpp>

namespace Pocket {

    category_manager::category_manager () :
        Income {"Salary", "Freelance", "Investment", "Gift", "Other"},
        Expense {"Food", "Transport", "Entertainment", "Bills", "Shopping", "Health", "Other"} {}

    namespace {
        std::set<std::string> read_categories (const JSON &j) {
            if (!j.is_array ()) throw exception {} << "invalid categories JSON format";
            std::set<std::string> x;
            for (const JSON &name : j) {
                if (!name.is_string ()) throw exception {} << "invalid categories JSON format: expected string";
                x.insert (std::string (name));
            }
            return x;
        }

        JSON write_categories (const std::set<std::string> &x) {
            JSON::array_t a;
            for (const std::string &name : x) a.push_back (name);
            return a;
        }
    }

    category_manager::category_manager (const JSON &j) : category_manager {} {
        if (j == JSON (nullptr)) return;

        if (!j.is_object ()) throw exception {} << "invalid categories JSON format";

        auto income = j.find ("income");
        auto expense = j.find ("expense");

        if (income != j.end ()) Income.merge (read_categories (*income));
        if (expense != j.end ()) Expense.merge (read_categories (*expense));
    }

    category_manager::operator JSON () const {
        JSON::object_t o;
        o["income"] = write_categories (Income);
        o["expense"] = write_categories (Expense);
        return o;
    }

}
