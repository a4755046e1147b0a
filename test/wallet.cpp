#include <Pocket/wallet/manager.hpp>
#include "gtest/gtest.h"

#include <cmath>

namespace Pocket {

    namespace {

        timestamp at (const std::string &x) {
            return *read_timestamp (x);
        }

        // balance, total income and total expense all agree with the transactions.
        void expect_consistent (const wallet &w) {
            double income = 0;
            double expense = 0;
            for (const transaction *t : w.transactions ())
                if (t->Direction == direction::income) income += t->Amount;
                else expense += t->Amount;

            EXPECT_DOUBLE_EQ (w.total_income (), income);
            EXPECT_DOUBLE_EQ (w.total_expense (), expense);
            EXPECT_DOUBLE_EQ (w.balance (), income - expense);
        }

        const transfer *only_transfer (const wallet &w) {
            const transfer *x = nullptr;
            for (const transaction *t : w.transactions ()) if (t->is_transfer ()) {
                EXPECT_EQ (x, nullptr);
                x = dynamic_cast<const transfer *> (t);
            }
            return x;
        }

    }

    TEST (Wallet, Aggregates) {
        wallet w {"Cash"};
        EXPECT_EQ (w.currency (), "USD");
        EXPECT_EQ (w.balance (), 0);

        std::string salary = w.add_transaction (1000, direction::income, "Salary").ID;
        std::string food = w.add_transaction (120, direction::expense, "Food").ID;
        w.add_transaction (80, direction::expense, "Transport");
        EXPECT_EQ (w.transaction_count (), 3);
        EXPECT_EQ (w.total_income (), 1000);
        EXPECT_EQ (w.total_expense (), 200);
        EXPECT_EQ (w.balance (), 800);

        EXPECT_TRUE (w.update_by_id (food, transaction_edit {.Amount = 150}));
        EXPECT_EQ (w.balance (), 770);
        expect_consistent (w);

        EXPECT_TRUE (w.update_by_id (food, transaction_edit {.Direction = direction::income, .Category = "Gift"}));
        EXPECT_EQ (w.total_income (), 1150);
        EXPECT_EQ (w.total_expense (), 80);
        EXPECT_EQ (w.get_by_id (food)->Category, "Gift");
        expect_consistent (w);

        EXPECT_THROW (w.update_by_id (salary, transaction_edit {.Amount = 0}), validation_error);
        EXPECT_EQ (w.get_by_id (salary)->Amount, 1000);
        expect_consistent (w);

        EXPECT_FALSE (w.update_by_id ("ffffffff", transaction_edit {.Amount = 1}));
        EXPECT_FALSE (w.update_by_position (4, transaction_edit {.Amount = 1}));

        EXPECT_TRUE (w.delete_by_id (salary));
        EXPECT_FALSE (w.delete_by_id (salary));
        EXPECT_EQ (w.get_by_id (salary), nullptr);
        EXPECT_EQ (w.transaction_count (), 2);
        EXPECT_EQ (w.balance (), 70);
        expect_consistent (w);

        EXPECT_FALSE (w.delete_by_position (3));
        EXPECT_TRUE (w.delete_by_position (1));
        EXPECT_TRUE (w.delete_by_position (1));
        EXPECT_EQ (w.transaction_count (), 0);
        EXPECT_EQ (w.balance (), 0);
    }

    TEST (Wallet, InvalidName) {
        EXPECT_THROW (wallet {""}, validation_error);
    }

    TEST (Wallet, CategoryBreakdown) {
        wallet w {"Cash"};
        EXPECT_TRUE (w.income_category_percentages ().empty ());
        EXPECT_TRUE (w.expense_category_percentages ().empty ());
        EXPECT_TRUE (w.category_percentages ().empty ());

        w.add_transaction (300, direction::income, "Salary");
        w.add_transaction (100, direction::income, "Gift");
        w.add_transaction (50, direction::expense, "Food");
        w.add_transaction (150, direction::expense, "Bills");
        w.add_transaction (100, direction::expense, "Gift");

        auto totals = w.category_totals ();
        EXPECT_EQ (totals.size (), 3);
        EXPECT_EQ (totals["Salary"], 300);
        EXPECT_EQ (totals["Food"], -50);
        EXPECT_EQ (totals["Bills"], -150);
        EXPECT_FALSE (totals.contains ("Gift"));

        EXPECT_EQ (w.income_category_totals ()["Gift"], 100);
        EXPECT_EQ (w.expense_category_totals ()["Gift"], 100);

        auto income = w.income_category_percentages ();
        EXPECT_DOUBLE_EQ (income["Salary"], 75);
        EXPECT_DOUBLE_EQ (income["Gift"], 25);

        auto expense = w.expense_category_percentages ();
        EXPECT_DOUBLE_EQ (expense["Food"], 50.0 / 3);
        EXPECT_DOUBLE_EQ (expense["Bills"], 50);
        EXPECT_DOUBLE_EQ (expense["Gift"], 100.0 / 3);

        auto all = w.category_percentages ();
        EXPECT_DOUBLE_EQ (all["Salary"], 300.0 / 7);
        EXPECT_DOUBLE_EQ (all["Gift"], 200.0 / 7);
        EXPECT_DOUBLE_EQ (all["Food"], 50.0 / 7);
        EXPECT_DOUBLE_EQ (all["Bills"], 150.0 / 7);
    }

    TEST (Wallet, Report) {
        wallet w {"Cash"};

        wallet_report empty = w.report ();
        EXPECT_EQ (empty.Count, 0);
        EXPECT_EQ (empty.net (), 0);
        EXPECT_TRUE (empty.income_percentages ().empty ());

        w.add_transaction (1000, direction::income, "Salary", "", at ("2024-01-31 09:00:00"));
        w.add_transaction (40, direction::expense, "Food", "", at ("2024-01-31 23:59:59"));
        w.add_transaction (1000, direction::income, "Salary", "", at ("2024-02-29 09:00:00"));
        w.add_transaction (25, direction::expense, "Food", "", at ("2024-02-01"));
        w.add_transaction (35, direction::expense, "Food", "", at ("2024-02-15 12:00:00"));
        w.add_transaction (140, direction::expense, "Bills", "", at ("2024-02-20"));
        w.add_transaction (60, direction::expense, "Food", "", at ("2024-03-01"));

        wallet_report all = w.report ();
        EXPECT_EQ (all.Count, 7);
        EXPECT_EQ (all.TotalIncome, w.total_income ());
        EXPECT_EQ (all.TotalExpense, w.total_expense ());
        EXPECT_EQ (all.Expense["Food"].Count, 4);
        EXPECT_EQ (all.Expense["Food"].Total, 160);

        filtering_context february {};
        february.add (std::make_shared<date_filter> (date_filter::between (*read_date ("2024-02-01"), *read_date ("2024-02-29"))));

        wallet_report r = w.report (february);
        EXPECT_EQ (r.Count, 4);
        EXPECT_EQ (r.TotalIncome, 1000);
        EXPECT_EQ (r.TotalExpense, 200);
        EXPECT_EQ (r.net (), 800);

        EXPECT_EQ (r.Income.size (), 1);
        EXPECT_EQ (r.Income["Salary"].Total, 1000);
        EXPECT_EQ (r.Income["Salary"].Count, 1);

        EXPECT_EQ (r.Expense.size (), 2);
        EXPECT_EQ (r.Expense["Food"].Total, 60);
        EXPECT_EQ (r.Expense["Food"].Count, 2);
        EXPECT_EQ (r.Expense["Bills"].Total, 140);
        EXPECT_EQ (r.Expense["Bills"].Count, 1);

        EXPECT_DOUBLE_EQ (r.income_percentages ()["Salary"], 100);
        EXPECT_DOUBLE_EQ (r.expense_percentages ()["Food"], 30);
        EXPECT_DOUBLE_EQ (r.expense_percentages ()["Bills"], 70);

        // an open end covers everything on that side.
        filtering_context since {};
        since.add (std::make_shared<date_filter> (date_filter::between (*read_date ("2024-02-20"), {})));
        EXPECT_EQ (w.report (since).Count, 3);

        // the other filters narrow a report too.
        february.add (std::make_shared<category_filter> (std::set<std::string> {"Food"}));
        wallet_report food = w.report (february);
        EXPECT_EQ (food.Count, 2);
        EXPECT_EQ (food.TotalIncome, 0);
        EXPECT_EQ (food.TotalExpense, 60);

        // the filters of the wallet's own view are not used.
        w.filters ().add (make_filter (filter_preset::income));
        EXPECT_EQ (w.report ().Count, 7);
    }

    TEST (Wallet, TransferCategoryIsReserved) {
        wallet w {"Cash"};
        EXPECT_THROW (w.add_transaction (10, direction::expense, transfer_category ()), validation_error);
        EXPECT_EQ (w.transaction_count (), 0);

        std::string id = w.add_transaction (10, direction::expense, "Food").ID;
        EXPECT_THROW (w.update_by_id (id, transaction_edit {.Category = transfer_category ()}), validation_error);
        EXPECT_EQ (w.get_by_id (id)->Category, "Food");
        EXPECT_EQ (w.balance (), -10);

        filtering_context transfers {};
        transfers.add (make_filter (filter_preset::transfers));
        EXPECT_TRUE (transfers.apply (w.transactions ()).empty ());
    }

    TEST (Manager, AddWallets) {
        wallet_manager m {};
        EXPECT_EQ (m.current_wallet (), nullptr);
        EXPECT_EQ (m.wallet_count (), 0);

        wallet &cash = m.create_wallet (wallet_options {.Name = "Cash"});
        EXPECT_EQ (m.current_wallet (), &cash);
        EXPECT_NE (cash.id (), 0);

        wallet &bank = m.add_wallet (std::make_unique<wallet> ("Bank", "EUR", "checking account"));
        EXPECT_EQ (m.current_wallet (), &cash);
        EXPECT_NE (bank.id (), cash.id ());
        EXPECT_EQ (m.find (bank.id ()), &bank);
        EXPECT_EQ (m.find (12345), nullptr);

        EXPECT_EQ (m.get_wallet ("bank"), &bank);
        EXPECT_EQ (m.get_wallet ("CASH"), &cash);
        EXPECT_EQ (m.get_wallet ("Savings"), nullptr);

        EXPECT_THROW (m.create_wallet (wallet_options {.Name = "cash"}), validation_error);
        EXPECT_THROW (m.create_wallet (wallet_options {.Name = ""}), validation_error);
        EXPECT_THROW (m.create_wallet (wallet_options {.Name = "Savings", .InterestRate = 5}), validation_error);
        EXPECT_THROW (m.create_wallet (wallet_options {.Name = "Savings", .Deposit = true, .TermMonths = 12}), validation_error);
        EXPECT_THROW (m.create_wallet (wallet_options {.Name = "Savings", .Deposit = true, .InterestRate = 5}), validation_error);
        EXPECT_THROW (m.create_wallet (wallet_options {.Name = "Savings", .Deposit = true, .InterestRate = 101, .TermMonths = 12}), validation_error);
        EXPECT_EQ (m.wallet_count (), 2);

        wallet &savings = m.create_wallet (wallet_options {.Name = "Savings", .Deposit = true, .InterestRate = 5, .TermMonths = 12});
        EXPECT_TRUE (savings.is_deposit ());
        EXPECT_EQ (m.wallet_count (), 3);

        std::vector<std::string> names;
        for (const wallet *w : m.wallets ()) names.push_back (w->name ());
        EXPECT_EQ (names, (std::vector<std::string> {"Bank", "Cash", "Savings"}));
    }

    TEST (Manager, StartingBalance) {
        wallet_manager m {};

        wallet &a = m.create_wallet (wallet_options {.Name = "A", .StartingValue = 250});
        ASSERT_EQ (a.transaction_count (), 1);
        const transaction *t = a.get_by_position (1);
        EXPECT_EQ (t->Category, ledger_options::StartingBalanceCategory);
        EXPECT_EQ (t->Direction, direction::income);
        EXPECT_EQ (t->Amount, 250);
        EXPECT_EQ (a.balance (), 250);
        EXPECT_TRUE (m.categories ().contains (ledger_options::StartingBalanceCategory, direction::income));

        wallet &b = m.create_wallet (wallet_options {.Name = "B", .StartingValue = -40});
        ASSERT_EQ (b.transaction_count (), 1);
        EXPECT_EQ (b.get_by_position (1)->Direction, direction::expense);
        EXPECT_EQ (b.balance (), -40);

        wallet &c = m.create_wallet (wallet_options {.Name = "C", .StartingValue = 0});
        EXPECT_EQ (c.transaction_count (), 0);
    }

    TEST (Manager, CategoriesAreShared) {
        wallet_manager m {};
        wallet &a = m.create_wallet (wallet_options {.Name = "A"});

        a.add_transaction (10, direction::expense, "Books");
        EXPECT_TRUE (m.categories ().contains ("Books", direction::expense));
        EXPECT_FALSE (m.categories ().contains ("Books", direction::income));

        // categories of a wallet that is added later are registered too.
        auto b = std::make_unique<wallet> ("B");
        b->add_transaction (10, direction::income, "Royalties");
        EXPECT_FALSE (m.categories ().contains ("Royalties", direction::income));
        m.add_wallet (std::move (b));
        EXPECT_TRUE (m.categories ().contains ("Royalties", direction::income));

        EXPECT_TRUE (a.update_by_position (1, transaction_edit {.Category = "Magazines"}));
        EXPECT_TRUE (m.categories ().contains ("Magazines", direction::expense));
    }

    TEST (Manager, Transfer) {
        wallet_manager m {};
        wallet &a = m.create_wallet (wallet_options {.Name = "A", .StartingValue = 500});
        wallet &b = m.create_wallet (wallet_options {.Name = "B"});

        timestamp when = at ("2024-06-01 12:00:00");
        ASSERT_TRUE (m.transfer ("a", "B", 200, "savings", when));

        EXPECT_EQ (a.balance (), 300);
        EXPECT_EQ (b.balance (), 200);
        EXPECT_EQ (a.transaction_count (), 2);
        EXPECT_EQ (b.transaction_count (), 1);

        const transfer *out = only_transfer (a);
        const transfer *in = only_transfer (b);
        ASSERT_NE (out, nullptr);
        ASSERT_NE (in, nullptr);

        EXPECT_EQ (out->Direction, direction::expense);
        EXPECT_EQ (in->Direction, direction::income);
        EXPECT_EQ (out->Category, transfer_category ());
        EXPECT_EQ (in->Category, transfer_category ());
        EXPECT_EQ (out->Description, "savings");
        EXPECT_EQ (in->Created, when);
        EXPECT_EQ (out->SourceWallet, a.id ());
        EXPECT_EQ (in->SourceWallet, b.id ());
        EXPECT_EQ (*out->Connected, in->link ());
        EXPECT_EQ (*in->Connected, out->link ());

        EXPECT_TRUE (m.categories ().contains (transfer_category (), direction::income));
        EXPECT_TRUE (m.categories ().contains (transfer_category (), direction::expense));
    }

    TEST (Manager, InvalidTransfer) {
        wallet_manager m {};
        wallet &a = m.create_wallet (wallet_options {.Name = "A", .StartingValue = 500});
        wallet &b = m.create_wallet (wallet_options {.Name = "B"});

        EXPECT_FALSE (m.transfer ("A", "A", 100));
        EXPECT_FALSE (m.transfer ("A", "a", 100));
        EXPECT_FALSE (m.transfer ("A", "C", 100));
        EXPECT_FALSE (m.transfer ("C", "B", 100));
        EXPECT_FALSE (m.transfer ("A", "B", 0));
        EXPECT_FALSE (m.transfer ("A", "B", -10));
        EXPECT_FALSE (m.transfer ("A", "B", std::nan ("")));

        EXPECT_EQ (a.transaction_count (), 1);
        EXPECT_EQ (b.transaction_count (), 0);
        EXPECT_EQ (a.balance (), 500);
        EXPECT_EQ (b.balance (), 0);
    }

    TEST (Manager, TransferRollback) {
        wallet_manager m {};
        wallet &a = m.create_wallet (wallet_options {.Name = "A", .StartingValue = 500});
        wallet &b = m.create_wallet (wallet_options {.Name = "B"});

        timestamp when = at ("2024-06-01 12:00:00");
        b.add_transaction (std::make_unique<transaction> ("0000beef", 40, direction::income, "Gift", "", when));

        std::vector<const transaction *> a_before = a.transactions ();
        std::vector<const transaction *> b_before = b.transactions ();

        // the incoming side reuses an id that B already has.
        EXPECT_THROW (m.transfer (
            std::make_unique<transfer> ("0000aaaa", a.id (), 25, direction::expense, "rent", when),
            std::make_unique<transfer> ("0000beef", b.id (), 25, direction::income, "rent", when)), validation_error);

        EXPECT_EQ (a.transactions (), a_before);
        EXPECT_EQ (b.transactions (), b_before);
        EXPECT_EQ (a.get_by_id ("0000aaaa"), nullptr);
        EXPECT_EQ (a.balance (), 500);
        EXPECT_EQ (a.total_expense (), 0);
        EXPECT_EQ (b.balance (), 40);
        EXPECT_EQ (b.get_by_id ("0000beef")->Category, "Gift");
        expect_consistent (a);
        expect_consistent (b);

        // the same pair goes through once the id is free.
        ASSERT_TRUE (b.delete_by_id ("0000beef"));
        m.transfer (
            std::make_unique<transfer> ("0000aaaa", a.id (), 25, direction::expense, "rent", when),
            std::make_unique<transfer> ("0000beef", b.id (), 25, direction::income, "rent", when));
        EXPECT_EQ (a.balance (), 475);
        EXPECT_EQ (b.balance (), 25);
        EXPECT_EQ (*only_transfer (a)->Connected, only_transfer (b)->link ());
    }

    TEST (Manager, MismatchedTransferSides) {
        wallet_manager m {};
        wallet &a = m.create_wallet (wallet_options {.Name = "A", .StartingValue = 500});
        wallet &b = m.create_wallet (wallet_options {.Name = "B"});
        timestamp when = at ("2024-06-01 12:00:00");

        EXPECT_THROW (m.transfer (
            std::make_unique<transfer> (a.id (), 25, direction::expense, "", when),
            std::make_unique<transfer> (b.id (), 30, direction::income, "", when)), validation_error);

        EXPECT_THROW (m.transfer (
            std::make_unique<transfer> (a.id (), 25, direction::income, "", when),
            std::make_unique<transfer> (b.id (), 25, direction::expense, "", when)), validation_error);

        EXPECT_THROW (m.transfer (
            std::make_unique<transfer> (a.id (), 25, direction::expense, "", when),
            std::make_unique<transfer> (a.id (), 25, direction::income, "", when)), validation_error);

        EXPECT_THROW (m.transfer (
            std::make_unique<transfer> (a.id (), 25, direction::expense, "", when),
            std::make_unique<transfer> (99, 25, direction::income, "", when)), validation_error);

        EXPECT_EQ (a.transaction_count (), 1);
        EXPECT_EQ (b.transaction_count (), 0);
    }

    TEST (Manager, EditTransfer) {
        wallet_manager m {};
        wallet &a = m.create_wallet (wallet_options {.Name = "A", .StartingValue = 500});
        wallet &b = m.create_wallet (wallet_options {.Name = "B", .StartingValue = 100});
        ASSERT_TRUE (m.transfer ("A", "B", 200));

        std::string out = only_transfer (a)->ID;
        std::string in = only_transfer (b)->ID;

        timestamp when = at ("2024-07-01 09:30:00");
        EXPECT_TRUE (a.update_by_id (out, transaction_edit {.Amount = 250, .Description = "more", .Created = when}));

        EXPECT_EQ (a.balance (), 250);
        EXPECT_EQ (b.balance (), 350);
        EXPECT_EQ (b.get_by_id (in)->Amount, 250);
        EXPECT_EQ (b.get_by_id (in)->Description, "more");
        EXPECT_EQ (b.get_by_id (in)->Created, when);
        expect_consistent (a);
        expect_consistent (b);

        // editing from the other side works the same way.
        EXPECT_TRUE (b.update_by_id (in, transaction_edit {.Amount = 50}));
        EXPECT_EQ (a.balance (), 450);
        EXPECT_EQ (b.balance (), 150);

        EXPECT_THROW (a.update_by_id (out, transaction_edit {.Category = "Food"}), validation_error);
        EXPECT_THROW (b.update_by_id (in, transaction_edit {.Direction = direction::expense}), validation_error);
        EXPECT_THROW (a.update_by_id (out, transaction_edit {.Amount = -50}), validation_error);

        EXPECT_EQ (a.balance (), 450);
        EXPECT_EQ (b.balance (), 150);
        EXPECT_EQ (a.get_by_id (out)->Amount, 50);
        expect_consistent (a);
        expect_consistent (b);
    }

    TEST (Manager, DeleteTransfer) {
        wallet_manager m {};
        wallet &a = m.create_wallet (wallet_options {.Name = "A", .StartingValue = 500});
        wallet &b = m.create_wallet (wallet_options {.Name = "B"});
        ASSERT_TRUE (m.transfer ("A", "B", 200));

        std::string out = only_transfer (a)->ID;
        std::string in = only_transfer (b)->ID;

        EXPECT_TRUE (b.delete_by_id (in));

        EXPECT_EQ (a.get_by_id (out), nullptr);
        EXPECT_EQ (b.get_by_id (in), nullptr);
        EXPECT_EQ (a.transaction_count (), 1);
        EXPECT_EQ (b.transaction_count (), 0);
        EXPECT_EQ (a.balance (), 500);
        EXPECT_EQ (b.balance (), 0);
        expect_consistent (a);
        expect_consistent (b);
    }

    TEST (Manager, OrphanedTransfer) {
        wallet_manager m {};
        wallet &a = m.create_wallet (wallet_options {.Name = "A"});

        // a transfer that points at a wallet that does not exist.
        auto t = std::make_unique<transfer> (a.id (), 20, direction::expense);
        t->Connected = transfer_link {999, "00000000"};
        std::string id = a.add_transaction (std::move (t)).ID;

        EXPECT_THROW (a.update_by_id (id, transaction_edit {.Amount = 10}), invariant_violation);
        EXPECT_THROW (a.delete_by_id (id), invariant_violation);

        // nothing was changed.
        EXPECT_EQ (a.get_by_id (id)->Amount, 20);
        EXPECT_EQ (a.balance (), -20);
    }

    TEST (Manager, RemoveWallet) {
        wallet_manager m {};
        wallet &a = m.create_wallet (wallet_options {.Name = "A", .StartingValue = 500});
        wallet &b = m.create_wallet (wallet_options {.Name = "B", .StartingValue = 100});
        wallet &c = m.create_wallet (wallet_options {.Name = "C"});

        ASSERT_TRUE (m.transfer ("A", "B", 200));
        ASSERT_TRUE (m.transfer ("C", "A", 30));
        ASSERT_TRUE (m.transfer ("A", "C", 70));
        EXPECT_EQ (a.balance (), 260);

        EXPECT_FALSE (m.remove_wallet ("D"));
        EXPECT_TRUE (m.remove_wallet ("a"));

        EXPECT_EQ (m.wallet_count (), 2);
        EXPECT_EQ (m.get_wallet ("A"), nullptr);

        EXPECT_EQ (b.transaction_count (), 1);
        EXPECT_EQ (b.balance (), 100);
        EXPECT_EQ (c.transaction_count (), 0);
        EXPECT_EQ (c.balance (), 0);
        expect_consistent (b);
        expect_consistent (c);

        // the current wallet was removed, so the first remaining one is chosen.
        EXPECT_EQ (m.current_wallet (), &b);

        EXPECT_TRUE (m.switch_wallet ("c"));
        EXPECT_EQ (m.current_wallet (), &c);
        EXPECT_FALSE (m.switch_wallet ("A"));
        EXPECT_EQ (m.current_wallet (), &c);

        EXPECT_TRUE (m.remove_wallet ("C"));
        EXPECT_EQ (m.current_wallet (), &b);
        EXPECT_TRUE (m.remove_wallet ("B"));
        EXPECT_EQ (m.current_wallet (), nullptr);
    }

    TEST (Manager, UpdateWallet) {
        wallet_manager m {};
        wallet &a = m.create_wallet (wallet_options {.Name = "Cash"});
        m.create_wallet (wallet_options {.Name = "Bank"});
        m.create_wallet (wallet_options {.Name = "Savings", .Deposit = true, .InterestRate = 3, .TermMonths = 6});

        EXPECT_FALSE (m.update_wallet ("Purse", wallet_update {.Currency = "EUR"}));

        EXPECT_THROW (m.update_wallet ("Cash", wallet_update {.Name = "BANK"}), validation_error);
        EXPECT_THROW (m.update_wallet ("Cash", wallet_update {.Name = ""}), validation_error);
        EXPECT_THROW (m.update_wallet ("Cash", wallet_update {.InterestRate = 2}), validation_error);
        EXPECT_EQ (a.name (), "Cash");

        EXPECT_TRUE (m.update_wallet ("cash", wallet_update {.Name = "Wallet", .Currency = "EUR", .Description = "pocket money"}));
        EXPECT_EQ (m.get_wallet ("Cash"), nullptr);
        EXPECT_EQ (m.get_wallet ("wallet"), &a);
        EXPECT_EQ (a.name (), "Wallet");
        EXPECT_EQ (a.currency (), "EUR");
        EXPECT_EQ (a.description (), "pocket money");

        // changing only the case of the name is allowed.
        EXPECT_TRUE (m.update_wallet ("wallet", wallet_update {.Name = "WALLET"}));
        EXPECT_EQ (a.name (), "WALLET");

        EXPECT_TRUE (m.update_wallet ("Savings", wallet_update {.InterestRate = 4.5}));
        EXPECT_EQ (dynamic_cast<const deposit_wallet *> (m.get_wallet ("Savings"))->interest_rate (), 4.5);
        EXPECT_THROW (m.update_wallet ("Savings", wallet_update {.InterestRate = -1}), validation_error);
    }

    TEST (Manager, SortedWallets) {
        wallet_manager m {};
        m.create_wallet (wallet_options {.Name = "b", .StartingValue = 10});
        m.create_wallet (wallet_options {.Name = "A", .StartingValue = 20});
        m.create_wallet (wallet_options {.Name = "c", .StartingValue = 30});

        auto names = [&m] () -> std::vector<std::string> {
            std::vector<std::string> x;
            for (const wallet *w : m.sorted_wallets ()) x.push_back (w->name ());
            return x;
        };

        EXPECT_EQ (names (), (std::vector<std::string> {"c", "A", "b"}));
        EXPECT_TRUE (m.sorting ().set_strategy ("2"));
        EXPECT_EQ (names (), (std::vector<std::string> {"A", "b", "c"}));
        EXPECT_FALSE (m.sorting ().set_strategy ("9"));
        EXPECT_EQ (names (), (std::vector<std::string> {"A", "b", "c"}));
    }

}
