/**
 * @file 02_transactions.cpp
 * @brief Grouped and application-controlled transactions
 *
 * Demonstrates:
 * - inTransaction(): commit on success, rollback on failure
 * - Joining an ambient transaction and Propagation::RequiresNew
 * - enableTransactionSynchronization() with begin/commit/rollback
 */

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <rdbcpp/firebird.hpp>

using namespace rdbcpp;

namespace {

void printHeader(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "  " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

std::int64_t countSets(const DatabaseClient& client) {
    auto count = client.execute()
                     .sql("SELECT COUNT(*) FROM LEGOSET")
                     .map([](const RawRow& row, const std::vector<ColumnMetadata>&) {
                         return std::get<std::int64_t>(*row[0]);
                     })
                     .one()
                     .get();
    return count.value_or(0);
}

Single<std::uint64_t> insertSet(DatabaseClient& db, int id, const std::string& name) {
    return db.execute()
        .sql("INSERT INTO LEGOSET (ID, NAME) VALUES (:id, :name)")
        .bind("id", id)
        .bind("name", name)
        .fetch()
        .rowsUpdated();
}

} // namespace

int main() {
    printHeader("rdbcpp - Transactions");

    try {
        std::string path = util::ConfigLoader::findConfigFile("client_config.json");
        if (!path.empty()) {
            util::Config::load(path);
        }
        util::Logging::initFromConfig();

        auto admin = std::make_shared<firebird::FirebirdConnection>(firebird::ConnectionParams::fromConfig());
        try {
            admin->executeDDL("DROP TABLE LEGOSET");
        }
        catch (const firebird::FirebirdException&) {
            // first run
        }
        admin->executeDDL("CREATE TABLE LEGOSET (ID INTEGER NOT NULL PRIMARY KEY, NAME VARCHAR(255), MANUAL INTEGER)");

        TransactionalDatabaseClient client(firebird::FirebirdConnectionProvider::fromConfig());

        printHeader("inTransaction: commit");
        auto both = client.inTransaction([](DatabaseClient& db) {
            return insertSet(db, 1, "Blacktron").flatMap([&db](std::uint64_t) {
                return insertSet(db, 2, "Space Police");
            });
        });
        std::cout << "Built, not started. Sets: " << countSets(client) << "\n";
        both.get();
        std::cout << "✓ Committed. Sets: " << countSets(client) << "\n";

        printHeader("inTransaction: rollback on failure");
        auto failing = client.inTransaction([](DatabaseClient& db) {
            return insertSet(db, 3, "Ice Planet").flatMap([&db](std::uint64_t) {
                return insertSet(db, 1, "duplicate key");
            });
        });
        try {
            failing.get();
        }
        catch (const ExecutionFailed& e) {
            std::cout << "✗ " << e.what() << "\n";
            std::cout << "  SQLSTATE " << e.getSQLState() << ", error code " << e.getErrorCode() << "\n";
        }
        std::cout << "Rolled back. Sets: " << countSets(client) << "\n";

        printHeader("Application-controlled transaction");
        {
            auto scope = client.enableTransactionSynchronization();

            client.beginTransaction();
            insertSet(client, 10, "Aquazone").get();
            insertSet(client, 11, "Time Cruisers").get();
            std::cout << "Inside the transaction. Sets: " << countSets(client) << "\n";

            // Joins the open transaction instead of starting one
            client.inTransaction([](DatabaseClient& db) { return insertSet(db, 12, "Rock Raiders"); }).get();

            // Runs and commits independently of the open transaction
            TransactionDefinition independent;
            independent.propagation = Propagation::RequiresNew;
            independent.name = "audit";
            client.inTransaction([](DatabaseClient& db) { return insertSet(db, 99, "Audit entry"); },
                                 independent).get();

            client.rollbackTransaction();
            std::cout << "Rolled back. Sets: " << countSets(client) << "\n";

            client.beginTransaction();
            insertSet(client, 20, "Exo-Force").get();
            client.commitTransaction();
            std::cout << "✓ Committed. Sets: " << countSets(client) << "\n";

            try {
                client.commitTransaction();
            }
            catch (const TransactionInactive& e) {
                std::cout << "Second commit: " << e.what() << "\n";
            }

            client.beginTransaction();
            insertSet(client, 30, "left open").get();
            // scope ends here; the open transaction is rolled back
        }
        std::cout << "After scope teardown. Sets: " << countSets(client) << "\n";

        std::cout << "\n✓ Done\n";
        return 0;
    }
    catch (const DatabaseException& e) {
        std::cerr << "\n✗ Database error [" << e.getSQLState() << "]: " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception& e) {
        std::cerr << "\n✗ Error: " << e.what() << "\n";
        return 1;
    }
}
