/**
 * @file 01_basic_operations.cpp
 * @brief Basic statements through DatabaseClient
 *
 * Demonstrates:
 * - Loading client_config.json and logging setup
 * - Raw SQL with named parameters and typed NULLs
 * - Generated INSERT and SELECT with criteria, ordering and paging
 * - Rows as JSON, rowsUpdated counts
 */

#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

#include <rdbcpp/firebird.hpp>

namespace {

void printHeader(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "  " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

void printInfo(const std::string& label, const std::string& value) {
    std::cout << std::setw(20) << std::left << label << ": " << value << "\n";
}

void loadConfiguration() {
    std::string path = util::ConfigLoader::findConfigFile("client_config.json");
    if (path.empty() || !util::Config::load(path)) {
        std::cout << "client_config.json not found, using defaults and RDBCPP_* environment\n";
    }
    util::Logging::initFromConfig();
}

void prepareSchema(const rdbcpp::firebird::ConnectionParams& params) {
    auto admin = std::make_shared<rdbcpp::firebird::FirebirdConnection>(params);
    try {
        admin->executeDDL("DROP TABLE LEGOSET");
    }
    catch (const rdbcpp::firebird::FirebirdException&) {
        // first run
    }
    admin->executeDDL(
        "CREATE TABLE LEGOSET ("
        "  ID INTEGER NOT NULL PRIMARY KEY,"
        "  NAME VARCHAR(255),"
        "  MANUAL INTEGER"
        ")");
}

} // namespace

int main() {
    using namespace rdbcpp;

    printHeader("rdbcpp - Basic Operations");

    try {
        loadConfiguration();

        auto params = firebird::ConnectionParams::fromConfig();
        printInfo("Database", params.database);
        printInfo("Username", params.user);
        printInfo("Charset", params.charset);

        prepareSchema(params);
        std::cout << "✓ Table LEGOSET created\n";

        DatabaseClient client(firebird::FirebirdConnectionProvider::fromConfig());
        printInfo("Dialect", client.getDialect().getName());

        // Raw SQL, named parameters
        printHeader("INSERT with named parameters");
        auto inserted = client.execute()
                            .sql("INSERT INTO LEGOSET (ID, NAME, MANUAL) VALUES (:id, :name, :manual)")
                            .bind("id", 42)
                            .bind("name", "SCHAUFELRADBAGGER")
                            .bindNull("manual", SqlType::Integer)
                            .fetch()
                            .rowsUpdated();
        // Nothing has been sent yet
        std::cout << "Rows inserted: " << inserted.get() << "\n";

        // Generated INSERT
        client.insert().into("LEGOSET").value("ID", 10179).value("NAME", "Millennium Falcon").value("MANUAL", 1).then().get();
        client.insert().into("LEGOSET").value("ID", 75192).value("NAME", "Millennium Falcon UCS").then().get();
        client.insert().into("LEGOSET").value("ID", 21318).value("NAME", "Tree House").then().get();
        std::cout << "✓ Three more sets inserted\n";

        printHeader("SELECT ordered by ID descending");
        for (const auto& row : client.select().from("LEGOSET").orderBy(desc("ID")).fetch().all().toList()) {
            std::cout << row.toJson().dump() << "\n";
        }

        printHeader("SELECT with criteria and paging");
        auto falcons = client.select()
                           .from("LEGOSET")
                           .project({"ID", "NAME"})
                           .matching(Criteria::where("NAME").like("Millennium%").andWhere("ID").greaterThan(10000))
                           .orderBy(asc("ID"))
                           .page(0, 10)
                           .fetch()
                           .all();
        // Rows are pulled from the cursor one at a time
        auto subscription = falcons.subscribe();
        for (const auto& row : subscription) {
            std::cout << std::setw(8) << row.get<int>("ID") << "  " << row.get<std::string>("NAME") << "\n";
        }

        printHeader("UPDATE");
        auto updated = client.execute()
                           .sql("UPDATE LEGOSET SET MANUAL = :manual WHERE MANUAL IS NULL")
                           .bind("manual", 0)
                           .fetch()
                           .rowsUpdated()
                           .get();
        std::cout << "Rows updated: " << updated << "\n";

        printHeader("Single row and first row");
        auto one = client.execute().sql("SELECT * FROM LEGOSET WHERE ID = :id").bind("id", 42).fetch().one().get();
        if (one) {
            std::cout << "one():   " << one->toString() << "\n";
        }
        auto first = client.select().from("LEGOSET").orderBy(asc("NAME")).fetch().first().get();
        if (first) {
            std::cout << "first(): " << first->toString() << "\n";
        }

        try {
            client.select().from("LEGOSET").fetch().one().get();
        }
        catch (const IncorrectResultSize& e) {
            std::cout << "one() over several rows: " << e.what() << "\n";
        }

        printHeader("DELETE");
        auto deleted = client.execute().sql("DELETE FROM LEGOSET WHERE ID < :id").bind("id", 100).fetch().rowsUpdated().get();
        std::cout << "Rows deleted: " << deleted << "\n";

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
