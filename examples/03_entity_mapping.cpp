/**
 * @file 03_entity_mapping.cpp
 * @brief Rows to structs and back
 *
 * Demonstrates:
 * - EntityDescriptor specialization for a plain struct
 * - Generated INSERT from an entity, SELECT ... as<T>()
 * - A hand-written EntityMapper and a raw-row extractor
 * - MappingFailed for NULL in a non-optional member
 */

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include <rdbcpp/firebird.hpp>

using namespace rdbcpp;

struct LegoSet {
    std::int32_t id = 0;
    std::string name;
    std::optional<std::int32_t> manual;
};

template<>
struct rdbcpp::core::EntityDescriptor<LegoSet> {
    static constexpr bool is_specialized = true;
    static constexpr const char* name = "LEGOSET";

    static constexpr auto fields = std::make_tuple(
        makeField(&LegoSet::id, "ID"),
        makeField(&LegoSet::name, "NAME"),
        makeField(&LegoSet::manual, "MANUAL")
    );
};

struct Manual {
    std::int32_t id = 0;
    std::string author;
    std::int16_t pages = 0;
};

// Column names differ from member names; the mapper is written by hand
class ManualMapper : public EntityMapper<Manual> {
public:
    Manual rowToEntity(const Row& row) const override {
        return Manual{row.get<std::int32_t>("ID"), row.get<std::string>("AUTHOR"), row.get<std::int16_t>("PAGES")};
    }

    ColumnValues entityToColumns(const Manual& manual) const override {
        return {{"ID", Parameter::from(manual.id)},
                {"AUTHOR", Parameter::from(manual.author)},
                {"PAGES", Parameter::from(manual.pages)}};
    }
};

namespace {

void printHeader(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "  " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

void printSet(const LegoSet& set) {
    std::cout << std::setw(8) << set.id << "  " << std::setw(30) << std::left << set.name << std::right
              << "  manual: " << (set.manual ? std::to_string(*set.manual) : std::string("none")) << "\n";
}

void createTables(firebird::FirebirdConnection& admin) {
    for (const char* table : {"LEGO_MANUAL", "LEGOSET"}) {
        try {
            admin.executeDDL(std::string("DROP TABLE ") + table);
        }
        catch (const firebird::FirebirdException&) {
            // first run
        }
    }
    admin.executeDDL("CREATE TABLE LEGOSET (ID INTEGER NOT NULL PRIMARY KEY, NAME VARCHAR(255), MANUAL INTEGER)");
    admin.executeDDL("CREATE TABLE LEGO_MANUAL (ID INTEGER NOT NULL PRIMARY KEY, AUTHOR VARCHAR(255), PAGES SMALLINT)");
}

} // namespace

int main() {
    printHeader("rdbcpp - Entity Mapping");

    try {
        std::string path = util::ConfigLoader::findConfigFile("client_config.json");
        if (!path.empty()) {
            util::Config::load(path);
        }
        util::Logging::initFromConfig();

        auto admin = std::make_shared<firebird::FirebirdConnection>(firebird::ConnectionParams::fromConfig());
        createTables(*admin);

        DatabaseClient client(firebird::FirebirdConnectionProvider::fromConfig());

        printHeader("INSERT from entities");
        std::vector<LegoSet> sets = {
            {10214, "Tower Bridge", 3},
            {8110, "Unimog U400", std::nullopt},
            {42009, "Mobile Crane MK II", 1}};
        for (const auto& set : sets) {
            client.insert().into("LEGOSET").entity(set).then().get();
        }
        std::cout << "✓ " << sets.size() << " sets inserted\n";

        printHeader("SELECT as<LegoSet>()");
        for (const auto& set : client.select().from("LEGOSET").orderBy(asc("NAME")).as<LegoSet>().all().toList()) {
            printSet(set);
        }

        printHeader("Hand-written mapper");
        auto mapper = std::make_shared<const ManualMapper>();
        client.insert().into("LEGO_MANUAL").entity<Manual>(Manual{3, "Jens", 120}, mapper).then().get();
        client.insert().into("LEGO_MANUAL").entity<Manual>(Manual{1, "Astrid", 84}, mapper).then().get();

        auto manuals = client.select().from("LEGO_MANUAL").orderBy(desc("PAGES")).as<Manual>(mapper).all().toList();
        for (const auto& manual : manuals) {
            std::cout << std::setw(4) << manual.id << "  " << manual.author << ", " << manual.pages << " pages\n";
        }

        printHeader("Raw-row extractor");
        auto labels = client.execute()
                          .sql("SELECT s.NAME, m.AUTHOR FROM LEGOSET s JOIN LEGO_MANUAL m ON m.ID = s.MANUAL")
                          .map([](const RawRow& row, const std::vector<ColumnMetadata>& columns) {
                              return columns[0].name + "=" + std::get<std::string>(*row[0]) + ", " +
                                     columns[1].name + "=" + std::get<std::string>(*row[1]);
                          })
                          .all()
                          .toList();
        for (const auto& label : labels) {
            std::cout << label << "\n";
        }

        printHeader("Mapping failure");
        client.execute().sql("UPDATE LEGOSET SET NAME = NULL WHERE ID = 8110").then().get();
        try {
            client.select().from("LEGOSET").orderBy(asc("ID")).as<LegoSet>().all().toList();
        }
        catch (const MappingFailed& e) {
            std::cout << "✗ Row " << e.getRowIndex() << ": " << e.what() << "\n";
        }

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
