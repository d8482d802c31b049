#include "test_base.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

using namespace rdbcpp;
using namespace rdbcpp::core;
using namespace rdbcpp::test;

namespace {

struct LegoSet {
    std::int32_t id = 0;
    std::string name;
    std::optional<std::int32_t> manual;
};

} // namespace

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

class FirebirdClientTest : public PersistentDatabaseTest {
protected:
    void SetUp() override {
        PersistentDatabaseTest::SetUp();
        if (IsSkipped()) {
            return;
        }
        client_ = std::make_unique<TransactionalDatabaseClient>(provider_, clientOptions());
    }

    void TearDown() override {
        client_.reset();
        PersistentDatabaseTest::TearDown();
    }

    std::int64_t countSets() {
        auto count = client_->execute()
                         .sql("SELECT COUNT(*) FROM LEGOSET")
                         .map([](const RawRow& row, const std::vector<ColumnMetadata>&) {
                             return std::get<std::int64_t>(*row[0]);
                         })
                         .one()
                         .get();
        return count.value_or(-1);
    }

    void insertSets(int count) {
        for (int id = 1; id <= count; ++id) {
            client_->insert().into("LEGOSET").value("ID", id).value("NAME", "Set " + std::to_string(id)).then().get();
        }
    }

    std::unique_ptr<TransactionalDatabaseClient> client_;
};

TEST_F(FirebirdClientTest, SelectOrderedDescending) {
    client_->insert().into("legoset").value("id", 1).value("name", "A").then().get();
    client_->insert().into("legoset").value("id", 2).value("name", "B").then().get();

    auto rows = client_->select().from("legoset").orderBy(desc("id")).fetch().all().toList();

    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].get<int>("id"), 2);
    EXPECT_EQ(rows[0].get<std::string>("name"), "B");
    EXPECT_EQ(rows[1].get<int>("id"), 1);
    EXPECT_EQ(rows[1].get<std::string>("name"), "A");
    EXPECT_EQ(provider_->getStatistics().leased, 0u);
}

TEST_F(FirebirdClientTest, NamedBindingsAndRowsUpdated) {
    auto inserted = client_->execute()
                        .sql("INSERT INTO LEGOSET (ID, NAME, MANUAL) VALUES (:id, :name, :manual)")
                        .bind("id", 42)
                        .bind("name", "SCHAUFELRADBAGGER")
                        .bindNull("manual", SqlType::Integer)
                        .fetch()
                        .rowsUpdated()
                        .get();
    EXPECT_EQ(inserted, 1u);

    auto row = client_->execute().sql("SELECT * FROM LEGOSET WHERE ID = :id").bind("id", 42).fetch().one().get();
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->get<std::string>("NAME"), "SCHAUFELRADBAGGER");
    EXPECT_TRUE(row->isNull("MANUAL"));
}

TEST_F(FirebirdClientTest, UpdateCountsMatchedRows) {
    insertSets(4);
    auto updated = client_->execute()
                       .sql("UPDATE LEGOSET SET MANUAL = :manual WHERE ID > :id")
                       .bind("manual", 7)
                       .bind("id", 1)
                       .fetch()
                       .rowsUpdated()
                       .get();
    EXPECT_EQ(updated, 3u);
}

TEST_F(FirebirdClientTest, EntityRoundTrip) {
    client_->insert().into("LEGOSET").entity(LegoSet{7, "Tower Bridge", 10214}).then().get();
    client_->insert().into("LEGOSET").entity(LegoSet{8, "Unimog", std::nullopt}).then().get();

    auto sets = client_->select().from("LEGOSET").orderBy(asc("ID")).as<LegoSet>().all().toList();

    ASSERT_EQ(sets.size(), 2u);
    EXPECT_EQ(sets[0].name, "Tower Bridge");
    EXPECT_EQ(sets[0].manual, std::optional<std::int32_t>(10214));
    EXPECT_FALSE(sets[1].manual.has_value());
}

TEST_F(FirebirdClientTest, CriteriaAndPaging) {
    insertSets(6);
    client_->execute().sql("UPDATE LEGOSET SET MANUAL = 1 WHERE ID IN (2, 4)").then().get();

    auto paged = client_->select()
                     .from("LEGOSET")
                     .project({"ID"})
                     .orderBy(asc("ID"))
                     .page(2, 3)
                     .map([](const RawRow& row, const std::vector<ColumnMetadata>&) {
                         return std::get<std::int32_t>(*row[0]);
                     })
                     .all()
                     .toList();
    EXPECT_EQ(paged, (std::vector<std::int32_t>{3, 4, 5}));

    auto matched = client_->select()
                       .from("LEGOSET")
                       .matching(Criteria::where("ID").in({1, 2, 3}).andWhere("MANUAL").isNull())
                       .fetch()
                       .all()
                       .toList();
    ASSERT_EQ(matched.size(), 2u);

    auto named = client_->select()
                     .from("LEGOSET")
                     .matching(Criteria::where("NAME").like("Set 5%"))
                     .fetch()
                     .first()
                     .get();
    ASSERT_TRUE(named.has_value());
    EXPECT_EQ(named->get<int>("ID"), 5);
}

TEST_F(FirebirdClientTest, EarlyCancellationReleasesConnection) {
    insertSets(5);

    auto firstTwo = client_->select().from("LEGOSET").orderBy(asc("ID")).fetch().all().take(2).toList();
    EXPECT_EQ(firstTwo.size(), 2u);
    EXPECT_EQ(provider_->getStatistics().leased, 0u);
    EXPECT_EQ(countSets(), 5);
}

TEST_F(FirebirdClientTest, StatementErrorSurfacesAtConsumption) {
    auto pending = client_->execute().sql("SELECT * FROM NO_SUCH_TABLE").fetch().all();

    try {
        pending.toList();
        FAIL() << "Expected ExecutionFailed";
    }
    catch (const ExecutionFailed& e) {
        EXPECT_NE(e.getErrorCode(), 0);
        EXPECT_FALSE(e.getSQLState().empty());
    }
    EXPECT_EQ(provider_->getStatistics().leased, 0u);
}

TEST_F(FirebirdClientTest, InTransactionCommits) {
    auto inserted = client_->inTransaction([](DatabaseClient& db) {
        return db.insert().into("LEGOSET").value("ID", 1).value("NAME", "A").fetch().rowsUpdated()
            .flatMap([&db](std::uint64_t) {
                return db.insert().into("LEGOSET").value("ID", 2).value("NAME", "B").fetch().rowsUpdated();
            });
    });

    EXPECT_EQ(inserted.get(), 1u);
    EXPECT_EQ(countSets(), 2);
}

TEST_F(FirebirdClientTest, InTransactionRollsBackOnFailure) {
    auto work = client_->inTransaction([](DatabaseClient& db) {
        return db.insert().into("LEGOSET").value("ID", 1).value("NAME", "A").fetch().rowsUpdated()
            .flatMap([&db](std::uint64_t) {
                // Duplicate primary key
                return db.insert().into("LEGOSET").value("ID", 1).value("NAME", "again").fetch().rowsUpdated();
            });
    });

    EXPECT_THROW(work.get(), ExecutionFailed);
    EXPECT_EQ(countSets(), 0);
    EXPECT_EQ(provider_->getStatistics().leased, 0u);
}

TEST_F(FirebirdClientTest, ApplicationControlledTransaction) {
    auto scope = client_->enableTransactionSynchronization();

    client_->beginTransaction();
    insertSets(2);
    client_->rollbackTransaction();
    EXPECT_EQ(countSets(), 0);

    client_->beginTransaction();
    insertSets(3);
    // Visible inside the transaction before commit
    EXPECT_EQ(countSets(), 3);
    client_->commitTransaction();

    EXPECT_THROW(client_->commitTransaction(), TransactionInactive);
    EXPECT_EQ(countSets(), 3);
}

TEST_F(FirebirdClientTest, ScopeDestructionRollsBack) {
    {
        auto scope = client_->enableTransactionSynchronization();
        client_->beginTransaction();
        insertSets(2);
    }
    EXPECT_EQ(countSets(), 0);
    EXPECT_EQ(provider_->getStatistics().leased, 0u);
}

TEST_F(FirebirdClientTest, BinaryColumnThroughClient) {
    Bytes cover(40000, 0x5A);
    client_->insert()
        .into("LEGO_MANUAL")
        .value("ID", 1)
        .value("AUTHOR", "Jens")
        .value("COVER", cover)
        .then()
        .get();

    auto row = client_->select().from("LEGO_MANUAL").fetch().one().get();
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->get<Bytes>("COVER"), cover);
    EXPECT_TRUE(row->isNull("PUBLISHED"));
}
