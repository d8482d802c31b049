#include <gtest/gtest.h>
#include "fake_driver.hpp"
#include "rdbcpp/core/database_client.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

using namespace rdbcpp::core;
using namespace rdbcpp::test;

namespace {

struct Minifig {
    std::int32_t id = 0;
    std::string name;
    std::optional<std::int32_t> setId;
};

} // namespace

template<>
struct rdbcpp::core::EntityDescriptor<Minifig> {
    static constexpr bool is_specialized = true;
    static constexpr const char* name = "MINIFIG";

    static constexpr auto fields = std::make_tuple(
        makeField(&Minifig::id, "ID"),
        makeField(&Minifig::name, "NAME"),
        makeField(&Minifig::setId, "SET_ID")
    );
};

class DatabaseClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        provider_ = std::make_shared<FakeConnectionProvider>();
        client_ = std::make_unique<DatabaseClient>(provider_, options("firebird"));
    }

    static ClientOptions options(const std::string& dialect) {
        ClientOptions options;
        options.dialect = dialect;
        return options;
    }

    void scriptLegoset(const std::string& sql) {
        ScriptedResult result;
        result.columns = makeColumns({{"ID", SqlType::Integer}, {"NAME", SqlType::Text}});
        result.rows = {
            {Value{std::int32_t{2}}, Value{std::string("B")}},
            {Value{std::int32_t{1}}, Value{std::string("A")}}};
        provider_->script(sql, result);
    }

    std::shared_ptr<FakeConnectionProvider> provider_;
    std::unique_ptr<DatabaseClient> client_;
};

TEST_F(DatabaseClientTest, SelectOrderedDescending) {
    scriptLegoset("SELECT * FROM legoset ORDER BY id DESC");

    auto rows = client_->select().from("legoset").orderBy(desc("id")).fetch().all().toList();

    EXPECT_EQ(provider_->lastStatement().sql, "SELECT * FROM legoset ORDER BY id DESC");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].get<int>("id"), 2);
    EXPECT_EQ(rows[0].get<std::string>("name"), "B");
    EXPECT_EQ(rows[1].get<int>("id"), 1);
    EXPECT_EQ(rows[1].get<std::string>("name"), "A");
}

TEST_F(DatabaseClientTest, InsertRowsUpdated) {
    ScriptedResult inserted;
    inserted.affectedRows = 1;
    provider_->script("INSERT INTO t(a) VALUES($1)", inserted);

    auto count = client_->execute().sql("INSERT INTO t(a) VALUES($1)").bind("$1", 5).fetch().rowsUpdated();
    EXPECT_EQ(count.get(), 1u);

    auto statement = provider_->lastStatement();
    EXPECT_EQ(statement.sql, "INSERT INTO t(a) VALUES($1)");
    ASSERT_EQ(statement.bindings.size(), 1u);
    EXPECT_EQ(std::get<std::string>(statement.bindings[0].placeholder), "$1");
    EXPECT_EQ(statement.bindings[0].parameter, Parameter::from(5));
}

TEST_F(DatabaseClientTest, RowsUpdatedReportsDriverCount) {
    ScriptedResult updated;
    updated.affectedRows = 17;
    provider_->script("UPDATE legoset SET name = :name WHERE id > :id", updated);

    auto count = client_->execute()
                     .sql("UPDATE legoset SET name = :name WHERE id > :id")
                     .bind("name", "renamed")
                     .bind("id", 3)
                     .fetch()
                     .rowsUpdated()
                     .get();
    EXPECT_EQ(count, 17u);
}

TEST_F(DatabaseClientTest, BindLastWriteWins) {
    client_->execute().sql("DELETE FROM legoset WHERE id = :id").bind("id", 1).bind(":ID", 2).then().get();

    auto statement = provider_->lastStatement();
    ASSERT_EQ(statement.bindings.size(), 1u);
    EXPECT_EQ(statement.bindings[0].parameter, Parameter::from(2));
}

TEST_F(DatabaseClientTest, UnboundPlaceholderFailsAtBuild) {
    auto spec = client_->execute().sql("SELECT * FROM legoset WHERE id = :id AND name = :name").bind("id", 1);

    EXPECT_THROW(spec.fetch(), InvalidSpecification);
    EXPECT_EQ(provider_->executedCount(), 0u);
}

TEST_F(DatabaseClientTest, MixedAddressingFails) {
    auto spec = client_->execute().sql("SELECT * FROM legoset WHERE id = ?").bind(size_t{0}, 1);
    EXPECT_THROW(spec.bind("id", 1), InvalidSpecification);
}

TEST_F(DatabaseClientTest, TypedNullIsTransmitted) {
    client_->execute()
        .sql("UPDATE legoset SET manual = :manual WHERE id = :id")
        .bindNull("manual", SqlType::BigInt)
        .bind("id", std::optional<std::int32_t>{})
        .then()
        .get();

    auto statement = provider_->lastStatement();
    ASSERT_EQ(statement.bindings.size(), 2u);
    EXPECT_TRUE(statement.bindings[0].parameter.isNull());
    EXPECT_EQ(statement.bindings[0].parameter.getType(), SqlType::BigInt);
    EXPECT_TRUE(statement.bindings[1].parameter.isNull());
    EXPECT_EQ(statement.bindings[1].parameter.getType(), SqlType::Integer);
}

TEST_F(DatabaseClientTest, BuildersAreImmutable) {
    auto base = client_->select().from("legoset");
    auto filtered = base.matching(Criteria::where("id").greaterThan(1));

    EXPECT_EQ(base.toSpec().render(client_->getDialect()).sql, "SELECT * FROM legoset");
    EXPECT_EQ(filtered.toSpec().render(client_->getDialect()).sql, "SELECT * FROM legoset WHERE id > ?");
}

TEST_F(DatabaseClientTest, SelectWithCriteriaAndPaging) {
    client_->select()
        .from("legoset")
        .project({"id", "name"})
        .matching(Criteria::where("name").like("Star%"))
        .orderBy(asc("name"))
        .orderBy(desc("id"))
        .page(10, 5)
        .fetch()
        .all()
        .toList();

    auto statement = provider_->lastStatement();
    EXPECT_EQ(statement.sql,
              "SELECT id, name FROM legoset WHERE name LIKE ? ORDER BY name ASC, id DESC "
              "OFFSET 10 ROWS FETCH NEXT 5 ROWS ONLY");
    ASSERT_EQ(statement.bindings.size(), 1u);
    EXPECT_EQ(std::get<size_t>(statement.bindings[0].placeholder), 0u);
}

TEST_F(DatabaseClientTest, NegativePagingFails) {
    EXPECT_THROW(client_->select().from("legoset").page(-1, 10), InvalidSpecification);
}

TEST_F(DatabaseClientTest, PostgresDialectMarkers) {
    DatabaseClient pg(provider_, options("postgres"));
    EXPECT_EQ(pg.getDialect().getName(), "postgres");

    pg.insert().into("legoset").value("id", 42).value("name", "X-Wing").then().get();
    EXPECT_EQ(provider_->lastStatement().sql, "INSERT INTO legoset (id, name) VALUES ($1, $2)");
}

TEST_F(DatabaseClientTest, InsertValuesAndNulls) {
    ScriptedResult inserted;
    inserted.affectedRows = 1;
    provider_->script("INSERT INTO legoset (id, name, manual) VALUES (?, ?, ?)", inserted);

    auto count = client_->insert()
                     .into("legoset")
                     .value("id", 42)
                     .value("name", "X-Wing")
                     .nullValue("manual", SqlType::Integer)
                     .fetch()
                     .rowsUpdated()
                     .get();

    EXPECT_EQ(count, 1u);
    auto statement = provider_->lastStatement();
    ASSERT_EQ(statement.bindings.size(), 3u);
    EXPECT_TRUE(statement.bindings[2].parameter.isNull());
    EXPECT_EQ(statement.bindings[2].parameter.getType(), SqlType::Integer);
}

TEST_F(DatabaseClientTest, InsertWithoutValuesFails) {
    EXPECT_THROW(client_->insert().into("legoset").fetch(), InvalidSpecification);
    EXPECT_THROW(client_->insert().into("").value("id", 1).fetch(), InvalidSpecification);
}

TEST_F(DatabaseClientTest, InsertEntity) {
    Minifig figure{7, "Luke", 42};
    client_->insert().into("minifig").entity(figure).then().get();

    auto statement = provider_->lastStatement();
    EXPECT_EQ(statement.sql, "INSERT INTO minifig (ID, NAME, SET_ID) VALUES (?, ?, ?)");
    ASSERT_EQ(statement.bindings.size(), 3u);
    EXPECT_EQ(statement.bindings[1].parameter, Parameter::from("Luke"));
}

TEST_F(DatabaseClientTest, SelectAsEntity) {
    ScriptedResult figures;
    figures.columns = makeColumns({{"ID", SqlType::Integer}, {"NAME", SqlType::Text}, {"SET_ID", SqlType::Integer}});
    figures.rows = {
        {Value{std::int32_t{1}}, Value{std::string("Luke")}, Value{std::int32_t{42}}},
        {Value{std::int32_t{2}}, Value{std::string("Leia")}, std::nullopt}};
    provider_->script("SELECT * FROM minifig ORDER BY ID ASC", figures);

    auto result = client_->select().from("minifig").orderBy(asc("ID")).as<Minifig>().all().toList();

    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0].name, "Luke");
    EXPECT_EQ(result[0].setId, std::optional<std::int32_t>(42));
    EXPECT_FALSE(result[1].setId.has_value());
}

TEST_F(DatabaseClientTest, MapExtractor) {
    scriptLegoset("SELECT id, name FROM legoset");

    auto names = client_->execute()
                     .sql("SELECT id, name FROM legoset")
                     .map([](const RawRow& raw, const std::vector<ColumnMetadata>&) {
                         return std::get<std::string>(*raw[1]);
                     })
                     .all()
                     .toList();
    EXPECT_EQ(names, (std::vector<std::string>{"B", "A"}));
}

TEST_F(DatabaseClientTest, OneAndFirst) {
    scriptLegoset("SELECT * FROM legoset");

    EXPECT_THROW(client_->execute().sql("SELECT * FROM legoset").fetch().one().get(), IncorrectResultSize);

    auto first = client_->execute().sql("SELECT * FROM legoset").fetch().first().get();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->get<int>("ID"), 2);
    EXPECT_EQ(provider_->outstanding(), 0);
}

TEST_F(DatabaseClientTest, ExecutionFailureSurfacesAtConsumption) {
    provider_->failOn("DELETE FROM missing", "Table unknown MISSING");

    Single<void> pending = client_->execute().sql("DELETE FROM missing").then();
    EXPECT_EQ(provider_->executedCount(), 0u);

    EXPECT_THROW(pending.get(), ExecutionFailed);
    EXPECT_EQ(provider_->outstanding(), 0);
}

TEST_F(DatabaseClientTest, EachStatementAutoCommits) {
    client_->execute().sql("UPDATE a SET x = 1").then().get();
    client_->execute().sql("UPDATE b SET x = 2").then().get();

    auto executed = provider_->executed();
    ASSERT_EQ(executed.size(), 2u);
    EXPECT_FALSE(executed[0].inTransaction);
    EXPECT_FALSE(executed[1].inTransaction);
    EXPECT_NE(executed[0].connectionId, executed[1].connectionId);
    EXPECT_EQ(provider_->state().begun.load(), 0);
    EXPECT_EQ(provider_->state().autoCommits.load(), 2);
    EXPECT_EQ(provider_->outstanding(), 0);
}

TEST_F(DatabaseClientTest, CursorIsGoneBeforeConnectionReturns) {
    scriptLegoset("SELECT * FROM legoset");

    EXPECT_EQ(client_->select().from("legoset").fetch().all().toList().size(), 2u);
    EXPECT_EQ(client_->select().from("legoset").fetch().all().take(1).toList().size(), 1u);
    {
        auto rows = client_->select().from("legoset").fetch().all().subscribe();
        ASSERT_TRUE(rows.next().has_value());
    }

    EXPECT_EQ(provider_->state().cursorsOpened.load(), 3);
    EXPECT_EQ(provider_->state().cursorsClosed.load(), 3);
    EXPECT_EQ(provider_->state().cursorsOutlivingLease.load(), 0);
    EXPECT_EQ(provider_->outstanding(), 0);
}

TEST_F(DatabaseClientTest, ResultsOutliveClient) {
    scriptLegoset("SELECT * FROM legoset");
    auto stream = client_->select().from("legoset").fetch().all();
    client_.reset();

    EXPECT_EQ(stream.toList().size(), 2u);
}

TEST_F(DatabaseClientTest, InvalidConstruction) {
    EXPECT_THROW(DatabaseClient(provider_, options("oracle")), InvalidSpecification);
    EXPECT_THROW(DatabaseClient(nullptr, options("firebird")), InvalidSpecification);
}
