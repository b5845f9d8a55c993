#include <gtest/gtest.h>

#include "modelbase/core/exceptions.h"
#include "modelbase/model/relationship.h"
#include "common/fake_database_connector.h"
#include "common/test_helpers.h"

namespace {
    /// Participant with nothing but a name and an id.
    class Participant final : public mdb::Persistable {
    public:
        Participant(std::string entity, std::string id)
            : m_entity(std::move(entity)), m_id(std::move(id)) {
        }

        [[nodiscard]] std::string name() const override { return m_entity; }
        [[nodiscard]] std::string tableName() const override { return mdb::toLower(m_entity); }
        [[nodiscard]] const mdb::FieldList &fieldDescriptors() const override { return m_fields; }

        [[nodiscard]] mdb::json get(const std::string &field_name) const override {
            return field_name == "id" ? mdb::json(m_id) : mdb::json();
        }

        [[nodiscard]] mdb::Record values() const override { return {{"id", m_id}}; }

    private:
        std::string m_entity, m_id;
        mdb::FieldList m_fields;
    };

    class RelationshipTest : public ::testing::Test {
    protected:
        mdb::Relationship relationship(const std::string &name) {
            return {ctx, engine.relationshipMetadata(name)};
        }

        mdb::MetadataEngine engine{TestHelpers::fixtureConfig()};
        FakeDatabaseConnector db;
        mdb::ModelContext ctx{engine, db, [] { return std::string("u-admin"); }};

        Participant heat{"Movies", "m-1"};
        Participant ronin{"Movies", "m-2"};
        Participant quote{"MovieQuotes", "q-1"};
        Participant other_quote{"MovieQuotes", "q-2"};
        Participant jane{"Users", "u-1"};
        Participant john{"Users", "u-2"};
        Participant profile{"Profiles", "p-1"};
        Participant admin_role{"Roles", "r-1"};
    };
}

TEST_F(RelationshipTest, PersistableView) {
    auto rel = relationship("movies_movie_quotes");

    EXPECT_EQ(rel.name(), "movies_movie_quotes");
    EXPECT_EQ(rel.tableName(), "rel_1_movies_M_moviequotes");
    EXPECT_EQ(rel.type(), mdb::RelationshipType::OneToMany);
    EXPECT_TRUE(rel.hasField("sort_order"));

    EXPECT_TRUE(rel.set("sort_order", 3));
    EXPECT_FALSE(rel.set("no_such_column", 1));
    EXPECT_EQ(rel.get("sort_order"), 3);

    const auto row = rel.values();
    EXPECT_TRUE(row.contains("one_movies_id"));
    EXPECT_FALSE(row.contains("created_by_name"));
    EXPECT_FALSE(row.contains("no_such_column"));

    rel.reset();
    EXPECT_TRUE(rel.get("sort_order").is_null());
}

TEST_F(RelationshipTest, ParticipantsAndKeys) {
    const auto rel = relationship("movies_movie_quotes");

    EXPECT_EQ(rel.modelIdField(heat), "one_movies_id");
    EXPECT_EQ(rel.modelIdField(quote), "many_moviequotes_id");
    EXPECT_EQ(rel.otherModel("Movies"), "MovieQuotes");
    EXPECT_EQ(rel.otherModel("MovieQuotes"), "Movies");
    EXPECT_THROW((void) rel.otherModel("Users"), mdb::SchemaError);
    EXPECT_THROW((void) rel.modelIdField(jane), mdb::SchemaError);
}

TEST_F(RelationshipTest, AddStampsAndRefusesDuplicates) {
    auto rel = relationship("movies_movie_quotes");

    ASSERT_TRUE(rel.add(heat, quote, {{"sort_order", 1}, {"one_movies_id", "m-999"}}));

    const auto rows = db.rows("rel_1_movies_M_moviequotes");
    ASSERT_EQ(rows.size(), 1);
    EXPECT_EQ(rows[0]["one_movies_id"], "m-1");
    EXPECT_EQ(rows[0]["many_moviequotes_id"], "q-1");
    EXPECT_EQ(rows[0]["sort_order"], 1);
    EXPECT_EQ(rows[0]["created_by"], "u-admin");
    EXPECT_EQ(rows[0]["updated_by"], "u-admin");
    EXPECT_TRUE(rows[0]["deleted_at"].is_null());
    EXPECT_EQ(rows[0]["id"].get<std::string>().size(), 36);

    EXPECT_TRUE(rel.has(heat, quote));
    EXPECT_FALSE(rel.has(ronin, quote));

    EXPECT_FALSE(rel.add(heat, quote));
    EXPECT_EQ(db.calls["create"], 1);
}

TEST_F(RelationshipTest, RemoveSoftDeletesThroughUpdate) {
    auto rel = relationship("movies_movie_quotes");
    ASSERT_TRUE(rel.add(heat, quote));
    const auto id = db.rows("rel_1_movies_M_moviequotes")[0]["id"];

    ASSERT_TRUE(rel.remove(heat, quote));
    EXPECT_EQ(db.calls["update"], 1);

    // The removed row is the one now held by the instance
    EXPECT_EQ(rel.get("id"), id);
    EXPECT_EQ(rel.get("deleted_by"), "u-admin");

    const auto rows = db.rows("rel_1_movies_M_moviequotes");
    ASSERT_EQ(rows.size(), 1);
    EXPECT_FALSE(rows[0]["deleted_at"].is_null());
    EXPECT_FALSE(rel.has(heat, quote));

    EXPECT_FALSE(rel.remove(heat, quote));
}

TEST_F(RelationshipTest, OneToOneReplacesPreviousLinks) {
    auto rel = relationship("users_profiles");

    ASSERT_TRUE(rel.add(jane, profile));
    ASSERT_TRUE(rel.add(john, profile));

    EXPECT_EQ(db.calls["bulkSoftDeleteByFieldValue"], 4);
    EXPECT_FALSE(rel.has(jane, profile));
    EXPECT_TRUE(rel.has(john, profile));

    const auto active = rel.relatedRecords(profile);
    ASSERT_EQ(active.size(), 1);
    EXPECT_EQ(active[0]["users_id"], "u-2");
}

TEST_F(RelationshipTest, RelatedRecordsAndPagination) {
    auto rel = relationship("movies_movie_quotes");
    for (int i = 0; i < 5; ++i) {
        const Participant q("MovieQuotes", std::format("q-{}", i));
        ASSERT_TRUE(rel.add(heat, q, {{"sort_order", i}}));
    }
    ASSERT_TRUE(rel.add(ronin, quote));

    EXPECT_EQ(rel.relatedRecords(heat).size(), 5);
    EXPECT_EQ(rel.activeRelatedCount(heat), 5);

    const auto page = rel.relatedPaginated(heat, 2, 2);
    EXPECT_EQ(page["records"].size(), 2);
    EXPECT_EQ(page["records"][0]["sort_order"], 2);
    EXPECT_EQ(page["pagination"]["current_page"], 2);
    EXPECT_EQ(page["pagination"]["per_page"], 2);
    EXPECT_EQ(page["pagination"]["total"], 5);
    EXPECT_EQ(page["pagination"]["total_pages"], 3);
    EXPECT_EQ(page["pagination"]["has_more"], true);

    const auto last = rel.relatedPaginated(heat, 3, 2);
    EXPECT_EQ(last["records"].size(), 1);
    EXPECT_EQ(last["pagination"]["has_more"], false);
}

TEST_F(RelationshipTest, UpdateRelationWritesAdditionalFieldsOnly) {
    auto rel = relationship("movies_movie_quotes");
    ASSERT_TRUE(rel.add(heat, quote, {{"sort_order", 1}}));

    ASSERT_TRUE(rel.updateRelation(heat, quote, {{"sort_order", 9}, {"many_moviequotes_id", "q-9"}}));

    const auto row = db.rows("rel_1_movies_M_moviequotes")[0];
    EXPECT_EQ(row["sort_order"], 9);
    EXPECT_EQ(row["many_moviequotes_id"], "q-1");

    EXPECT_FALSE(rel.updateRelation(ronin, quote, {{"sort_order", 2}}));
}

TEST_F(RelationshipTest, RestrictBlocksDeletionWhileActive) {
    auto rel = relationship("movies_movie_quotes");
    ASSERT_TRUE(rel.add(heat, quote));

    EXPECT_THROW((void) rel.handleModelDeletion(heat, mdb::CascadeAction::Restrict), mdb::ConstraintError);
    EXPECT_TRUE(rel.handleModelDeletion(ronin, mdb::CascadeAction::Restrict));

    ASSERT_TRUE(rel.remove(heat, quote));
    EXPECT_TRUE(rel.handleModelDeletion(heat, "restrict"));
}

TEST_F(RelationshipTest, CascadeSoftDeletesRows) {
    auto rel = relationship("users_roles");
    const Participant editor_role("Roles", "r-2");
    ASSERT_TRUE(rel.add(jane, admin_role));
    ASSERT_TRUE(rel.add(jane, editor_role));
    ASSERT_TRUE(rel.add(john, admin_role));

    EXPECT_TRUE(rel.handleModelDeletion(jane, mdb::CascadeAction::Cascade));
    EXPECT_EQ(rel.activeRelatedCount(jane), 0);
    EXPECT_EQ(rel.activeRelatedCount(admin_role), 1);

    for (const auto &row: db.rows("rel_N_users_M_roles", {{"users_id", "u-1"}}))
        EXPECT_EQ(row["deleted_by"], "u-admin");

    // Nothing left to delete still lets the deletion proceed
    EXPECT_TRUE(rel.handleModelDeletion(jane, "soft_delete"));
    EXPECT_THROW((void) rel.handleModelDeletion(jane, "explode"), mdb::SchemaError);
}

TEST_F(RelationshipTest, SoftDeleteAndRestore) {
    auto rel = relationship("users_roles");
    const Participant editor_role("Roles", "r-2");
    ASSERT_TRUE(rel.add(jane, admin_role));
    ASSERT_TRUE(rel.add(jane, editor_role));

    EXPECT_TRUE(rel.softDeleteRelationship(jane, &admin_role));
    EXPECT_FALSE(rel.has(jane, admin_role));
    EXPECT_TRUE(rel.has(jane, editor_role));

    EXPECT_TRUE(rel.softDeleteRelationship(jane));
    EXPECT_FALSE(rel.softDeleteRelationship(jane));
    EXPECT_EQ(rel.activeRelatedCount(jane), 0);

    EXPECT_TRUE(rel.restoreRelationship(jane, &editor_role));
    EXPECT_TRUE(rel.has(jane, editor_role));
    EXPECT_FALSE(rel.has(jane, admin_role));

    EXPECT_TRUE(rel.restoreRelationship(jane));
    EXPECT_EQ(rel.activeRelatedCount(jane), 2);
    EXPECT_FALSE(rel.restoreRelationship(jane));
}
