#include <gtest/gtest.h>

#include "modelbase/core/exceptions.h"
#include "modelbase/model/model.h"
#include "common/fake_database_connector.h"
#include "common/test_helpers.h"

namespace {
    class ModelTest : public ::testing::Test {
    protected:
        /// A stored movie, created through the model.
        std::unique_ptr<mdb::Model> storedMovie(const std::string &title) {
            auto movie = std::make_unique<mdb::Model>(ctx, "Movies");
            movie->set("title", title);
            EXPECT_TRUE(movie->create()) << movie->validationErrors().dump();
            return movie;
        }

        mdb::MetadataEngine engine{TestHelpers::fixtureConfig()};
        FakeDatabaseConnector db;
        std::string user = "u-admin";
        mdb::ModelContext ctx{engine, db, [this] { return user; }};
    };
}

TEST_F(ModelTest, BindsToMetadata) {
    const mdb::Model movie(ctx, "Movies");

    EXPECT_EQ(movie.name(), "Movies");
    EXPECT_EQ(movie.tableName(), "movies");
    EXPECT_TRUE(movie.hasField("title"));
    EXPECT_TRUE(movie.hasField("created_at"));
    EXPECT_EQ(movie.fields().size(), movie.fieldDescriptors().size());
    EXPECT_EQ(movie.field("title")->reactComponent(), "TextInput");
    EXPECT_EQ(movie.field("nope"), nullptr);

    EXPECT_THROW((void) mdb::Model(ctx, "DoesNotExist"), mdb::NotFoundError);
}

TEST_F(ModelTest, CreateAssignsIdAndAuditFields) {
    mdb::Model movie(ctx, "Movies");
    ASSERT_TRUE(movie.set("title", "Heat"));
    ASSERT_TRUE(movie.set("rating", "8"));

    ASSERT_TRUE(movie.create()) << movie.validationErrors().dump();

    const auto id = movie.get("id");
    ASSERT_TRUE(id.is_string());
    EXPECT_EQ(id.get<std::string>().size(), 36);
    EXPECT_EQ(movie.get("created_by"), "u-admin");
    EXPECT_EQ(movie.get("updated_by"), "u-admin");
    EXPECT_TRUE(mdb::isValidDateTime(movie.get("created_at").get<std::string>(), true));
    EXPECT_FALSE(movie.isDeleted());

    const auto rows = db.rows("movies");
    ASSERT_EQ(rows.size(), 1);
    EXPECT_EQ(rows[0]["id"], id);
    EXPECT_EQ(rows[0]["title"], "Heat");
    EXPECT_EQ(rows[0]["rating"], 8);
    EXPECT_FALSE(rows[0].contains("created_by_name"));
}

TEST_F(ModelTest, SystemUserWhenNoneIsActing) {
    user.clear();
    const auto movie = storedMovie("Ronin");

    EXPECT_EQ(movie->get("created_by"), "system");
}

TEST_F(ModelTest, MissingRequiredFieldBlocksCreate) {
    mdb::Model movie(ctx, "Movies");
    movie.set("rating", 5);

    EXPECT_FALSE(movie.create());
    EXPECT_TRUE(movie.validationErrors().contains("title"));
    EXPECT_FALSE(movie.validationErrors().contains("rating"));
    EXPECT_EQ(db.calls["create"], 0);
}

TEST_F(ModelTest, SetRejectsBadValues) {
    mdb::Model movie(ctx, "Movies");
    ASSERT_TRUE(movie.set("genre", "drama"));

    EXPECT_FALSE(movie.set("genre", "western"));
    EXPECT_EQ(movie.get("genre"), "drama");
    EXPECT_TRUE(movie.validationErrors().contains("genre"));

    EXPECT_FALSE(movie.set("rating", 11));
    EXPECT_FALSE(movie.set("release_date", "someday"));
    EXPECT_FALSE(movie.set("trailer", "https://example.com/trailer.mp4"));
    EXPECT_FALSE(movie.set("no_such_field", 1));

    ASSERT_TRUE(movie.set("genre", "comedy"));
    EXPECT_FALSE(movie.validationErrors().contains("genre"));
}

TEST_F(ModelTest, UniqueIsCheckedAgainstStorage) {
    mdb::Model jane(ctx, "Users");
    jane.set("email", "jane@example.com");
    ASSERT_TRUE(jane.create()) << jane.validationErrors().dump();

    mdb::Model impostor(ctx, "Users");
    impostor.set("email", "jane@example.com");
    EXPECT_FALSE(impostor.create());
    EXPECT_TRUE(impostor.validationErrors().contains("email"));

    // Updating the owner of the value is fine
    EXPECT_TRUE(jane.update()) << jane.validationErrors().dump();
}

TEST_F(ModelTest, UpdateNeedsAnId) {
    mdb::Model movie(ctx, "Movies");
    movie.set("title", "Heat");
    EXPECT_FALSE(movie.update());

    const auto stored = storedMovie("Heat");
    user = "u-editor";
    ASSERT_TRUE(stored->set("title", "Heat (1995)"));
    ASSERT_TRUE(stored->update());

    const auto row = db.rows("movies")[0];
    EXPECT_EQ(row["title"], "Heat (1995)");
    EXPECT_EQ(row["updated_by"], "u-editor");
    EXPECT_EQ(row["created_by"], "u-admin");
}

TEST_F(ModelTest, SoftDeleteAndRestore) {
    const auto movie = storedMovie("Heat");

    ASSERT_TRUE(movie->softDelete());
    EXPECT_TRUE(movie->isDeleted());
    EXPECT_EQ(db.rows("movies")[0]["deleted_by"], "u-admin");

    ASSERT_TRUE(movie->restore());
    EXPECT_FALSE(movie->isDeleted());
    EXPECT_TRUE(db.rows("movies")[0]["deleted_at"].is_null());

    EXPECT_FALSE(movie->restore());
}

TEST_F(ModelTest, HardDelete) {
    const auto movie = storedMovie("Heat");

    ASSERT_TRUE(movie->hardDelete());
    EXPECT_TRUE(db.rows("movies").empty());

    mdb::Model unsaved(ctx, "Movies");
    EXPECT_FALSE(unsaved.hardDelete());
    EXPECT_FALSE(unsaved.softDelete());
}

TEST_F(ModelTest, PopulateFromRowSkipsValidation) {
    mdb::Model movie(ctx, "Movies");
    movie.populateFromRow({{"id", "m-1"}, {"title", "Heat"}, {"rating", 42}, {"unknown", true}});

    EXPECT_EQ(movie.get("id"), "m-1");
    EXPECT_EQ(movie.get("rating"), 42);
    EXPECT_FALSE(movie.toJSON().contains("unknown"));
    EXPECT_TRUE(movie.toJSON().contains("created_by_name"));

    EXPECT_FALSE(movie.validate());
    EXPECT_TRUE(movie.validationErrors().contains("rating"));
}

TEST_F(ModelTest, RelationsThroughTheModel) {
    const auto movie = storedMovie("Heat");

    mdb::Model quote(ctx, "MovieQuotes");
    quote.set("quote", "Don't let yourself get attached to anything.");
    ASSERT_TRUE(quote.create());

    ASSERT_EQ(movie->relationships().size(), 1);
    ASSERT_NE(movie->relationship("movies_movie_quotes"), nullptr);

    ASSERT_TRUE(movie->addRelation("movies_movie_quotes", quote, {{"sort_order", 1}}));
    EXPECT_TRUE(movie->hasRelation("movies_movie_quotes", quote));
    EXPECT_TRUE(quote.hasRelation("movies_movie_quotes", *movie));

    const auto rows = movie->related("movies_movie_quotes");
    ASSERT_EQ(rows.size(), 1);
    EXPECT_EQ(rows[0]["many_moviequotes_id"], quote.get("id"));

    EXPECT_THROW((void) movie->related("users_roles"), mdb::NotFoundError);

    ASSERT_TRUE(movie->removeRelation("movies_movie_quotes", quote));
    EXPECT_FALSE(movie->hasRelation("movies_movie_quotes", quote));
}

TEST_F(ModelTest, RemoveHonoursRestrict) {
    const auto movie = storedMovie("Heat");
    mdb::Model quote(ctx, "MovieQuotes");
    quote.set("quote", "All I am is what I'm going after.");
    ASSERT_TRUE(quote.create());
    ASSERT_TRUE(movie->addRelation("movies_movie_quotes", quote));

    EXPECT_THROW((void) movie->remove(), mdb::ConstraintError);
    EXPECT_FALSE(movie->isDeleted());

    // An explicit action overrides the relationship's own policy
    ASSERT_TRUE(movie->remove(mdb::CascadeAction::Cascade));
    EXPECT_TRUE(movie->isDeleted());
    EXPECT_FALSE(movie->hasRelation("movies_movie_quotes", quote));
}

TEST_F(ModelTest, RemoveCascadesThroughInlineRelationships) {
    mdb::Model article(ctx, "Articles");
    article.set("headline", "Heat turns 30");
    ASSERT_TRUE(article.create()) << article.validationErrors().dump();

    mdb::Model tag(ctx, "Tags");
    tag.set("label", "anniversary");
    ASSERT_TRUE(tag.create());

    ASSERT_NE(article.relationship("article_tags"), nullptr);
    ASSERT_TRUE(article.addRelation("article_tags", tag, {{"weight", 3}}));

    ASSERT_TRUE(article.remove());
    EXPECT_TRUE(article.isDeleted());
    EXPECT_FALSE(article.hasRelation("article_tags", tag));
}

TEST_F(ModelTest, UnresolvableRelationshipsAreLeftOut) {
    // Tags names a relationship without metadata
    const mdb::Model tag(ctx, "Tags");

    EXPECT_TRUE(tag.relationships().empty());
    EXPECT_EQ(tag.relationship("missing_relationship"), nullptr);
}

TEST_F(ModelTest, ListingConfiguration) {
    const mdb::Model movie(ctx, "Movies");

    EXPECT_EQ(movie.searchableFields(), mdb::FieldNames{"title"});
    EXPECT_EQ(movie.defaultSort(), (std::vector<mdb::SortSpec>{{"title", "asc"}}));
    EXPECT_EQ(movie.pagination().maxPageSize, 200);

    const auto sortable = movie.sortableFields();
    EXPECT_NE(std::ranges::find(sortable, "rating"), sortable.end());
    EXPECT_EQ(std::ranges::find(sortable, "trailer"), sortable.end());
}
