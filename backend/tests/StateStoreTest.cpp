#include "utils/StateStore.hpp"

#include "TestUtils.hpp"

#include <doctest/doctest.h>

TEST_CASE("StateStore persists values across reopen")
{
    tp::tests::TempDir dir("state-store");
    auto const db_path = dir.path() / "state.db";
    {
        tp::storage::StateStore store(db_path);
        REQUIRE(store.is_valid());
        CHECK_FALSE(store.get("lastPreset"));
        CHECK(store.set("lastPreset", "race.json"));
        CHECK(store.set("lastPreset", "endurance.json"));
        CHECK(store.set("other", "x"));
        CHECK(store.remove("other"));
    }

    tp::storage::StateStore reopened(db_path);
    REQUIRE(reopened.is_valid());
    CHECK(reopened.get("lastPreset") == "endurance.json");
    CHECK_FALSE(reopened.get("other"));
    CHECK(reopened.path() == db_path);
}

TEST_CASE("StateStore reports an unusable location")
{
    tp::tests::TempDir dir("state-store-bad");
    auto const blocker = dir.path() / "blocker";
    tp::tests::write_text(blocker, "x");
    tp::storage::StateStore store(blocker / "state.db");
    CHECK_FALSE(store.is_valid());
    CHECK_FALSE(store.get("lastPreset"));
    CHECK_FALSE(store.set("lastPreset", "x"));
}
