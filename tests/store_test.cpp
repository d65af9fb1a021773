#include "storage/store.hpp"

#include "storage/clock.hpp"
#include "storage/entry.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

namespace ttlkv {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

// ── Fixture ───────────────────────────────────────────────────────────────────

class StoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = fs::temp_directory_path() /
                    ("ttlkv_store_test_" + std::string(info->name()));
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
        path_  = test_dir_ / "store.json";
        clock_ = std::make_shared<ManualClock>();
        store_ = std::make_unique<Store>(path_, clock_);
    }

    void TearDown() override {
        store_.reset();
        std::error_code ec;
        fs::remove_all(test_dir_, ec);
    }

    // A second Store on the same file, sharing the clock.
    std::unique_ptr<Store> open_other() const {
        return std::make_unique<Store>(path_, clock_);
    }

    static std::optional<Value> some(Value v) {
        return v;
    }

    std::string read_file() const {
        std::ifstream in(path_);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    void write_file(const std::string& text) const {
        std::ofstream out(path_, std::ios::trunc);
        out << text;
    }

    fs::path test_dir_;
    fs::path path_;
    std::shared_ptr<ManualClock> clock_;
    std::unique_ptr<Store> store_;
};

// ── add() / get() ─────────────────────────────────────────────────────────────

TEST_F(StoreTest, GetReturnsNulloptForMissingKey) {
    EXPECT_FALSE(store_->get("nonexistent").has_value());
}

TEST_F(StoreTest, AddThenGetReturnsValue) {
    store_->add("name", "John", 5);
    auto value = store_->get("name");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, Value("John"));
}

TEST_F(StoreTest, AddOverwritesExistingKey) {
    store_->add("key", "first", 5);
    store_->add("key", "second");
    EXPECT_EQ(store_->get("key"), some("second"));
    EXPECT_FALSE(store_->get_all().at("key").expiration.has_value());
}

TEST_F(StoreTest, StoresStructuredValues) {
    const Value object = {{"name", "John"}, {"tags", {"a", "b"}}, {"age", 42}};
    store_->add("object", object);
    store_->add("number", 3.5);
    store_->add("flag", true);
    store_->add("list", Value::array({1, 2, 3}));

    EXPECT_EQ(store_->get("object"), some(object));
    EXPECT_EQ(store_->get("number"), some(3.5));
    EXPECT_EQ(store_->get("flag"), some(true));
    EXPECT_EQ(store_->get("list"), some(Value::array({1, 2, 3})));
}

TEST_F(StoreTest, NullValueIsDistinctFromNotFound) {
    store_->add("nothing", nullptr);
    auto value = store_->get("nothing");
    ASSERT_TRUE(value.has_value());
    EXPECT_TRUE(value->is_null());
}

// ── Expiration ────────────────────────────────────────────────────────────────

TEST_F(StoreTest, ComputeExpiration) {
    EXPECT_FALSE(store_->compute_expiration(std::nullopt).has_value());
    EXPECT_FALSE(store_->compute_expiration(0).has_value());
    EXPECT_EQ(store_->compute_expiration(5), clock_->now() + 300);
}

TEST_F(StoreTest, HugeTtlSaturatesInsteadOfWrapping) {
    constexpr auto kMax = std::numeric_limits<int64_t>::max();

    store_->add("k", "v", kMax / 60 + 1);
    EXPECT_EQ(store_->get("k"), some("v"));
    EXPECT_EQ(store_->get_all().at("k").expiration, kMax);

    // The multiplication fits; adding it to now would not.
    EXPECT_EQ(store_->compute_expiration(kMax / 60), kMax);
    EXPECT_EQ(store_->compute_expiration(kMax), kMax);
}

TEST_F(StoreTest, HugeNegativeTtlSaturatesAndExpires) {
    constexpr auto kMin = std::numeric_limits<int64_t>::min();

    EXPECT_EQ(store_->compute_expiration(kMin), kMin);
    EXPECT_EQ(store_->compute_expiration(kMin / 60 - 1), kMin);
    EXPECT_EQ(store_->compute_expiration(kMin / 60), clock_->now() + (kMin / 60) * 60);

    store_->add("k", "v", kMin);
    EXPECT_FALSE(store_->get("k").has_value());
}

TEST_F(StoreTest, ZeroTtlNeverExpires) {
    store_->add("key", "value", 0);
    clock_->advance(24h * 365);
    EXPECT_EQ(store_->get("key"), some("value"));
}

TEST_F(StoreTest, EntryLivesUntilTtlElapses) {
    store_->add("key", "value", 5);
    clock_->advance(5min - 1s);
    EXPECT_EQ(store_->get("key"), some("value"));
}

TEST_F(StoreTest, EntryExpiresOnceTtlElapses) {
    store_->add("key", "value", 5);
    clock_->advance(5min + 1s);
    EXPECT_FALSE(store_->get("key").has_value());
    EXPECT_EQ(store_->get_all().count("key"), 0u);
}

TEST_F(StoreTest, ExpirationIsReachedAtExactInstant) {
    store_->add("key", "value", 1);
    clock_->advance(1min);
    EXPECT_FALSE(store_->get("key").has_value());
}

TEST_F(StoreTest, SweepRemovesExpiredEntriesFromFile) {
    store_->add("short", 1, 1);
    store_->add("long", 2, 10);
    clock_->advance(2min);
    auto all = store_->sync();

    EXPECT_EQ(all.size(), 1u);
    EXPECT_EQ(all.count("long"), 1u);
    auto on_disk = nlohmann::json::parse(read_file());
    EXPECT_FALSE(on_disk.contains("short"));
    EXPECT_TRUE(on_disk.contains("long"));
}

// ── update() ──────────────────────────────────────────────────────────────────

TEST_F(StoreTest, UpdateReplacesValueAndExpiration) {
    store_->add("name", "John", 5);
    EXPECT_TRUE(store_->update("name", "Jane", 10));
    EXPECT_EQ(store_->get("name"), some("Jane"));
    EXPECT_EQ(store_->get_all().at("name").expiration, clock_->now() + 600);
}

TEST_F(StoreTest, UpdateWithoutTtlClearsExpiration) {
    store_->add("name", "John", 5);
    EXPECT_TRUE(store_->update("name", "Jane"));
    clock_->advance(1h);
    EXPECT_EQ(store_->get("name"), some("Jane"));
}

TEST_F(StoreTest, UpdateOnAbsentKeyIsNoop) {
    store_->add("present", "value");
    const auto before = read_file();

    EXPECT_FALSE(store_->update("absent", "other", 3));

    EXPECT_EQ(read_file(), before);
    EXPECT_FALSE(store_->get("absent").has_value());
    EXPECT_EQ(store_->get_all().size(), 1u);
}

TEST_F(StoreTest, UpdateOnExpiredKeyIsNoop) {
    store_->add("key", "old", 1);
    clock_->advance(2min);
    EXPECT_FALSE(store_->update("key", "new"));
    EXPECT_FALSE(store_->get("key").has_value());
}

// ── remove() ──────────────────────────────────────────────────────────────────

TEST_F(StoreTest, RemoveDeletesKey) {
    store_->add("key", "value");
    EXPECT_TRUE(store_->remove("key"));
    EXPECT_FALSE(store_->get("key").has_value());
}

TEST_F(StoreTest, RemoveMissingKeyReturnsFalse) {
    EXPECT_FALSE(store_->remove("ghost"));
    EXPECT_FALSE(store_->get("ghost").has_value());
}

TEST_F(StoreTest, NameLifecycleScenario) {
    store_->add("name", "John", 5);
    EXPECT_EQ(store_->get("name"), some("John"));

    store_->update("name", "Jane", 10);
    EXPECT_EQ(store_->get("name"), some("Jane"));

    store_->remove("name");
    EXPECT_FALSE(store_->get("name").has_value());
}

// ── expire() / expire_all() ───────────────────────────────────────────────────

TEST_F(StoreTest, ExpireMakesKeyExpiredAndSweptOnNextLoad) {
    store_->add("k", "v");
    EXPECT_TRUE(store_->expire("k"));

    auto expired = store_->get_expired_details();
    ASSERT_EQ(expired.count("k"), 1u);
    EXPECT_EQ(expired.at("k").expiration, clock_->now());

    EXPECT_EQ(store_->get_all().count("k"), 0u);
}

TEST_F(StoreTest, ExpireMissingKeyReturnsFalse) {
    store_->add("k", "v");
    EXPECT_FALSE(store_->expire("other"));
    EXPECT_TRUE(store_->get_expired_details().empty());
}

TEST_F(StoreTest, ExpireAllMarksEveryEntry) {
    store_->add("a", 1);
    store_->add("b", 2, 30);
    store_->expire_all();

    EXPECT_EQ(store_->get_expired_details().size(), 2u);
    EXPECT_TRUE(store_->get_active_details().empty());
    EXPECT_TRUE(store_->sync().empty());
}

TEST_F(StoreTest, ExpireOnFreshStoreSeesExistingFile) {
    store_->add("k", "v");
    auto other = open_other();
    EXPECT_TRUE(other->expire("k"));
    EXPECT_FALSE(store_->get("k").has_value());
}

TEST_F(StoreTest, ExpireWorksOnLastLoadedSnapshot) {
    store_->sync();
    auto other = open_other();
    other->add("late", "v");

    // store_ has not reloaded since "late" was written.
    EXPECT_FALSE(store_->expire("late"));
    EXPECT_EQ(store_->get("late"), some("v"));
}

// ── get_expired_details() / get_active_details() ──────────────────────────────

TEST_F(StoreTest, ExpiredAndActivePartitionEntries) {
    store_->add("forever", 1);
    store_->add("soon", 2, 1);
    store_->add("later", 3, 2);
    clock_->advance(90s);

    auto expired = store_->get_expired_details();
    auto active  = store_->get_active_details();

    ASSERT_EQ(expired.size(), 1u);
    EXPECT_EQ(expired.count("soon"), 1u);
    ASSERT_EQ(active.size(), 2u);
    EXPECT_EQ(active.count("forever"), 1u);
    EXPECT_EQ(active.count("later"), 1u);
    EXPECT_EQ(expired.size() + active.size(), store_->size());
}

TEST_F(StoreTest, DetailsDoNotSweep) {
    store_->add("soon", 1, 1);
    clock_->advance(5min);
    EXPECT_EQ(store_->get_expired_details().size(), 1u);
    EXPECT_EQ(store_->size(), 1u);
}

// ── remove_all() / expire_all_expired() ───────────────────────────────────────

TEST_F(StoreTest, RemoveAllClearsStoreAndFile) {
    store_->add("a", 1);
    store_->add("b", 2);
    store_->remove_all();

    EXPECT_EQ(store_->size(), 0u);
    EXPECT_TRUE(nlohmann::json::parse(read_file()).empty());
    EXPECT_TRUE(store_->get_all().empty());
}

TEST_F(StoreTest, ExpireAllExpiredDeletesOnlyExpired) {
    store_->add("soon", 1, 1);
    store_->add("forever", 2);
    clock_->advance(2min);

    EXPECT_EQ(store_->expire_all_expired(), 1u);
    EXPECT_EQ(store_->size(), 1u);

    auto on_disk = nlohmann::json::parse(read_file());
    EXPECT_FALSE(on_disk.contains("soon"));
    EXPECT_TRUE(on_disk.contains("forever"));
}

// ── Backing file ──────────────────────────────────────────────────────────────

TEST_F(StoreTest, MissingFileIsEmptyStore) {
    EXPECT_TRUE(store_->get_all().empty());
    EXPECT_TRUE(fs::exists(path_));
}

TEST_F(StoreTest, MalformedFileIsEmptyStore) {
    write_file("{ this is not json");
    EXPECT_FALSE(store_->get("anything").has_value());
    EXPECT_TRUE(store_->get_all().empty());
    EXPECT_EQ(read_file(), "{}\n");
}

TEST_F(StoreTest, FileIsPrettyPrintedWithTrailingNewline) {
    store_->add("name", "John");
    EXPECT_EQ(read_file(),
              "{\n"
              "    \"name\": {\n"
              "        \"expiration\": null,\n"
              "        \"value\": \"John\"\n"
              "    }\n"
              "}\n");
}

TEST_F(StoreTest, ExpirationIsWrittenAsEpochSeconds) {
    store_->add("name", "John", 5);
    auto on_disk = nlohmann::json::parse(read_file());
    EXPECT_EQ(on_disk["name"]["expiration"].get<int64_t>(), clock_->now() + 300);
}

TEST_F(StoreTest, ReloadFromFileIsObservationallyEqual) {
    store_->add("plain", "text");
    store_->add("timed", Value::object({{"n", 1}}), 7);
    store_->add("list", Value::array({true, nullptr, "x"}), 0);
    const auto written = store_->get_all();

    auto other = open_other();
    EXPECT_EQ(other->get_all(), written);
}

TEST_F(StoreTest, UnserialisableValueThrowsAndLeavesStoreUnchanged) {
    store_->add("good", "v");
    const auto before = read_file();

    EXPECT_THROW(store_->add("bad", std::string("\xff")), std::system_error);
    EXPECT_EQ(store_->size(), 1u);
    EXPECT_EQ(read_file(), before);

    // The rejected entry never reached memory, so in-memory operations work.
    EXPECT_TRUE(store_->expire("good"));
    EXPECT_EQ(store_->expire_all_expired(), 1u);
}

TEST_F(StoreTest, UnserialisableUpdateKeepsPreviousValue) {
    store_->add("key", "old");
    EXPECT_THROW(store_->update("key", std::string("\xfe\xff")), std::system_error);
    EXPECT_EQ(store_->size(), 1u);
    EXPECT_EQ(store_->get("key"), some("old"));
}

TEST_F(StoreTest, AcceptsStringViewKeys) {
    const std::string buffer = "prefix:key";
    const std::string_view key = std::string_view(buffer).substr(7);
    store_->add(key, 1);
    EXPECT_EQ(store_->get("key"), some(1));
    EXPECT_TRUE(store_->remove(key));
}

TEST_F(StoreTest, WriteFailureThrows) {
    Store broken{test_dir_ / "missing_dir" / "store.json", clock_};
    EXPECT_THROW(broken.add("key", "value"), std::system_error);
}

TEST(DefaultStoreTest, BoundToDotEnv) {
    EXPECT_EQ(default_store().path(), fs::path(".env"));
}

} // namespace ttlkv
