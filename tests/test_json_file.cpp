#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "state/json_file.hpp"
#include "test_support.hpp"

using namespace hookstack;
using json = nlohmann::json;

class JsonFileTest : public ::testing::Test {
protected:
    test_support::TempDir dir;
    std::filesystem::path file() const { return dir.path() / "ledger.json"; }
};

TEST_F(JsonFileTest, ReadMissingFileReturnsNullopt) {
    state::JsonFile f(file());
    EXPECT_FALSE(f.read().has_value());
}

TEST_F(JsonFileTest, UpdateWritesDocumentAndLeavesNoTempFiles) {
    state::JsonFile f(file());
    auto result = f.update([](json& doc) {
        doc["count"] = 1;
        return true;
    });
    EXPECT_TRUE(result.written);
    EXPECT_FALSE(result.recovered);

    auto doc = f.read();
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ((*doc)["count"], 1);

    for (const auto& entry : std::filesystem::directory_iterator(dir.path())) {
        EXPECT_EQ(entry.path().string().find(".tmp."), std::string::npos) << entry.path();
    }
}

TEST_F(JsonFileTest, MutatorReturningFalseSkipsWrite) {
    state::JsonFile f(file());
    auto result = f.update([](json&) { return false; });
    EXPECT_FALSE(result.written);
    EXPECT_FALSE(std::filesystem::exists(file()));
}

TEST_F(JsonFileTest, CorruptFileIsReportedAndReinitialized) {
    test_support::write_file(file(), "{\"count\": 3,,,");
    state::JsonFile f(file());

    EXPECT_THROW(f.read(), state::PersistenceError);

    bool saw_empty = false;
    auto result = f.update([&](json& doc) {
        saw_empty = doc.empty();
        return false;
    });
    EXPECT_TRUE(saw_empty);
    EXPECT_TRUE(result.recovered);
    EXPECT_TRUE(result.written);
    EXPECT_EQ(*f.read(), json::object());
}

TEST_F(JsonFileTest, NonObjectTopLevelIsCorrupt) {
    test_support::write_file(file(), "[1, 2, 3]");
    state::JsonFile f(file());
    EXPECT_THROW(f.read(), state::PersistenceError);
}

TEST_F(JsonFileTest, WrongFieldTypeIsReinitialized) {
    test_support::write_file(file(), R"({"count": "x"})");
    state::JsonFile f(file());

    auto result = f.update([](json& doc) {
        doc["count"] = doc.value("count", 0) + 1;
        return true;
    });
    EXPECT_TRUE(result.recovered);
    EXPECT_TRUE(result.written);
    EXPECT_EQ((*f.read())["count"], 1);
}

TEST_F(JsonFileTest, ConcurrentIncrementsAreNotLost) {
    constexpr int kThreads = 4;
    constexpr int kIncrements = 50;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this] {
            // Separate handle per thread, as separate hook processes would have.
            state::JsonFile f(file(), std::chrono::milliseconds(10000));
            for (int i = 0; i < kIncrements; ++i) {
                f.update([](json& doc) {
                    doc["count"] = doc.value("count", 0) + 1;
                    return true;
                });
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    state::JsonFile f(file());
    EXPECT_EQ((*f.read())["count"], kThreads * kIncrements);
}

TEST_F(JsonFileTest, HeldLockTimesOut) {
    state::FileLock held(file().string() + ".lock", state::FileLock::Mode::EXCLUSIVE,
                         std::chrono::milliseconds(100));

    state::JsonFile f(file(), std::chrono::milliseconds(50));
    EXPECT_THROW(f.update([](json&) { return true; }), state::LockTimeout);
}
