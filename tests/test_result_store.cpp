#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include "result_store.hpp"
#include "errors.hpp"

using namespace valucalc;
using json = nlohmann::json;

namespace {

std::string fresh_directory(const std::string& name) {
    std::filesystem::path dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    return dir.string();
}

} // anonymous namespace

TEST_CASE("JSON file result store", "[store]") {
    std::string dir = fresh_directory("valucalc_test_store");
    JsonFileResultStore store(dir + "/nested/results");

    SECTION("Empty store") {
        REQUIRE(store.list().empty());
        REQUIRE_FALSE(store.load("20260101T000000000-0000").has_value());
    }

    SECTION("Save creates the directory and round-trips the bundle") {
        json bundle = {{"analysis", "dcf"}, {"result", {{"value", 1234.5}}}};
        std::string id = store.save(bundle);

        REQUIRE(std::filesystem::is_directory(store.directory()));
        REQUIRE(std::filesystem::exists(store.path_for(id)));

        auto loaded = store.load(id);
        REQUIRE(loaded.has_value());
        REQUIRE(*loaded == bundle);
    }

    SECTION("Identifiers list in save order") {
        std::string first = store.save({{"n", 1}});
        std::string second = store.save({{"n", 2}});
        std::string third = store.save({{"n", 3}});

        REQUIRE(first != second);
        auto ids = store.list();
        REQUIRE(ids == std::vector<std::string>{first, second, third});
        REQUIRE((*store.load(third))["n"] == 3);
    }

    SECTION("Unsafe identifiers are never resolved") {
        store.save({{"n", 1}});
        REQUIRE_FALSE(store.load("../results").has_value());
        REQUIRE_FALSE(store.load("").has_value());
    }

    SECTION("Corrupt bundle is a data error") {
        std::string id = store.save({{"n", 1}});
        {
            std::ofstream file(store.path_for(id));
            file << "{ not json";
        }
        REQUIRE_THROWS_AS(store.load(id), DataError);
    }

    SECTION("Foreign files are not listed") {
        store.save({{"n", 1}});
        std::ofstream(std::filesystem::path(store.directory()) / "notes.txt") << "x";
        REQUIRE(store.list().size() == 1);
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("Result store directory failure", "[store][errors]") {
    std::string dir = fresh_directory("valucalc_test_store_blocked");
    {
        // A regular file where the directory should be
        std::ofstream file(dir);
        file << "occupied";
    }

    JsonFileResultStore store(dir + "/results");
    REQUIRE_THROWS_AS(store.save({{"n", 1}}), DataError);

    std::filesystem::remove_all(dir);
}
