// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include "test_util.h"

#include <sidgen/generator.h>

#include <set>

using namespace sidgen;
using namespace std::literals;


TEST_SUITE("normalize") {

TEST_CASE("defaults") {
    auto config = normalize({});
    CHECK(config.name == "");
    CHECK(config.length == 16);
    CHECK(config.only_lowercase == false);
    CHECK(config.style == id_style::extended);
    CHECK(config.url_safe == true);
    CHECK(config == id_config{});
}

TEST_CASE("explicit values") {
    auto config = normalize({.name = "key", .length = 40, .only_lowercase = true, .style = id_style::hex, .url_safe = false});
    CHECK(config.name == "key");
    CHECK(config.length == 40);
    CHECK(config.only_lowercase == true);
    CHECK(config.style == id_style::hex);
    CHECK(config.url_safe == false);
}

TEST_CASE("partial") {
    auto config = normalize({.length = 8, .url_safe = false});
    CHECK(config.name == "");
    CHECK(config.length == 8);
    CHECK(config.only_lowercase == default_only_lowercase);
    CHECK(config.style == default_style);
    CHECK(config.url_safe == false);
}

TEST_CASE("length") {
    CHECK(normalize({.length = 0}).length == default_length);
    CHECK(normalize({.length = -3}).length == -3);
    CHECK(normalize({.length = 1}).length == 1);
}

}

TEST_SUITE("generator") {

TEST_CASE("create") {
    id_generator gen;

    auto id = gen.create();
    CHECK(id.size() == 16);
    CHECK(all_chars_in(id, resolve_alphabet(id_style::extended, false, true)));

    CHECK(gen.create(8).size() == 8);
    CHECK(gen.create(12).size() == 12);

    id = gen.create(30, id_style::alphanumeric);
    CHECK(id.size() == 30);
    CHECK(all_chars_in(id, resolve_alphabet(id_style::alphanumeric, false, true)));

    id = gen.create(30, id_style::hex, true);
    CHECK(all_chars_in(id, "0123456789abcdef"));

    id = gen.create(std::nullopt, id_style::extended, true, false);
    CHECK(id.size() == 16);
    CHECK(all_chars_in(id, resolve_alphabet(id_style::extended, true, false)));

    CHECK(gen.size() == 0);
}

TEST_CASE("create zero length") {
    id_generator gen;
    CHECK(gen.create(0).size() == 16);
}

TEST_CASE("create invalid") {
    id_generator gen;
    CHECK_ID_ERROR(gen.create(-1), errc::invalid_length);
    CHECK_ID_ERROR(gen.create(8, id_style(9)), errc::invalid_style);
}

TEST_CASE("add and custom") {
    id_generator gen;
    gen.add({.name = "session", .length = 32, .style = id_style::alphanumeric});

    CHECK(gen.contains("session"));
    CHECK(gen.size() == 1);

    auto config = gen.find("session");
    REQUIRE(config);
    CHECK(config->name == "session");
    CHECK(config->length == 32);
    CHECK(config->style == id_style::alphanumeric);
    CHECK(config->only_lowercase == false);
    CHECK(config->url_safe == true);

    auto id = gen.custom("session");
    CHECK(id.size() == 32);
    CHECK(all_chars_in(id, config->alphabet()));
}

TEST_CASE("add overwrites") {
    id_generator gen;
    gen.add({.name = "key", .length = 10});
    gen.add({.name = "key", .length = 24, .only_lowercase = true, .style = id_style::hex});

    CHECK(gen.size() == 1);
    auto id = gen.custom("key");
    CHECK(id.size() == 24);
    CHECK(all_chars_in(id, "0123456789abcdef"));
}

TEST_CASE("add without name") {
    id_generator gen;
    CHECK_ID_ERROR(gen.add({}), errc::missing_name);
    CHECK_ID_ERROR(gen.add({.name = ""}), errc::missing_name);
    CHECK_ID_ERROR(gen.add({.length = 8}), errc::missing_name);
    CHECK(gen.size() == 0);
}

TEST_CASE("remove") {
    id_generator gen;
    gen.add({.name = "a"});
    gen.add({.name = "b"});

    gen.remove(id_config_options{.name = "a"});
    CHECK(!gen.contains("a"));
    CHECK(gen.contains("b"));

    gen.remove("b");
    CHECK(gen.size() == 0);

    gen.remove("does-not-exist");
    gen.remove(id_config_options{.name = "a"});
    CHECK(gen.size() == 0);
}

TEST_CASE("remove without name") {
    id_generator gen;
    gen.add({.name = "a"});
    CHECK_ID_ERROR(gen.remove(id_config_options{}), errc::missing_name);
    CHECK_ID_ERROR(gen.remove(""sv), errc::missing_name);
    CHECK(gen.contains("a"));
}

TEST_CASE("custom not found") {
    id_generator gen;
    CHECK_ID_ERROR(gen.custom("nope"), errc::configuration_not_found);

    gen.add({.name = "gone"});
    gen.remove("gone");
    CHECK_ID_ERROR(gen.custom("gone"), errc::configuration_not_found);

    try {
        (void)gen.custom("my-profile");
        FAIL("custom did not throw");
    } catch (id_error & ex) {
        CHECK(std::string_view(ex.what()).find("my-profile") != std::string_view::npos);
    }
}

TEST_CASE("custom invalid length") {
    id_generator gen;
    gen.add({.name = "negative", .length = -4});
    CHECK_ID_ERROR(gen.custom("negative"), errc::invalid_length);

    gen.add({.name = "zero", .length = 0});
    CHECK(gen.custom("zero").size() == 16);
}

TEST_CASE("initial registry") {
    id_generator gen({
        {"short", {.length = 6, .style = id_style::hex}},
        {"renamed", {.name = "ignored", .only_lowercase = true}},
        {"plain", {}}
    });

    CHECK(gen.size() == 3);
    CHECK((gen.names() == std::vector<std::string>{"plain", "renamed", "short"}));
    CHECK(!gen.contains("ignored"));

    auto short_config = gen.find("short");
    REQUIRE(short_config);
    CHECK(short_config->length == 6);
    CHECK(short_config->style == id_style::hex);
    CHECK(short_config->url_safe == true);

    auto renamed = gen.find("renamed");
    REQUIRE(renamed);
    CHECK(renamed->name == "renamed");
    CHECK(renamed->only_lowercase == true);
    CHECK(renamed->length == 16);

    auto plain = gen.find("plain");
    REQUIRE(plain);
    CHECK(*plain == id_config{.name = "plain"});

    CHECK(gen.custom("short").size() == 6);
    CHECK(gen.custom("plain").size() == 16);
}

TEST_CASE("copy and move") {
    id_generator gen;
    gen.add({.name = "a", .length = 5});

    id_generator copy = gen;
    copy.add({.name = "b"});
    CHECK(gen.size() == 1);
    CHECK(copy.size() == 2);

    id_generator moved = std::move(copy);
    CHECK(moved.size() == 2);
    CHECK(moved.custom("a").size() == 5);

    gen = moved;
    CHECK(gen.size() == 2);

    id_generator other;
    other = std::move(moved);
    CHECK(other.contains("b"));
}

TEST_CASE("uniqueness") {
    id_generator gen;
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i)
        ids.insert(gen.create(16));
    CHECK(ids.size() == 1000);
}

}
