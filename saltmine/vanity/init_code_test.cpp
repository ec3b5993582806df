// Copyright 2025 The Saltmine Authors
// SPDX-License-Identifier: Apache-2.0

#include "init_code.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

#include <catch2/catch_test_macros.hpp>

#include <saltmine/core/common/util.hpp>
#include <saltmine/infra/test_util/temporary_directory.hpp>

namespace saltmine::vanity {

static std::filesystem::path write_file(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out{path};
    out << text;
    return path;
}

TEST_CASE("parse_init_code") {
    CHECK(to_hex(parse_init_code("0x6080604052")) == "6080604052");
    CHECK(to_hex(parse_init_code("  6080604052\n")) == "6080604052");
    CHECK(parse_init_code("0x").empty());
    CHECK_THROWS_AS(parse_init_code("0x608"), std::invalid_argument);
    CHECK_THROWS_AS(parse_init_code("60zz"), std::invalid_argument);
}

TEST_CASE("read_init_code_file") {
    test_util::TemporaryDirectory tmp_dir;
    const auto path{write_file(tmp_dir.path() / "init_code.hex", "0x60806040\n")};
    CHECK(to_hex(read_init_code_file(path)) == "60806040");
    CHECK_THROWS_AS(read_init_code_file(tmp_dir.path() / "missing.hex"), std::runtime_error);
}

TEST_CASE("read_artifact_bytecode") {
    test_util::TemporaryDirectory tmp_dir;

    SECTION("bytecode string") {
        const auto path{write_file(tmp_dir.path() / "hardhat.json",
                                   R"({"contractName": "Create2Factory", "bytecode": "0x6080604052"})")};
        CHECK(to_hex(read_artifact_bytecode(path)) == "6080604052");
    }

    SECTION("bytecode object") {
        const auto path{write_file(tmp_dir.path() / "foundry.json",
                                   R"({"bytecode": {"object": "0x6080604052", "linkReferences": {}}})")};
        CHECK(to_hex(read_artifact_bytecode(path)) == "6080604052");
    }

    SECTION("empty bytecode") {
        const auto path{write_file(tmp_dir.path() / "interface.json", R"({"bytecode": "0x"})")};
        CHECK_THROWS_AS(read_artifact_bytecode(path), std::runtime_error);
    }

    SECTION("missing bytecode") {
        const auto path{write_file(tmp_dir.path() / "abi.json", R"({"abi": []})")};
        CHECK_THROWS_AS(read_artifact_bytecode(path), std::runtime_error);
    }

    SECTION("not JSON") {
        const auto path{write_file(tmp_dir.path() / "broken.json", "bytecode: 0x60")};
        CHECK_THROWS_AS(read_artifact_bytecode(path), std::runtime_error);
    }
}

}  // namespace saltmine::vanity
