// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>
#include <augsweep/errors.h>
#include <augsweep/operation_registry.h>

using namespace augsweep;

// Helper to create OperationParameter (C++17 compatible, no designated initializers)
static OperationParameter makeParam(const std::string& name, ParamType type,
                                    bool required, const std::string& desc = "") {
    OperationParameter p;
    p.name = name;
    p.type = type;
    p.required = required;
    p.description = desc;
    return p;
}

static json noop(const json&) {
    return json{{"status", "ok"}};
}

class OperationRegistryTest : public ::testing::Test {
protected:
    OperationRegistry registry;

    void registerEcho() {
        registry.registerOperation("echo", "Echo back the input",
            [](const json& args) -> json {
                return json{{"status", "ok"}, {"echoed", args["message"]}};
            },
            {makeParam("message", ParamType::STRING, true, "text to echo")});
    }
};

TEST_F(OperationRegistryTest, RegisterAndFind) {
    registerEcho();
    EXPECT_TRUE(registry.hasOperation("echo"));
    EXPECT_FALSE(registry.hasOperation("nonexistent"));

    const OperationInfo* op = registry.findOperation("echo");
    ASSERT_NE(op, nullptr);
    EXPECT_EQ(op->description, "Echo back the input");
    ASSERT_EQ(op->parameters.size(), 1u);
    EXPECT_TRUE(op->parameters[0].required);
    EXPECT_FALSE(op->destructive);
}

TEST_F(OperationRegistryTest, DuplicateRegistrationThrows) {
    registerEcho();
    EXPECT_THROW(registerEcho(), std::runtime_error);
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(OperationRegistryTest, RemoveAndClear) {
    registerEcho();
    registry.registerOperation("scan", "Scan", noop);
    EXPECT_EQ(registry.size(), 2u);

    EXPECT_TRUE(registry.removeOperation("echo"));
    EXPECT_FALSE(registry.removeOperation("echo"));
    EXPECT_EQ(registry.size(), 1u);

    registry.clear();
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(OperationRegistryTest, RegisterWithOperationInfo) {
    OperationInfo info;
    info.name = "clean";
    info.description = "Remove state";
    info.callback = noop;
    info.destructive = true;
    registry.registerOperation(std::move(info));

    const OperationInfo* found = registry.findOperation("clean");
    ASSERT_NE(found, nullptr);
    EXPECT_TRUE(found->destructive);
    EXPECT_EQ(registry.allOperations().count("clean"), 1u);
}

TEST_F(OperationRegistryTest, ExecuteOperation) {
    registerEcho();
    json result = registry.executeOperation("echo", {{"message", "hello"}});
    EXPECT_EQ(result["echoed"], "hello");
}

TEST_F(OperationRegistryTest, ExecuteResolvesName) {
    registerEcho();
    json result = registry.executeOperation("ECH", {{"message", "hi"}});
    EXPECT_EQ(result["echoed"], "hi");
}

TEST_F(OperationRegistryTest, ExecuteNotFound) {
    json result = registry.executeOperation("nonexistent", json::object());
    EXPECT_EQ(result["status"], "error");
    EXPECT_NE(result["error"].get<std::string>().find("not found"), std::string::npos);
}

TEST_F(OperationRegistryTest, ExecuteMissingRequiredParameter) {
    registerEcho();
    json result = registry.executeOperation("echo", json::object());
    EXPECT_EQ(result["status"], "error");
    EXPECT_NE(result["error"].get<std::string>().find("requires 'message'"), std::string::npos);
}

TEST_F(OperationRegistryTest, ExecuteWithoutCallback) {
    OperationInfo info;
    info.name = "empty";
    registry.registerOperation(std::move(info));

    json result = registry.executeOperation("empty", json::object());
    EXPECT_EQ(result["status"], "error");
    EXPECT_NE(result["error"].get<std::string>().find("no callback"), std::string::npos);
}

TEST_F(OperationRegistryTest, CleanerErrorCarriesKind) {
    registry.registerOperation("locked", "Always locked",
        [](const json&) -> json {
            throw StoreUnavailableError("database is locked");
        });

    json result = registry.executeOperation("locked", json::object());
    EXPECT_EQ(result["status"], "error");
    EXPECT_EQ(result["kind"], "StoreUnavailableError");
    EXPECT_NE(result["error"].get<std::string>().find("database is locked"), std::string::npos);
}

TEST_F(OperationRegistryTest, OtherExceptionsAreReported) {
    registry.registerOperation("failing", "Always fails",
        [](const json&) -> json {
            throw std::invalid_argument("intentional failure");
        });

    json result = registry.executeOperation("failing", json::object());
    EXPECT_EQ(result["status"], "error");
    EXPECT_FALSE(result.contains("kind"));
    EXPECT_EQ(result["error"], "Operation failed: intentional failure");
}

TEST_F(OperationRegistryTest, ResolveNameNormalizes) {
    registry.registerOperation("dry_run", "Dry run", noop);
    EXPECT_EQ(registry.resolveName("DRY-RUN"), "dry_run");
    EXPECT_EQ(registry.resolveName("dry_run"), "dry_run");
}

TEST_F(OperationRegistryTest, ResolveNamePrefix) {
    registry.registerOperation("telemetry", "Telemetry", noop);
    registry.registerOperation("store", "Store", noop);
    registry.registerOperation("scan", "Scan", noop);

    EXPECT_EQ(registry.resolveName("tele"), "telemetry");
    EXPECT_EQ(registry.resolveName("st"), "store");
    // "s" matches both scan and store
    EXPECT_EQ(registry.resolveName("s"), "");
    EXPECT_EQ(registry.resolveName(""), "");
    EXPECT_EQ(registry.resolveName("purge"), "");
}

TEST_F(OperationRegistryTest, ExactMatchBeatsPrefix) {
    registry.registerOperation("scan", "Scan", noop);
    registry.registerOperation("scanner", "Scanner", noop);
    EXPECT_EQ(registry.resolveName("scan"), "scan");
}

TEST_F(OperationRegistryTest, FormatHelp) {
    registerEcho();
    registry.registerOperation("clean", "Remove state", noop,
        {makeParam("editor", ParamType::STRING, false),
         makeParam("dryRun", ParamType::BOOLEAN, false)},
        true);

    std::string help = registry.formatHelp();
    EXPECT_NE(help.find("  echo <message: string>: Echo back the input\n"), std::string::npos);
    EXPECT_NE(help.find("  clean [editor: string] [dryRun: boolean]: Remove state (destructive)\n"),
              std::string::npos);
    // Ordered by name
    EXPECT_LT(help.find("clean"), help.find("echo"));
}
