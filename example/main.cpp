// -*- mode:c++;indent-tabs-mode:nil;c-basic-offset:4;coding:utf-8 -*-
// vi: set et ft=cpp ts=4 sts=4 sw=4 fenc=utf-8 :vi
//
// Example usage of the jtools library
//
// This example walks through the document transformation tools:
// - Addressing values with JSON Pointers
// - Applying JSON Patch documents
// - Guarding patches with JSON Predicates
// - Registering custom operations
// - Error handling

#include "../json.h"
#include "../patch.h"
#include "../pointer.h"
#include "../predicate.h"
#include <cstdlib>
#include <iostream>
#include <string>

using jtools::FailedOperationError;
using jtools::InvalidPatchError;
using jtools::Json;
using jtools::Patch;
using jtools::Pointer;
using jtools::PointerError;
using jtools::PredicateRegistry;
using jtools::UnknownOperationError;

static Json
load(const std::string& text)
{
    auto result = Json::parse(text);
    if (result.first != Json::success) {
        std::cerr << "Parse error: " << Json::StatusToString(result.first)
                  << std::endl;
        exit(1);
    }
    return result.second;
}

static const char kInventory[] = R"({
    "store": "north",
    "items": [
        {"sku": "A-100", "name": "Widget", "qty": 4},
        {"sku": "B-200", "name": "Gadget", "qty": 0}
    ],
    "meta/info": {"owner": "ops", "tilde~key": true}
})";

// Example 1: Pointers
void example_pointer()
{
    std::cout << "\n=== Example 1: JSON Pointer ===" << std::endl;

    Json doc = load(kInventory);
    const char* paths[] = {
        "/store",
        "/items/0/name",
        "/items/1/qty",
        "/meta~1info/tilde~0key",
        "/items/2",
        "/items/-",
    };
    for (const char* path : paths) {
        const Json* value = Pointer(path).value(doc);
        std::cout << "  " << path << " -> "
                  << (value ? value->toString() : "(missing)") << std::endl;
    }

    // Writing through a resolved pointer changes the document
    if (Json* qty = Pointer("/items/1/qty").value(doc))
        *qty = 12;
    std::cout << "After restock: " << doc["items"][1].toString() << std::endl;

    try {
        Pointer("/items/7/qty").valueOrThrow(doc);
    } catch (const PointerError& e) {
        std::cout << "Pointer error (expected): " << e.what() << std::endl;
    }
}

// Example 2: Patching a copy
void example_patch()
{
    std::cout << "\n=== Example 2: JSON Patch ===" << std::endl;

    const Json doc = load(kInventory);
    Patch patch = Patch::parse(R"([
        {"op": "replace", "path": "/store", "value": "south"},
        {"op": "add", "path": "/items/-",
         "value": {"sku": "C-300", "name": "Doohickey", "qty": 9}},
        {"op": "move", "from": "/items/0", "path": "/featured"},
        {"op": "copy", "from": "/meta~1info/owner", "path": "/contact"},
        {"op": "remove", "path": "/meta~1info"},
        {"op": "test", "path": "/items/0/sku", "value": "B-200"}
    ])");

    Json result = patch.apply(doc);
    std::cout << "Patched document:" << std::endl;
    std::cout << result.toStringPretty() << std::endl;
    std::cout << "Original store is still: " << doc.find("store")->getString()
              << std::endl;
}

// Example 3: Predicates on their own
void example_predicates()
{
    std::cout << "\n=== Example 3: JSON Predicates ===" << std::endl;

    const Json doc = load(kInventory);
    PredicateRegistry predicates = PredicateRegistry::standard();
    const char* checks[] = {
        R"({"op": "starts", "path": "/items/0/sku", "value": "A-"})",
        R"({"op": "contains", "path": "/items/1/name", "value": "GADGET",
            "ignore_case": true})",
        R"({"op": "matches", "path": "/items/1/sku", "value": "^[A-Z]-\\d+$"})",
        R"({"op": "less", "path": "/items/0/qty", "value": 2})",
        R"({"op": "type", "path": "/items/5", "value": "undefined"})",
        R"({"op": "and", "apply": [
              {"op": "defined", "path": "/store"},
              {"op": "not", "apply": [
                  {"op": "more", "path": "/items/1/qty", "value": 0}]}]})",
    };
    for (const char* check : checks) {
        Json predicate = load(check);
        std::cout << "  " << predicate.toString() << " -> "
                  << (predicates.evaluate(predicate, doc) ? "true" : "false")
                  << std::endl;
    }
}

// Example 4: Guarded updates
void example_guarded_patch()
{
    std::cout << "\n=== Example 4: Guarded Patch ===" << std::endl;

    Json doc = load(R"({"a": {"b": {"c": "123!ABC"}}})");
    Patch guarded = Patch::withPredicates(load(R"([
        {"op": "contains", "path": "/a/b/c", "value": "ABC"},
        {"op": "replace", "path": "/a/b/c", "value": 123}
    ])"));
    std::cout << "Guard holds: " << guarded.apply(doc).toString() << std::endl;

    Patch stale = Patch::withPredicates(load(R"([
        {"op": "starts", "path": "/a/b/c", "value": "999"},
        {"op": "replace", "path": "/a/b/c", "value": 999}
    ])"));
    try {
        stale.applyInPlace(doc);
    } catch (const FailedOperationError& e) {
        std::cout << "Guard failed (expected): " << e.what() << std::endl;
    }
    std::cout << "Document untouched: " << doc.toString() << std::endl;
}

// Example 5: Custom operations
void example_custom_operation()
{
    std::cout << "\n=== Example 5: Custom Operations ===" << std::endl;

    Patch patch(load(R"([
        {"op": "increment", "path": "/items/0/qty", "by": 3},
        {"op": "test", "path": "/items/0/qty", "value": 7}
    ])"));
    patch.registerOperation(
      "increment", [](const Json& operation, Json& target) {
          const Json* path = operation.find("path");
          const Json* by = operation.find("by");
          if (!path || !path->isString() || !by || !by->isLong())
              throw FailedOperationError(operation);
          Json* counter = Pointer(path->getString()).value(target);
          if (!counter || !counter->isLong())
              throw FailedOperationError(operation);
          *counter = counter->getLong() + by->getLong();
      });

    Json result = patch.apply(load(kInventory));
    std::cout << "Incremented: " << result["items"][0].toString() << std::endl;
}

// Example 6: Error handling
void example_error_handling()
{
    std::cout << "\n=== Example 6: Error Handling ===" << std::endl;

    try {
        Patch::parse(R"({"op": "add", "path": "/x", "value": 1})");
    } catch (const InvalidPatchError& e) {
        std::cout << "Invalid patch (expected): " << e.what() << std::endl;
    }

    try {
        Patch::parse(R"([{"op": "add", "path": "/x", "value": 1)");
    } catch (const InvalidPatchError& e) {
        std::cout << "Invalid patch (expected): " << e.what() << std::endl;
    }

    try {
        Patch::parse(R"([{"op": "merge", "path": "/x"}])").apply(load("{}"));
    } catch (const UnknownOperationError& e) {
        std::cout << "Unknown operation (expected): " << e.name() << std::endl;
    }

    try {
        Patch::parse(R"([{"op": "replace", "path": "/nowhere", "value": 1}])")
          .apply(load("{}"));
    } catch (const FailedOperationError& e) {
        std::cout << "Failed operation (expected): "
                  << e.operation().toString() << std::endl;
    }
}

int main()
{
    std::cout << "JSON Tools Example Program" << std::endl;
    std::cout << "==========================" << std::endl;

    example_pointer();
    example_patch();
    example_predicates();
    example_guarded_patch();
    example_custom_operation();
    example_error_handling();

    std::cout << "\nAll examples completed!" << std::endl;
    return 0;
}
