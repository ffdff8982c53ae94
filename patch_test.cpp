// -*- mode:c++;indent-tabs-mode:nil;c-basic-offset:4;coding:utf-8 -*-
// vi: set et ft=cpp ts=4 sts=4 sw=4 fenc=utf-8 :vi
//
// Copyright 2024 Mozilla Foundation
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "json.h"
#include "patch.h"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#define ARRAYLEN(A) \
    ((sizeof(A) / sizeof(*(A))) / ((unsigned)!(sizeof(A) % sizeof(*(A)))))

#define BENCH(ITERATIONS, WORK_PER_RUN, CODE) \
    do { \
        auto start = std::chrono::high_resolution_clock::now(); \
        for (int __i = 0; __i < ITERATIONS; ++__i) { \
            std::atomic_signal_fence(std::memory_order_acq_rel); \
            CODE; \
        } \
        auto end = std::chrono::high_resolution_clock::now(); \
        auto duration = \
          std::chrono::duration_cast<std::chrono::nanoseconds>(end - start); \
        long long work = (WORK_PER_RUN) * (ITERATIONS); \
        double nanos = (duration.count() + work - 1) / (double)work; \
        printf("%10g ns %2dx %s\n", nanos, (ITERATIONS), #CODE); \
    } while (0)

using jtools::FailedOperationError;
using jtools::InvalidPatchError;
using jtools::Json;
using jtools::OperationRegistry;
using jtools::Patch;
using jtools::UnknownOperationError;

static const char kExample[] = R"({"a":{"b":{"c":"123!ABC"}}})";

static Json
parse(const char* text)
{
    std::pair<Json::Status, Json> res = Json::parse(text);
    if (res.first != Json::success) {
        printf("error: %s: %s\n", Json::StatusToString(res.first), text);
        exit(199);
    }
    return res.second;
}

// Applies ops to doc by copy and compares the compact result.
static bool
patched(const char* doc, const char* ops, const char* want)
{
    Json res = Patch(parse(ops)).apply(parse(doc));
    if (res.toString() != want) {
        printf("error: %s applied to %s was %s but should have been %s\n",
               ops,
               doc,
               res.toString().c_str(),
               want);
        return false;
    }
    return true;
}

// True if applying ops to doc fails with FailedOperationError.
static bool
fails(const char* doc, const char* ops)
{
    Json target = parse(doc);
    Json before = target;
    try {
        Patch(parse(ops)).apply(target);
    } catch (const FailedOperationError&) {
        return target == before;
    }
    printf("error: %s applied to %s should have failed\n", ops, doc);
    return false;
}

static const struct
{
    const char* doc;
    const char* ops;
    const char* want;
} kSuccess[] = {

    // add
    { R"({"arr":[1,2,3]})",
      R"([{"op":"add","path":"/arr/-","value":4}])",
      R"({"arr":[1,2,3,4]})" },
    { R"({"arr":[1,2,3]})",
      R"([{"op":"add","path":"/arr/1","value":9}])",
      R"({"arr":[1,9,2,3]})" },
    { R"({"arr":[1,2,3]})",
      R"([{"op":"add","path":"/arr/3","value":4}])",
      R"({"arr":[1,2,3,4]})" },
    { R"({"arr":[]})",
      R"([{"op":"add","path":"/arr/0","value":{"x":[true]}}])",
      R"({"arr":[{"x":[true]}]})" },
    { R"({"foo":"bar"})",
      R"([{"op":"add","path":"/baz","value":"qux"}])",
      R"({"foo":"bar","baz":"qux"})" },
    { R"({"foo":"bar","baz":1})",
      R"([{"op":"add","path":"/foo","value":null}])",
      R"({"foo":null,"baz":1})" },
    { R"({"a":{}})",
      R"([{"op":"add","path":"/a/x~1y~0z","value":1}])",
      R"({"a":{"x/y~z":1}})" },
    { R"({"a":1})",
      R"([{"op":"add","path":"/","value":2}])",
      R"({"a":1,"":2})" },
    { R"({"a":1})",
      R"([{"op":"add","path":"","value":[1,2]}])",
      R"([1,2])" },

    // remove
    { R"({"a":1,"b":2})",
      R"([{"op":"remove","path":"/a"}])",
      R"({"b":2})" },
    { R"({"arr":[1,2,3]})",
      R"([{"op":"remove","path":"/arr/0"}])",
      R"({"arr":[2,3]})" },
    { R"({"a":1})",
      R"([{"op":"remove","path":"/missing"},
          {"op":"remove","path":"/x/y/z"},
          {"op":"remove","path":"/a/0"}])",
      R"({"a":1})" },
    { R"({"arr":[1]})",
      R"([{"op":"remove","path":"/arr/5"},{"op":"remove","path":"/arr/-"}])",
      R"({"arr":[1]})" },

    // replace
    { kExample,
      R"([{"op":"replace","path":"/a/b/c","value":123}])",
      R"({"a":{"b":{"c":123}}})" },
    { R"({"arr":[1,2,3]})",
      R"([{"op":"replace","path":"/arr/2","value":[3]}])",
      R"({"arr":[1,2,[3]]})" },
    { R"({"z":1,"y":2})",
      R"([{"op":"replace","path":"/z","value":0}])",
      R"({"z":0,"y":2})" },
    { R"({"a":1})",
      R"([{"op":"replace","path":"","value":"whole"}])",
      R"("whole")" },

    // move
    { R"({"foo":{"bar":"baz","waldo":"fred"},"qux":{"corge":"grault"}})",
      R"([{"op":"move","from":"/foo/waldo","path":"/qux/thud"}])",
      R"({"foo":{"bar":"baz"},"qux":{"corge":"grault","thud":"fred"}})" },
    { R"({"foo":["all","grass","cows","eat"]})",
      R"([{"op":"move","from":"/foo/1","path":"/foo/3"}])",
      R"({"foo":["all","cows","eat","grass"]})" },
    { R"({"foo":["all","grass","cows","eat"]})",
      R"([{"op":"move","from":"/foo/3","path":"/foo/0"}])",
      R"({"foo":["eat","all","grass","cows"]})" },
    { R"({"a":[1,2],"b":{}})",
      R"([{"op":"move","from":"/a","path":"/b/a"}])",
      R"({"b":{"a":[1,2]}})" },
    { R"({"a":1})",
      R"([{"op":"move","from":"/a","path":"/a"}])",
      R"({"a":1})" },

    // copy
    { R"({"a":{"b":[1]}})",
      R"([{"op":"copy","from":"/a/b","path":"/c"}])",
      R"({"a":{"b":[1]},"c":[1]})" },
    { R"({"arr":["x","y"]})",
      R"([{"op":"copy","from":"/arr/1","path":"/arr/0"}])",
      R"({"arr":["y","x","y"]})" },
    { R"({"a":1})",
      R"([{"op":"copy","from":"","path":"/self"}])",
      R"({"a":1,"self":{"a":1}})" },

    // test
    { kExample,
      R"([{"op":"test","path":"/a/b/c","value":"123!ABC"}])",
      kExample },
    { R"({"n":1,"o":{"x":[1,{"y":null}],"z":"s"}})",
      R"([{"op":"test","path":"/n","value":1.0},
          {"op":"test","path":"/o","value":{"z":"s","x":[1,{"y":null}]}}])",
      R"({"n":1,"o":{"x":[1,{"y":null}],"z":"s"}})" },
    { R"({"k":null})",
      R"([{"op":"test","path":"/k","value":null}])",
      R"({"k":null})" },
    { R"([1,2])",
      R"([{"op":"test","path":"","value":[1,2]}])",
      R"([1,2])" },

    // sequences
    { R"({})",
      R"([{"op":"add","path":"/list","value":[]},
          {"op":"add","path":"/list/-","value":"a"},
          {"op":"add","path":"/list/-","value":"b"},
          {"op":"add","path":"/list/0","value":"first"},
          {"op":"copy","from":"/list","path":"/backup"},
          {"op":"remove","path":"/list/1"},
          {"op":"test","path":"/list","value":["first","b"]}])",
      R"({"list":["first","b"],"backup":["first","a","b"]})" },
    { R"({"a":1})", "[]", R"({"a":1})" },
};

static const struct
{
    const char* doc;
    const char* ops;
} kFailure[] = {

    // add
    { R"({"a":1})", R"([{"op":"add","path":"/x/y","value":1}])" },
    { R"({"arr":[1]})", R"([{"op":"add","path":"/arr/2","value":1}])" },
    { R"({"arr":[1]})", R"([{"op":"add","path":"/arr/01","value":1}])" },
    { R"({"arr":[1]})", R"([{"op":"add","path":"/arr/x","value":1}])" },
    { R"({"s":"str"})", R"([{"op":"add","path":"/s/x","value":1}])" },
    { R"({"n":null})", R"([{"op":"add","path":"/n/x","value":1}])" },
    { R"({"a":1})", R"([{"op":"add","path":"/b"}])" },
    { R"({"a":1})", R"([{"op":"add","value":1}])" },
    { R"({"a":1})", R"([{"op":"add","path":7,"value":1}])" },
    { R"({"a":1})", R"([{"op":"add","path":"b","value":1}])" },

    // remove
    { R"({"a":1})", R"([{"op":"remove","path":""}])" },
    { R"({"a":1})", R"([{"op":"remove"}])" },

    // replace
    { R"({"a":1})", R"([{"op":"replace","path":"/b","value":1}])" },
    { R"({"arr":[1]})", R"([{"op":"replace","path":"/arr/1","value":1}])" },
    { R"({"arr":[1]})", R"([{"op":"replace","path":"/arr/-","value":1}])" },
    { R"({"a":1})", R"([{"op":"replace","path":"/a"}])" },

    // move and copy
    { R"({"a":1})", R"([{"op":"move","from":"/b","path":"/c"}])" },
    { R"({"a":1})", R"([{"op":"copy","from":"/b","path":"/c"}])" },
    { R"({"a":1})", R"([{"op":"move","path":"/c"}])" },
    { R"({"a":1})", R"([{"op":"copy","from":"/a"}])" },
    { R"({"a":1})", R"([{"op":"copy","from":"/a","to":"/b"}])" },
    { R"({"a":1})", R"([{"op":"copy","from":"/a","path":"/x/y"}])" },
    { R"({"a":{"b":1}})", R"([{"op":"move","from":"/a","path":"/a/b/c"}])" },
    { R"({"a":{"b":1}})", R"([{"op":"move","from":"","path":"/x"}])" },

    // test
    { kExample, R"([{"op":"test","path":"/a/b/c","value":"wrong"}])" },
    { kExample, R"([{"op":"test","path":"/a/b/x","value":null}])" },
    { kExample, R"([{"op":"test","path":"/a/b/c"}])" },
    { R"({"n":1})", R"([{"op":"test","path":"/n","value":"1"}])" },
    { R"({"o":{"x":1}})", R"([{"op":"test","path":"/o","value":{"x":1,"y":2}}])" },
    { R"({"l":[1,2]})", R"([{"op":"test","path":"/l","value":[2,1]}])" },

    // a failure part way through leaves the copy behind
    { R"({"a":1})",
      R"([{"op":"add","path":"/b","value":2},
          {"op":"remove","path":"/a"},
          {"op":"test","path":"/b","value":3}])" },
};

void
success_test()
{
    for (size_t i = 0; i < ARRAYLEN(kSuccess); ++i)
        if (!patched(kSuccess[i].doc, kSuccess[i].ops, kSuccess[i].want))
            exit(1);
}

void
failure_test()
{
    for (size_t i = 0; i < ARRAYLEN(kFailure); ++i)
        if (!fails(kFailure[i].doc, kFailure[i].ops))
            exit(2);
}

void
copy_apply_test()
{
    const Json original = parse(kExample);
    Patch patch(parse(R"([{"op":"replace","path":"/a/b/c","value":123},
                          {"op":"add","path":"/a/d","value":[]}])"));
    Json res = patch.apply(original);
    if (res.toString() != R"({"a":{"b":{"c":123},"d":[]}})")
        exit(10);
    if (original.toString() != kExample)
        exit(11);

    // a failed copy apply leaves the argument alone
    Patch failing(parse(R"([{"op":"remove","path":"/a/b"},
                            {"op":"test","path":"/a/b/c","value":"wrong"}])"));
    try {
        failing.apply(original);
        exit(12);
    } catch (const FailedOperationError& e) {
        if (e.operation().find("op")->getString() != "test")
            exit(13);
    }
    if (original.toString() != kExample)
        exit(14);
}

void
in_place_test()
{
    Json doc = parse(kExample);
    Json* alias = &doc["a"];
    Patch(parse(R"([{"op":"add","path":"/a/x","value":true}])"))
      .applyInPlace(doc);
    if (doc.toString() != R"({"a":{"b":{"c":"123!ABC"},"x":true}})")
        exit(20);
    if (alias != &doc["a"])
        exit(21);

    // operations before the failure stay applied
    Patch partial(parse(R"([{"op":"remove","path":"/a/x"},
                            {"op":"replace","path":"/a/b/c","value":0},
                            {"op":"replace","path":"/nope","value":1},
                            {"op":"add","path":"/never","value":1}])"));
    try {
        partial.applyInPlace(doc);
        exit(22);
    } catch (const FailedOperationError& e) {
        if (e.operation().find("path")->getString() != "/nope")
            exit(23);
    }
    if (doc.toString() != R"({"a":{"b":{"c":0}}})")
        exit(24);
}

void
remove_idempotence_test()
{
    Json doc = parse(R"({"a":{"b":1,"c":2}})");
    Patch remove(parse(R"([{"op":"remove","path":"/a/b"}])"));
    remove.applyInPlace(doc);
    remove.applyInPlace(doc);
    if (doc.toString() != R"({"a":{"c":2}})")
        exit(30);

    // add followed by remove restores the document
    const Json before = parse(R"({"arr":[1,2,3],"o":{"k":"v"}})");
    static const char* const kRoundTrips[] = {
        R"([{"op":"add","path":"/arr/1","value":9},
            {"op":"remove","path":"/arr/1"}])",
        R"([{"op":"add","path":"/arr/-","value":9},
            {"op":"remove","path":"/arr/3"}])",
        R"([{"op":"add","path":"/o/new","value":{"deep":[1]}},
            {"op":"remove","path":"/o/new"}])",
    };
    for (size_t i = 0; i < ARRAYLEN(kRoundTrips); ++i)
        if (Patch(parse(kRoundTrips[i])).apply(before) != before)
            exit(31);
}

void
move_round_trip_test()
{
    const Json before =
      parse(R"({"x":{"v":[1,{"w":2}]},"y":{},"arr":["a","b","c"]})");
    static const struct
    {
        const char* there;
        const char* back;
    } kMoves[] = {
        { R"([{"op":"move","from":"/x/v","path":"/y/v"}])",
          R"([{"op":"move","from":"/y/v","path":"/x/v"}])" },
        { R"([{"op":"move","from":"/arr/0","path":"/y/first"}])",
          R"([{"op":"move","from":"/y/first","path":"/arr/0"}])" },
        { R"([{"op":"move","from":"/arr/2","path":"/arr/0"}])",
          R"([{"op":"move","from":"/arr/0","path":"/arr/2"}])" },
    };
    for (size_t i = 0; i < ARRAYLEN(kMoves); ++i) {
        Json there = Patch(parse(kMoves[i].there)).apply(before);
        if (there == before)
            exit(40);
        Json back = Patch(parse(kMoves[i].back)).apply(there);
        if (back != before) {
            printf("error: %s then %s gave %s\n",
                   kMoves[i].there,
                   kMoves[i].back,
                   back.toString().c_str());
            exit(41);
        }
    }
}

void
test_is_pure_test()
{
    const char* text = R"({"a":[1,2,{"b":null}],"c":"d"})";
    Json doc = parse(text);
    Patch(parse(R"([{"op":"test","path":"/a","value":[1,2,{"b":null}]},
                    {"op":"test","path":"/a/2/b","value":null},
                    {"op":"test","path":"","value":{"c":"d","a":[1,2,{"b":null}]}}])"))
      .applyInPlace(doc);
    if (doc.toString() != text)
        exit(50);
}

void
unknown_operation_test()
{
    Json doc = parse(R"({"a":1})");
    Patch patch(parse(R"([{"op":"add","path":"/b","value":2},
                          {"op":"frobnicate","path":"/a"},
                          {"op":"add","path":"/c","value":3}])"));
    try {
        patch.applyInPlace(doc);
        exit(60);
    } catch (const UnknownOperationError& e) {
        if (e.name() != "frobnicate")
            exit(61);
        if (e.operation().find("path")->getString() != "/a")
            exit(62);
    }
    if (doc.toString() != R"({"a":1,"b":2})")
        exit(63);

    // predicates are unknown unless they were asked for
    try {
        Patch(parse(R"([{"op":"defined","path":"/a"}])")).apply(doc);
        exit(64);
    } catch (const UnknownOperationError&) {
    }

    // names are case sensitive
    try {
        Patch(parse(R"([{"op":"ADD","path":"/z","value":1}])")).apply(doc);
        exit(65);
    } catch (const UnknownOperationError&) {
    }
}

void
invalid_document_test()
{
    static const char* const kInvalid[] = {
        R"({"op":"add","path":"/a","value":1})",
        R"("add")",
        R"(null)",
        R"(42)",
        R"([{"op":"add","path":"/a","value":1}, 7])",
        R"([[]])",
        R"([{"path":"/a","value":1}])",
        R"([{"op":null,"path":"/a"}])",
        R"([{"op":1,"path":"/a"}])",
    };
    for (size_t i = 0; i < ARRAYLEN(kInvalid); ++i) {
        try {
            Patch patch(parse(kInvalid[i]));
            printf("error: %s should not be accepted\n", kInvalid[i]);
            exit(70);
        } catch (const InvalidPatchError&) {
        }
    }
    Patch empty(parse("[]"));
    if (empty.size())
        exit(71);
}

void
parse_text_test()
{
    Patch patch = Patch::parse(R"([
        {"op": "add", "path": "/greeting", "value": "hello"},
        {"op": "copy", "from": "/greeting", "path": "/echo"}
    ])");
    if (patch.size() != 2 || patch.hasPredicates())
        exit(80);
    if (patch.apply(parse("{}")).toString() !=
        R"({"greeting":"hello","echo":"hello"})")
        exit(81);
    try {
        Patch::parse(R"([{"op":"add",])");
        exit(82);
    } catch (const InvalidPatchError& e) {
        if (!strstr(e.what(), "invalid patch document: unparseable JSON"))
            exit(83);
    }
    try {
        Patch::parse(R"({"op":"add"})");
        exit(84);
    } catch (const InvalidPatchError&) {
    }
    Patch withPredicates = Patch::parse(
      R"([{"op":"defined","path":"/a"}])", true);
    if (!withPredicates.hasPredicates())
        exit(85);
    withPredicates.apply(parse(R"({"a":0})"));
}

void
registry_test()
{
    OperationRegistry standard = OperationRegistry::standard();
    static const char* const kNames[] = {
        "add", "copy", "move", "remove", "replace", "test",
    };
    if (standard.size() != ARRAYLEN(kNames))
        exit(90);
    std::vector<std::string> names = standard.names();
    for (size_t i = 0; i < ARRAYLEN(kNames); ++i)
        if (!standard.contains(kNames[i]) || names[i] != kNames[i])
            exit(91);
    if (standard.find("contains") || standard.find(""))
        exit(92);

    Patch patch(parse(R"([{"op":"increment","path":"/n","by":5},
                          {"op":"increment","path":"/n","by":2}])"));
    patch.registerOperation(
      "increment", [](const Json& operation, Json& target) {
          Json* n = target.find(operation.find("path")->getString().substr(1));
          if (!n || !n->isLong())
              throw FailedOperationError(operation);
          *n = n->getLong() + operation.find("by")->getLong();
      });
    if (patch.apply(parse(R"({"n":1})")).toString() != R"({"n":8})")
        exit(93);
    if (!patch.registry().contains("increment"))
        exit(94);
    try {
        patch.apply(parse(R"({"n":"one"})"));
        exit(95);
    } catch (const FailedOperationError&) {
    }

    // registries belong to their patch
    if (Patch(parse("[]")).registry().contains("increment"))
        exit(96);

    // built in operations may be replaced
    Patch strict(parse(R"([{"op":"remove","path":"/missing"}])"));
    strict.registerOperation("remove", [](const Json& operation, Json&) {
        throw FailedOperationError(operation);
    });
    try {
        strict.apply(parse("{}"));
        exit(97);
    } catch (const FailedOperationError&) {
    }
}

void
error_message_test()
{
    try {
        Patch(parse(R"([{"op":"replace","path":"/q","value":1}])"))
          .apply(parse("{}"));
        exit(100);
    } catch (const jtools::PatchError& e) {
        if (strcmp(e.what(),
                   R"(failed operation: {"op":"replace","path":"/q","value":1})"))
            exit(101);
    }
    try {
        Patch(parse(R"([{"op":"nope"}])")).apply(parse("{}"));
        exit(102);
    } catch (const jtools::PatchError& e) {
        if (strcmp(e.what(), R"(unknown operation "nope": {"op":"nope"})"))
            exit(103);
    }
}

void
apply_perf_test()
{
    static const Json doc = parse(
      R"({"a":{"b":{"c":"123!ABC"}},"arr":[1,2,3,4,5,6,7,8],"o":{"k":"v"}})");
    static const Patch patch(parse(R"([
        {"op":"test","path":"/a/b/c","value":"123!ABC"},
        {"op":"add","path":"/arr/-","value":9},
        {"op":"move","from":"/arr/0","path":"/arr/8"},
        {"op":"copy","from":"/o","path":"/p"},
        {"op":"replace","path":"/a/b/c","value":123},
        {"op":"remove","path":"/o/k"}
    ])"));
    Json res = patch.apply(doc);
    if (!res.find("p"))
        exit(110);
}

int
main()
{
    success_test();
    failure_test();
    copy_apply_test();
    in_place_test();
    remove_idempotence_test();
    move_round_trip_test();
    test_is_pure_test();
    unknown_operation_test();
    invalid_document_test();
    parse_text_test();
    registry_test();
    error_message_test();

    BENCH(2000, 1, apply_perf_test());
    BENCH(2000, 1, success_test());
    BENCH(2000, 1, failure_test());
}
