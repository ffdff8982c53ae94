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

#include "patch.h"
#include "pointer.h"
#include "predicate.h"

#include <utility>

namespace jtools {

UnknownOperationError::UnknownOperationError(const std::string& name,
                                             const Json& operation)
  : PatchError("unknown operation \"" + name + "\": " + operation.toString()),
    name_(name),
    operation_(operation)
{
}

FailedOperationError::FailedOperationError(const Json& operation)
  : PatchError("failed operation: " + operation.toString()),
    operation_(operation)
{
}

static Pointer
pointerField(const Json& operation, const char* name)
{
    const Json* field = operation.find(name);
    if (!field || !field->isString())
        throw FailedOperationError(operation);
    return Pointer(field->getString());
}

static const Json&
valueField(const Json& operation)
{
    const Json* value = operation.find("value");
    if (!value)
        throw FailedOperationError(operation);
    return *value;
}

// Shared by add, move and copy. Adding at the root swaps out the whole
// document.
static bool
addValue(const Pointer& ptr, Json value, Json& target)
{
    if (ptr.isRoot()) {
        target = std::move(value);
        return true;
    }
    Json* parent = ptr.parent(target);
    if (!parent)
        return false;
    return parent->insert(ptr.last(), std::move(value));
}

static void
addOp(const Json& operation, Json& target)
{
    Pointer ptr = pointerField(operation, "path");
    if (!addValue(ptr, valueField(operation), target))
        throw FailedOperationError(operation);
}

static void
removeOp(const Json& operation, Json& target)
{
    Pointer ptr = pointerField(operation, "path");
    if (ptr.isRoot())
        throw FailedOperationError(operation);
    Json* parent = ptr.parent(target);
    if (!parent || !parent->find(ptr.last()))
        return; // already gone
    if (!parent->erase(ptr.last()))
        throw FailedOperationError(operation);
}

static void
replaceOp(const Json& operation, Json& target)
{
    Pointer ptr = pointerField(operation, "path");
    const Json& value = valueField(operation);
    Json* node = ptr.value(target);
    if (!node)
        throw FailedOperationError(operation);
    *node = value;
}

static void
testOp(const Json& operation, Json& target)
{
    Pointer ptr = pointerField(operation, "path");
    const Json& value = valueField(operation);
    const Json* node = ptr.value(target);
    if (!node || *node != value)
        throw FailedOperationError(operation);
}

// The source value is taken before anything is removed, so the array
// index shift caused by a move cannot change what gets moved.
static void
transfer(const Json& operation, Json& target, bool move)
{
    Pointer from = pointerField(operation, "from");
    Pointer to = pointerField(operation, "path");
    Json* source = from.value(target);
    if (!source)
        throw FailedOperationError(operation);
    if (!move) {
        Json value(*source);
        if (!addValue(to, std::move(value), target))
            throw FailedOperationError(operation);
        return;
    }
    if (from.isRoot() || from.isPrefixOf(to))
        throw FailedOperationError(operation);
    Json value(std::move(*source));
    if (!from.parent(target)->erase(from.last()))
        throw FailedOperationError(operation);
    if (!addValue(to, std::move(value), target))
        throw FailedOperationError(operation);
}

static void
moveOp(const Json& operation, Json& target)
{
    transfer(operation, target, true);
}

static void
copyOp(const Json& operation, Json& target)
{
    transfer(operation, target, false);
}

OperationRegistry
OperationRegistry::standard()
{
    OperationRegistry registry;
    registry.add("add", addOp);
    registry.add("remove", removeOp);
    registry.add("replace", replaceOp);
    registry.add("move", moveOp);
    registry.add("copy", copyOp);
    registry.add("test", testOp);
    return registry;
}

void
OperationRegistry::add(const std::string& name, Handler handler)
{
    handlers_[name] = std::move(handler);
}

const OperationRegistry::Handler*
OperationRegistry::find(const std::string& name) const
{
    auto i = handlers_.find(name);
    if (i == handlers_.end())
        return nullptr;
    return &i->second;
}

bool
OperationRegistry::contains(const std::string& name) const
{
    return handlers_.find(name) != handlers_.end();
}

std::vector<std::string>
OperationRegistry::names() const
{
    std::vector<std::string> res;
    res.reserve(handlers_.size());
    for (const auto& entry : handlers_)
        res.push_back(entry.first);
    return res;
}

Patch::Patch(const Json& operations, bool withPredicates)
  : registry_(OperationRegistry::standard()), predicates_(withPredicates)
{
    if (!operations.isArray())
        throw InvalidPatchError(std::string("expected an array, got ") +
                                operations.kindName());
    const std::vector<Json>& ops = operations.getArray();
    for (size_t i = 0; i < ops.size(); ++i) {
        if (!ops[i].isObject())
            throw InvalidPatchError("operation " + std::to_string(i) +
                                    " is not an object");
        const Json* op = ops[i].find("op");
        if (!op || !op->isString())
            throw InvalidPatchError("operation " + std::to_string(i) +
                                    " has no \"op\" string");
    }
    operations_ = ops;
    if (withPredicates)
        registerPredicateOperations(registry_, PredicateRegistry::standard());
}

Patch
Patch::parse(const std::string& text, bool withPredicates)
{
    std::pair<Json::Status, Json> res = Json::parse(text);
    if (res.first != Json::success)
        throw InvalidPatchError(std::string("unparseable JSON (") +
                                Json::StatusToString(res.first) + ")");
    return Patch(res.second, withPredicates);
}

Patch
Patch::withPredicates(const Json& operations)
{
    return Patch(operations, true);
}

Json
Patch::apply(const Json& target) const
{
    Json copy(target);
    applyInPlace(copy);
    return copy;
}

void
Patch::applyInPlace(Json& target) const
{
    for (const Json& operation : operations_) {
        const std::string& name = operation.find("op")->getString();
        const OperationRegistry::Handler* handler = registry_.find(name);
        if (!handler)
            throw UnknownOperationError(name, operation);
        (*handler)(operation, target);
    }
}

void
Patch::registerOperation(const std::string& name,
                         OperationRegistry::Handler handler)
{
    registry_.add(name, std::move(handler));
}

} // namespace jtools
