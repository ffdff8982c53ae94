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

#pragma once
#include "json.h"

#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace jtools {

class PatchError : public std::runtime_error
{
  public:
    explicit PatchError(const std::string& message)
      : std::runtime_error(message)
    {
    }
};

// The patch document is not a list of operation objects.
class InvalidPatchError : public PatchError
{
  public:
    explicit InvalidPatchError(const std::string& message)
      : PatchError("invalid patch document: " + message)
    {
    }
};

// An operation names nothing in the registry.
class UnknownOperationError : public PatchError
{
  public:
    UnknownOperationError(const std::string& name, const Json& operation);

    const std::string& name() const
    {
        return name_;
    }

    const Json& operation() const
    {
        return operation_;
    }

  private:
    std::string name_;
    Json operation_;
};

// An operation could not be carried out against the target.
class FailedOperationError : public PatchError
{
  public:
    explicit FailedOperationError(const Json& operation);

    const Json& operation() const
    {
        return operation_;
    }

  private:
    Json operation_;
};

class OperationRegistry
{
  public:
    // Handlers throw FailedOperationError when the operation cannot
    // be applied. Anything else they throw is passed through as is.
    typedef std::function<void(const Json& operation, Json& target)> Handler;

    // Registry holding add, remove, replace, move, copy and test.
    static OperationRegistry standard();

    void add(const std::string& name, Handler handler);
    const Handler* find(const std::string& name) const;
    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;

    size_t size() const
    {
        return handlers_.size();
    }

  private:
    std::map<std::string, Handler> handlers_;
};

// An ordered list of RFC 6902 operations.
//
// Operations run in order and the first failure aborts the rest.
// Nothing is rolled back: applyInPlace() leaves the operations that
// already ran in the caller's document, while apply() works on a copy
// and so never touches its argument.
//
// Every operation carries its target location under "path"; move and
// copy take their source location from "from". Adding to a location
// that already exists overwrites object members and inserts before
// array elements. Removing a location that does not exist succeeds.
//
// A const Patch can be applied from several threads at once as long as
// each thread works on its own document.
class Patch
{
  public:
    // Throws InvalidPatchError unless operations is an array of
    // objects that each name their operation with a string "op".
    explicit Patch(const Json& operations, bool withPredicates = false);

    // Decodes the operations from JSON text first.
    static Patch parse(const std::string& text, bool withPredicates = false);

    static Patch withPredicates(const Json& operations);

    Json apply(const Json& target) const;
    void applyInPlace(Json& target) const;

    void registerOperation(const std::string& name,
                           OperationRegistry::Handler handler);

    const std::vector<Json>& operations() const
    {
        return operations_;
    }

    size_t size() const
    {
        return operations_.size();
    }

    bool hasPredicates() const
    {
        return predicates_;
    }

    const OperationRegistry& registry() const
    {
        return registry_;
    }

  private:
    std::vector<Json> operations_;
    OperationRegistry registry_;
    bool predicates_;
};

} // namespace jtools
