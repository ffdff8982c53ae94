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
#include "patch.h"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace jtools {

// JSON Predicate tests.
//
// A predicate is an operation object like {"op": "contains", "path":
// "/a", "value": "x", "ignore_case": true}. Evaluation only ever
// answers true or false: missing values, wrong types, bad regular
// expressions and unknown names all come out false.
//
// The combinators and, or and not take nested predicates under
// "apply". Note that not is true when none of them hold, which makes
// it nor rather than negation once there is more than one.
class PredicateRegistry
{
  public:
    typedef std::function<bool(const Json& predicate,
                               const Json& target,
                               const PredicateRegistry& registry)>
      Predicate;

    // contains, defined, ends, less, matches, more, starts, type,
    // undefined, and, not, or.
    static PredicateRegistry standard();

    void add(const std::string& name, Predicate predicate);
    const Predicate* find(const std::string& name) const;
    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;

    size_t size() const
    {
        return predicates_.size();
    }

    // Never throws.
    bool evaluate(const Json& predicate, const Json& target) const;

  private:
    std::map<std::string, Predicate> predicates_;
};

// Makes every predicate usable as a patch operation which fails when
// the predicate does not hold.
void registerPredicateOperations(OperationRegistry& operations,
                                 const PredicateRegistry& predicates);

} // namespace jtools
