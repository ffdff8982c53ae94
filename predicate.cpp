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

#include "predicate.h"
#include "pointer.h"

#include <cctype>
#include <functional>
#include <memory>
#include <regex>
#include <stdexcept>

namespace jtools {

// Looks up "path" in target. Returns false when the predicate carries
// no usable path; otherwise *value is the addressed value or nullptr.
static bool
resolve(const Json& predicate, const Json& target, const Json** value)
{
    const Json* path = predicate.find("path");
    if (!path || !path->isString())
        return false;
    *value = Pointer(path->getString()).value(target);
    return true;
}

// Anything but an absent member, null or false turns the option on.
static bool
option(const Json& predicate, const char* name)
{
    const Json* flag = predicate.find(name);
    if (!flag || flag->isNull())
        return false;
    if (flag->isBool())
        return flag->getBool();
    return true;
}

static std::string
upcase(const std::string& s)
{
    std::string b(s);
    for (size_t i = 0; i < b.size(); ++i)
        b[i] = toupper(b[i] & 255);
    return b;
}

template <typename Compare>
static bool
stringCheck(const Json& predicate, const Json& target, Compare compare)
{
    const Json* value = nullptr;
    if (!resolve(predicate, target, &value))
        return false;
    const Json* expected = predicate.find("value");
    if (!value || !value->isString() || !expected || !expected->isString())
        return false;
    if (option(predicate, "ignore_case"))
        return compare(upcase(value->getString()),
                       upcase(expected->getString()));
    return compare(value->getString(), expected->getString());
}

template <typename Compare>
static bool
numberCheck(const Json& predicate, const Json& target, Compare compare)
{
    const Json* value = nullptr;
    if (!resolve(predicate, target, &value))
        return false;
    const Json* expected = predicate.find("value");
    if (!value || !value->isNumber() || !expected || !expected->isNumber())
        return false;
    if (value->isLong() && expected->isLong())
        return compare(value->getLong(), expected->getLong());
    return compare(value->getNumber(), expected->getNumber());
}

static bool
containsPredicate(const Json& predicate,
                  const Json& target,
                  const PredicateRegistry&)
{
    return stringCheck(
      predicate, target, [](const std::string& s, const std::string& x) {
          return s.find(x) != std::string::npos;
      });
}

static bool
startsPredicate(const Json& predicate,
                const Json& target,
                const PredicateRegistry&)
{
    return stringCheck(
      predicate, target, [](const std::string& s, const std::string& x) {
          return s.size() >= x.size() && !s.compare(0, x.size(), x);
      });
}

static bool
endsPredicate(const Json& predicate,
              const Json& target,
              const PredicateRegistry&)
{
    return stringCheck(
      predicate, target, [](const std::string& s, const std::string& x) {
          return s.size() >= x.size() &&
                 !s.compare(s.size() - x.size(), x.size(), x);
      });
}

// Unanchored ECMAScript search. A pattern std::regex rejects does not
// match anything.
static bool
matchesPredicate(const Json& predicate,
                 const Json& target,
                 const PredicateRegistry&)
{
    const Json* value = nullptr;
    if (!resolve(predicate, target, &value))
        return false;
    const Json* pattern = predicate.find("value");
    if (!value || !value->isString() || !pattern || !pattern->isString())
        return false;
    std::regex::flag_type flags = std::regex::ECMAScript;
    if (option(predicate, "ignore_case"))
        flags |= std::regex::icase;
    try {
        std::regex re(pattern->getString(), flags);
        return std::regex_search(value->getString(), re);
    } catch (const std::regex_error&) {
        return false;
    }
}

static bool
lessPredicate(const Json& predicate,
              const Json& target,
              const PredicateRegistry&)
{
    return numberCheck(predicate, target, std::less<>());
}

static bool
morePredicate(const Json& predicate,
              const Json& target,
              const PredicateRegistry&)
{
    return numberCheck(predicate, target, std::greater<>());
}

static bool
definedPredicate(const Json& predicate,
                 const Json& target,
                 const PredicateRegistry&)
{
    const Json* value = nullptr;
    return resolve(predicate, target, &value) && value;
}

static bool
undefinedPredicate(const Json& predicate,
                   const Json& target,
                   const PredicateRegistry&)
{
    const Json* value = nullptr;
    return resolve(predicate, target, &value) && !value;
}

static bool
typePredicate(const Json& predicate,
              const Json& target,
              const PredicateRegistry&)
{
    const Json* value = nullptr;
    if (!resolve(predicate, target, &value))
        return false;
    const Json* expected = predicate.find("value");
    if (!expected || !expected->isString())
        return false;
    if (!value)
        return expected->getString() == "undefined";
    return expected->getString() == value->kindName();
}

static bool
andPredicate(const Json& predicate,
             const Json& target,
             const PredicateRegistry& registry)
{
    const Json* apply = predicate.find("apply");
    if (!apply || !apply->isArray())
        return false;
    for (const Json& nested : apply->getArray())
        if (!registry.evaluate(nested, target))
            return false;
    return true;
}

static bool
orPredicate(const Json& predicate,
            const Json& target,
            const PredicateRegistry& registry)
{
    const Json* apply = predicate.find("apply");
    if (!apply || !apply->isArray())
        return false;
    for (const Json& nested : apply->getArray())
        if (registry.evaluate(nested, target))
            return true;
    return false;
}

// None of the nested predicates may hold.
static bool
notPredicate(const Json& predicate,
             const Json& target,
             const PredicateRegistry& registry)
{
    const Json* apply = predicate.find("apply");
    if (!apply || !apply->isArray())
        return false;
    for (const Json& nested : apply->getArray())
        if (registry.evaluate(nested, target))
            return false;
    return true;
}

PredicateRegistry
PredicateRegistry::standard()
{
    PredicateRegistry registry;
    registry.add("contains", containsPredicate);
    registry.add("defined", definedPredicate);
    registry.add("ends", endsPredicate);
    registry.add("less", lessPredicate);
    registry.add("matches", matchesPredicate);
    registry.add("more", morePredicate);
    registry.add("starts", startsPredicate);
    registry.add("type", typePredicate);
    registry.add("undefined", undefinedPredicate);
    registry.add("and", andPredicate);
    registry.add("not", notPredicate);
    registry.add("or", orPredicate);
    return registry;
}

void
PredicateRegistry::add(const std::string& name, Predicate predicate)
{
    predicates_[name] = std::move(predicate);
}

const PredicateRegistry::Predicate*
PredicateRegistry::find(const std::string& name) const
{
    auto i = predicates_.find(name);
    if (i == predicates_.end())
        return nullptr;
    return &i->second;
}

bool
PredicateRegistry::contains(const std::string& name) const
{
    return predicates_.find(name) != predicates_.end();
}

std::vector<std::string>
PredicateRegistry::names() const
{
    std::vector<std::string> res;
    res.reserve(predicates_.size());
    for (const auto& entry : predicates_)
        res.push_back(entry.first);
    return res;
}

bool
PredicateRegistry::evaluate(const Json& predicate, const Json& target) const
{
    const Json* op = predicate.find("op");
    if (!op || !op->isString())
        return false;
    const Predicate* test = find(op->getString());
    if (!test)
        return false;
    try {
        return (*test)(predicate, target, *this);
    } catch (const std::exception&) {
        // a predicate that throws does not hold
        return false;
    }
}

void
registerPredicateOperations(OperationRegistry& operations,
                            const PredicateRegistry& predicates)
{
    auto registry = std::make_shared<const PredicateRegistry>(predicates);
    for (const std::string& name : registry->names()) {
        operations.add(name, [registry](const Json& operation, Json& target) {
            if (!registry->evaluate(operation, target))
                throw FailedOperationError(operation);
        });
    }
}

} // namespace jtools
