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
#include <stdexcept>
#include <string>
#include <vector>

namespace jtools {

class PointerError : public std::runtime_error
{
  public:
    explicit PointerError(const std::string& path);

    const std::string& path() const
    {
        return path_;
    }

  private:
    std::string path_;
};

// Reinterprets a pointer segment for the container it is applied to.
// Arrays need an index within [0, size), which is written to *index;
// any other container takes the key as it is. The "-" append marker is
// not accepted here, only by Json::insert().
bool fixKey(const Json& container, const std::string& key, size_t* index);

// RFC 6901 JSON Pointer.
//
// A pointer is parsed once and holds no reference to any document, so
// it may be evaluated against as many documents as needed. The empty
// path addresses the whole document. Parsing never fails: a non-empty
// path without a leading slash yields a pointer that resolves nowhere.
class Pointer
{
  public:
    typedef std::function<void(const std::string&, const Json*)> Visitor;

    explicit Pointer(const std::string& path);

    static std::string escape(const std::string& segment);
    static std::string unescape(const std::string& segment);

    const std::string& path() const
    {
        return path_;
    }

    // Unescaped segments leading to the parent of the target.
    const std::vector<std::string>& segments() const
    {
        return parts_;
    }

    // Unescaped final segment. Empty for the root pointer.
    const std::string& last() const
    {
        return last_;
    }

    bool isRoot() const
    {
        return root_;
    }

    bool isValid() const
    {
        return valid_;
    }

    // Canonical spelling with every segment escaped again.
    std::string toString() const;

    // True if other addresses a location strictly below this one.
    bool isPrefixOf(const Pointer& other) const;

    // Container holding the target, or nullptr if some step along the
    // way is missing, out of range, or not a container. The root
    // pointer has no parent.
    Json* parent(Json& root) const;
    const Json* parent(const Json& root) const;
    Json& parentOrThrow(Json& root) const;

    // Target value, or nullptr. Absent values and explicit nulls are
    // told apart by the return value, not by the Json it points to.
    Json* value(Json& root) const;
    const Json* value(const Json& root) const;
    const Json& valueOrThrow(const Json& root) const;

    bool exists(const Json& root) const;

    // Calls visit(segment, value) for each step of the path, stopping
    // after the first step whose value is missing; that step is
    // reported with a nullptr value.
    void walk(const Json& root, const Visitor& visit) const;

  private:
    std::string path_;
    std::vector<std::string> parts_;
    std::string last_;
    bool root_;
    bool valid_;
};

} // namespace jtools
