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

#include "pointer.h"

namespace jtools {

PointerError::PointerError(const std::string& path)
  : std::runtime_error("JSON pointer does not resolve: \"" + path + "\""),
    path_(path)
{
}

bool
fixKey(const Json& container, const std::string& key, size_t* index)
{
    if (!container.isArray())
        return true;
    if (!Json::parseIndex(key, index))
        return false;
    return *index < container.getArray().size();
}

// "~1" must become "/" before "~0" becomes "~", otherwise "~01" would
// turn into "/" instead of "~1".
std::string
Pointer::unescape(const std::string& segment)
{
    std::string s(segment);
    for (size_t i = 0; (i = s.find("~1", i)) != std::string::npos; ++i)
        s.replace(i, 2, "/");
    for (size_t i = 0; (i = s.find("~0", i)) != std::string::npos; ++i)
        s.replace(i, 2, "~");
    return s;
}

std::string
Pointer::escape(const std::string& segment)
{
    std::string s;
    s.reserve(segment.size());
    for (char c : segment) {
        switch (c) {
            case '~':
                s += "~0";
                break;
            case '/':
                s += "~1";
                break;
            default:
                s += c;
                break;
        }
    }
    return s;
}

Pointer::Pointer(const std::string& path)
  : path_(path), root_(path.empty()), valid_(path.empty() || path[0] == '/')
{
    if (root_ || !valid_)
        return;
    size_t start = 1;
    for (;;) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) {
            last_ = unescape(path.substr(start));
            break;
        }
        parts_.push_back(unescape(path.substr(start, slash - start)));
        start = slash + 1;
    }
}

std::string
Pointer::toString() const
{
    std::string b;
    if (root_ || !valid_)
        return b;
    for (const std::string& part : parts_) {
        b += '/';
        b += escape(part);
    }
    b += '/';
    b += escape(last_);
    return b;
}

bool
Pointer::isPrefixOf(const Pointer& other) const
{
    if (!valid_ || !other.valid_ || other.root_)
        return false;
    if (root_)
        return true;
    if (parts_.size() >= other.parts_.size())
        return false;
    for (size_t i = 0; i < parts_.size(); ++i)
        if (parts_[i] != other.parts_[i])
            return false;
    return last_ == other.parts_[parts_.size()];
}

Json*
Pointer::parent(Json& root) const
{
    if (root_ || !valid_)
        return nullptr;
    Json* node = &root;
    for (const std::string& part : parts_) {
        node = node->find(part);
        if (!node)
            return nullptr;
    }
    return node;
}

const Json*
Pointer::parent(const Json& root) const
{
    return parent(const_cast<Json&>(root));
}

Json&
Pointer::parentOrThrow(Json& root) const
{
    Json* node = parent(root);
    if (!node)
        throw PointerError(path_);
    return *node;
}

Json*
Pointer::value(Json& root) const
{
    if (root_)
        return &root;
    Json* node = parent(root);
    if (!node)
        return nullptr;
    return node->find(last_);
}

const Json*
Pointer::value(const Json& root) const
{
    return value(const_cast<Json&>(root));
}

const Json&
Pointer::valueOrThrow(const Json& root) const
{
    const Json* node = value(root);
    if (!node)
        throw PointerError(path_);
    return *node;
}

bool
Pointer::exists(const Json& root) const
{
    return value(root) != nullptr;
}

void
Pointer::walk(const Json& root, const Visitor& visit) const
{
    if (root_ || !valid_)
        return;
    const Json* node = &root;
    for (const std::string& part : parts_) {
        node = node->find(part);
        visit(part, node);
        if (!node)
            return;
    }
    visit(last_, node->find(last_));
}

} // namespace jtools
