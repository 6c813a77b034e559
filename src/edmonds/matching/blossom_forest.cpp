/**
 *    Copyright (C) 2024-present MongoDB, Inc.
 *
 *    This program is free software: you can redistribute it and/or modify
 *    it under the terms of the Server Side Public License, version 1,
 *    as published by MongoDB, Inc.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    Server Side Public License for more details.
 *
 *    You should have received a copy of the Server Side Public License
 *    along with this program. If not, see
 *    <http://www.mongodb.com/licensing/server-side-public-license>.
 *
 *    As a special exception, the copyright holders give permission to link the
 *    code of portions of this program with the OpenSSL library under certain
 *    conditions as described in each individual source file and distribute
 *    linked combinations including the program with the OpenSSL library. You
 *    must comply with the Server Side Public License in all respects for
 *    all of the code used other than as permitted herein. If you modify file(s)
 *    with this exception, you may extend this exception to your version of the
 *    file(s), but you are not obligated to do so. If you do not wish to do so,
 *    delete this exception statement from your version. If you delete this
 *    exception statement from all source files in the program, then also delete
 *    it in the license file.
 */

#include "edmonds/matching/blossom_forest.h"

#include <algorithm>
#include <functional>

#include "edmonds/util/assert_util.h"
#include "edmonds/util/str.h"

namespace edmonds {

BlossomForest::BlossomForest(int numVertices)
    : _n(numVertices),
      _parent(2 * numVertices, kNoBlossom),
      _base(2 * numVertices, kNoVertex),
      _inBlossom(numVertices),
      _children(2 * numVertices),
      _edges(2 * numVertices),
      _allocated(numVertices, false) {
    for (VertexId v = 0; v < _n; ++v) {
        _base[v] = v;
        _inBlossom[v] = v;
    }
    _free.reserve(_n);
    for (BlossomId b = 2 * _n - 1; b >= _n; --b)
        _free.push_back(b);
}

BlossomId BlossomForest::allocate() {
    invariant(!_free.empty(), "no free blossom slot");
    const BlossomId b = _free.back();
    _free.pop_back();
    _allocated[b - _n] = true;
    return b;
}

void BlossomForest::release(BlossomId b) {
    invariant(!isVertex(b) && _allocated[b - _n]);
    _allocated[b - _n] = false;
    _parent[b] = kNoBlossom;
    _base[b] = kNoVertex;
    _children[b].clear();
    _edges[b].clear();
    // Keep the lowest free id at the back.
    auto pos = std::upper_bound(_free.begin(), _free.end(), b, std::greater<BlossomId>());
    _free.insert(pos, b);
}

std::vector<VertexId> BlossomForest::leaves(BlossomId b) const {
    std::vector<VertexId> result;
    forEachLeaf(b, [&](VertexId v) { result.push_back(v); });
    return result;
}

std::size_t BlossomForest::childIndex(BlossomId b, BlossomId child) const {
    const auto& children = _children[b];
    auto it = std::find(children.begin(), children.end(), child);
    invariant(it != children.end());
    return static_cast<std::size_t>(it - children.begin());
}

void BlossomForest::rotate(BlossomId b, std::size_t i) {
    auto& children = _children[b];
    auto& edges = _edges[b];
    std::rotate(children.begin(), children.begin() + i, children.end());
    std::rotate(edges.begin(), edges.begin() + i, edges.end());
}

std::vector<BlossomId> BlossomForest::nonTrivialBlossoms() const {
    std::vector<BlossomId> result;
    for (BlossomId b = _n; b < 2 * _n; ++b) {
        if (_allocated[b - _n])
            result.push_back(b);
    }
    return result;
}

Status BlossomForest::checkConsistency() const {
    for (VertexId v = 0; v < _n; ++v) {
        const BlossomId top = _inBlossom[v];
        if (!isAllocated(top) || _parent[top] != kNoBlossom) {
            return {ErrorCodes::InternalError,
                    str::stream() << "vertex " << v << " points at " << top
                                  << ", which is not an allocated top-level blossom"};
        }
        BlossomId b = v;
        while (_parent[b] != kNoBlossom)
            b = _parent[b];
        if (b != top) {
            return {ErrorCodes::InternalError,
                    str::stream() << "vertex " << v << " is inside " << b << " but points at "
                                  << top};
        }
    }
    for (BlossomId b : nonTrivialBlossoms()) {
        const auto k = _children[b].size();
        if (k < 3 || k % 2 == 0 || _edges[b].size() != k) {
            return {ErrorCodes::InternalError,
                    str::stream() << "blossom " << b << " has " << k << " children and "
                                  << _edges[b].size() << " edges"};
        }
        for (BlossomId child : _children[b]) {
            if (_parent[child] != b) {
                return {ErrorCodes::InternalError,
                        str::stream() << "child " << child << " of blossom " << b
                                      << " has parent " << _parent[child]};
            }
        }
    }
    return Status::OK();
}

}  // namespace edmonds
